/**
 * @file DiscoveryConfig.hpp
 * @brief Parameters of one discovery run and its progress/report types.
 */

#pragma once

#include "core/types/Credentials.hpp"
#include "core/types/Endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Configuration for a discovery run.
 *
 * Built by the application layer from defaults, the config file, the
 * environment and the command line. The default credential pair lives here
 * and is handed to the authenticator explicitly.
 */
struct DiscoveryConfig {
    std::string targetRange;                 ///< CIDR or single IPv4 address; may be empty
    std::vector<uint16_t> ports;             ///< Candidate ports (defaults when empty)
    std::optional<Credentials> operatorCredentials; ///< Operator supplied pair, tried first
    Credentials defaultCredentials{"admin", "TANDBERG"}; ///< Built-in pair, tried second
    std::vector<std::string> forceEndpoints; ///< Addresses injected without probing
    int maxConcurrency{20};                  ///< Hosts processed concurrently
    int perHostConcurrency{5};               ///< Port probes in flight per host
    std::chrono::milliseconds connectTimeout{500};  ///< Per connect/handshake timeout
    std::chrono::milliseconds hostTimeout{3000};    ///< Budget for all probes of one host
    std::chrono::milliseconds httpTimeout{5000};    ///< Per HTTP exchange timeout
    bool resolveHostnames{true};             ///< Reverse DNS for probed hosts
    bool vendorApiEnrichment{true};          ///< Query status.xml / REST APIs after extraction

    /**
     * @brief Returns the ports to probe.
     * @return The configured ports, or the default candidate set when empty.
     */
    [[nodiscard]] std::vector<uint16_t> portsToProbe() const;

    /**
     * @brief Returns credential pairs in priority order.
     *
     * Operator pair first (when given and valid), then the default pair.
     * A pair equal to an earlier one is not repeated.
     */
    [[nodiscard]] std::vector<Credentials> credentialChain() const;
};

/**
 * @brief Progress information during a discovery run.
 */
struct DiscoveryProgress {
    uint64_t totalHosts{0};   ///< Hosts in the target range
    uint64_t scannedHosts{0}; ///< Hosts whose processing finished
    uint64_t liveHosts{0};    ///< Hosts with at least one reachable port
    uint64_t endpoints{0};    ///< Records produced so far
    bool cancelled{false};    ///< Whether cancellation was requested

    [[nodiscard]] double percentComplete() const {
        return totalHosts > 0 ? (static_cast<double>(scannedHosts) / totalHosts) * 100.0 : 0.0;
    }
};

/**
 * @brief Final output of a discovery run.
 */
struct DiscoveryReport {
    std::vector<EndpointRecord> endpoints; ///< One record per IP, sorted by address
    uint64_t scannedHosts{0};              ///< Hosts actually processed
    bool cancelled{false};                 ///< Run stopped early on request
    std::chrono::milliseconds elapsed{0};  ///< Wall clock duration
};

} // namespace vidscan::core
