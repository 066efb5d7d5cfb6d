/**
 * @file ProbeResult.hpp
 * @brief Port probe results and per-host reachability profiles.
 *
 * This file defines the outcome of probing a single candidate port and the
 * HostProfile that aggregates all probes of one host.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidscan::core {

/**
 * @brief Outcome of a single connect-level probe.
 */
enum class ProbeOutcome : int {
    Open = 0,        ///< TCP connection established
    Refused = 1,     ///< Host answered with a reset
    Timeout = 2,     ///< No answer within the connect timeout
    Unreachable = 3, ///< Network or host unreachable
    Error = 4        ///< Any other local error (invalid address, no descriptors)
};

/**
 * @brief Result of probing one (host, port) pair. Never mutated once created.
 */
struct ProbeResult {
    std::string address;          ///< Probed IPv4 address
    uint16_t port{0};             ///< Probed port
    ProbeOutcome outcome{ProbeOutcome::Error}; ///< Connect outcome
    bool tls{false};              ///< TLS handshake succeeded (443/5061 only)
    std::chrono::microseconds latency{0}; ///< Time to connect

    /**
     * @brief Checks whether the port accepted a connection.
     * @return True if the outcome is Open.
     */
    [[nodiscard]] bool reachable() const { return outcome == ProbeOutcome::Open; }

    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    [[nodiscard]] std::string outcomeToString() const;

    static std::string probeOutcomeToString(ProbeOutcome outcome);

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief URI scheme used to reach a device's management interface.
 */
enum class Scheme : int { Http = 0, Https = 1 };

std::string schemeToString(Scheme scheme);

/**
 * @brief Reachability summary of a host across all candidate ports.
 *
 * Only exists for hosts with at least one reachable port; use fromResults()
 * to build one.
 */
struct HostProfile {
    std::string address;          ///< IPv4 address of the host
    std::set<uint16_t> openPorts; ///< Reachable candidate ports
    std::set<uint16_t> tlsPorts;  ///< Subset of openPorts that completed a TLS handshake

    /**
     * @brief Aggregates per-port results into a profile.
     * @param address Host address.
     * @param results Probe results for that host.
     * @return Profile, or nullopt when no port was reachable.
     */
    static std::optional<HostProfile> fromResults(const std::string& address,
                                                  const std::vector<ProbeResult>& results);

    /**
     * @brief Returns the preferred scheme for the management interface.
     *
     * HTTPS when 443 is open and spoke TLS, HTTP otherwise.
     */
    [[nodiscard]] Scheme preferredScheme() const;

    /**
     * @brief Returns the web port matching preferredScheme(), if any is open.
     */
    [[nodiscard]] std::optional<uint16_t> webPort() const;

    [[nodiscard]] bool hasPort(uint16_t port) const { return openPorts.count(port) > 0; }

    /**
     * @brief Builds the access URI of the management interface.
     * @return "https://ip", "http://ip", or "http://ip" for non-web hosts.
     */
    [[nodiscard]] std::string accessUri() const;

    bool operator==(const HostProfile& other) const = default;
};

/**
 * @brief Well-known ports of video conferencing endpoints.
 */
class CandidatePorts {
public:
    static constexpr uint16_t Http = 80;
    static constexpr uint16_t Https = 443;
    static constexpr uint16_t Sip = 5060;
    static constexpr uint16_t SipTls = 5061;
    static constexpr uint16_t H323 = 1720;

    /**
     * @brief Returns the default candidate set {80, 443, 5060, 5061, 1720}.
     */
    static std::vector<uint16_t> defaults();

    /**
     * @brief Checks whether a port conventionally carries TLS.
     */
    static bool carriesTls(uint16_t port);

    /**
     * @brief Looks up the service name of a candidate port.
     * @return Service name, empty string for unknown ports.
     */
    static std::string serviceName(uint16_t port);

private:
    static const std::unordered_map<uint16_t, std::string>& knownServices();
};

} // namespace vidscan::core
