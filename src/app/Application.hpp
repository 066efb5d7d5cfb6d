#pragma once

#include "app/CommandLine.hpp"
#include "core/types/DiscoveryConfig.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/discovery/DiscoveryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/PortProber.hpp"

#include <asio.hpp>
#include <filesystem>
#include <memory>
#include <optional>

namespace vidscan::app {

/**
 * @brief Process wiring: command line, logging, configuration, discovery, output.
 */
class Application {
public:
    static constexpr const char* Version = "1.0.0";

    Application(int argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs one discovery and prints the result.
     * @return Process exit status: 0 on success, 1 on errors, 2 on usage errors.
     * @throws core::InvalidRangeError for a malformed range or forced address.
     */
    int run();

    /**
     * @brief Layers environment and command line values over the configured ones.
     *
     * Precedence: built-in defaults < config file < VIDSCAN_USERNAME /
     * VIDSCAN_PASSWORD < command line.
     */
    static core::DiscoveryConfig buildDiscoveryConfig(const infra::ConfigManager& config,
                                                      const CommandLineOptions& options);

private:
    void initializeLogging(const std::filesystem::path& configDir, bool verbose, bool quiet);
    void saveCredentials(const CommandLineOptions& options);
    OutputMode resolveOutputMode(const CommandLineOptions& options) const;
    bool resolveTargets(core::DiscoveryConfig& discovery) const;
    void startServices(const core::DiscoveryConfig& discovery);

    int argc_;
    char** argv_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::PortProber> prober_;
    std::unique_ptr<infra::HttpClient> httpClient_;
    std::unique_ptr<infra::DiscoveryService> discovery_;
    // Destroyed before the services above, so no I/O handler outlives them
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::optional<asio::signal_set> signals_;
};

} // namespace vidscan::app
