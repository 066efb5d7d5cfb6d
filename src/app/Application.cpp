#include "app/Application.hpp"

#include "app/ResultFormatter.hpp"
#include "core/types/NetworkInterface.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>

namespace vidscan::app {

namespace {

std::optional<std::string> environment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

Application::Application(int argc, char** argv) : argc_(argc), argv_(argv) {}

Application::~Application() {
    if (signals_) {
        asio::error_code ignored;
        signals_->cancel(ignored);
        signals_.reset();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
}

int Application::run() {
    std::string program = argc_ > 0 ? std::filesystem::path(argv_[0]).filename().string()
                                     : "vidscan";

    CommandLineOptions options;
    try {
        options = CommandLine::parse(argc_, argv_);
    } catch (const UsageError& e) {
        std::cerr << program << ": " << e.what() << "\n"
                  << "Try '" << program << " --help' for more information.\n";
        return 2;
    }

    if (options.help) {
        std::cout << CommandLine::usage(program);
        return 0;
    }
    if (options.version) {
        std::cout << "vidscan " << Version << "\n";
        return 0;
    }

    auto configDir = infra::ConfigManager::defaultConfigDir();
    bool jsonRequested = options.outputMode == OutputMode::Json;
    initializeLogging(configDir, options.verbose, jsonRequested);

    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }

    if (options.saveCredentials) {
        saveCredentials(options);
    }

    auto mode = resolveOutputMode(options);
    if (mode == OutputMode::Json && !jsonRequested) {
        spdlog::default_logger()->sinks().front()->set_level(spdlog::level::warn);
    }

    auto discovery = buildDiscoveryConfig(*config_, options);
    if (!resolveTargets(discovery)) {
        std::cerr << program << ": cannot detect the local network, use --range\n";
        return 1;
    }

    startServices(discovery);

    auto report = discovery_->discover(discovery, [](const core::DiscoveryProgress& progress) {
        spdlog::debug("Progress: {}/{} hosts ({:.0f}%), {} endpoint(s)", progress.scannedHosts,
                      progress.totalHosts, progress.percentComplete(), progress.endpoints);
    });

    asio::error_code ignored;
    signals_->cancel(ignored);

    std::cout << ResultFormatter(mode).format(report.endpoints) << std::flush;
    return 0;
}

core::DiscoveryConfig Application::buildDiscoveryConfig(const infra::ConfigManager& config,
                                                        const CommandLineOptions& options) {
    core::DiscoveryConfig discovery;
    config.applyTo(discovery);

    std::string username;
    std::string password;
    if (discovery.operatorCredentials) {
        username = discovery.operatorCredentials->username;
        password = discovery.operatorCredentials->password;
    }

    if (auto envUser = environment("VIDSCAN_USERNAME")) {
        username = *envUser;
    }
    if (auto envPassword = environment("VIDSCAN_PASSWORD")) {
        password = *envPassword;
    }
    if (options.username) {
        username = *options.username;
    }
    if (options.password) {
        password = *options.password;
    }

    discovery.operatorCredentials.reset();
    if (!username.empty()) {
        discovery.operatorCredentials = core::Credentials{username, password};
    }

    if (options.range) {
        discovery.targetRange = *options.range;
    }
    discovery.forceEndpoints = options.forceEndpoints;
    if (options.ports) {
        discovery.ports = *options.ports;
    }
    if (options.concurrency) {
        discovery.maxConcurrency = *options.concurrency;
    }
    if (options.timeoutMs) {
        discovery.connectTimeout = std::chrono::milliseconds(*options.timeoutMs);
    }
    if (options.noEnrich) {
        discovery.vendorApiEnrichment = false;
    }
    return discovery;
}

void Application::initializeLogging(const std::filesystem::path& configDir, bool verbose,
                                    bool quiet) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(verbose ? spdlog::level::debug
                                   : (quiet ? spdlog::level::warn : spdlog::level::info));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    auto logPath = configDir / "vidscan.log";
    std::string fileSinkError;
    try {
        std::filesystem::create_directories(configDir);
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    } catch (const std::exception& e) {
        fileSinkError = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("vidscan", sinks.begin(), sinks.end());
    logger->set_level(verbose ? spdlog::level::trace : spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (!fileSinkError.empty()) {
        spdlog::warn("File logging disabled: {}", fileSinkError);
    }
    spdlog::debug("VidScan {} starting, log file {}", Version, logPath.string());
}

void Application::saveCredentials(const CommandLineOptions& options) {
    if (!options.username) {
        spdlog::warn("--save-credentials needs --username, nothing saved");
        return;
    }

    config_->config().username = *options.username;
    if (!config_->save()) {
        return;
    }
    if (options.password && !config_->setSecureValue("password", *options.password)) {
        spdlog::error("Password could not be stored");
        return;
    }
    spdlog::info("Saved credentials for '{}' to {}", *options.username,
                 config_->configPath().string());
}

OutputMode Application::resolveOutputMode(const CommandLineOptions& options) const {
    if (options.outputMode) {
        return *options.outputMode;
    }
    const auto& configured = config_->config().outputMode;
    if (auto mode = outputModeFromString(configured)) {
        return *mode;
    }
    spdlog::warn("Unknown output mode '{}' in config, using simple", configured);
    return OutputMode::Simple;
}

bool Application::resolveTargets(core::DiscoveryConfig& discovery) const {
    if (!discovery.targetRange.empty() || !discovery.forceEndpoints.empty()) {
        return true;
    }

    auto range = core::NetworkInterfaceEnumerator::detectLocalRange();
    if (!range) {
        spdlog::error("No usable IPv4 interface found");
        return false;
    }
    spdlog::info("Auto-detected network range: {}", *range);
    discovery.targetRange = *range;
    return true;
}

void Application::startServices(const core::DiscoveryConfig& discovery) {
    asioContext_ = std::make_unique<infra::AsioContext>(4);
    asioContext_->start();

    infra::ProbeOptions probeOptions;
    probeOptions.connectTimeout = discovery.connectTimeout;
    probeOptions.hostTimeout = discovery.hostTimeout;
    probeOptions.perHostConcurrency = discovery.perHostConcurrency;

    prober_ = std::make_unique<infra::PortProber>(*asioContext_, probeOptions);
    httpClient_ = std::make_unique<infra::HttpClient>(*asioContext_);
    discovery_ = std::make_unique<infra::DiscoveryService>(*prober_, *httpClient_);

    signals_.emplace(asioContext_->getContext(), SIGINT, SIGTERM);
    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::warn("Received signal {}, finishing hosts in flight", signal);
        discovery_->cancel();
    });
}

} // namespace vidscan::app
