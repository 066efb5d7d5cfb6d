#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace vidscan::infra {

namespace {

int atLeastOne(const char* name, int value, int fallback) {
    if (value >= 1) {
        return value;
    }
    spdlog::warn("Config value scan.{} = {} is invalid, using {}", name, value, fallback);
    return fallback;
}

} // namespace

ConfigManager::ConfigManager(std::filesystem::path configDir) : configDir_(std::move(configDir)) {
    std::error_code ec;
    std::filesystem::create_directories(configDir_, ec);
    if (ec) {
        spdlog::warn("Cannot create config directory {}: {}", configDir_.string(), ec.message());
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* dir = std::getenv("VIDSCAN_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "vidscan";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "vidscan";
    }
    return ".vidscan";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", configPath_.string(), e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    const auto& scan = config_.scan;
    j["scan"]["ports"] = scan.ports;
    j["scan"]["max_concurrency"] = scan.maxConcurrency;
    j["scan"]["per_host_concurrency"] = scan.perHostConcurrency;
    j["scan"]["connect_timeout_ms"] = scan.connectTimeoutMs;
    j["scan"]["host_timeout_ms"] = scan.hostTimeoutMs;
    j["scan"]["http_timeout_ms"] = scan.httpTimeoutMs;
    j["scan"]["resolve_hostnames"] = scan.resolveHostnames;
    j["scan"]["vendor_api_enrichment"] = scan.vendorApiEnrichment;

    j["credentials"]["username"] = config_.username;
    j["output"]["mode"] = config_.outputMode;

    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }
    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        ScanSettings defaults;
        auto& scan = config_.scan;
        scan.ports = s.value("ports", std::vector<uint16_t>{});
        scan.maxConcurrency = atLeastOne("max_concurrency",
                                         s.value("max_concurrency", defaults.maxConcurrency),
                                         defaults.maxConcurrency);
        scan.perHostConcurrency =
            atLeastOne("per_host_concurrency",
                       s.value("per_host_concurrency", defaults.perHostConcurrency),
                       defaults.perHostConcurrency);
        scan.connectTimeoutMs = atLeastOne("connect_timeout_ms",
                                           s.value("connect_timeout_ms", defaults.connectTimeoutMs),
                                           defaults.connectTimeoutMs);
        scan.hostTimeoutMs = atLeastOne("host_timeout_ms",
                                        s.value("host_timeout_ms", defaults.hostTimeoutMs),
                                        defaults.hostTimeoutMs);
        scan.httpTimeoutMs = atLeastOne("http_timeout_ms",
                                        s.value("http_timeout_ms", defaults.httpTimeoutMs),
                                        defaults.httpTimeoutMs);
        scan.resolveHostnames = s.value("resolve_hostnames", defaults.resolveHostnames);
        scan.vendorApiEnrichment = s.value("vendor_api_enrichment", defaults.vendorApiEnrichment);
    }

    if (j.contains("credentials")) {
        config_.username = j["credentials"].value("username", "");
    }

    if (j.contains("output")) {
        config_.outputMode = j["output"].value("mode", "simple");
    }

    if (j.contains("secure") && j["secure"].is_object()) {
        secureValues_ = j["secure"];
    }
}

bool ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto encrypted = secureStorage_->encrypt(value);
    if (!encrypted) {
        spdlog::error("Cannot encrypt '{}', value not saved", key);
        return false;
    }
    secureValues_[key] = *encrypted;
    return save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    auto it = secureValues_.find(key);
    if (it == secureValues_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return secureStorage_->decrypt(it->get<std::string>());
}

void ConfigManager::applyTo(core::DiscoveryConfig& discovery) const {
    const auto& scan = config_.scan;
    discovery.ports = scan.ports;
    discovery.maxConcurrency = scan.maxConcurrency;
    discovery.perHostConcurrency = scan.perHostConcurrency;
    discovery.connectTimeout = std::chrono::milliseconds(scan.connectTimeoutMs);
    discovery.hostTimeout = std::chrono::milliseconds(scan.hostTimeoutMs);
    discovery.httpTimeout = std::chrono::milliseconds(scan.httpTimeoutMs);
    discovery.resolveHostnames = scan.resolveHostnames;
    discovery.vendorApiEnrichment = scan.vendorApiEnrichment;

    if (!config_.username.empty()) {
        core::Credentials credentials;
        credentials.username = config_.username;
        credentials.password = getSecureValue("password").value_or("");
        discovery.operatorCredentials = credentials;
    }
}

} // namespace vidscan::infra
