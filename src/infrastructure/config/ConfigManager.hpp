#pragma once

#include "core/types/DiscoveryConfig.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vidscan::infra {

/**
 * @brief Scan tuning persisted in the "scan" section.
 */
struct ScanSettings {
    std::vector<uint16_t> ports;    ///< Candidate ports; empty means the default set.
    int maxConcurrency{20};         ///< Hosts processed concurrently.
    int perHostConcurrency{5};      ///< Port probes in flight per host.
    int connectTimeoutMs{500};      ///< Connect and TLS handshake timeout.
    int hostTimeoutMs{3000};        ///< Probe budget per host.
    int httpTimeoutMs{5000};        ///< Timeout of each HTTP exchange.
    bool resolveHostnames{true};    ///< Reverse DNS for discovered hosts.
    bool vendorApiEnrichment{true}; ///< Query status.xml / REST APIs.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    ScanSettings scan;
    std::string username;             ///< Operator username; the password lives in secure storage.
    std::string outputMode{"simple"}; ///< "simple", "detailed" or "json".
};

/**
 * @brief Loads and saves config.json and the encrypted password.
 *
 * Secrets are sealed with SecureStorage, whose key file sits next to the
 * configuration, and kept under the "secure" section.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Directory holding config.json, the key file and the log.
     */
    explicit ConfigManager(std::filesystem::path configDir);

    /**
     * @brief Resolves the configuration directory from the environment.
     *
     * $VIDSCAN_CONFIG_DIR, else $XDG_CONFIG_HOME/vidscan, else ~/.config/vidscan,
     * else ./.vidscan.
     */
    static std::filesystem::path defaultConfigDir();

    /**
     * @brief Loads configuration from disk, writing defaults when the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Encrypts and stores a value, then saves the file.
     * @return False when encryption or saving failed.
     */
    bool setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Retrieves and decrypts a stored value.
     * @return Plaintext, or nullopt if absent or undecryptable.
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    /**
     * @brief Copies the scan settings and the saved credentials into a discovery config.
     *
     * The operator credentials are only set when a username is configured.
     */
    void applyTo(core::DiscoveryConfig& discovery) const;

    [[nodiscard]] const std::filesystem::path& configDir() const { return configDir_; }
    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    /**
     * @brief Returns the path of the rotating log file.
     */
    [[nodiscard]] std::filesystem::path logPath() const { return configDir_ / "vidscan.log"; }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace vidscan::infra
