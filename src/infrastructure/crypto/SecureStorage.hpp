#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidscan::infra {

/**
 * @brief Encrypts stored secrets (the saved device password) with libsodium.
 *
 * Uses crypto_secretbox with a random per-message nonce. The key lives in a
 * file next to the configuration, readable by the owner only, and is created
 * on first use.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    /**
     * @brief Loads the key from @p keyPath, generating it when missing or short.
     * @param keyPath Path to the key file.
     */
    explicit SecureStorage(std::filesystem::path keyPath);

    /**
     * @brief Destructor. Wipes the key from memory.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Seals a secret.
     * @param plaintext Secret to protect.
     * @return Base64 of nonce followed by ciphertext, or nullopt without a usable key.
     */
    std::optional<std::string> encrypt(const std::string& plaintext) const;

    /**
     * @brief Opens a sealed secret.
     * @param sealed Value produced by encrypt().
     * @return Plaintext, or nullopt if the value is malformed or was sealed with another key.
     */
    std::optional<std::string> decrypt(const std::string& sealed) const;

    [[nodiscard]] bool ready() const { return ready_; }
    [[nodiscard]] const std::filesystem::path& keyPath() const { return keyPath_; }

private:
    bool loadKey();
    bool createKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool ready_{false};
};

/**
 * @brief Encodes bytes as standard (padded) Base64 using libsodium.
 */
std::string base64Encode(std::string_view data);

/**
 * @brief Decodes standard Base64.
 * @return Decoded bytes, or nullopt on invalid input.
 */
std::optional<std::string> base64Decode(std::string_view encoded);

} // namespace vidscan::infra
