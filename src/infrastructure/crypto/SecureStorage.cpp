#include "infrastructure/crypto/SecureStorage.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace vidscan::infra {

namespace {

constexpr size_t KeySize = crypto_secretbox_KEYBYTES;
constexpr size_t NonceSize = crypto_secretbox_NONCEBYTES;
constexpr size_t MacSize = crypto_secretbox_MACBYTES;

} // namespace

SecureStorage::SecureStorage(std::filesystem::path keyPath) : keyPath_(std::move(keyPath)) {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialisation failed, saved passwords are unavailable");
        return;
    }

    key_.resize(KeySize);
    ready_ = loadKey() || createKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

bool SecureStorage::loadKey() {
    std::error_code ec;
    if (!std::filesystem::exists(keyPath_, ec)) {
        return false;
    }

    std::ifstream file(keyPath_, std::ios::binary);
    file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KeySize));
    if (file.gcount() != static_cast<std::streamsize>(KeySize)) {
        spdlog::warn("Key file {} is truncated, replacing it", keyPath_.string());
        return false;
    }

    spdlog::debug("Loaded secret key from {}", keyPath_.string());
    return true;
}

bool SecureStorage::createKey() {
    std::error_code ec;
    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    randombytes_buf(key_.data(), KeySize);

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot write key file {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KeySize));
    file.close();

#ifndef _WIN32
    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Cannot restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }
#endif

    spdlog::info("Created secret key {}", keyPath_.string());
    return true;
}

std::optional<std::string> SecureStorage::encrypt(const std::string& plaintext) const {
    if (!ready_) {
        return std::nullopt;
    }

    std::string sealed(NonceSize + MacSize + plaintext.size(), '\0');
    auto* nonce = reinterpret_cast<unsigned char*>(sealed.data());
    randombytes_buf(nonce, NonceSize);

    if (crypto_secretbox_easy(nonce + NonceSize,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), nonce, key_.data()) != 0) {
        spdlog::error("Sealing secret failed");
        return std::nullopt;
    }

    return base64Encode(sealed);
}

std::optional<std::string> SecureStorage::decrypt(const std::string& sealed) const {
    if (!ready_) {
        return std::nullopt;
    }

    auto raw = base64Decode(sealed);
    if (!raw || raw->size() < NonceSize + MacSize) {
        spdlog::warn("Stored secret is malformed");
        return std::nullopt;
    }

    const auto* nonce = reinterpret_cast<const unsigned char*>(raw->data());
    const auto* box = nonce + NonceSize;
    size_t boxSize = raw->size() - NonceSize;

    std::string plaintext(boxSize - MacSize, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()), box,
                                   boxSize, nonce, key_.data()) != 0) {
        spdlog::warn("Stored secret does not match key {}", keyPath_.string());
        return std::nullopt;
    }
    return plaintext;
}

std::string base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encodedLen, '\0');
    sodium_bin2base64(encoded.data(), encodedLen,
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    // encoded_len counts the terminating NUL
    encoded.resize(encodedLen - 1);
    return encoded;
}

std::optional<std::string> base64Decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::string{};
    }

    std::string decoded(encoded.size(), '\0');
    size_t decodedLen = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(decoded.data()), decoded.size(),
                          encoded.data(), encoded.size(), nullptr, &decodedLen, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    decoded.resize(decodedLen);
    return decoded;
}

} // namespace vidscan::infra
