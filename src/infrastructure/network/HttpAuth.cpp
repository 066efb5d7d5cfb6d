#include "infrastructure/network/HttpAuth.hpp"

#include "infrastructure/crypto/SecureStorage.hpp"

#include <openssl/evp.h>
#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <map>
#include <stdexcept>

namespace vidscan::infra {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toHex(const unsigned char* data, size_t size) {
    static constexpr char Digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        hex.push_back(Digits[data[i] >> 4]);
        hex.push_back(Digits[data[i] & 0x0f]);
    }
    return hex;
}

// Parses `key=value, key="quoted value", ...`; the first occurrence of a key wins.
std::map<std::string, std::string> parseParams(const std::string& text) {
    std::map<std::string, std::string> params;
    size_t pos = 0;

    while (pos < text.size()) {
        while (pos < text.size() && (std::isspace(static_cast<unsigned char>(text[pos])) ||
                                     text[pos] == ',')) {
            ++pos;
        }
        auto eq = text.find('=', pos);
        if (eq == std::string::npos) {
            break;
        }
        std::string key = toLower(text.substr(pos, eq - pos));
        key.erase(std::remove_if(key.begin(), key.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  key.end());
        pos = eq + 1;

        std::string value;
        if (pos < text.size() && text[pos] == '"') {
            ++pos;
            while (pos < text.size() && text[pos] != '"') {
                if (text[pos] == '\\' && pos + 1 < text.size()) {
                    ++pos;
                }
                value.push_back(text[pos++]);
            }
            ++pos;
        } else {
            auto end = text.find(',', pos);
            value = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = end == std::string::npos ? text.size() : end;
        }

        params.emplace(std::move(key), std::move(value));
    }
    return params;
}

} // namespace

std::string HttpAuth::basic(const core::Credentials& credentials) {
    return "Basic " + base64Encode(credentials.username + ":" + credentials.password);
}

std::optional<DigestChallenge> HttpAuth::parseDigestChallenge(const std::string& headerValue) {
    auto lower = toLower(headerValue);
    auto start = lower.find("digest ");
    if (start == std::string::npos) {
        return std::nullopt;
    }

    auto params = parseParams(headerValue.substr(start + 7));
    auto nonce = params.find("nonce");
    if (nonce == params.end() || nonce->second.empty()) {
        return std::nullopt;
    }

    DigestChallenge challenge;
    challenge.nonce = nonce->second;
    if (auto it = params.find("realm"); it != params.end()) {
        challenge.realm = it->second;
    }
    if (auto it = params.find("opaque"); it != params.end()) {
        challenge.opaque = it->second;
    }
    if (auto it = params.find("algorithm"); it != params.end()) {
        challenge.algorithm = it->second;
    }
    if (auto it = params.find("qop"); it != params.end()) {
        // qop is a comma separated list inside the quotes, e.g. "auth,auth-int"
        std::string qop = toLower(it->second);
        size_t pos = 0;
        while (pos <= qop.size()) {
            auto end = qop.find(',', pos);
            std::string token = qop.substr(pos, end == std::string::npos ? std::string::npos
                                                                         : end - pos);
            token.erase(std::remove_if(token.begin(), token.end(),
                                       [](unsigned char c) { return std::isspace(c); }),
                        token.end());
            if (token == "auth") {
                challenge.qopAuth = true;
            }
            if (end == std::string::npos) {
                break;
            }
            pos = end + 1;
        }
    }
    return challenge;
}

std::string HttpAuth::digest(const DigestChallenge& challenge,
                             const core::Credentials& credentials, const std::string& uri,
                             const std::string& cnonce, unsigned nonceCount) {
    auto algorithm = toLower(challenge.algorithm);
    if (algorithm != "md5" && algorithm != "md5-sess") {
        return {};
    }

    std::array<char, 9> nc{};
    std::snprintf(nc.data(), nc.size(), "%08x", nonceCount);

    std::string ha1 =
        md5Hex(credentials.username + ":" + challenge.realm + ":" + credentials.password);
    if (algorithm == "md5-sess") {
        ha1 = md5Hex(ha1 + ":" + challenge.nonce + ":" + cnonce);
    }
    std::string ha2 = md5Hex("GET:" + uri);

    std::string response;
    if (challenge.qopAuth) {
        response = md5Hex(ha1 + ":" + challenge.nonce + ":" + nc.data() + ":" + cnonce +
                          ":auth:" + ha2);
    } else {
        response = md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);
    }

    std::string header = "Digest username=\"" + credentials.username + "\", realm=\"" +
                         challenge.realm + "\", nonce=\"" + challenge.nonce + "\", uri=\"" +
                         uri + "\", algorithm=" + challenge.algorithm + ", response=\"" +
                         response + "\"";
    if (!challenge.opaque.empty()) {
        header += ", opaque=\"" + challenge.opaque + "\"";
    }
    if (challenge.qopAuth) {
        header += ", qop=auth, nc=" + std::string(nc.data()) + ", cnonce=\"" + cnonce + "\"";
    }
    return header;
}

std::string HttpAuth::md5Hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_md5(), nullptr) != 1) {
        return {};
    }
    return toHex(digest.data(), length);
}

std::string HttpAuth::makeCnonce() {
    std::array<unsigned char, 8> bytes{};
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialisation failed");
    }
    randombytes_buf(bytes.data(), bytes.size());
    return toHex(bytes.data(), bytes.size());
}

} // namespace vidscan::infra
