#pragma once

#include "core/types/Credentials.hpp"

#include <optional>
#include <string>

namespace vidscan::infra {

/**
 * @brief Parameters of a `WWW-Authenticate: Digest ...` challenge.
 */
struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string algorithm{"MD5"}; ///< MD5 or MD5-sess
    bool qopAuth{false};          ///< Server offered qop=auth
};

/**
 * @brief Builders for the Authorization header of HTTP Basic and Digest (RFC 2617).
 */
class HttpAuth {
public:
    /**
     * @brief Builds a Basic Authorization header value.
     * @return "Basic base64(user:pass)".
     */
    static std::string basic(const core::Credentials& credentials);

    /**
     * @brief Extracts a Digest challenge from a WWW-Authenticate header value.
     *
     * The value may list several challenges; only the Digest one is read.
     *
     * @return The challenge, or nullopt if none is offered or it lacks a nonce.
     */
    static std::optional<DigestChallenge> parseDigestChallenge(const std::string& headerValue);

    /**
     * @brief Builds a Digest Authorization header value for a GET.
     * @param challenge Challenge returned by the server.
     * @param credentials Username and password.
     * @param uri Request target, e.g. "/index.html".
     * @param cnonce Client nonce.
     * @param nonceCount Request counter, formatted as eight hex digits.
     * @return Header value, or empty string for an unsupported algorithm.
     */
    static std::string digest(const DigestChallenge& challenge,
                              const core::Credentials& credentials, const std::string& uri,
                              const std::string& cnonce, unsigned nonceCount = 1);

    /**
     * @brief Lower-case hex MD5 of @p data.
     */
    static std::string md5Hex(const std::string& data);

    /**
     * @brief Random client nonce (16 hex digits).
     * @throws std::runtime_error if libsodium cannot be initialised.
     */
    static std::string makeCnonce();
};

} // namespace vidscan::infra
