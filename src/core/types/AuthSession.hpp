/**
 * @file AuthSession.hpp
 * @brief Outcome of authenticating against a device management interface.
 */

#pragma once

#include "core/types/Credentials.hpp"
#include "core/types/HttpResponse.hpp"

#include <optional>
#include <string>

namespace vidscan::core {

/**
 * @brief How an authentication attempt against a host ended.
 */
enum class AuthOutcome : int {
    Authenticated = 0,         ///< A credential pair produced a 2xx/3xx response
    MarkersUnderChallenge = 1, ///< Auth failed but the challenge leaked device markers
    Rejected = 2,              ///< Every credential pair was refused
    Unreachable = 3,           ///< The web interface did not answer
    NoWebPort = 4              ///< Host exposes no HTTP/HTTPS port
};

/**
 * @brief Transient record of an authentication run against one host.
 *
 * At most one successful session exists per host. When every credential pair
 * fails, credentials is empty and response carries the unauthenticated
 * (or last challenged) response used for reduced-confidence classification.
 */
struct AuthSession {
    std::string address;                   ///< Host address
    std::string baseUrl;                   ///< scheme://address[:port] that was queried
    std::optional<Credentials> credentials; ///< Pair that succeeded, if any
    AuthOutcome outcome{AuthOutcome::NoWebPort}; ///< Final outcome
    HttpResponse response;                 ///< Best available response
    int attempts{0};                       ///< Number of requests issued

    /**
     * @brief Checks whether a credential pair was accepted.
     */
    [[nodiscard]] bool success() const { return outcome == AuthOutcome::Authenticated; }

    /**
     * @brief Checks whether a response body/headers are available to classify.
     */
    [[nodiscard]] bool hasResponse() const { return response.received(); }

    [[nodiscard]] std::string outcomeToString() const;
};

} // namespace vidscan::core
