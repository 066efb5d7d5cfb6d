/**
 * @file HttpResponse.hpp
 * @brief HTTP request/response values exchanged with device web interfaces.
 */

#pragma once

#include "core/types/Credentials.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace vidscan::core {

/**
 * @brief A GET request against a device management interface.
 */
struct HttpRequest {
    std::string url;                          ///< Absolute http:// or https:// URL
    std::optional<Credentials> credentials;   ///< Basic auth pair, if any
    std::map<std::string, std::string> headers; ///< Extra request headers
    std::chrono::milliseconds timeout{5000};  ///< Budget for the whole exchange
};

/**
 * @brief Response data from an HTTP request.
 *
 * Header names are stored lower-cased.
 */
struct HttpResponse {
    int statusCode{0};       ///< HTTP status code (e.g., 200, 401); 0 when no response
    std::map<std::string, std::string> headers; ///< Response headers, lower-case keys
    std::string body;        ///< Response body content
    std::string errorMessage; ///< Transport error message if the request failed
    bool success{false};     ///< True for 2xx/3xx responses

    /**
     * @brief Checks whether a response was received at all.
     * @return True if the server sent a parseable status line.
     */
    [[nodiscard]] bool received() const { return statusCode > 0; }

    /**
     * @brief Checks whether the server demanded authentication.
     * @return True for 401 and 407 responses.
     */
    [[nodiscard]] bool isAuthChallenge() const {
        return statusCode == 401 || statusCode == 407;
    }

    /**
     * @brief Looks up a header by name (case-insensitive).
     * @param name Header name.
     * @return Header value, or nullopt if absent.
     */
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    bool operator==(const HttpResponse& other) const = default;
};

} // namespace vidscan::core
