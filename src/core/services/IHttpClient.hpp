#pragma once

#include "core/types/HttpResponse.hpp"

namespace vidscan::core {

/**
 * @brief Blocking HTTP(S) GET client used to talk to device web interfaces.
 *
 * Transport failures (refused, timeout, TLS error) are returned as a
 * response with statusCode 0 and an errorMessage, never thrown.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const HttpRequest& request) = 0;
};

} // namespace vidscan::core
