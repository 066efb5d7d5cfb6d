#pragma once

#include "core/services/IHttpClient.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vidscan::infra {

/**
 * @brief Components of an http:// or https:// URL.
 */
struct ParsedUrl {
    std::string scheme; ///< "http" or "https"
    std::string host;
    uint16_t port{80};
    std::string target{"/"}; ///< Path and query

    [[nodiscard]] bool tls() const { return scheme == "https"; }

    /**
     * @brief Host header value; the port is omitted when it is the scheme default.
     */
    [[nodiscard]] std::string hostHeader() const;
};

/**
 * @brief HTTP/1.1 GET client over Asio, with TLS through asio::ssl.
 *
 * Each exchange opens its own connection (`Connection: close`) and runs on
 * its own strand; a single timer bounds resolve, connect, handshake, write
 * and read together. Certificates are not verified since management
 * interfaces almost always present self-signed ones.
 *
 * get() answers a Digest challenge by repeating the request once with a
 * Digest Authorization header.
 */
class HttpClient : public core::IHttpClient {
public:
    using ResponseCallback = std::function<void(core::HttpResponse)>;

    static constexpr size_t MaxResponseBytes = 1024 * 1024;

    explicit HttpClient(AsioContext& context, std::string userAgent = "VidScan/1.0");

    /**
     * @brief Performs one exchange asynchronously.
     *
     * Credentials in the request are sent as Basic unless the request already
     * carries an Authorization header.
     *
     * @param request Request to send.
     * @param callback Invoked once with the response; statusCode is 0 on transport failure.
     */
    void getAsync(const core::HttpRequest& request, ResponseCallback callback);

    /**
     * @brief Performs a GET and waits for it, retrying once with Digest when challenged.
     *
     * Must not be called from an I/O thread of the context.
     *
     * @throws std::runtime_error if the I/O context is not running.
     */
    core::HttpResponse get(const core::HttpRequest& request) override;

    /**
     * @brief Splits an absolute http(s) URL.
     * @return Parsed URL, or nullopt for other schemes or a missing host.
     */
    static std::optional<ParsedUrl> parseUrl(const std::string& url);

    /**
     * @brief Parses a raw HTTP/1.x response (status line, headers, body).
     *
     * Chunked bodies are decoded and Content-Length is honoured. Header names
     * are lower-cased; repeated headers are joined with ", ".
     *
     * @return Response with statusCode 0 and an errorMessage when the status line is invalid.
     */
    static core::HttpResponse parseResponse(const std::string& raw);

    /**
     * @brief Serialises the request line and headers of a GET.
     */
    std::string buildRequest(const ParsedUrl& url, const core::HttpRequest& request) const;

private:
    struct Exchange;

    void resolve(const std::shared_ptr<Exchange>& exchange);
    void connect(const std::shared_ptr<Exchange>& exchange,
                 const asio::ip::tcp::resolver::results_type& endpoints);
    void handshake(const std::shared_ptr<Exchange>& exchange);
    void write(const std::shared_ptr<Exchange>& exchange);
    void read(const std::shared_ptr<Exchange>& exchange);
    void finish(const std::shared_ptr<Exchange>& exchange, const asio::error_code& ec);

    AsioContext& context_;
    std::string userAgent_;
    asio::ssl::context sslContext_;
};

} // namespace vidscan::infra
