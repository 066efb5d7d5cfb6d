#include "infrastructure/network/HttpClient.hpp"

#include "infrastructure/network/HttpAuth.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <future>
#include <sstream>
#include <stdexcept>

namespace vidscan::infra {

namespace {

using Strand = asio::strand<asio::io_context::executor_type>;

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<size_t> parseSize(const std::string& text, int base) {
    try {
        size_t consumed = 0;
        auto value = std::stoull(text, &consumed, base);
        if (consumed == 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Parses the status line and header block (everything before the blank line).
bool parseHead(const std::string& head, core::HttpResponse& response) {
    std::istringstream iss(head);
    std::string line;

    if (!std::getline(iss, line)) {
        return false;
    }
    std::istringstream statusLine(trim(line));
    std::string version;
    int status = 0;
    statusLine >> version >> status;
    if (version.rfind("HTTP/", 0) != 0 || status < 100 || status > 999) {
        return false;
    }
    response.statusCode = status;

    while (std::getline(iss, line)) {
        auto colonPos = line.find(':');
        if (colonPos == std::string::npos) {
            continue;
        }
        std::string key = toLower(trim(line.substr(0, colonPos)));
        std::string value = trim(line.substr(colonPos + 1));

        auto [it, inserted] = response.headers.emplace(key, value);
        if (!inserted) {
            it->second += ", " + value;
        }
    }
    return true;
}

std::string decodeChunked(const std::string& data) {
    std::string decoded;
    size_t pos = 0;

    while (pos < data.size()) {
        auto lineEnd = data.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            break;
        }
        std::string sizeLine = data.substr(pos, lineEnd - pos);
        sizeLine = trim(sizeLine.substr(0, sizeLine.find(';')));
        auto size = parseSize(sizeLine, 16);
        if (!size || *size == 0) {
            break;
        }

        pos = lineEnd + 2;
        decoded.append(data, pos, std::min(*size, data.size() - pos));
        pos += *size + 2;
    }
    return decoded;
}

// True once the bytes received so far form a whole response, so servers that
// keep the connection open after the body do not stall the exchange.
bool messageComplete(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return false;
    }

    core::HttpResponse head;
    if (!parseHead(raw.substr(0, headerEnd), head)) {
        return true;
    }
    if (head.statusCode < 200 || head.statusCode == 204 || head.statusCode == 304) {
        return true;
    }

    size_t bodySize = raw.size() - headerEnd - 4;
    auto encoding = head.header("transfer-encoding");
    if (encoding && toLower(*encoding).find("chunked") != std::string::npos) {
        return bodySize >= 5 && raw.compare(raw.size() - 5, 5, "0\r\n\r\n") == 0;
    }
    if (auto length = head.header("content-length")) {
        auto expected = parseSize(*length, 10);
        return expected && bodySize >= *expected;
    }
    return false;
}

} // namespace

std::string ParsedUrl::hostHeader() const {
    bool defaultPort = (tls() && port == 443) || (!tls() && port == 80);
    return defaultPort ? host : host + ":" + std::to_string(port);
}

struct HttpClient::Exchange {
    Exchange(asio::io_context& io, asio::ssl::context& sslContext)
        : strand(asio::make_strand(io)), resolver(strand), stream(strand, sslContext),
          timer(strand) {}

    Strand strand;
    asio::ip::tcp::resolver resolver;
    asio::ssl::stream<asio::ip::tcp::socket> stream;
    asio::steady_timer timer;
    ParsedUrl url;
    std::string request;
    std::string raw;
    std::array<char, 8192> buffer{};
    bool timedOut{false};
    bool finished{false};
    ResponseCallback callback;
};

HttpClient::HttpClient(AsioContext& context, std::string userAgent)
    : context_(context), userAgent_(std::move(userAgent)),
      sslContext_(asio::ssl::context::tls_client) {
    sslContext_.set_verify_mode(asio::ssl::verify_none);
}

void HttpClient::getAsync(const core::HttpRequest& request, ResponseCallback callback) {
    auto url = parseUrl(request.url);
    if (!url) {
        core::HttpResponse response;
        response.errorMessage = "Invalid URL: " + request.url;
        callback(std::move(response));
        return;
    }

    auto exchange = std::make_shared<Exchange>(context_.getContext(), sslContext_);
    exchange->url = *url;
    exchange->request = buildRequest(*url, request);
    exchange->callback = std::move(callback);

    auto timeout = request.timeout;
    asio::post(exchange->strand, [this, exchange, timeout]() {
        exchange->timer.expires_after(timeout);
        exchange->timer.async_wait([exchange](const asio::error_code& ec) {
            if (ec || exchange->finished) {
                return;
            }
            exchange->timedOut = true;
            exchange->resolver.cancel();
            asio::error_code ignored;
            exchange->stream.lowest_layer().close(ignored);
        });
        resolve(exchange);
    });
}

core::HttpResponse HttpClient::get(const core::HttpRequest& request) {
    if (!context_.isRunning()) {
        throw std::runtime_error("HttpClient used with a stopped I/O context");
    }

    auto perform = [this](const core::HttpRequest& req) {
        auto promise = std::make_shared<std::promise<core::HttpResponse>>();
        auto future = promise->get_future();
        getAsync(req, [promise](core::HttpResponse response) {
            promise->set_value(std::move(response));
        });
        return future.get();
    };

    auto response = perform(request);
    if (response.statusCode != 401 || !request.credentials || !request.credentials->isValid()) {
        return response;
    }

    auto challengeHeader = response.header("www-authenticate");
    if (!challengeHeader) {
        return response;
    }
    auto challenge = HttpAuth::parseDigestChallenge(*challengeHeader);
    if (!challenge) {
        return response;
    }

    auto url = parseUrl(request.url);
    auto authorization =
        HttpAuth::digest(*challenge, *request.credentials, url->target, HttpAuth::makeCnonce());
    if (authorization.empty()) {
        spdlog::debug("Unsupported Digest algorithm '{}' at {}", challenge->algorithm,
                      request.url);
        return response;
    }

    spdlog::debug("Answering Digest challenge of {} (realm '{}')", request.url, challenge->realm);
    core::HttpRequest retry = request;
    retry.headers["Authorization"] = authorization;
    return perform(retry);
}

void HttpClient::resolve(const std::shared_ptr<Exchange>& exchange) {
    exchange->resolver.async_resolve(
        exchange->url.host, std::to_string(exchange->url.port),
        asio::bind_executor(exchange->strand,
                            [this, exchange](const asio::error_code& ec,
                                             asio::ip::tcp::resolver::results_type results) {
                                if (ec) {
                                    finish(exchange, ec);
                                    return;
                                }
                                connect(exchange, results);
                            }));
}

void HttpClient::connect(const std::shared_ptr<Exchange>& exchange,
                         const asio::ip::tcp::resolver::results_type& endpoints) {
    asio::async_connect(
        exchange->stream.lowest_layer(), endpoints,
        asio::bind_executor(exchange->strand, [this, exchange](const asio::error_code& ec,
                                                               const asio::ip::tcp::endpoint&) {
            if (ec) {
                finish(exchange, ec);
                return;
            }
            if (exchange->url.tls()) {
                handshake(exchange);
            } else {
                write(exchange);
            }
        }));
}

void HttpClient::handshake(const std::shared_ptr<Exchange>& exchange) {
    asio::error_code ec;
    asio::ip::make_address(exchange->url.host, ec);
    if (ec) {
        // SNI only for names, not for address literals
        SSL_set_tlsext_host_name(exchange->stream.native_handle(), exchange->url.host.c_str());
    }

    exchange->stream.async_handshake(
        asio::ssl::stream_base::client,
        asio::bind_executor(exchange->strand, [this, exchange](const asio::error_code& hsEc) {
            if (hsEc) {
                finish(exchange, hsEc);
                return;
            }
            write(exchange);
        }));
}

void HttpClient::write(const std::shared_ptr<Exchange>& exchange) {
    auto onWritten = asio::bind_executor(
        exchange->strand, [this, exchange](const asio::error_code& ec, std::size_t /*bytes*/) {
            if (ec) {
                finish(exchange, ec);
                return;
            }
            read(exchange);
        });

    if (exchange->url.tls()) {
        asio::async_write(exchange->stream, asio::buffer(exchange->request), onWritten);
    } else {
        asio::async_write(exchange->stream.next_layer(), asio::buffer(exchange->request),
                          onWritten);
    }
}

void HttpClient::read(const std::shared_ptr<Exchange>& exchange) {
    auto onRead = asio::bind_executor(
        exchange->strand, [this, exchange](const asio::error_code& ec, std::size_t bytes) {
            exchange->raw.append(exchange->buffer.data(), bytes);
            if (ec) {
                finish(exchange, ec);
                return;
            }
            if (exchange->raw.size() >= MaxResponseBytes || messageComplete(exchange->raw)) {
                finish(exchange, {});
                return;
            }
            read(exchange);
        });

    if (exchange->url.tls()) {
        exchange->stream.async_read_some(asio::buffer(exchange->buffer), onRead);
    } else {
        exchange->stream.next_layer().async_read_some(asio::buffer(exchange->buffer), onRead);
    }
}

void HttpClient::finish(const std::shared_ptr<Exchange>& exchange, const asio::error_code& ec) {
    if (exchange->finished) {
        return;
    }
    exchange->finished = true;
    exchange->timer.cancel();
    asio::error_code ignored;
    exchange->stream.lowest_layer().close(ignored);

    core::HttpResponse response;
    if (!exchange->raw.empty()) {
        response = parseResponse(exchange->raw);
    }

    if (!response.received()) {
        response = core::HttpResponse{};
        if (exchange->timedOut) {
            response.errorMessage = "Request timed out";
        } else if (ec && ec != asio::error::eof) {
            response.errorMessage = ec.message();
        } else {
            response.errorMessage = "Empty response";
        }
        spdlog::debug("GET {}://{}{} failed: {}", exchange->url.scheme,
                      exchange->url.hostHeader(), exchange->url.target, response.errorMessage);
    } else {
        spdlog::trace("GET {}://{}{} -> {} ({} bytes)", exchange->url.scheme,
                      exchange->url.hostHeader(), exchange->url.target, response.statusCode,
                      response.body.size());
    }

    auto callback = std::move(exchange->callback);
    callback(std::move(response));
}

std::optional<ParsedUrl> HttpClient::parseUrl(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, sep));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }
    parsed.port = parsed.tls() ? 443 : 80;

    std::string rest = url.substr(sep + 3);
    auto pathPos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathPos);
    if (pathPos != std::string::npos) {
        parsed.target = rest.substr(pathPos);
        if (parsed.target.front() == '?') {
            parsed.target.insert(0, "/");
        }
    }

    auto colonPos = authority.rfind(':');
    if (colonPos != std::string::npos) {
        auto port = parseSize(authority.substr(colonPos + 1), 10);
        if (!port || *port == 0 || *port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(*port);
        authority = authority.substr(0, colonPos);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    parsed.host = authority;
    return parsed;
}

core::HttpResponse HttpClient::parseResponse(const std::string& raw) {
    core::HttpResponse response;

    auto headerEnd = raw.find("\r\n\r\n");
    size_t bodyStart = headerEnd == std::string::npos ? raw.size() : headerEnd + 4;
    if (headerEnd == std::string::npos) {
        headerEnd = raw.size();
    }

    if (!parseHead(raw.substr(0, headerEnd), response)) {
        core::HttpResponse malformed;
        malformed.errorMessage = "Malformed HTTP response";
        return malformed;
    }

    std::string body = raw.substr(bodyStart);
    auto encoding = response.header("transfer-encoding");
    if (encoding && toLower(*encoding).find("chunked") != std::string::npos) {
        body = decodeChunked(body);
    } else if (auto length = response.header("content-length")) {
        auto expected = parseSize(*length, 10);
        if (expected && *expected < body.size()) {
            body.resize(*expected);
        }
    }
    response.body = std::move(body);

    response.success = response.statusCode >= 200 && response.statusCode < 400;
    if (!response.success) {
        response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
    }
    return response;
}

std::string HttpClient::buildRequest(const ParsedUrl& url, const core::HttpRequest& request) const {
    std::ostringstream ss;
    ss << "GET " << url.target << " HTTP/1.1\r\n";
    ss << "Host: " << url.hostHeader() << "\r\n";
    ss << "User-Agent: " << userAgent_ << "\r\n";
    ss << "Accept: */*\r\n";

    bool hasAuthorization = false;
    for (const auto& [key, value] : request.headers) {
        if (toLower(key) == "authorization") {
            hasAuthorization = true;
        }
        ss << key << ": " << value << "\r\n";
    }
    if (!hasAuthorization && request.credentials && request.credentials->isValid()) {
        ss << "Authorization: " << HttpAuth::basic(*request.credentials) << "\r\n";
    }

    ss << "Connection: close\r\n";
    ss << "\r\n";
    return ss.str();
}

} // namespace vidscan::infra
