#pragma once

#include "core/services/IPortProber.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace vidscan::infra {

/**
 * @brief Timing and fan-out limits of the port prober.
 */
struct ProbeOptions {
    std::chrono::milliseconds connectTimeout{500}; ///< Per connect, and per TLS handshake
    std::chrono::milliseconds hostTimeout{3000};   ///< Budget for all ports of a host
    int perHostConcurrency{5};                     ///< Ports in flight per host
};

/**
 * @brief Asynchronous TCP connect prober with TLS detection.
 *
 * Probes the ports of a host concurrently, at most perHostConcurrency at a
 * time. On ports that conventionally carry TLS (443, 5061) a successful
 * connect is followed by a TLS client handshake, certificate verification
 * disabled, to record whether the port speaks TLS. Every socket and timer of
 * a host runs on one strand, so timeouts close sockets without racing the
 * completion handlers.
 */
class PortProber : public core::IPortProber {
public:
    using ResultCallback = std::function<void(std::vector<core::ProbeResult>)>;

    /**
     * @brief Constructs a PortProber with the given Asio context.
     * @param context I/O context driving the sockets; must be started.
     * @param options Timeouts and concurrency limits.
     */
    PortProber(AsioContext& context, ProbeOptions options);

    /**
     * @brief Starts probing a target.
     * @param target Host and ports to probe.
     * @param onComplete Invoked once, on an I/O thread, with one result per port.
     */
    void probeAsync(const core::Target& target, ResultCallback onComplete);

    /**
     * @brief Probes a target and waits for the result.
     *
     * Must not be called from an I/O thread of the context.
     */
    std::vector<core::ProbeResult> probeHost(const core::Target& target) override;

    [[nodiscard]] const ProbeOptions& options() const { return options_; }

private:
    struct HostState;
    struct PortState;

    void startNextPorts(const std::shared_ptr<HostState>& host);
    void probePort(const std::shared_ptr<HostState>& host, uint16_t port);
    void detectTls(const std::shared_ptr<HostState>& host, const std::shared_ptr<PortState>& state);
    void finishPort(const std::shared_ptr<HostState>& host, const std::shared_ptr<PortState>& state);
    void expireHost(const std::shared_ptr<HostState>& host);
    void completeHost(const std::shared_ptr<HostState>& host);

    AsioContext& context_;
    ProbeOptions options_;
    asio::ssl::context sslContext_;
};

} // namespace vidscan::infra
