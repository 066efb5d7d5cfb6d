#include "infrastructure/network/PortProber.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <stdexcept>

namespace vidscan::infra {

namespace {

using Strand = asio::strand<asio::io_context::executor_type>;

core::ProbeOutcome outcomeFor(const asio::error_code& ec) {
    if (ec == asio::error::connection_refused) {
        return core::ProbeOutcome::Refused;
    }
    if (ec == asio::error::timed_out) {
        return core::ProbeOutcome::Timeout;
    }
    if (ec == asio::error::host_unreachable || ec == asio::error::network_unreachable) {
        return core::ProbeOutcome::Unreachable;
    }
    return core::ProbeOutcome::Error;
}

} // namespace

struct PortProber::PortState {
    PortState(Strand& strand, asio::ssl::context& sslContext)
        : stream(strand, sslContext), timer(strand) {}

    void closeSocket() {
        asio::error_code ignored;
        stream.lowest_layer().close(ignored);
    }

    asio::ssl::stream<asio::ip::tcp::socket> stream;
    asio::steady_timer timer;
    core::ProbeResult result;
    std::chrono::steady_clock::time_point started;
    bool timedOut{false};
    bool finished{false};
};

struct PortProber::HostState {
    explicit HostState(asio::io_context& io) : strand(asio::make_strand(io)), deadline(strand) {}

    Strand strand;
    asio::steady_timer deadline;
    core::Target target;
    asio::ip::address address;
    std::vector<core::ProbeResult> results;
    std::vector<std::shared_ptr<PortState>> active;
    size_t nextPort{0};
    size_t inFlight{0};
    bool expired{false};
    bool completed{false};
    ResultCallback onComplete;
};

PortProber::PortProber(AsioContext& context, ProbeOptions options)
    : context_(context), options_(options), sslContext_(asio::ssl::context::tls_client) {
    sslContext_.set_verify_mode(asio::ssl::verify_none);
    if (options_.perHostConcurrency < 1) {
        options_.perHostConcurrency = 1;
    }
}

void PortProber::probeAsync(const core::Target& target, ResultCallback onComplete) {
    asio::error_code ec;
    auto address = asio::ip::make_address(target.address, ec);
    if (ec || target.ports.empty()) {
        if (ec) {
            spdlog::debug("Cannot probe '{}': {}", target.address, ec.message());
        }
        std::vector<core::ProbeResult> results;
        for (uint16_t port : target.ports) {
            core::ProbeResult result;
            result.address = target.address;
            result.port = port;
            result.outcome = core::ProbeOutcome::Error;
            results.push_back(result);
        }
        onComplete(std::move(results));
        return;
    }

    auto host = std::make_shared<HostState>(context_.getContext());
    host->target = target;
    host->address = address;
    host->onComplete = std::move(onComplete);

    asio::post(host->strand, [this, host]() {
        host->deadline.expires_after(options_.hostTimeout);
        host->deadline.async_wait([this, host](const asio::error_code& waitEc) {
            if (!waitEc) {
                expireHost(host);
            }
        });
        startNextPorts(host);
    });
}

std::vector<core::ProbeResult> PortProber::probeHost(const core::Target& target) {
    if (!context_.isRunning()) {
        throw std::runtime_error("PortProber used with a stopped I/O context");
    }

    auto promise = std::make_shared<std::promise<std::vector<core::ProbeResult>>>();
    auto future = promise->get_future();

    probeAsync(target, [promise](std::vector<core::ProbeResult> results) {
        promise->set_value(std::move(results));
    });

    return future.get();
}

void PortProber::startNextPorts(const std::shared_ptr<HostState>& host) {
    auto limit = static_cast<size_t>(options_.perHostConcurrency);
    while (!host->expired && host->inFlight < limit &&
           host->nextPort < host->target.ports.size()) {
        probePort(host, host->target.ports[host->nextPort++]);
    }
}

void PortProber::probePort(const std::shared_ptr<HostState>& host, uint16_t port) {
    auto state = std::make_shared<PortState>(host->strand, sslContext_);
    state->result.address = host->target.address;
    state->result.port = port;
    state->started = std::chrono::steady_clock::now();

    host->active.push_back(state);
    ++host->inFlight;

    state->timer.expires_after(options_.connectTimeout);
    state->timer.async_wait([state](const asio::error_code& ec) {
        if (ec || state->finished) {
            return;
        }
        state->timedOut = true;
        state->closeSocket();
    });

    asio::ip::tcp::endpoint endpoint(host->address, port);
    state->stream.lowest_layer().async_connect(
        endpoint, asio::bind_executor(host->strand, [this, host, state](const asio::error_code& ec) {
            if (ec) {
                state->result.outcome = (state->timedOut || host->expired)
                                            ? core::ProbeOutcome::Timeout
                                            : outcomeFor(ec);
                finishPort(host, state);
                return;
            }

            state->result.outcome = core::ProbeOutcome::Open;
            state->result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - state->started);

            if (core::CandidatePorts::carriesTls(state->result.port) && !host->expired) {
                detectTls(host, state);
                return;
            }
            finishPort(host, state);
        }));
}

void PortProber::detectTls(const std::shared_ptr<HostState>& host,
                           const std::shared_ptr<PortState>& state) {
    // Re-arming the timer aborts the pending connect-timeout wait
    state->timer.expires_after(options_.connectTimeout);
    state->timer.async_wait([state](const asio::error_code& ec) {
        if (ec || state->finished) {
            return;
        }
        state->closeSocket();
    });

    state->stream.async_handshake(
        asio::ssl::stream_base::client,
        asio::bind_executor(host->strand, [this, host, state](const asio::error_code& ec) {
            state->result.tls = !ec;
            if (ec) {
                spdlog::trace("No TLS on {}:{} - {}", state->result.address, state->result.port,
                              ec.message());
            }
            finishPort(host, state);
        }));
}

void PortProber::finishPort(const std::shared_ptr<HostState>& host,
                            const std::shared_ptr<PortState>& state) {
    if (state->finished) {
        return;
    }
    state->finished = true;
    state->timer.cancel();
    state->closeSocket();

    spdlog::trace("Probe {}:{} -> {}{}", state->result.address, state->result.port,
                  state->result.outcomeToString(), state->result.tls ? " (tls)" : "");

    host->results.push_back(state->result);
    host->active.erase(std::remove(host->active.begin(), host->active.end(), state),
                       host->active.end());
    --host->inFlight;

    startNextPorts(host);

    if (host->results.size() == host->target.ports.size()) {
        completeHost(host);
    }
}

void PortProber::expireHost(const std::shared_ptr<HostState>& host) {
    if (host->completed) {
        return;
    }
    host->expired = true;
    spdlog::debug("Probe budget of {}ms exhausted for {}", options_.hostTimeout.count(),
                  host->target.address);

    // In-flight ports report Timeout from their handlers once the socket is closed
    for (const auto& state : host->active) {
        state->timedOut = true;
        state->closeSocket();
    }

    while (host->nextPort < host->target.ports.size()) {
        core::ProbeResult result;
        result.address = host->target.address;
        result.port = host->target.ports[host->nextPort++];
        result.outcome = core::ProbeOutcome::Timeout;
        host->results.push_back(result);
    }

    if (host->results.size() == host->target.ports.size()) {
        completeHost(host);
    }
}

void PortProber::completeHost(const std::shared_ptr<HostState>& host) {
    if (host->completed) {
        return;
    }
    host->completed = true;
    host->deadline.cancel();

    std::sort(host->results.begin(), host->results.end(),
              [](const core::ProbeResult& a, const core::ProbeResult& b) { return a.port < b.port; });

    auto callback = std::move(host->onComplete);
    callback(std::move(host->results));
}

} // namespace vidscan::infra
