#pragma once

#include "core/services/IDiscoveryService.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/IPortProber.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace vidscan::infra {

/**
 * @brief Discovery pipeline over a pool of worker threads.
 *
 * Each worker takes the next address of the range and runs it through
 * probe, authenticate, classify, extract and enrich, keeping the records it
 * produces in its own list. The lists are merged into a ResultAggregator
 * after all workers joined, and forced endpoints are added last so they
 * supersede probed records. cancel() stops workers from taking new hosts;
 * hosts already in flight finish and their records are kept.
 */
class DiscoveryService : public core::IDiscoveryService {
public:
    using HostnameLookup = std::function<std::string(const std::string&)>;

    /**
     * @param prober Port prober; must outlive the service and be thread-safe.
     * @param httpClient HTTP client; must outlive the service and be thread-safe.
     * @param hostnameLookup Reverse lookup, HostnameResolver::reverseLookup by default.
     */
    DiscoveryService(core::IPortProber& prober, core::IHttpClient& httpClient,
                     HostnameLookup hostnameLookup = {});

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @copydoc core::IDiscoveryService::discover
     * @throws std::logic_error if a discovery is already running.
     * @throws std::system_error if worker threads cannot be started.
     */
    core::DiscoveryReport discover(const core::DiscoveryConfig& config,
                                   ProgressCallback onProgress = {}) override;

    void cancel() override;

    bool isRunning() const override { return running_.load(); }

private:
    struct Run;

    void runWorker(Run& run, size_t worker);
    std::optional<core::EndpointRecord> processHost(Run& run, const std::string& address);
    void reportProgress(Run& run, bool live);

    core::IPortProber& prober_;
    core::IHttpClient& httpClient_;
    HostnameLookup hostnameLookup_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
};

} // namespace vidscan::infra
