#include "infrastructure/discovery/DiscoveryService.hpp"

#include "core/classification/DetailExtractor.hpp"
#include "core/classification/ManufacturerClassifier.hpp"
#include "core/discovery/ResultAggregator.hpp"
#include "core/discovery/TargetRange.hpp"
#include "infrastructure/discovery/CredentialAuthenticator.hpp"
#include "infrastructure/discovery/VendorApiEnricher.hpp"
#include "infrastructure/network/HostnameResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace vidscan::infra {

struct DiscoveryService::Run {
    Run(const core::DiscoveryConfig& cfg, core::IHttpClient& client, ProgressCallback callback)
        : config(cfg), ports(cfg.portsToProbe()),
          authenticator(client, cfg.credentialChain(), cfg.httpTimeout),
          enricher(client, cfg.httpTimeout), onProgress(std::move(callback)) {}

    const core::DiscoveryConfig& config;
    std::optional<core::TargetRange> range;
    std::vector<uint16_t> ports;
    CredentialAuthenticator authenticator;
    VendorApiEnricher enricher;
    ProgressCallback onProgress;

    std::atomic<uint64_t> nextIndex{0};
    std::vector<std::vector<core::EndpointRecord>> perWorker;

    std::mutex progressMutex;
    core::DiscoveryProgress progress;

    std::mutex failureMutex;
    std::exception_ptr failure;
};

DiscoveryService::DiscoveryService(core::IPortProber& prober, core::IHttpClient& httpClient,
                                   HostnameLookup hostnameLookup)
    : prober_(prober), httpClient_(httpClient), hostnameLookup_(std::move(hostnameLookup)) {
    if (!hostnameLookup_) {
        hostnameLookup_ = &HostnameResolver::reverseLookup;
    }
}

core::DiscoveryReport DiscoveryService::discover(const core::DiscoveryConfig& config,
                                                 ProgressCallback onProgress) {
    if (running_.exchange(true)) {
        throw std::logic_error("A discovery is already running");
    }
    struct RunningReset {
        std::atomic<bool>& flag;
        ~RunningReset() { flag = false; }
    } runningReset{running_};

    cancelled_ = false;
    auto startTime = std::chrono::steady_clock::now();

    Run run(config, httpClient_, std::move(onProgress));
    if (!config.targetRange.empty()) {
        run.range = core::TargetRange::parse(config.targetRange);
    }
    for (const auto& address : config.forceEndpoints) {
        if (!core::TargetRange::parseAddress(address)) {
            throw core::InvalidRangeError(address, "forced endpoint is not an IPv4 address");
        }
    }

    uint64_t totalHosts = run.range ? run.range->size() : 0;
    run.progress.totalHosts = totalHosts;

    auto workerCount = static_cast<size_t>(
        std::min<uint64_t>(static_cast<uint64_t>(std::max(1, config.maxConcurrency)), totalHosts));
    run.perWorker.resize(workerCount);

    if (run.range) {
        std::string portList;
        for (auto port : run.ports) {
            portList += (portList.empty() ? "" : ",") + std::to_string(port);
        }
        spdlog::info("Scanning {} ({} hosts, {} workers, ports {})", run.range->toString(),
                     totalHosts, workerCount, portList);
    }

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    try {
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back([this, &run, i]() { runWorker(run, i); });
        }
    } catch (const std::system_error& e) {
        spdlog::critical("Cannot start discovery workers: {}", e.what());
        cancelled_ = true;
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    for (auto& worker : workers) {
        worker.join();
    }

    if (run.failure) {
        std::rethrow_exception(run.failure);
    }

    core::ResultAggregator aggregator;
    for (auto& records : run.perWorker) {
        aggregator.addAll(std::move(records));
    }
    for (const auto& address : config.forceEndpoints) {
        spdlog::debug("Adding forced endpoint {}", address);
        aggregator.add(core::EndpointRecord::forced(address));
    }

    core::DiscoveryReport report;
    report.endpoints = aggregator.results();
    report.scannedHosts = run.progress.scannedHosts;
    report.cancelled = cancelled_.load();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (report.cancelled) {
        spdlog::warn("Discovery cancelled after {} of {} hosts", report.scannedHosts, totalHosts);
        if (run.onProgress) {
            auto progress = run.progress;
            progress.cancelled = true;
            progress.endpoints = report.endpoints.size();
            run.onProgress(progress);
        }
    }
    spdlog::info("Discovery finished: {} endpoint(s), {} host(s) scanned in {} ms",
                 report.endpoints.size(), report.scannedHosts, report.elapsed.count());
    return report;
}

void DiscoveryService::cancel() {
    if (!cancelled_.exchange(true)) {
        spdlog::info("Discovery cancellation requested");
    }
}

void DiscoveryService::runWorker(Run& run, size_t worker) {
    try {
        while (!cancelled_) {
            auto index = run.nextIndex.fetch_add(1);
            if (!run.range || index >= run.range->size()) {
                break;
            }

            auto address = run.range->at(index);
            auto record = processHost(run, address);
            bool live = record.has_value();
            if (record) {
                run.perWorker[worker].push_back(std::move(*record));
            }
            reportProgress(run, live);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Discovery worker {} failed: {}", worker, e.what());
        {
            std::lock_guard lock(run.failureMutex);
            if (!run.failure) {
                run.failure = std::current_exception();
            }
        }
        cancelled_ = true;
    }
}

std::optional<core::EndpointRecord> DiscoveryService::processHost(Run& run,
                                                                  const std::string& address) {
    auto results = prober_.probeHost(core::Target{address, run.ports});
    auto profile = core::HostProfile::fromResults(address, results);
    if (!profile) {
        spdlog::debug("{}: no candidate port reachable", address);
        return std::nullopt;
    }

    core::EndpointRecord record;
    record.ip = address;
    record.source = core::EndpointSource::Probed;
    record.accessUri = profile->accessUri();
    record.openPorts.assign(profile->openPorts.begin(), profile->openPorts.end());

    auto session = run.authenticator.authenticate(*profile);
    if (session.credentials) {
        record.authenticatedAs = session.credentials->username;
    }

    if (session.hasResponse()) {
        auto classification = core::ManufacturerClassifier::classify(session.response);
        record.manufacturer = classification.manufacturer;
        if (!classification.evidence.empty()) {
            spdlog::debug("{}: {} ({})", address, record.manufacturerToString(),
                          classification.evidence);
        }

        auto details = core::extractorFor(record.manufacturer).extract(session.response);
        if (run.config.vendorApiEnrichment) {
            auto enrichment = run.enricher.enrich(record.manufacturer, session, *profile);
            details.merge(enrichment.details);
            if (enrichment.manufacturer) {
                record.manufacturer = *enrichment.manufacturer;
            }
        }
        record.applyDetails(details);
    } else {
        spdlog::debug("{}: no web response ({}), recording as Generic", address,
                      session.outcomeToString());
    }

    record.hostname = run.config.resolveHostnames ? hostnameLookup_(address) : address;

    if (!record.complete()) {
        spdlog::debug("{}: no identity details extracted", address);
    }
    spdlog::info("Found {} endpoint at {}{}", record.manufacturerToString(), address,
                 record.model.empty() ? "" : " (" + record.model + ")");
    return record;
}

void DiscoveryService::reportProgress(Run& run, bool live) {
    core::DiscoveryProgress snapshot;
    {
        std::lock_guard lock(run.progressMutex);
        ++run.progress.scannedHosts;
        if (live) {
            ++run.progress.liveHosts;
            ++run.progress.endpoints;
        }
        run.progress.cancelled = cancelled_.load();
        snapshot = run.progress;
    }

    if (run.onProgress) {
        run.onProgress(snapshot);
    }
}

} // namespace vidscan::infra
