/**
 * @file IDiscoveryService.hpp
 * @brief Interface for the endpoint discovery pipeline.
 */

#pragma once

#include "core/types/DiscoveryConfig.hpp"

#include <functional>

namespace vidscan::core {

/**
 * @brief Runs probe, authenticate, classify, extract and aggregate over a range.
 */
class IDiscoveryService {
public:
    /**
     * @brief Callback function type for progress updates.
     *
     * Called from the worker threads, possibly concurrently; snapshots from
     * different workers may arrive out of order.
     * @param progress Current discovery progress.
     */
    using ProgressCallback = std::function<void(const DiscoveryProgress&)>;

    virtual ~IDiscoveryService() = default;

    /**
     * @brief Runs a discovery and blocks until it finishes or is cancelled.
     * @param config Range, credentials, overrides and limits.
     * @param onProgress Optional progress callback, invoked from worker threads.
     * @return One record per endpoint, sorted by address.
     * @throws InvalidRangeError if the range or a forced address is malformed.
     */
    virtual DiscoveryReport discover(const DiscoveryConfig& config,
                                     ProgressCallback onProgress = {}) = 0;

    /**
     * @brief Requests cancellation. No new hosts are started; hosts in flight finish.
     */
    virtual void cancel() = 0;

    virtual bool isRunning() const = 0;
};

} // namespace vidscan::core
