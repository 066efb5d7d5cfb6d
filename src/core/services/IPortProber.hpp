/**
 * @file IPortProber.hpp
 * @brief Interface for connect-level probing of candidate ports.
 */

#pragma once

#include "core/discovery/TargetRange.hpp"
#include "core/types/ProbeResult.hpp"

#include <vector>

namespace vidscan::core {

/**
 * @brief Probes the candidate ports of one host.
 *
 * Implementations probe the ports of a target concurrently and return once
 * every port has completed or timed out. Refused, unreachable and timed out
 * connections are reported as outcomes, never thrown.
 */
class IPortProber {
public:
    virtual ~IPortProber() = default;

    /**
     * @brief Probes every port of a target.
     * @param target Host address and ports.
     * @return One ProbeResult per port of the target.
     */
    virtual std::vector<ProbeResult> probeHost(const Target& target) = 0;
};

} // namespace vidscan::core
