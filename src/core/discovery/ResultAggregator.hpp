#pragma once

#include "core/types/Endpoint.hpp"

#include <map>
#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Merges endpoint records into one record per IP.
 *
 * A forced record always supersedes a probed record for the same address,
 * whatever the arrival order. Between two records of the same source the
 * first one is kept. Not thread-safe: feed it from a single ingestion point.
 */
class ResultAggregator {
public:
    /**
     * @brief Adds a record.
     * @param record Record to merge.
     * @return True if the record was stored (new IP or superseding).
     */
    bool add(EndpointRecord record);

    void addAll(std::vector<EndpointRecord> records);

    /**
     * @brief Returns the merged records sorted by numeric IPv4 address.
     */
    [[nodiscard]] std::vector<EndpointRecord> results() const;

    [[nodiscard]] size_t size() const { return records_.size(); }

    void clear() { records_.clear(); }

private:
    std::map<std::string, EndpointRecord> records_;
};

} // namespace vidscan::core
