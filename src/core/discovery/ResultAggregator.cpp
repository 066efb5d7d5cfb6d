#include "core/discovery/ResultAggregator.hpp"

#include "core/discovery/TargetRange.hpp"

#include <algorithm>
#include <limits>

namespace vidscan::core {

bool ResultAggregator::add(EndpointRecord record) {
    auto it = records_.find(record.ip);
    if (it == records_.end()) {
        auto key = record.ip;
        records_.emplace(std::move(key), std::move(record));
        return true;
    }

    if (record.source == EndpointSource::Forced && it->second.source != EndpointSource::Forced) {
        it->second = std::move(record);
        return true;
    }
    return false;
}

void ResultAggregator::addAll(std::vector<EndpointRecord> records) {
    for (auto& record : records) {
        add(std::move(record));
    }
}

std::vector<EndpointRecord> ResultAggregator::results() const {
    std::vector<EndpointRecord> sorted;
    sorted.reserve(records_.size());
    for (const auto& [ip, record] : records_) {
        sorted.push_back(record);
    }

    auto numeric = [](const std::string& ip) -> uint64_t {
        auto parsed = TargetRange::parseAddress(ip);
        return parsed ? *parsed : std::numeric_limits<uint64_t>::max();
    };

    std::stable_sort(sorted.begin(), sorted.end(),
                     [&numeric](const EndpointRecord& a, const EndpointRecord& b) {
                         return numeric(a.ip) < numeric(b.ip);
                     });
    return sorted;
}

} // namespace vidscan::core
