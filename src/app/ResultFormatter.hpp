#pragma once

#include "app/CommandLine.hpp"
#include "core/types/Endpoint.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vidscan::app {

/**
 * @brief Renders discovery results for stdout.
 *
 * Simple mode prints one line per endpoint (ip, manufacturer, model);
 * detailed mode prints a block per endpoint with every field; JSON mode
 * prints an array of detailed objects with 2-space indentation.
 */
class ResultFormatter {
public:
    explicit ResultFormatter(OutputMode mode) : mode_(mode) {}

    /**
     * @brief Formats the records, including a trailing newline.
     */
    [[nodiscard]] std::string format(const std::vector<core::EndpointRecord>& records) const;

    /**
     * @brief Serialises a record to its flat structure.
     * @param record Record to serialise.
     * @param detailed Add hostname, open_ports, raw_details and authenticated_as.
     */
    static nlohmann::json toJson(const core::EndpointRecord& record, bool detailed);

    [[nodiscard]] OutputMode mode() const { return mode_; }

private:
    std::string formatSimple(const std::vector<core::EndpointRecord>& records) const;
    std::string formatDetailed(const std::vector<core::EndpointRecord>& records) const;

    OutputMode mode_;
};

} // namespace vidscan::app
