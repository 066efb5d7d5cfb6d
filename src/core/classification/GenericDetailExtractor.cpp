#include "core/classification/GenericDetailExtractor.hpp"

#include "core/classification/MarkupScanner.hpp"

namespace vidscan::core {

PartialDetails GenericDetailExtractor::parse(const std::string& body) const {
    MarkupScanner scanner(body);
    PartialDetails details;

    if (auto title = scanner.title()) {
        details.extra["title"] = *title;
    }

    details.model = scanner.labelledValue("(?:Model|Product)(?:\\s{1,8}Name)?");
    details.softwareVersion =
        scanner.labelledValue("(?:(?:Software|Firmware|SW)\\s{1,8})?Version");
    if (!details.softwareVersion) {
        details.softwareVersion = scanner.labelledValue("(?:Software|Firmware)");
    }
    details.serial = scanner.labelledValue("Serial(?:\\s{1,8}(?:Number|No\\.?))?");
    details.macAddress = scanner.labelledValue("MAC(?:\\s{1,8}Address)?");

    return details;
}

} // namespace vidscan::core
