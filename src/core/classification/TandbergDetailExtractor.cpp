#include "core/classification/TandbergDetailExtractor.hpp"

#include "core/classification/MarkupScanner.hpp"

#include <regex>

namespace vidscan::core {

PartialDetails TandbergDetailExtractor::parse(const std::string& body) const {
    MarkupScanner scanner(body);
    PartialDetails details;

    if (auto title = scanner.title()) {
        details.extra["title"] = *title;
        static const std::regex prefixRe(R"(^tandberg\s*)", std::regex::icase);
        auto model = std::regex_replace(*title, prefixRe, "",
                                        std::regex_constants::format_first_only);
        if (!model.empty()) {
            details.model = model;
        }
    }

    static const std::regex versionDivRe(R"(<div id="sw-version">([^<]{0,256})</div>)");
    static const std::regex versionCellRe(
        R"(Software:\s{0,128}</td>\s{0,128}<td[^>]{0,256}>([^<]{0,256})</td>)");
    details.softwareVersion = scanner.capture(versionDivRe);
    if (!details.softwareVersion) {
        details.softwareVersion = scanner.capture(versionCellRe);
    }

    static const std::regex productIdRe(R"(<div id="product-id">([^<]{0,256})</div>)");
    if (auto productId = scanner.capture(productIdRe)) {
        details.extra["product_id"] = *productId;
    }

    details.serial = scanner.labelledValue("Serial(?:\\s{1,8}Number)?");
    details.macAddress = scanner.labelledValue("MAC(?:\\s{1,8}Address)?");

    return details;
}

} // namespace vidscan::core
