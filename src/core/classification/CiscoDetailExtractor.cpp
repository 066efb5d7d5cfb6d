#include "core/classification/CiscoDetailExtractor.hpp"

#include "core/classification/MarkupScanner.hpp"

#include <regex>
#include <vector>

namespace vidscan::core {

namespace {

std::optional<std::string> firstOf(const MarkupScanner& scanner,
                                   const std::vector<std::regex>& patterns) {
    for (const auto& pattern : patterns) {
        if (auto value = scanner.capture(pattern)) {
            return value;
        }
    }
    return std::nullopt;
}

// Bounded building blocks for the page patterns
const std::string Ws = "\\s{0,128}";
const std::string Attrs = "[^>]{0,256}";
const std::string Value = "([^<]{0,256}?)";

std::string classContaining(const std::string& name) {
    return "class=\"[^\"]{0,128}" + name + "[^\"]{0,128}\"";
}

std::vector<std::regex> fieldPatterns(const std::string& cssClass, const std::string& spanPrefix,
                                      const std::string& label) {
    const auto icase = std::regex::icase;
    return {
        std::regex("<(?:div|span) class=\"" + cssClass + "\">([^<]{0,256})</(?:div|span)>"),
        std::regex("<span>" + Ws + spanPrefix + ":" + Ws + Value + Ws + "</span>"),
        std::regex(label + ":?" + Ws + "</td>" + Ws + "<td" + Attrs + ">([^<]{0,256})</td>", icase),
        std::regex("<td" + Attrs + classContaining("label") + Attrs + ">" + Ws + label + ":?" + Ws +
                       "</td>" + Ws + "<td" + Attrs + classContaining("value") + Attrs + ">" + Ws +
                       Value + Ws + "</td>",
                   icase),
        std::regex("<span" + Attrs + classContaining("info-label") + Attrs + ">" + Ws + label +
                       ":?" + Ws + "</span>" + Ws + "<span" + Attrs +
                       classContaining("info-value") + Attrs + ">" + Ws + Value + Ws + "</span>",
                   icase),
        std::regex("<p>" + Ws + label + ":?" + Ws + Value + Ws + "</p>", icase),
    };
}

std::string modelFromTitle(const std::string& title) {
    static const std::regex prefixRe(R"(^(?:cisco)?\s*(?:webex)?\s*)", std::regex::icase);
    auto model = std::regex_replace(title, prefixRe, "", std::regex_constants::format_first_only);
    if (model.empty()) {
        return model;
    }

    auto lower = MarkupScanner::toLower(model);
    if (lower.find("webex") == std::string::npos &&
        lower.find("telepresence") == std::string::npos) {
        model = "Webex " + model;
    }
    return model;
}

} // namespace

PartialDetails CiscoDetailExtractor::parse(const std::string& body) const {
    MarkupScanner scanner(body);
    PartialDetails details;

    if (auto title = scanner.title()) {
        details.extra["title"] = *title;
        auto model = modelFromTitle(*title);
        if (!model.empty()) {
            details.model = model;
        }
    }

    static const auto versionPatterns = [] {
        auto patterns = fieldPatterns("sw-version", "Software", "Software(?: Version)?");
        patterns.insert(patterns.begin() + 1,
                        std::regex("<div class=\"sw-info\">([^<]{0,256})</div>"));
        return patterns;
    }();
    static const auto serialPatterns =
        fieldPatterns("serial-number", "Serial", "Serial(?: Number)?");
    static const auto macPatterns = fieldPatterns("mac-address", "MAC", "MAC Address");

    details.softwareVersion = firstOf(scanner, versionPatterns);
    details.serial = firstOf(scanner, serialPatterns);
    details.macAddress = firstOf(scanner, macPatterns);

    if (!details.softwareVersion) {
        details.softwareVersion = scanner.labelledValue("(?:Software|Version)");
    }
    if (!details.serial) {
        details.serial = scanner.labelledValue("Serial(?:\\s{1,8}Number)?");
    }

    return details;
}

} // namespace vidscan::core
