#include "core/classification/MarkupScanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace vidscan::core {

namespace {

void replaceAll(std::string& str, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

MarkupScanner::MarkupScanner(const std::string& markup)
    : markup_(markup.substr(0, std::min(markup.size(), MaxScanBytes))) {}

std::optional<std::string> MarkupScanner::capture(const std::regex& pattern) const {
    std::smatch match;
    if (!std::regex_search(markup_, match, pattern) || match.size() < 2) {
        return std::nullopt;
    }

    auto value = clean(match[1].str());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> MarkupScanner::title() const {
    static const std::regex titleRe(R"(<title[^>]{0,256}>([^<]{0,512})</title>)",
                                    std::regex::icase);
    return capture(titleRe);
}

std::optional<std::string> MarkupScanner::labelledValue(const std::string& label) const {
    // Label and value in adjacent cells or spans
    std::regex cellRe("<(?:td|th|span|div|dt|label)[^>]{0,256}>\\s{0,128}" + label +
                          "\\s{0,16}:?\\s{0,16}</(?:td|th|span|div|dt|label)>\\s{0,128}"
                          "<(?:td|span|div|dd)[^>]{0,256}>([^<]{0,256})<",
                      std::regex::icase);
    if (auto value = capture(cellRe)) {
        return value;
    }

    // Plain "Label: value" text
    std::regex textRe("(?:^|[>\\s])" + label + "\\s{0,16}:\\s{0,16}([^<>\\r\\n]{1,256})",
                      std::regex::icase);
    return capture(textRe);
}

std::string MarkupScanner::clean(const std::string& fragment) {
    std::string text;
    text.reserve(fragment.size());
    bool inTag = false;
    for (char c : fragment) {
        if (inTag) {
            if (c == '>') {
                inTag = false;
                text += ' ';
            }
        } else if (c == '<') {
            inTag = true;
        } else {
            text += c;
        }
    }

    static const std::array<std::pair<const char*, const char*>, 6> entities = {{
        {"&nbsp;", " "},
        {"&lt;", "<"},
        {"&gt;", ">"},
        {"&quot;", "\""},
        {"&#39;", "'"},
        {"&amp;", "&"},
    }};
    for (const auto& [entity, replacement] : entities) {
        replaceAll(text, entity, replacement);
    }

    std::string collapsed;
    collapsed.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !collapsed.empty()) {
            collapsed += ' ';
        }
        pendingSpace = false;
        collapsed += c;
    }
    return collapsed;
}

std::string MarkupScanner::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace vidscan::core
