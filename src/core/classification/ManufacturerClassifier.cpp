#include "core/classification/ManufacturerClassifier.hpp"

#include "core/classification/MarkupScanner.hpp"

namespace vidscan::core {

namespace {

std::string locationName(FingerprintLocation location) {
    switch (location) {
    case FingerprintLocation::Header:
        return "header";
    case FingerprintLocation::Title:
        return "title";
    case FingerprintLocation::Body:
        return "body";
    }
    return "body";
}

struct Haystacks {
    std::string headers;
    std::string title;
    std::string body;

    [[nodiscard]] const std::string& at(FingerprintLocation location) const {
        switch (location) {
        case FingerprintLocation::Header:
            return headers;
        case FingerprintLocation::Title:
            return title;
        case FingerprintLocation::Body:
            return body;
        }
        return body;
    }
};

Haystacks prepare(const HttpResponse& response) {
    Haystacks haystacks;
    for (const auto& [name, value] : response.headers) {
        haystacks.headers += MarkupScanner::toLower(value);
        haystacks.headers += '\n';
    }

    MarkupScanner scanner(response.body);
    haystacks.title = MarkupScanner::toLower(scanner.title().value_or(""));
    haystacks.body = MarkupScanner::toLower(scanner.text());
    return haystacks;
}

} // namespace

const std::vector<FingerprintRule>& ManufacturerClassifier::rules() {
    using L = FingerprintLocation;
    using M = Manufacturer;
    static const std::vector<FingerprintRule> table = {
        {M::Cisco, L::Header, "cisco"},
        {M::Cisco, L::Header, "webex"},
        {M::Cisco, L::Title, "cisco"},
        {M::Cisco, L::Title, "webex"},
        {M::Cisco, L::Body, "<productid>cisco"},
        {M::Cisco, L::Body, "roomos"},
        {M::Cisco, L::Body, "cisco"},
        {M::Cisco, L::Body, "webex"},

        {M::Polycom, L::Header, "polycom"},
        {M::Polycom, L::Title, "polycom"},
        {M::Polycom, L::Title, "realpresence"},
        {M::Polycom, L::Body, "polycom"},
        {M::Polycom, L::Body, "realpresence"},
        {M::Polycom, L::Body, "poly studio"},

        {M::Tandberg, L::Header, "tandberg"},
        {M::Tandberg, L::Title, "tandberg"},
        {M::Tandberg, L::Body, "tandberg"},
    };
    return table;
}

Classification ManufacturerClassifier::classify(const HttpResponse& response) {
    auto haystacks = prepare(response);

    for (const auto& rule : rules()) {
        const auto& haystack = haystacks.at(rule.location);
        if (!haystack.empty() && haystack.find(rule.token) != std::string::npos) {
            return {rule.manufacturer,
                    locationName(rule.location) + " contains '" + rule.token + "'"};
        }
    }

    return {Manufacturer::Generic, ""};
}

bool ManufacturerClassifier::hasDeviceMarkers(const HttpResponse& response) {
    return classify(response).manufacturer != Manufacturer::Generic;
}

} // namespace vidscan::core
