#include "core/types/Endpoint.hpp"

#include <algorithm>
#include <cctype>

namespace vidscan::core {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

void overlay(std::optional<std::string>& target, const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        target = value;
    }
}

} // namespace

bool PartialDetails::empty() const {
    return !model && !softwareVersion && !serial && !macAddress && extra.empty();
}

void PartialDetails::merge(const PartialDetails& other) {
    overlay(model, other.model);
    overlay(softwareVersion, other.softwareVersion);
    overlay(serial, other.serial);
    overlay(macAddress, other.macAddress);
    for (const auto& [key, value] : other.extra) {
        extra[key] = value;
    }
}

EndpointRecord EndpointRecord::forced(const std::string& ip) {
    EndpointRecord record;
    record.ip = ip;
    record.hostname = ip;
    record.manufacturer = Manufacturer::Generic;
    record.source = EndpointSource::Forced;
    return record;
}

void EndpointRecord::applyDetails(const PartialDetails& details) {
    model = details.model.value_or("");
    softwareVersion = details.softwareVersion.value_or("");
    serial = details.serial.value_or("");
    macAddress = details.macAddress.value_or("");
    for (const auto& [key, value] : details.extra) {
        rawDetails[key] = value;
    }
}

bool EndpointRecord::complete() const {
    return !model.empty() || !softwareVersion.empty() || !serial.empty() || !macAddress.empty();
}

std::string EndpointRecord::manufacturerToString() const {
    return core::manufacturerToString(manufacturer);
}

std::string EndpointRecord::sourceToString() const {
    return core::sourceToString(source);
}

std::string manufacturerToString(Manufacturer manufacturer) {
    switch (manufacturer) {
    case Manufacturer::Generic:
        return "Generic";
    case Manufacturer::Cisco:
        return "Cisco";
    case Manufacturer::Polycom:
        return "Polycom";
    case Manufacturer::Tandberg:
        return "TANDBERG";
    }
    return "Generic";
}

Manufacturer manufacturerFromString(const std::string& str) {
    auto lower = toLower(str);
    if (lower == "cisco")
        return Manufacturer::Cisco;
    if (lower == "polycom")
        return Manufacturer::Polycom;
    if (lower == "tandberg")
        return Manufacturer::Tandberg;
    return Manufacturer::Generic;
}

std::string sourceToString(EndpointSource source) {
    switch (source) {
    case EndpointSource::Probed:
        return "probed";
    case EndpointSource::Forced:
        return "forced";
    }
    return "probed";
}

} // namespace vidscan::core
