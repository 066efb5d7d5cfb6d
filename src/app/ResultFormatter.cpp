#include "app/ResultFormatter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vidscan::app {

namespace {

const std::string Separator(50, '-');

std::string orUnknown(const std::string& value) {
    return value.empty() ? "Unknown" : value;
}

std::string joinPorts(const std::vector<uint16_t>& ports) {
    std::string joined;
    for (auto port : ports) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += std::to_string(port);
    }
    return joined;
}

} // namespace

std::string ResultFormatter::format(const std::vector<core::EndpointRecord>& records) const {
    if (mode_ == OutputMode::Json) {
        auto array = nlohmann::json::array();
        for (const auto& record : records) {
            array.push_back(toJson(record, true));
        }
        return array.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    }

    if (records.empty()) {
        return "No video endpoints found.\n";
    }
    return mode_ == OutputMode::Detailed ? formatDetailed(records) : formatSimple(records);
}

nlohmann::json ResultFormatter::toJson(const core::EndpointRecord& record, bool detailed) {
    nlohmann::json j;
    j["ip"] = record.ip;
    j["manufacturer"] = record.manufacturerToString();
    j["model"] = record.model;
    j["software_version"] = record.softwareVersion;
    j["serial"] = record.serial;
    j["mac_address"] = record.macAddress;
    j["access_uri"] = record.accessUri;
    j["source"] = record.sourceToString();

    if (detailed) {
        j["hostname"] = record.hostname;
        j["open_ports"] = record.openPorts;
        j["raw_details"] = record.rawDetails;
        if (record.authenticatedAs.empty()) {
            j["authenticated_as"] = nullptr;
        } else {
            j["authenticated_as"] = record.authenticatedAs;
        }
    }
    return j;
}

std::string ResultFormatter::formatSimple(const std::vector<core::EndpointRecord>& records) const {
    size_t ipWidth = 2;
    size_t manufacturerWidth = 12;
    for (const auto& record : records) {
        ipWidth = std::max(ipWidth, record.ip.size());
        manufacturerWidth = std::max(manufacturerWidth, record.manufacturerToString().size());
    }

    std::ostringstream ss;
    ss << "Found " << records.size() << " video endpoint(s):\n";
    ss << std::left << std::setw(static_cast<int>(ipWidth) + 2) << "IP"
       << std::setw(static_cast<int>(manufacturerWidth) + 2) << "Manufacturer"
       << "Model\n";
    ss << Separator << "\n";
    for (const auto& record : records) {
        ss << std::left << std::setw(static_cast<int>(ipWidth) + 2) << record.ip
           << std::setw(static_cast<int>(manufacturerWidth) + 2) << record.manufacturerToString()
           << orUnknown(record.model) << "\n";
    }
    return ss.str();
}

std::string ResultFormatter::formatDetailed(const std::vector<core::EndpointRecord>& records) const {
    std::ostringstream ss;
    ss << "Found " << records.size() << " video endpoint(s):\n";
    ss << Separator << "\n";

    int index = 1;
    for (const auto& record : records) {
        ss << "Endpoint " << index++ << ":\n";
        ss << "  IP: " << record.ip << "\n";
        if (!record.hostname.empty() && record.hostname != record.ip) {
            ss << "  Hostname: " << record.hostname << "\n";
        }
        ss << "  Manufacturer: " << record.manufacturerToString() << "\n";
        ss << "  Model: " << orUnknown(record.model) << "\n";
        ss << "  Software Version: " << orUnknown(record.softwareVersion) << "\n";
        ss << "  Serial: " << orUnknown(record.serial) << "\n";
        ss << "  MAC Address: " << orUnknown(record.macAddress) << "\n";
        if (!record.accessUri.empty()) {
            ss << "  Access URI: " << record.accessUri << "\n";
        }
        if (!record.openPorts.empty()) {
            ss << "  Open Ports: " << joinPorts(record.openPorts) << "\n";
        }
        if (!record.authenticatedAs.empty()) {
            ss << "  Authenticated As: " << record.authenticatedAs << "\n";
        }
        ss << "  Source: " << record.sourceToString() << "\n";
        for (const auto& [key, value] : record.rawDetails) {
            ss << "  " << key << ": " << value << "\n";
        }
        ss << Separator << "\n";
    }
    return ss.str();
}

} // namespace vidscan::app
