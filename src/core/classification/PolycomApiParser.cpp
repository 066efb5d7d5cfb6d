#include "core/classification/VendorApiParser.hpp"

#include <nlohmann/json.hpp>

namespace vidscan::core {

namespace {

using nlohmann::json;

void take(std::optional<std::string>& target, const json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        auto value = object[key].get<std::string>();
        if (!value.empty()) {
            target = value;
        }
    }
}

void takeExtra(PartialDetails& details, const std::string& name, const json& object,
               const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        details.extra[name] = object[key].get<std::string>();
    }
}

bool isObject(const json& j, const char* key) {
    return j.contains(key) && j[key].is_object();
}

} // namespace

PartialDetails PolycomApiParser::parse(const std::string& body) {
    PartialDetails details;

    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return details;
    }

    if (isObject(j, "Status") && isObject(j["Status"], "SystemInfo")) {
        // RealPresence Group status document
        const auto& info = j["Status"]["SystemInfo"];
        take(details.model, info, "Product");
        if (isObject(info, "Software")) {
            take(details.softwareVersion, info["Software"], "Version");
        }
        take(details.serial, info, "SerialNumber");
        if (isObject(info, "Hardware")) {
            take(details.macAddress, info["Hardware"], "MAC");
        }
    } else if (isObject(j, "device")) {
        // Poly Studio X / G7500 management API
        const auto& device = j["device"];
        take(details.model, device, "model");
        take(details.softwareVersion, device, "version");
        take(details.serial, device, "serial");
        take(details.macAddress, device, "mac");
    } else if (isObject(j, "systeminfo")) {
        const auto& info = j["systeminfo"];
        take(details.model, info, "model");
        if (!details.model) {
            take(details.model, info, "name");
        }
        if (isObject(info, "softwareInfo") && isObject(info["softwareInfo"], "current")) {
            take(details.softwareVersion, info["softwareInfo"]["current"], "version");
        }
        take(details.serial, info, "serialNumber");
        if (isObject(info, "hardwareInfo")) {
            take(details.macAddress, info["hardwareInfo"], "macAddress");
        }
    } else if (j.contains("model") && j.contains("softwareVersion")) {
        // Flat /rest/system reply of RealPresence Group 300/500/700
        take(details.model, j, "model");
        take(details.softwareVersion, j, "softwareVersion");
        take(details.serial, j, "serialNumber");
        takeExtra(details, "system_name", j, "systemName");
    } else if (isObject(j, "system")) {
        const auto& system = j["system"];
        take(details.model, system, "type");
        take(details.softwareVersion, system, "version");
    }

    return details;
}

const std::vector<std::string>& PolycomApiParser::paths() {
    static const std::vector<std::string> list = {"/api/v1/mgmt/device/info", "/rest/system",
                                                  "/api/rest/system"};
    return list;
}

} // namespace vidscan::core
