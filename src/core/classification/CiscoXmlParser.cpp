#include "core/classification/VendorApiParser.hpp"

#include <tinyxml2.h>

#include <initializer_list>
#include <optional>

namespace vidscan::core {

namespace {

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

const XMLElement* find(const XMLElement* root, std::initializer_list<const char*> path) {
    const XMLElement* node = root;
    for (const char* name : path) {
        if (node == nullptr) {
            return nullptr;
        }
        node = node->FirstChildElement(name);
    }
    return node;
}

std::optional<std::string> text(const XMLElement* root, std::initializer_list<const char*> path) {
    const XMLElement* node = find(root, path);
    if (node == nullptr || node->GetText() == nullptr) {
        return std::nullopt;
    }

    std::string value = node->GetText();
    auto start = value.find_first_not_of(" \t\r\n");
    auto end = value.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    return value.substr(start, end - start + 1);
}

void putExtra(PartialDetails& details, const std::string& key,
              const std::optional<std::string>& value) {
    if (value) {
        details.extra[key] = *value;
    }
}

const XMLElement* parseRoot(XMLDocument& doc, const std::string& xml, const char* rootName) {
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return nullptr;
    }
    const XMLElement* root = doc.RootElement();
    if (root == nullptr || std::string(root->Name()) != rootName) {
        return nullptr;
    }
    return root;
}

} // namespace

PartialDetails CiscoXmlParser::parseStatus(const std::string& xml) {
    PartialDetails details;
    XMLDocument doc;
    const XMLElement* root = parseRoot(doc, xml, "Status");
    if (root == nullptr) {
        return details;
    }

    if (auto productId = text(root, {"SystemUnit", "ProductId"})) {
        const std::string prefix = "Cisco ";
        if (productId->compare(0, prefix.size(), prefix) == 0) {
            details.model = productId->substr(prefix.size());
        } else {
            details.model = productId;
        }
    }

    auto displayName = text(root, {"SystemUnit", "Software", "DisplayName"});
    auto version = text(root, {"SystemUnit", "Software", "Version"});
    if (displayName && version) {
        details.softwareVersion = *displayName + " " + *version;
    } else if (version) {
        details.softwareVersion = version;
    }

    details.serial = text(root, {"SystemUnit", "Hardware", "SerialNumber"});
    details.macAddress = text(root, {"SystemUnit", "Hardware", "MACAddress"});
    if (!details.macAddress) {
        details.macAddress = text(root, {"Network", "Ethernet", "MacAddress"});
    }

    putExtra(details, "product_type", text(root, {"SystemUnit", "ProductType"}));
    putExtra(details, "ip_address", text(root, {"Network", "IPv4", "Address"}));
    putExtra(details, "subnet_mask", text(root, {"Network", "IPv4", "SubnetMask"}));
    putExtra(details, "gateway", text(root, {"Network", "IPv4", "Gateway"}));
    putExtra(details, "sip_status", text(root, {"SIP", "Registration", "Status"}));
    putExtra(details, "sip_uri", text(root, {"SIP", "Registration", "URI"}));
    putExtra(details, "system_time", text(root, {"Time", "SystemTime"}));

    int cameras = 0;
    if (const XMLElement* camerasNode = root->FirstChildElement("Cameras")) {
        for (const XMLElement* camera = camerasNode->FirstChildElement("Camera"); camera;
             camera = camera->NextSiblingElement("Camera")) {
            ++cameras;
        }
    }
    if (cameras > 0) {
        details.extra["cameras"] = std::to_string(cameras);
    }

    return details;
}

PartialDetails CiscoXmlParser::parseConfig(const std::string& xml) {
    PartialDetails details;
    XMLDocument doc;
    const XMLElement* root = parseRoot(doc, xml, "Configuration");
    if (root == nullptr) {
        return details;
    }

    // Some firmware abbreviates <Name> to <n>
    auto systemName = text(root, {"SystemUnit", "Name"});
    if (!systemName) {
        systemName = text(root, {"SystemUnit", "n"});
    }
    putExtra(details, "system_name", systemName);
    putExtra(details, "sip_uri", text(root, {"SIP", "URI"}));

    auto contactName = text(root, {"SystemUnit", "ContactInfo", "Name"});
    if (!contactName) {
        contactName = text(root, {"SystemUnit", "ContactInfo", "n"});
    }
    if (contactName) {
        std::string contact = *contactName;
        if (auto number = text(root, {"SystemUnit", "ContactInfo", "ContactNumber"})) {
            contact += " (" + *number + ")";
        }
        details.extra["contact_info"] = contact;
    }

    return details;
}

const std::vector<std::string>& CiscoXmlParser::paths() {
    static const std::vector<std::string> list = {"/status.xml", "/config.xml"};
    return list;
}

} // namespace vidscan::core
