/**
 * @file VendorApiParser.hpp
 * @brief Parsers for the machine-readable status APIs some endpoints expose.
 *
 * Cisco codecs (CE/RoomOS and TANDBERG TC lineage) publish status.xml and
 * config.xml; Polycom/Poly units answer JSON on a handful of REST paths.
 * Values found here are more reliable than those scraped from HTML and
 * override them.
 */

#pragma once

#include "core/types/Endpoint.hpp"

#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Parser for the Cisco xAPI XML documents.
 */
class CiscoXmlParser {
public:
    /**
     * @brief Parses a /status.xml document.
     * @param xml Document text.
     * @return Model, version, serial, MAC plus network/SIP extras; empty on malformed XML.
     */
    static PartialDetails parseStatus(const std::string& xml);

    /**
     * @brief Parses a /config.xml document.
     * @param xml Document text.
     * @return system_name, sip_uri and contact_info extras; empty on malformed XML.
     */
    static PartialDetails parseConfig(const std::string& xml);

    /// Paths queried on Cisco devices, in order.
    static const std::vector<std::string>& paths();
};

/**
 * @brief Parser for the Polycom / Poly REST API JSON replies.
 */
class PolycomApiParser {
public:
    /**
     * @brief Parses a JSON reply from any of the known Polycom REST paths.
     * @param json Response body.
     * @return Details; empty when the body is not JSON or of an unknown shape.
     */
    static PartialDetails parse(const std::string& json);

    /// REST paths tried on Polycom devices, in order, until one yields a model.
    static const std::vector<std::string>& paths();
};

} // namespace vidscan::core
