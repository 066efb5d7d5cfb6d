/**
 * @file Endpoint.hpp
 * @brief Discovered endpoint records and manufacturer identity types.
 *
 * This file defines the closed set of manufacturers the classifier can
 * assign, the sparse detail map produced by the extractors, and the final
 * EndpointRecord handed to the output layer.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Manufacturer variants recognised by the classifier.
 */
enum class Manufacturer : int {
    Generic = 0,  ///< Reachable but not attributable to a known vendor
    Cisco = 1,    ///< Cisco / Webex / RoomOS devices
    Polycom = 2,  ///< Polycom / Poly devices
    Tandberg = 3  ///< Legacy TANDBERG devices
};

/**
 * @brief Origin of an endpoint record.
 */
enum class EndpointSource : int {
    Probed = 0, ///< Produced by the probe/classify/extract pipeline
    Forced = 1  ///< Injected by an operator override
};

/**
 * @brief Sparse set of identity fields pulled from a device response.
 *
 * Every field is optional; an extractor that cannot find a value leaves it
 * unset. Vendor specific extras (system name, SIP URI, ...) go into extra.
 */
struct PartialDetails {
    std::optional<std::string> model;
    std::optional<std::string> softwareVersion;
    std::optional<std::string> serial;
    std::optional<std::string> macAddress;
    std::map<std::string, std::string> extra;

    /**
     * @brief Checks whether no field was extracted.
     * @return True if all identity fields and extras are empty.
     */
    [[nodiscard]] bool empty() const;

    /**
     * @brief Overlays another detail set on top of this one.
     *
     * Fields present in @p other replace the current values; fields absent
     * in @p other are left untouched.
     *
     * @param other Details with higher precedence.
     */
    void merge(const PartialDetails& other);

    bool operator==(const PartialDetails& other) const = default;
};

/**
 * @brief Final unit of discovery output, keyed by IP address.
 */
struct EndpointRecord {
    std::string ip;                    ///< IPv4 address of the endpoint
    std::string hostname;              ///< Reverse DNS name, or the IP when unresolved
    Manufacturer manufacturer{Manufacturer::Generic}; ///< Classified manufacturer
    std::string model;                 ///< Model name (empty if unknown)
    std::string softwareVersion;       ///< Software version (empty if unknown)
    std::string serial;                ///< Serial number (empty if unknown)
    std::string macAddress;            ///< MAC address (empty if unknown)
    std::string accessUri;             ///< URI of the management interface
    std::map<std::string, std::string> rawDetails; ///< Vendor specific extras
    std::vector<uint16_t> openPorts;   ///< Reachable candidate ports, ascending
    std::string authenticatedAs;       ///< Username of the successful credential pair
    EndpointSource source{EndpointSource::Probed}; ///< Where the record came from

    /**
     * @brief Builds a synthetic record for an operator forced endpoint.
     * @param ip Address of the forced endpoint.
     * @return Generic record with empty details and source Forced.
     */
    static EndpointRecord forced(const std::string& ip);

    /**
     * @brief Fills the identity fields from extracted details.
     * @param details Details produced by an extractor.
     */
    void applyDetails(const PartialDetails& details);

    /**
     * @brief Checks whether any identity field was extracted.
     * @return False when model, version, serial and MAC are all empty.
     */
    [[nodiscard]] bool complete() const;

    [[nodiscard]] std::string manufacturerToString() const;
    [[nodiscard]] std::string sourceToString() const;

    bool operator==(const EndpointRecord& other) const = default;
};

/**
 * @brief Converts a manufacturer to its display name.
 * @param manufacturer Manufacturer to convert.
 * @return "Cisco", "Polycom", "TANDBERG" or "Generic".
 */
std::string manufacturerToString(Manufacturer manufacturer);

/**
 * @brief Parses a manufacturer display name (case-insensitive).
 * @param str Name to parse.
 * @return Matching manufacturer, Generic when unknown.
 */
Manufacturer manufacturerFromString(const std::string& str);

std::string sourceToString(EndpointSource source);

} // namespace vidscan::core
