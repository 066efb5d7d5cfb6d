/**
 * @file NetworkInterface.hpp
 * @brief Local IPv4 interfaces, used to pick a default scan range.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief An IPv4 address assigned to a local interface.
 */
struct NetworkInterface {
    std::string name;       ///< System name of the interface (e.g., "eth0")
    std::string ipAddress;  ///< IPv4 address assigned to the interface
    std::string netmask;    ///< Dotted netmask, empty when unknown
    std::string macAddress; ///< Hardware address, empty when unknown
    bool isUp{false};       ///< Whether the interface is currently up
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief Prefix length derived from the netmask.
     * @return Number of leading one bits, or nullopt for a missing or non-contiguous mask.
     */
    [[nodiscard]] std::optional<uint8_t> prefixLength() const;

    /**
     * @brief Network of this interface in CIDR notation.
     *
     * Falls back to /24 when the netmask is unknown, and narrows networks
     * wider than /16 to the /24 around the interface address.
     *
     * @return e.g. "192.168.1.0/24".
     */
    [[nodiscard]] std::string cidr() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Enumerates local IPv4 interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Lists every interface that carries an IPv4 address.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Picks the scan range of the first up, non-loopback interface.
     * @param interfaces Interfaces to choose from.
     * @return CIDR of the chosen interface, or nullopt if none qualifies.
     */
    static std::optional<std::string> detectLocalRange(const std::vector<NetworkInterface>& interfaces);

    /**
     * @brief detectLocalRange() over the interfaces of this machine.
     */
    static std::optional<std::string> detectLocalRange();
};

} // namespace vidscan::core
