#include "core/types/NetworkInterface.hpp"

#include "core/discovery/TargetRange.hpp"

#include <fstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace vidscan::core {

namespace {

constexpr uint8_t WidestAutoPrefix = 16;
constexpr uint8_t FallbackPrefix = 24;

std::string readMacAddress(const std::string& interfaceName) {
    std::ifstream file("/sys/class/net/" + interfaceName + "/address");
    std::string mac;
    if (file) {
        file >> mac;
    }
    return mac;
}

} // namespace

std::optional<uint8_t> NetworkInterface::prefixLength() const {
    auto mask = TargetRange::parseAddress(netmask);
    if (!mask) {
        return std::nullopt;
    }

    uint8_t bits = 0;
    uint32_t value = *mask;
    while (value & 0x80000000u) {
        ++bits;
        value <<= 1;
    }
    if (value != 0) {
        return std::nullopt;
    }
    return bits;
}

std::string NetworkInterface::cidr() const {
    auto prefix = prefixLength().value_or(FallbackPrefix);
    if (prefix < WidestAutoPrefix) {
        prefix = FallbackPrefix;
    }
    return TargetRange::parse(ipAddress + "/" + std::to_string(prefix)).toString();
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        char ipStr[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
        iface.ipAddress = ipStr;

        if (ifa->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
            inet_ntop(AF_INET, &mask->sin_addr, ipStr, INET_ADDRSTRLEN);
            iface.netmask = ipStr;
        }

        iface.macAddress = readMacAddress(iface.name);
        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<std::string>
NetworkInterfaceEnumerator::detectLocalRange(const std::vector<NetworkInterface>& interfaces) {
    for (const auto& iface : interfaces) {
        if (!iface.isUp || iface.isLoopback) {
            continue;
        }
        if (!TargetRange::parseAddress(iface.ipAddress)) {
            continue;
        }
        return iface.cidr();
    }
    return std::nullopt;
}

std::optional<std::string> NetworkInterfaceEnumerator::detectLocalRange() {
    return detectLocalRange(enumerate());
}

} // namespace vidscan::core
