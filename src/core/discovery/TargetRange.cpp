#include "core/discovery/TargetRange.hpp"

#include <arpa/inet.h>

#include <cctype>

namespace vidscan::core {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

uint32_t maskFor(uint8_t prefix) {
    return prefix == 0 ? 0U : ~0U << (32 - prefix);
}

} // namespace

TargetRange::TargetRange(uint32_t network, uint8_t prefix)
    : network_(network & maskFor(prefix)), prefix_(prefix) {
    uint64_t total = uint64_t{1} << (32 - prefix);
    if (prefix >= 31) {
        firstHost_ = network_;
        count_ = total;
    } else {
        firstHost_ = network_ + 1;
        count_ = total - 2;
    }
}

TargetRange TargetRange::parse(const std::string& spec) {
    auto text = trim(spec);
    if (text.empty()) {
        throw InvalidRangeError(spec, "empty specification");
    }

    std::string addressPart = text;
    uint8_t prefix = 32;

    auto slash = text.find('/');
    if (slash != std::string::npos) {
        addressPart = text.substr(0, slash);
        auto prefixPart = text.substr(slash + 1);
        if (prefixPart.empty() || prefixPart.size() > 2) {
            throw InvalidRangeError(spec, "prefix length must be 0-32");
        }
        for (char c : prefixPart) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw InvalidRangeError(spec, "prefix length must be numeric");
            }
        }
        int value = std::stoi(prefixPart);
        if (value > 32) {
            throw InvalidRangeError(spec, "prefix length must be 0-32");
        }
        prefix = static_cast<uint8_t>(value);
    }

    auto address = parseAddress(addressPart);
    if (!address) {
        throw InvalidRangeError(spec, "not an IPv4 address");
    }

    return TargetRange(*address, prefix);
}

std::string TargetRange::at(uint64_t index) const {
    if (index >= count_) {
        throw std::out_of_range("TargetRange index out of range");
    }
    return formatAddress(static_cast<uint32_t>(firstHost_ + index));
}

bool TargetRange::contains(const std::string& address) const {
    auto parsed = parseAddress(address);
    if (!parsed) {
        return false;
    }
    return *parsed >= firstHost_ && static_cast<uint64_t>(*parsed - firstHost_) < count_;
}

std::string TargetRange::toString() const {
    return formatAddress(network_) + "/" + std::to_string(prefix_);
}

std::optional<uint32_t> TargetRange::parseAddress(const std::string& address) {
    struct in_addr addr {};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string TargetRange::formatAddress(uint32_t address) {
    struct in_addr addr {};
    addr.s_addr = htonl(address);

    char buffer[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr, buffer, INET_ADDRSTRLEN);
    return buffer;
}

} // namespace vidscan::core
