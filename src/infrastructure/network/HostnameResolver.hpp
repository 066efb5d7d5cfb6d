#pragma once

#include <string>

namespace vidscan::infra {

/**
 * @brief Reverse DNS lookups for discovered hosts.
 */
class HostnameResolver {
public:
    /**
     * @brief Resolves the name of an IPv4 address.
     * @param address Dotted-quad address.
     * @return Host name, or @p address itself when no PTR record exists.
     */
    static std::string reverseLookup(const std::string& address);
};

} // namespace vidscan::infra
