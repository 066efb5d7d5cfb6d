#include "core/types/DiscoveryConfig.hpp"

#include "core/types/ProbeResult.hpp"

#include <algorithm>

namespace vidscan::core {

std::vector<uint16_t> DiscoveryConfig::portsToProbe() const {
    if (ports.empty()) {
        return CandidatePorts::defaults();
    }
    return ports;
}

std::vector<Credentials> DiscoveryConfig::credentialChain() const {
    std::vector<Credentials> chain;
    if (operatorCredentials && operatorCredentials->isValid()) {
        chain.push_back(*operatorCredentials);
    }
    if (defaultCredentials.isValid() &&
        std::find(chain.begin(), chain.end(), defaultCredentials) == chain.end()) {
        chain.push_back(defaultCredentials);
    }
    return chain;
}

} // namespace vidscan::core
