#include "core/types/ProbeResult.hpp"

namespace vidscan::core {

std::string ProbeResult::outcomeToString() const {
    return probeOutcomeToString(outcome);
}

std::string ProbeResult::probeOutcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
    case ProbeOutcome::Open:
        return "Open";
    case ProbeOutcome::Refused:
        return "Refused";
    case ProbeOutcome::Timeout:
        return "Timeout";
    case ProbeOutcome::Unreachable:
        return "Unreachable";
    case ProbeOutcome::Error:
        return "Error";
    }
    return "Error";
}

std::string schemeToString(Scheme scheme) {
    return scheme == Scheme::Https ? "https" : "http";
}

std::optional<HostProfile> HostProfile::fromResults(const std::string& address,
                                                    const std::vector<ProbeResult>& results) {
    HostProfile profile;
    profile.address = address;

    for (const auto& result : results) {
        if (!result.reachable()) {
            continue;
        }
        profile.openPorts.insert(result.port);
        if (result.tls) {
            profile.tlsPorts.insert(result.port);
        }
    }

    if (profile.openPorts.empty()) {
        return std::nullopt;
    }
    return profile;
}

Scheme HostProfile::preferredScheme() const {
    if (tlsPorts.count(CandidatePorts::Https) > 0) {
        return Scheme::Https;
    }
    return Scheme::Http;
}

std::optional<uint16_t> HostProfile::webPort() const {
    if (preferredScheme() == Scheme::Https) {
        return CandidatePorts::Https;
    }
    if (hasPort(CandidatePorts::Http)) {
        return CandidatePorts::Http;
    }
    return std::nullopt;
}

std::string HostProfile::accessUri() const {
    return schemeToString(preferredScheme()) + "://" + address;
}

std::vector<uint16_t> CandidatePorts::defaults() {
    return {Http, Https, Sip, SipTls, H323};
}

bool CandidatePorts::carriesTls(uint16_t port) {
    return port == Https || port == SipTls;
}

const std::unordered_map<uint16_t, std::string>& CandidatePorts::knownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {Http, "http"}, {Https, "https"}, {Sip, "sip"}, {SipTls, "sips"}, {H323, "h323"}};
    return services;
}

std::string CandidatePorts::serviceName(uint16_t port) {
    const auto& services = knownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : "";
}

} // namespace vidscan::core
