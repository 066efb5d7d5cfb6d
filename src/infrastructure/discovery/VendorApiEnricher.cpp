#include "infrastructure/discovery/VendorApiEnricher.hpp"

#include "core/classification/VendorApiParser.hpp"

#include <spdlog/spdlog.h>

namespace vidscan::infra {

VendorApiEnricher::VendorApiEnricher(core::IHttpClient& client, std::chrono::milliseconds timeout)
    : client_(client), timeout_(timeout) {}

Enrichment VendorApiEnricher::enrich(core::Manufacturer manufacturer,
                                     const core::AuthSession& session,
                                     const core::HostProfile& profile) const {
    if (session.baseUrl.empty() || !session.hasResponse()) {
        return {};
    }

    switch (manufacturer) {
    case core::Manufacturer::Cisco:
        return enrichCisco(session, false);
    case core::Manufacturer::Polycom:
        return enrichPolycom(session);
    case core::Manufacturer::Generic:
        if (profile.hasPort(core::CandidatePorts::Https)) {
            return enrichCisco(session, true);
        }
        return {};
    case core::Manufacturer::Tandberg:
        return {};
    }
    return {};
}

Enrichment VendorApiEnricher::enrichCisco(const core::AuthSession& session, bool relabel) const {
    Enrichment enrichment;
    const auto& paths = core::CiscoXmlParser::paths();

    ++enrichment.requests;
    if (auto status = fetch(session, paths.at(0))) {
        enrichment.details = core::CiscoXmlParser::parseStatus(*status);
    }
    if (relabel) {
        if (!enrichment.details.model) {
            return enrichment;
        }
        spdlog::debug("{}: status.xml names product '{}', classifying as Cisco", session.address,
                      *enrichment.details.model);
        enrichment.manufacturer = core::Manufacturer::Cisco;
    }

    ++enrichment.requests;
    if (auto config = fetch(session, paths.at(1))) {
        enrichment.details.merge(core::CiscoXmlParser::parseConfig(*config));
    }
    return enrichment;
}

Enrichment VendorApiEnricher::enrichPolycom(const core::AuthSession& session) const {
    Enrichment enrichment;
    for (const auto& path : core::PolycomApiParser::paths()) {
        ++enrichment.requests;
        auto body = fetch(session, path);
        if (!body) {
            continue;
        }
        enrichment.details.merge(core::PolycomApiParser::parse(*body));
        if (enrichment.details.model) {
            break;
        }
    }
    return enrichment;
}

std::optional<std::string> VendorApiEnricher::fetch(const core::AuthSession& session,
                                                    const std::string& path) const {
    core::HttpRequest request;
    request.url = session.baseUrl + path;
    request.credentials = session.credentials;
    request.timeout = timeout_;

    auto response = client_.get(request);
    if (!response.success || response.body.empty()) {
        spdlog::debug("{}: {} unavailable ({})", session.address, path,
                      response.received() ? std::to_string(response.statusCode)
                                          : response.errorMessage);
        return std::nullopt;
    }
    return response.body;
}

} // namespace vidscan::infra
