#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/types/AuthSession.hpp"
#include "core/types/Endpoint.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <optional>

namespace vidscan::infra {

/**
 * @brief Details gathered from a vendor status API.
 */
struct Enrichment {
    core::PartialDetails details;
    std::optional<core::Manufacturer> manufacturer; ///< Set when the API proves a different vendor
    int requests{0};
};

/**
 * @brief Queries the machine-readable status APIs of classified endpoints.
 *
 * Cisco devices, and Generic hosts with 443 open, are asked for status.xml
 * and config.xml; a Generic host whose status.xml names a product becomes
 * Cisco. Polycom devices are asked the known REST paths in order until one
 * yields a model. Requests reuse the session's credentials. Every failure
 * leaves the details empty.
 */
class VendorApiEnricher {
public:
    VendorApiEnricher(core::IHttpClient& client, std::chrono::milliseconds timeout);

    Enrichment enrich(core::Manufacturer manufacturer, const core::AuthSession& session,
                      const core::HostProfile& profile) const;

private:
    Enrichment enrichCisco(const core::AuthSession& session, bool relabel) const;
    Enrichment enrichPolycom(const core::AuthSession& session) const;
    std::optional<std::string> fetch(const core::AuthSession& session, const std::string& path) const;

    core::IHttpClient& client_;
    std::chrono::milliseconds timeout_;
};

} // namespace vidscan::infra
