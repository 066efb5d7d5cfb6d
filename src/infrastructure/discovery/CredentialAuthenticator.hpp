/**
 * @file CredentialAuthenticator.hpp
 * @brief Authentication against a device's web management interface.
 */

#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/types/AuthSession.hpp"
#include "core/types/Credentials.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vidscan::infra {

/**
 * @brief Tries credential pairs in priority order against a host's root page.
 *
 * The chain is handed in explicitly (operator pair first, then the built-in
 * default); the authenticator holds no defaults of its own. For every pair it
 * issues a GET of "/" with that pair and stops at the first 2xx/3xx response.
 * A transport failure ends the run as Unreachable. When every pair is refused,
 * the first 401/407 challenge carrying manufacturer markers is kept as the
 * response (MarkersUnderChallenge); failing that, one unauthenticated GET
 * supplies the response for classification.
 */
class CredentialAuthenticator {
public:
    /**
     * @param client HTTP client used for all requests; must outlive the authenticator.
     * @param chain Credential pairs in the order they are tried.
     * @param timeout Budget of each HTTP exchange.
     */
    CredentialAuthenticator(core::IHttpClient& client, std::vector<core::Credentials> chain,
                            std::chrono::milliseconds timeout);

    /**
     * @brief Authenticates against the web port of a host.
     * @param profile Probe summary; its preferred scheme selects the URL.
     * @return Session with the outcome, the accepted pair (if any) and the best response.
     */
    core::AuthSession authenticate(const core::HostProfile& profile) const;

    [[nodiscard]] const std::vector<core::Credentials>& chain() const { return chain_; }

private:
    core::HttpResponse fetchRoot(const std::string& baseUrl,
                                 const std::optional<core::Credentials>& credentials) const;

    core::IHttpClient& client_;
    std::vector<core::Credentials> chain_;
    std::chrono::milliseconds timeout_;
};

} // namespace vidscan::infra
