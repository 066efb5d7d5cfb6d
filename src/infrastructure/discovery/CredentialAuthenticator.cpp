#include "infrastructure/discovery/CredentialAuthenticator.hpp"

#include "core/classification/ManufacturerClassifier.hpp"

#include <spdlog/spdlog.h>

namespace vidscan::infra {

CredentialAuthenticator::CredentialAuthenticator(core::IHttpClient& client,
                                                 std::vector<core::Credentials> chain,
                                                 std::chrono::milliseconds timeout)
    : client_(client), chain_(std::move(chain)), timeout_(timeout) {}

core::AuthSession CredentialAuthenticator::authenticate(const core::HostProfile& profile) const {
    core::AuthSession session;
    session.address = profile.address;

    if (!profile.webPort()) {
        session.outcome = core::AuthOutcome::NoWebPort;
        return session;
    }
    session.baseUrl = profile.accessUri();

    std::optional<core::HttpResponse> lastRefusal;
    std::optional<core::HttpResponse> identifyingChallenge;
    for (const auto& credentials : chain_) {
        auto response = fetchRoot(session.baseUrl, credentials);
        ++session.attempts;

        if (!response.received()) {
            spdlog::debug("{}: web interface unreachable ({})", profile.address,
                          response.errorMessage);
            session.outcome = core::AuthOutcome::Unreachable;
            session.response = std::move(response);
            return session;
        }

        if (response.success) {
            spdlog::debug("{}: authenticated as '{}' (HTTP {})", profile.address,
                          credentials.username, response.statusCode);
            session.outcome = core::AuthOutcome::Authenticated;
            session.credentials = credentials;
            session.response = std::move(response);
            return session;
        }

        if (!identifyingChallenge && response.isAuthChallenge() &&
            core::ManufacturerClassifier::hasDeviceMarkers(response)) {
            spdlog::debug("{}: challenge for '{}' identifies the device", profile.address,
                          credentials.username);
            identifyingChallenge = response;
        }

        spdlog::debug("{}: credentials '{}' refused (HTTP {})", profile.address,
                      credentials.username, response.statusCode);
        lastRefusal = std::move(response);
    }

    if (identifyingChallenge) {
        session.outcome = core::AuthOutcome::MarkersUnderChallenge;
        session.response = std::move(*identifyingChallenge);
        return session;
    }

    auto anonymous = fetchRoot(session.baseUrl, std::nullopt);
    ++session.attempts;
    session.outcome = core::AuthOutcome::Rejected;
    if (anonymous.received() || !lastRefusal) {
        session.response = std::move(anonymous);
    } else {
        session.response = std::move(*lastRefusal);
    }
    return session;
}

core::HttpResponse
CredentialAuthenticator::fetchRoot(const std::string& baseUrl,
                                   const std::optional<core::Credentials>& credentials) const {
    core::HttpRequest request;
    request.url = baseUrl + "/";
    request.credentials = credentials;
    request.timeout = timeout_;
    return client_.get(request);
}

} // namespace vidscan::infra
