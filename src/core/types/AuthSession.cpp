#include "core/types/AuthSession.hpp"

namespace vidscan::core {

std::string AuthSession::outcomeToString() const {
    switch (outcome) {
    case AuthOutcome::Authenticated:
        return "Authenticated";
    case AuthOutcome::MarkersUnderChallenge:
        return "MarkersUnderChallenge";
    case AuthOutcome::Rejected:
        return "Rejected";
    case AuthOutcome::Unreachable:
        return "Unreachable";
    case AuthOutcome::NoWebPort:
        return "NoWebPort";
    }
    return "Unknown";
}

} // namespace vidscan::core
