#include "audience/privacy_status.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace audience {

const char* to_string(PrivacyStatus status) {
    switch (status) {
    case PrivacyStatus::OptedIn: return "optedin";
    case PrivacyStatus::OptedOut: return "optedout";
    case PrivacyStatus::Unknown:
    default: return "optunknown";
    }
}

std::optional<PrivacyStatus> parse_privacy_status(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (lowered == "optedin")
        return PrivacyStatus::OptedIn;
    if (lowered == "optedout")
        return PrivacyStatus::OptedOut;
    if (lowered == "optunknown")
        return PrivacyStatus::Unknown;
    return std::nullopt;
}

} // namespace audience
