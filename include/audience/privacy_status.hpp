#pragma once

#include <optional>
#include <string_view>

namespace audience {

enum class PrivacyStatus {
    OptedIn,
    OptedOut,
    Unknown
};

// "optedin", "optedout" or "optunknown"
const char* to_string(PrivacyStatus status);

// Case-insensitive. Returns std::nullopt for anything else.
std::optional<PrivacyStatus> parse_privacy_status(std::string_view text);

} // namespace audience
