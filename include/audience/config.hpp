#pragma once

#include "audience/log.hpp"
#include "audience/privacy_status.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace audience {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * YAML configuration:
 *
 *   audience:
 *     privacy_status: optunknown
 *     storage_dir: /var/lib/audience   # empty -> memory only
 *   log:
 *     level: info
 */
struct AudienceConfig {
    PrivacyStatus privacy_status{PrivacyStatus::Unknown};
    std::filesystem::path storage_dir{};
    LogLevel log_level{LogLevel::Info};

    // A missing file yields the defaults.
    // Throws ConfigError on malformed YAML or invalid values.
    static AudienceConfig load(const std::filesystem::path& path);
    static AudienceConfig parse(const std::string& yaml);

    // argv path if given, else AUDIENCE_CONFIG_PATH, else config/audience.yaml
    static std::filesystem::path resolve_path(const char* cli_path);
};

} // namespace audience
