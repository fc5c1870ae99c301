#include "audience/config.hpp"

#include <cstdlib>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace audience {

namespace {

constexpr const char* kLogTag = "AudienceConfig";
constexpr const char* kDefaultConfigPath = "config/audience.yaml";

AudienceConfig from_node(const YAML::Node& doc, const std::filesystem::path& base_dir) {
    AudienceConfig config;

    if (!doc || doc.IsNull())
        return config;
    if (!doc.IsMap())
        throw ConfigError{"top level is not a mapping"};

    try {
        if (auto section = doc["audience"]) {
            if (section["privacy_status"]) {
                auto text = section["privacy_status"].as<std::string>();
                auto status = parse_privacy_status(text);
                if (!status)
                    throw ConfigError{"invalid audience.privacy_status '" + text + "'"};
                config.privacy_status = *status;
            }
            if (section["storage_dir"]) {
                std::filesystem::path dir = section["storage_dir"].as<std::string>("");
                // relative paths are taken from the config file location
                if (!dir.empty() && dir.is_relative() && !base_dir.empty())
                    dir = (base_dir / dir).lexically_normal();
                config.storage_dir = dir;
            }
        }

        if (auto section = doc["log"]) {
            if (section["level"]) {
                auto text = section["level"].as<std::string>();
                auto level = try_parse_log_level(text);
                if (!level)
                    throw ConfigError{"invalid log.level '" + text + "'"};
                config.log_level = *level;
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError{e.what()};
    }

    return config;
}

} // namespace

AudienceConfig AudienceConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log::warn(kLogTag, "load - " + path.string() + " not found, using defaults");
        return AudienceConfig{};
    }

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError{"Failed to load " + path.string() + ": " + e.what()};
    }

    const auto absolute = std::filesystem::absolute(path, ec);
    const auto base_dir = ec ? path.parent_path() : absolute.parent_path();
    try {
        return from_node(doc, base_dir);
    } catch (const ConfigError& e) {
        throw ConfigError{path.string() + ": " + e.what()};
    }
}

AudienceConfig AudienceConfig::parse(const std::string& yaml) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError{e.what()};
    }
    return from_node(doc, {});
}

std::filesystem::path AudienceConfig::resolve_path(const char* cli_path) {
    if (cli_path && *cli_path)
        return cli_path;

    const char* env_path = std::getenv("AUDIENCE_CONFIG_PATH");
    if (env_path && *env_path)
        return env_path;

    return kDefaultConfigPath;
}

} // namespace audience
