#include "audience/event_data.hpp"

#include <yaml-cpp/yaml.h>

namespace audience {

EventData& EventData::put_string(const std::string& key, std::string value) {
    data_[key] = std::move(value);
    return *this;
}

EventData& EventData::put_string_map(const std::string& key, StringMap value) {
    data_[key] = std::move(value);
    return *this;
}

std::optional<std::string> EventData::get_string(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    if (const auto* value = std::get_if<std::string>(&it->second))
        return *value;
    return std::nullopt;
}

std::optional<StringMap> EventData::get_string_map(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    if (const auto* value = std::get_if<StringMap>(&it->second))
        return *value;
    return std::nullopt;
}

bool EventData::contains(const std::string& key) const {
    return data_.find(key) != data_.end();
}

size_t EventData::size() const {
    return data_.size();
}

bool EventData::empty() const {
    return data_.empty();
}

std::string EventData::to_yaml() const {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    for (const auto& [key, value] : data_) {
        out << YAML::Key << key << YAML::Value;
        if (const auto* text = std::get_if<std::string>(&value)) {
            out << *text;
        } else {
            out << YAML::Flow << YAML::BeginMap;
            for (const auto& [map_key, map_value] : std::get<StringMap>(value))
                out << YAML::Key << map_key << YAML::Value << map_value;
            out << YAML::EndMap;
        }
    }
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace audience
