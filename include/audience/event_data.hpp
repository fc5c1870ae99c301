#pragma once

#include "audience/data_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace audience {

/*
 * Structured key -> value bag shared with other modules.
 * Values are strings or string maps. Keys are kept ordered.
 */
class EventData {
public:
    using Value = std::variant<std::string, StringMap>;

    EventData& put_string(const std::string& key, std::string value);
    EventData& put_string_map(const std::string& key, StringMap value);

    // std::nullopt if the key is missing or holds the other kind.
    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<StringMap> get_string_map(const std::string& key) const;

    bool contains(const std::string& key) const;
    size_t size() const;
    bool empty() const;

    // Single-line YAML flow mapping, e.g. {dpid: d1, aamprofile: {k: v}}
    std::string to_yaml() const;

    bool operator==(const EventData& other) const = default;

private:
    std::map<std::string, Value> data_;
};

} // namespace audience
