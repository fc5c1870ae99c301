#include "audience/data_store.hpp"
#include "audience/log.hpp"

#include <fstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace audience {

namespace {

constexpr const char* kLogTag = "DataStore";

} // namespace

// MemoryDataStore

std::optional<std::string> MemoryDataStore::get_string(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    if (const auto* value = std::get_if<std::string>(&it->second))
        return *value;
    return std::nullopt;
}

void MemoryDataStore::set_string(const std::string& key, const std::string& value) {
    std::unique_lock lock(mutex_);
    data_[key] = value;
}

std::optional<StringMap> MemoryDataStore::get_map(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    if (const auto* value = std::get_if<StringMap>(&it->second))
        return *value;
    return std::nullopt;
}

void MemoryDataStore::set_map(const std::string& key, const StringMap& value) {
    std::unique_lock lock(mutex_);
    data_[key] = value;
}

bool MemoryDataStore::remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    return data_.erase(key) > 0;
}

bool MemoryDataStore::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

size_t MemoryDataStore::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

std::unordered_map<std::string, MemoryDataStore::Value> MemoryDataStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return data_;
}

// FileDataStore

FileDataStore::FileDataStore(std::filesystem::path path) : path_(std::move(path)) {
    load();
}

void FileDataStore::set_string(const std::string& key, const std::string& value) {
    MemoryDataStore::set_string(key, value);
    flush();
}

void FileDataStore::set_map(const std::string& key, const StringMap& value) {
    MemoryDataStore::set_map(key, value);
    flush();
}

bool FileDataStore::remove(const std::string& key) {
    bool removed = MemoryDataStore::remove(key);
    if (removed)
        flush();
    return removed;
}

const std::filesystem::path& FileDataStore::path() const noexcept {
    return path_;
}

void FileDataStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
        return;

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& e) {
        throw StorageError{"Failed to read " + path_.string() + ": " + e.what()};
    }

    if (!doc || doc.IsNull())
        return;
    if (!doc.IsMap())
        throw StorageError{"Malformed data store " + path_.string() + ": top level is not a mapping"};

    try {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const auto key = it->first.as<std::string>();
            const YAML::Node& node = it->second;

            if (node.IsMap()) {
                StringMap map;
                for (auto entry = node.begin(); entry != node.end(); ++entry)
                    map[entry->first.as<std::string>()] = entry->second.as<std::string>("");
                MemoryDataStore::set_map(key, map);
            } else if (node.IsScalar() || node.IsNull()) {
                MemoryDataStore::set_string(key, node.as<std::string>(""));
            } else {
                throw StorageError{"Malformed data store " + path_.string() + ": unsupported value for key " + key};
            }
        }
    } catch (const YAML::Exception& e) {
        throw StorageError{"Malformed data store " + path_.string() + ": " + e.what()};
    }
}

void FileDataStore::flush() {
    std::lock_guard lock(flush_mutex_);
    const auto data = snapshot();

    // Sorted keys keep the file stable between writes.
    std::map<std::string, const Value*> ordered;
    for (const auto& [key, value] : data)
        ordered.emplace(key, &value);

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, value] : ordered) {
        out << YAML::Key << key << YAML::Value;
        if (const auto* text = std::get_if<std::string>(value)) {
            out << YAML::DoubleQuoted << *text;
        } else {
            out << YAML::BeginMap;
            for (const auto& [map_key, map_value] : std::get<StringMap>(*value))
                out << YAML::Key << map_key << YAML::Value << YAML::DoubleQuoted << map_value;
            out << YAML::EndMap;
        }
    }
    out << YAML::EndMap;

    if (!out.good()) {
        log::error(kLogTag, "flush - Failed to encode " + path_.string() + ": " + out.GetLastError());
        return;
    }

    std::filesystem::path tmp = path_;
    tmp += ".tmp";
    bool written = false;
    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        file << out.c_str() << "\n";
        file.close();
        written = static_cast<bool>(file);
    }

    std::error_code ec;
    if (!written) {
        log::error(kLogTag, "flush - Failed to write " + tmp.string());
        std::filesystem::remove(tmp, ec);
        return;
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        log::error(kLogTag, "flush - Failed to replace " + path_.string() + ": " + ec.message());
        std::error_code remove_ec;
        std::filesystem::remove(tmp, remove_ec);
    }
}

} // namespace audience
