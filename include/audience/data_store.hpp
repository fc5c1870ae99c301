#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>

namespace audience {

using StringMap = std::map<std::string, std::string>;

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * Key-value persistence collaborator.
 * A key holds either a string or a string map; writing one kind
 * replaces the other. Reading the wrong kind yields std::nullopt.
 */
class DataStore {
public:
    virtual ~DataStore() = default;

    virtual std::optional<std::string> get_string(const std::string& key) const = 0;
    virtual void set_string(const std::string& key, const std::string& value) = 0;

    virtual std::optional<StringMap> get_map(const std::string& key) const = 0;
    virtual void set_map(const std::string& key, const StringMap& value) = 0;

    // Returns false if the key was not present.
    virtual bool remove(const std::string& key) = 0;
    virtual bool contains(const std::string& key) const = 0;

    std::string get_string(const std::string& key, const std::string& fallback) const {
        auto value = get_string(key);
        return value ? *value : fallback;
    }
};

/*
 * Thread-safe in-memory data store.
 */
class MemoryDataStore : public DataStore {
public:
    std::optional<std::string> get_string(const std::string& key) const override;
    void set_string(const std::string& key, const std::string& value) override;

    std::optional<StringMap> get_map(const std::string& key) const override;
    void set_map(const std::string& key, const StringMap& value) override;

    bool remove(const std::string& key) override;
    bool contains(const std::string& key) const override;

    size_t size() const;

    using DataStore::get_string;

protected:
    using Value = std::variant<std::string, StringMap>;

    std::unordered_map<std::string, Value> snapshot() const;

private:
    std::unordered_map<std::string, Value> data_;
    mutable std::shared_mutex mutex_;
};

/*
 * Data store backed by a YAML file.
 *
 * The file is read once at construction; a missing file is an empty store,
 * a malformed one throws StorageError. Every mutation rewrites the whole
 * file (temporary file + rename). A failed write is logged and the
 * in-memory change is kept.
 */
class FileDataStore : public MemoryDataStore {
public:
    explicit FileDataStore(std::filesystem::path path);

    void set_string(const std::string& key, const std::string& value) override;
    void set_map(const std::string& key, const StringMap& value) override;
    bool remove(const std::string& key) override;

    const std::filesystem::path& path() const noexcept;

private:
    void load();
    void flush();

    std::filesystem::path path_;
    std::mutex flush_mutex_;
};

} // namespace audience
