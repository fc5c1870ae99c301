#pragma once

#include "audience/data_store.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace audience {

/*
 * Resolves a namespace name to a shared data store.
 *
 * With an empty root directory every namespace lives in memory only;
 * otherwise namespace <name> is persisted to <root>/<name>.yaml.
 * Stores are created on first use and cached for the service lifetime.
 */
class LocalStorageService {
public:
    // Creates root_dir if it does not exist. Throws StorageError on failure.
    explicit LocalStorageService(std::filesystem::path root_dir = {});

    LocalStorageService(const LocalStorageService&) = delete;
    LocalStorageService& operator=(const LocalStorageService&) = delete;

    // nullptr if the name is invalid or the backing file cannot be read.
    std::shared_ptr<DataStore> data_store(const std::string& name);

    bool persistent() const noexcept;
    const std::filesystem::path& root_dir() const noexcept;

    static bool is_valid_name(std::string_view name);

private:
    std::filesystem::path root_dir_;
    std::map<std::string, std::shared_ptr<DataStore>> stores_;
    std::mutex mutex_;
};

} // namespace audience
