#include "audience/local_storage.hpp"
#include "audience/log.hpp"

#include <system_error>

namespace audience {

namespace {

constexpr const char* kLogTag = "LocalStorageService";

} // namespace

LocalStorageService::LocalStorageService(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {
    if (root_dir_.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(root_dir_, ec);
    if (ec)
        throw StorageError{"Failed to create storage directory " + root_dir_.string() + ": " + ec.message()};
}

std::shared_ptr<DataStore> LocalStorageService::data_store(const std::string& name) {
    if (!is_valid_name(name)) {
        log::error(kLogTag, "data_store - Invalid data store name '" + name + "'");
        return nullptr;
    }

    std::lock_guard lock(mutex_);
    auto it = stores_.find(name);
    if (it != stores_.end())
        return it->second;

    std::shared_ptr<DataStore> store;
    if (root_dir_.empty()) {
        store = std::make_shared<MemoryDataStore>();
    } else {
        try {
            store = std::make_shared<FileDataStore>(root_dir_ / (name + ".yaml"));
        } catch (const StorageError& e) {
            log::error(kLogTag, std::string{"data_store - "} + e.what());
            return nullptr;
        }
    }

    stores_.emplace(name, store);
    return store;
}

bool LocalStorageService::persistent() const noexcept {
    return !root_dir_.empty();
}

const std::filesystem::path& LocalStorageService::root_dir() const noexcept {
    return root_dir_;
}

bool LocalStorageService::is_valid_name(std::string_view name) {
    if (name.empty() || name == "." || name == "..")
        return false;

    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok)
            return false;
    }
    return true;
}

} // namespace audience
