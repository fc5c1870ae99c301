#include "audience/audience_state.hpp"
#include "audience/audience_constants.hpp"
#include "audience/local_storage.hpp"
#include "audience/log.hpp"

namespace audience {

namespace {

constexpr const char* kLogTag = "AudienceState";

bool is_null_or_empty(const std::optional<std::string>& value) {
    return !value || value->empty();
}

bool is_null_or_empty(const std::optional<StringMap>& value) {
    return !value || value->empty();
}

std::shared_ptr<DataStore> open_data_store(LocalStorageService* storage) {
    if (!storage)
        return nullptr;
    return storage->data_store(constants::kDataStoreName);
}

} // namespace

AudienceState::AudienceState(std::shared_ptr<DataStore> store, PrivacyStatus privacy_status)
    : privacy_status_(privacy_status), store_(std::move(store)) {}

AudienceState::AudienceState(LocalStorageService* storage, PrivacyStatus privacy_status)
    : AudienceState(open_data_store(storage), privacy_status) {}

void AudienceState::set_dpid(std::optional<std::string> dpid) {
    if (is_null_or_empty(dpid) || !opted_out())
        dpid_ = std::move(dpid);
    else
        log::debug(kLogTag, "set_dpid - Ignored while privacy status is opted out");
}

void AudienceState::set_dpuuid(std::optional<std::string> dpuuid) {
    if (is_null_or_empty(dpuuid) || !opted_out())
        dpuuid_ = std::move(dpuuid);
    else
        log::debug(kLogTag, "set_dpuuid - Ignored while privacy status is opted out");
}

void AudienceState::set_uuid(std::optional<std::string> uuid) {
    if (DataStore* store = data_store()) {
        if (is_null_or_empty(uuid))
            store->remove(constants::kUserIdKey);
        else if (!opted_out())
            store->set_string(constants::kUserIdKey, *uuid);
    } else {
        log::error(kLogTag, "set_uuid - Unable to update uuid in persistence as the local storage service is unavailable");
    }

    if (is_null_or_empty(uuid) || !opted_out())
        uuid_ = std::move(uuid);
    else
        log::debug(kLogTag, "set_uuid - Ignored while privacy status is opted out");
}

void AudienceState::set_visitor_profile(std::optional<StringMap> visitor_profile) {
    if (DataStore* store = data_store()) {
        if (is_null_or_empty(visitor_profile))
            store->remove(constants::kProfileKey);
        else if (!opted_out())
            store->set_map(constants::kProfileKey, *visitor_profile);
    } else {
        log::error(kLogTag,
                   "set_visitor_profile - Unable to update visitor profile in persistence as the local storage service is unavailable");
    }

    if (is_null_or_empty(visitor_profile) || !opted_out())
        visitor_profile_ = std::move(visitor_profile);
    else
        log::debug(kLogTag, "set_visitor_profile - Ignored while privacy status is opted out");
}

void AudienceState::set_privacy_status(PrivacyStatus privacy_status) {
    privacy_status_ = privacy_status;
}

const std::optional<std::string>& AudienceState::dpid() const {
    return dpid_;
}

const std::optional<std::string>& AudienceState::dpuuid() const {
    return dpuuid_;
}

const std::optional<std::string>& AudienceState::uuid() {
    if (is_null_or_empty(uuid_)) {
        if (DataStore* store = data_store()) {
            if (auto stored = store->get_string(constants::kUserIdKey))
                uuid_ = std::move(stored);
        } else {
            log::error(kLogTag, "uuid - Unable to retrieve uuid from persistence as the local storage service is unavailable");
        }
    }

    return uuid_;
}

const std::optional<StringMap>& AudienceState::visitor_profile() {
    if (is_null_or_empty(visitor_profile_)) {
        DataStore* store = data_store();

        if (!store) {
            log::error(kLogTag,
                       "visitor_profile - Unable to retrieve visitor profile from persistence as the local storage service is unavailable");
        } else if (store->contains(constants::kProfileKey)) {
            visitor_profile_ = store->get_map(constants::kProfileKey);
        }
    }

    return visitor_profile_;
}

PrivacyStatus AudienceState::privacy_status() const {
    return privacy_status_;
}

EventData AudienceState::state_data() {
    EventData data;

    // nothing is shared while opted out
    if (opted_out())
        return data;

    if (!is_null_or_empty(dpid()))
        data.put_string(constants::state_keys::kDpid, *dpid());

    if (!is_null_or_empty(dpuuid()))
        data.put_string(constants::state_keys::kDpuuid, *dpuuid());

    if (const auto& current_uuid = uuid(); !is_null_or_empty(current_uuid))
        data.put_string(constants::state_keys::kUuid, *current_uuid);

    if (const auto& profile = visitor_profile(); !is_null_or_empty(profile))
        data.put_string_map(constants::state_keys::kVisitorProfile, *profile);

    return data;
}

void AudienceState::clear_identifiers() {
    set_uuid(std::nullopt);
    set_dpid(std::nullopt);
    set_dpuuid(std::nullopt);
    set_visitor_profile(std::nullopt);
}

DataStore* AudienceState::data_store() const {
    return store_.get();
}

bool AudienceState::opted_out() const {
    return privacy_status_ == PrivacyStatus::OptedOut;
}

} // namespace audience
