#pragma once

#include "audience/data_store.hpp"
#include "audience/event_data.hpp"
#include "audience/privacy_status.hpp"

#include <memory>
#include <optional>
#include <string>

namespace audience {

class LocalStorageService;

/*
 * Current audience identifiers and privacy status.
 *
 * uuid and the visitor profile are persisted to the data store and
 * hydrated from it on first read; dpid and dpuuid live in memory only.
 * While the privacy status is OptedOut every non-clearing write is
 * ignored. A missing data store is logged and never reported to the
 * caller.
 *
 * Not thread-safe.
 */
class AudienceState {
public:
    explicit AudienceState(std::shared_ptr<DataStore> store,
                           PrivacyStatus privacy_status = PrivacyStatus::Unknown);

    // Resolves the audience namespace from storage. storage may be null.
    explicit AudienceState(LocalStorageService* storage,
                           PrivacyStatus privacy_status = PrivacyStatus::Unknown);

    void set_dpid(std::optional<std::string> dpid);
    void set_dpuuid(std::optional<std::string> dpuuid);
    void set_uuid(std::optional<std::string> uuid);
    void set_visitor_profile(std::optional<StringMap> visitor_profile);
    void set_privacy_status(PrivacyStatus privacy_status);

    const std::optional<std::string>& dpid() const;
    const std::optional<std::string>& dpuuid() const;

    // Loads from the data store when nothing is cached in memory.
    const std::optional<std::string>& uuid();
    const std::optional<StringMap>& visitor_profile();

    PrivacyStatus privacy_status() const;

    // Non-empty identifiers and profile, or nothing at all when opted out.
    EventData state_data();

    // Clears uuid, dpid, dpuuid and the visitor profile.
    void clear_identifiers();

private:
    DataStore* data_store() const;
    bool opted_out() const;

    std::optional<std::string> uuid_;
    std::optional<std::string> dpid_;
    std::optional<std::string> dpuuid_;
    std::optional<StringMap> visitor_profile_;
    PrivacyStatus privacy_status_;
    std::shared_ptr<DataStore> store_;
};

} // namespace audience
