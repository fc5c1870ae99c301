#pragma once

namespace audience::constants {

inline constexpr const char* kDataStoreName = "AAMDataStore";
inline constexpr const char* kUserIdKey = "AAMUserId";
inline constexpr const char* kProfileKey = "AAMUserProfile";

// Keys of the shared state data.
namespace state_keys {
inline constexpr const char* kDpid = "dpid";
inline constexpr const char* kDpuuid = "dpuuid";
inline constexpr const char* kUuid = "uuid";
inline constexpr const char* kVisitorProfile = "aamprofile";
} // namespace state_keys

} // namespace audience::constants
