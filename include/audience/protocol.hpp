#pragma once

#include "audience/data_store.hpp"
#include "audience/privacy_status.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace audience {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class Field {
    Uuid,
    Dpid,
    Dpuuid,
    Profile,
    Privacy
};

const char* to_string(Field field);

struct NoOp {};

struct Get {
    Field field;
};

struct Set {
    Field field;
    std::string value;
};

struct Del {
    Field field;
};

struct Privacy {
    PrivacyStatus status;
};

struct State {};

struct Reset {};

struct Ping {};

struct Quit {};

using Command = std::variant<NoOp, Get, Set, Del, Privacy, State, Reset, Ping, Quit>;

/*
 * Parses command lines and formats replies.
 *
 *   GET <uuid|dpid|dpuuid|profile|privacy>
 *   SET <uuid|dpid|dpuuid|profile> <value>
 *   DEL <uuid|dpid|dpuuid|profile>
 *   PRIVACY <optedin|optedout|optunknown>
 *   STATE | RESET | PING | QUIT
 */
class Protocol {
public:
    static Command parse(std::string_view line);

    static std::string format_ok();
    static std::string format_error(std::string_view message);
    static std::string format_value(std::string_view value);

private:
    static Command parse_tokens(const std::vector<std::string_view>& tokens);
    static Field parse_field(std::string_view token, bool allow_privacy);
};

/*
 * Text form of a visitor profile: "k=v;k2=v2".
 */
struct ProfileCodec {
    // Empty segments are skipped, the last duplicate key wins.
    // Throws ProtocolError on a segment without '=' or with an empty key.
    static StringMap parse(std::string_view text);

    static std::string build(const StringMap& profile);
};

} // namespace audience
