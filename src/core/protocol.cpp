#include "audience/protocol.hpp"

#include <algorithm>
#include <cctype>

namespace audience {

namespace {

std::string to_lower(std::string_view token) {
    std::string lowered{token};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return lowered;
}

} // namespace

const char* to_string(Field field) {
    switch (field) {
    case Field::Uuid: return "uuid";
    case Field::Dpid: return "dpid";
    case Field::Dpuuid: return "dpuuid";
    case Field::Profile: return "profile";
    case Field::Privacy:
    default: return "privacy";
    }
}

Command Protocol::parse(std::string_view line) {
    // CRLF tolerance (windows, telnet, netcat)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string_view> tokens;
    tokens.reserve(3);

    size_t pos = 0;

    while (pos < line.size()) {
        // Skip spaces
        while (pos < line.size() && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            break;

        size_t start = pos;
        while (pos < line.size() && line[pos] != ' ')
            ++pos;

        tokens.emplace_back(line.substr(start, pos - start));
    }

    if (tokens.empty()) {
        return NoOp{ };
    }

    return parse_tokens(tokens);
}

Command Protocol::parse_tokens(const std::vector<std::string_view>& tokens) {
    std::string cmd = to_lower(tokens[0]);

    if (cmd == "get") {
        if (tokens.size() != 2)
            throw ProtocolError{"GET requires exactly one argument"};

        return Get{ parse_field(tokens[1], true) };
    }

    if (cmd == "set") {
        if (tokens.size() != 3)
            throw ProtocolError{"SET requires exactly two arguments"};

        return Set{
            parse_field(tokens[1], false),
            std::string{tokens[2]}
        };
    }

    if (cmd == "del") {
        if (tokens.size() != 2)
            throw ProtocolError{"DEL requires exactly one argument"};

        return Del{ parse_field(tokens[1], false) };
    }

    if (cmd == "privacy") {
        if (tokens.size() != 2)
            throw ProtocolError{"PRIVACY requires exactly one argument"};

        auto status = parse_privacy_status(tokens[1]);
        if (!status)
            throw ProtocolError{"unknown privacy status"};
        return Privacy{ *status };
    }

    if (cmd == "state") {
        if (tokens.size() != 1)
            throw ProtocolError{"STATE takes no arguments"};
        return State{ };
    }

    if (cmd == "reset") {
        if (tokens.size() != 1)
            throw ProtocolError{"RESET takes no arguments"};
        return Reset{ };
    }

    if (cmd == "ping") {
        if (tokens.size() != 1)
            throw ProtocolError{"PING takes no arguments"};
        return Ping{ };
    }

    if (cmd == "quit") {
        if (tokens.size() != 1)
            throw ProtocolError{"QUIT takes no arguments"};
        return Quit{ };
    }

    throw ProtocolError{"unknown command"};
}

Field Protocol::parse_field(std::string_view token, bool allow_privacy) {
    std::string name = to_lower(token);

    if (name == "uuid")
        return Field::Uuid;
    if (name == "dpid")
        return Field::Dpid;
    if (name == "dpuuid")
        return Field::Dpuuid;
    if (name == "profile")
        return Field::Profile;
    if (name == "privacy" && allow_privacy)
        return Field::Privacy;

    throw ProtocolError{"unknown field"};
}

std::string Protocol::format_ok() {
    return "+OK\n";
}

std::string Protocol::format_error(std::string_view message) {
    return "-ERR " + std::string{message} + "\n";
}

std::string Protocol::format_value(std::string_view value) {
    return "$" + std::string{value} + "\n";
}

StringMap ProfileCodec::parse(std::string_view text) {
    StringMap profile;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find(';', pos);
        if (end == std::string_view::npos)
            end = text.size();

        std::string_view segment = text.substr(pos, end - pos);
        pos = end + 1;

        if (segment.empty())
            continue;

        size_t eq = segment.find('=');
        if (eq == std::string_view::npos)
            throw ProtocolError{"profile entry without '='"};
        if (eq == 0)
            throw ProtocolError{"profile entry with empty key"};

        profile[std::string{segment.substr(0, eq)}] = std::string{segment.substr(eq + 1)};
    }

    return profile;
}

std::string ProfileCodec::build(const StringMap& profile) {
    std::string out;
    for (const auto& [key, value] : profile) {
        if (!out.empty())
            out += ';';
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

} // namespace audience
