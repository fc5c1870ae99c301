#pragma once

#include "audience/audience_state.hpp"
#include "audience/protocol.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace audience {

class CommandDispatcher {
public:
    // Returns the reply line, or an empty string for NoOp.
    // Throws ProtocolError if a SET profile value is malformed.
    static std::string execute(const Command& command, AudienceState& state);
};

// Executes one command per line of in and writes each reply to out.
// Malformed lines get a -ERR reply. Stops at EOF or after QUIT.
// Returns the number of lines read.
std::size_t run_session(std::istream& in, std::ostream& out, AudienceState& state);

// Loads the config, opens storage and runs a session.
// Returns 0, or 1 after printing "Error: ..." to err on a startup failure.
int run_cli(const std::filesystem::path& config_path, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace audience
