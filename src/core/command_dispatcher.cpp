#include "audience/command_dispatcher.hpp"
#include "audience/config.hpp"
#include "audience/local_storage.hpp"
#include "audience/log.hpp"

#include <cstdlib>
#include <istream>
#include <memory>
#include <ostream>

namespace audience {

namespace {

std::string reply_optional(const std::optional<std::string>& value) {
    return (value && !value->empty()) ?
        Protocol::format_value(*value) :
        Protocol::format_error("not set");
}

std::string get_field(Field field, AudienceState& state) {
    switch (field) {
    case Field::Uuid:
        return reply_optional(state.uuid());
    case Field::Dpid:
        return reply_optional(state.dpid());
    case Field::Dpuuid:
        return reply_optional(state.dpuuid());
    case Field::Profile: {
        const auto& profile = state.visitor_profile();
        return (profile && !profile->empty()) ?
            Protocol::format_value(ProfileCodec::build(*profile)) :
            Protocol::format_error("not set");
    }
    case Field::Privacy:
        return Protocol::format_value(to_string(state.privacy_status()));
    }
    return Protocol::format_error("unknown field");
}

void set_field(Field field, const std::optional<std::string>& value, AudienceState& state) {
    switch (field) {
    case Field::Uuid:
        state.set_uuid(value);
        break;
    case Field::Dpid:
        state.set_dpid(value);
        break;
    case Field::Dpuuid:
        state.set_dpuuid(value);
        break;
    case Field::Profile:
        if (value)
            state.set_visitor_profile(ProfileCodec::parse(*value));
        else
            state.set_visitor_profile(std::nullopt);
        break;
    case Field::Privacy:
        break;
    }
}

} // namespace

std::string CommandDispatcher::execute(const Command& command, AudienceState& state) {
    return std::visit([&](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, NoOp>) {
            return {};

        } else if constexpr (std::is_same_v<T, Get>) {
            return get_field(cmd.field, state);

        } else if constexpr (std::is_same_v<T, Set>) {
            set_field(cmd.field, cmd.value, state);
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Del>) {
            set_field(cmd.field, std::nullopt, state);
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Privacy>) {
            state.set_privacy_status(cmd.status);
            // opting out wipes whatever was collected so far
            if (cmd.status == PrivacyStatus::OptedOut)
                state.clear_identifiers();
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, State>) {
            return Protocol::format_value(state.state_data().to_yaml());

        } else if constexpr (std::is_same_v<T, Reset>) {
            state.clear_identifiers();
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Ping>) {
            return Protocol::format_value("PONG");

        } else if constexpr (std::is_same_v<T, Quit>) {
            return Protocol::format_ok();
        }
    }, command);
}

std::size_t run_session(std::istream& in, std::ostream& out, AudienceState& state) {
    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lines;
        try {
            Command cmd = Protocol::parse(line);
            out << CommandDispatcher::execute(cmd, state) << std::flush;
            if (std::holds_alternative<Quit>(cmd))
                break;
        } catch (const ProtocolError& e) {
            out << Protocol::format_error(e.what()) << std::flush;
        }
    }
    return lines;
}

int run_cli(const std::filesystem::path& config_path, std::istream& in, std::ostream& out, std::ostream& err) {
    std::unique_ptr<LocalStorageService> storage;
    AudienceConfig config;
    try {
        config = AudienceConfig::load(config_path);
        storage = std::make_unique<LocalStorageService>(config.storage_dir);
    } catch (const ConfigError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    } catch (const StorageError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    const char* env_level = std::getenv("AUDIENCE_LOG_LEVEL");
    Logger::instance().set_level(env_level ? parse_log_level(env_level, config.log_level) : config.log_level);

    AudienceState state{storage.get(), config.privacy_status};
    log::info("audience_cli", std::string{"privacy status "} + to_string(state.privacy_status()) +
                                  (storage->persistent() ? ", storage " + storage->root_dir().string()
                                                         : ", in-memory storage"));

    run_session(in, out, state);
    return 0;
}

} // namespace audience
