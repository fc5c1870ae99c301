#include "audience/command_dispatcher.hpp"
#include "audience/config.hpp"

#include <iostream>


/*
 * Entry point for the audience CLI.
 * load config
 * open the audience data store
 * execute one command per stdin line until EOF or QUIT
 */

int main(int argc, char* argv[]) {
    auto config_path = audience::AudienceConfig::resolve_path(argc > 1 ? argv[1] : nullptr);
    return audience::run_cli(config_path, std::cin, std::cout, std::cerr);
}
