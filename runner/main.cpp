#include "cmd_selftest.h"
#include "cmd_tools.h"

#include "labwright/config.h"

#include <csignal>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "labwright_cli <selftest|launch|recover|check_script|mutate|render> ...\n";
        return 2;
    }
    // Children may exit before draining their stdin.
    ::signal(SIGPIPE, SIG_IGN);

    const auto profile = labwright::detect_profile();
    labwright::apply_profile_defaults(profile);

    std::string cmd = argv[1];
    if (cmd == "selftest") return cmd_selftest(argc, argv);
    if (cmd == "launch") return cmd_launch(argc, argv);
    if (cmd == "recover") return cmd_recover(argc, argv);
    if (cmd == "check_script") return cmd_check_script(argc, argv);
    if (cmd == "mutate") return cmd_mutate(argc, argv);
    if (cmd == "render") return cmd_render(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
