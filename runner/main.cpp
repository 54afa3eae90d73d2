#include "commands.h"

#include "codemode/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "codemode_cli <exec|validate|modes> ...\n";
        return 2;
    }

    codemode::apply_profile_defaults(codemode::detect_profile());

    std::string cmd = argv[1];
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "modes") return cmd_modes(argc, argv);

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
