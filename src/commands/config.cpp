#include "commands/config.hpp"
#include "commands/common.hpp"

#include "lint/Config.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int cmd_config(int argc, char** argv) {
    if (cmdutil::has_flag(argc, argv, "--show")) {
        try {
            std::cout << lint::config_to_json(cmdutil::load_effective_config(argc, argv)).dump(2) << "\n";
        } catch (const std::exception& e) {
            cmdutil::print_error(e);
            return 2;
        }
        return 0;
    }

    std::cout << "config file locations checked:\n";
    for (const auto& f : lint::default_config_files()) {
        std::cout << "  " << f << (fs::exists(f) ? "  (found)" : "  (missing)") << "\n";
    }
    return 0;
}
