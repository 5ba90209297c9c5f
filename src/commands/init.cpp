#include "commands/init.hpp"
#include "commands/common.hpp"

#include "io/JsonIO.hpp"
#include "lint/Config.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int cmd_init(int argc, char** argv) {
    (void)argc;
    (void)argv;

    const fs::path path = lint::default_config_files().front();
    if (fs::exists(path)) {
        std::cerr << "error: " << path.string() << " already exists\n";
        return 1;
    }

    try {
        jsonio::write_text_file(path, lint::config_to_json(lint::LinterConfig{}).dump(2) + "\n");
    } catch (const std::exception& e) {
        cmdutil::print_error(e);
        return 1;
    }

    std::cout << "created " << path.string() << "\n";
    return 0;
}
