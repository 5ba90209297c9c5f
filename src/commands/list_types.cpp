#include "commands/list_types.hpp"
#include "commands/common.hpp"

#include "lint/Formatter.hpp"
#include "schema/SchemaLoader.hpp"

#include <iostream>

int cmd_list_types(int argc, char** argv) {
    lint::LinterConfig cfg;
    try {
        cfg = cmdutil::load_effective_config(argc, argv);
    } catch (const std::exception& e) {
        cmdutil::print_error(e);
        return 2;
    }

    schema::SchemaLoader loader(cfg.schema_path);
    try {
        loader.load();
    } catch (const std::exception& e) {
        cmdutil::print_error(e, "failed to load schemas");
        return 2;
    }

    std::cout << lint::format_document_types(loader.get_document_types());
    return 0;
}
