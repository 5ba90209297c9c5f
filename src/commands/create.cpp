#include "commands/create.hpp"
#include "commands/common.hpp"

#include "io/JsonIO.hpp"
#include "lint/Template.hpp"
#include "schema/SchemaLoader.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using cmdutil::get_arg;

static int create_usage() {
    std::cerr
        << "usage:\n"
        << "  planlint create <type> <id> [--title <str>] [--author <str>] [--output <path>]\n"
        << "\n"
        << "  --output <path>              default: <id>.adoc\n";
    return 2;
}

int cmd_create(int argc, char** argv) {
    const auto args = cmdutil::positional_args(argc, argv);
    if (args.size() != 2) return create_usage();

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

    lint::TemplateRequest req;
    req.type = args[0];
    req.id = args[1];
    req.date = lint::today_iso_date();
    const std::string title = get_arg(argc, argv, "--title", "");
    const std::string author = get_arg(argc, argv, "--author", "");
    if (!title.empty()) req.title = title;
    if (!author.empty()) req.author = author;

    const std::string out_path = get_arg(argc, argv, "--output", get_arg(argc, argv, "-o", req.id + ".adoc"));

    try {
        jsonio::write_text_file(fs::path(out_path), lint::create_document_template(loader, req));
    } catch (const std::exception& e) {
        cmdutil::print_error(e);
        return 1;
    }

    std::cout << "created " << req.type << " document: " << out_path << "\n";
    return 0;
}
