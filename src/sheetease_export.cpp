// sheetease_export.cpp - SheetEase - Command-line Exporter
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#include "sheetease.hpp"

#include <iostream>

using namespace sheetease;

namespace
{
    constexpr const char* RED    = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* GREEN  = "\033[32m";
    constexpr const char* RESET  = "\033[0m";

    void print_usage(std::ostream& os)
    {
        os << "usage: sheetease_export [--config file] [--source dir] [--json-out dir]\n"
              "                        [--desc-out dir] [--enum-out dir] [--id-last]\n"
              "                        [--sort-keys] [--no-diff] [--no-fallback] [--dry-run]\n";
    }

    struct command_line
    {
        std::optional<std::string> config_path;
        std::optional<std::string> source;
        std::optional<std::string> json_out;
        std::optional<std::string> desc_out;
        std::optional<std::string> enum_out;
        bool id_last     = false;
        bool sort_keys   = false;
        bool no_diff     = false;
        bool no_fallback = false;
        bool dry_run     = false;
        bool help        = false;
    };

    std::optional<command_line> parse_command_line(int argc, char** argv)
    {
        command_line cl;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];

            auto take = [&](std::optional<std::string>& target) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << RED << "missing value for " << arg << RESET << "\n";
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if      (arg == "--config")      { if (!take(cl.config_path)) return std::nullopt; }
            else if (arg == "--source")      { if (!take(cl.source))      return std::nullopt; }
            else if (arg == "--json-out")    { if (!take(cl.json_out))    return std::nullopt; }
            else if (arg == "--desc-out")    { if (!take(cl.desc_out))    return std::nullopt; }
            else if (arg == "--enum-out")    { if (!take(cl.enum_out))    return std::nullopt; }
            else if (arg == "--id-last")     cl.id_last     = true;
            else if (arg == "--sort-keys")   cl.sort_keys   = true;
            else if (arg == "--no-diff")     cl.no_diff     = true;
            else if (arg == "--no-fallback") cl.no_fallback = true;
            else if (arg == "--dry-run")     cl.dry_run     = true;
            else if (arg == "--help" || arg == "-h") cl.help = true;
            else
            {
                std::cerr << RED << "unknown argument '" << arg << "'" << RESET << "\n";
                return std::nullopt;
            }
        }

        return cl;
    }

    struct diagnostics
    {
        size_t fatal       = 0;
        size_t recoverable = 0;
        size_t info        = 0;

        template <typename Error>
        void report(Error const& e)
        {
            switch (level_of(e))
            {
                case severity::fatal:
                    ++fatal;
                    std::cerr << RED << to_string(e) << RESET << "\n";
                    break;
                case severity::recoverable:
                    ++recoverable;
                    std::cerr << YELLOW << to_string(e) << RESET << "\n";
                    break;
                case severity::info:
                    ++info;
                    std::cout << to_string(e) << "\n";
                    break;
            }
        }

        template <typename Error>
        void report(std::vector<Error> const& errors)
        {
            for (auto const& e : errors)
                report(e);
        }
    };

    void apply(command_line const& cl, tool_config& cfg)
    {
        if (cl.source)      cfg.source_folder      = *cl.source;
        if (cl.json_out)    cfg.json_output        = *cl.json_out;
        if (cl.desc_out)    cfg.description_output = *cl.desc_out;
        if (cl.enum_out)    cfg.enum_output        = *cl.enum_out;
        if (cl.id_last)     cfg.options.id_first   = false;
        if (cl.sort_keys)   cfg.options.sort_keys  = true;
        if (cl.no_diff)     cfg.options.diff_only  = false;
        if (cl.no_fallback) cfg.custom_type_fallback = fallback_policy::reject;
        if (cl.dry_run)     cfg.dry_run            = true;
    }

    void write_artifacts(batch_result const& batch, tool_config const& cfg, artifact_writer& writer)
    {
        namespace fs = std::filesystem;
        auto const& opts = cfg.options;

        if (!cfg.json_output.empty())
            for (auto const& t : batch.tables)
                writer.write(fs::path(cfg.json_output) / file_name(opts.json_file_pattern, t.table), render_document(t, opts));

        if (!cfg.description_output.empty())
            for (auto const& d : batch.descriptions)
                writer.write(fs::path(cfg.description_output) / file_name(opts.description_file_pattern, d.name), render_description(d, opts));

        if (!cfg.enum_output.empty())
        {
            for (auto const& d : batch.descriptions)
                if (d.keys_enum)
                    writer.write(fs::path(cfg.enum_output) / file_name(opts.enum_file_pattern, d.keys_enum->name), render_enum(*d.keys_enum, opts));

            for (auto const& e : batch.enums)
                writer.write(fs::path(cfg.enum_output) / file_name(opts.enum_file_pattern, e.name), render_enum(e, opts));
        }
    }
}

int main(int argc, char** argv)
{
    auto cl = parse_command_line(argc, argv);
    if (!cl)
    {
        print_usage(std::cerr);
        return 2;
    }
    if (cl->help)
    {
        print_usage(std::cout);
        return 0;
    }

    diagnostics diag;

    // Configuration: file first, then command-line overrides.
    tool_config cfg;
    std::string origin = "<command line>";
    if (cl->config_path)
    {
        auto loaded = load_config(*cl->config_path);
        diag.report(loaded.errors);
        if (loaded.has_fatal())
            return 1;
        cfg = std::move(loaded.result);
        origin = *cl->config_path;
    }
    apply(*cl, cfg);

    auto problems = validate_config(cfg, origin);
    diag.report(problems);
    if (diag.fatal > 0)
    {
        print_usage(std::cerr);
        return 1;
    }

    custom_type_registry registry(cfg.custom_type_fallback);

    // Sources
    auto scan = scan_workbooks(cfg.source_folder);
    diag.report(scan.errors);
    if (scan.has_fatal())
        return 1;

    size_t skipped = static_cast<size_t>(std::count_if(scan.errors.begin(), scan.errors.end(),
        [](source_error const& e) { return e.kind == source_error_kind::skipped_file; }));

    std::vector<workbook> books;
    for (auto const& path : scan.result)
    {
        std::cout << "reading " << path.string() << "\n";
        auto wb = read_workbook(path);
        diag.report(wb.errors);
        if (wb.result)
            books.push_back(std::move(*wb.result));
        else
            ++skipped;
    }

    // Stage 1
    auto batch = build_batch(books, registry, cfg.options);

    artifact_writer writer(cfg.options.diff_only, cfg.dry_run);
    write_artifacts(batch.result, cfg, writer);

    for (auto const& a : writer.artifacts())
    {
        if (a.status == write_status::failed)
        {
            ++diag.fatal;
            std::cerr << RED << a.path.string() << ": " << a.message << RESET << "\n";
        }
        else if (a.status != write_status::unchanged)
        {
            std::cout << to_string(a.status) << " " << a.path.string() << "\n";
        }
    }

    // Stage 2, against the batch and anything already exported
    target_loader loader;
    if (!cfg.json_output.empty())
        loader = file_target_loader(cfg.json_output, cfg.options);
    check_batch_references(batch, cfg.options, std::move(loader));

    diag.report(batch.errors);

    auto const& refs = batch.result.references;
    std::cout << (diag.fatal ? RED : GREEN)
              << batch.result.tables.size() << " tables, "
              << batch.result.enums.size() << " enums, "
              << skipped << " workbooks skipped; "
              << writer.count(write_status::written) << " written, "
              << writer.count(write_status::unchanged) << " unchanged, "
              << writer.count(write_status::planned) << " planned; "
              << refs.checked << " references checked, "
              << refs.failed << " failed, "
              << refs.skipped << " skipped; "
              << diag.fatal << " errors, "
              << diag.recoverable << " warnings, "
              << diag.info << " notes"
              << RESET << "\n";

    return diag.fatal > 0 ? 1 : 0;
}
