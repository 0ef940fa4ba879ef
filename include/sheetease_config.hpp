// sheetease_config.hpp - SheetEase - Export Options and Tool Configuration
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_CONFIG_HPP
#define SHEETEASE_CONFIG_HPP

#include "sheetease_core.hpp"
#include "sheetease_registry.hpp"

#include <fstream>
#include <sstream>

namespace sheetease
{
    struct export_options
    {
        bool id_first  = true;
        bool sort_keys = false;

        // Reference values that mean "no reference".
        std::vector<int64_t>     empty_int_refs    = { 0 };
        std::vector<std::string> empty_string_refs = { "" };

        std::string json_file_pattern        = "{name}Config.json";
        std::string description_file_pattern = "{name}Data.json";
        std::string enum_file_pattern        = "{name}.json";

        int  indent    = 4;
        bool diff_only = true;
    };

    struct tool_config
    {
        std::string     source_folder;
        std::string     json_output;          // empty: not produced
        std::string     description_output;
        std::string     enum_output;
        fallback_policy custom_type_fallback = fallback_policy::structural;
        bool            dry_run = false;
        export_options  options;
    };

    enum class config_error_kind
    {
        unreadable,
        invalid_json,
        missing_key,
        wrong_type,
        unknown_key
    };

    using config_error   = error<config_error_kind>;
    using config_context = context<tool_config, config_error>;

    config_context parse_config(std::string_view text, std::string const & origin = "<config>");
    config_context load_config(std::string const & path);
    std::vector<config_error> validate_config(tool_config const & cfg, std::string const & origin);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct config_reader
        {
            value const &     root;
            std::string const & origin;
            config_context &  out;

            void wrong_type(std::string const & key, std::string_view expected)
            {
                out.errors.push_back({
                    config_error_kind::wrong_type,
                    severity::fatal,
                    { origin, npos(), npos(), key },
                    "'" + key + "' must be " + std::string(expected)
                });
            }

            void read(std::string const & key, std::string & target)
            {
                auto it = root.find(key);
                if (it == root.end())
                    return;
                if (!it->is_string())
                    return wrong_type(key, "a string");
                target = it->get<std::string>();
            }

            void read(std::string const & key, bool & target)
            {
                auto it = root.find(key);
                if (it == root.end())
                    return;
                if (!it->is_boolean())
                    return wrong_type(key, "true or false");
                target = it->get<bool>();
            }

            void read(std::string const & key, int & target)
            {
                auto it = root.find(key);
                if (it == root.end())
                    return;
                if (!it->is_number_integer() || it->get<int64_t>() < 0 || it->get<int64_t>() > 16)
                    return wrong_type(key, "an integer between 0 and 16");
                target = it->get<int>();
            }

            void read(std::string const & key, std::vector<int64_t> & target)
            {
                auto it = root.find(key);
                if (it == root.end())
                    return;
                if (!it->is_array())
                    return wrong_type(key, "an array of integers");

                std::vector<int64_t> values;
                for (auto const & v : *it)
                {
                    if (!v.is_number_integer())
                        return wrong_type(key, "an array of integers");
                    values.push_back(v.get<int64_t>());
                }
                target = std::move(values);
            }

            void read(std::string const & key, std::vector<std::string> & target)
            {
                auto it = root.find(key);
                if (it == root.end())
                    return;
                if (!it->is_array())
                    return wrong_type(key, "an array of strings");

                std::vector<std::string> values;
                for (auto const & v : *it)
                {
                    if (!v.is_string())
                        return wrong_type(key, "an array of strings");
                    values.push_back(v.get<std::string>());
                }
                target = std::move(values);
            }
        };
    }

    inline config_context parse_config(std::string_view text, std::string const & origin)
    {
        config_context out{};

        value root = value::parse(text, nullptr, false);
        if (root.is_discarded() || !root.is_object())
        {
            out.errors.push_back({
                config_error_kind::invalid_json,
                severity::fatal,
                { origin, npos(), npos(), {} },
                "configuration is not a JSON object"
            });
            return out;
        }

        static const std::vector<std::string_view> known =
        {
            "source_folder", "json_output", "description_output", "enum_output",
            "id_first", "sort_keys", "empty_int_refs", "empty_string_refs",
            "diff_only", "indent", "custom_type_fallback", "dry_run",
            "json_file_pattern", "description_file_pattern", "enum_file_pattern"
        };

        for (auto const & [key, _] : root.items())
        {
            if (std::find(known.begin(), known.end(), key) == known.end())
            {
                out.errors.push_back({
                    config_error_kind::unknown_key,
                    severity::info,
                    { origin, npos(), npos(), key },
                    "unknown key '" + key + "' ignored"
                });
            }
        }

        auto & cfg  = out.result;
        auto & opts = cfg.options;
        detail::config_reader reader{ root, origin, out };

        reader.read("source_folder",            cfg.source_folder);
        reader.read("json_output",              cfg.json_output);
        reader.read("description_output",       cfg.description_output);
        reader.read("enum_output",              cfg.enum_output);
        reader.read("dry_run",                  cfg.dry_run);
        reader.read("id_first",                 opts.id_first);
        reader.read("sort_keys",                opts.sort_keys);
        reader.read("empty_int_refs",           opts.empty_int_refs);
        reader.read("empty_string_refs",        opts.empty_string_refs);
        reader.read("diff_only",                opts.diff_only);
        reader.read("indent",                   opts.indent);
        reader.read("json_file_pattern",        opts.json_file_pattern);
        reader.read("description_file_pattern", opts.description_file_pattern);
        reader.read("enum_file_pattern",        opts.enum_file_pattern);

        bool fallback = true;
        reader.read("custom_type_fallback", fallback);
        cfg.custom_type_fallback = fallback ? fallback_policy::structural : fallback_policy::reject;

        return out;
    }

    // Run after command-line overrides have been applied.
    inline std::vector<config_error> validate_config(tool_config const & cfg, std::string const & origin)
    {
        std::vector<config_error> errors;

        if (cfg.source_folder.empty())
        {
            errors.push_back({
                config_error_kind::missing_key,
                severity::fatal,
                { origin, npos(), npos(), "source_folder" },
                "'source_folder' is required"
            });
        }

        if (cfg.options.json_file_pattern.find("{name}") == std::string::npos)
        {
            errors.push_back({
                config_error_kind::wrong_type,
                severity::fatal,
                { origin, npos(), npos(), "json_file_pattern" },
                "'json_file_pattern' must contain {name}"
            });
        }

        return errors;
    }

    inline config_context load_config(std::string const & path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            config_context out{};
            out.errors.push_back({
                config_error_kind::unreadable,
                severity::fatal,
                { path, npos(), npos(), {} },
                "cannot open configuration file"
            });
            return out;
        }

        std::stringstream buffer;
        buffer << in.rdbuf();
        return parse_config(buffer.str(), path);
    }

} // namespace sheetease

#endif // SHEETEASE_CONFIG_HPP
