// sheetease_schema.hpp - SheetEase - Table Schema
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// Header rows, top to bottom:
//   1 remark   2 header   3 type   4 label   5 name   6 default
//
// Field names may carry tags, parsed here once and never again:
//   key1:Real, key2:Real       composite key parts (columns 1 and 2)
//   [Table]Name                reference to Table's id
//   [Table/Field]Name          reference to Table's Field

#ifndef SHEETEASE_SCHEMA_HPP
#define SHEETEASE_SCHEMA_HPP

#include "sheetease_core.hpp"
#include "sheetease_types.hpp"
#include "sheetease_registry.hpp"

#include <map>

namespace sheetease
{
//========================================================================
// Field descriptors
//========================================================================

    enum class field_label
    {
        normal,
        required,
        ignore
    };

    enum class key_tag
    {
        none,
        key1,
        key2
    };

    struct reference_tag
    {
        std::string                target_table;
        std::optional<std::string> target_field;   // id when omitted

        std::string tag() const
        {
            return target_field
                ? "[" + target_table + "/" + *target_field + "]"
                : "[" + target_table + "]";
        }
    };

    struct field_descriptor
    {
        size_t                       index = 0;
        std::string                  raw_name;
        std::string                  actual_name;
        type_descriptor              type;
        field_label                  label = field_label::normal;
        std::string                  remark;
        std::string                  header;
        std::optional<cell_value>    default_raw;
        key_tag                      key = key_tag::none;
        std::optional<reference_tag> reference;

        bool is_key_column() const noexcept { return index == 0; }
        bool is_exported() const noexcept { return index > 0 && label != field_label::ignore; }
    };

//========================================================================
// Primary key policy
//========================================================================

    // floor(sqrt(2^31)): key1 * M + key2 stays below 2^31 for key parts in [0, M).
    constexpr int64_t COMPOSITE_KEY_MULTIPLIER = 46340;
    constexpr int64_t COMPOSITE_KEY_LIMIT      = int64_t{1} << 31;

    enum class key_policy_kind
    {
        string_enum,
        composite_int,
        single_int
    };

    struct key_policy
    {
        key_policy_kind kind = key_policy_kind::single_int;
        std::string     key1_name;   // composite_int only
        std::string     key2_name;
    };

    inline std::string to_string(key_policy_kind k)
    {
        switch (k)
        {
            case key_policy_kind::string_enum:   return "string-enum";
            case key_policy_kind::composite_int: return "composite-int";
            case key_policy_kind::single_int:    return "single-int";
        }
        return "single-int";
    }

//========================================================================
// Table schema
//========================================================================

    struct table_schema
    {
        std::string                   name;
        std::vector<field_descriptor> fields;
        key_policy                    policy;

        field_descriptor const * field(std::string_view actual_name) const noexcept
        {
            for (auto const & f : fields)
                if (f.actual_name == actual_name)
                    return &f;
            return nullptr;
        }
    };

    enum class schema_error_kind
    {
        header_format,
        header_misaligned,
        duplicate_field,
        invalid_field_name,
        unknown_custom_type,
        key_tags_ignored,
        sheet_name_conflict
    };

    using schema_error   = error<schema_error_kind>;
    using schema_context = context<std::optional<table_schema>, schema_error>;

    schema_context build_schema(sheet const & sh, custom_type_registry const & registry);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct name_tags
        {
            key_tag                      key = key_tag::none;
            std::optional<reference_tag> reference;
            std::string                  actual;
            std::optional<std::string>   problem;
        };

        inline name_tags parse_name_tags(std::string_view raw)
        {
            name_tags out;
            auto s = trim_sv(raw);

            if (s.starts_with("key1:"))
            {
                out.key = key_tag::key1;
                s = trim_sv(s.substr(5));
            }
            else if (s.starts_with("key2:"))
            {
                out.key = key_tag::key2;
                s = trim_sv(s.substr(5));
            }

            if (s.starts_with("["))
            {
                auto close = s.find(']');
                if (close == std::string_view::npos)
                {
                    out.problem = "unterminated reference tag in '" + std::string(raw) + "'";
                    return out;
                }

                auto inner = s.substr(1, close - 1);
                reference_tag ref;

                if (auto slash = inner.find('/'); slash != std::string_view::npos)
                {
                    ref.target_table = trim(inner.substr(0, slash));
                    auto target_field = trim(inner.substr(slash + 1));
                    if (target_field.empty())
                    {
                        out.problem = "reference tag in '" + std::string(raw) + "' names no target field";
                        return out;
                    }
                    ref.target_field = target_field;
                }
                else
                {
                    ref.target_table = trim(inner);
                }

                if (ref.target_table.empty())
                {
                    out.problem = "reference tag in '" + std::string(raw) + "' names no target table";
                    return out;
                }

                out.reference = std::move(ref);
                s = trim_sv(s.substr(close + 1));
            }

            out.actual = std::string(s);
            return out;
        }

        inline field_label parse_label(std::string_view s)
        {
            auto l = to_lower(trim_sv(s));
            if (l == "required") return field_label::required;
            if (l == "ignore")   return field_label::ignore;
            return field_label::normal;
        }

        // "'a' (columns 1 3), 'b' (columns 2 4)"; names mapped to "" are skipped.
        template <typename Name>
        std::string duplicate_report(std::vector<field_descriptor> const & fields, Name name_of)
        {
            std::map<std::string, std::vector<size_t>> seen;
            std::vector<std::string> order;
            for (auto const & f : fields)
            {
                auto const & name = name_of(f);
                if (name.empty())
                    continue;
                auto & cols = seen[name];
                if (cols.empty())
                    order.push_back(name);
                cols.push_back(f.index);
            }

            std::string report;
            for (auto const & name : order)
            {
                auto const & cols = seen[name];
                if (cols.size() < 2)
                    continue;

                if (!report.empty())
                    report += ", ";
                report += "'" + name + "' (columns";
                for (auto c : cols)
                    report += " " + std::to_string(c);
                report += ")";
            }
            return report;
        }

        inline std::string_view header_row_name(size_t r)
        {
            static constexpr std::string_view names[] =
                { "remark", "header", "type", "label", "name", "default" };
            return r < HEADER_ROW_COUNT ? names[r] : "data";
        }
    }

    inline key_policy detect_key_policy(std::vector<field_descriptor> const & fields, std::vector<schema_error> & notes, std::string const & table)
    {
        key_policy policy;

        if (!fields.empty() && fields[0].type.is_primitive(primitive_type::string))
        {
            policy.kind = key_policy_kind::string_enum;
            return policy;
        }

        bool tagged = fields.size() >= 3
            && fields[1].key == key_tag::key1
            && fields[2].key == key_tag::key2;

        if (tagged
            && fields[1].type.is_primitive(primitive_type::integer)
            && fields[2].type.is_primitive(primitive_type::integer))
        {
            policy.kind      = key_policy_kind::composite_int;
            policy.key1_name = fields[1].actual_name;
            policy.key2_name = fields[2].actual_name;
            return policy;
        }

        bool any_tag = std::any_of(fields.begin(), fields.end(),
            [](field_descriptor const & f) { return f.key != key_tag::none; });

        if (any_tag)
        {
            notes.push_back({
                schema_error_kind::key_tags_ignored,
                severity::info,
                { table, npos(), npos(), {} },
                tagged
                    ? "key1:/key2: columns must both be int; using the first column as the key"
                    : "key1:/key2: tags only form a composite key on columns 1 and 2; using the first column as the key"
            });
        }

        policy.kind = key_policy_kind::single_int;
        return policy;
    }

    inline schema_context build_schema(sheet const & sh, custom_type_registry const & registry)
    {
        schema_context out{};

        auto fatal = [&](schema_error_kind kind, size_t row, size_t column, std::string field, std::string message)
        {
            out.errors.push_back({ kind, severity::fatal, { sh.name, row, column, std::move(field) }, std::move(message) });
        };

        if (sh.rows.size() < HEADER_ROW_COUNT)
        {
            fatal(schema_error_kind::header_format, npos(), npos(), {},
                "expected " + std::to_string(HEADER_ROW_COUNT) + " header rows, found " + std::to_string(sh.rows.size()));
            return out;
        }

        for (size_t r = 0; r < HEADER_ROW_COUNT; ++r)
        {
            if (sh.rows[r].empty())
                fatal(schema_error_kind::header_format, r + 1, npos(), {},
                    "header row '" + std::string(detail::header_row_name(r)) + "' has no cells");
        }
        if (out.has_fatal())
            return out;

        // The field-name row decides the width; trailing empty cells do not count.
        auto const & names_row = sh.rows[static_cast<size_t>(header_row::name)];
        size_t width = names_row.size();
        while (width > 0 && detail::is_blank(names_row[width - 1]))
            --width;

        if (width == 0)
        {
            fatal(schema_error_kind::header_format, static_cast<size_t>(header_row::name) + 1, npos(), {},
                "field-name row is empty");
            return out;
        }

        std::vector<cell_row> header(sh.rows.begin(), sh.rows.begin() + HEADER_ROW_COUNT);
        for (size_t r = 0; r < HEADER_ROW_COUNT; ++r)
        {
            size_t before = header[r].size();
            bool dropped = detail::align_cells(header[r], width);

            if (before < width || dropped)
            {
                out.errors.push_back({
                    schema_error_kind::header_misaligned,
                    severity::info,
                    { sh.name, r + 1, npos(), {} },
                    "header row '" + std::string(detail::header_row_name(r)) + "' has " + std::to_string(before) +
                        " cells, " + (before < width ? "padded" : "truncated") + " to " + std::to_string(width)
                });
            }
        }

        auto const & remarks  = header[static_cast<size_t>(header_row::remark)];
        auto const & headers  = header[static_cast<size_t>(header_row::header)];
        auto const & types    = header[static_cast<size_t>(header_row::type)];
        auto const & labels   = header[static_cast<size_t>(header_row::label)];
        auto const & names    = header[static_cast<size_t>(header_row::name)];
        auto const & defaults = header[static_cast<size_t>(header_row::default_value)];

        table_schema schema;
        schema.name = sh.name;
        schema.fields.reserve(width);

        for (size_t i = 0; i < width; ++i)
        {
            field_descriptor f;
            f.index    = i;
            f.raw_name = detail::trim(detail::stringify(names[i]));
            f.label    = detail::parse_label(detail::stringify(labels[i]));
            f.remark   = detail::trim(detail::stringify(remarks[i]));
            f.header   = detail::trim(detail::stringify(headers[i]));

            if (!detail::is_blank(defaults[i]))
                f.default_raw = defaults[i];

            auto tags = detail::parse_name_tags(f.raw_name);
            if (tags.problem)
            {
                fatal(schema_error_kind::header_format, static_cast<size_t>(header_row::name) + 1, i, f.raw_name, *tags.problem);
                continue;
            }
            f.key         = tags.key;
            f.reference   = std::move(tags.reference);
            f.actual_name = std::move(tags.actual);

            auto annotation = detail::stringify(types[i]);
            auto parsed = parse_type(annotation);
            if (parsed.result)
            {
                f.type = *parsed.result;
            }
            else if (f.is_key_column() || f.label != field_label::ignore)
            {
                fatal(schema_error_kind::header_format, static_cast<size_t>(header_row::type) + 1, i, f.raw_name,
                    parsed.errors.front().message);
                continue;
            }
            else
            {
                f.type.annotation = annotation;
            }

            if (f.type.kind == type_kind::custom
                && f.label != field_label::ignore
                && registry.policy() == fallback_policy::reject
                && !registry.contains(f.type.custom_name))
            {
                fatal(schema_error_kind::unknown_custom_type, static_cast<size_t>(header_row::type) + 1, i, f.raw_name,
                    "custom type '" + f.type.custom_name + "' is not registered and the structural fallback is disabled");
                continue;
            }

            // Only scalar values, list elements and map values can be looked up.
            if (f.reference && f.type.kind == type_kind::custom && f.label != field_label::ignore)
            {
                fatal(schema_error_kind::header_format, static_cast<size_t>(header_row::name) + 1, i, f.raw_name,
                    "reference tag " + f.reference->tag() + " on custom type '" + f.type.custom_name +
                        "'; references need a primitive, list or dict column");
                continue;
            }

            schema.fields.push_back(std::move(f));
        }

        if (out.has_fatal())
            return out;

        // Duplicate raw names, all of them in one report.
        auto raw_dupes = detail::duplicate_report(schema.fields, [](field_descriptor const & f) -> std::string const &
        {
            return f.raw_name;
        });
        if (!raw_dupes.empty())
        {
            fatal(schema_error_kind::duplicate_field, static_cast<size_t>(header_row::name) + 1, npos(), {},
                "duplicate field names: " + raw_dupes);
            return out;
        }

        // Tags are stripped before export; "[T]x" and "x" would both write "x".
        auto exported_dupes = detail::duplicate_report(schema.fields, [](field_descriptor const & f) -> std::string const &
        {
            static const std::string skip;
            return f.is_exported() ? f.actual_name : skip;
        });
        if (!exported_dupes.empty())
        {
            fatal(schema_error_kind::duplicate_field, static_cast<size_t>(header_row::name) + 1, npos(), {},
                "fields export under the same name: " + exported_dupes);
            return out;
        }

        // Identifier legality; the first offender stops the table.
        for (auto const & f : schema.fields)
        {
            if (!f.is_exported())
                continue;

            std::string why;
            if (!detail::is_symbol_name(f.actual_name))
                why = "is not a legal identifier";
            else if (detail::is_reserved_word(f.actual_name))
                why = "is a reserved word";
            else if (f.actual_name == "id")
                why = "is reserved for the derived key";

            if (!why.empty())
            {
                fatal(schema_error_kind::invalid_field_name, static_cast<size_t>(header_row::name) + 1, f.index, f.raw_name,
                    "field name '" + f.actual_name + "' in column " + std::to_string(f.index) +
                        " of table '" + sh.name + "' " + why);
                return out;
            }
        }

        schema.policy = detect_key_policy(schema.fields, out.errors, sh.name);
        out.result = std::move(schema);
        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_SCHEMA_HPP
