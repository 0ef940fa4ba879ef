// sheetease_describe.hpp - SheetEase - Structural Descriptions
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// What a code generator needs to emit the record type, the data-access
// type and the key enum of a table. No code is generated here.

#ifndef SHEETEASE_DESCRIBE_HPP
#define SHEETEASE_DESCRIBE_HPP

#include "sheetease_keys.hpp"

#include <set>

namespace sheetease
{
    enum class access_variant
    {
        keyed,       // string_enum: lookup by generated enum
        composite,   // composite_int: lookup by (key1, key2)
        plain        // single_int: lookup by id
    };

    inline std::string to_string(access_variant v)
    {
        switch (v)
        {
            case access_variant::keyed:     return "keyed";
            case access_variant::composite: return "composite";
            case access_variant::plain:     return "plain";
        }
        return "plain";
    }

    struct property_description
    {
        std::string                  name;
        std::string                  type_name;
        std::string                  summary;
        std::optional<reference_tag> reference;
    };

    struct enum_member
    {
        std::string name;
        int64_t     value = 0;
        std::string remark;
    };

    struct enum_description
    {
        std::string              name;
        std::vector<enum_member> members;
    };

    struct table_description
    {
        std::string                       name;
        std::string                       info_type;
        std::string                       access_type;
        access_variant                    variant = access_variant::plain;
        std::vector<property_description> properties;
        std::optional<int64_t>            composite_multiplier;
        std::string                       key1_name;
        std::string                       key2_name;
        std::optional<enum_description>   keys_enum;
    };

    constexpr std::string_view ENUM_SHEET_PREFIX = "Enum-";

    inline bool is_enum_sheet(sheet const & sh)
    {
        return sh.name.starts_with(ENUM_SHEET_PREFIX);
    }

    using enum_context = context<std::optional<enum_description>, key_error>;

//========================================================================
// Implementation
//========================================================================

    // Type names as the generated access code spells them.
    inline std::string target_type_name(type_descriptor const & t)
    {
        switch (t.kind)
        {
            case type_kind::primitive: return to_string(t.element);
            case type_kind::list:      return "List<" + to_string(t.element) + ">";
            case type_kind::map:       return "Dictionary<" + to_string(t.key) + ", " + to_string(t.mapped) + ">";
            case type_kind::custom:    return t.custom_name;
            case type_kind::unresolved: break;
        }
        return "object";
    }

    inline table_description describe_table(table_schema const & schema, key_plan const & plan)
    {
        table_description d;
        d.name        = schema.name;
        d.info_type   = schema.name + "Info";
        d.access_type = schema.name + "Config";

        for (auto const & f : schema.fields)
        {
            if (!f.is_exported())
                continue;

            property_description p;
            p.name      = f.actual_name;
            p.type_name = target_type_name(f.type);
            p.summary   = f.remark.empty() ? f.header : f.header + ": " + f.remark;
            p.reference = f.reference;
            d.properties.push_back(std::move(p));
        }

        switch (plan.policy.kind)
        {
            case key_policy_kind::string_enum:
            {
                d.variant = access_variant::keyed;

                enum_description keys;
                keys.name = schema.name + "Keys";
                for (auto const & k : plan.keys)
                    keys.members.push_back({ k.symbol, k.value, {} });
                d.keys_enum = std::move(keys);
                break;
            }

            case key_policy_kind::composite_int:
                d.variant              = access_variant::composite;
                d.composite_multiplier = COMPOSITE_KEY_MULTIPLIER;
                d.key1_name            = plan.policy.key1_name;
                d.key2_name            = plan.policy.key2_name;
                break;

            case key_policy_kind::single_int:
                d.variant = access_variant::plain;
                break;
        }

        return d;
    }

    // Rows from the second on: name | value | remark. Blank rows are skipped.
    inline enum_context describe_enum_sheet(sheet const & sh)
    {
        enum_context out{};
        enum_description d;
        d.name = sh.name.substr(ENUM_SHEET_PREFIX.size());

        if (!detail::is_symbol_name(d.name) || detail::is_reserved_word(d.name))
        {
            out.errors.push_back({
                key_error_kind::invalid_enum_name,
                severity::fatal,
                { sh.name, npos(), npos(), {} },
                "enum sheet '" + sh.name + "' does not name a legal enum type"
            });
            return out;
        }

        std::set<std::string> seen;
        for (size_t r = 1; r < sh.rows.size(); ++r)
        {
            auto const & row = sh.rows[r];
            size_t line = r + 1;

            auto const & name_cell  = detail::cell_at(row, 0);
            auto const & value_cell = detail::cell_at(row, 1);
            if (detail::is_blank(name_cell) && detail::is_blank(value_cell))
                continue;

            auto name = detail::trim(detail::stringify(name_cell));
            if (!detail::is_identifier(name))
            {
                out.errors.push_back({
                    key_error_kind::invalid_enum_name,
                    severity::fatal,
                    { sh.name, line, 0, {} },
                    "'" + name + "' is not a legal enum member name"
                });
                continue;
            }

            if (!seen.insert(name).second)
            {
                out.errors.push_back({
                    key_error_kind::duplicate_enum_key,
                    severity::fatal,
                    { sh.name, line, 0, name },
                    "enum member '" + name + "' is defined twice"
                });
                continue;
            }

            auto v = detail::cell_to_integer(value_cell);
            if (!v)
            {
                out.errors.push_back({
                    key_error_kind::invalid_integer_key,
                    severity::fatal,
                    { sh.name, line, 1, name },
                    "value '" + detail::stringify(value_cell) + "' of enum member '" + name + "' is not an integer"
                });
                continue;
            }

            d.members.push_back({ name, *v, detail::trim(detail::stringify(detail::cell_at(row, 2))) });
        }

        if (!out.has_fatal())
            out.result = std::move(d);
        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_DESCRIBE_HPP
