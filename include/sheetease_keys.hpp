// sheetease_keys.hpp - SheetEase - Primary Key Derivation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_KEYS_HPP
#define SHEETEASE_KEYS_HPP

#include "sheetease_schema.hpp"

#include <limits>
#include <map>
#include <unordered_map>

namespace sheetease
{
    enum class key_error_kind
    {
        invalid_enum_name,
        duplicate_enum_key,
        composite_key_range,
        composite_key_overflow,
        duplicate_composite_key,
        invalid_integer_key,
        key_not_named_id,
        empty_table
    };

    using key_error = error<key_error_kind>;

    struct derived_key
    {
        int64_t     value = 0;
        size_t      row   = 0;      // spreadsheet row number
        std::string symbol;         // string_enum only
    };

    struct key_plan
    {
        key_policy               policy;
        std::vector<derived_key> keys;   // one per data row, in row order
    };

    using key_context = context<std::optional<key_plan>, key_error>;

    inline constexpr int64_t combine_key(int64_t key1, int64_t key2) noexcept
    {
        return key1 * COMPOSITE_KEY_MULTIPLIER + key2;
    }

    key_context derive_keys(table_schema const & schema, std::vector<cell_row> const & data_rows);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string row_list(std::vector<size_t> const & rows)
        {
            std::string out;
            for (auto r : rows)
            {
                if (!out.empty())
                    out += ", ";
                out += std::to_string(r);
            }
            return out;
        }

        inline void derive_enum_keys(table_schema const & schema, std::vector<cell_row> const & data_rows, key_context & out)
        {
            auto const & key_field = schema.fields.front().raw_name;
            key_plan plan{ schema.policy, {} };

            std::unordered_map<std::string, std::vector<size_t>> rows_of;
            std::vector<std::string> order;

            for (size_t i = 0; i < data_rows.size(); ++i)
            {
                size_t row = data_row_number(i);
                auto name = trim(stringify(cell_at(data_rows[i], 0)));

                if (!is_symbol_name(name))
                {
                    out.errors.push_back({
                        key_error_kind::invalid_enum_name,
                        severity::fatal,
                        { schema.name, row, 0, key_field },
                        "'" + name + "' is not a legal enum name"
                    });
                }
                else
                {
                    auto & rows = rows_of[name];
                    if (rows.empty())
                        order.push_back(name);
                    rows.push_back(row);
                }

                plan.keys.push_back({ static_cast<int64_t>(i), row, name });
            }

            for (auto const & name : order)
            {
                auto const & rows = rows_of[name];
                if (rows.size() < 2)
                    continue;

                out.errors.push_back({
                    key_error_kind::duplicate_enum_key,
                    severity::fatal,
                    { schema.name, rows[1], 0, key_field },
                    "duplicate key '" + name + "' in rows " + row_list(rows)
                });
            }

            if (!out.has_fatal())
                out.result = std::move(plan);
        }

        inline void derive_composite_keys(table_schema const & schema, std::vector<cell_row> const & data_rows, key_context & out)
        {
            key_plan plan{ schema.policy, {} };
            std::unordered_map<int64_t, size_t> first_row;

            for (size_t i = 0; i < data_rows.size(); ++i)
            {
                size_t row = data_row_number(i);
                auto const & k1_cell = cell_at(data_rows[i], 1);
                auto const & k2_cell = cell_at(data_rows[i], 2);
                auto k1 = cell_to_integer(k1_cell);
                auto k2 = cell_to_integer(k2_cell);

                if (!k1 || !k2)
                {
                    bool first = !k1;
                    out.errors.push_back({
                        key_error_kind::invalid_integer_key,
                        severity::fatal,
                        { schema.name, row, first ? size_t{1} : size_t{2}, first ? schema.policy.key1_name : schema.policy.key2_name },
                        "composite key part '" + stringify(first ? k1_cell : k2_cell) + "' is not an integer"
                    });
                    continue;
                }

                if (*k1 < 0 || *k1 >= COMPOSITE_KEY_MULTIPLIER || *k2 < 0 || *k2 >= COMPOSITE_KEY_MULTIPLIER)
                {
                    out.errors.push_back({
                        key_error_kind::composite_key_range,
                        severity::fatal,
                        { schema.name, row, npos(), {} },
                        "composite key (" + std::to_string(*k1) + ", " + std::to_string(*k2) + ") is outside [0, " +
                            std::to_string(COMPOSITE_KEY_MULTIPLIER) + ")"
                    });
                    continue;
                }

                auto combined = combine_key(*k1, *k2);
                if (combined >= COMPOSITE_KEY_LIMIT)
                {
                    out.errors.push_back({
                        key_error_kind::composite_key_overflow,
                        severity::fatal,
                        { schema.name, row, npos(), {} },
                        "composite key " + std::to_string(combined) + " does not fit below 2^31"
                    });
                    continue;
                }

                if (auto [it, inserted] = first_row.emplace(combined, row); !inserted)
                {
                    out.errors.push_back({
                        key_error_kind::duplicate_composite_key,
                        severity::fatal,
                        { schema.name, row, npos(), {} },
                        "composite key " + std::to_string(combined) + " (" + std::to_string(*k1) + ", " +
                            std::to_string(*k2) + ") appears in rows " + std::to_string(it->second) + " and " + std::to_string(row)
                    });
                    continue;
                }

                plan.keys.push_back({ combined, row, {} });
            }

            if (!out.has_fatal())
                out.result = std::move(plan);
        }

        inline void derive_single_keys(table_schema const & schema, std::vector<cell_row> const & data_rows, key_context & out)
        {
            auto const & key_field = schema.fields.front();
            key_plan plan{ schema.policy, {} };

            if (key_field.actual_name != "id")
            {
                out.errors.push_back({
                    key_error_kind::key_not_named_id,
                    severity::info,
                    { schema.name, npos(), 0, key_field.raw_name },
                    "first column is named '" + key_field.actual_name + "'; its values are still exported as 'id'"
                });
            }

            for (size_t i = 0; i < data_rows.size(); ++i)
            {
                size_t row = data_row_number(i);
                auto const & cell = cell_at(data_rows[i], 0);
                auto key = cell_to_integer(cell);

                if (!key
                    || *key < std::numeric_limits<int32_t>::min()
                    || *key > std::numeric_limits<int32_t>::max())
                {
                    out.errors.push_back({
                        key_error_kind::invalid_integer_key,
                        severity::fatal,
                        { schema.name, row, 0, key_field.raw_name },
                        "key '" + stringify(cell) + "' is not a 32-bit integer"
                    });
                    continue;
                }

                plan.keys.push_back({ *key, row, {} });
            }

            if (!out.has_fatal())
                out.result = std::move(plan);
        }
    }

    inline key_context derive_keys(table_schema const & schema, std::vector<cell_row> const & data_rows)
    {
        key_context out{};

        if (data_rows.empty())
        {
            out.errors.push_back({
                key_error_kind::empty_table,
                severity::info,
                { schema.name, npos(), npos(), {} },
                "table has no data rows"
            });
            out.result = key_plan{ schema.policy, {} };
            return out;
        }

        switch (schema.policy.kind)
        {
            case key_policy_kind::string_enum:
                detail::derive_enum_keys(schema, data_rows, out);
                break;

            case key_policy_kind::composite_int:
                detail::derive_composite_keys(schema, data_rows, out);
                break;

            case key_policy_kind::single_int:
                detail::derive_single_keys(schema, data_rows, out);
                break;
        }

        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_KEYS_HPP
