// sheetease_records.hpp - SheetEase - Record Builder
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_RECORDS_HPP
#define SHEETEASE_RECORDS_HPP

#include "sheetease_config.hpp"
#include "sheetease_keys.hpp"

#include <unordered_map>

namespace sheetease
{
    enum class record_error_kind
    {
        duplicate_primary_key,
        required_field_missing,
        cell_conversion,
        row_misaligned
    };

    using record_error = error<record_error_kind>;

    // A value that must exist in another table; checked after the batch.
    struct reference_item
    {
        std::string     source_table;
        size_t          row = 0;
        std::string     field;
        reference_tag   target;
        type_descriptor declared;
        value           val;
    };

    struct record_set
    {
        std::string                 table;
        value                       document = value::object();
        std::vector<reference_item> pending;
    };

    using record_context = context<std::optional<record_set>, record_error>;

    record_context build_records(
        table_schema const &         schema,
        std::vector<cell_row> const & data_rows,
        key_plan const &             plan,
        custom_type_registry const & registry,
        export_options const &       options = {}
    );

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline void add_references(
            field_descriptor const & f,
            std::string const &      table,
            size_t                   row,
            value const &            converted,
            std::vector<reference_item> & pending)
        {
            if (!f.reference)
                return;

            pending.push_back({ table, row, f.actual_name, *f.reference, f.type, converted });
        }
    }

    inline record_context build_records(
        table_schema const &         schema,
        std::vector<cell_row> const & data_rows,
        key_plan const &             plan,
        custom_type_registry const & registry,
        export_options const &       options
    )
    {
        record_context out{};
        record_set set;
        set.table = schema.name;

        size_t const width = schema.fields.size();
        std::unordered_map<int64_t, size_t> first_row;

        auto push = [&](record_error_kind kind, severity level, size_t row, std::string field, std::string message)
        {
            out.errors.push_back({ kind, level, { schema.name, row, npos(), std::move(field) }, std::move(message) });
        };

        for (size_t i = 0; i < data_rows.size() && i < plan.keys.size(); ++i)
        {
            auto const & key = plan.keys[i];
            size_t row = key.row;

            cell_row cells = data_rows[i];
            if (detail::align_cells(cells, width))
            {
                push(record_error_kind::row_misaligned, severity::info, row, {},
                    "cells beyond column " + std::to_string(width - 1) + " are ignored");
            }

            if (auto [it, inserted] = first_row.emplace(key.value, row); !inserted)
            {
                push(record_error_kind::duplicate_primary_key, severity::fatal, row, schema.fields.front().raw_name,
                    "duplicate primary key " + std::to_string(key.value) + " in rows " +
                        std::to_string(it->second) + " and " + std::to_string(row));
                continue;
            }

            value record = value::object();
            if (options.id_first)
                record["id"] = key.value;

            bool row_failed = false;
            for (auto const & f : schema.fields)
            {
                if (!f.is_exported())
                    continue;

                cell_value const * source = &cells[f.index];
                if (detail::is_blank(*source))
                {
                    if (f.default_raw)
                    {
                        source = &*f.default_raw;
                    }
                    else if (f.label == field_label::required)
                    {
                        push(record_error_kind::required_field_missing, severity::fatal, row, f.actual_name,
                            "required field '" + f.actual_name + "' is empty and has no default");
                        row_failed = true;
                        continue;
                    }
                    else
                    {
                        static const cell_value null_cell{};
                        source = &null_cell;
                    }
                }

                auto converted = convert(f.type, *source, registry, { schema.name, row, f.index, f.actual_name });
                if (converted.has_errors())
                {
                    for (auto const & e : converted.errors)
                    {
                        push(record_error_kind::cell_conversion,
                            e.level == severity::fatal ? severity::fatal : severity::recoverable,
                            row, f.actual_name,
                            "'" + detail::stringify(*source) + "': " + e.message);
                    }
                    record[f.actual_name] = nullptr;
                    continue;
                }

                detail::add_references(f, schema.name, row, converted.result, set.pending);
                record[f.actual_name] = std::move(converted.result);
            }

            if (!options.id_first)
                record["id"] = key.value;

            if (!row_failed)
                set.document[std::to_string(key.value)] = std::move(record);
        }

        if (!out.has_fatal())
            out.result = std::move(set);
        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_RECORDS_HPP
