// sheetease.hpp - SheetEase
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// SheetEase Pipeline:
//========================================================================
//
// Stage 1: Build
// --------------
// Every table is built on its own: schema, primary keys, records.
// A fatal error stops that table and nothing else. References are
// collected, not resolved.
//
//
// Stage 2: Cross-reference
// ------------------------
// Runs once every table of the batch has been built. Reference
// values are looked up in their target tables. Findings are
// warnings; the documents stand as produced.
//
//========================================================================

#ifndef SHEETEASE_SHEETEASE_HPP
#define SHEETEASE_SHEETEASE_HPP

#include "sheetease_core.hpp"
#include "sheetease_types.hpp"
#include "sheetease_registry.hpp"
#include "sheetease_config.hpp"
#include "sheetease_schema.hpp"
#include "sheetease_keys.hpp"
#include "sheetease_records.hpp"
#include "sheetease_references.hpp"
#include "sheetease_describe.hpp"
#include "sheetease_serializer.hpp"
#include "sheetease_source.hpp"

#include <map>

namespace sheetease
{
//========================================================================
// Pipeline errors
//========================================================================

    using any_error = std::variant<
        schema_error,
        key_error,
        record_error,
        reference_error,
        source_error,
        config_error
    >;

    inline bool is_schema_error(any_error const & e)    { return std::holds_alternative<schema_error>(e); }
    inline bool is_key_error(any_error const & e)       { return std::holds_alternative<key_error>(e); }
    inline bool is_record_error(any_error const & e)    { return std::holds_alternative<record_error>(e); }
    inline bool is_reference_error(any_error const & e) { return std::holds_alternative<reference_error>(e); }
    inline bool is_source_error(any_error const & e)    { return std::holds_alternative<source_error>(e); }
    inline bool is_config_error(any_error const & e)    { return std::holds_alternative<config_error>(e); }

    inline schema_error_kind    get_schema_error(any_error const & e)    { return std::get<schema_error>(e).kind; }
    inline key_error_kind       get_key_error(any_error const & e)       { return std::get<key_error>(e).kind; }
    inline record_error_kind    get_record_error(any_error const & e)    { return std::get<record_error>(e).kind; }
    inline reference_error_kind get_reference_error(any_error const & e) { return std::get<reference_error>(e).kind; }
    inline source_error_kind    get_source_error(any_error const & e)    { return std::get<source_error>(e).kind; }
    inline config_error_kind    get_config_error(any_error const & e)    { return std::get<config_error>(e).kind; }

    template <typename Kind>
    void append_errors(std::vector<any_error> & out, std::vector<error<Kind>> const & errors)
    {
        out.reserve(out.size() + errors.size());
        for (auto const & e : errors)
            out.emplace_back(e);
    }

//========================================================================
// Stage 1: tables
//========================================================================

    struct table_result
    {
        std::optional<table_schema>      schema;
        std::optional<key_plan>          plan;
        std::optional<record_set>        records;
        std::optional<table_description> description;

        bool built() const noexcept { return records.has_value(); }
    };

    using table_context = context<table_result, any_error>;

    inline std::vector<cell_row> data_rows_of(sheet const & sh)
    {
        if (sh.rows.size() <= HEADER_ROW_COUNT)
            return {};
        return std::vector<cell_row>(sh.rows.begin() + HEADER_ROW_COUNT, sh.rows.end());
    }

    inline table_context build_table(sheet const & sh, custom_type_registry const & registry, export_options const & options = {})
    {
        table_context out{};

        auto schema_ctx = build_schema(sh, registry);
        append_errors(out.errors, schema_ctx.errors);
        if (schema_ctx.has_fatal() || !schema_ctx.result)
            return out;
        out.result.schema = std::move(schema_ctx.result);

        auto rows = data_rows_of(sh);

        auto key_ctx = derive_keys(*out.result.schema, rows);
        append_errors(out.errors, key_ctx.errors);
        if (key_ctx.has_fatal() || !key_ctx.result)
            return out;
        out.result.plan = std::move(key_ctx.result);

        auto record_ctx = build_records(*out.result.schema, rows, *out.result.plan, registry, options);
        append_errors(out.errors, record_ctx.errors);
        if (record_ctx.has_fatal() || !record_ctx.result)
            return out;
        out.result.records = std::move(record_ctx.result);

        out.result.description = describe_table(*out.result.schema, *out.result.plan);
        return out;
    }

//========================================================================
// Batches
//========================================================================

    struct batch_result
    {
        std::vector<record_set>        tables;
        std::vector<table_description> descriptions;
        std::vector<enum_description>  enums;
        std::vector<reference_item>    pending;
        reference_report               references;
    };

    using batch_context = context<batch_result, any_error>;

    inline batch_context build_batch(std::vector<workbook> const & books, custom_type_registry const & registry, export_options const & options = {})
    {
        batch_context out{};
        auto & batch = out.result;

        std::map<std::string, std::string> table_origin;
        std::map<std::string, std::string> enum_origin;

        auto conflict = [&](std::string const & name, std::string const & first, std::string const & second)
        {
            out.errors.emplace_back(schema_error{
                schema_error_kind::sheet_name_conflict,
                severity::fatal,
                { name, npos(), npos(), {} },
                "'" + name + "' is defined in both " + first + " and " + second
            });
        };

        for (auto const & book : books)
        {
            auto const * table_sheet = book.main_sheet();
            if (!table_sheet)
                continue;

            if (!is_enum_sheet(*table_sheet))
            {
                if (auto [it, inserted] = table_origin.emplace(table_sheet->name, book.origin); !inserted)
                {
                    conflict(table_sheet->name, it->second, book.origin);
                }
                else
                {
                    auto table = build_table(*table_sheet, registry, options);
                    out.errors.insert(out.errors.end(), table.errors.begin(), table.errors.end());

                    if (table.result.built())
                    {
                        auto & records = *table.result.records;
                        batch.pending.insert(batch.pending.end(), records.pending.begin(), records.pending.end());
                        batch.descriptions.push_back(std::move(*table.result.description));
                        batch.tables.push_back(std::move(records));
                    }
                }
            }

            for (auto const & sh : book.sheets)
            {
                if (!is_enum_sheet(sh))
                    continue;

                auto name = sh.name.substr(ENUM_SHEET_PREFIX.size());
                if (auto [it, inserted] = enum_origin.emplace(name, book.origin); !inserted)
                {
                    conflict(sh.name, it->second, book.origin);
                    continue;
                }

                auto en = describe_enum_sheet(sh);
                append_errors(out.errors, en.errors);
                if (en.result)
                    batch.enums.push_back(std::move(*en.result));
            }
        }

        return out;
    }

//========================================================================
// Stage 2: references
//========================================================================

    // Only call once build_batch has returned for the whole batch.
    inline void check_batch_references(batch_context & ctx, export_options const & options = {}, target_loader loader = {})
    {
        reference_index index(ctx.result.tables, std::move(loader));
        auto refs = index.check(ctx.result.pending, options);
        append_errors(ctx.errors, refs.errors);
        ctx.result.references = refs.result;
    }

    inline batch_context export_batch(
        std::vector<workbook> const & books,
        custom_type_registry const &  registry,
        export_options const &        options = {},
        target_loader                 loader = {}
    )
    {
        auto ctx = build_batch(books, registry, options);
        check_batch_references(ctx, options, std::move(loader));
        return ctx;
    }

} // namespace sheetease

#endif // SHEETEASE_SHEETEASE_HPP
