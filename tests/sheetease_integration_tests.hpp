#ifndef SHEETEASE_TESTS_INTEGRATION__
#define SHEETEASE_TESTS_INTEGRATION__

#include "sheetease_test_harness.hpp"

#include <filesystem>

namespace sheetease::tests
{

static sheet customers_sheet()
{
    return make_sheet("Customers", { { "int", "id" }, { "string", "name" } }, {
        { num(1), txt("Ada") },
        { num(2), txt("Grace") },
    });
}

static sheet orders_sheet()
{
    return make_sheet("Orders", { { "int", "id" }, { "int", "[Customers]customer" } }, {
        { num(1), num(1) },
        { num(2), num(7) },
        { num(3), num(0) },
    });
}

template <typename Kind>
size_t count_any(std::vector<any_error> const & errors, Kind kind)
{
    return static_cast<size_t>(std::count_if(errors.begin(), errors.end(), [&](any_error const & e)
    {
        auto const * typed = std::get_if<error<Kind>>(&e);
        return typed && typed->kind == kind;
    }));
}

static bool batch_reports_dangling_reference_once()
{
    std::vector<workbook> books{
        { "Orders.json",    { orders_sheet() } },
        { "Customers.json", { customers_sheet() } },
    };

    auto ctx = export_batch(books, custom_type_registry{});
    EXPECT(ctx.result.tables.size() == 2, "tables not built");
    EXPECT(count_any(ctx.errors, reference_error_kind::missing_value) == 1, "expected exactly one dangling reference");
    EXPECT(!ctx.has_fatal(), "reference finding treated as fatal");

    auto const & refs = ctx.result.references;
    EXPECT(refs.checked == 2 && refs.skipped == 1 && refs.failed == 1, "reference counts wrong");

    auto const & err = std::get<reference_error>(ctx.errors.back());
    EXPECT(err.loc.table == "Orders" && err.loc.row == 8 && err.loc.field == "customer", "dangling reference location wrong");
    return true;
}

static bool reference_tags_reach_descriptions()
{
    std::vector<workbook> books{ { "Orders.json", { orders_sheet() } } };

    auto ctx = build_batch(books, custom_type_registry{});
    EXPECT(ctx.result.descriptions.size() == 1, "description missing");

    auto const & prop = ctx.result.descriptions[0].properties[0];
    EXPECT(prop.name == "customer" && prop.reference && prop.reference->tag() == "[Customers]", "reference tag lost");
    EXPECT(ctx.result.pending.size() == 3, "reference items not collected");
    return true;
}

static bool duplicate_table_names_conflict()
{
    std::vector<workbook> books{
        { "a/Customers.json", { customers_sheet() } },
        { "b/Customers.json", { customers_sheet() } },
    };

    auto ctx = build_batch(books, custom_type_registry{});
    EXPECT(count_any(ctx.errors, schema_error_kind::sheet_name_conflict) == 1, "conflict not reported");
    EXPECT(ctx.result.tables.size() == 1, "second definition built");

    auto const & err = std::get<schema_error>(ctx.errors[0]);
    EXPECT(contains_text(err.message, "a/Customers.json") && contains_text(err.message, "b/Customers.json"), "both origins not named");
    return true;
}

static bool fatal_table_does_not_stop_batch()
{
    auto broken = make_sheet("Broken", { { "int", "id" } }, { { num(1) }, { num(1) } });

    std::vector<workbook> books{
        { "Broken.json",    { broken } },
        { "Customers.json", { customers_sheet() } },
    };

    auto ctx = export_batch(books, custom_type_registry{});
    EXPECT(ctx.has_fatal(), "duplicate key not fatal");
    EXPECT(count_any(ctx.errors, record_error_kind::duplicate_primary_key) == 1, "duplicate key not reported");
    EXPECT(ctx.result.tables.size() == 1 && ctx.result.tables[0].table == "Customers", "healthy table not built");
    return true;
}

static bool enum_sheets_travel_with_workbooks()
{
    sheet rarity{ "Enum-Rarity", {
        { txt("name"),   txt("value") },
        { txt("Common"), num(0) },
        { txt("Rare"),   num(1) },
    } };

    std::vector<workbook> books{
        { "Customers.json", { customers_sheet(), rarity } },
        { "Loot.json",      { rarity } },
    };

    auto ctx = build_batch(books, custom_type_registry{});
    EXPECT(ctx.result.tables.size() == 1, "enum-only workbook built as a table");
    EXPECT(ctx.result.enums.size() == 1 && ctx.result.enums[0].name == "Rarity", "enum not described");
    EXPECT(count_any(ctx.errors, schema_error_kind::sheet_name_conflict) == 1, "repeated enum not reported");
    return true;
}

static bool targets_load_from_previous_exports()
{
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "sheetease_tests_loader";
    std::error_code ec;
    fs::remove_all(dir, ec);

    export_options options;
    auto customers = build_table(customers_sheet(), custom_type_registry{}, options);
    EXPECT(customers.result.built(), "customers not built");

    artifact_writer writer(options.diff_only, false);
    auto written = writer.write(dir / file_name(options.json_file_pattern, "Customers"), render_document(*customers.result.records, options));
    EXPECT(written.status == write_status::written, "customers not written");

    std::vector<workbook> books{ { "Orders.json", { orders_sheet() } } };
    auto ctx = export_batch(books, custom_type_registry{}, options, file_target_loader(dir.string(), options));
    EXPECT(count_any(ctx.errors, reference_error_kind::missing_value) == 1, "loaded target not checked");
    EXPECT(count_any(ctx.errors, reference_error_kind::missing_target) == 0, "exported target not found");

    fs::remove_all(dir, ec);
    return true;
}

//----------------------------------------------------------------------------

inline void run_integration_tests()
{
    RUN_TEST(batch_reports_dangling_reference_once);
    RUN_TEST(reference_tags_reach_descriptions);
    RUN_TEST(duplicate_table_names_conflict);
    RUN_TEST(fatal_table_does_not_stop_batch);
    RUN_TEST(enum_sheets_travel_with_workbooks);
    RUN_TEST(targets_load_from_previous_exports);
}

}

#endif
