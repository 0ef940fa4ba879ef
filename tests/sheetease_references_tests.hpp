#ifndef SHEETEASE_TESTS_REFERENCES__
#define SHEETEASE_TESTS_REFERENCES__

#include "sheetease_test_harness.hpp"

namespace sheetease::tests
{

static record_set orders_table()
{
    record_set t;
    t.table = "Orders";
    for (int id : { 1, 2, 3 })
    {
        value rec = value::object();
        rec["id"]    = id;
        rec["label"] = "order-" + std::to_string(id);
        t.document[std::to_string(id)] = rec;
    }
    return t;
}

static reference_item item(std::string field, std::string declared, value v, std::string target, std::optional<std::string> target_field = std::nullopt)
{
    reference_item it;
    it.source_table = "Invoices";
    it.row          = 7;
    it.field        = std::move(field);
    it.target       = { std::move(target), std::move(target_field) };
    it.declared     = *parse_type(declared).result;
    it.val          = std::move(v);
    return it;
}

static bool missing_reference_reported_once()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({ item("order", "int", 7, "Orders") });
    EXPECT(ctx.errors.size() == 1, "expected exactly one finding");
    EXPECT(ctx.errors[0].kind == reference_error_kind::missing_value, "wrong error kind");
    EXPECT(contains_text(ctx.errors[0].message, "7") && contains_text(ctx.errors[0].message, "[Orders]"), "value or tag not named");
    EXPECT(ctx.errors[0].loc.table == "Invoices" && ctx.errors[0].loc.row == 7 && ctx.errors[0].loc.field == "order", "source location lost");
    EXPECT(ctx.errors[0].level == severity::recoverable, "reference finding should be recoverable");
    EXPECT(ctx.result.checked == 1 && ctx.result.failed == 1, "report counts wrong");
    return true;
}

static bool present_references_pass()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({
        item("order", "int", 2, "Orders"),
        item("order", "float", 3.0, "Orders"),
        item("label", "string", "order-1", "Orders", "label"),
    });
    EXPECT(!ctx.has_errors(), "present values reported");
    EXPECT(ctx.result.checked == 3, "values not checked");
    return true;
}

static bool sentinels_are_skipped()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    export_options options;
    options.empty_int_refs    = { 0, -1 };
    options.empty_string_refs = { "", "none" };

    auto ctx = index.check({
        item("order", "int", 0, "Orders"),
        item("order", "int", -1, "Orders"),
        item("label", "string", "none", "Orders", "label"),
        item("label", "string", "", "Orders", "label"),
    }, options);

    EXPECT(!ctx.has_errors(), "sentinel reported");
    EXPECT(ctx.result.skipped == 4 && ctx.result.checked == 0, "sentinels not skipped");
    return true;
}

static bool list_elements_checked_individually()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({ item("orders", "list(int)", value::parse("[1, 5, 0, 9]"), "Orders") });
    EXPECT(count_kind(ctx.errors, reference_error_kind::missing_value) == 2, "expected 5 and 9 missing");
    EXPECT(ctx.result.checked == 3 && ctx.result.skipped == 1, "element counts wrong");
    return true;
}

static bool map_values_checked()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({ item("by_slot", "dict(string,int)", value::parse(R"({"a": 1, "b": 4})"), "Orders") });
    EXPECT(count_kind(ctx.errors, reference_error_kind::missing_value) == 1, "map value not checked");
    EXPECT(contains_text(ctx.errors[0].message, "4"), "wrong value reported");
    return true;
}

static bool kind_mismatch_is_per_value()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({ item("code", "Game.Ref", "abc", "Orders") });
    EXPECT(count_kind(ctx.errors, reference_error_kind::kind_mismatch) == 1, "kind mismatch not reported");
    EXPECT(!has_kind(ctx.errors, reference_error_kind::missing_value), "mismatch also reported as missing");
    return true;
}

static bool declared_type_mismatch_reported_once_per_field()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({
        item("codes", "list(string)", value::parse(R"(["x"])"), "Orders"),
        item("codes", "list(string)", value::parse(R"(["y"])"), "Orders"),
    });

    EXPECT(count_kind(ctx.errors, reference_error_kind::declared_type_mismatch) == 1, "field mismatch not reported exactly once");
    EXPECT(count_kind(ctx.errors, reference_error_kind::kind_mismatch) == 2, "per-value checks skipped");
    return true;
}

static bool missing_target_is_skipped_with_warning()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({
        item("shop", "int", 1, "Shops"),
        item("shop", "int", 2, "Shops"),
    });

    EXPECT(count_kind(ctx.errors, reference_error_kind::missing_target) == 1, "missing target not reported once");
    EXPECT(ctx.errors[0].level == severity::recoverable, "missing target should not be fatal");
    EXPECT(ctx.result.skipped == 2, "items not skipped");
    return true;
}

static bool missing_target_field_is_skipped()
{
    std::vector<record_set> tables{ orders_table() };
    reference_index index(tables);

    auto ctx = index.check({ item("x", "int", 1, "Orders", "weight") });
    EXPECT(has_kind(ctx.errors, reference_error_kind::missing_target_field), "missing field not reported");
    return true;
}

static bool loader_results_are_cached()
{
    std::vector<record_set> tables;
    size_t calls = 0;

    reference_index index(tables, [&](std::string const & table) -> std::optional<value>
    {
        ++calls;
        if (table != "Orders")
            return std::nullopt;
        return orders_table().document;
    });

    auto ctx = index.check({
        item("a", "int", 1, "Orders"),
        item("b", "int", 4, "Orders"),
        item("c", "int", 1, "Shops"),
        item("d", "int", 1, "Shops"),
    });

    EXPECT(calls == 2, "each target should be loaded once");
    EXPECT(count_kind(ctx.errors, reference_error_kind::missing_value) == 1, "loaded target not used");
    return true;
}

static bool default_field_is_id_when_exported_last()
{
    export_options options;
    options.id_first = false;

    auto sh = make_sheet("Orders", { { "int", "id" }, { "string", "label" } }, {
        { num(1), txt("first") },
        { num(2), txt("second") },
    });
    auto orders = build_table(sh, custom_type_registry{}, options);
    EXPECT(orders.result.built(), "orders not built");
    EXPECT(orders.result.records->document["1"].begin().key() == "label", "id not placed last");

    std::vector<record_set> tables{ *orders.result.records };
    reference_index index(tables);

    auto ctx = index.check({
        item("order", "int", 2, "Orders"),
        item("order", "int", 7, "Orders"),
    }, options);

    EXPECT(ctx.errors.size() == 1, "expected exactly one finding");
    EXPECT(ctx.errors[0].kind == reference_error_kind::missing_value, "tag not resolved against id");
    EXPECT(contains_text(ctx.errors[0].message, "7"), "wrong value reported");
    return true;
}

static bool default_field_scans_targets_without_id()
{
    record_set tags;
    tags.table = "Tags";
    tags.document["0"] = value::parse(R"({"list": [1], "empty": "", "code": "fire"})");
    tags.document["1"] = value::parse(R"({"list": [], "empty": "", "code": "ice"})");

    std::vector<record_set> tables{ tags };
    reference_index index(tables);

    auto ctx = index.check({
        item("tag", "string", "ice", "Tags"),
        item("tag", "string", "mud", "Tags"),
    });
    EXPECT(count_kind(ctx.errors, reference_error_kind::missing_value) == 1, "first scalar field not chosen");
    return true;
}

//----------------------------------------------------------------------------

inline void run_references_tests()
{
    RUN_TEST(missing_reference_reported_once);
    RUN_TEST(present_references_pass);
    RUN_TEST(sentinels_are_skipped);
    RUN_TEST(list_elements_checked_individually);
    RUN_TEST(map_values_checked);
    RUN_TEST(kind_mismatch_is_per_value);
    RUN_TEST(declared_type_mismatch_reported_once_per_field);
    RUN_TEST(missing_target_is_skipped_with_warning);
    RUN_TEST(missing_target_field_is_skipped);
    RUN_TEST(loader_results_are_cached);
    RUN_TEST(default_field_is_id_when_exported_last);
    RUN_TEST(default_field_scans_targets_without_id);
}

}

#endif
