#ifndef SHEETEASE_TESTS_REGISTRY__
#define SHEETEASE_TESTS_REGISTRY__

#include "sheetease_test_harness.hpp"

#include <stdexcept>

namespace sheetease::tests
{

static custom_type_registry vector_registry(fallback_policy policy = fallback_policy::structural)
{
    custom_type_registry registry(policy);
    registry.add("Math.Vec2", [](cell_value const & raw) -> value
    {
        auto parts = detail::split(detail::stringify(raw), ',');
        if (parts.size() != 2)
            throw std::invalid_argument("expected two components");

        value out = value::object();
        out["x"] = std::stod(detail::trim(parts[0]));
        out["y"] = std::stod(detail::trim(parts[1]));
        return out;
    });
    return registry;
}

static size_t count_any_record(std::vector<any_error> const & errors, record_error_kind kind)
{
    return static_cast<size_t>(std::count_if(errors.begin(), errors.end(), [&](any_error const & e)
    {
        return is_record_error(e) && get_record_error(e) == kind;
    }));
}

static bool registered_parser_is_used()
{
    auto registry = vector_registry();
    auto type = parse_type("Math.Vec2").result;

    auto ctx = convert(*type, txt("1.5, 2"), registry, { "Units", 7, 3, "pos" });
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result["x"] == 1.5 && ctx.result["y"] == 2.0, "parser result not returned");
    return true;
}

static bool parser_exception_is_wrapped()
{
    auto registry = vector_registry();
    auto ctx = registry.parse("Math.Vec2", txt("1,2,3"), { "Units", 8, 3, "pos" });

    EXPECT(ctx.has_errors(), "no error emitted");
    EXPECT(ctx.errors[0].kind == type_error_kind::custom_parse_failed, "wrong error kind");
    EXPECT(contains_text(ctx.errors[0].message, "expected two components"), "original reason lost");
    EXPECT(contains_text(ctx.errors[0].message, "pos") && contains_text(ctx.errors[0].message, "Units"), "field or table missing");
    EXPECT(ctx.result.is_null(), "failed parse should be null");
    return true;
}

static bool non_standard_throw_is_reported()
{
    custom_type_registry registry;
    registry.add("Game.Vec", [](cell_value const &) -> value { throw 42; });

    auto sh = make_sheet("Units", { { "int", "id" }, { "Game.Vec", "pos" }, { "int", "hp" } }, {
        { num(1), txt("1,2"), num(30) },
    });

    auto table = build_table(sh, registry);
    EXPECT(table.result.built(), "row not continued after the parser failed");
    EXPECT(count_any_record(table.errors, record_error_kind::cell_conversion) == 1, "failure not reported");

    auto const & e = std::get<record_error>(table.errors[0]);
    EXPECT(e.level == severity::recoverable, "parser failure should be recoverable");
    EXPECT(contains_text(e.message, "unknown exception") && contains_text(e.message, "Units"), "reason or table missing");

    auto const & rec = table.result.records->document["1"];
    EXPECT(rec["pos"].is_null() && rec["hp"] == 30, "record content wrong");
    return true;
}

static bool structural_fallback_for_unregistered()
{
    auto registry = vector_registry();
    auto ctx = registry.parse("Game.Loot", txt("sword # 3 #rare"), {});

    EXPECT(!ctx.has_errors(), "fallback emitted an error");
    EXPECT(ctx.result["type"] == "Game.Loot", "type name missing");
    EXPECT(ctx.result["raw"] == "sword # 3 #rare", "raw value missing");
    EXPECT(ctx.result["segments"] == value::parse(R"(["sword","3","rare"])"), "segments not split and trimmed");
    return true;
}

static bool structural_fallback_keeps_numbers()
{
    auto registry = vector_registry();
    auto ctx = registry.parse("Game.Level", num(12), {});

    EXPECT(ctx.result["raw"] == 12, "raw number not kept");
    EXPECT(ctx.result["segments"] == value::parse(R"(["12"])"), "number not stringified into segments");

    auto empty = registry.parse("Game.Level", nil(), {});
    EXPECT(empty.result["raw"].is_null(), "null raw not kept");
    EXPECT(empty.result["segments"].empty(), "null produced segments");
    return true;
}

static bool rejecting_registry_reports_unknown()
{
    auto registry = vector_registry(fallback_policy::reject);
    auto ctx = registry.parse("Game.Loot", txt("sword"), { "Chests", 9, 2, "loot" });

    EXPECT(ctx.has_errors(), "unknown type accepted");
    EXPECT(ctx.errors[0].kind == type_error_kind::unknown_custom_type, "wrong error kind");
    EXPECT(ctx.errors[0].level == severity::fatal, "unknown type should be fatal");
    EXPECT(contains_text(ctx.errors[0].message, "loot") && contains_text(ctx.errors[0].message, "Chests"), "field or table missing");
    return true;
}

static bool registry_lists_names()
{
    auto registry = vector_registry();
    registry.add("A.B", [](cell_value const &) { return value(1); });

    EXPECT(registry.contains("A.B") && registry.contains("Math.Vec2"), "registered name missing");
    EXPECT(!registry.contains("Math.Vec3"), "unregistered name reported");
    EXPECT(registry.names() == std::vector<std::string>({ "A.B", "Math.Vec2" }), "names not sorted");
    return true;
}

//----------------------------------------------------------------------------

inline void run_registry_tests()
{
    RUN_TEST(registered_parser_is_used);
    RUN_TEST(parser_exception_is_wrapped);
    RUN_TEST(non_standard_throw_is_reported);
    RUN_TEST(structural_fallback_for_unregistered);
    RUN_TEST(structural_fallback_keeps_numbers);
    RUN_TEST(rejecting_registry_reports_unknown);
    RUN_TEST(registry_lists_names);
}

}

#endif
