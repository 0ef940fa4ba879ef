#ifndef SHEETEASE_TESTS_DESCRIBE__
#define SHEETEASE_TESTS_DESCRIBE__

#include "sheetease_test_harness.hpp"

namespace sheetease::tests
{

static std::optional<table_description> description_of(sheet const & sh)
{
    auto table = build_table(sh, custom_type_registry{});
    return table.result.description;
}

static bool properties_follow_exported_columns()
{
    auto sh = make_sheet("Heroes", {
        { "int",               "id" },
        { "string",            "name",   "", nil(), "Name", "shown in menus" },
        { "list(int)",         "skills", "", nil(), "Skills" },
        { "dict(string,float)", "stats" },
        { "Math.Vec3",         "spawn" },
        { "string",            "memo",   "ignore" },
    }, { { num(1), txt("Ayla") } });

    auto d = description_of(sh);
    EXPECT(d, "no description");
    EXPECT(d->info_type == "HeroesInfo" && d->access_type == "HeroesConfig", "type names wrong");
    EXPECT(d->variant == access_variant::plain, "wrong access variant");
    EXPECT(d->properties.size() == 4, "key or ignored column described");

    EXPECT(d->properties[0].type_name == "string", "string type name wrong");
    EXPECT(d->properties[0].summary == "Name: shown in menus", "summary not 'header: remark'");
    EXPECT(d->properties[1].type_name == "List<int>", "list type name wrong");
    EXPECT(d->properties[1].summary == "Skills", "summary without remark wrong");
    EXPECT(d->properties[2].type_name == "Dictionary<string, float>", "dict type name wrong");
    EXPECT(d->properties[3].type_name == "Math.Vec3", "custom type name wrong");
    return true;
}

static bool enum_tables_describe_their_keys()
{
    auto sh = make_sheet("Colors", { { "string", "key" }, { "int", "rgb" } }, {
        { txt("Red"),  num(1) },
        { txt("Blue"), num(2) },
    });

    auto d = description_of(sh);
    EXPECT(d && d->variant == access_variant::keyed, "wrong access variant");
    EXPECT(d->keys_enum && d->keys_enum->name == "ColorsKeys", "keys enum missing");
    EXPECT(d->keys_enum->members.size() == 2, "wrong member count");
    EXPECT(d->keys_enum->members[1].name == "Blue" && d->keys_enum->members[1].value == 1, "member wrong");
    return true;
}

static bool composite_tables_carry_multiplier()
{
    auto sh = make_sheet("Stages", { { "int", "id" }, { "int", "key1:chapter" }, { "int", "key2:stage" } }, {
        { num(0), num(1), num(1) },
    });

    auto d = description_of(sh);
    EXPECT(d && d->variant == access_variant::composite, "wrong access variant");
    EXPECT(d->composite_multiplier == std::optional<int64_t>(46340), "multiplier missing");
    EXPECT(d->key1_name == "chapter" && d->key2_name == "stage", "key names missing");
    EXPECT(!d->keys_enum, "composite table has a keys enum");
    return true;
}

static bool enum_sheets_are_described()
{
    sheet sh{ "Enum-Rarity", {
        { txt("name"),   txt("value"), txt("remark") },
        { txt("Common"), num(0),       txt("most items") },
        { txt("Rare"),   num(5) },
        { },
        { txt("Epic"),   txt("10") },
    } };

    EXPECT(is_enum_sheet(sh), "prefix not recognised");

    auto ctx = describe_enum_sheet(sh);
    EXPECT(!ctx.has_errors() && ctx.result, "enum not described");
    EXPECT(ctx.result->name == "Rarity", "prefix not stripped");
    EXPECT(ctx.result->members.size() == 3, "blank row not skipped");
    EXPECT(ctx.result->members[0].remark == "most items", "remark lost");
    EXPECT(ctx.result->members[2].value == 10, "text value not parsed");
    return true;
}

static bool enum_sheet_errors_are_fatal_for_that_enum()
{
    sheet sh{ "Enum-Rarity", {
        { txt("name"),   txt("value") },
        { txt("Common"), num(0) },
        { txt("Common"), num(1) },
        { txt("new"),    num(2) },
        { txt("Odd"),    num(2.5) },
    } };

    auto ctx = describe_enum_sheet(sh);
    EXPECT(!ctx.result, "broken enum described");
    EXPECT(has_kind(ctx.errors, key_error_kind::duplicate_enum_key), "duplicate member accepted");
    EXPECT(has_kind(ctx.errors, key_error_kind::invalid_enum_name), "reserved member name accepted");
    EXPECT(has_kind(ctx.errors, key_error_kind::invalid_integer_key), "fractional value accepted");
    return true;
}

//----------------------------------------------------------------------------

inline void run_describe_tests()
{
    RUN_TEST(properties_follow_exported_columns);
    RUN_TEST(enum_tables_describe_their_keys);
    RUN_TEST(composite_tables_carry_multiplier);
    RUN_TEST(enum_sheets_are_described);
    RUN_TEST(enum_sheet_errors_are_fatal_for_that_enum);
}

}

#endif
