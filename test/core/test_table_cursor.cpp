#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/TableCursor.hpp"

#include <map>

using namespace dsearch;
using namespace dsearch::test;

namespace {

void load_sites(FeatureStore& store) {
    make_layer(store, "mem:data/Sites", wkbPoint, {
        FieldInfo("Name", FieldType::STRING, 20),
        FieldInfo("Type", FieldType::STRING, 20),
        FieldInfo("Score", FieldType::INTEGER),
    }, {
        {"POINT (0 0)", {std::string("delta"), std::string("Wood"), std::int64_t{5}}},
        {"POINT (1 0)", {std::string("Alpha"), std::string("heath"), std::int64_t{12}}},
        {"POINT (2 0)", {std::string("charlie"), std::string("Wood"), std::int64_t{1}}},
        {"POINT (3 0)", {std::string("Bravo"), std::string("Heath"), std::int64_t{12}}},
    }, "Sites");
}

std::vector<std::string> visit_names(TableCursor& cursor) {
    std::vector<std::string> names;
    cursor.for_each([&](const OGRFeature& feature) {
        names.push_back(feature.GetFieldAsString("Name"));
    });
    return names;
}

} // anonymous namespace

TEST_CASE("compare_values") {
    const FieldValue null;
    REQUIRE(compare_values(null, null) == 0);
    REQUIRE(compare_values(null, FieldValue{std::int64_t{-5}}) < 0);
    REQUIRE(compare_values(FieldValue{2.5}, FieldValue{std::int64_t{3}}) < 0);
    REQUIRE(compare_values(FieldValue{std::int64_t{3}}, FieldValue{3.0}) == 0);
    REQUIRE(compare_values(FieldValue{std::int64_t{100}}, FieldValue{std::string("1")}) < 0);
    REQUIRE(compare_values(FieldValue{std::string("apple")}, FieldValue{std::string("Banana")}) < 0);
    REQUIRE(compare_values(FieldValue{std::string("WOOD")}, FieldValue{std::string("wood")}) == 0);
}

TEST_CASE("value_to_string") {
    REQUIRE(value_to_string(FieldValue{}).empty());
    REQUIRE(value_to_string(FieldValue{std::int64_t{-42}}) == "-42");
    REQUIRE(value_to_string(FieldValue{4.0}) == "4");
    REQUIRE(value_to_string(FieldValue{0.1}) == "0.1");
    REQUIRE(value_to_string(FieldValue{158.11388300841898}) == "158.113883008419");
    REQUIRE(value_to_string(FieldValue{std::string("Wood")}) == "Wood");
}

TEST_CASE("group keys differing only in case stay distinct") {
    std::map<std::vector<FieldValue>, int, FieldValueKeyLess> groups;
    groups[{std::string("Wood")}] = 1;
    groups[{std::string("wood")}] = 2;
    groups[{std::string("Heath")}] = 3;
    groups[{FieldValue{}}] = 4;

    REQUIRE(groups.size() == 4);
    auto it = groups.begin();
    REQUIRE(it->second == 4);
    REQUIRE((++it)->second == 3);
}

TEST_CASE("sort_order is stable and puts nulls and numbers first") {
    const std::vector<std::vector<FieldValue>> keys = {
        {std::string("b")},
        {std::string("A")},
        {FieldValue{}},
        {std::int64_t{2}},
        {std::int64_t{10}},
    };
    REQUIRE(TableCursor::sort_order(keys) == std::vector<size_t>{2, 3, 4, 1, 0});

    const std::vector<std::vector<FieldValue>> ties = {
        {std::string("x"), std::int64_t{2}},
        {std::string("X"), std::int64_t{1}},
        {std::string("x"), std::int64_t{1}},
    };
    REQUIRE(TableCursor::sort_order(ties) == std::vector<size_t>{1, 2, 0});
    REQUIRE(TableCursor::sort_order({}).empty());
}

TEST_CASE("cursor iteration") {
    FeatureStore store;
    load_sites(store);
    TableCursor cursor(store, "Sites");

    SECTION("store order without ordering columns") {
        REQUIRE(visit_names(cursor) == std::vector<std::string>{"delta", "Alpha", "charlie", "Bravo"});
    }

    SECTION("one ordering column") {
        REQUIRE(cursor.set_order("Name") == std::vector<std::string>{"Name"});
        REQUIRE(visit_names(cursor) == std::vector<std::string>{"Alpha", "Bravo", "charlie", "delta"});
    }

    SECTION("several columns, either delimiter, unknown ones skipped") {
        REQUIRE(cursor.set_order("Type;Bogus, Score") == std::vector<std::string>{"Type", "Score"});
        REQUIRE(visit_names(cursor) == std::vector<std::string>{"Alpha", "Bravo", "charlie", "delta"});
    }

    SECTION("only unknown columns fall back to store order") {
        REQUIRE(cursor.set_order("Bogus").empty());
        REQUIRE(visit_names(cursor).front() == "delta");
    }

    SECTION("selections are honoured") {
        Selection selected;
        store.visit_features("Sites", [&](OGRFeature& feature) {
            if (std::string(feature.GetFieldAsString("Type")) == "Wood") {
                selected.insert(feature.GetFID());
            }
        });
        store.set_selection("Sites", selected);
        cursor.set_order("Name");
        REQUIRE(visit_names(cursor) == std::vector<std::string>{"charlie", "delta"});
    }
}

TEST_CASE("cursor over a missing dataset") {
    FeatureStore store;
    TableCursor cursor(store, "mem:data/Nothing");

    REQUIRE(cursor.set_order("Name").empty());
    REQUIRE(cursor.for_each([](const OGRFeature&) {}) == -1);
}
