#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/DerivedFieldCalculator.hpp"

using namespace dsearch;
using namespace dsearch::test;

TEST_CASE("area expressions per unit") {
    REQUIRE(DerivedFieldCalculator::area_expression(AreaUnit::HECTARES) == "!SHAPE.AREA@HECTARES!");
    REQUIRE(DerivedFieldCalculator::area_expression(AreaUnit::SQUARE_METERS) == "!SHAPE.AREA@SQUAREMETERS!");
    REQUIRE(DerivedFieldCalculator::area_expression(AreaUnit::SQUARE_KILOMETERS) ==
            "!SHAPE.AREA@SQUAREKILOMETERS!");
}

TEST_CASE("area of polygon datasets") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);
    make_layer(store, "mem:data/Sites", wkbPolygon, {FieldInfo("Name", FieldType::STRING, 10)}, {
        {square(0, 0, 200), {std::string("Big")}},
        {square(500, 0, 100), {std::string("Small")}},
    }, "Sites");

    SECTION("hectares") {
        REQUIRE(calculator.add_area("Sites", AreaUnit::HECTARES));
        REQUIRE(column_values(store, "Sites", "Area") == std::vector<FieldValue>{4.0, 1.0});

        const FieldInfo area = store.list_fields("Sites").back();
        REQUIRE(area.name == "Area");
        REQUIRE(area.type == FieldType::DOUBLE);
    }

    SECTION("square meters") {
        REQUIRE(calculator.add_area("Sites", AreaUnit::SQUARE_METERS));
        REQUIRE(column_values(store, "Sites", "Area") == std::vector<FieldValue>{40000.0, 10000.0});
    }

    SECTION("an existing Area field is recalculated, not duplicated") {
        REQUIRE(calculator.add_area("Sites", AreaUnit::HECTARES));
        REQUIRE(calculator.add_area("Sites", AreaUnit::SQUARE_KILOMETERS));
        REQUIRE(store.list_fields("Sites").size() == 4);
        REQUIRE(column_values(store, "Sites", "Area") == std::vector<FieldValue>{0.04, 0.01});
    }

    SECTION("only the selection is calculated") {
        Selection first;
        first.insert(*all_features(store, "Sites").begin());
        store.set_selection("Sites", first);
        REQUIRE(calculator.add_area("Sites", AreaUnit::HECTARES));

        store.clear_selection("Sites");
        const auto values = column_values(store, "Sites", "Area");
        REQUIRE(values[0] == FieldValue{4.0});
        REQUIRE(is_null(values[1]));
    }
}

TEST_CASE("area skips datasets that are not polygons") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);
    make_layer(store, "mem:data/Trees", wkbPoint, {}, {{"POINT (1 2)", {}}}, "Trees");

    REQUIRE_FALSE(calculator.add_area("Trees", AreaUnit::HECTARES));
    REQUIRE(field_names(store, "Trees") == std::vector<std::string>{"FID", "Shape"});
}

TEST_CASE("area of a missing dataset") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);

    try {
        calculator.add_area("mem:data/Nothing", AreaUnit::HECTARES);
        FAIL("add_area should throw");
    } catch (const PipelineError& e) {
        REQUIRE(e.category() == ErrorCategory::INPUT_MISSING);
    }
}

TEST_CASE("distance to the nearest target feature") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);
    make_layer(store, "mem:data/Sites", wkbPolygon, {FieldInfo("Name", FieldType::STRING, 10)}, {
        {square(0, 0, 100), {std::string("Near")}},
        {square(200, 0, 100), {std::string("Far")}},
    }, "Sites");

    SECTION("one row per input row") {
        make_layer(store, "mem:data/Site", wkbPoint, {}, {{"POINT (-50 50)", {}}}, "Site");
        calculator.add_distance("Sites", "Site", "mem:temp/TempOutput", "TempOutput");

        REQUIRE(store.is_loaded("TempOutput"));
        REQUIRE(store.feature_count("TempOutput") == 2);
        REQUIRE(column_values(store, "TempOutput", "Name") ==
                std::vector<FieldValue>{std::string("Near"), std::string("Far")});
        REQUIRE(column_values(store, "TempOutput", "Distance") == std::vector<FieldValue>{50.0, 250.0});
    }

    SECTION("an empty target leaves the distance null") {
        make_layer(store, "mem:data/Site", wkbPoint, {}, {}, "Site");
        calculator.add_distance("Sites", "Site", "mem:temp/TempOutput", "");

        REQUIRE_FALSE(store.is_loaded("TempOutput"));
        for (const auto& value : column_values(store, "mem:temp/TempOutput", "Distance")) {
            REQUIRE(is_null(value));
        }
    }
}

TEST_CASE("radius tag") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);
    make_layer(store, "mem:data/Sites", wkbPoint, {}, {{"POINT (0 0)", {}}, {"POINT (1 1)", {}}}, "Sites");

    calculator.add_radius("Sites", "1km");
    REQUIRE(column_values(store, "Sites", "Radius") ==
            std::vector<FieldValue>{std::string("1km"), std::string("1km")});

    const FieldInfo radius = store.list_fields("Sites").back();
    REQUIRE(radius.type == FieldType::STRING);
    REQUIRE(radius.length == RADIUS_FIELD_LENGTH);

    calculator.add_radius("Sites", "500m");
    REQUIRE(store.list_fields("Sites").size() == 3);
    REQUIRE(column_values(store, "Sites", "Radius").front() == FieldValue{std::string("500m")});
}

TEST_CASE("derived field failures propagate") {
    FeatureStore store;
    FailingEngine engine;
    DerivedFieldCalculator calculator(store, engine, TEST_POLL);
    make_layer(store, "mem:data/Sites", wkbPolygon, {}, {{square(0, 0, 10), {}}}, "Sites");

    REQUIRE_THROWS_AS(calculator.add_area("Sites", AreaUnit::HECTARES), EngineOperationError);
    REQUIRE(engine.calls == std::vector<std::string>{"AddField"});
}
