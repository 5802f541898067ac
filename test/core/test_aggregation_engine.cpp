#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/AggregationEngine.hpp"

using namespace dsearch;
using namespace dsearch::test;

namespace {

void load_sites(FeatureStore& store) {
    make_layer(store, "mem:data/Sites", wkbPolygon, {
        FieldInfo("Name", FieldType::STRING, 20),
        FieldInfo("Type", FieldType::STRING, 20),
        FieldInfo("Area", FieldType::DOUBLE),
    }, {
        {square(0, 0, 10),  {std::string("A"), std::string("Wood"), 10.0}},
        {square(10, 0, 10), {std::string("A"), std::string("Wood"), 5.0}},
        {square(50, 0, 10), {std::string("B"), std::string("Heath"), 7.0}},
    }, "Sites");
}

} // anonymous namespace

TEST_CASE("plan drops unknown and malformed entries") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    const AggregationPlan plan = aggregation.plan("Sites", "Name;Bogus", "Area SUM;Nope MAX;Junk", false);

    REQUIRE(plan.group_columns == std::vector<std::string>{"Name"});
    REQUIRE(plan.statistics == std::vector<StatisticSpec>{StatisticSpec("Area", StatisticType::SUM)});
    REQUIRE(plan.dropped == std::vector<std::string>{"Bogus", "Nope", "Junk"});
    REQUIRE_FALSE(plan.placeholder_injected);
    REQUIRE(plan.has_statistics());
}

TEST_CASE("groups without statistics get a placeholder") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    SECTION("first group field, FIRST") {
        const AggregationPlan plan = aggregation.plan("Sites", "Type;Name", "", false);
        REQUIRE(plan.placeholder_injected);
        REQUIRE(plan.statistics == std::vector<StatisticSpec>{StatisticSpec("Type", StatisticType::FIRST)});
    }

    SECTION("statistics that all fail validation also get one") {
        const AggregationPlan plan = aggregation.plan("Sites", "Name", "Missing SUM", false);
        REQUIRE(plan.placeholder_injected);
        REQUIRE(plan.statistics.size() == 1);
        REQUIRE(plan.statistics[0].field == "Name");
    }

    SECTION("nothing to group means no aggregation") {
        const AggregationPlan plan = aggregation.plan("Sites", "Bogus", "", false);
        REQUIRE(plan.group_columns.empty());
        REQUIRE_FALSE(plan.has_statistics());
    }
}

TEST_CASE("inject_placeholder leaves complete plans alone") {
    AggregationPlan plan;
    REQUIRE_FALSE(AggregationEngine::inject_placeholder(plan));

    plan.group_columns = {"Name"};
    plan.statistics = {StatisticSpec("Area", StatisticType::MAX)};
    REQUIRE_FALSE(AggregationEngine::inject_placeholder(plan));
    REQUIRE(plan.statistics.size() == 1);
}

TEST_CASE("radius is carried through grouping") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    SECTION("appended after the requested statistics") {
        const AggregationPlan plan = aggregation.plan("Sites", "Name", "Area SUM", true);
        REQUIRE(plan.radius_appended);
        REQUIRE(plan.statistics.back() == StatisticSpec(RADIUS_FIELD, StatisticType::FIRST));
    }

    SECTION("not when there is no aggregation") {
        const AggregationPlan plan = aggregation.plan("Sites", "", "", true);
        REQUIRE_FALSE(plan.radius_appended);
        REQUIRE(plan.statistics.empty());
    }

    SECTION("not twice") {
        make_layer(store, "mem:data/Tagged", wkbPoint, {FieldInfo("Radius", FieldType::STRING, 25)}, {}, "Tagged");
        const AggregationPlan plan = aggregation.plan("Tagged", "Radius", "Radius LAST", true);
        REQUIRE_FALSE(plan.radius_appended);
        REQUIRE(plan.statistics.size() == 1);
    }
}

TEST_CASE("statistics table groups by the case fields") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    const AggregationPlan plan = aggregation.plan("Sites", "Name", "Area SUM", false);
    aggregation.execute(plan, "Sites", "mem:temp/TempTable", AggregationMode::STATISTICS_TABLE, "TempTable");

    REQUIRE(store.is_loaded("TempTable"));
    REQUIRE(field_names(store, "TempTable") ==
            std::vector<std::string>{"FID", "FREQUENCY", "Name", "SUM_Area"});
    REQUIRE(column_values(store, "TempTable", "Name") ==
            std::vector<FieldValue>{std::string("A"), std::string("B")});
    REQUIRE(column_values(store, "TempTable", "SUM_Area") == std::vector<FieldValue>{15.0, 7.0});
}

TEST_CASE("statistics over a selection only see selected rows") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    Selection first;
    first.insert(*all_features(store, "Sites").begin());
    store.set_selection("Sites", first);

    const AggregationPlan plan = aggregation.plan("Sites", "Name", "Area SUM", false);
    aggregation.execute(plan, "Sites", "mem:temp/TempTable", AggregationMode::STATISTICS_TABLE);

    REQUIRE(column_values(store, "mem:temp/TempTable", "SUM_Area") == std::vector<FieldValue>{10.0});
}

TEST_CASE("dissolve output keeps geometry ahead of the group fields") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    const AggregationPlan plan = aggregation.plan("Sites", "Type", "Area MAX", false);
    aggregation.execute(plan, "Sites", "mem:temp/TempOutput", AggregationMode::DISSOLVE);

    const FieldList fields = store.list_fields("mem:temp/TempOutput");
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[1].type == FieldType::GEOMETRY);
    REQUIRE(fields[2].name == "Type");
    REQUIRE(fields[3].name == "MAX_Area");
    REQUIRE(store.feature_count("mem:temp/TempOutput") == 2);
}

TEST_CASE("execute refuses a plan without statistics") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_sites(store);
    AggregationEngine aggregation(store, engine, TEST_POLL);

    try {
        aggregation.execute(AggregationPlan{}, "Sites", "mem:temp/T", AggregationMode::STATISTICS_TABLE);
        FAIL("execute should throw");
    } catch (const PipelineError& e) {
        REQUIRE(e.category() == ErrorCategory::SCHEMA_MISMATCH);
    }
}

TEST_CASE("engine failures propagate from execute") {
    FeatureStore store;
    OgrGeoprocessor real(store);
    load_sites(store);
    SelectiveEngine engine(real, {"Statistics"});
    AggregationEngine aggregation(store, engine, TEST_POLL);

    const AggregationPlan plan = aggregation.plan("Sites", "Name", "Area SUM", false);
    REQUIRE_THROWS_AS(aggregation.execute(plan, "Sites", "mem:temp/T", AggregationMode::STATISTICS_TABLE),
                      EngineOperationError);
}
