#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/Geoprocessor.hpp"

#include <ogr_api.h>

#include <algorithm>
#include <thread>

using namespace dsearch;
using namespace dsearch::test;

namespace {

const std::vector<FieldInfo> HABITAT_FIELDS = {
    FieldInfo("Type", FieldType::STRING, 20),
    FieldInfo("Score", FieldType::INTEGER),
    FieldInfo("Value", FieldType::DOUBLE),
};

void load_habitats(FeatureStore& store) {
    make_layer(store, "mem:data/Habitats", wkbPolygon, HABITAT_FIELDS, {
        {square(0, 0, 10),   {std::string("Wood"),  std::int64_t{2},  10.0}},
        {square(10, 0, 10),  {std::string("Wood"),  std::int64_t{7},  5.0}},
        {square(100, 0, 10), {std::string("Heath"), std::int64_t{9},  7.0}},
    }, "Habitats");
}

} // anonymous namespace

TEST_CASE("unknown tools fail without running") {
    FeatureStore store;
    OgrGeoprocessor engine(store);

    const JobHandle job = engine.execute("Reproject", {});
    REQUIRE(job->status() == JobStatus::FAILED);
    REQUIRE_FALSE(job->messages().empty());

    try {
        run_tool(engine, "Reproject", {}, TEST_POLL);
        FAIL("run_tool should throw");
    } catch (const EngineOperationError& e) {
        REQUIRE(e.tool() == "Reproject");
        REQUIRE(e.category() == ErrorCategory::ENGINE_FAILURE);
        REQUIRE_FALSE(e.diagnostics().empty());
    }
}

TEST_CASE("wait_for_completion polls until the job is terminal") {
    auto job = std::make_shared<GeoprocessingJob>("Slow");
    std::thread worker([job] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        job->add_message("done");
        job->set_status(JobStatus::SUCCEEDED);
    });

    const JobResult result = wait_for_completion(job, TEST_POLL);
    worker.join();

    REQUIRE(result.status == JobStatus::SUCCEEDED);
    REQUIRE(result.messages == std::vector<std::string>{"done"});
}

TEST_CASE("cancelled operations raise with the engine messages") {
    FeatureStore store;
    OgrGeoprocessor real(store);
    SelectiveEngine engine(real, {"Clip"}, JobStatus::CANCELLED);

    REQUIRE_THROWS_AS(run_tool(engine, "Clip", {}, TEST_POLL), EngineOperationError);
    REQUIRE_THROWS_WITH(run_tool(engine, "Clip", {}, TEST_POLL), Catch::Contains("cancelled"));
}

TEST_CASE("missing parameters fail the job") {
    FeatureStore store;
    OgrGeoprocessor engine(store);

    REQUIRE_THROWS_WITH(run_tool(engine, "CopyFeatures", {}, TEST_POLL),
                        Catch::Contains("Missing required parameter"));
    REQUIRE_THROWS_WITH(run_tool(engine, "CopyFeatures", {{"in_features", "Nowhere"},
                                                          {"out_feature_class", "mem:t/Out"}}, TEST_POLL),
                        Catch::Contains("does not exist"));
}

TEST_CASE("attribute selections combine with the current selection") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);

    run_tool(engine, "SelectLayerByAttribute",
             {{"in_layer", "Habitats"}, {"where_clause", "Score > 5"}, {"selection_type", "NEW_SELECTION"}}, TEST_POLL);
    REQUIRE(store.feature_count("Habitats") == 2);

    SECTION("subset") {
        run_tool(engine, "SelectLayerByAttribute",
                 {{"in_layer", "Habitats"}, {"where_clause", "Type = 'Wood'"}, {"selection_type", "SUBSET_SELECTION"}},
                 TEST_POLL);
        REQUIRE(store.feature_count("Habitats") == 1);
        REQUIRE(column_values(store, "Habitats", "Score") == std::vector<FieldValue>{std::int64_t{7}});
    }

    SECTION("add and remove") {
        run_tool(engine, "SelectLayerByAttribute",
                 {{"in_layer", "Habitats"}, {"where_clause", "Score < 5"}, {"selection_type", "ADD_TO_SELECTION"}},
                 TEST_POLL);
        REQUIRE(store.feature_count("Habitats") == 3);

        run_tool(engine, "SelectLayerByAttribute",
                 {{"in_layer", "Habitats"}, {"where_clause", "Type = 'Heath'"}, {"selection_type", "REMOVE_FROM_SELECTION"}},
                 TEST_POLL);
        REQUIRE(store.feature_count("Habitats") == 2);
    }

    SECTION("clear") {
        run_tool(engine, "SelectLayerByAttribute",
                 {{"in_layer", "Habitats"}, {"selection_type", "CLEAR_SELECTION"}}, TEST_POLL);
        REQUIRE(store.selection("Habitats") == nullptr);
        REQUIRE(store.feature_count("Habitats") == 3);
    }

    SECTION("an invalid expression fails") {
        REQUIRE_THROWS_AS(run_tool(engine, "SelectLayerByAttribute",
                                   {{"in_layer", "Habitats"}, {"where_clause", "Score >>> 'x"}}, TEST_POLL),
                          EngineOperationError);
    }
}

TEST_CASE("location selection and buffering") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);
    make_layer(store, "mem:data/Site", wkbPoint, {}, {{"POINT (5 5)", {}}}, "Site");

    SECTION("buffer around a point") {
        run_tool(engine, "Buffer", {{"in_features", "Site"}, {"out_feature_class", "mem:search/Area"},
                                    {"buffer_distance", "20"}, {"dissolve_option", "ALL"},
                                    {"add_to_session", "Area"}}, TEST_POLL);
        REQUIRE(store.is_loaded("Area"));
        REQUIRE(store.feature_count("Area") == 1);

        run_tool(engine, "SelectLayerByLocation", {{"in_layer", "Habitats"}, {"select_features", "Area"},
                                                   {"overlap_type", "INTERSECT"}}, TEST_POLL);
        REQUIRE(store.feature_count("Habitats") == 2);
    }

    SECTION("within a distance") {
        run_tool(engine, "SelectLayerByLocation", {{"in_layer", "Habitats"}, {"select_features", "Site"},
                                                   {"overlap_type", "WITHIN_A_DISTANCE"},
                                                   {"search_distance", "200"}}, TEST_POLL);
        REQUIRE(store.feature_count("Habitats") == 3);
    }

    SECTION("unsupported overlap") {
        REQUIRE_THROWS_AS(run_tool(engine, "SelectLayerByLocation",
                                   {{"in_layer", "Habitats"}, {"select_features", "Site"},
                                    {"overlap_type", "TOUCHES"}}, TEST_POLL),
                          EngineOperationError);
    }
}

TEST_CASE("copies honour the selection") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);

    Selection one;
    one.insert(*all_features(store, "Habitats").rbegin());
    store.set_selection("Habitats", one);

    run_tool(engine, "CopyFeatures", {{"in_features", "Habitats"}, {"out_feature_class", "mem:temp/Copy"}}, TEST_POLL);
    REQUIRE(store.feature_count("mem:temp/Copy") == 1);
    REQUIRE(field_names(store, "mem:temp/Copy") == field_names(store, "Habitats"));

    run_tool(engine, "CopyRows", {{"in_rows", "Habitats"}, {"out_table", "mem:temp/Rows"}}, TEST_POLL);
    REQUIRE(store.list_fields("mem:temp/Rows").size() == 4);

    run_tool(engine, "Delete", {{"in_data", "mem:temp/Copy"}}, TEST_POLL);
    REQUIRE_FALSE(store.layer_exists(store.resolve("mem:temp/Copy")));
}

TEST_CASE("Statistics writes identity, frequency, case fields, then statistics") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);

    run_tool(engine, "Statistics", {{"in_table", "Habitats"}, {"out_table", "mem:temp/Stats"},
                                    {"statistics_fields", "Value SUM;Score MAX;Value STD"},
                                    {"case_field", "Type"}}, TEST_POLL);

    REQUIRE(field_names(store, "mem:temp/Stats") ==
            std::vector<std::string>{"FID", "FREQUENCY", "Type", "SUM_Value", "MAX_Score", "STD_Value"});
    REQUIRE(column_values(store, "mem:temp/Stats", "Type") ==
            std::vector<FieldValue>{std::string("Heath"), std::string("Wood")});
    REQUIRE(column_values(store, "mem:temp/Stats", "FREQUENCY") ==
            std::vector<FieldValue>{std::int64_t{1}, std::int64_t{2}});
    REQUIRE(column_values(store, "mem:temp/Stats", "SUM_Value") == std::vector<FieldValue>{7.0, 15.0});
    REQUIRE(column_values(store, "mem:temp/Stats", "MAX_Score") ==
            std::vector<FieldValue>{std::int64_t{9}, std::int64_t{7}});

    const auto deviations = column_values(store, "mem:temp/Stats", "STD_Value");
    REQUIRE(std::get<double>(deviations[0]) == Approx(0.0));
    REQUIRE(std::get<double>(deviations[1]) == Approx(2.5));

    SECTION("unknown statistics fields fail the tool") {
        REQUIRE_THROWS_AS(run_tool(engine, "Statistics", {{"in_table", "Habitats"}, {"out_table", "mem:temp/Bad"},
                                                          {"statistics_fields", "Nope SUM"}}, TEST_POLL),
                          EngineOperationError);
    }
}

TEST_CASE("Dissolve merges geometries per group") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);

    run_tool(engine, "Dissolve", {{"in_features", "Habitats"}, {"out_feature_class", "mem:temp/Dissolved"},
                                  {"dissolve_field", "Type"}, {"statistics_fields", "Value MEAN"}}, TEST_POLL);

    const FieldList fields = store.list_fields("mem:temp/Dissolved");
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[1].type == FieldType::GEOMETRY);
    REQUIRE(fields[2].name == "Type");
    REQUIRE(fields[3].name == "MEAN_Value");
    REQUIRE(store.feature_count("mem:temp/Dissolved") == 2);

    std::vector<double> areas;
    store.visit_features("mem:temp/Dissolved", [&](OGRFeature& feature) {
        areas.push_back(OGR_G_Area(OGRGeometry::ToHandle(feature.GetGeometryRef())));
    });
    REQUIRE(areas[0] == Approx(100.0));
    REQUIRE(areas[1] == Approx(200.0));
    REQUIRE(column_values(store, "mem:temp/Dissolved", "MEAN_Value") == std::vector<FieldValue>{7.0, 7.5});
}

TEST_CASE("SpatialJoin adds the distance to the closest join feature") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    make_layer(store, "mem:data/Records", wkbPoint, {FieldInfo("Species", FieldType::STRING, 30)}, {
        {"POINT (30 40)", {std::string("Bat")}},
        {"POINT (0 -10)", {std::string("Newt")}},
    }, "Records");
    make_layer(store, "mem:data/Site", wkbPoint, {}, {{"POINT (0 0)", {}}}, "Site");

    run_tool(engine, "SpatialJoin", {{"target_features", "Records"}, {"join_features", "Site"},
                                     {"out_feature_class", "mem:temp/Joined"}, {"match_option", "CLOSEST"},
                                     {"distance_field_name", "Distance"}}, TEST_POLL);

    REQUIRE(store.feature_count("mem:temp/Joined") == 2);
    REQUIRE(column_values(store, "mem:temp/Joined", "Distance") == std::vector<FieldValue>{50.0, 10.0});

    SECTION("an empty join layer leaves the distance null") {
        make_layer(store, "mem:data/Empty", wkbPoint, {}, {}, "Empty");
        run_tool(engine, "SpatialJoin", {{"target_features", "Records"}, {"join_features", "Empty"},
                                         {"out_feature_class", "mem:temp/Joined"}}, TEST_POLL);
        const auto distances = column_values(store, "mem:temp/Joined", "Distance");
        REQUIRE(distances.size() == 2);
        REQUIRE(is_null(distances[0]));
    }
}

TEST_CASE("CalculateField expressions") {
    FeatureStore store;
    OgrGeoprocessor engine(store);
    load_habitats(store);
    run_tool(engine, "AddField", {{"in_table", "Habitats"}, {"field_name", "Label"}, {"field_type", "TEXT"},
                                  {"field_length", "25"}}, TEST_POLL);
    run_tool(engine, "AddField", {{"in_table", "Habitats"}, {"field_name", "Area"}, {"field_type", "DOUBLE"}},
             TEST_POLL);

    SECTION("constant text") {
        run_tool(engine, "CalculateField", {{"in_table", "Habitats"}, {"field", "Label"},
                                            {"expression", "\"2km\""}}, TEST_POLL);
        REQUIRE(column_values(store, "Habitats", "Label") ==
                std::vector<FieldValue>(3, FieldValue(std::string("2km"))));
    }

    SECTION("field copy") {
        run_tool(engine, "CalculateField", {{"in_table", "Habitats"}, {"field", "Area"},
                                            {"expression", "[Value]"}}, TEST_POLL);
        REQUIRE(column_values(store, "Habitats", "Area") == std::vector<FieldValue>{10.0, 5.0, 7.0});
    }

    SECTION("area in square metres") {
        run_tool(engine, "CalculateField", {{"in_table", "Habitats"}, {"field", "Area"},
                                            {"expression", "!SHAPE.AREA@SQUAREMETERS!"}}, TEST_POLL);
        REQUIRE(column_values(store, "Habitats", "Area") == std::vector<FieldValue>{100.0, 100.0, 100.0});
    }

    SECTION("adding an existing field is a no-op") {
        run_tool(engine, "AddField", {{"in_table", "Habitats"}, {"field_name", "label"}, {"field_type", "TEXT"}},
                 TEST_POLL);
        REQUIRE(store.list_fields("Habitats").size() == 7);
    }

    SECTION("required fields cannot be dropped") {
        REQUIRE_THROWS_AS(run_tool(engine, "DeleteField", {{"in_table", "Habitats"}, {"drop_field", "FID"}},
                                   TEST_POLL),
                          EngineOperationError);
        run_tool(engine, "DeleteField", {{"in_table", "Habitats"}, {"drop_field", "Label;Area"}}, TEST_POLL);
        REQUIRE(store.list_fields("Habitats").size() == 5);
    }
}

TEST_CASE("tool names cover the pipeline") {
    const auto names = OgrGeoprocessor::tool_names();
    for (const char* tool : {"Buffer", "Clip", "Intersect", "SpatialJoin", "Statistics", "Dissolve",
                             "SelectLayerByLocation", "SelectLayerByAttribute", "CopyFeatures", "Delete"}) {
        REQUIRE(std::find(names.begin(), names.end(), tool) != names.end());
    }
}
