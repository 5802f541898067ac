#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/SchemaValidator.hpp"

using namespace dsearch;
using namespace dsearch::test;

TEST_CASE("find_field prefers exact names, then names, then aliases") {
    FieldList fields = {
        FieldInfo("FID", FieldType::INTEGER, 0, true),
        FieldInfo("Shape", FieldType::GEOMETRY, 0, true),
        FieldInfo("area", FieldType::DOUBLE),
        FieldInfo("Area", FieldType::DOUBLE),
        FieldInfo("SITE_NM", FieldType::STRING, 80),
    };
    fields[4].alias = "Site Name";

    REQUIRE(SchemaValidator::find_field(fields, "Area") == size_t{3});
    REQUIRE(SchemaValidator::find_field(fields, "AREA") == size_t{2});
    REQUIRE(SchemaValidator::find_field(fields, "site name") == size_t{4});
    REQUIRE(SchemaValidator::find_field(fields, "fid") == size_t{0});
    REQUIRE_FALSE(SchemaValidator::find_field(fields, "Distance").has_value());
}

TEST_CASE("field checks against a dataset") {
    FeatureStore store;
    make_layer(store, "mem:data/Sites", wkbPoint,
               {FieldInfo("Name", FieldType::STRING, 20), FieldInfo("Type", FieldType::STRING, 20)}, {}, "Sites");
    SchemaValidator validator(store);

    REQUIRE(validator.field_exists("Sites", "name"));
    REQUIRE(validator.field_exists("Sites", "Shape"));
    REQUIRE_FALSE(validator.field_exists("Sites", "Radius"));

    std::vector<std::string> missing;
    const auto existing = validator.filter_existing("Sites", {"Type", "Bogus", "Name", "Other"}, &missing);
    REQUIRE(existing == std::vector<std::string>{"Type", "Name"});
    REQUIRE(missing == std::vector<std::string>{"Bogus", "Other"});
}

TEST_CASE("dataset_exists") {
    FeatureStore store;
    SchemaValidator validator(store);
    make_layer(store, "mem:data/Sites", wkbPoint, {}, {}, "Sites");

    SECTION("session names and workspace paths") {
        REQUIRE(validator.dataset_exists("Sites"));
        REQUIRE(validator.dataset_exists("mem:data/Sites"));
        REQUIRE_FALSE(validator.dataset_exists("mem:data/Other"));
        REQUIRE_FALSE(validator.dataset_exists(""));
    }

    SECTION("single-file datasets are checked on disk") {
        const auto directory = scratch_directory("schema_validator");
        write_text(directory / "present.dbf", "");
        REQUIRE(validator.dataset_exists((directory / "present.dbf").string()));
        REQUIRE_FALSE(validator.dataset_exists((directory / "absent.shp").string()));
    }

    SECTION("remote datasets are assumed to exist") {
        REQUIRE(validator.dataset_exists("connections/gis.sde/Sites"));
    }
}
