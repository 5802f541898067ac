#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "core/FieldProjector.hpp"

using namespace dsearch;
using namespace dsearch::test;

namespace {

FieldList habitat_fields() {
    FieldList fields = {
        FieldInfo("FID", FieldType::INTEGER, 0, true),
        FieldInfo("Shape", FieldType::GEOMETRY, 0, true),
        FieldInfo("HAB_TYPE", FieldType::STRING, 50),
        FieldInfo("Area", FieldType::DOUBLE),
    };
    fields[2].alias = "Habitat";
    return fields;
}

} // anonymous namespace

TEST_CASE("projection keeps literals and known fields in order") {
    const Projection projection =
        FieldProjector::project("\"Habitats\", Habitat ,Missing,Area,Gone", habitat_fields());

    REQUIRE(projection.tokens == std::vector<std::string>{"\"Habitats\"", "Habitat", "Area"});
    REQUIRE(projection.cleaned_spec == "\"Habitats\",Habitat,Area");
    REQUIRE(projection.missing == std::vector<std::string>{"Missing", "Gone"});
    REQUIRE_FALSE(projection.empty());
}

TEST_CASE("literals are never validated") {
    const Projection projection = FieldProjector::project("\"Not a field\"", FieldList{});
    REQUIRE(projection.cleaned_spec == "\"Not a field\"");
    REQUIRE(projection.missing.empty());
}

TEST_CASE("a projection with nothing left is empty, not an error") {
    REQUIRE(FieldProjector::project("", habitat_fields()).empty());

    const Projection projection = FieldProjector::project("Nope,Nada", habitat_fields());
    REQUIRE(projection.empty());
    REQUIRE(projection.cleaned_spec.empty());
    REQUIRE(projection.missing.size() == 2);
}

TEST_CASE("projection with another delimiter") {
    const Projection projection = FieldProjector::project("Area;HAB_TYPE;Bogus", habitat_fields(), ';');
    REQUIRE(projection.cleaned_spec == "Area;HAB_TYPE");
}

TEST_CASE("projection against a dataset in the store") {
    FeatureStore store;
    make_layer(store, "mem:data/Sites", wkbPoint, {FieldInfo("Name", FieldType::STRING, 20)}, {}, "Sites");
    FieldProjector projector(store);

    const Projection projection = projector.project("FID,Name,Shape,Radius", "Sites");
    REQUIRE(projection.tokens.size() == 3);
    REQUIRE(projection.missing == std::vector<std::string>{"Radius"});
}
