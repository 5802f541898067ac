/**
 * @file DerivedFieldCalculator.cpp
 * @brief Implementation of the Area and Radius derived fields
 */

#include "DerivedFieldCalculator.hpp"
#include "SchemaValidator.hpp"

namespace dsearch {

DerivedFieldCalculator::DerivedFieldCalculator(FeatureStore& store, GeoprocessingEngine& engine,
                                               std::chrono::milliseconds poll_interval)
    : store_(store), engine_(engine), poll_interval_(poll_interval), logger_("DerivedFields") {
}

std::string DerivedFieldCalculator::area_expression(AreaUnit unit) {
    switch (unit) {
        case AreaUnit::SQUARE_METERS:     return "!SHAPE.AREA@SQUAREMETERS!";
        case AreaUnit::SQUARE_KILOMETERS: return "!SHAPE.AREA@SQUAREKILOMETERS!";
        case AreaUnit::HECTARES:
        default:                          return "!SHAPE.AREA@HECTARES!";
    }
}

bool DerivedFieldCalculator::add_area(const std::string& dataset, AreaUnit unit) {
    auto kind = store_.sample_geometry_kind(store_.resolve(dataset));
    if (!kind) {
        throw PipelineError(ErrorCategory::INPUT_MISSING, "Cannot read geometry type of " + dataset);
    }
    if (*kind != GeometryKind::POLYGON) {
        logger_.detailed("Skipping area for " + dataset + " (" + geometry_kind_name(*kind) + " geometry)");
        return false;
    }

    SchemaValidator validator(store_);
    if (!validator.field_exists(dataset, AREA_FIELD)) {
        run_tool(engine_, "AddField", {
            {"in_table", dataset},
            {"field_name", AREA_FIELD},
            {"field_type", "DOUBLE"},
            {"field_length", std::to_string(AREA_FIELD_LENGTH)},
        }, poll_interval_);
    }

    run_tool(engine_, "CalculateField", {
        {"in_table", dataset},
        {"field", AREA_FIELD},
        {"expression", area_expression(unit)},
    }, poll_interval_);

    logger_.detailed("Calculated area for " + dataset);
    return true;
}

void DerivedFieldCalculator::add_distance(const std::string& input, const std::string& target,
                                          const std::string& output, const std::string& session_name) {
    ToolArguments arguments = {
        {"target_features", input},
        {"join_features", target},
        {"out_feature_class", output},
        {"match_option", "CLOSEST"},
        {"distance_field_name", DISTANCE_FIELD},
    };
    if (!session_name.empty()) {
        arguments["add_to_session"] = session_name;
    }
    run_tool(engine_, "SpatialJoin", arguments, poll_interval_);
    logger_.detailed("Joined " + input + " to nearest " + target);
}

void DerivedFieldCalculator::add_radius(const std::string& dataset, const std::string& radius) {
    SchemaValidator validator(store_);
    if (!validator.field_exists(dataset, RADIUS_FIELD)) {
        run_tool(engine_, "AddField", {
            {"in_table", dataset},
            {"field_name", RADIUS_FIELD},
            {"field_type", "TEXT"},
            {"field_length", std::to_string(RADIUS_FIELD_LENGTH)},
        }, poll_interval_);
    }

    run_tool(engine_, "CalculateField", {
        {"in_table", dataset},
        {"field", RADIUS_FIELD},
        {"expression", "\"" + radius + "\""},
    }, poll_interval_);

    logger_.trace("Tagged " + dataset + " with radius " + radius);
}

} // namespace dsearch
