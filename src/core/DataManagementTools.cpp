/**
 * @file DataManagementTools.cpp
 * @brief Copy, field management, calculation, deletion and selection tools
 */

#include "GeoprocessingTools.hpp"
#include "ColumnSpec.hpp"

#include <ogr_api.h>
#include <cpl_error.h>

#include <algorithm>
#include <iterator>

namespace dsearch {

namespace {

FieldType parse_field_type(const std::string& keyword) {
    const std::string lower = to_lower(keyword);
    if (lower == "text" || lower == "string") return FieldType::STRING;
    if (lower == "double" || lower == "float") return FieldType::DOUBLE;
    if (lower == "long" || lower == "short" || lower == "integer") return FieldType::INTEGER;
    if (lower == "date") return FieldType::DATE;
    throw ToolError("Unsupported field type: " + keyword);
}

void copy_dataset(ToolContext& ctx, const char* in_key, const char* out_key, bool keep_geometry) {
    const std::string& input = ctx.required(in_key);
    OGRLayer* source = ctx.input_layer(in_key);

    OGRLayer* output = ctx.output_layer(out_key,
                                        keep_geometry ? source->GetGeomType() : wkbNone,
                                        keep_geometry ? source->GetSpatialRef() : nullptr);
    const std::vector<int> mapping = copy_fields(source->GetLayerDefn(), output);

    long copied = 0;
    ctx.store.visit_features(input, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
        row->SetFrom(&feature, mapping.data(), TRUE);
        write_feature(output, *row);
        ++copied;
    });

    ctx.finish_output(out_key, output);
    ctx.message(std::to_string(copied) + " rows copied to " + ctx.required(out_key));
}

// RAII guard clearing an attribute filter on scope exit
class AttributeFilterGuard {
public:
    explicit AttributeFilterGuard(OGRLayer* layer) : layer_(layer) {}
    ~AttributeFilterGuard() {
        layer_->SetAttributeFilter(nullptr);
        layer_->ResetReading();
    }

    AttributeFilterGuard(const AttributeFilterGuard&) = delete;
    AttributeFilterGuard& operator=(const AttributeFilterGuard&) = delete;

private:
    OGRLayer* layer_;
};

Selection combine_selection(const Selection* current, Selection matched, const std::string& selection_type) {
    if (selection_type == "NEW_SELECTION" || !current) {
        if (selection_type == "REMOVE_FROM_SELECTION") return Selection{};
        return matched;
    }

    Selection combined;
    if (selection_type == "SUBSET_SELECTION") {
        std::set_intersection(current->begin(), current->end(), matched.begin(), matched.end(),
                              std::inserter(combined, combined.begin()));
    } else if (selection_type == "ADD_TO_SELECTION") {
        std::set_union(current->begin(), current->end(), matched.begin(), matched.end(),
                       std::inserter(combined, combined.begin()));
    } else if (selection_type == "REMOVE_FROM_SELECTION") {
        std::set_difference(current->begin(), current->end(), matched.begin(), matched.end(),
                            std::inserter(combined, combined.begin()));
    } else {
        throw ToolError("Unknown selection type: " + selection_type);
    }
    return combined;
}

void apply_selection(ToolContext& ctx, const std::string& layer_name, Selection matched) {
    const std::string selection_type = ctx.optional("selection_type", "NEW_SELECTION");
    Selection combined = combine_selection(ctx.store.selection(layer_name), std::move(matched), selection_type);
    const size_t count = combined.size();
    if (!ctx.store.set_selection(layer_name, std::move(combined))) {
        throw ToolError("Layer is not loaded: " + layer_name);
    }
    ctx.message(std::to_string(count) + " features selected in " + layer_name);
}

/**
 * @brief Parsed CalculateField expression
 *
 * "\"text\"" constant, [Field] or !Field! copy, !SHAPE.AREA@UNIT! area,
 * or a numeric constant.
 */
struct CalculateExpression {
    enum class Kind { CONSTANT, FIELD, FEATURE_ID, AREA };

    Kind kind = Kind::CONSTANT;
    FieldValue constant;
    int source_index = -1;
    double area_divisor = 1.0;
};

CalculateExpression parse_expression(const std::string& text, OGRFeatureDefn* definition) {
    const std::string expression = trim(text);
    CalculateExpression parsed;

    if (expression.size() >= 2 && expression.front() == '"' && expression.back() == '"') {
        parsed.constant = expression.substr(1, expression.size() - 2);
        return parsed;
    }

    const bool bracketed = expression.size() >= 2 &&
        ((expression.front() == '[' && expression.back() == ']') ||
         (expression.front() == '!' && expression.back() == '!'));
    if (bracketed) {
        const std::string inner = expression.substr(1, expression.size() - 2);
        const std::string lower = to_lower(inner);

        if (lower.rfind("shape.area", 0) == 0) {
            parsed.kind = CalculateExpression::Kind::AREA;
            const size_t at = lower.find('@');
            const std::string unit = at == std::string::npos ? "squaremeters" : lower.substr(at + 1);
            if (unit == "hectares") {
                parsed.area_divisor = 10000.0;
            } else if (unit == "squaremeters" || unit == "square_meters") {
                parsed.area_divisor = 1.0;
            } else if (unit == "squarekilometers" || unit == "square_kilometers") {
                parsed.area_divisor = 1000000.0;
            } else {
                throw ToolError("Unsupported area unit in expression: " + expression);
            }
            return parsed;
        }

        parsed.source_index = find_field_index(definition, inner);
        if (parsed.source_index >= 0) {
            parsed.kind = CalculateExpression::Kind::FIELD;
            return parsed;
        }
        if (lower == "fid" || lower == "objectid") {
            parsed.kind = CalculateExpression::Kind::FEATURE_ID;
            return parsed;
        }
        throw ToolError("Field in expression does not exist: " + inner);
    }

    const double number = parse_number(expression, "expression");
    if (expression.find_first_not_of("+-0123456789") == std::string::npos) {
        parsed.constant = static_cast<std::int64_t>(number);
    } else {
        parsed.constant = number;
    }
    return parsed;
}

FieldValue evaluate(const CalculateExpression& expression, const OGRFeature& feature) {
    switch (expression.kind) {
        case CalculateExpression::Kind::CONSTANT:
            return expression.constant;
        case CalculateExpression::Kind::FIELD:
            return read_field_value(feature, expression.source_index);
        case CalculateExpression::Kind::FEATURE_ID:
            return static_cast<std::int64_t>(feature.GetFID());
        case CalculateExpression::Kind::AREA: {
            const OGRGeometry* geometry = feature.GetGeometryRef();
            if (!geometry) {
                return std::monostate{};
            }
            double area = OGR_G_Area(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(geometry)));
            return area / expression.area_divisor;
        }
    }
    return std::monostate{};
}

} // anonymous namespace

// ============================================================================
// Copy
// ============================================================================

void copy_features_tool(ToolContext& ctx) {
    copy_dataset(ctx, "in_features", "out_feature_class", true);
}

void copy_rows_tool(ToolContext& ctx) {
    copy_dataset(ctx, "in_rows", "out_table", false);
}

// ============================================================================
// Fields
// ============================================================================

void add_field_tool(ToolContext& ctx) {
    const std::string& table = ctx.required("in_table");
    FieldInfo field(ctx.required("field_name"), parse_field_type(ctx.required("field_type")));
    field.length = static_cast<int>(parse_number(ctx.optional("field_length", "0"), "field_length"));
    field.alias = ctx.optional("field_alias");

    OGRLayer* layer = ctx.input_layer("in_table");
    if (find_field_index(layer->GetLayerDefn(), field.name) >= 0) {
        ctx.message("Field " + field.name + " already exists in " + table);
        return;
    }
    if (!ctx.store.add_field(ctx.store.resolve(table), field)) {
        throw ToolError("Cannot add field " + field.name + " to " + table + ": " + CPLGetLastErrorMsg());
    }
    ctx.message("Added field " + field.name);
}

void delete_field_tool(ToolContext& ctx) {
    const std::string& table = ctx.required("in_table");
    const DatasetRef ref = ctx.store.resolve(table);
    ctx.input_layer("in_table");

    for (const auto& name : split_list(ctx.required("drop_field"), ';')) {
        for (const auto& field : ctx.store.list_fields(ref)) {
            if (field.required && iequals(field.name, name)) {
                throw ToolError("Field " + field.name + " is required and cannot be deleted");
            }
        }
        if (!ctx.store.delete_field(ref, name)) {
            throw ToolError("Cannot delete field " + name + " from " + table);
        }
        ctx.message("Deleted field " + name);
    }
}

void calculate_field_tool(ToolContext& ctx) {
    const std::string& table = ctx.required("in_table");
    OGRLayer* layer = ctx.input_layer("in_table");
    OGRFeatureDefn* definition = layer->GetLayerDefn();

    const std::string& field = ctx.required("field");
    const int target = find_field_index(definition, field);
    if (target < 0) {
        throw ToolError("Field does not exist: " + field);
    }
    const CalculateExpression expression = parse_expression(ctx.required("expression"), definition);

    std::vector<OGRFeatureUniquePtr> rows;
    ctx.store.visit_features(table, [&](OGRFeature& feature) {
        rows.emplace_back(feature.Clone());
    });

    for (auto& row : rows) {
        ctx.check_cancelled();
        write_field_value(*row, target, evaluate(expression, *row));
        if (layer->SetFeature(row.get()) != OGRERR_NONE) {
            throw ToolError("Failed to update row " + std::to_string(row->GetFID()) + ": " + CPLGetLastErrorMsg());
        }
    }
    layer->SyncToDisk();
    ctx.message(std::to_string(rows.size()) + " rows calculated");
}

// ============================================================================
// Delete
// ============================================================================

void delete_tool(ToolContext& ctx) {
    const DatasetRef ref = ctx.store.resolve(ctx.required("in_data"));
    if (!ctx.store.delete_dataset(ref)) {
        throw ToolError("Cannot delete " + ref.path());
    }
    ctx.message("Deleted " + ref.path());
}

// ============================================================================
// Selection
// ============================================================================

void select_by_attribute_tool(ToolContext& ctx) {
    const std::string& layer_name = ctx.required("in_layer");
    if (ctx.optional("selection_type") == "CLEAR_SELECTION") {
        ctx.store.clear_selection(layer_name);
        ctx.message("Selection cleared in " + layer_name);
        return;
    }

    OGRLayer* layer = ctx.input_layer("in_layer");
    const std::string where = ctx.optional("where_clause");

    Selection matched;
    {
        AttributeFilterGuard guard(layer);
        if (layer->SetAttributeFilter(where.empty() ? nullptr : where.c_str()) != OGRERR_NONE) {
            throw ToolError("Invalid expression: " + where + " " + CPLGetLastErrorMsg());
        }
        layer->ResetReading();
        while (OGRFeatureUniquePtr feature{layer->GetNextFeature()}) {
            matched.insert(feature->GetFID());
        }
    }
    apply_selection(ctx, layer_name, std::move(matched));
}

void select_by_location_tool(ToolContext& ctx) {
    const std::string& layer_name = ctx.required("in_layer");
    const std::string& select_name = ctx.required("select_features");
    OGRLayer* layer = ctx.input_layer("in_layer");
    ctx.input_layer("select_features");

    const std::string overlap = ctx.optional("overlap_type", "INTERSECT");
    double search_distance = 0.0;
    if (overlap == "WITHIN_A_DISTANCE") {
        search_distance = parse_number(ctx.required("search_distance"), "search_distance");
    } else if (overlap != "INTERSECT" && overlap != "COMPLETELY_WITHIN") {
        throw ToolError("Unsupported overlap type: " + overlap);
    }

    std::vector<OGRGeometryUniquePtr> selectors;
    ctx.store.visit_features(select_name, [&](OGRFeature& feature) {
        if (feature.GetGeometryRef()) {
            selectors.emplace_back(feature.GetGeometryRef()->clone());
        }
    });

    Selection matched;
    layer->ResetReading();
    while (OGRFeatureUniquePtr feature{layer->GetNextFeature()}) {
        ctx.check_cancelled();
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry) {
            continue;
        }
        for (const auto& selector : selectors) {
            bool hit = false;
            if (overlap == "INTERSECT") {
                hit = geometry->Intersects(selector.get());
            } else if (overlap == "COMPLETELY_WITHIN") {
                hit = geometry->Within(selector.get());
            } else {
                const double distance = geometry->Distance(selector.get());
                hit = distance >= 0.0 && distance <= search_distance;
            }
            if (hit) {
                matched.insert(feature->GetFID());
                break;
            }
        }
    }
    layer->ResetReading();

    apply_selection(ctx, layer_name, std::move(matched));
}

} // namespace dsearch
