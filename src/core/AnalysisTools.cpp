/**
 * @file AnalysisTools.cpp
 * @brief Overlay and proximity tools: Buffer, Clip, Intersect, SpatialJoin, Dissolve
 *
 * Geometry work is done with the OGR/GEOS predicates and overlay operators.
 * Distances and buffer widths are in the units of the dataset's CRS.
 */

#include "GeoprocessingTools.hpp"
#include "ColumnSpec.hpp"

#include <cpl_error.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace dsearch {

namespace {

using FeatureList = std::vector<OGRFeatureUniquePtr>;

FeatureList collect_features(ToolContext& ctx, const std::string& name) {
    FeatureList features;
    ctx.store.visit_features(name, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        features.emplace_back(feature.Clone());
    });
    return features;
}

OGRGeometryUniquePtr clip_geometry_of(const FeatureList& features) {
    std::vector<const OGRGeometry*> parts;
    for (const auto& feature : features) {
        if (feature->GetGeometryRef()) {
            parts.push_back(feature->GetGeometryRef());
        }
    }
    return union_geometries(parts);
}

/// Overlay result of the expected dimension, or nullptr when nothing remains
OGRGeometryUniquePtr overlay_part(const OGRGeometry* geometry, const OGRGeometry* other, int dimension) {
    if (!geometry->Intersects(other)) {
        return nullptr;
    }
    OGRGeometryUniquePtr part(geometry->Intersection(other));
    if (!part) {
        throw ToolError(std::string("Geometry intersection failed: ") + CPLGetLastErrorMsg());
    }
    if (part->IsEmpty() || part->getDimension() != dimension) {
        return nullptr;
    }
    return force_to_multi(std::move(part));
}

} // anonymous namespace

// ============================================================================
// Buffer
// ============================================================================

void buffer_tool(ToolContext& ctx) {
    const std::string& input = ctx.required("in_features");
    OGRLayer* source = ctx.input_layer("in_features");
    const double distance = parse_number(ctx.required("buffer_distance"), "buffer_distance");
    const bool dissolve_all = to_lower(ctx.optional("dissolve_option", "NONE")) == "all";

    std::vector<std::pair<OGRFeatureUniquePtr, OGRGeometryUniquePtr>> buffered;
    ctx.store.visit_features(input, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        const OGRGeometry* geometry = feature.GetGeometryRef();
        if (!geometry) {
            return;
        }
        OGRGeometry* zone = geometry->Buffer(distance);
        if (!zone) {
            throw ToolError(std::string("Buffer failed: ") + CPLGetLastErrorMsg());
        }
        buffered.emplace_back(OGRFeatureUniquePtr(feature.Clone()), OGRGeometryUniquePtr(zone));
    });

    OGRLayer* output = ctx.output_layer("out_feature_class", wkbMultiPolygon, source->GetSpatialRef());

    if (dissolve_all) {
        std::vector<const OGRGeometry*> zones;
        for (const auto& entry : buffered) {
            zones.push_back(entry.second.get());
        }
        OGRGeometryUniquePtr merged = force_to_multi(union_geometries(zones));
        if (merged) {
            OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
            row->SetGeometryDirectly(merged.release());
            write_feature(output, *row);
        }
    } else {
        const std::vector<int> mapping = copy_fields(source->GetLayerDefn(), output);
        for (auto& entry : buffered) {
            OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
            row->SetFrom(entry.first.get(), mapping.data(), TRUE);
            row->SetGeometryDirectly(force_to_multi(std::move(entry.second)).release());
            write_feature(output, *row);
        }
    }

    ctx.finish_output("out_feature_class", output);
    ctx.message("Buffered " + std::to_string(buffered.size()) + " features of " + input);
}

// ============================================================================
// Clip
// ============================================================================

void clip_tool(ToolContext& ctx) {
    const std::string& input = ctx.required("in_features");
    OGRLayer* source = ctx.input_layer("in_features");
    ctx.input_layer("clip_features");

    const FeatureList clip_features = collect_features(ctx, ctx.required("clip_features"));
    OGRGeometryUniquePtr clip_geometry = clip_geometry_of(clip_features);

    OGRLayer* output = ctx.output_layer("out_feature_class",
                                        multi_geometry_type(source->GetGeomType()),
                                        source->GetSpatialRef());
    const std::vector<int> mapping = copy_fields(source->GetLayerDefn(), output);

    long written = 0;
    if (clip_geometry) {
        ctx.store.visit_features(input, [&](OGRFeature& feature) {
            ctx.check_cancelled();
            const OGRGeometry* geometry = feature.GetGeometryRef();
            if (!geometry) {
                return;
            }
            OGRGeometryUniquePtr part = overlay_part(geometry, clip_geometry.get(), geometry->getDimension());
            if (!part) {
                return;
            }
            OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
            row->SetFrom(&feature, mapping.data(), TRUE);
            row->SetGeometryDirectly(part.release());
            write_feature(output, *row);
            ++written;
        });
    }

    ctx.finish_output("out_feature_class", output);
    ctx.message("Clipped " + std::to_string(written) + " features of " + input);
}

// ============================================================================
// Intersect
// ============================================================================

void intersect_tool(ToolContext& ctx) {
    const std::string& input = ctx.required("in_features");
    OGRLayer* left = ctx.input_layer("in_features");
    OGRLayer* right = ctx.input_layer("intersect_features");

    const FeatureList right_features = collect_features(ctx, ctx.required("intersect_features"));

    OGRwkbGeometryType output_type = wkbUnknown;
    if (wkbFlatten(left->GetGeomType()) == wkbFlatten(right->GetGeomType())) {
        output_type = multi_geometry_type(left->GetGeomType());
    }

    OGRLayer* output = ctx.output_layer("out_feature_class", output_type, left->GetSpatialRef());
    const std::vector<int> left_mapping = copy_fields(left->GetLayerDefn(), output);
    const std::vector<int> right_mapping = copy_fields(right->GetLayerDefn(), output);

    long written = 0;
    ctx.store.visit_features(input, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        const OGRGeometry* geometry = feature.GetGeometryRef();
        if (!geometry) {
            return;
        }
        for (const auto& other : right_features) {
            const OGRGeometry* other_geometry = other->GetGeometryRef();
            if (!other_geometry) {
                continue;
            }
            const int dimension = std::min(geometry->getDimension(), other_geometry->getDimension());
            OGRGeometryUniquePtr part = overlay_part(geometry, other_geometry, dimension);
            if (!part) {
                continue;
            }
            OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
            row->SetFrom(&feature, left_mapping.data(), TRUE);
            row->SetFieldsFrom(other.get(), right_mapping.data(), TRUE);
            row->SetGeometryDirectly(part.release());
            write_feature(output, *row);
            ++written;
        }
    });

    ctx.finish_output("out_feature_class", output);
    ctx.message("Intersect produced " + std::to_string(written) + " features");
}

// ============================================================================
// SpatialJoin
// ============================================================================

void spatial_join_tool(ToolContext& ctx) {
    const std::string& target_name = ctx.required("target_features");
    OGRLayer* target = ctx.input_layer("target_features");
    OGRLayer* join = ctx.input_layer("join_features");

    const std::string match_option = ctx.optional("match_option", "CLOSEST");
    if (!iequals(match_option, "CLOSEST")) {
        throw ToolError("Unsupported match option: " + match_option);
    }
    const std::string distance_name = ctx.optional("distance_field_name", DISTANCE_FIELD);

    const FeatureList join_features = collect_features(ctx, ctx.required("join_features"));

    OGRLayer* output = ctx.output_layer("out_feature_class", target->GetGeomType(), target->GetSpatialRef());
    const std::vector<int> target_mapping = copy_fields(target->GetLayerDefn(), output);
    const std::vector<int> join_mapping = copy_fields(join->GetLayerDefn(), output);

    int distance_index = output->GetLayerDefn()->GetFieldIndex(distance_name.c_str());
    if (distance_index < 0) {
        OGRFieldDefn distance_field(distance_name.c_str(), OFTReal);
        if (output->CreateField(&distance_field) != OGRERR_NONE) {
            throw ToolError("Cannot create field " + distance_name + ": " + CPLGetLastErrorMsg());
        }
        distance_index = output->GetLayerDefn()->GetFieldCount() - 1;
    }

    long matched = 0;
    long written = 0;
    ctx.store.visit_features(target_name, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        const OGRGeometry* geometry = feature.GetGeometryRef();

        const OGRFeature* closest = nullptr;
        double closest_distance = std::numeric_limits<double>::max();
        if (geometry) {
            for (const auto& candidate : join_features) {
                const OGRGeometry* candidate_geometry = candidate->GetGeometryRef();
                if (!candidate_geometry) {
                    continue;
                }
                const double distance = geometry->Distance(candidate_geometry);
                if (distance >= 0.0 && distance < closest_distance) {
                    closest_distance = distance;
                    closest = candidate.get();
                }
            }
        }

        OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
        row->SetFrom(&feature, target_mapping.data(), TRUE);
        if (closest) {
            row->SetFieldsFrom(closest, join_mapping.data(), TRUE);
            row->SetField(distance_index, closest_distance);
            ++matched;
        } else {
            row->SetFieldNull(distance_index);
        }
        if (geometry) {
            row->SetGeometry(geometry);
        }
        write_feature(output, *row);
        ++written;
    });

    ctx.finish_output("out_feature_class", output);
    ctx.message("Joined " + std::to_string(matched) + " of " + std::to_string(written) + " features");
}

// ============================================================================
// Dissolve
// ============================================================================

void dissolve_tool(ToolContext& ctx) {
    const std::string& input = ctx.required("in_features");
    OGRLayer* source = ctx.input_layer("in_features");

    std::vector<std::string> malformed;
    const std::vector<StatisticSpec> statistics = parse_statistics(ctx.optional("statistics_fields"), &malformed);
    if (!malformed.empty()) {
        throw ToolError("Invalid statistics fields: " + join_list(malformed, ";"));
    }
    const std::vector<std::string> dissolve_fields = split_list(ctx.optional("dissolve_field"), ';');

    GroupAggregator aggregator(source->GetLayerDefn(), dissolve_fields, statistics, true);
    ctx.store.visit_features(input, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        aggregator.add(feature);
    });

    OGRLayer* output = ctx.output_layer("out_feature_class",
                                        multi_geometry_type(source->GetGeomType()),
                                        source->GetSpatialRef());
    aggregator.create_output_fields(output);

    for (const auto& entry : aggregator.groups()) {
        const auto& group = entry.second;
        std::vector<const OGRGeometry*> parts;
        for (const auto& geometry : group.geometries) {
            parts.push_back(geometry.get());
        }

        OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
        aggregator.write_group(*row, group, 0);
        OGRGeometryUniquePtr merged = force_to_multi(union_geometries(parts));
        if (merged) {
            row->SetGeometryDirectly(merged.release());
        }
        write_feature(output, *row);
    }

    ctx.finish_output("out_feature_class", output);
    ctx.message(std::to_string(aggregator.groups().size()) + " groups dissolved from " + input);
}

} // namespace dsearch
