/**
 * @file StatisticsTools.cpp
 * @brief Group-by accumulation and the Statistics tool
 *
 * Output layout of Statistics: identity, FREQUENCY, case fields, then one
 * "<STAT>_<field>" per requested statistic in request order.
 */

#include "GeoprocessingTools.hpp"
#include "ColumnSpec.hpp"

#include <cpl_error.h>

#include <algorithm>
#include <cmath>

namespace dsearch {

// ============================================================================
// StatisticAccumulator
// ============================================================================

StatisticAccumulator::StatisticAccumulator(StatisticType type) : type_(type) {
}

void StatisticAccumulator::add(const FieldValue& value) {
    if (!has_first_) {
        first_ = value;
        has_first_ = true;
    }
    last_ = value;

    if (is_null(value)) {
        return;
    }

    ++count_;
    if (is_null(min_) || compare_values(value, min_) < 0) min_ = value;
    if (is_null(max_) || compare_values(value, max_) > 0) max_ = value;

    if (auto number = numeric_value(value)) {
        sum_ += *number;
        sum_squares_ += *number * *number;
    }
}

FieldValue StatisticAccumulator::result() const {
    switch (type_) {
        case StatisticType::FIRST:
            return first_;
        case StatisticType::LAST:
            return last_;
        case StatisticType::COUNT:
            return static_cast<std::int64_t>(count_);
        case StatisticType::MIN:
            return min_;
        case StatisticType::MAX:
            return max_;
        default:
            break;
    }

    if (count_ == 0) {
        return std::monostate{};
    }

    switch (type_) {
        case StatisticType::SUM:
            return sum_;
        case StatisticType::MEAN:
            return sum_ / static_cast<double>(count_);
        case StatisticType::RANGE: {
            auto low = numeric_value(min_);
            auto high = numeric_value(max_);
            if (!low || !high) return std::monostate{};
            return *high - *low;
        }
        case StatisticType::STD: {
            const double mean = sum_ / static_cast<double>(count_);
            const double variance = sum_squares_ / static_cast<double>(count_) - mean * mean;
            return std::sqrt(std::max(0.0, variance));
        }
        default:
            return std::monostate{};
    }
}

// ============================================================================
// GroupAggregator
// ============================================================================

GroupAggregator::GroupAggregator(OGRFeatureDefn* source,
                                 const std::vector<std::string>& case_fields,
                                 const std::vector<StatisticSpec>& statistics,
                                 bool collect_geometry)
    : source_(source), statistics_(statistics), collect_geometry_(collect_geometry) {
    for (const auto& name : case_fields) {
        int index = find_field_index(source, name);
        if (index < 0) {
            throw ToolError("Case field does not exist: " + name);
        }
        case_indices_.push_back(index);
    }
    for (const auto& statistic : statistics) {
        int index = find_field_index(source, statistic.field);
        if (index < 0) {
            throw ToolError("Statistics field does not exist: " + statistic.field);
        }
        statistic_indices_.push_back(index);
    }
}

void GroupAggregator::add(const OGRFeature& feature) {
    std::vector<FieldValue> key;
    key.reserve(case_indices_.size());
    for (int index : case_indices_) {
        key.push_back(read_field_value(feature, index));
    }

    auto it = groups_.find(key);
    if (it == groups_.end()) {
        Group group;
        group.key = key;
        for (const auto& statistic : statistics_) {
            group.statistics.emplace_back(statistic.type);
        }
        it = groups_.emplace(key, std::move(group)).first;
    }

    Group& group = it->second;
    ++group.frequency;
    for (size_t i = 0; i < statistics_.size(); ++i) {
        group.statistics[i].add(read_field_value(feature, statistic_indices_[i]));
    }
    if (collect_geometry_ && feature.GetGeometryRef()) {
        group.geometries.emplace_back(feature.GetGeometryRef()->clone());
    }
}

void GroupAggregator::create_output_fields(OGRLayer* output) const {
    for (int index : case_indices_) {
        OGRFieldDefn field(source_->GetFieldDefn(index));
        if (output->CreateField(&field) != OGRERR_NONE) {
            throw ToolError(std::string("Cannot create case field ") + field.GetNameRef() + ": " + CPLGetLastErrorMsg());
        }
    }

    for (size_t i = 0; i < statistics_.size(); ++i) {
        const StatisticSpec& statistic = statistics_[i];
        const OGRFieldDefn* source_field = source_->GetFieldDefn(statistic_indices_[i]);
        const std::string name = statistic_keyword(statistic.type) + "_" + source_field->GetNameRef();

        OGRFieldType type = OFTReal;
        switch (statistic.type) {
            case StatisticType::FIRST:
            case StatisticType::LAST:
            case StatisticType::MIN:
            case StatisticType::MAX:
                type = source_field->GetType();
                break;
            case StatisticType::COUNT:
                type = OFTInteger64;
                break;
            default:
                type = OFTReal;
                break;
        }

        OGRFieldDefn field(name.c_str(), type);
        if (type == source_field->GetType()) {
            field.SetWidth(source_field->GetWidth());
            field.SetPrecision(source_field->GetPrecision());
        }
        if (output->CreateField(&field) != OGRERR_NONE) {
            throw ToolError("Cannot create statistics field " + name + ": " + CPLGetLastErrorMsg());
        }
    }
}

void GroupAggregator::write_group(OGRFeature& output, const Group& group, int first_field) const {
    int index = first_field;
    for (const auto& value : group.key) {
        write_field_value(output, index++, value);
    }
    for (const auto& statistic : group.statistics) {
        write_field_value(output, index++, statistic.result());
    }
}

// ============================================================================
// Statistics tool
// ============================================================================

void statistics_tool(ToolContext& ctx) {
    const std::string& input = ctx.required("in_table");
    OGRLayer* source = ctx.input_layer("in_table");

    std::vector<std::string> malformed;
    const std::vector<StatisticSpec> statistics = parse_statistics(ctx.required("statistics_fields"), &malformed);
    if (!malformed.empty()) {
        throw ToolError("Invalid statistics fields: " + join_list(malformed, ";"));
    }
    if (statistics.empty()) {
        throw ToolError("At least one statistics field is required");
    }
    const std::vector<std::string> case_fields = split_list(ctx.optional("case_field"), ';');

    GroupAggregator aggregator(source->GetLayerDefn(), case_fields, statistics, false);
    ctx.store.visit_features(input, [&](OGRFeature& feature) {
        ctx.check_cancelled();
        aggregator.add(feature);
    });

    OGRLayer* output = ctx.output_layer("out_table", wkbNone, nullptr);
    OGRFieldDefn frequency("FREQUENCY", OFTInteger64);
    if (output->CreateField(&frequency) != OGRERR_NONE) {
        throw ToolError(std::string("Cannot create FREQUENCY field: ") + CPLGetLastErrorMsg());
    }
    aggregator.create_output_fields(output);

    for (const auto& entry : aggregator.groups()) {
        const auto& group = entry.second;
        OGRFeatureUniquePtr row(OGRFeature::CreateFeature(output->GetLayerDefn()));
        row->SetField(0, static_cast<GIntBig>(group.frequency));
        aggregator.write_group(*row, group, 1);
        write_feature(output, *row);
    }

    ctx.finish_output("out_table", output);
    ctx.message(std::to_string(aggregator.groups().size()) + " groups written to " + ctx.required("out_table"));
}

} // namespace dsearch
