#pragma once

/**
 * @file FieldValues.hpp
 * @brief Reading, writing, comparing and formatting cell values
 */

#include "../../include/data_search.hpp"

#include <ogr_feature.h>

#include <optional>
#include <string>
#include <vector>

namespace dsearch {

FieldValue read_field_value(const OGRFeature& feature, int index);
void write_field_value(OGRFeature& feature, int index, const FieldValue& value);

std::optional<double> numeric_value(const FieldValue& value);

/**
 * @brief Three-way comparison used for sorting and grouping
 *
 * Nulls sort first, numbers compare numerically and before strings,
 * strings compare case-insensitively.
 */
int compare_values(const FieldValue& a, const FieldValue& b);

/**
 * @brief Text form of a value; null is empty, doubles use up to 15 significant digits
 */
std::string value_to_string(const FieldValue& value);

/**
 * @brief Strict weak ordering of group keys
 *
 * Ties under compare_values are broken by exact text so keys differing only
 * in case stay distinct groups.
 */
struct FieldValueKeyLess {
    bool operator()(const std::vector<FieldValue>& a, const std::vector<FieldValue>& b) const;
};

/**
 * @brief Attribute field index by name, falling back to a case-insensitive alias match
 * @return -1 when neither matches
 */
int find_field_index(OGRFeatureDefn* definition, const std::string& name);

} // namespace dsearch
