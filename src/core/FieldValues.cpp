/**
 * @file FieldValues.cpp
 * @brief Implementation of field value reading, comparison and text conversion
 */

#include "FieldValues.hpp"
#include "ColumnSpec.hpp"

#include <algorithm>
#include <cstdio>

namespace dsearch {

FieldValue read_field_value(const OGRFeature& feature, int index) {
    if (index < 0 || !feature.IsFieldSetAndNotNull(index)) {
        return std::monostate{};
    }
    switch (feature.GetFieldDefnRef(index)->GetType()) {
        case OFTInteger:
        case OFTInteger64:
            return static_cast<std::int64_t>(feature.GetFieldAsInteger64(index));
        case OFTReal:
            return feature.GetFieldAsDouble(index);
        default:
            return std::string(feature.GetFieldAsString(index));
    }
}

void write_field_value(OGRFeature& feature, int index, const FieldValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        feature.SetFieldNull(index);
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        feature.SetField(index, text->c_str());
    } else if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        feature.SetField(index, static_cast<GIntBig>(*integer));
    } else {
        feature.SetField(index, std::get<double>(value));
    }
}

std::optional<double> numeric_value(const FieldValue& value) {
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    return std::nullopt;
}

int compare_values(const FieldValue& a, const FieldValue& b) {
    const bool a_null = is_null(a);
    const bool b_null = is_null(b);
    if (a_null || b_null) {
        return (a_null ? 0 : 1) - (b_null ? 0 : 1);
    }

    auto a_number = numeric_value(a);
    auto b_number = numeric_value(b);
    if (a_number && b_number) {
        if (*a_number < *b_number) return -1;
        if (*a_number > *b_number) return 1;
        return 0;
    }
    if (a_number) return -1;
    if (b_number) return 1;

    const std::string a_text = to_lower(std::get<std::string>(a));
    const std::string b_text = to_lower(std::get<std::string>(b));
    return a_text.compare(b_text) < 0 ? -1 : (a_text == b_text ? 0 : 1);
}

std::string value_to_string(const FieldValue& value) {
    if (is_null(value)) {
        return "";
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integer);
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.15g", std::get<double>(value));
    return buffer;
}

bool FieldValueKeyLess::operator()(const std::vector<FieldValue>& a,
                                   const std::vector<FieldValue>& b) const {
    const size_t count = std::min(a.size(), b.size());
    for (size_t i = 0; i < count; ++i) {
        int order = compare_values(a[i], b[i]);
        if (order == 0) {
            const auto* a_text = std::get_if<std::string>(&a[i]);
            const auto* b_text = std::get_if<std::string>(&b[i]);
            if (a_text && b_text && *a_text != *b_text) {
                order = *a_text < *b_text ? -1 : 1;
            }
        }
        if (order != 0) return order < 0;
    }
    return a.size() < b.size();
}

int find_field_index(OGRFeatureDefn* definition, const std::string& name) {
    int index = definition->GetFieldIndex(name.c_str());
    if (index >= 0) {
        return index;
    }
    for (int i = 0; i < definition->GetFieldCount(); ++i) {
        const char* alias = definition->GetFieldDefn(i)->GetAlternativeNameRef();
        if (alias && iequals(alias, name)) {
            return i;
        }
    }
    return -1;
}

} // namespace dsearch
