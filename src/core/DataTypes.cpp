/**
 * @file DataTypes.cpp
 * @brief Keyword conversions and dataset path parsing shared by every module
 */

#include "../../include/data_search.hpp"

#include <algorithm>
#include <cctype>

namespace dsearch {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool ends_with_ci(const std::string& text, const std::string& suffix) {
    if (text.size() < suffix.size()) return false;
    return to_upper(text.substr(text.size() - suffix.size())) == to_upper(suffix);
}

} // anonymous namespace

std::string geometry_kind_name(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::POINT:   return "point";
        case GeometryKind::LINE:    return "line";
        case GeometryKind::POLYGON: return "polygon";
        case GeometryKind::OTHER:   return "other";
    }
    return "other";
}

std::string statistic_keyword(StatisticType type) {
    switch (type) {
        case StatisticType::SUM:   return "SUM";
        case StatisticType::MEAN:  return "MEAN";
        case StatisticType::MIN:   return "MIN";
        case StatisticType::MAX:   return "MAX";
        case StatisticType::RANGE: return "RANGE";
        case StatisticType::STD:   return "STD";
        case StatisticType::COUNT: return "COUNT";
        case StatisticType::FIRST: return "FIRST";
        case StatisticType::LAST:  return "LAST";
    }
    return "FIRST";
}

std::optional<StatisticType> parse_statistic_keyword(const std::string& keyword) {
    const std::string upper = to_upper(keyword);
    if (upper == "SUM")   return StatisticType::SUM;
    if (upper == "MEAN")  return StatisticType::MEAN;
    if (upper == "MIN")   return StatisticType::MIN;
    if (upper == "MAX")   return StatisticType::MAX;
    if (upper == "RANGE") return StatisticType::RANGE;
    if (upper == "STD")   return StatisticType::STD;
    if (upper == "COUNT") return StatisticType::COUNT;
    if (upper == "FIRST") return StatisticType::FIRST;
    if (upper == "LAST")  return StatisticType::LAST;
    return std::nullopt;
}

DatasetRef DatasetRef::parse(const std::string& path) {
    DatasetRef ref;
    std::string working = path;
    while (working.size() > 1 && working.back() == '/') {
        working.pop_back();
    }

    const size_t slash = working.find_last_of('/');
    if (slash == std::string::npos) {
        ref.name = working;
    } else {
        ref.workspace = working.substr(0, slash);
        ref.name = working.substr(slash + 1);
    }

    // Only single-file table formats carry an extension on the dataset name;
    // a ".gpkg" or ".sde" component is the workspace itself.
    for (const char* ext : {".shp", ".dbf"}) {
        if (ends_with_ci(ref.name, ext)) {
            ref.extension = ref.name.substr(ref.name.size() - 4);
            ref.name = ref.name.substr(0, ref.name.size() - 4);
            break;
        }
    }
    return ref;
}

std::string DatasetRef::path() const {
    if (workspace.empty()) return name + extension;
    return workspace + "/" + name + extension;
}

bool DatasetRef::is_memory() const {
    return workspace.rfind("mem:", 0) == 0;
}

bool DatasetRef::is_remote() const {
    if (ends_with_ci(workspace, ".sde")) return true;
    const std::string upper = to_upper(workspace);
    for (const char* prefix : {"PG:", "MSSQL:", "OCI:", "MYSQL:"}) {
        if (upper.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INPUT_MISSING:   return "input-missing";
        case ErrorCategory::SCHEMA_MISMATCH: return "schema-mismatch";
        case ErrorCategory::ENGINE_FAILURE:  return "engine-operation-failure";
        case ErrorCategory::CLEANUP_FAILURE: return "cleanup-failure";
    }
    return "unknown";
}

} // namespace dsearch
