/**
 * @file CsvSerializer.cpp
 * @brief Implementation of delimited text output
 */

#include "CsvSerializer.hpp"
#include "../core/ColumnSpec.hpp"
#include "../core/FieldProjector.hpp"
#include "../core/FieldValues.hpp"
#include "../core/SchemaValidator.hpp"
#include "../core/TableCursor.hpp"

#include <cpl_conv.h>

#include <cmath>
#include <filesystem>
#include <fstream>

namespace dsearch {

namespace {

struct ColumnBinding {
    enum class Kind { LITERAL, FEATURE_ID, GEOMETRY, ATTRIBUTE };

    Kind kind = Kind::LITERAL;
    std::string literal;
    int index = -1;
    bool truncate = false;
};

std::string geometry_text(const OGRFeature& feature) {
    const OGRGeometry* geometry = feature.GetGeometryRef();
    if (!geometry) {
        return "";
    }
    char* wkt = nullptr;
    if (geometry->exportToWkt(&wkt) != OGRERR_NONE || !wkt) {
        CPLFree(wkt);
        return "";
    }
    std::string text(wkt);
    CPLFree(wkt);
    return text;
}

} // anonymous namespace

CsvSerializer::CsvSerializer(FeatureStore& store)
    : store_(store), logger_("CsvSerializer") {
}

std::string CsvSerializer::quote_if_needed(const std::string& text) {
    if (text.find(',') != std::string::npos) {
        return "\"" + text + "\"";
    }
    return text;
}

std::string CsvSerializer::format_value(const FieldValue& value, bool truncate_to_integer) {
    if (is_null(value)) {
        return "";
    }
    if (truncate_to_integer) {
        if (auto number = numeric_value(value)) {
            return std::to_string(static_cast<long long>(std::trunc(*number)));
        }
    }
    return quote_if_needed(value_to_string(value));
}

long CsvSerializer::write_csv(const std::string& dataset, const std::string& path,
                              const std::string& columns, const Options& options) {
    SchemaValidator validator(store_);
    if (!validator.dataset_exists(dataset)) {
        logger_.error("Input table " + dataset + " does not exist");
        return -1;
    }

    FieldProjector projector(store_);
    const Projection projection = projector.project(columns, dataset);
    if (projection.empty()) {
        logger_.info("No columns to export from " + dataset);
        return 0;
    }

    OGRLayer* layer = store_.open_layer(dataset);
    if (!layer) {
        logger_.error("Cannot open " + dataset);
        return -1;
    }
    OGRFeatureDefn* definition = layer->GetLayerDefn();
    const FieldList fields = store_.list_fields(dataset);

    std::vector<ColumnBinding> bindings;
    for (const auto& token : projection.tokens) {
        ColumnBinding binding;
        if (is_literal_token(token)) {
            binding.literal = token;
            bindings.push_back(binding);
            continue;
        }

        binding.index = find_field_index(definition, token);
        if (binding.index >= 0) {
            binding.kind = ColumnBinding::Kind::ATTRIBUTE;
            binding.truncate = std::string(definition->GetFieldDefn(binding.index)->GetNameRef()) == DISTANCE_FIELD;
        } else {
            auto position = SchemaValidator::find_field(fields, token);
            const bool is_geometry = position && fields[*position].type == FieldType::GEOMETRY;
            binding.kind = is_geometry ? ColumnBinding::Kind::GEOMETRY : ColumnBinding::Kind::FEATURE_ID;
        }
        bindings.push_back(binding);
    }

    // Length to restore if appending fails part way
    std::optional<std::uintmax_t> kept_size;
    if (options.append) {
        std::error_code size_error;
        const std::uintmax_t size = std::filesystem::file_size(path, size_error);
        if (!size_error) {
            kept_size = size;
        }
    }

    std::ofstream file(path, options.append ? std::ios::app : std::ios::trunc);
    if (!file) {
        logger_.error("Cannot open " + path + " for writing");
        return -1;
    }

    if (!options.append && !options.exclude_header) {
        file << projection.cleaned_spec << "\n";
    }

    TableCursor cursor(store_, dataset);
    cursor.set_order(options.order_columns);

    const long rows = cursor.for_each([&](const OGRFeature& feature) {
        std::string line;
        for (size_t i = 0; i < bindings.size(); ++i) {
            const ColumnBinding& binding = bindings[i];
            if (i > 0) {
                line += ",";
            }
            switch (binding.kind) {
                case ColumnBinding::Kind::LITERAL:
                    line += binding.literal;
                    break;
                case ColumnBinding::Kind::FEATURE_ID:
                    line += std::to_string(feature.GetFID());
                    break;
                case ColumnBinding::Kind::GEOMETRY:
                    line += quote_if_needed(geometry_text(feature));
                    break;
                case ColumnBinding::Kind::ATTRIBUTE:
                    line += format_value(read_field_value(feature, binding.index), binding.truncate);
                    break;
            }
        }
        file << line << "\n";
    });

    file.close();
    if (rows < 0) {
        logger_.error("Cannot read rows of " + dataset);
        discard_partial(path, kept_size);
        return -1;
    }
    if (file.fail()) {
        logger_.error("Failed writing " + path);
        discard_partial(path, kept_size);
        return -1;
    }

    logger_.info(std::to_string(rows) + " rows written to " + path);
    return rows;
}

void CsvSerializer::discard_partial(const std::string& path, const std::optional<std::uintmax_t>& kept_size) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return;
    }

    if (kept_size) {
        std::filesystem::resize_file(path, *kept_size, error);
    } else {
        std::filesystem::remove(path, error);
    }
    if (error) {
        logger_.warning("Cannot discard partial output " + path + ": " + error.message());
    } else {
        logger_.detailed("Discarded partial output " + path);
    }
}

bool CsvSerializer::write_empty_csv(const std::string& path, const std::string& header) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        logger_.error("Cannot create " + path);
        return false;
    }
    if (!header.empty()) {
        file << header << "\n";
    }
    file.close();
    if (file.fail()) {
        logger_.error("Failed writing " + path);
        return false;
    }
    logger_.detailed("Created empty table " + path);
    return true;
}

} // namespace dsearch
