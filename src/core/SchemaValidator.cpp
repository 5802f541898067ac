/**
 * @file SchemaValidator.cpp
 * @brief Implementation of dataset and field existence checks
 */

#include "SchemaValidator.hpp"
#include "ColumnSpec.hpp"

#include <filesystem>
#include <system_error>

namespace dsearch {

SchemaValidator::SchemaValidator(FeatureStore& store)
    : store_(store), logger_("SchemaValidator") {
}

std::optional<size_t> SchemaValidator::find_field(const FieldList& fields, const std::string& name) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name == name) return i;
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        if (iequals(fields[i].name, name)) return i;
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!fields[i].alias.empty() && iequals(fields[i].alias, name)) return i;
    }
    return std::nullopt;
}

bool SchemaValidator::field_exists(const std::string& dataset, const std::string& name) {
    return find_field(store_.list_fields(dataset), name).has_value();
}

std::vector<std::string> SchemaValidator::filter_existing(const std::string& dataset,
                                                          const std::vector<std::string>& names,
                                                          std::vector<std::string>* missing) {
    const FieldList fields = store_.list_fields(dataset);
    std::vector<std::string> existing;
    for (const auto& name : names) {
        if (find_field(fields, name)) {
            existing.push_back(name);
        } else if (missing) {
            missing->push_back(name);
        }
    }
    return existing;
}

bool SchemaValidator::dataset_exists(const std::string& name_or_path) {
    const DatasetRef ref = store_.resolve(name_or_path);
    if (ref.empty()) {
        return false;
    }

    if (ref.is_single_file() && !ref.is_memory()) {
        std::error_code ec;
        bool present = std::filesystem::exists(ref.path(), ec);
        if (ec) {
            logger_.debug("Cannot check " + ref.path() + ": " + ec.message());
            return false;
        }
        return present;
    }

    if (ref.is_remote()) {
        logger_.trace("Assuming remote dataset exists: " + ref.path());
        return true;
    }

    return store_.layer_exists(ref);
}

} // namespace dsearch
