#pragma once

/**
 * @file SchemaValidator.hpp
 * @brief Field and dataset existence checks
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dsearch {

class SchemaValidator {
public:
    explicit SchemaValidator(FeatureStore& store);

    /**
     * @brief Locate a field by name, then by alias
     *
     * Exact name match wins, then a case-insensitive name match, then a
     * case-insensitive alias match.
     *
     * @return Position in FeatureStore::list_fields order, or nullopt
     */
    static std::optional<size_t> find_field(const FieldList& fields, const std::string& name);

    bool field_exists(const std::string& dataset, const std::string& name);

    /**
     * @brief Keep the names that exist, preserving their order
     * @param missing Receives the names that do not exist
     */
    std::vector<std::string> filter_existing(const std::string& dataset,
                                             const std::vector<std::string>& names,
                                             std::vector<std::string>* missing = nullptr);

    /**
     * @brief Whether a dataset or table exists
     *
     * A single-file dataset exists when its file is on disk. A dataset in a
     * remote (server) workspace is assumed to exist. Anything else is looked
     * up by name in its workspace; an unreadable workspace counts as absent.
     */
    bool dataset_exists(const std::string& name_or_path);

private:
    FeatureStore& store_;
    Logger logger_;
};

} // namespace dsearch
