#pragma once

/**
 * @file FieldProjector.hpp
 * @brief Cleans an output column specification against a dataset schema
 */

#include "../../include/data_search.hpp"
#include "Logger.hpp"
#include "SchemaValidator.hpp"

#include <string>
#include <vector>

namespace dsearch {

/**
 * @brief Result of projecting a column specification onto a schema
 *
 * An empty projection means "nothing to export" and is not an error.
 */
struct Projection {
    std::string cleaned_spec;          // surviving tokens joined with ','
    std::vector<std::string> tokens;   // literals and field names, in order
    std::vector<std::string> missing;  // unknown field names, in order

    bool empty() const { return tokens.empty(); }
};

class FieldProjector {
public:
    explicit FieldProjector(FeatureStore& store);

    /**
     * @brief Project a specification onto a field list
     *
     * Quoted literal tokens pass through without validation. Field tokens
     * that do not resolve by name or alias are removed and collected.
     */
    static Projection project(const std::string& column_spec, const FieldList& fields,
                              char delimiter = ',');

    /**
     * @brief Project onto a dataset and log the missing names once
     */
    Projection project(const std::string& column_spec, const std::string& dataset,
                       char delimiter = ',');

private:
    FeatureStore& store_;
    Logger logger_;
};

} // namespace dsearch
