/**
 * @file FieldProjector.cpp
 * @brief Implementation of column list projection against a dataset's fields
 */

#include "FieldProjector.hpp"
#include "ColumnSpec.hpp"

namespace dsearch {

FieldProjector::FieldProjector(FeatureStore& store)
    : store_(store), logger_("FieldProjector") {
}

Projection FieldProjector::project(const std::string& column_spec, const FieldList& fields,
                                   char delimiter) {
    Projection result;
    for (const auto& token : split_list(column_spec, delimiter)) {
        if (is_literal_token(token) || SchemaValidator::find_field(fields, token)) {
            result.tokens.push_back(token);
        } else {
            result.missing.push_back(token);
        }
    }
    result.cleaned_spec = join_list(result.tokens, std::string(1, delimiter));
    return result;
}

Projection FieldProjector::project(const std::string& column_spec, const std::string& dataset,
                                   char delimiter) {
    Projection result = project(column_spec, store_.list_fields(dataset), delimiter);
    if (!result.missing.empty()) {
        logger_.warning("The following columns cannot be found in " + dataset + ": " +
                        join_list(result.missing, ", "));
    }
    logger_.trace("Projected columns for " + dataset + ": " + result.cleaned_spec);
    return result;
}

} // namespace dsearch
