#pragma once

/**
 * @file TableCursor.hpp
 * @brief Read cursor over a dataset, optionally sorted
 *
 * Unsorted iteration streams features in store order. Sorting first
 * materializes the ordering keys of every row (with its feature id), sorts
 * them ascending and then fetches rows one at a time in that order.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Logger.hpp"

#include <functional>
#include <string>
#include <vector>

namespace dsearch {

class TableCursor {
public:
    TableCursor(FeatureStore& store, std::string dataset);

    /**
     * @brief Set the ordering columns (',' or ';' separated)
     *
     * Columns that do not exist are ignored.
     * @return The columns that will be used
     */
    std::vector<std::string> set_order(const std::string& order_spec);

    /**
     * @brief Visit every (selected) row in order
     * @return Number of rows visited, or -1 if the dataset cannot be opened
     */
    long for_each(const std::function<void(const OGRFeature&)>& visitor);

    /**
     * @brief Stable ascending permutation of key rows (case-insensitive text)
     */
    static std::vector<size_t> sort_order(const std::vector<std::vector<FieldValue>>& keys);

private:
    FeatureStore& store_;
    std::string dataset_;
    std::vector<int> order_indices_;
    Logger logger_;
};

} // namespace dsearch
