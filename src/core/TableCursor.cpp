/**
 * @file TableCursor.cpp
 * @brief Implementation of ordered row iteration over a dataset
 */

#include "TableCursor.hpp"
#include "ColumnSpec.hpp"
#include "FieldValues.hpp"

#include <algorithm>
#include <numeric>

namespace dsearch {

TableCursor::TableCursor(FeatureStore& store, std::string dataset)
    : store_(store), dataset_(std::move(dataset)), logger_("TableCursor") {
}

std::vector<std::string> TableCursor::set_order(const std::string& order_spec) {
    order_indices_.clear();
    std::vector<std::string> used;

    OGRLayer* layer = store_.open_layer(dataset_);
    if (!layer) {
        return used;
    }

    std::string normalized = order_spec;
    std::replace(normalized.begin(), normalized.end(), ';', ',');
    for (const auto& name : split_list(normalized, ',')) {
        const int index = find_field_index(layer->GetLayerDefn(), name);
        if (index < 0) {
            logger_.debug("Ignoring unknown order column " + name);
            continue;
        }
        order_indices_.push_back(index);
        used.push_back(name);
    }
    return used;
}

std::vector<size_t> TableCursor::sort_order(const std::vector<std::vector<FieldValue>>& keys) {
    std::vector<size_t> order(keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&keys](size_t a, size_t b) {
        const auto& left = keys[a];
        const auto& right = keys[b];
        for (size_t i = 0; i < left.size() && i < right.size(); ++i) {
            const int cmp = compare_values(left[i], right[i]);
            if (cmp != 0) {
                return cmp < 0;
            }
        }
        return false;
    });
    return order;
}

long TableCursor::for_each(const std::function<void(const OGRFeature&)>& visitor) {
    if (order_indices_.empty()) {
        long count = 0;
        const bool opened = store_.visit_features(dataset_, [&](OGRFeature& feature) {
            visitor(feature);
            ++count;
        });
        return opened ? count : -1;
    }

    OGRLayer* layer = store_.open_layer(dataset_);
    if (!layer) {
        return -1;
    }

    std::vector<GIntBig> ids;
    std::vector<std::vector<FieldValue>> keys;
    store_.visit_features(dataset_, [&](OGRFeature& feature) {
        std::vector<FieldValue> key;
        key.reserve(order_indices_.size());
        for (int index : order_indices_) {
            key.push_back(read_field_value(feature, index));
        }
        ids.push_back(feature.GetFID());
        keys.push_back(std::move(key));
    });

    long count = 0;
    for (size_t position : sort_order(keys)) {
        OGRFeatureUniquePtr feature(layer->GetFeature(ids[position]));
        if (!feature) {
            logger_.warning("Row " + std::to_string(ids[position]) + " of " + dataset_ + " disappeared while reading");
            continue;
        }
        visitor(*feature);
        ++count;
    }
    logger_.trace("Read " + std::to_string(count) + " sorted rows from " + dataset_);
    return count;
}

} // namespace dsearch
