/**
 * @file TemporaryResources.cpp
 * @brief Implementation of scratch dataset and field cleanup
 */

#include "TemporaryResources.hpp"
#include "SchemaValidator.hpp"

namespace dsearch {

TemporaryResourceScope::TemporaryResourceScope(FeatureStore& store, GeoprocessingEngine& engine,
                                               std::chrono::milliseconds poll_interval)
    : store_(store), engine_(engine), poll_interval_(poll_interval), logger_("TempResources") {
}

TemporaryResourceScope::~TemporaryResourceScope() {
    release();
}

std::string TemporaryResourceScope::track(const std::string& session_name, const DatasetRef& ref) {
    Resource resource{session_name, ref};
    std::vector<std::string> failures;
    remove(resource, failures);
    resources_.push_back(resource);
    return ref.path();
}

void TemporaryResourceScope::track_field(const std::string& dataset, const std::string& field) {
    fields_.push_back(AddedField{dataset, field});
}

std::vector<std::string> TemporaryResourceScope::release() {
    std::vector<std::string> failures;
    for (const auto& added : fields_) {
        remove(added, failures);
    }
    fields_.clear();
    for (const auto& resource : resources_) {
        remove(resource, failures);
    }
    resources_.clear();
    return failures;
}

void TemporaryResourceScope::remove(const Resource& resource, std::vector<std::string>& failures) {
    while (store_.is_loaded(resource.session_name)) {
        if (!store_.remove_first(resource.session_name)) {
            break;
        }
        logger_.trace("Removed " + resource.session_name + " from the session");
    }

    if (!store_.layer_exists(resource.ref)) {
        return;
    }

    try {
        run_tool(engine_, "Delete", {{"in_data", resource.ref.path()}}, poll_interval_);
        logger_.trace("Deleted temporary dataset " + resource.ref.path());
    } catch (const std::exception& e) {
        const std::string message = "Cannot delete temporary dataset " + resource.ref.path() + ": " + e.what();
        logger_.warning(message);
        failures.push_back(message);
    }
}

void TemporaryResourceScope::remove(const AddedField& added, std::vector<std::string>& failures) {
    if (!SchemaValidator(store_).field_exists(added.dataset, added.field)) {
        return;
    }

    try {
        run_tool(engine_, "DeleteField", {
            {"in_table", added.dataset},
            {"drop_field", added.field},
        }, poll_interval_);
        logger_.trace("Deleted field " + added.field + " from " + added.dataset);
    } catch (const std::exception& e) {
        const std::string message = "Cannot delete field " + added.field + " from " + added.dataset + ": " + e.what();
        logger_.warning(message);
        failures.push_back(message);
    }
}

} // namespace dsearch
