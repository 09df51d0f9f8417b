/**
 * @file Fold.cpp
 * @brief Implementation of the left-to-right fold
 */

#include "strata/Fold.hpp"
#include "strata/Merge.hpp"
#include "strata/Errors.hpp"
#include "strata/Log.hpp"

namespace strata {

namespace {
    constexpr const char* kComponent = "fold";
}

Value fold_merge(const std::vector<Value>& documents, const MergePolicy& policy) {
    if (documents.empty()) {
        throw Error("Nothing to merge: at least one document is required");
    }
    policy.validate();

    Value result = documents[0];
    for (std::size_t i = 1; i < documents.size(); ++i) {
        result = merge(result, documents[i], policy);
    }

    return result;
}

Value fold_merge(const std::vector<Layer>& layers, const MergePolicy& policy) {
    if (layers.empty()) {
        throw Error("Nothing to merge: at least one document is required");
    }
    policy.validate();

    STRATA_LOG_INFO(kComponent, "merging " << layers.size() << " layer(s): list_strategy="
                                           << to_string(policy.list_strategy)
                                           << " null_override=" << to_string(policy.null_override)
                                           << " type_mismatch=" << to_string(policy.type_mismatch));
    STRATA_LOG_DEBUG(kComponent, "base layer: " << layers[0].name);

    Value result = layers[0].document;
    for (std::size_t i = 1; i < layers.size(); ++i) {
        STRATA_LOG_DEBUG(kComponent, "applying layer " << i << ": " << layers[i].name);
        try {
            result = merge(result, layers[i].document, policy);
        } catch (const MergeError& e) {
            STRATA_LOG_ERROR(kComponent, "layer " << i << " (" << layers[i].name
                                                  << ") failed: " << e.what());
            throw;
        }
    }

    return result;
}

} // namespace strata
