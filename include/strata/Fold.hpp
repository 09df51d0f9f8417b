/**
 * @file Fold.hpp
 * @brief Left-to-right merge of an ordered list of documents
 */

#ifndef STRATA_FOLD_HPP
#define STRATA_FOLD_HPP

#include "strata/Value.hpp"
#include "strata/Policy.hpp"

#include <string>
#include <vector>

namespace strata {

/**
 * @brief A document together with the name it came from
 *
 * The name is a file path, "<inline:N>" or "<overrides>"; it only shows up
 * in log output.
 */
struct Layer {
    std::string name;
    Value document;
};

/**
 * @brief Merge documents in order, lowest precedence first
 *
 * result = documents[0], then result = merge(result, documents[i]) for
 * each following document. A single document is returned unchanged.
 * The first MergeError stops the fold; later documents are not tried.
 *
 * @throws Error if documents is empty
 * @throws InvalidPolicyError if the policy does not validate
 * @throws MergeError from the failing merge, unchanged
 *
 * Example:
 * ```cpp
 * Value defaults = {{"a", 1}, {"b", 2}};
 * Value env      = {{"b", 3}, {"c", 4}};
 * Value instance = {{"c", 5}};
 *
 * auto result = fold_merge({defaults, env, instance}, MergePolicy{});
 * // Result: {"a": 1, "b": 3, "c": 5}
 * ```
 */
Value fold_merge(const std::vector<Value>& documents, const MergePolicy& policy);

/**
 * @brief Same as above for named layers, with progress logging
 *
 * Logs each applied layer at debug level and the layer that failed at
 * error level before rethrowing.
 */
Value fold_merge(const std::vector<Layer>& layers, const MergePolicy& policy);

} // namespace strata

#endif // STRATA_FOLD_HPP
