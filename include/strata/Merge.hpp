/**
 * @file Merge.hpp
 * @brief Deep merge of two configuration values
 *
 * Rules, first match wins:
 * 1. Overlay is null and null_override=base_wins: base is kept
 * 2. Both mappings: keys merged recursively; base keys first in base
 *    order, then overlay-only keys in overlay order
 * 3. Both sequences: list_strategy (replace, concatenate, union_by_key)
 * 4. Same scalar kind, or either side null: overlay wins
 * 5. Different kinds: type_mismatch (overlay wins, or TypeConflict)
 */

#ifndef STRATA_MERGE_HPP
#define STRATA_MERGE_HPP

#include "strata/Value.hpp"
#include "strata/KeyPath.hpp"
#include "strata/Policy.hpp"

namespace strata {

/**
 * @brief Deep merge overlay onto base
 *
 * Neither input is modified; the result is a new value. The function is
 * pure and may be called from several threads on unrelated inputs.
 *
 * @param base Base value (lower precedence)
 * @param overlay Overlay value (higher precedence)
 * @param policy Conflict-resolution choices (validated on entry)
 * @param path Location of base/overlay inside their documents, used only
 *             to attribute errors
 * @return Merged result
 * @throws InvalidPolicyError if the policy does not validate
 * @throws MergeError on the first conflict the policy does not resolve
 *
 * Examples:
 * ```cpp
 * MergePolicy policy;
 * Value base = {{"db", {{"host", "a"}, {"port", 1}}}};
 * Value over = {{"db", {{"port", 2}}}};
 * auto result = merge(base, over, policy);
 * // Result: {"db": {"host": "a", "port": 2}}
 *
 * policy.list_strategy = ListStrategy::Replace;
 * merge({{"l", {1, 2}}}, {{"l", {3}}}, policy);
 * // Result: {"l": [3]}
 * ```
 */
Value merge(const Value& base, const Value& overlay, const MergePolicy& policy,
            const KeyPath& path = KeyPath());

} // namespace strata

#endif // STRATA_MERGE_HPP
