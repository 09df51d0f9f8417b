/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "strata/Merge.hpp"
#include "strata/Errors.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace strata {

namespace {

Value merge_at(const Value& base, const Value& overlay, const MergePolicy& policy,
               const KeyPath& path);

/**
 * @brief Key value of a union-by-key element, or throw MissingMergeKey
 */
const Value& merge_key_of(const Value& element, const std::string& key_field,
                          const KeyPath& element_path, const char* side) {
    if (element.is_object()) {
        auto it = element.find(key_field);
        if (it != element.end()) {
            return *it;
        }
    }
    throw MergeError(MergeErrorKind::MissingMergeKey, element_path, "sequence", "sequence",
                     std::string(side) + " element (" + type_name(element) +
                         ") has no '" + key_field + "' key");
}

Value merge_union_by_key(const Value& base, const Value& overlay, const MergePolicy& policy,
                         const KeyPath& path) {
    Value result = base;

    // (key, position in result) in registration order; the first key that
    // compares == is the match target. A NaN key never matches.
    std::vector<std::pair<Value, std::size_t>> positions;
    positions.reserve(base.size() + overlay.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        positions.emplace_back(merge_key_of(base[i], policy.list_key, path.index(i), "base"), i);
    }
    for (std::size_t j = 0; j < overlay.size(); ++j) {
        merge_key_of(overlay[j], policy.list_key, path.index(j), "overlay");
    }

    for (const auto& element : overlay) {
        const Value& key = element.at(policy.list_key);
        auto found = std::find_if(positions.begin(), positions.end(),
                                  [&key](const auto& entry) { return entry.first == key; });
        if (found == positions.end()) {
            positions.emplace_back(key, result.size());
            result.push_back(element);
        } else {
            const std::size_t pos = found->second;
            result[pos] = merge_at(result[pos], element, policy, path.index(pos));
        }
    }

    return result;
}

Value merge_sequences(const Value& base, const Value& overlay, const MergePolicy& policy,
                      const KeyPath& path) {
    switch (policy.list_strategy) {
        case ListStrategy::Replace:
            return overlay;

        case ListStrategy::Concatenate: {
            Value result = base;
            for (const auto& element : overlay) {
                result.push_back(element);
            }
            return result;
        }

        case ListStrategy::UnionByKey:
            return merge_union_by_key(base, overlay, policy, path);
    }
    return overlay;
}

Value merge_mappings(const Value& base, const Value& overlay, const MergePolicy& policy,
                     const KeyPath& path) {
    Value result = Value::object();

    // Base keys first, in base order
    for (auto it = base.begin(); it != base.end(); ++it) {
        auto found = overlay.find(it.key());
        if (found == overlay.end()) {
            result[it.key()] = it.value();
        } else {
            result[it.key()] = merge_at(it.value(), *found, policy, path.child(it.key()));
        }
    }

    // Then overlay-only keys, in overlay order
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (!base.contains(it.key())) {
            result[it.key()] = it.value();
        }
    }

    return result;
}

Value merge_at(const Value& base, const Value& overlay, const MergePolicy& policy,
               const KeyPath& path) {
    const ValueKind base_kind = kind_of(base);
    const ValueKind overlay_kind = kind_of(overlay);

    // Only containers merged from both sides are walked; a container whose
    // path is longer than max_depth is too deep. Scalar leaves are not.
    const bool walks = (base_kind == ValueKind::Mapping && overlay_kind == ValueKind::Mapping) ||
                       (base_kind == ValueKind::Sequence && overlay_kind == ValueKind::Sequence);
    if (walks && path.size() > policy.max_depth) {
        throw MergeError(MergeErrorKind::DepthExceeded, path,
                         type_name(base), type_name(overlay),
                         "nesting exceeds max_depth " + std::to_string(policy.max_depth));
    }

    // Null overlay means "no override" when the base wins
    if (overlay_kind == ValueKind::Null && policy.null_override == NullOverride::BaseWins) {
        return base;
    }

    if (base_kind == ValueKind::Mapping && overlay_kind == ValueKind::Mapping) {
        return merge_mappings(base, overlay, policy, path);
    }

    if (base_kind == ValueKind::Sequence && overlay_kind == ValueKind::Sequence) {
        return merge_sequences(base, overlay, policy, path);
    }

    // Same scalar kind, or a null on either side: overlay wins
    if (base_kind == overlay_kind || base_kind == ValueKind::Null ||
        overlay_kind == ValueKind::Null) {
        return overlay;
    }

    // Incompatible kinds
    if (policy.type_mismatch == TypeMismatch::Error) {
        throw MergeError(MergeErrorKind::TypeConflict, path,
                         type_name(base), type_name(overlay));
    }
    return overlay;
}

} // anonymous namespace

Value merge(const Value& base, const Value& overlay, const MergePolicy& policy,
            const KeyPath& path) {
    policy.validate();
    return merge_at(base, overlay, policy, path);
}

} // namespace strata
