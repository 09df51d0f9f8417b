/**
 * @file Policy.hpp
 * @brief Merge policy: conflict-resolution choices for one merge run
 *
 * A MergePolicy is plain data. It is built once per invocation, validated,
 * and then applied uniformly to every path of every layer.
 *
 * Policy configuration follows the usual precedence, lowest first:
 *   defaults -> policy file -> STRATA_* environment -> explicit overrides
 */

#ifndef STRATA_POLICY_HPP
#define STRATA_POLICY_HPP

#include "strata/Value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace strata {

/// How two sequences at the same path are combined
enum class ListStrategy {
    Replace,      ///< overlay sequence replaces base sequence
    Concatenate,  ///< base elements followed by overlay elements
    UnionByKey    ///< mapping elements matched on a key field and merged
};

/// What a null in the overlay means
enum class NullOverride {
    OverlayNullWins,  ///< null replaces the base value
    BaseWins          ///< null means "no override here"
};

/// What happens when base and overlay have incompatible kinds
enum class TypeMismatch {
    OverlayWins,  ///< overlay replaces base structure
    Error         ///< raise MergeError{TypeConflict}
};

/**
 * @brief Complete set of merge choices
 *
 * Defaults: concatenate lists, overlay null wins, overlay wins on type
 * mismatch, 128 levels of nesting.
 */
struct MergePolicy {
    ListStrategy list_strategy = ListStrategy::Concatenate;
    std::string list_key;  ///< key field for ListStrategy::UnionByKey
    NullOverride null_override = NullOverride::OverlayNullWins;
    TypeMismatch type_mismatch = TypeMismatch::OverlayWins;
    std::size_t max_depth = 128;

    /**
     * @brief Check the policy is usable
     * @throws InvalidPolicyError if union_by_key has no key field or
     *         max_depth is zero
     */
    void validate() const;

    bool operator==(const MergePolicy& other) const {
        return list_strategy == other.list_strategy && list_key == other.list_key &&
               null_override == other.null_override &&
               type_mismatch == other.type_mismatch && max_depth == other.max_depth;
    }
    bool operator!=(const MergePolicy& other) const { return !(*this == other); }
};

// ============================================================================
// Names
// ============================================================================

std::string to_string(ListStrategy s);
std::string to_string(NullOverride n);
std::string to_string(TypeMismatch t);

/**
 * @brief Parse option names (case-insensitive, '-' and '_' are equivalent)
 *
 * Accepted spellings:
 * - list strategy: replace | concatenate, concat, append | union_by_key, union
 * - null override: overlay_null_wins, overlay | base_wins, base, transparent
 * - type mismatch: overlay_wins, overlay | error, strict
 *
 * @throws InvalidPolicyError for unknown names
 */
ListStrategy parse_list_strategy(const std::string& name);
NullOverride parse_null_override(const std::string& name);
TypeMismatch parse_type_mismatch(const std::string& name);

// ============================================================================
// Value conversion
// ============================================================================

/**
 * @brief Render a policy as a mapping
 *
 * Keys: list_strategy, list_key, null_override, type_mismatch, max_depth.
 */
Value policy_to_value(const MergePolicy& policy);

/**
 * @brief Build a policy from a mapping
 *
 * Missing keys keep their default. Unknown keys are rejected. max_depth
 * may be an integer or a string holding one.
 *
 * @throws InvalidPolicyError on unknown keys or bad values
 */
MergePolicy policy_from_value(const Value& data);

// ============================================================================
// Layered configuration
// ============================================================================

/// Environment variable prefix for policy settings
inline constexpr const char* POLICY_ENV_PREFIX = "STRATA_";

/**
 * @brief Where to look for policy settings
 */
struct PolicyOptions {
    std::optional<std::string> policy_file;  ///< JSON/YAML/TOML mapping
    bool use_environment = true;             ///< read STRATA_* variables
    std::map<std::string, std::string> overrides;  ///< field -> value, final precedence
};

/**
 * @brief Collect policy fields from STRATA_* environment variables
 *
 * STRATA_LIST_STRATEGY, STRATA_LIST_KEY, STRATA_NULL_OVERRIDE,
 * STRATA_TYPE_MISMATCH, STRATA_MAX_DEPTH. Unset variables are omitted.
 */
Value policy_env_layer();

/**
 * @brief Build and validate the policy
 *
 * Layers defaults, the policy file, the environment and the overrides
 * with the fold driver, converts the result and validates it.
 *
 * @throws InvalidPolicyError, FileNotFoundError, ParseError
 */
MergePolicy load_policy(const PolicyOptions& opts);

} // namespace strata

#endif // STRATA_POLICY_HPP
