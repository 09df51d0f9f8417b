/**
 * @file Policy.cpp
 * @brief Merge policy names, validation and layered configuration
 */

#include "strata/Policy.hpp"
#include "strata/Errors.hpp"
#include "strata/Fold.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace strata {

namespace {
    constexpr const char* kComponent = "policy";

    /// Policy fields, in the order they are rendered
    const std::vector<std::string> kFields = {
        "list_strategy", "list_key", "null_override", "type_mismatch", "max_depth"
    };

    /**
     * @brief Lowercase and map '-' to '_' so "Union-By-Key" == "union_by_key"
     */
    std::string normalize_name(const std::string& name) {
        std::string out;
        out.reserve(name.size());
        for (unsigned char c : name) {
            if (std::isspace(c)) continue;
            out += c == '-' ? '_' : static_cast<char>(std::tolower(c));
        }
        return out;
    }

    std::optional<std::string> get_env_var(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    const std::string& expect_string(const Value& v, const std::string& field) {
        if (!v.is_string()) {
            throw InvalidPolicyError(field, "expected a string, got " + type_name(v));
        }
        return v.get_ref<const std::string&>();
    }

    std::size_t parse_max_depth(const Value& v) {
        if (v.is_number_unsigned()) {
            return static_cast<std::size_t>(v.get<std::uint64_t>());
        }
        if (v.is_number_integer()) {
            const auto n = v.get<std::int64_t>();
            if (n < 0) {
                throw InvalidPolicyError("max_depth", "must not be negative");
            }
            return static_cast<std::size_t>(n);
        }
        if (v.is_string()) {
            const auto& s = v.get_ref<const std::string&>();
            if (s.empty() || !std::all_of(s.begin(), s.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
                throw InvalidPolicyError("max_depth", "expected a non-negative integer, got '" + s + "'");
            }
            try {
                return static_cast<std::size_t>(std::stoull(s));
            } catch (const std::out_of_range&) {
                throw InvalidPolicyError("max_depth", "value out of range: '" + s + "'");
            }
        }
        throw InvalidPolicyError("max_depth", "expected an integer, got " + type_name(v));
    }
}

// ============================================================================
// Validation
// ============================================================================

void MergePolicy::validate() const {
    if (list_strategy == ListStrategy::UnionByKey && list_key.empty()) {
        throw InvalidPolicyError("list_key", "union_by_key needs a key field");
    }
    if (max_depth == 0) {
        throw InvalidPolicyError("max_depth", "must be at least 1");
    }
}

// ============================================================================
// Names
// ============================================================================

std::string to_string(ListStrategy s) {
    switch (s) {
        case ListStrategy::Replace: return "replace";
        case ListStrategy::Concatenate: return "concatenate";
        case ListStrategy::UnionByKey: return "union_by_key";
    }
    return "unknown";
}

std::string to_string(NullOverride n) {
    switch (n) {
        case NullOverride::OverlayNullWins: return "overlay_null_wins";
        case NullOverride::BaseWins: return "base_wins";
    }
    return "unknown";
}

std::string to_string(TypeMismatch t) {
    switch (t) {
        case TypeMismatch::OverlayWins: return "overlay_wins";
        case TypeMismatch::Error: return "error";
    }
    return "unknown";
}

ListStrategy parse_list_strategy(const std::string& name) {
    const std::string n = normalize_name(name);
    if (n == "replace") return ListStrategy::Replace;
    if (n == "concatenate" || n == "concat" || n == "append") return ListStrategy::Concatenate;
    if (n == "union_by_key" || n == "union") return ListStrategy::UnionByKey;
    throw InvalidPolicyError("list_strategy",
                             "unknown value '" + name + "' (expected replace, concatenate or union_by_key)");
}

NullOverride parse_null_override(const std::string& name) {
    const std::string n = normalize_name(name);
    if (n == "overlay_null_wins" || n == "overlay") return NullOverride::OverlayNullWins;
    if (n == "base_wins" || n == "base" || n == "transparent") return NullOverride::BaseWins;
    throw InvalidPolicyError("null_override",
                             "unknown value '" + name + "' (expected overlay_null_wins or base_wins)");
}

TypeMismatch parse_type_mismatch(const std::string& name) {
    const std::string n = normalize_name(name);
    if (n == "overlay_wins" || n == "overlay") return TypeMismatch::OverlayWins;
    if (n == "error" || n == "strict") return TypeMismatch::Error;
    throw InvalidPolicyError("type_mismatch",
                             "unknown value '" + name + "' (expected overlay_wins or error)");
}

// ============================================================================
// Value conversion
// ============================================================================

Value policy_to_value(const MergePolicy& policy) {
    Value out = Value::object();
    out["list_strategy"] = to_string(policy.list_strategy);
    out["list_key"] = policy.list_key;
    out["null_override"] = to_string(policy.null_override);
    out["type_mismatch"] = to_string(policy.type_mismatch);
    out["max_depth"] = static_cast<std::uint64_t>(policy.max_depth);
    return out;
}

MergePolicy policy_from_value(const Value& data) {
    if (!data.is_object()) {
        throw InvalidPolicyError("<root>", "policy must be a mapping, got " + type_name(data));
    }

    MergePolicy policy;
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string& field = it.key();
        const Value& v = it.value();

        if (field == "list_strategy") {
            policy.list_strategy = parse_list_strategy(expect_string(v, field));
        } else if (field == "list_key") {
            policy.list_key = expect_string(v, field);
        } else if (field == "null_override") {
            policy.null_override = parse_null_override(expect_string(v, field));
        } else if (field == "type_mismatch") {
            policy.type_mismatch = parse_type_mismatch(expect_string(v, field));
        } else if (field == "max_depth") {
            policy.max_depth = parse_max_depth(v);
        } else {
            throw InvalidPolicyError(field, "unknown policy field");
        }
    }
    return policy;
}

// ============================================================================
// Layered configuration
// ============================================================================

Value policy_env_layer() {
    Value layer = Value::object();
    for (const auto& field : kFields) {
        std::string var = POLICY_ENV_PREFIX;
        for (unsigned char c : field) var += static_cast<char>(std::toupper(c));

        if (auto value = get_env_var(var)) {
            STRATA_LOG_DEBUG(kComponent, var << "=" << *value);
            layer[field] = *value;
        }
    }
    return layer;
}

MergePolicy load_policy(const PolicyOptions& opts) {
    std::vector<Layer> layers;

    // 1) defaults
    layers.push_back(Layer{"<defaults>", policy_to_value(MergePolicy{})});

    // 2) file
    if (opts.policy_file.has_value()) {
        Value file = load_document(*opts.policy_file);
        if (!file.is_object()) {
            throw InvalidPolicyError("<root>", "policy file '" + *opts.policy_file +
                                                   "' must hold a mapping, got " + type_name(file));
        }
        layers.push_back(Layer{*opts.policy_file, std::move(file)});
    }

    // 3) env
    if (opts.use_environment) {
        layers.push_back(Layer{"<environment>", policy_env_layer()});
    }

    // 4) overrides
    Value overrides = Value::object();
    for (const auto& [field, value] : opts.overrides) {
        overrides[field] = value;
    }
    layers.push_back(Layer{"<flags>", std::move(overrides)});

    // Policy documents are flat; any policy that replaces scalars will do
    MergePolicy layering;
    layering.list_strategy = ListStrategy::Replace;

    MergePolicy policy = policy_from_value(fold_merge(layers, layering));
    policy.validate();

    STRATA_LOG_INFO(kComponent, "list_strategy=" << to_string(policy.list_strategy)
                                << (policy.list_key.empty() ? "" : " list_key=" + policy.list_key)
                                << " null_override=" << to_string(policy.null_override)
                                << " type_mismatch=" << to_string(policy.type_mismatch)
                                << " max_depth=" << policy.max_depth);
    return policy;
}

} // namespace strata
