/**
 * @file Sources.hpp
 * @brief Turning command-line sources into ordered layers
 *
 * A source is one of:
 * - an inline JSON object ("{...}"), named "<inline:N>"
 * - a file path, loaded by extension (or a forced format)
 *
 * An overlay tree is a directory holding one file per name, optionally
 * repeated in sub-folders:
 *
 *   root/_default.json
 *   root/prod.yaml
 *   root/eu-west/_default.toml
 *   root/eu-west/prod.json
 *
 * discover_overlay_tree(root, {"prod"}, {"eu-west"}) lists those four in
 * that order: folders outermost, names innermost, "_default" first.
 */

#ifndef STRATA_SOURCES_HPP
#define STRATA_SOURCES_HPP

#include "strata/Fold.hpp"
#include "strata/Loader.hpp"
#include "strata/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

/// File name (without extension) of the lowest layer in each tree folder
inline constexpr const char* OVERLAY_DEFAULT_NAME = "_default";

/// Name of the layer built from --set overrides
inline constexpr const char* OVERRIDES_LAYER_NAME = "<overrides>";

/**
 * @brief Check if a source argument is an inline JSON object
 */
bool is_inline_source(const std::string& arg);

/**
 * @brief Load one source argument
 *
 * @param arg File path or inline JSON object text
 * @param index Position among the sources, used to name inline layers
 * @param format Forced input format for files; detected when absent
 * @return Layer named after the path or "<inline:index>"
 * @throws FileNotFoundError, ParseError, Error
 */
Layer resolve_source(const std::string& arg, std::size_t index,
                     std::optional<Format> format = std::nullopt);

/**
 * @brief Find the files of an overlay tree in precedence order
 *
 * For each folder in ["", subfolders...] and each name in
 * ["_default", names...], the first existing file among
 * <folder>/<name>.json, .yaml, .yml, .toml is listed. Missing files are
 * skipped.
 *
 * @throws FileNotFoundError if root is not a directory
 */
std::vector<std::string> discover_overlay_tree(const std::string& root,
                                               const std::vector<std::string>& names,
                                               const std::vector<std::string>& subfolders);

/**
 * @brief Build the overrides layer from PATH=VALUE assignments
 *
 * VALUE is typed with parse_value(); PATH is KeyPath text. Later
 * assignments to the same path win.
 *
 * @throws KeyPathError for a malformed path or a missing '='
 */
Layer build_override_layer(const std::vector<std::string>& assignments);

} // namespace strata

#endif // STRATA_SOURCES_HPP
