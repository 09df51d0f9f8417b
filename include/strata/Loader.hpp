/**
 * @file Loader.hpp
 * @brief Document loading
 *
 * Turns document text into a Value:
 * - JSON (using nlohmann::json, ordered)
 * - YAML (using yaml-cpp, core schema scalar resolution)
 * - TOML (using toml++, keys in source order)
 * - .env files (KEY=value lines, string values)
 *
 * Every loader keeps mapping keys in source order and keeps integers and
 * floats apart.
 */

#ifndef STRATA_LOADER_HPP
#define STRATA_LOADER_HPP

#include "strata/Value.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {

/// Supported document formats
enum class Format {
    Json,
    Yaml,
    Toml,
    Env
};

/// Lowercase format name ("json", "yaml", "toml", "env")
std::string format_name(Format format);

/**
 * @brief Format from a name such as "json" or "yml"
 * @throws Error for unknown names
 */
Format parse_format_name(const std::string& name);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Format implied by a file name
 *
 * .json -> Json, .yaml/.yml -> Yaml, .toml -> Toml, .env (or a file
 * named ".env") -> Env.
 *
 * @return Format, or nullopt for unknown extensions
 */
std::optional<Format> format_from_path(const std::string& path);

// ============================================================================
// Text parsing
// ============================================================================

/**
 * @brief Parse JSON text
 * @param text Document text
 * @param source Name used in error messages
 * @throws ParseError on syntax errors
 */
Value parse_json(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Parse YAML text (first document of the stream)
 *
 * Quoted and !!str scalars are strings; plain scalars go through
 * resolve_plain_scalar(). Empty input yields null.
 *
 * @throws ParseError on syntax errors or non-scalar mapping keys
 */
Value parse_yaml(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Parse TOML text
 *
 * Dates and times become strings. Keys are ordered by where they appear
 * in the source.
 *
 * @throws ParseError on syntax errors
 */
Value parse_toml(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Result of parsing .env text
 */
struct DotenvResult {
    /// Key-value pairs in file order
    std::vector<std::pair<std::string, std::string>> entries;
};

/**
 * @brief Parse .env text into key/value pairs
 *
 * - KEY=value lines, blank lines and '#' comments skipped
 * - optional "export " prefix
 * - single and double quoted values; escapes in double quotes
 * - inline comments after the value (outside quotes)
 * - lines without '=' are skipped
 */
DotenvResult parse_dotenv(const std::string& text);

/**
 * @brief Parse .env text into a flat mapping of strings
 *
 * A repeated key keeps its first position and its last value.
 */
Value parse_env(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Parse text in the given format
 * @throws ParseError
 */
Value parse_document(const std::string& text, Format format,
                     const std::string& source = "<string>");

// ============================================================================
// File loading
// ============================================================================

/**
 * @brief Read a whole file
 * @throws FileNotFoundError if the file does not exist
 * @throws Error if it cannot be read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Load a document from a file
 *
 * @param path File path
 * @param format Format to use; detected from the extension when absent
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws Error if the format can't be determined
 */
Value load_document(const std::string& path, std::optional<Format> format = std::nullopt);

} // namespace strata

#endif // STRATA_LOADER_HPP
