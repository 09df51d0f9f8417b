/**
 * @file Writer.hpp
 * @brief Document serialization
 *
 * JSON and YAML output read back to an equal Value (key order, sequence
 * order and scalar kinds preserved). TOML and .env output are lossy:
 * - TOML needs a mapping at the root, has no null, and toml++ writes
 *   table keys in its own sorted order
 * - .env is flat: nested keys become dotted paths, sequences become JSON
 *   text, null becomes an empty value
 */

#ifndef STRATA_WRITER_HPP
#define STRATA_WRITER_HPP

#include "strata/Value.hpp"
#include "strata/Loader.hpp"

#include <string>

namespace strata {

/**
 * @brief Options for serialize()
 */
struct WriteOptions {
    int indent = 2;  ///< JSON indent; negative writes a single line
};

std::string to_json_string(const Value& value, int indent = 2);
std::string to_yaml_string(const Value& value);
std::string to_toml_string(const Value& value);
std::string to_env_string(const Value& value);

/**
 * @brief Serialize a value in the given format
 *
 * The returned text ends with a newline.
 *
 * @throws SerializeError if the value is not representable in the format
 *         (non-finite float in JSON, null or non-mapping root in TOML,
 *         invalid UTF-8)
 */
std::string serialize(const Value& value, Format format, const WriteOptions& opts = {});

/**
 * @brief Serialize and write to a file
 * @throws SerializeError, Error if the file cannot be written
 */
void write_document(const std::string& path, const Value& value, Format format,
                    const WriteOptions& opts = {});

} // namespace strata

#endif // STRATA_WRITER_HPP
