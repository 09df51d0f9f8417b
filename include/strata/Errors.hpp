/**
 * @file Errors.hpp
 * @brief Exception types for strata
 *
 * Error taxonomy:
 * - Error: Base class
 * - MergeError: Conflict found by the merge engine (type conflict,
 *   missing union key, nesting too deep)
 * - InvalidPolicyError: Merge policy field has a bad value
 * - FileNotFoundError: Source file not found
 * - ParseError: Document text could not be parsed
 * - SerializeError: Value cannot be written in the requested format
 * - KeyPathError: Malformed or unresolvable key path
 */

#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include "strata/KeyPath.hpp"

#include <stdexcept>
#include <string>
#include <sstream>

namespace strata {

/**
 * @brief Base class for all strata exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Category of a merge conflict
 */
enum class MergeErrorKind {
    TypeConflict,     ///< Incompatible kinds under type_mismatch=error
    MissingMergeKey,  ///< Union-by-key element without the key field
    DepthExceeded     ///< Nesting deeper than the policy's max_depth
};

inline const char* merge_error_kind_name(MergeErrorKind kind) {
    switch (kind) {
        case MergeErrorKind::TypeConflict: return "TypeConflict";
        case MergeErrorKind::MissingMergeKey: return "MissingMergeKey";
        case MergeErrorKind::DepthExceeded: return "DepthExceeded";
    }
    return "Unknown";
}

/**
 * @brief Conflict raised by the merge engine
 *
 * Carries the location of the conflict and the type names of the two
 * values involved. The message always contains the path text so an
 * operator can find the offending key in the source documents.
 */
class MergeError : public Error {
public:
    /**
     * @brief Construct a merge error
     * @param kind Conflict category
     * @param path Location of the conflict
     * @param base_type Type name of the base side
     * @param overlay_type Type name of the overlay side
     * @param detail Optional extra explanation appended to the message
     */
    MergeError(MergeErrorKind kind, KeyPath path,
               std::string base_type, std::string overlay_type,
               std::string detail = "")
        : Error(format_message(kind, path, base_type, overlay_type, detail))
        , kind_(kind)
        , path_(std::move(path))
        , base_type_(std::move(base_type))
        , overlay_type_(std::move(overlay_type))
        , detail_(std::move(detail))
    {}

    MergeErrorKind kind() const noexcept { return kind_; }
    const KeyPath& path() const noexcept { return path_; }
    const std::string& base_type() const noexcept { return base_type_; }
    const std::string& overlay_type() const noexcept { return overlay_type_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    MergeErrorKind kind_;
    KeyPath path_;
    std::string base_type_;
    std::string overlay_type_;
    std::string detail_;

    static std::string format_message(MergeErrorKind kind, const KeyPath& path,
                                      const std::string& base_type,
                                      const std::string& overlay_type,
                                      const std::string& detail) {
        std::ostringstream oss;
        oss << merge_error_kind_name(kind) << " at '" << path.to_string() << "'";
        if (kind == MergeErrorKind::TypeConflict) {
            oss << ": cannot merge " << overlay_type << " into " << base_type;
        }
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        return oss.str();
    }
};

/**
 * @brief A merge policy field has an invalid value
 */
class InvalidPolicyError : public Error {
public:
    /**
     * @param field Policy field name (e.g., "list_strategy")
     * @param details What is wrong with it
     */
    InvalidPolicyError(std::string field, std::string details)
        : Error("Invalid merge policy '" + field + "': " + details)
        , field_(std::move(field))
    {}

    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string field_;
};

/**
 * @brief Source file not found
 */
class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(std::string path)
        : Error("Source file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/YAML/TOML/dotenv syntax)
 */
class ParseError : public Error {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path or inline source name
     * @param details Detailed error message from the parser
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     */
    ParseError(std::string source, std::string details, int line = 0, int column = 0)
        : Error(format_message(source, details, line, column))
        , source_(std::move(source))
        , details_(std::move(details))
        , line_(line)
        , column_(column)
    {}

    const std::string& source() const noexcept { return source_; }
    const std::string& details() const noexcept { return details_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    std::string source_;
    std::string details_;
    int line_;
    int column_;

    static std::string format_message(const std::string& source, const std::string& details,
                                      int line, int column) {
        std::ostringstream oss;
        oss << "Parse error in '" << source << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Value cannot be serialized in the requested format
 */
class SerializeError : public Error {
public:
    /**
     * @param format Target format name (e.g., "toml")
     * @param details Why the value is not representable
     */
    SerializeError(std::string format, std::string details)
        : Error("Cannot write " + format + ": " + details)
        , format_(std::move(format))
    {}

    const std::string& format() const noexcept {
        return format_;
    }

private:
    std::string format_;
};

/**
 * @brief Malformed or unresolvable key path
 */
class KeyPathError : public Error {
public:
    KeyPathError(std::string path, std::string details)
        : Error("Bad key path '" + path + "': " + details)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace strata

#endif // STRATA_ERRORS_HPP
