/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * Implements text parsing for:
 * - JSON files (using nlohmann::json)
 * - YAML files (using yaml-cpp)
 * - TOML files (using toml++)
 * - .env files (custom parser)
 */

#include "strata/Loader.hpp"
#include "strata/Errors.hpp"
#include "strata/Parse.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstddef>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace strata {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/// Nesting bound for YAML conversion; aliases can describe very deep trees
constexpr int kMaxYamlDepth = 1024;

/// Node bound for YAML conversion; an alias is expanded at every use
constexpr std::size_t kMaxYamlNodes = 1000000;

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of string.
 */
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * @brief Remove quotes from a quoted string value.
 */
std::string unquote(const std::string& s) {
    if (s.length() < 2) return s;

    char first = s.front();
    char last = s.back();

    // Single quotes: literal content
    if (first == '\'' && last == '\'') {
        return s.substr(1, s.length() - 2);
    }

    // Double quotes with escape processing
    if (first == '"' && last == '"') {
        std::string content = s.substr(1, s.length() - 2);
        std::string result;
        result.reserve(content.length());

        for (size_t i = 0; i < content.length(); ++i) {
            if (content[i] == '\\' && i + 1 < content.length()) {
                char next = content[i + 1];
                switch (next) {
                    case 'n': result += '\n'; ++i; break;
                    case 'r': result += '\r'; ++i; break;
                    case 't': result += '\t'; ++i; break;
                    case '\\': result += '\\'; ++i; break;
                    case '"': result += '"'; ++i; break;
                    case '\'': result += '\''; ++i; break;
                    default: result += content[i]; break;
                }
            } else {
                result += content[i];
            }
        }
        return result;
    }

    return s;
}

/**
 * @brief 1-based line and column of a byte offset
 */
std::pair<int, int> line_column_of(const std::string& text, std::size_t byte) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(byte, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

/**
 * @brief Convert toml++ node to Value, keys in source order.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << *node.as_date();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << *node.as_time();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << *node.as_date_time();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            // toml::table iterates in key order; restore source order
            std::vector<std::pair<const toml::key*, const toml::node*>> entries;
            for (const auto& [key, val] : *node.as_table()) {
                entries.emplace_back(&key, &val);
            }
            std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
                const auto& pa = a.first->source().begin;
                const auto& pb = b.first->source().begin;
                if (pa.line != pb.line) return pa.line < pb.line;
                return pa.column < pb.column;
            });

            Value obj = Value::object();
            for (const auto& [key, val] : entries) {
                obj[std::string(key->str())] = toml_node_to_value(*val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Convert yaml-cpp node to Value.
 */
Value yaml_node_to_value(const YAML::Node& node, const std::string& source, int depth,
                         std::size_t& budget) {
    if (depth > kMaxYamlDepth) {
        const auto mark = node.Mark();
        throw ParseError(source, "nesting deeper than " + std::to_string(kMaxYamlDepth) + " levels",
                         mark.is_null() ? 0 : mark.line + 1,
                         mark.is_null() ? 0 : mark.column + 1);
    }
    if (budget == 0) {
        const auto mark = node.Mark();
        throw ParseError(source, "document expands to more than " + std::to_string(kMaxYamlNodes) +
                                     " nodes (alias expansion)",
                         mark.is_null() ? 0 : mark.line + 1,
                         mark.is_null() ? 0 : mark.column + 1);
    }
    --budget;

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);

        case YAML::NodeType::Scalar: {
            const std::string& tag = node.Tag();
            // "!" marks a quoted scalar; !!str forces a string
            if (tag == "!" || tag == "tag:yaml.org,2002:str") {
                return Value(node.Scalar());
            }
            return resolve_plain_scalar(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_node_to_value(item, source, depth + 1, budget));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& pair : node) {
                // A plain null key ("~:" or "null:") is kept as the text "null"
                if (pair.first.IsNull()) {
                    obj["null"] = yaml_node_to_value(pair.second, source, depth + 1, budget);
                    continue;
                }
                if (!pair.first.IsScalar()) {
                    const auto mark = pair.first.Mark();
                    throw ParseError(source, "mapping keys must be scalars",
                                     mark.is_null() ? 0 : mark.line + 1,
                                     mark.is_null() ? 0 : mark.column + 1);
                }
                obj[pair.first.Scalar()] = yaml_node_to_value(pair.second, source, depth + 1, budget);
            }
            return obj;
        }
    }

    return Value(nullptr);
}

} // anonymous namespace

// ============================================================================
// Formats
// ============================================================================

std::string format_name(Format format) {
    switch (format) {
        case Format::Json: return "json";
        case Format::Yaml: return "yaml";
        case Format::Toml: return "toml";
        case Format::Env: return "env";
    }
    return "unknown";
}

Format parse_format_name(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "json") return Format::Json;
    if (lower == "yaml" || lower == "yml") return Format::Yaml;
    if (lower == "toml") return Format::Toml;
    if (lower == "env" || lower == "dotenv") return Format::Env;
    throw Error("Unknown document format: '" + name + "' (expected json, yaml, toml or env)");
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

std::optional<Format> format_from_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".yaml" || ext == ".yml") return Format::Yaml;
    if (ext == ".toml") return Format::Toml;
    if (ext == ".env" || fs::path(path).filename() == ".env") return Format::Env;
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

Value parse_json(const std::string& text, const std::string& source) {
    try {
        return Value::parse(text);
    } catch (const Value::parse_error& e) {
        const auto [line, column] = line_column_of(text, e.byte > 0 ? e.byte - 1 : 0);
        throw ParseError(source, e.what(), line, column);
    }
}

// ============================================================================
// YAML
// ============================================================================

Value parse_yaml(const std::string& text, const std::string& source) {
    try {
        std::size_t budget = kMaxYamlNodes;
        return yaml_node_to_value(YAML::Load(text), source, 0, budget);
    } catch (const YAML::Exception& e) {
        throw ParseError(source, e.msg,
                         e.mark.is_null() ? 0 : e.mark.line + 1,
                         e.mark.is_null() ? 0 : e.mark.column + 1);
    }
}

// ============================================================================
// TOML
// ============================================================================

Value parse_toml(const std::string& text, const std::string& source) {
    toml::table table;
    try {
        table = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            source,
            std::string(e.description()),
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column)
        );
    }
    return toml_node_to_value(table);
}

// ============================================================================
// .env
// ============================================================================

DotenvResult parse_dotenv(const std::string& text) {
    DotenvResult result;
    std::istringstream input(text);
    std::string line;

    while (std::getline(input, line)) {
        std::string trimmed = trim(line);

        // Skip empty lines and comments
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // Handle 'export' prefix
        const std::string export_prefix = "export ";
        if (trimmed.length() > export_prefix.length() &&
            to_lower(trimmed.substr(0, export_prefix.length())) == export_prefix) {
            trimmed = trim(trimmed.substr(export_prefix.length()));
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            continue;
        }

        std::string key = trim(trimmed.substr(0, eq_pos));
        std::string value = trimmed.substr(eq_pos + 1);

        // Inline comments, but not inside quotes
        bool in_single_quote = false;
        bool in_double_quote = false;
        size_t comment_pos = std::string::npos;

        for (size_t i = 0; i < value.length(); ++i) {
            char c = value[i];
            if (c == '\\' && in_double_quote) {
                ++i;
            } else if (c == '\'' && !in_double_quote) {
                in_single_quote = !in_single_quote;
            } else if (c == '"' && !in_single_quote) {
                in_double_quote = !in_double_quote;
            } else if (c == '#' && !in_single_quote && !in_double_quote &&
                       (i == 0 || std::isspace(static_cast<unsigned char>(value[i - 1])))) {
                comment_pos = i;
                break;
            }
        }

        if (comment_pos != std::string::npos) {
            value = value.substr(0, comment_pos);
        }

        value = unquote(trim(value));

        if (!key.empty()) {
            result.entries.emplace_back(std::move(key), std::move(value));
        }
    }

    return result;
}

Value parse_env(const std::string& text, const std::string& /*source*/) {
    Value obj = Value::object();
    for (const auto& [key, value] : parse_dotenv(text).entries) {
        obj[key] = value;
    }
    return obj;
}

Value parse_document(const std::string& text, Format format, const std::string& source) {
    switch (format) {
        case Format::Json: return parse_json(text, source);
        case Format::Yaml: return parse_yaml(text, source);
        case Format::Toml: return parse_toml(text, source);
        case Format::Env: return parse_env(text, source);
    }
    throw Error("Unknown document format for '" + source + "'");
}

// ============================================================================
// Files
// ============================================================================

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error("Cannot open file for reading: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value load_document(const std::string& path, std::optional<Format> format) {
    if (!format.has_value()) {
        format = format_from_path(path);
        if (!format.has_value()) {
            throw Error("Cannot determine format of '" + path + "' from extension '" +
                        get_file_extension(path) +
                        "' (expected .json, .yaml, .yml, .toml or .env)");
        }
    }

    return parse_document(read_text_file(path), *format, path);
}

} // namespace strata
