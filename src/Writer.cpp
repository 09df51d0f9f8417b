/**
 * @file Writer.cpp
 * @brief Document serialization implementation
 */

#include "strata/Writer.hpp"
#include "strata/Errors.hpp"
#include "strata/KeyPath.hpp"
#include "strata/Parse.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace strata {

namespace {

// ---- JSON -----------------------------------------------------------------

void check_finite(const Value& v, const KeyPath& path) {
    if (v.is_number_float() && !std::isfinite(v.get<double>())) {
        throw SerializeError("json", "non-finite number at '" + path.to_string() + "'");
    }
    if (v.is_array()) {
        for (std::size_t i = 0; i < v.size(); ++i) check_finite(v[i], path.index(i));
    } else if (v.is_object()) {
        for (auto it = v.begin(); it != v.end(); ++it) check_finite(it.value(), path.child(it.key()));
    }
}

// ---- YAML -----------------------------------------------------------------

/**
 * @brief Emit a string, quoted when a reader would otherwise type it as
 *        null, boolean or number
 */
void emit_yaml_string(YAML::Emitter& out, const std::string& s) {
    if (kind_of(resolve_plain_scalar(s)) != ValueKind::String) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

void emit_yaml(YAML::Emitter& out, const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            out << YAML::Null;
            break;

        case Value::value_t::boolean:
            out << v.get<bool>();
            break;

        case Value::value_t::number_integer:
            out << v.get<std::int64_t>();
            break;

        case Value::value_t::number_unsigned:
            out << v.get<std::uint64_t>();
            break;

        case Value::value_t::number_float: {
            const double d = v.get<double>();
            if (std::isnan(d)) {
                out << ".nan";
            } else if (std::isinf(d)) {
                out << (d > 0 ? ".inf" : "-.inf");
            } else {
                // JSON number text always reads back as a YAML float ("1.0", "1e+300")
                out << v.dump();
            }
            break;
        }

        case Value::value_t::string:
            emit_yaml_string(out, v.get_ref<const std::string&>());
            break;

        case Value::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& elem : v) emit_yaml(out, elem);
            out << YAML::EndSeq;
            break;

        case Value::value_t::object:
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key;
                emit_yaml_string(out, it.key());
                out << YAML::Value;
                emit_yaml(out, it.value());
            }
            out << YAML::EndMap;
            break;

        case Value::value_t::binary:
            throw SerializeError("yaml", "binary values are not supported");
    }
}

// ---- TOML -----------------------------------------------------------------

toml::array make_toml_array(const Value& a, const KeyPath& path);
toml::table make_toml_table(const Value& o, const KeyPath& path);

std::int64_t toml_integer(const Value& v, const KeyPath& path) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw SerializeError("toml", "integer too large for TOML at '" + path.to_string() + "'");
        }
        return static_cast<std::int64_t>(u);
    }
    return v.get<std::int64_t>();
}

template <typename Sink>
void insert_toml(Sink&& sink, const Value& v, const KeyPath& path) {
    switch (v.type()) {
        case Value::value_t::object:
            sink(make_toml_table(v, path));
            break;
        case Value::value_t::array:
            sink(make_toml_array(v, path));
            break;
        case Value::value_t::string:
            sink(v.get<std::string>());
            break;
        case Value::value_t::boolean:
            sink(v.get<bool>());
            break;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            sink(toml_integer(v, path));
            break;
        case Value::value_t::number_float:
            sink(v.get<double>());
            break;
        case Value::value_t::null:
        case Value::value_t::discarded:
            throw SerializeError("toml", "TOML has no null (at '" + path.to_string() + "')");
        case Value::value_t::binary:
            throw SerializeError("toml", "binary values are not supported");
    }
}

toml::array make_toml_array(const Value& a, const KeyPath& path) {
    toml::array out;
    for (std::size_t i = 0; i < a.size(); ++i) {
        insert_toml([&out](auto&& node) { out.push_back(std::forward<decltype(node)>(node)); },
                    a[i], path.index(i));
    }
    return out;
}

toml::table make_toml_table(const Value& o, const KeyPath& path) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& key = it.key();
        insert_toml([&tbl, &key](auto&& node) { tbl.insert(key, std::forward<decltype(node)>(node)); },
                    it.value(), path.child(key));
    }
    return tbl;
}

// ---- .env -----------------------------------------------------------------

/**
 * @brief Double-quote a value when the .env reader would not read it back
 *        verbatim
 */
std::string env_quote(const std::string& s) {
    const bool plain = !s.empty() &&
        s.find_first_of(" \t\r\n#'\"\\") == std::string::npos;
    if (plain) return s;

    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

void write_env_lines(std::ostream& os, const Value& v, const KeyPath& path) {
    if (v.is_object()) {
        for (auto it = v.begin(); it != v.end(); ++it) {
            write_env_lines(os, it.value(), path.child(it.key()));
        }
        return;
    }

    os << path.to_string() << '=';
    if (v.is_null()) {
        // empty value
    } else if (v.is_string()) {
        os << env_quote(v.get_ref<const std::string&>());
    } else {
        os << env_quote(v.dump());
    }
    os << '\n';
}

} // anonymous namespace

std::string to_json_string(const Value& value, int indent) {
    check_finite(value, KeyPath());
    try {
        return value.dump(indent) + "\n";
    } catch (const Value::type_error& e) {
        throw SerializeError("json", e.what());
    }
}

std::string to_yaml_string(const Value& value) {
    YAML::Emitter out;
    emit_yaml(out, value);
    if (!out.good()) {
        throw SerializeError("yaml", out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::string to_toml_string(const Value& value) {
    if (!value.is_object()) {
        throw SerializeError("toml", "TOML documents need a mapping at the root, got " +
                                         type_name(value));
    }
    const toml::table root = make_toml_table(value, KeyPath());
    std::ostringstream oss;
    oss << root << "\n";
    return oss.str();
}

std::string to_env_string(const Value& value) {
    if (!value.is_object()) {
        throw SerializeError("env", ".env output needs a mapping at the root, got " +
                                        type_name(value));
    }
    std::ostringstream oss;
    write_env_lines(oss, value, KeyPath());
    return oss.str();
}

std::string serialize(const Value& value, Format format, const WriteOptions& opts) {
    switch (format) {
        case Format::Json: return to_json_string(value, opts.indent);
        case Format::Yaml: return to_yaml_string(value);
        case Format::Toml: return to_toml_string(value);
        case Format::Env: return to_env_string(value);
    }
    throw SerializeError(format_name(format), "unsupported output format");
}

void write_document(const std::string& path, const Value& value, Format format,
                    const WriteOptions& opts) {
    // Serialize first so a failure leaves no partial file behind
    const std::string text = serialize(value, format, opts);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw Error("Failed to open for write: " + path);
    }
    ofs << text;
    if (!ofs) {
        throw Error("Failed to write: " + path);
    }
}

} // namespace strata
