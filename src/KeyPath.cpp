/**
 * @file KeyPath.cpp
 * @brief Implementation of key paths
 */

#include "strata/KeyPath.hpp"
#include "strata/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {

namespace {
    /**
     * @brief Check if a key can be written bare (without ["..."])
     */
    bool is_bare_key(const std::string& key) {
        if (key.empty()) return false;
        return std::all_of(key.begin(), key.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        });
    }

    /**
     * @brief Parse a decimal sequence index
     * @pre text is non-empty and all digits
     */
    std::size_t parse_index(const std::string& text, const std::string& path) {
        try {
            return static_cast<std::size_t>(std::stoull(text));
        } catch (const std::out_of_range&) {
            throw KeyPathError(path, "index out of range: " + text);
        }
    }
}

KeyPath KeyPath::child(std::string key) const {
    auto node = std::make_shared<const Node>(Node{tail_, Segment(std::move(key))});
    return KeyPath(std::move(node), size_ + 1);
}

KeyPath KeyPath::index(std::size_t idx) const {
    auto node = std::make_shared<const Node>(Node{tail_, Segment(idx)});
    return KeyPath(std::move(node), size_ + 1);
}

std::vector<KeyPath::Segment> KeyPath::segments() const {
    std::vector<Segment> out(size_);
    const Node* cur = tail_.get();
    for (std::size_t i = size_; i > 0; --i) {
        out[i - 1] = cur->segment;
        cur = cur->parent.get();
    }
    return out;
}

std::string KeyPath::to_string() const {
    if (empty()) {
        return "<root>";
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments()) {
        if (const auto* idx = std::get_if<std::size_t>(&seg)) {
            oss << '[' << *idx << ']';
        } else {
            const auto& key = std::get<std::string>(seg);
            if (is_bare_key(key)) {
                if (!first) oss << '.';
                oss << key;
            } else {
                // JSON string escaping keeps dots, brackets and quotes unambiguous
                oss << '[' << Value(key).dump() << ']';
            }
        }
        first = false;
    }
    return oss.str();
}

bool KeyPath::operator==(const KeyPath& other) const {
    if (size_ != other.size_) return false;
    const Node* a = tail_.get();
    const Node* b = other.tail_.get();
    while (a != nullptr && b != nullptr) {
        if (a == b) return true;  // shared prefix
        if (a->segment != b->segment) return false;
        a = a->parent.get();
        b = b->parent.get();
    }
    return a == b;
}

KeyPath KeyPath::parse(const std::string& text) {
    KeyPath path;
    if (text.empty() || text == "<root>") {
        return path;
    }

    std::size_t i = 0;
    const std::size_t n = text.size();
    bool expect_key = true;  // at start or after '.'

    while (i < n) {
        const char c = text[i];

        if (c == '[') {
            const std::size_t start = i + 1;
            if (start < n && text[start] == '"') {
                // Quoted key: JSON string up to the matching quote
                std::size_t j = start + 1;
                while (j < n && text[j] != '"') {
                    if (text[j] == '\\') ++j;
                    ++j;
                }
                if (j >= n || j + 1 >= n || text[j + 1] != ']') {
                    throw KeyPathError(text, "unterminated quoted key");
                }
                Value key;
                try {
                    key = Value::parse(text.substr(start, j - start + 1));
                } catch (const Value::parse_error& e) {
                    throw KeyPathError(text, std::string("bad quoted key: ") + e.what());
                }
                path = path.child(key.get<std::string>());
                i = j + 2;
            } else {
                const std::size_t close = text.find(']', start);
                if (close == std::string::npos) {
                    throw KeyPathError(text, "missing ']'");
                }
                const std::string digits = text.substr(start, close - start);
                if (digits.empty() ||
                    !std::all_of(digits.begin(), digits.end(),
                                 [](unsigned char d) { return std::isdigit(d); })) {
                    throw KeyPathError(text, "index must be a non-negative integer: '" + digits + "'");
                }
                path = path.index(parse_index(digits, text));
                i = close + 1;
            }
            expect_key = false;
            continue;
        }

        if (c == '.') {
            if (expect_key) {
                throw KeyPathError(text, "empty key segment");
            }
            expect_key = true;
            ++i;
            continue;
        }

        if (!expect_key) {
            throw KeyPathError(text, "expected '.' or '[' at position " + std::to_string(i));
        }

        std::size_t j = i;
        while (j < n && text[j] != '.' && text[j] != '[') ++j;
        path = path.child(text.substr(i, j - i));
        expect_key = false;
        i = j;
    }

    if (expect_key) {
        throw KeyPathError(text, "path ends with '.'");
    }
    return path;
}

const Value* find_by_path(const Value& data, const KeyPath& path) {
    const Value* current = &data;

    for (const auto& seg : path.segments()) {
        if (const auto* idx = std::get_if<std::size_t>(&seg)) {
            if (!current->is_array() || *idx >= current->size()) {
                return nullptr;
            }
            current = &(*current)[*idx];
        } else {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(std::get<std::string>(seg));
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        }
    }

    return current;
}

void set_by_path(Value& data, const KeyPath& path, const Value& value) {
    Value* current = &data;

    for (const auto& seg : path.segments()) {
        if (const auto* idx = std::get_if<std::size_t>(&seg)) {
            if (current->is_null()) {
                *current = Value::array();
            }
            if (!current->is_array()) {
                throw KeyPathError(path.to_string(),
                                   "index applied to " + type_name(*current));
            }
            if (*idx > current->size()) {
                throw KeyPathError(path.to_string(),
                                   "index " + std::to_string(*idx) + " past end of sequence");
            }
            if (*idx == current->size()) {
                current->push_back(Value());
            }
            current = &(*current)[*idx];
        } else {
            // Overwrite non-mapping intermediates
            if (!current->is_object()) {
                *current = Value::object();
            }
            current = &(*current)[std::get<std::string>(seg)];
        }
    }

    *current = value;
}

} // namespace strata
