/**
 * @file KeyPath.hpp
 * @brief Locations inside a document tree
 *
 * A KeyPath is an ordered list of segments, each either a mapping key or a
 * sequence index. Paths are immutable: child() and index() return a new
 * path that shares its parent, so recursion can branch into sibling
 * subtrees without copying or aliasing a mutable cursor.
 *
 * Text form:
 * - keys are joined with '.'                         a.b.c
 * - indices are written in brackets                  servers[2].host
 * - keys outside [A-Za-z0-9_-] (or empty) are quoted ["x.y"].z
 * - the root path is rendered as "<root>"
 */

#ifndef STRATA_KEYPATH_HPP
#define STRATA_KEYPATH_HPP

#include "strata/Value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace strata {

class KeyPath {
public:
    /// A mapping key or a sequence index
    using Segment = std::variant<std::string, std::size_t>;

    /// The root path (no segments)
    KeyPath() = default;

    /**
     * @brief Parse the text form back into a path
     *
     * @param text Path text such as "db.hosts[0].name" or "[\"a.b\"].c"
     * @return Parsed path; "" and "<root>" yield the root path
     * @throws KeyPathError on malformed text
     */
    static KeyPath parse(const std::string& text);

    KeyPath child(std::string key) const;
    KeyPath index(std::size_t idx) const;

    bool empty() const noexcept { return size_ == 0; }
    std::size_t size() const noexcept { return size_; }

    /// Segments from root to leaf
    std::vector<Segment> segments() const;

    std::string to_string() const;

    bool operator==(const KeyPath& other) const;
    bool operator!=(const KeyPath& other) const { return !(*this == other); }

private:
    struct Node {
        std::shared_ptr<const Node> parent;
        Segment segment;
    };

    KeyPath(std::shared_ptr<const Node> tail, std::size_t size)
        : tail_(std::move(tail)), size_(size) {}

    std::shared_ptr<const Node> tail_;
    std::size_t size_ = 0;
};

/**
 * @brief Look up the value at a path
 *
 * @return Pointer into data, or nullptr if any segment does not resolve
 *         (missing key, index out of range, or a segment that does not
 *         match the container kind)
 */
const Value* find_by_path(const Value& data, const KeyPath& path);

/**
 * @brief Set the value at a path, creating intermediate mappings
 *
 * Key segments turn a non-mapping intermediate into an empty mapping.
 * Index segments must address an existing sequence element, or the
 * position one past the end (which appends); a null intermediate becomes
 * an empty sequence first.
 *
 * @throws KeyPathError if an index segment cannot be satisfied
 */
void set_by_path(Value& data, const KeyPath& path, const Value& value);

} // namespace strata

#endif // STRATA_KEYPATH_HPP
