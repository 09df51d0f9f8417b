/**
 * @file Sources.cpp
 * @brief Source resolution and overlay tree discovery
 */

#include "strata/Sources.hpp"
#include "strata/Errors.hpp"
#include "strata/KeyPath.hpp"
#include "strata/Log.hpp"
#include "strata/Parse.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace strata {

namespace {
    constexpr const char* kComponent = "sources";

    /// Extensions tried for each overlay tree name, in order
    const std::vector<std::string> kTreeExtensions = {".json", ".yaml", ".yml", ".toml"};

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }
}

bool is_inline_source(const std::string& arg) {
    const std::string t = trim(arg);
    return t.size() >= 2 && t.front() == '{' && t.back() == '}';
}

Layer resolve_source(const std::string& arg, std::size_t index, std::optional<Format> format) {
    if (is_inline_source(arg)) {
        std::string name = "<inline:" + std::to_string(index) + ">";
        STRATA_LOG_DEBUG(kComponent, "source " << index << " is inline JSON");
        Value doc = parse_json(arg, name);
        return Layer{std::move(name), std::move(doc)};
    }

    STRATA_LOG_DEBUG(kComponent, "loading source " << index << ": " << arg);
    return Layer{arg, load_document(arg, format)};
}

std::vector<std::string> discover_overlay_tree(const std::string& root,
                                               const std::vector<std::string>& names,
                                               const std::vector<std::string>& subfolders) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw FileNotFoundError(root);
    }

    std::vector<std::string> folders = {""};
    folders.insert(folders.end(), subfolders.begin(), subfolders.end());

    std::vector<std::string> all_names = {OVERLAY_DEFAULT_NAME};
    all_names.insert(all_names.end(), names.begin(), names.end());

    std::vector<std::string> found;
    for (const auto& folder : folders) {
        const fs::path dir = folder.empty() ? fs::path(root) : fs::path(root) / folder;
        for (const auto& name : all_names) {
            bool matched = false;
            for (const auto& ext : kTreeExtensions) {
                const fs::path candidate = dir / (name + ext);
                if (fs::is_regular_file(candidate, ec)) {
                    found.push_back(candidate.string());
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                STRATA_LOG_DEBUG(kComponent, "no '" << name << "' layer in " << dir.string());
            }
        }
    }

    STRATA_LOG_INFO(kComponent, "overlay tree " << root << ": " << found.size() << " layer(s)");
    return found;
}

Layer build_override_layer(const std::vector<std::string>& assignments) {
    Value doc = Value::object();

    for (const auto& assignment : assignments) {
        const auto eq = assignment.find('=');
        if (eq == std::string::npos) {
            throw KeyPathError(assignment, "expected PATH=VALUE");
        }
        const KeyPath path = KeyPath::parse(trim(assignment.substr(0, eq)));
        if (path.empty()) {
            throw KeyPathError(assignment, "override path must not be empty");
        }
        set_by_path(doc, path, parse_value(assignment.substr(eq + 1)));
    }

    return Layer{OVERRIDES_LAYER_NAME, std::move(doc)};
}

} // namespace strata
