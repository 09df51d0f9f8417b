// Vector options (--set, sources) hold JSON text with commas; never split them
#define CXXOPTS_VECTOR_DELIMITER '\0'
#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "strata/Errors.hpp"
#include "strata/Fold.hpp"
#include "strata/KeyPath.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"
#include "strata/Policy.hpp"
#include "strata/Sources.hpp"
#include "strata/Writer.hpp"

#ifndef STRATA_VERSION
#define STRATA_VERSION "0.0.0"
#endif

using namespace strata;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

constexpr const char* kUsageExamples =
    "Examples:\n"
    "  strata base.yaml prod.yaml instance.json\n"
    "  strata --list-strategy union_by_key --list-key name services/*.json\n"
    "  strata --tree conf --name prod --subfolder eu-west -f yaml -o merged.yaml\n"
    "  strata base.json '{\"debug\": true}' --set db.port=5433\n";

std::vector<std::string> strings_of(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) return {};
    return result[name].as<std::vector<std::string>>();
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("strata", "Deep-merge layered JSON/YAML/TOML/.env configuration documents");
    options.positional_help("SOURCE [SOURCE...]");

    options.add_options()
        ("o,output", "Write the merged document to FILE instead of stdout", cxxopts::value<std::string>())
        ("f,format", "Output format: json, yaml, toml, env (default: from --output extension, else json)",
            cxxopts::value<std::string>())
        ("input-format", "Read every file source as this format instead of by extension",
            cxxopts::value<std::string>())
        ("indent", "JSON indent; negative for a single line", cxxopts::value<int>()->default_value("2"))
        ("get", "Emit only the subtree at this key path", cxxopts::value<std::string>())
        ("set", "Final override PATH=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("v,verbose", "More diagnostics on stderr (-vv for debug)")
        ("q,quiet", "Only report errors")
        ("version", "Print version")
        ("h,help", "Show help");

    options.add_options("Policy")
        ("policy", "Policy file (JSON/YAML/TOML mapping)", cxxopts::value<std::string>())
        ("list-strategy", "replace | concatenate | union_by_key", cxxopts::value<std::string>())
        ("list-key", "Key field for union_by_key", cxxopts::value<std::string>())
        ("null-override", "overlay_null_wins | base_wins", cxxopts::value<std::string>())
        ("type-mismatch", "overlay_wins | error", cxxopts::value<std::string>())
        ("max-depth", "Maximum nesting depth", cxxopts::value<std::string>())
        ("none-values-are-transparent", "Null values do not override set values (null_override=base_wins)")
        ("no-env", "Ignore STRATA_* policy environment variables");

    options.add_options("Overlay tree")
        ("tree", "Overlay tree root directory", cxxopts::value<std::string>())
        ("name", "Layer name inside the tree (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("subfolder", "Tree sub-folder to include (repeatable)", cxxopts::value<std::vector<std::string>>());

    options.add_options()
        ("sources", "Source files or inline JSON objects", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"sources"});

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help({"", "Policy", "Overlay tree"}) << "\n" << kUsageExamples;
            return kExitOk;
        }
        if (result.count("version")) {
            std::cout << "strata " << STRATA_VERSION << "\n";
            return kExitOk;
        }

        if (result.count("quiet")) {
            set_log_level(LogLevel::Error);
        } else if (result.count("verbose") >= 2) {
            set_log_level(LogLevel::Debug);
        } else if (result.count("verbose") == 1) {
            set_log_level(LogLevel::Info);
        }

        // Policy: defaults -> --policy file -> STRATA_* -> flags
        PolicyOptions policy_opts;
        if (result.count("policy")) policy_opts.policy_file = result["policy"].as<std::string>();
        policy_opts.use_environment = result.count("no-env") == 0;
        if (result.count("none-values-are-transparent")) {
            policy_opts.overrides["null_override"] = "base_wins";
        }
        const std::vector<std::pair<std::string, std::string>> policy_flags = {
            {"list-strategy", "list_strategy"},
            {"list-key", "list_key"},
            {"null-override", "null_override"},
            {"type-mismatch", "type_mismatch"},
            {"max-depth", "max_depth"},
        };
        for (const auto& [flag, field] : policy_flags) {
            if (result.count(flag)) policy_opts.overrides[field] = result[flag].as<std::string>();
        }
        const MergePolicy policy = load_policy(policy_opts);

        // Layers: overlay tree, then positional sources, then --set
        std::optional<Format> input_format;
        if (result.count("input-format")) {
            input_format = parse_format_name(result["input-format"].as<std::string>());
        }

        std::vector<Layer> layers;
        if (result.count("tree")) {
            for (const auto& path : discover_overlay_tree(result["tree"].as<std::string>(),
                                                          strings_of(result, "name"),
                                                          strings_of(result, "subfolder"))) {
                layers.push_back(resolve_source(path, layers.size(), input_format));
            }
        } else if (result.count("name") || result.count("subfolder")) {
            std::cerr << "Error: --name and --subfolder need --tree\n";
            return kExitUsage;
        }

        for (const auto& source : strings_of(result, "sources")) {
            layers.push_back(resolve_source(source, layers.size(), input_format));
        }

        const auto assignments = strings_of(result, "set");
        if (!assignments.empty()) {
            layers.push_back(build_override_layer(assignments));
        }

        if (layers.empty()) {
            std::cerr << "Error: no sources given\n";
            std::cerr << options.help({"", "Policy", "Overlay tree"}) << "\n" << kUsageExamples;
            return kExitUsage;
        }

        Value merged = fold_merge(layers, policy);

        if (result.count("get")) {
            const std::string text = result["get"].as<std::string>();
            const Value* found = find_by_path(merged, KeyPath::parse(text));
            if (found == nullptr) {
                throw KeyPathError(text, "not found in the merged document");
            }
            merged = Value(*found);
        }

        // Output format: --format, else --output extension, else JSON
        Format out_format = Format::Json;
        if (result.count("format")) {
            out_format = parse_format_name(result["format"].as<std::string>());
        } else if (result.count("output")) {
            out_format = format_from_path(result["output"].as<std::string>()).value_or(Format::Json);
        }

        WriteOptions write_opts;
        write_opts.indent = result["indent"].as<int>();

        if (result.count("output")) {
            const std::string out = result["output"].as<std::string>();
            write_document(out, merged, out_format, write_opts);
            STRATA_LOG_INFO("cli", "wrote " << format_name(out_format) << " to " << out);
        } else {
            std::cout << serialize(merged, out_format, write_opts);
        }
        return kExitOk;

    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << "Try 'strata --help'.\n";
        return kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}
