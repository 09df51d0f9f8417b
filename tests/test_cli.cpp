/**
 * @file test_cli.cpp
 * @brief Tests for the merge workflow behind the CLI (GoogleTest)
 *
 * These tests drive the same steps the strata binary runs: resolve
 * sources, fold them under a loaded policy, select a subtree and write
 * the result. The binary itself is not spawned.
 */

#include <gtest/gtest.h>

#include "strata/Errors.hpp"
#include "strata/Fold.hpp"
#include "strata/KeyPath.hpp"
#include "strata/Loader.hpp"
#include "strata/Policy.hpp"
#include "strata/Sources.hpp"
#include "strata/Writer.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace strata;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/**
 * @brief RAII wrapper for a temporary working directory
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("strata_cli_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        std::ofstream out(path_ / name);
        out << content;
        return file(name);
    }

private:
    fs::path path_;
};

Value run_merge(const std::vector<std::string>& sources, const PolicyOptions& opts,
                const std::vector<std::string>& assignments = {}) {
    std::vector<Layer> layers;
    for (const auto& s : sources) {
        layers.push_back(resolve_source(s, layers.size()));
    }
    if (!assignments.empty()) {
        layers.push_back(build_override_layer(assignments));
    }
    return fold_merge(layers, load_policy(opts));
}

PolicyOptions flags(std::map<std::string, std::string> overrides = {}) {
    PolicyOptions opts;
    opts.use_environment = false;
    opts.overrides = std::move(overrides);
    return opts;
}

} // namespace

// ============================================================================
// Full workflow
// ============================================================================

TEST(CliWorkflow, MixedFormatsMergeInOrder) {
    TempDir dir;
    const auto base = dir.write("base.yaml",
        "service:\n"
        "  name: api\n"
        "  port: 8080\n"
        "  features: [auth]\n");
    const auto prod = dir.write("prod.toml",
        "[service]\n"
        "port = 443\n"
        "features = [\"tls\"]\n");

    Value merged = run_merge({base, prod, R"({"service": {"debug": false}})"}, flags());

    EXPECT_EQ(merged["service"]["name"], "api");
    EXPECT_EQ(merged["service"]["port"], 443);
    EXPECT_EQ(merged["service"]["features"], Value({"auth", "tls"}));
    EXPECT_EQ(merged["service"]["debug"], false);
}

TEST(CliWorkflow, UnionByKeyFromFlags) {
    TempDir dir;
    const auto base = dir.write("base.json",
        R"({"users": [{"name": "ann", "role": "dev"}, {"name": "bob", "role": "ops"}]})");
    const auto site = dir.write("site.json",
        R"({"users": [{"name": "bob", "role": "admin"}, {"name": "cy", "role": "qa"}]})");

    Value merged = run_merge({base, site},
                             flags({{"list_strategy", "union_by_key"}, {"list_key", "name"}}));

    ASSERT_EQ(merged["users"].size(), 3u);
    EXPECT_EQ(merged["users"][1]["role"], "admin");
    EXPECT_EQ(merged["users"][2]["name"], "cy");
}

TEST(CliWorkflow, NoneValuesAreTransparent) {
    TempDir dir;
    const auto base = dir.write("base.json", R"({"timeout": 30})");
    const auto site = dir.write("site.json", R"({"timeout": null})");

    EXPECT_TRUE(run_merge({base, site}, flags())["timeout"].is_null());
    EXPECT_EQ(run_merge({base, site}, flags({{"null_override", "base_wins"}}))["timeout"], 30);
}

TEST(CliWorkflow, OverridesApplyLast) {
    TempDir dir;
    const auto base = dir.write("base.json", R"({"db": {"port": 5432, "host": "db"}})");

    Value merged = run_merge({base}, flags(), {"db.port=6432"});
    EXPECT_EQ(merged["db"]["port"], 6432);
    EXPECT_EQ(merged["db"]["host"], "db");
}

TEST(CliWorkflow, ConflictProducesNoDocument) {
    TempDir dir;
    const auto base = dir.write("base.json", R"({"limits": {"cpu": 2}})");
    const auto bad = dir.write("bad.yaml", "limits:\n  cpu: [1, 2]\n");
    const auto out = dir.file("merged.json");

    try {
        Value merged = run_merge({base, bad}, flags({{"type_mismatch", "error"}}));
        write_document(out, merged, Format::Json);
        FAIL() << "expected MergeError";
    } catch (const MergeError& e) {
        EXPECT_EQ(e.kind(), MergeErrorKind::TypeConflict);
        EXPECT_EQ(e.path().to_string(), "limits.cpu");
    }
    EXPECT_FALSE(fs::exists(out));
}

TEST(CliWorkflow, GetSelectsSubtree) {
    Value merged = run_merge({R"({"a": {"b": [10, 20]}})"}, flags());
    const Value* found = find_by_path(merged, KeyPath::parse("a.b[1]"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(*found, 20);
    EXPECT_EQ(find_by_path(merged, KeyPath::parse("a.c")), nullptr);
}

TEST(CliWorkflow, OutputFormatFromExtension) {
    TempDir dir;
    const auto out = dir.file("merged.yaml");
    Value merged = run_merge({R"({"z": 1, "a": {"n": null}})"}, flags());

    auto format = format_from_path(out);
    ASSERT_TRUE(format.has_value());
    write_document(out, merged, *format);

    EXPECT_EQ(load_document(out), merged);
}

TEST(CliWorkflow, TomlOutputOfNullFailsWithoutWriting) {
    TempDir dir;
    const auto out = dir.file("merged.toml");
    Value merged = run_merge({R"({"a": null})"}, flags());

    EXPECT_THROW(write_document(out, merged, Format::Toml), SerializeError);
    EXPECT_FALSE(fs::exists(out));
}
