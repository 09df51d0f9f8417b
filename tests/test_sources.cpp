/**
 * @file test_sources.cpp
 * @brief Tests for source resolution, overlay trees and overrides (Catch2)
 */

#include <catch2/catch_all.hpp>
#include "strata/Sources.hpp"
#include "strata/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace strata;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("strata_test_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        fs::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// Single sources
// ============================================================================

TEST_CASE("is_inline_source", "[sources]") {
    CHECK(is_inline_source("{}"));
    CHECK(is_inline_source("  {\"a\": 1}\n"));
    CHECK_FALSE(is_inline_source("config.json"));
    CHECK_FALSE(is_inline_source("[1, 2]"));
    CHECK_FALSE(is_inline_source("{"));
}

TEST_CASE("resolve_source", "[sources]") {
    SECTION("Inline JSON is named by position") {
        Layer layer = resolve_source(R"({"debug": true})", 3);
        CHECK(layer.name == "<inline:3>");
        CHECK(layer.document["debug"] == true);
    }

    SECTION("Malformed inline JSON names the layer") {
        try {
            resolve_source("{debug}", 0);
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            CHECK(e.source() == "<inline:0>");
        }
    }

    SECTION("Files are named by path") {
        TempDir dir;
        const std::string path = dir.create_file("base.yaml", "a: 1\n");
        Layer layer = resolve_source(path, 0);
        CHECK(layer.name == path);
        CHECK(layer.document["a"] == 1);
    }

    SECTION("Forced input format") {
        TempDir dir;
        const std::string path = dir.create_file("settings.cfg", "a = 1\n");
        CHECK(resolve_source(path, 0, Format::Toml).document["a"] == 1);
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(resolve_source("/nonexistent/strata.yaml", 0), FileNotFoundError);
    }
}

// ============================================================================
// Overlay trees
// ============================================================================

TEST_CASE("discover_overlay_tree", "[sources][tree]") {
    TempDir dir;
    const auto root_default = dir.create_file("_default.json", "{}");
    const auto root_prod = dir.create_file("prod.yaml", "a: 1\n");
    const auto sub_default = dir.create_file("eu-west/_default.toml", "a = 2\n");
    const auto sub_prod = dir.create_file("eu-west/prod.json", "{}");
    dir.create_file("eu-west/prod.yaml", "ignored: true\n");
    dir.create_file("staging.json", "{}");

    SECTION("Folders outermost, names innermost, _default first") {
        auto files = discover_overlay_tree(dir.path(), {"prod"}, {"eu-west"});
        CHECK(files == std::vector<std::string>{root_default, root_prod, sub_default, sub_prod});
    }

    SECTION("Defaults only") {
        auto files = discover_overlay_tree(dir.path(), {}, {});
        CHECK(files == std::vector<std::string>{root_default});
    }

    SECTION("Missing names and folders are skipped") {
        auto files = discover_overlay_tree(dir.path(), {"qa", "prod"}, {"us-east"});
        CHECK(files == std::vector<std::string>{root_default, root_prod});
    }

    SECTION("Root must be a directory") {
        CHECK_THROWS_AS(discover_overlay_tree(root_default, {}, {}), FileNotFoundError);
        CHECK_THROWS_AS(discover_overlay_tree(dir.path() + "/nope", {}, {}), FileNotFoundError);
    }
}

// ============================================================================
// Overrides
// ============================================================================

TEST_CASE("build_override_layer", "[sources][overrides]") {
    SECTION("Typed values at key paths") {
        Layer layer = build_override_layer({
            "db.port=5433",
            "db.host=replica",
            "debug=true",
            "ratio=0.5",
            "tags=[\"a\",\"b\"]",
            "servers[0].name=alpha",
        });
        CHECK(layer.name == OVERRIDES_LAYER_NAME);
        CHECK(layer.document["db"]["port"] == 5433);
        CHECK(layer.document["db"]["host"] == "replica");
        CHECK(layer.document["debug"] == true);
        CHECK(layer.document["ratio"] == 0.5);
        CHECK(layer.document["tags"] == Value({"a", "b"}));
        CHECK(layer.document["servers"][0]["name"] == "alpha");
    }

    SECTION("Values may contain '='") {
        Layer layer = build_override_layer({"url=http://h/?a=b"});
        CHECK(layer.document["url"] == "http://h/?a=b");
    }

    SECTION("Later assignments win") {
        Layer layer = build_override_layer({"a=1", "a=2"});
        CHECK(layer.document["a"] == 2);
    }

    SECTION("Quoted keys") {
        Layer layer = build_override_layer({"[\"a.b\"]=1"});
        CHECK(layer.document["a.b"] == 1);
    }

    SECTION("Malformed assignments") {
        CHECK_THROWS_AS(build_override_layer({"novalue"}), KeyPathError);
        CHECK_THROWS_AS(build_override_layer({"=1"}), KeyPathError);
        CHECK_THROWS_AS(build_override_layer({"a..b=1"}), KeyPathError);
    }
}
