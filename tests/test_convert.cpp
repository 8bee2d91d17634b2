/**
 * @file test_convert.cpp
 * @brief Tests for JSON/TOML import and export
 */

#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "agentcfg/Convert.hpp"
#include "agentcfg/Defaults.hpp"
#include "agentcfg/Errors.hpp"

#include <stdexcept>

using namespace agentcfg;
using agentcfg_test::TempDir;

namespace {

/// Issue paths of the InvalidConfig thrown by config_from_toml, or a
/// single "no error" marker.
std::vector<std::string> toml_issue_paths(const std::string& text) {
    try {
        config_from_toml(text, "import.toml");
    } catch (const InvalidConfig& e) {
        std::vector<std::string> paths;
        for (const auto& issue : e.issues()) paths.push_back(issue.path);
        return paths;
    }
    return {"no error"};
}

} // anonymous namespace

// ============================================================================
// Format selection
// ============================================================================

TEST(FormatFromPath, ByExtension) {
    EXPECT_EQ(format_from_path("/a/cfg.toml"), FileFormat::Toml);
    EXPECT_EQ(format_from_path("/a/cfg.TOML"), FileFormat::Toml);
    EXPECT_EQ(format_from_path("/a/cfg.json"), FileFormat::Json);
    EXPECT_EQ(format_from_path("/a/cfg"), FileFormat::Json);
}

TEST(ParseFormat, KnownNames) {
    EXPECT_EQ(parse_format("json"), FileFormat::Json);
    EXPECT_EQ(parse_format("TOML"), FileFormat::Toml);
    EXPECT_THROW(parse_format("yaml"), std::invalid_argument);
}

// ============================================================================
// TOML import
// ============================================================================

TEST(ConfigFromToml, TablesBecomeBindings) {
    Config cfg = config_from_toml(R"(
[agents.oracle]
model = "openai/gpt-5.2"
variant = "high"

[categories.quick]
model = "anthropic/claude-haiku-4-5"
)", "import.toml");

    ASSERT_TRUE(cfg.agents.has_value());
    EXPECT_EQ(cfg.agents->at("oracle"), (ModelBinding{"openai/gpt-5.2", std::string("high")}));
    ASSERT_TRUE(cfg.categories.has_value());
    EXPECT_EQ(cfg.categories->at("quick"), (ModelBinding{"anthropic/claude-haiku-4-5", std::nullopt}));
}

TEST(ConfigFromToml, IntegerModelRejected) {
    try {
        config_from_toml("[agents.oracle]\nmodel = 5\n", "import.toml");
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("import.toml: agents.oracle.model: Expected string or table, received integer"),
                  std::string::npos);
        ASSERT_EQ(e.issues().size(), 1u);
    }
}

TEST(ConfigFromToml, NonStringValuesListedByPath) {
    auto paths = toml_issue_paths(R"(
[agents.a]
model = "m"
variant = 1979-05-27

[agents.b]
model = ["x", "y"]
)");
    EXPECT_EQ(paths, (std::vector<std::string>{"agents.a.variant", "agents.b.model"}));
}

TEST(ConfigFromToml, BooleanAtRootRejected) {
    EXPECT_EQ(toml_issue_paths("enabled = true\n"), std::vector<std::string>{"enabled"});
}

TEST(ConfigFromToml, SchemaStillApplies) {
    try {
        config_from_toml("agents = \"x\"\n", "import.toml");
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        ASSERT_EQ(e.issues().size(), 1u);
        EXPECT_EQ(e.issues()[0].path, "agents");
    }
}

TEST(ConfigFromToml, SyntaxErrorReportsLocation) {
    try {
        config_from_toml("a = \n", "broken.toml");
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("Invalid configuration: Malformed TOML in broken.toml"), std::string::npos);
        EXPECT_NE(msg.find("line 1"), std::string::npos);
    }
}

// ============================================================================
// TOML export
// ============================================================================

TEST(ConfigToToml, DefaultConfigRoundTrips) {
    const std::string text = config_to_toml(default_config());
    EXPECT_EQ(config_from_toml(text, "export.toml"), default_config());
}

TEST(ConfigToToml, UnsetVariantHasNoKey) {
    Config cfg;
    cfg.agents = BindingMap{{"oracle", {"openai/gpt-5.2", std::nullopt}}};

    const std::string text = config_to_toml(cfg);

    EXPECT_NE(text.find("model = \"openai/gpt-5.2\""), std::string::npos);
    EXPECT_EQ(text.find("variant"), std::string::npos);
    EXPECT_EQ(text.find("categories"), std::string::npos);
}

// ============================================================================
// Files
// ============================================================================

TEST(DumpConfig, JsonIsIndentedWithNewline) {
    Config cfg;
    cfg.agents = BindingMap{{"a", {"m", std::nullopt}}};
    EXPECT_EQ(dump_config(cfg, FileFormat::Json),
              "{\n  \"agents\": {\n    \"a\": {\n      \"model\": \"m\"\n    }\n  }\n}\n");
}

TEST(LoadConfigFile, ReadsEitherFormat) {
    TempDir dir;
    const std::string json_path = dir.create_file("in.json", R"({"agents": {"a": {"model": "m"}}})");
    const std::string toml_path = dir.create_file("in.toml", "[agents.a]\nmodel = \"m\"\n");

    EXPECT_EQ(load_config_file(json_path, FileFormat::Json),
              load_config_file(toml_path, FileFormat::Toml));
}

TEST(LoadConfigFile, JsonSchemaErrorsNameTheFile) {
    TempDir dir;
    const std::string path = dir.create_file("in.json", R"({"agents": {"a": {}}})");
    try {
        load_config_file(path, FileFormat::Json);
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        EXPECT_NE(std::string(e.what()).find(path + ": agents.a.model"), std::string::npos);
    }
}

TEST(LoadConfigFile, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(load_config_file(dir.file("none.toml"), FileFormat::Toml), FileNotFoundError);
}
