/**
 * @file test_history.cpp
 * @brief Tests for the backup history view
 */

#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "agentcfg/Backup.hpp"
#include "agentcfg/Defaults.hpp"
#include "agentcfg/History.hpp"
#include "agentcfg/Writer.hpp"

#include <chrono>

using namespace agentcfg;
using agentcfg_test::TempDir;

namespace {

std::chrono::system_clock::time_point at(int seconds) {
    // 2026-01-02 03:04:05 UTC
    return std::chrono::system_clock::from_time_t(1767323045 + seconds);
}

void snapshot(const std::string& path, const Config& cfg, int seconds) {
    save_config(WriteRequest{path, cfg, std::nullopt});
    create_backup(path, at(seconds));
}

Config with_reviewer() {
    Config cfg = default_config();
    (*cfg.agents)["reviewer"] = ModelBinding{"openai/gpt-5.2", std::nullopt};
    return cfg;
}

Config with_reviewer_and_new_sisyphus() {
    Config cfg = with_reviewer();
    cfg.agents->at("sisyphus").model = "x-ai/grok-code-fast-1";
    return cfg;
}

/// Three backups: add reviewer, change sisyphus, then no change.
std::string three_backups(const TempDir& dir) {
    const std::string path = dir.file("oh-my-opencode.json");
    snapshot(path, with_reviewer(), 0);
    snapshot(path, with_reviewer_and_new_sisyphus(), 60);
    snapshot(path, with_reviewer_and_new_sisyphus(), 120);
    return path;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Building
// ============================================================================

TEST(ConfigHistory, EachBackupDiffedAgainstPrevious) {
    TempDir dir;
    const std::string path = three_backups(dir);

    auto history = config_history(path);

    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].timestamp, "20260102-030605");
    EXPECT_TRUE(history[0].changes.empty());
    EXPECT_FALSE(history[0].initial);

    EXPECT_EQ(history[1].timestamp, "20260102-030505");
    EXPECT_EQ(history[1].summary.modifies, 1u);
    ASSERT_EQ(history[1].changes.size(), 1u);
    EXPECT_EQ(history[1].changes[0].path, "agents.sisyphus");

    EXPECT_EQ(history[2].timestamp, "20260102-030405");
    EXPECT_TRUE(history[2].initial);
    EXPECT_EQ(history[2].summary.adds, 1u);
    EXPECT_EQ(history[2].summary.modifies, 0u);
}

TEST(ConfigHistory, LimitKeepsNewestAndRebasesOnDefaults) {
    TempDir dir;
    const std::string path = three_backups(dir);

    auto history = config_history(path, 2);

    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].timestamp, "20260102-030605");
    EXPECT_EQ(history[1].timestamp, "20260102-030505");
    EXPECT_TRUE(history[1].initial);
    EXPECT_EQ(history[1].summary.adds, 1u);
    EXPECT_EQ(history[1].summary.modifies, 1u);
}

TEST(BuildHistory, BackupEqualToDefaultsIsNotInitial) {
    TempDir dir;
    const std::string path = dir.file("oh-my-opencode.json");
    snapshot(path, default_config(), 0);

    auto history = build_history(list_backups(path));

    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].initial);
    EXPECT_TRUE(history[0].changes.empty());
}

TEST(BuildHistory, NoBackups) {
    TempDir dir;
    EXPECT_TRUE(config_history(dir.file("oh-my-opencode.json")).empty());
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatHistory, SummaryLines) {
    TempDir dir;
    const std::string path = three_backups(dir);

    const std::string text = format_history(config_history(path), 3);

    EXPECT_TRUE(contains(text, "20260102-030605 ("));
    EXPECT_TRUE(contains(text, "  Changes: No changes\n"));
    EXPECT_TRUE(contains(text, "  Changes: 1 modified\n"));
    EXPECT_TRUE(contains(text, "  ~ agents.sisyphus: anthropic/claude-opus-4-5 -> x-ai/grok-code-fast-1\n"));
    EXPECT_TRUE(contains(text, "  Changes: Initial config (from defaults)\n"));
    EXPECT_TRUE(contains(text, "  + agents.reviewer: (none) -> openai/gpt-5.2\n"));
    EXPECT_EQ(text.substr(text.size() - 16), "Total backups: 3");
}

TEST(FormatHistory, TruncatesLongChangeLists) {
    TempDir dir;
    const std::string path = dir.file("oh-my-opencode.json");
    snapshot(path, default_config(), 0);

    Config busy = default_config();
    for (int i = 0; i < 7; ++i) {
        (*busy.agents)["agent" + std::to_string(i)] = ModelBinding{"m", std::nullopt};
    }
    snapshot(path, busy, 60);

    const std::string text = format_history(config_history(path), 2);

    EXPECT_TRUE(contains(text, "  Changes: 7 added\n"));
    EXPECT_TRUE(contains(text, "  + agents.agent4: (none) -> m\n"));
    EXPECT_FALSE(contains(text, "agents.agent5"));
    EXPECT_TRUE(contains(text, "  ... and 2 more changes\n"));
}

TEST(FormatHistory, EmptyHistory) {
    EXPECT_EQ(format_history({}, 0), "No backups found.");
}

TEST(HistoryToJson, CountsAndDetails) {
    TempDir dir;
    const std::string path = three_backups(dir);

    Value j = history_to_json(config_history(path));

    ASSERT_EQ(j.size(), 3u);
    EXPECT_EQ(j[1]["timestamp"], "20260102-030505");
    EXPECT_EQ(j[1]["changes"], Value({{"added", 0}, {"modified", 1}, {"removed", 0}}));
    ASSERT_EQ(j[1]["details"].size(), 1u);
    EXPECT_EQ(j[1]["details"][0]["type"], "modify");
    EXPECT_TRUE(j[1]["created"].is_string());
}
