/**
 * @file test_profile.cpp
 * @brief Tests for named profiles and the active-profile link
 */

#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Profile.hpp"
#include "agentcfg/Writer.hpp"

#include <chrono>

using namespace agentcfg;
using agentcfg_test::TempDir;
using agentcfg_test::read_file;

namespace fs = std::filesystem;

namespace {

Config agents_config(const std::string& name, const std::string& model) {
    Config cfg;
    cfg.agents = BindingMap{{name, {model, std::nullopt}}};
    return cfg;
}

void write_json(const std::string& path, const Config& cfg) {
    atomic_write(path, Value(cfg).dump(2) + "\n");
}

std::string config_dir(const TempDir& dir) {
    return dir.path().string();
}

} // anonymous namespace

// ============================================================================
// Names and paths
// ============================================================================

TEST(ValidateProfileName, AcceptsLettersDigitsHyphenUnderscore) {
    EXPECT_NO_THROW(validate_profile_name("work_2-fast"));
    EXPECT_NO_THROW(validate_profile_name(std::string(32, 'a')));
}

TEST(ValidateProfileName, LengthBounds) {
    try {
        validate_profile_name(std::string(33, 'a'));
        FAIL() << "Expected ProfileNameError";
    } catch (const ProfileNameError& e) {
        EXPECT_NE(std::string(e.what()).find("must be between 1 and 32 characters"), std::string::npos);
    }
    EXPECT_THROW(validate_profile_name(""), ProfileNameError);
}

TEST(ValidateProfileName, RejectsOtherCharacters) {
    for (const char* name : {"a b", "../x", "work.json", "caf\xc3\xa9"}) {
        try {
            validate_profile_name(name);
            FAIL() << "Expected ProfileNameError for " << name;
        } catch (const ProfileNameError& e) {
            EXPECT_NE(std::string(e.what()).find("only letters, numbers, hyphens, and underscores"),
                      std::string::npos);
        }
    }
}

TEST(ValidateProfileName, ReservedNames) {
    for (const auto& name : reserved_profile_names()) {
        EXPECT_THROW(validate_profile_name(name), ProfileNameError) << name;
        EXPECT_NO_THROW(validate_profile_name(name, true)) << name;
    }
    try {
        validate_profile_name("temp");
        FAIL() << "Expected ProfileNameError";
    } catch (const ProfileNameError& e) {
        EXPECT_EQ(std::string(e.what()), "Invalid profile name \"temp\": is a reserved name");
    }
}

TEST(ProfilePath, NamingScheme) {
    EXPECT_EQ(profile_path("/cfg", "work"), "/cfg/oh-my-opencode-work.json");
    EXPECT_EQ(active_config_path("/cfg"), "/cfg/oh-my-opencode.json");
}

// ============================================================================
// Save
// ============================================================================

TEST(SaveProfile, FirstSaveCreatesDefaultFromCurrentConfig) {
    TempDir dir;
    const std::string cfg_path = active_config_path(config_dir(dir));
    write_json(cfg_path, agents_config("oracle", "current/model"));

    save_profile(config_dir(dir), "work", agents_config("oracle", "work/model"));

    EXPECT_EQ(load_config(profile_path(config_dir(dir), "default")), agents_config("oracle", "current/model"));
    EXPECT_EQ(load_config(profile_path(config_dir(dir), "work")), agents_config("oracle", "work/model"));
}

TEST(SaveProfile, FirstSaveWithoutConfigUsesSavedConfig) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "work/model"));

    EXPECT_EQ(load_config(profile_path(config_dir(dir), "default")), agents_config("oracle", "work/model"));
}

TEST(SaveProfile, LaterSavesLeaveDefaultAlone) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "a"));
    const std::string default_before = read_file(profile_path(config_dir(dir), "default"));

    save_profile(config_dir(dir), "home", agents_config("oracle", "b"));

    EXPECT_EQ(read_file(profile_path(config_dir(dir), "default")), default_before);
    EXPECT_EQ(list_profiles(config_dir(dir)).size(), 3u);
}

TEST(SaveProfile, ReservedNameRefused) {
    TempDir dir;
    EXPECT_THROW(save_profile(config_dir(dir), "default", agents_config("a", "m")), ProfileNameError);
    EXPECT_TRUE(list_profiles(config_dir(dir)).empty());
}

TEST(SaveProfile, InvalidConfigRefused) {
    TempDir dir;
    try {
        save_profile(config_dir(dir), "work", agents_config("oracle", ""));
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        EXPECT_NE(std::string(e.what()).find("Config validation failed: agents.oracle.model"),
                  std::string::npos);
    }
    EXPECT_FALSE(fs::exists(profile_path(config_dir(dir), "work")));
}

TEST(SaveProfile, TemplateBesideConfigIsMergedUnder) {
    TempDir dir;
    Config tmpl;
    tmpl.agents = BindingMap{{"oracle", {"tmpl/model", std::string("high")}}};
    tmpl.categories = BindingMap{{"quick", {"tmpl/fast", std::nullopt}}};
    write_json(dir.file(kProfileTemplateFileName), tmpl);

    save_profile(config_dir(dir), "work", agents_config("oracle", "work/model"));

    Config saved = load_config(profile_path(config_dir(dir), "work"));
    EXPECT_EQ(saved.agents->at("oracle"), (ModelBinding{"work/model", std::string("high")}));
    ASSERT_TRUE(saved.categories.has_value());
    EXPECT_EQ(saved.categories->at("quick").model, "tmpl/fast");
}

TEST(SaveProfile, ExplicitTemplateWins) {
    TempDir dir;
    write_json(dir.file(kProfileTemplateFileName), agents_config("beside", "m"));
    const std::string explicit_tmpl = dir.file("other/base.json");
    write_json(explicit_tmpl, agents_config("explicit", "m"));

    SaveProfileOptions options;
    options.template_path = explicit_tmpl;
    save_profile(config_dir(dir), "work", agents_config("oracle", "x"), options);

    Config saved = load_config(profile_path(config_dir(dir), "work"));
    EXPECT_EQ(saved.agents->count("explicit"), 1u);
    EXPECT_EQ(saved.agents->count("beside"), 0u);
}

TEST(SaveProfile, MissingExplicitTemplateFallsBack) {
    TempDir dir;
    write_json(dir.file(kProfileTemplateFileName), agents_config("beside", "m"));

    SaveProfileOptions options;
    options.template_path = dir.file("nope.json");
    save_profile(config_dir(dir), "work", agents_config("oracle", "x"), options);

    EXPECT_EQ(load_config(profile_path(config_dir(dir), "work")).agents->count("beside"), 1u);
}

TEST(ApplyTemplate, InvalidMergeNamesTemplate) {
    try {
        apply_template(Config{}, agents_config("oracle", ""));
        FAIL() << "Expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        EXPECT_NE(std::string(e.what()).find("Template merge failed: agents.oracle.model"),
                  std::string::npos);
    }
}

// ============================================================================
// Use and list
// ============================================================================

TEST(UseProfile, LinksConfigToProfile) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "work/model"));

    use_profile(config_dir(dir), "work");

    const std::string link = active_config_path(config_dir(dir));
    ASSERT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(fs::read_symlink(link), fs::path("oh-my-opencode-work.json"));
    EXPECT_EQ(load_config(link), agents_config("oracle", "work/model"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(link + ".tmp.link")));
    EXPECT_EQ(active_profile_name(config_dir(dir)), std::optional<std::string>("work"));
}

TEST(UseProfile, SwitchesBetweenProfiles) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "a"));
    use_profile(config_dir(dir), "work");

    use_profile(config_dir(dir), "default");

    EXPECT_EQ(active_profile_name(config_dir(dir)), std::optional<std::string>("default"));
}

TEST(UseProfile, MissingProfileThrows) {
    TempDir dir;
    try {
        use_profile(config_dir(dir), "ghost");
        FAIL() << "Expected ProfileNotFound";
    } catch (const ProfileNotFound& e) {
        EXPECT_EQ(std::string(e.what()), "Profile \"ghost\" not found");
    }
    EXPECT_FALSE(fs::exists(fs::symlink_status(active_config_path(config_dir(dir)))));
}

TEST(UseProfile, EditsGoThroughTheLink) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "a"));
    use_profile(config_dir(dir), "work");

    save_config(WriteRequest{active_config_path(config_dir(dir)), agents_config("oracle", "b"), std::nullopt});

    EXPECT_TRUE(fs::is_symlink(active_config_path(config_dir(dir))));
    EXPECT_EQ(load_config(profile_path(config_dir(dir), "work")), agents_config("oracle", "b"));
}

TEST(ActiveProfileName, RegularFileIsNone) {
    TempDir dir;
    write_json(active_config_path(config_dir(dir)), agents_config("a", "m"));
    EXPECT_FALSE(active_profile_name(config_dir(dir)).has_value());
}

TEST(ActiveProfileName, LinkToOtherFileIsNone) {
    TempDir dir;
    write_json(dir.file("elsewhere.json"), agents_config("a", "m"));
    fs::create_symlink("elsewhere.json", active_config_path(config_dir(dir)));
    EXPECT_FALSE(active_profile_name(config_dir(dir)).has_value());
}

TEST(ActiveProfileName, DanglingLinkThrows) {
    TempDir dir;
    fs::create_symlink("oh-my-opencode-gone.json", active_config_path(config_dir(dir)));
    try {
        active_profile_name(config_dir(dir));
        FAIL() << "Expected DanglingSymlink";
    } catch (const DanglingSymlink& e) {
        EXPECT_NE(std::string(e.what()).find("target \"oh-my-opencode-gone.json\" no longer exists"),
                  std::string::npos);
    }
    EXPECT_THROW(list_profiles(config_dir(dir)), DanglingSymlink);
}

TEST(ListProfiles, OldestFirstWithActiveFlag) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("a", "m"));
    save_profile(config_dir(dir), "home", agents_config("a", "m"));
    dir.create_file("oh-my-opencode.template.json", "{}");
    dir.create_file("oh-my-opencode-work.json.backup.20260102-030405", "{}");

    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(profile_path(config_dir(dir), "home"), now - std::chrono::hours(3));
    fs::last_write_time(profile_path(config_dir(dir), "default"), now - std::chrono::hours(2));
    fs::last_write_time(profile_path(config_dir(dir), "work"), now - std::chrono::hours(1));
    use_profile(config_dir(dir), "work");

    auto profiles = list_profiles(config_dir(dir));

    ASSERT_EQ(profiles.size(), 3u);
    EXPECT_EQ(profiles[0].name, "home");
    EXPECT_EQ(profiles[1].name, "default");
    EXPECT_EQ(profiles[2].name, "work");
    EXPECT_FALSE(profiles[0].active);
    EXPECT_TRUE(profiles[2].active);
}

TEST(ListProfiles, MissingDirectoryIsEmpty) {
    TempDir dir;
    EXPECT_TRUE(list_profiles(dir.file("nope")).empty());
}

// ============================================================================
// Delete and rename
// ============================================================================

TEST(DeleteProfile, RemovesInactiveProfile) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("a", "m"));
    use_profile(config_dir(dir), "work");

    delete_profile(config_dir(dir), "default");

    EXPECT_FALSE(fs::exists(profile_path(config_dir(dir), "default")));
}

TEST(DeleteProfile, ActiveProfileRefused) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("a", "m"));
    use_profile(config_dir(dir), "work");

    try {
        delete_profile(config_dir(dir), "work");
        FAIL() << "Expected ProfileActive";
    } catch (const ProfileActive& e) {
        EXPECT_NE(std::string(e.what()).find("Switch to another profile first"), std::string::npos);
    }
    EXPECT_TRUE(fs::exists(profile_path(config_dir(dir), "work")));
}

TEST(DeleteProfile, MissingProfileThrows) {
    TempDir dir;
    EXPECT_THROW(delete_profile(config_dir(dir), "ghost"), ProfileNotFound);
}

TEST(RenameProfile, MovesActiveLink) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "w"));
    use_profile(config_dir(dir), "work");

    rename_profile(config_dir(dir), "work", "office");

    EXPECT_FALSE(fs::exists(profile_path(config_dir(dir), "work")));
    EXPECT_EQ(active_profile_name(config_dir(dir)), std::optional<std::string>("office"));
    EXPECT_EQ(load_config(active_config_path(config_dir(dir))), agents_config("oracle", "w"));
}

TEST(RenameProfile, InactiveProfileKeepsLink) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("oracle", "w"));
    use_profile(config_dir(dir), "work");

    rename_profile(config_dir(dir), "default", "original");

    EXPECT_TRUE(fs::exists(profile_path(config_dir(dir), "original")));
    EXPECT_EQ(active_profile_name(config_dir(dir)), std::optional<std::string>("work"));
}

TEST(RenameProfile, Conflicts) {
    TempDir dir;
    save_profile(config_dir(dir), "work", agents_config("a", "m"));
    save_profile(config_dir(dir), "home", agents_config("a", "m"));

    EXPECT_THROW(rename_profile(config_dir(dir), "work", "home"), ProfileExists);
    EXPECT_THROW(rename_profile(config_dir(dir), "ghost", "other"), ProfileNotFound);
    EXPECT_THROW(rename_profile(config_dir(dir), "work", "current"), ProfileNameError);
    EXPECT_TRUE(fs::exists(profile_path(config_dir(dir), "work")));
}

// ============================================================================
// Template output path
// ============================================================================

TEST(TemplateOutputPath, DefaultsBesideConfig) {
    TempDir dir;
    const fs::path base = fs::weakly_canonical(dir.path());
    EXPECT_EQ(template_output_path(config_dir(dir)), (base / kProfileTemplateFileName).string());
    EXPECT_EQ(template_output_path(config_dir(dir), std::string("  sub/t.json ")),
              (base / "sub" / "t.json").string());
}

TEST(TemplateOutputPath, OutsideConfigDirRefused) {
    TempDir dir;
    EXPECT_THROW(template_output_path(config_dir(dir), std::string("../escape.json")), InvalidConfig);
    EXPECT_THROW(template_output_path(config_dir(dir), std::string("/etc/t.json")), InvalidConfig);
}

// ============================================================================
// Symlink swap
// ============================================================================

TEST(UpdateSymlink, ReplacesRegularFileAndStaleTempLink) {
    TempDir dir;
    const std::string link = dir.create_file("cfg.json", "{}");
    dir.create_file("target.json", "{\"agents\": {}}");
    fs::create_symlink("missing", link + ".tmp.link");

    update_symlink("target.json", link);

    ASSERT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(read_file(link), "{\"agents\": {}}");
    EXPECT_FALSE(fs::exists(fs::symlink_status(link + ".tmp.link")));
}

TEST(UpdateSymlink, DirectoryInTheWayFails) {
    TempDir dir;
    const std::string link = dir.file("cfg.json");
    fs::create_directories(fs::path(link) / "inner");

    EXPECT_ANY_THROW(update_symlink("target.json", link));
    EXPECT_TRUE(fs::is_directory(link));
    EXPECT_FALSE(fs::exists(fs::symlink_status(link + ".tmp.link")));
}
