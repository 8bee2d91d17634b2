#include <algorithm>
#include <filesystem>
#include <cxxopts.hpp>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "agentcfg/Backup.hpp"
#include "agentcfg/Config.hpp"
#include "agentcfg/Convert.hpp"
#include "agentcfg/Defaults.hpp"
#include "agentcfg/Diff.hpp"
#include "agentcfg/Discover.hpp"
#include "agentcfg/DotPath.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/History.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Merge.hpp"
#include "agentcfg/Profile.hpp"
#include "agentcfg/Util.hpp"
#include "agentcfg/Writer.hpp"

using nlohmann::json;
using namespace agentcfg;

namespace {

struct CliContext {
    std::string config_path;
    bool json_output = false;
    bool dry_run = false;
};

void print_summary(const DiffSummary& s) {
    std::cout << "Summary: " << s.adds << " added, " << s.modifies << " modified, "
              << s.removes << " removed\n";
}

void print_section(const char* title, const std::optional<BindingMap>& section) {
    std::cout << "\n" << title << ":\n";
    if (!section || section->empty()) {
        std::cout << "  (none configured)\n";
        return;
    }
    size_t width = 0;
    for (const auto& [name, _] : *section) width = std::max(width, name.size());
    for (const auto& [name, binding] : *section) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << name
                  << "  " << binding.model
                  << "  " << binding.variant.value_or("none") << "\n";
    }
}

// Show the diff, then back up and save behind the mtime fence.
int apply_change(const CliContext& ctx, const Config& current, const Config& updated,
                 const std::optional<std::filesystem::file_time_type>& mtime) {
    auto entries = generate_diff(current, updated);

    if (ctx.json_output) {
        std::cout << format_diff_json(entries) << "\n";
    } else {
        std::cout << format_diff(entries) << "\n";
    }
    if (entries.empty()) {
        return 0;
    }
    if (ctx.dry_run) {
        if (!ctx.json_output) std::cout << "Dry run: No changes applied.\n";
        return 0;
    }

    save_with_backup(WriteRequest{ctx.config_path, updated, mtime});

    if (!ctx.json_output) {
        print_summary(summarize_diff(entries));
        std::cout << "Saved " << ctx.config_path << "\n";
    }
    return 0;
}

std::pair<std::string, std::string> parse_entry_arg(const std::string& arg) {
    auto [section, name] = split_entry_path(arg);
    if ((section != kAgentsSection && section != kCategoriesSection) || name.empty()) {
        throw std::invalid_argument("Expected agents.<name> or categories.<name>, got '" + arg + "'");
    }
    return {section, name};
}

std::string config_dir_of(const std::string& config_path) {
    const std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

int run_profile(const CliContext& ctx, const std::vector<std::string>& cmdv,
                const std::optional<std::string>& template_opt) {
    auto expect_args = [&](size_t want) {
        if (cmdv.size() < want) {
            throw std::invalid_argument("insufficient arguments for command 'profile " + cmdv[1] + "'");
        }
    };

    const std::string& sub = cmdv[1];
    const std::string dir = config_dir_of(ctx.config_path);

    if (sub == "save") {
        expect_args(3);
        SaveProfileOptions opts;
        opts.config_path = ctx.config_path;
        opts.template_path = template_opt;
        save_profile(dir, cmdv[2], load_config(ctx.config_path), opts);
        std::cout << "Profile \"" << cmdv[2] << "\" saved successfully.\n";
        return 0;
    }
    if (sub == "use") {
        expect_args(3);
        use_profile(dir, cmdv[2]);
        std::cout << "Now using profile \"" << cmdv[2] << "\".\n";
        return 0;
    }
    if (sub == "list") {
        auto profiles = list_profiles(dir);
        if (ctx.json_output) {
            json arr = json::array();
            for (const auto& p : profiles) {
                arr.push_back({{"name", p.name}, {"active", p.active},
                               {"created", format_file_time(p.created)}});
            }
            std::cout << arr.dump(2) << "\n";
            return 0;
        }
        if (profiles.empty()) {
            std::cout << "No profiles found. Create one with 'profile save <name>' first.\n";
            return 0;
        }
        for (const auto& p : profiles) {
            std::cout << (p.active ? "* " : "  ") << p.name
                      << "  (" << format_file_time(p.created) << ")\n";
        }
        return 0;
    }
    if (sub == "delete") {
        expect_args(3);
        delete_profile(dir, cmdv[2]);
        std::cout << "Profile \"" << cmdv[2] << "\" deleted.\n";
        return 0;
    }
    if (sub == "rename") {
        expect_args(4);
        rename_profile(dir, cmdv[2], cmdv[3]);
        std::cout << "Profile \"" << cmdv[2] << "\" renamed to \"" << cmdv[3] << "\".\n";
        return 0;
    }
    if (sub == "template") {
        const std::string path = template_output_path(dir, template_opt);
        Config cfg = load_config(ctx.config_path);
        if (ctx.dry_run) {
            const bool exists = get_file_mtime(path).has_value();
            std::cout << "Dry run: Would " << (exists ? "overwrite" : "create")
                      << " template at " << path << ".\n";
            return 0;
        }
        atomic_write(path, dump_config(cfg, FileFormat::Json));
        std::cout << "Template saved to " << path << ".\n";
        return 0;
    }
    throw std::invalid_argument("Unknown profile command: " + sub);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        init_logging();

        cxxopts::Options options("agentcfg", "Manage agent and category model bindings");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to oh-my-opencode.json (default: discovered)", cxxopts::value<std::string>())
            ("json", "Output as JSON")
            ("dry-run", "Preview without applying")
            ("v,verbose", "Detailed logging")
            ("log-level", "Log level (trace, debug, info, warn, error, off)", cxxopts::value<std::string>())
            ("variant", "Variant for `set`", cxxopts::value<std::string>())
            ("no-variant", "Clear the variant in `set`")
            ("merge", "Merge the imported file into the current config")
            ("format", "Format for `export` (json|toml)", cxxopts::value<std::string>())
            ("template", "Template file for `profile save` / `profile template`", cxxopts::value<std::string>())
            ("limit", "Number of backups shown by `history`", cxxopts::value<size_t>())
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: path | list | diff | set SECTION.NAME MODEL | unset SECTION.NAME |"
                         " import FILE | export FILE | reset | backup create|list|restore TIMESTAMP | undo |"
                         " history | profile save|use|delete NAME | profile list | profile rename OLD NEW |"
                         " profile template\n";
            return 0;
        }

        if (result.count("verbose")) set_log_level("debug");
        if (result.count("log-level")) {
            const auto level = result["log-level"].as<std::string>();
            if (!set_log_level(level)) {
                throw std::invalid_argument("Unknown log level: " + level);
            }
        }

        CliContext ctx;
        std::optional<std::string> explicit_path;
        if (result.count("config")) explicit_path = result["config"].as<std::string>();
        ctx.config_path = resolve_config_path(explicit_path, default_discover_options());
        ctx.json_output = result.count("json") > 0;
        ctx.dry_run = result.count("dry-run") > 0;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw std::invalid_argument("insufficient arguments for command '" + cmd + "'");
            }
        };

        // PATH
        if (cmd == "path") {
            std::cout << ctx.config_path << "\n";
            return 0;
        }

        // LIST
        if (cmd == "list") {
            Config cfg = load_config(ctx.config_path);
            if (ctx.json_output) {
                std::cout << cfg.to_json_string(2) << "\n";
                return 0;
            }
            std::cout << "Config source: " << ctx.config_path << "\n";
            print_section("Agents", cfg.agents);
            print_section("Categories", cfg.categories);
            return 0;
        }

        // DIFF (defaults -> current)
        if (cmd == "diff") {
            Config cfg = load_config(ctx.config_path);
            auto entries = generate_diff(default_config(), cfg);
            if (ctx.json_output) {
                std::cout << format_diff_json(entries) << "\n";
                return 0;
            }
            std::cout << "Comparing to defaults\nCurrent: " << ctx.config_path << "\n\n";
            std::cout << format_diff(entries) << "\n";
            if (!entries.empty()) print_summary(summarize_diff(entries));
            return 0;
        }

        // SET
        if (cmd == "set") {
            expect_args(3);
            auto [section, name] = parse_entry_arg(cmdv[1]);
            if (result.count("variant") && result.count("no-variant")) {
                throw std::invalid_argument("--variant and --no-variant are mutually exclusive");
            }

            auto mtime = get_file_mtime(ctx.config_path);
            Config current = load_config(ctx.config_path);

            ModelBinding binding{cmdv[2], std::nullopt};
            if (result.count("variant")) binding.variant = result["variant"].as<std::string>();

            Config patch;
            *patch.section(section) = BindingMap{{name, binding}};
            Config updated = merge_configs(current, patch);
            if (result.count("no-variant")) {
                (*updated.section(section))->at(name).variant.reset();
            }
            return apply_change(ctx, current, updated, mtime);
        }

        // UNSET
        if (cmd == "unset") {
            expect_args(2);
            auto [section, name] = parse_entry_arg(cmdv[1]);

            auto mtime = get_file_mtime(ctx.config_path);
            Config current = load_config(ctx.config_path);
            Config updated = current;
            auto& entries = *updated.section(section);
            if (!entries || entries->erase(name) == 0) {
                throw std::invalid_argument("No entry " + cmdv[1] + " in " + ctx.config_path);
            }
            return apply_change(ctx, current, updated, mtime);
        }

        // IMPORT
        if (cmd == "import") {
            expect_args(2);
            const std::string source = cmdv[1];

            auto mtime = get_file_mtime(ctx.config_path);
            Config current = load_config(ctx.config_path);
            Config imported = load_config_file(source, format_from_path(source));
            if (result.count("merge")) {
                imported = merge_configs(current, imported, "Merged import of " + source);
            }
            return apply_change(ctx, current, imported, mtime);
        }

        // EXPORT
        if (cmd == "export") {
            expect_args(2);
            const std::string out = cmdv[1];
            const FileFormat format = result.count("format")
                ? parse_format(result["format"].as<std::string>())
                : format_from_path(out);

            Config cfg = load_config(ctx.config_path);
            atomic_write(out, dump_config(cfg, format));
            if (ctx.json_output) {
                std::cout << json{{"success", true}, {"path", out}}.dump() << "\n";
            } else {
                std::cout << "Configuration exported to " << out << "\n";
            }
            return 0;
        }

        // RESET
        if (cmd == "reset") {
            auto mtime = get_file_mtime(ctx.config_path);
            Config current = load_config(ctx.config_path);
            return apply_change(ctx, current, default_config(), mtime);
        }

        // BACKUP
        if (cmd == "backup") {
            expect_args(2);
            const std::string sub = cmdv[1];
            if (sub == "create") {
                std::cout << "Backup created: " << create_backup(ctx.config_path) << "\n";
                cleanup_old_backups(ctx.config_path);
                return 0;
            }
            if (sub == "list") {
                auto backups = list_backups(ctx.config_path);
                if (ctx.json_output) {
                    json arr = json::array();
                    for (const auto& b : backups) arr.push_back({{"timestamp", b.timestamp}, {"path", b.path}});
                    std::cout << arr.dump(2) << "\n";
                    return 0;
                }
                if (backups.empty()) {
                    std::cout << "No backups found for " << ctx.config_path << "\n";
                    return 0;
                }
                for (const auto& b : backups) std::cout << b.timestamp << "  " << b.path << "\n";
                return 0;
            }
            if (sub == "restore") {
                expect_args(3);
                if (ctx.dry_run) {
                    std::cout << "Dry run: Would restore backup " << cmdv[2] << "\n";
                    return 0;
                }
                restore_backup(ctx.config_path, cmdv[2]);
                std::cout << "Restored backup " << cmdv[2] << "\n";
                return 0;
            }
            throw std::invalid_argument("Unknown backup command: " + sub);
        }

        // HISTORY
        if (cmd == "history") {
            std::optional<size_t> limit;
            if (result.count("limit")) limit = result["limit"].as<size_t>();
            auto entries = config_history(ctx.config_path, limit);
            if (ctx.json_output) {
                std::cout << history_to_json(entries).dump(2) << "\n";
                return 0;
            }
            std::cout << "Configuration History\n\n"
                      << format_history(entries, list_backups(ctx.config_path).size()) << "\n";
            return 0;
        }

        // PROFILE
        if (cmd == "profile") {
            expect_args(2);
            std::optional<std::string> template_opt;
            if (result.count("template")) template_opt = result["template"].as<std::string>();
            return run_profile(ctx, cmdv, template_opt);
        }

        // UNDO (restore newest backup)
        if (cmd == "undo") {
            auto backups = list_backups(ctx.config_path);
            if (backups.empty()) {
                std::cout << "No backups found. Cannot undo.\n";
                return 1;
            }
            const std::string ts = backups.front().timestamp;
            if (ctx.dry_run) {
                std::cout << "Dry run: Would restore backup " << ts << "\n";
                return 0;
            }
            restore_backup(ctx.config_path, ts);
            std::cout << "Successfully restored backup " << ts << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const InvalidConfig& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const PermissionDenied& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Check file permissions or try running with sudo.\n";
        return 1;
    } catch (const ConcurrentModificationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "The configuration was modified by another process. Please try again.\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
