/**
 * @file Diff.hpp
 * @brief Differences between two config snapshots
 */

#ifndef AGENTCFG_DIFF_HPP
#define AGENTCFG_DIFF_HPP

#include "agentcfg/Config.hpp"
#include "agentcfg/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

enum class DiffType {
    Add,
    Remove,
    Modify
};

/**
 * @brief Wire name of a diff type ("add", "remove", "modify").
 */
const char* diff_type_name(DiffType type);

/**
 * @brief One changed entry, addressed as "<section>.<name>".
 *
 * Add carries only new_value, Remove only old_value, Modify both.
 */
struct DiffEntry {
    DiffType type;
    std::string path;
    std::optional<ModelBinding> old_value;
    std::optional<ModelBinding> new_value;
};

bool operator==(const DiffEntry& a, const DiffEntry& b);

/**
 * @brief Counts per change kind
 */
struct DiffSummary {
    size_t adds = 0;
    size_t modifies = 0;
    size_t removes = 0;
};

/**
 * @brief Compute the entries that turn old_cfg into new_cfg.
 *
 * Covers both sections; an absent section behaves like an empty one.
 * Equal bindings (same model and variant) produce no entry. The result is
 * sorted ascending by path.
 */
std::vector<DiffEntry> generate_diff(const Config& old_cfg, const Config& new_cfg);

/**
 * @brief Render entries as text, one line per entry.
 *
 * Lines look like:
 *   + agents.oracle: openai/gpt-5.2 (high)
 *   - categories.quick: anthropic/claude-haiku-4-5
 *   ~ agents.momus: openai/gpt-5.2 -> openai/gpt-5.2 (high)
 *
 * An empty diff renders as "No changes detected."
 */
std::string format_diff(const std::vector<DiffEntry>& entries);

/**
 * @brief Entries as a JSON array of {type, path, old?, new?}.
 */
Value diff_to_json(const std::vector<DiffEntry>& entries);

/**
 * @brief diff_to_json() dumped with 2-space indentation.
 */
std::string format_diff_json(const std::vector<DiffEntry>& entries);

DiffSummary summarize_diff(const std::vector<DiffEntry>& entries);

} // namespace agentcfg

#endif // AGENTCFG_DIFF_HPP
