#include "agentcfg/Defaults.hpp"

namespace agentcfg {

namespace {

ModelBinding bind(std::string model) {
    return ModelBinding{std::move(model), std::nullopt};
}

ModelBinding bind(std::string model, std::string variant) {
    return ModelBinding{std::move(model), std::move(variant)};
}

Config make_default_config() {
    Config cfg;
    cfg.agents = BindingMap{
        {"sisyphus", bind("anthropic/claude-opus-4-5", "max")},
        {"hephaestus", bind("openai/gpt-5.2-codex")},
        {"oracle", bind("openai/gpt-5.2", "high")},
        {"librarian", bind("zai-coding-plan/glm-4.7")},
        {"explore", bind("x-ai/grok-code-fast-1")},
        {"multimodal-looker", bind("google/gemini-3-flash")},
        {"prometheus", bind("anthropic/claude-opus-4-5", "max")},
        {"metis", bind("anthropic/claude-opus-4-5")},
        {"momus", bind("openai/gpt-5.2")},
        {"atlas", bind("kimi-for-coding/k2p5")},
    };
    cfg.categories = BindingMap{
        {"visual-engineering", bind("google/gemini-3-pro")},
        {"ultrabrain", bind("openai/gpt-5.2-codex", "xhigh")},
        {"deep", bind("openai/gpt-5.2-codex", "medium")},
        {"artistry", bind("google/gemini-3-pro", "max")},
        {"quick", bind("anthropic/claude-haiku-4-5")},
        {"unspecified-low", bind("anthropic/claude-sonnet-4-5")},
        {"unspecified-high", bind("anthropic/claude-opus-4-5", "max")},
        {"writing", bind("google/gemini-3-flash")},
    };
    return cfg;
}

} // anonymous namespace

const Config& default_config() {
    static const Config cfg = make_default_config();
    return cfg;
}

} // namespace agentcfg
