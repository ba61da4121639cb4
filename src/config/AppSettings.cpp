#include "AppSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <algorithm>
#include <cstdint>

namespace config
{

namespace
{

void loadEngine(const toml::table& t, detection::EngineConfig& engine)
{
    if (auto v = t["use_context"].value<bool>())
        engine.use_context = *v;
    if (auto v = t["min_text_length_for_context"].value<std::int64_t>())
    {
        if (*v >= 0)
            engine.min_text_length_for_context = static_cast<std::size_t>(*v);
        else
            PLOG_WARNING << "Ignoring negative engine.min_text_length_for_context: " << *v;
    }
}

void loadContext(const toml::table& t, context::ContextClientConfig& ctx)
{
    if (auto v = t["base_url"].value<std::string>())
        ctx.base_url = *v;
    if (auto v = t["model"].value<std::string>())
        ctx.model = *v;
    if (auto v = t["connect_timeout_ms"].value<int>())
        ctx.connect_timeout_ms = std::max(*v, 1);
    if (auto v = t["timeout_ms"].value<int>())
        ctx.timeout_ms = std::max(*v, 1);
}

void loadLogging(const toml::table& t, LoggingSettings& logging)
{
    if (auto v = t["level"].value<int>())
        logging.level = std::clamp(*v, 0, 6);
    if (auto v = t["file"].value<std::string>())
        logging.file = *v;
    if (auto v = t["console"].value<bool>())
        logging.console = *v;
    if (auto v = t["verbose"].value<bool>())
        logging.verbose = *v;
}

void loadLabels(const toml::table& t, std::map<std::string, std::string>& overrides)
{
    for (const auto& [key, node] : t)
    {
        if (auto label = node.value<std::string>())
            overrides[std::string(key.str())] = *label;
        else
            PLOG_WARNING << "Ignoring non-string label for tag " << key.str();
    }
}

} // namespace

void registerSettings(ConfigManager& manager, AppSettings& settings)
{
    manager.registerTable("engine", { [&settings](const toml::table& t) { loadEngine(t, settings.engine); } });
    manager.registerTable("context", { [&settings](const toml::table& t) { loadContext(t, settings.context); } });
    manager.registerTable("dictionary", { [&settings](const toml::table& t) {
                              if (auto v = t["directory"].value<std::string>())
                                  settings.dictionary_dir = *v;
                          } });
    manager.registerTable("logging", { [&settings](const toml::table& t) { loadLogging(t, settings.logging); } });
    manager.registerTable("labels",
                          { [&settings](const toml::table& t) { loadLabels(t, settings.label_overrides); } });
}

} // namespace config
