#pragma once

#include "../context/OllamaContextClient.hpp"
#include "../detection/DetectionEngine.hpp"

#include <map>
#include <string>

namespace config
{

class ConfigManager;

struct LoggingSettings
{
    int level = 4; // plog severity, 0 (none) to 6 (verbose)
    std::string file = "logs/shieldai.log";
    bool console = false;
    bool verbose = false;
};

// Everything config.toml can set
struct AppSettings
{
    detection::EngineConfig engine;
    context::ContextClientConfig context;
    std::string dictionary_dir = "dictionaries";
    LoggingSettings logging;
    std::map<std::string, std::string> label_overrides; // entity tag -> label
};

// Register [engine], [context], [dictionary], [logging] and [labels]
// handlers that write into settings. settings must outlive manager.load().
void registerSettings(ConfigManager& manager, AppSettings& settings);

} // namespace config
