#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace config
{

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb)
{
    const bool taken = std::any_of(handlers_.begin(), handlers_.end(),
                                   [&path](const HandlerEntry& entry) { return entry.path == path; });
    if (taken)
    {
        last_error_ = "table [" + path + "] already has a handler";
        PLOG_ERROR << last_error_;
        return false;
    }
    handlers_.push_back({ path, std::move(cb) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream in(config_path_, std::ios::binary);
    if (!in)
    {
        PLOG_INFO << "Config " << config_path_ << " not found, using defaults";
        root_ = std::make_unique<toml::table>();
        applyHandlers();
        return true;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return parseAndApply(contents.str(), config_path_);
}

bool ConfigManager::loadFromString(std::string_view toml_text)
{
    last_error_.clear();
    return parseAndApply(toml_text, "<string>");
}

bool ConfigManager::parseAndApply(std::string_view toml_text, const std::string& source_name)
{
    toml::table parsed;
    try
    {
        parsed = toml::parse(toml_text, std::string_view{ source_name });
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        std::ostringstream details;
        details << source_name << ":" << where.line << ":" << where.column << ": " << pe.description();

        last_error_ = details.str();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration has errors, using defaults", last_error_);
        root_ = std::make_unique<toml::table>();
        return false;
    }

    root_ = std::make_unique<toml::table>(std::move(parsed));
    applyHandlers();
    return true;
}

void ConfigManager::applyHandlers()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        if (!handler.callbacks.load)
            continue;
        const toml::table* section = resolveTablePath(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

const toml::table& ConfigManager::root() const { return *root_; }

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    const toml::table* section = root.at_path(path).as_table();
    if (!section && root.at_path(path))
        PLOG_WARNING << "Config key '" << path << "' is not a table, ignoring it";
    return section;
}

} // namespace config
