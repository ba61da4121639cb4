#include "Application.hpp"
#include "JsonOutput.hpp"
#include "config/ConfigManager.hpp"
#include "context/ContextDetector.hpp"
#include "context/OllamaContextClient.hpp"
#include "detection/DetectionEngine.hpp"
#include "detection/Diagnostics.hpp"
#include "detection/PatternRecognizerSet.hpp"
#include "dictionary/DictionaryStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (!cli::parseCommandLine(args_, options_))
    {
        std::cerr << options_.error << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (options_.command == cli::Command::Help)
    {
        printUsage(std::cout);
        return 0;
    }

    initializeConfig();
    if (!initializeLogging())
    {
        flushErrorReports();
        return 1;
    }

    PROFILE_SCOPE_FUNCTION();
    setupEngine();

    int rc = 1;
    switch (options_.command)
    {
    case cli::Command::Redact:
        rc = runRedact();
        break;
    case cli::Command::Dict:
        rc = runDict();
        break;
    case cli::Command::Status:
        rc = runStatus();
        break;
    case cli::Command::Help:
        rc = 0;
        break;
    }

    flushErrorReports();
    return rc;
}

void Application::initializeConfig()
{
    config::ConfigManager manager(options_.config_path);
    config::registerSettings(manager, settings_);
    if (!manager.load())
        settings_ = config::AppSettings{}; // parse error already queued in ErrorReporter

    if (options_.use_context)
        settings_.engine.use_context = true;
}

bool Application::initializeLogging()
{
    utils::LogOptions options;
    options.level = static_cast<plog::Severity>(settings_.logging.level);
    options.main_file = settings_.logging.file;
    options.console = settings_.logging.console;

    if (!utils::LogManager::Initialize(options))
        return false;

    if (!utils::LogManager::AttachChannel<detection::Diagnostics::kLogInstance>("diagnostics.log"))
        PLOG_WARNING << "Diagnostics log unavailable";
#if SHIELDAI_PROFILING_LEVEL >= 1
    if (!utils::LogManager::AttachChannel<profiling::kProfilingLogInstance>("profiling.log", plog::debug))
        PLOG_WARNING << "Profiling log unavailable";
#endif

    detection::Diagnostics::SetVerbose(settings_.logging.verbose);
    PLOG_INFO << "shieldai starting, config " << options_.config_path;
    return true;
}

void Application::setupEngine()
{
    PROFILE_SCOPE_FUNCTION();

    store_ = std::make_shared<dictionary::DictionaryStore>(settings_.dictionary_dir);
    if (!store_->load())
        PLOG_WARNING << "Dictionary unavailable: " << store_->lastError();

    auto client = std::make_shared<const context::OllamaContextClient>(settings_.context);
    auto detector = std::make_shared<const context::ContextDetector>(client);
    auto labels = std::make_shared<const detection::EntityLabelTable>(settings_.label_overrides);

    engine_ = std::make_unique<detection::DetectionEngine>(
        settings_.engine, detection::PatternRecognizerSet::createDefault(), store_, detector, labels);
}

int Application::runRedact()
{
    std::string text;
    const std::string path = options_.inputPath();
    if (!readInput(path, text))
    {
        std::cerr << "Cannot read input: " << path << "\n";
        return 1;
    }

    const auto result = engine_->detect(text);
    PLOG_INFO << "Redacted " << result.detections.size() << " spans in " << result.processing_time_ms << " ms";

    if (options_.json)
        std::cout << cli::dumpJson(cli::detectionResultToJson(result, engine_->labels())) << "\n";
    else
        std::cout << result.masked_text;
    std::cout.flush();
    return 0;
}

int Application::runDict()
{
    const auto& positional = options_.positional;
    const std::string& action = positional.front();
    const std::vector<std::string> params(positional.begin() + 1, positional.end());

    if (action == "list" && params.empty())
    {
        auto terms = store_->snapshot();
        if (options_.json)
        {
            std::cout << cli::dumpJson(cli::termListToJson(*terms)) << "\n";
        }
        else
        {
            for (const auto& term : *terms)
                std::cout << term.value << '\t' << term.label << '\t' << term.category << '\n';
        }
        return 0;
    }

    if (action == "add" && !params.empty() && params.size() <= 3)
    {
        const std::string label = params.size() > 1 ? params[1] : std::string(dictionary::kDefaultLabel);
        const std::string category = params.size() > 2 ? params[2] : std::string(dictionary::kDefaultCategory);
        if (!store_->addTerm(params[0], label, category))
        {
            const std::string error = store_->lastError();
            std::cerr << (error.empty() ? "Entry already exists: " + params[0] : error) << "\n";
            return 1;
        }
        std::cout << "Added: " << params[0] << "\n";
        return 0;
    }

    if (action == "remove" && params.size() == 1)
    {
        if (!store_->removeTerm(params[0]))
        {
            const std::string error = store_->lastError();
            std::cerr << (error.empty() ? "Entry not found: " + params[0] : error) << "\n";
            return 1;
        }
        std::cout << "Deleted: " << params[0] << "\n";
        return 0;
    }

    if (action == "import" && params.size() == 1)
    {
        std::string csv;
        if (!readInput(params[0], csv))
        {
            std::cerr << "Cannot read CSV file: " << params[0] << "\n";
            return 1;
        }
        const auto imported = store_->importCsv(csv);
        const std::string error = store_->lastError();
        if (imported == 0 && !error.empty())
        {
            std::cerr << error << "\n";
            return 1;
        }
        std::cout << "Imported: " << imported << "\n";
        return 0;
    }

    printUsage(std::cerr);
    return 1;
}

int Application::runStatus()
{
    const bool reachable = engine_->isContextAvailable();

    if (options_.json)
    {
        const nlohmann::json status = { { "status", "ok" },
                                        { "use_context", settings_.engine.use_context },
                                        { "context_available", reachable },
                                        { "context_model", settings_.context.model },
                                        { "dictionary_terms", store_->size() } };
        std::cout << cli::dumpJson(status) << "\n";
        return 0;
    }

    std::cout << "use_context: " << (settings_.engine.use_context ? "true" : "false") << "\n"
              << "context_available: " << (reachable ? "true" : "false") << " (" << settings_.context.base_url
              << ", " << settings_.context.model << ")\n"
              << "dictionary_terms: " << store_->size() << "\n";
    return 0;
}

void Application::printUsage(std::ostream& os) const
{
    os << "Usage:\n"
       << "  shieldai [--config PATH] [--use-context] [--json] [FILE]\n"
       << "  shieldai [--config PATH] [--json] dict list\n"
       << "  shieldai [--config PATH] dict add VALUE [LABEL] [CATEGORY]\n"
       << "  shieldai [--config PATH] dict remove VALUE\n"
       << "  shieldai [--config PATH] dict import CSV_FILE\n"
       << "  shieldai [--config PATH] [--json] status\n";
}

void Application::flushErrorReports() const
{
    for (const auto& report : utils::ErrorReporter::TakePending(utils::ErrorSeverity::Warning))
    {
        std::cerr << utils::ErrorReporter::SeverityName(report.severity) << " ["
                  << utils::ErrorReporter::CategoryName(report.category) << "] " << report.summary;
        if (!report.details.empty())
            std::cerr << ": " << report.details;
        std::cerr << "\n";
    }
}

bool Application::readInput(const std::string& path, std::string& out)
{
    if (path == "-")
    {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    out = buffer.str();
    return true;
}
