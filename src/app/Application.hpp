#pragma once

#include "CommandLine.hpp"
#include "config/AppSettings.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace dictionary
{
class DictionaryStore;
}

namespace detection
{
class DetectionEngine;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    void initializeConfig();
    bool initializeLogging();
    void setupEngine();

    int runRedact();
    int runDict();
    int runStatus();

    void printUsage(std::ostream& os) const;
    void flushErrorReports() const;
    static bool readInput(const std::string& path, std::string& out);

    std::vector<std::string> args_;
    cli::CommandLineOptions options_;

    config::AppSettings settings_;
    std::shared_ptr<dictionary::DictionaryStore> store_;
    std::unique_ptr<detection::DetectionEngine> engine_;
};
