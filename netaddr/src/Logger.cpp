#include "Logger.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <vector>
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/RotatingFileSink.h>

namespace
{
namespace fs = std::filesystem;

constexpr const char* RUN_DIRECTORY_FORMAT = "%Y-%m-%d_%H-%M-%S";
constexpr std::size_t KEPT_RUN_DIRECTORIES = 5;

std::string currentRunName()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), RUN_DIRECTORY_FORMAT, &local);
    return buffer;
}

// Keeps the newest run directories, the timestamped names sort chronologically
void pruneOldRuns(const fs::path& logsDir)
{
    std::vector<fs::path> runs;
    for (const auto& entry : fs::directory_iterator{logsDir})
    {
        if (entry.is_directory())
            runs.push_back(entry.path());
    }

    if (runs.size() < KEPT_RUN_DIRECTORIES)
        return;

    std::sort(runs.begin(), runs.end());
    std::size_t excess = runs.size() - KEPT_RUN_DIRECTORIES + 1;
    for (std::size_t i = 0; i < excess; ++i)
    {
        std::error_code ec;
        fs::remove_all(runs[i], ec);
        if (ec)
            std::cerr << "[Logger] Failed to remove old log directory " << runs[i] << ": " << ec.message() << std::endl;
    }
}

std::string initializeLogDirectory(const std::string& directory)
{
    const fs::path logsDir{directory};
    fs::create_directories(logsDir);
    pruneOldRuns(logsDir);

    const fs::path runDir = logsDir / currentRunName();
    fs::create_directories(runDir);
    return runDir.string();
}

quill::ConsoleSinkConfig dimConsoleColours()
{
    using namespace quill;
    ConsoleSinkConfig cfg;

    ConsoleSinkConfig::Colours c;
    c.apply_default_colours();
    c.assign_colour_to_log_level(LogLevel::Warning, "\033[2m\033[33m");
    c.assign_colour_to_log_level(LogLevel::Error, "\033[2m\033[31m");
    c.assign_colour_to_log_level(LogLevel::Critical, "\033[1m\033[31m");

    cfg.set_colours(std::move(c));
    cfg.set_colour_mode(ConsoleSinkConfig::ColourMode::Automatic);
    return cfg;
}

quill::PatternFormatterOptions shortLogFormat()
{
    quill::PatternFormatterOptions opt{
        "%(time) [%(thread_id)] %(source_location) "
        "%(log_level) %(message)"
    };
#ifdef SOURCE_ROOT_DIR
    opt.source_location_path_strip_prefix = SOURCE_ROOT_DIR;
#endif
    return opt;
}

quill::LogLevel levelFor(bool verbose)
{
    return verbose ? quill::LogLevel::Debug : quill::LogLevel::Info;
}

std::once_flag initFlag;
std::atomic<quill::Logger*> sysLogObject{nullptr};
std::atomic<quill::Logger*> netLogObject{nullptr};
std::atomic<bool> verboseLogging{false};
std::atomic<bool> trafficLogging{false};

LogSettings consoleOnly()
{
    LogSettings settings;
    settings.writeFiles = false;
    return settings;
}
}

void initLogging(const LogSettings& settings)
{
    std::call_once(initFlag, [&settings]()
    {
        using namespace quill;

        // Sleep between polls instead of busy-spinning
        BackendOptions cfg;
        cfg.sleep_duration = std::chrono::milliseconds(1);
        Backend::start(cfg);

        auto consoleSink = Frontend::create_or_get_sink<ConsoleSink>("console", dimConsoleColours());

        Logger* sys = nullptr;
        Logger* net = nullptr;
        std::string logsPath;
        if (settings.writeFiles)
        {
            try
            {
                logsPath = initializeLogDirectory(settings.directory);
            }
            catch (const std::filesystem::filesystem_error& e)
            {
                std::cerr << "[Logger] Cannot create log directory, logging to console only: " << e.what() << std::endl;
            }
        }

        if (!logsPath.empty())
        {
            auto sysSink = Frontend::create_or_get_sink<FileSink>(
                logsPath + "/app.log",
                []
                {
                    FileSinkConfig cfg;
                    cfg.set_open_mode('w');
                    return cfg;
                }(),
                FileEventNotifier{});
            auto netSink = Frontend::create_or_get_sink<RotatingFileSink>(
                logsPath + "/net.log",
                []
                {
                    RotatingFileSinkConfig cfg;
                    cfg.set_open_mode('w');
                    cfg.set_rotation_max_file_size(5 * 1024 * 1024);
                    cfg.set_rotation_naming_scheme(RotatingFileSinkConfig::RotationNamingScheme::DateAndTime);
                    return cfg;
                }());

            sys = Frontend::create_or_get_logger("app", {consoleSink, sysSink}, shortLogFormat());
            net = Frontend::create_or_get_logger("net", {consoleSink, netSink}, shortLogFormat());
        }
        else
        {
            sys = Frontend::create_or_get_logger("app", consoleSink, shortLogFormat());
            net = Frontend::create_or_get_logger("net", consoleSink, shortLogFormat());
        }

        sys->set_log_level(levelFor(settings.verbose));
        net->set_log_level(levelFor(settings.verbose));
        verboseLogging = settings.verbose;
        trafficLogging = settings.logTraffic;

        sysLogObject = sys;
        netLogObject = net;
    });
}

quill::Logger* sysLogger()
{
    if (!sysLogObject.load())
        initLogging(consoleOnly());
    return sysLogObject.load();
}

quill::Logger* netLogger()
{
    if (!netLogObject.load())
        initLogging(consoleOnly());
    return netLogObject.load();
}

void setVerboseLogging(bool verbose)
{
    verboseLogging = verbose;
    sysLogger()->set_log_level(levelFor(verbose));
    netLogger()->set_log_level(levelFor(verbose));
}

bool isVerboseLogging()
{
    return verboseLogging;
}

void setShouldLogTraffic(bool shouldLog)
{
    trafficLogging = shouldLog;
    if (shouldLog)
        SYSTEM_LOG_WARNING("[Logger] Every STUN datagram will be logged, expect a noisy net log");
}

bool shouldLogTraffic()
{
    return trafficLogging;
}
