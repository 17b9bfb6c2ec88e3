#pragma once
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

struct LogSettings
{
    // Parent folder for the per-run log directories
    std::string directory = "logs";
    // Console only when false
    bool writeFiles = true;
    bool verbose = false;
    bool logTraffic = false;
};

// Token bucket, keeps per-datagram logging from flooding the net log
class LogRateLimiter
{
public:
    explicit LogRateLimiter(double maxLogsPerSec)
        : capacity(maxLogsPerSec)
        , rate(maxLogsPerSec)
        , tokens(maxLogsPerSec)
        , lastRefill(std::chrono::steady_clock::now())
    {}

    bool tryLog() noexcept
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto now = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = now - lastRefill;
        lastRefill = now;
        tokens = std::min(capacity, tokens + elapsed.count() * rate);

        if (tokens < 1.0)
            return false;

        tokens -= 1.0;
        return true;
    }

private:
    double capacity;
    double rate;
    double tokens;
    std::chrono::steady_clock::time_point lastRefill;
    std::mutex mutex;
};

void initLogging(const LogSettings& settings = LogSettings{});
quill::Logger* sysLogger();
quill::Logger* netLogger();

void setVerboseLogging(bool verbose);
bool isVerboseLogging();

void setShouldLogTraffic(bool shouldLog);
bool shouldLogTraffic();

inline LogRateLimiter& logLimiter()
{
    static LogRateLimiter limiter(6.0);
    return limiter;
}

#define SYSTEM_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(sysLogger(), fmt, ##__VA_ARGS__)
#define SYSTEM_LOG_INFO(fmt, ...) QUILL_LOG_INFO(sysLogger(), fmt, ##__VA_ARGS__)
#define SYSTEM_LOG_WARNING(fmt, ...) QUILL_LOG_WARNING(sysLogger(), fmt, ##__VA_ARGS__)
#define SYSTEM_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(sysLogger(), fmt, ##__VA_ARGS__)
#define SYSTEM_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(sysLogger(), fmt, ##__VA_ARGS__)

#define NETWORK_TRAFFIC_LOG(fmt, ...)                               \
    do {                                                            \
        if (shouldLogTraffic() && logLimiter().tryLog())            \
            QUILL_LOG_INFO(netLogger(), fmt, ##__VA_ARGS__);        \
    } while (0)

#define NETWORK_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(netLogger(), fmt, ##__VA_ARGS__)
#define NETWORK_LOG_INFO(fmt, ...) QUILL_LOG_INFO(netLogger(), fmt, ##__VA_ARGS__)
#define NETWORK_LOG_WARNING(fmt, ...) QUILL_LOG_WARNING(netLogger(), fmt, ##__VA_ARGS__)
#define NETWORK_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(netLogger(), fmt, ##__VA_ARGS__)
