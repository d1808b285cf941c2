#include "unitool/logging.h"

#include "fmt/chrono.h"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <utility>

using namespace std::literals;

// global logger map
static std::mutex g_loggers_mutex;
static std::unordered_map<std::string, std::shared_ptr<logging::Logger>> g_loggers;
static logging::level_enum g_default_level = logging::warn;

constexpr std::array level_names{
        "TRACE"sv,
        "DEBUG"sv,
        " INFO"sv,
        " WARN"sv,
        "ERROR"sv,
        "FATAL"sv,
        "OTHER"sv};

std::shared_ptr<logging::Logger> logging::get(std::string_view name)
{
    std::lock_guard<std::mutex> lock(g_loggers_mutex);

    // todo: heterogeneous lookup when switched to c++20
    std::string sname{name};
    auto found = g_loggers.find(sname);
    if (found != g_loggers.end())
        return found->second;

    auto logger = std::make_shared<logging::Logger>(name, g_default_level);
    g_loggers.emplace(std::move(sname), logger);
    return logger;
}

logging::level_enum logging::default_level()
{
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    return g_default_level;
}

void logging::default_level(logging::level_enum val)
{
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    g_default_level = val;
    for (auto& entry : g_loggers)
        entry.second->level(val);
}

void logging::details::write(std::string_view logname,
        logging::level_enum level, std::string_view text)
{
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

    std::tm local = {};
    localtime_r(&secs, &local);

    auto index = static_cast<std::size_t>(level);
    if (index >= level_names.size())
        index = level_names.size() - 1;

    // stdout carries the reports, logs go to stderr
    fmt::print(stderr, "{:%Y-%m-%dT%H:%M:%S}.{:03d} {} {} - {}\n",
            local, millis, level_names[index], logname, text);
}
