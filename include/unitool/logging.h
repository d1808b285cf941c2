#ifndef UNITOOL_LOGGING_H
#define UNITOOL_LOGGING_H

#include "fmt/format.h"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace logging {

enum level_enum
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    err = 4,
    fatal = 5,
    off = 6
};

class Logger
{
public:
    Logger(std::string_view name, logging::level_enum level) :
        m_name(name),
        m_level(level)
    {}

    virtual ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string_view name() const { return m_name; }

    logging::level_enum level() const { return m_level; }
    void level(logging::level_enum val) { m_level = val; }

    template <typename... Args>
    void log(level_enum lvl, std::string_view fmt, const Args&... args);

    template <typename... Args>
    void trace(std::string_view fmt, const Args&... args);
    template <typename... Args>
    void debug(std::string_view fmt, const Args&... args);
    template <typename... Args>
    void info(std::string_view fmt, const Args&... args);
    template <typename... Args>
    void warn(std::string_view fmt, const Args&... args);
    template <typename... Args>
    void error(std::string_view fmt, const Args&... args);
    template <typename... Args>
    void fatal(std::string_view fmt, const Args&... args);

private:
    const std::string m_name;
    std::atomic<logging::level_enum> m_level;
};

// get/create a logger
std::shared_ptr<Logger> get(std::string_view name);

// level given to new loggers; setting it also
// applies it to every existing logger
logging::level_enum default_level();
void default_level(logging::level_enum val);

namespace details {
// writes one formatted entry to stderr, stamped with the current time
void write(std::string_view logname, logging::level_enum level,
        std::string_view text);
} // namespace details
} // namespace logging

// impl bits:

inline logging::Logger::~Logger() = default;

template <typename... Args>
inline void logging::Logger::log(logging::level_enum lvl, std::string_view fmt, const Args&... args)
{
    if (lvl < m_level)
        return;

    if constexpr (sizeof...(Args) == 0)
        details::write(m_name, lvl, fmt);
    else
        details::write(m_name, lvl, fmt::format(fmt::runtime(fmt), args...));
}

template <typename... Args>
inline void logging::Logger::trace(std::string_view fmt, const Args&... args)
{
    log(logging::trace, fmt, args...);
}

template <typename... Args>
inline void logging::Logger::debug(std::string_view fmt, const Args&... args)
{
    log(logging::debug, fmt, args...);
}

template <typename... Args>
inline void logging::Logger::info(std::string_view fmt, const Args&... args)
{
    log(logging::info, fmt, args...);
}

template <typename... Args>
inline void logging::Logger::warn(std::string_view fmt, const Args&... args)
{
    log(logging::warn, fmt, args...);
}

template <typename... Args>
inline void logging::Logger::error(std::string_view fmt, const Args&... args)
{
    log(logging::err, fmt, args...);
}

template <typename... Args>
inline void logging::Logger::fatal(std::string_view fmt, const Args&... args)
{
    log(logging::fatal, fmt, args...);
}

#endif // UNITOOL_LOGGING_H
