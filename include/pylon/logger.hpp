#pragma once

#include <fmt/core.h>

#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace pylon
{

enum class log_level
{
    debug,
    info,
    warning,
    error
};

class logger
{
  public:
    static logger& instance()
    {
        static logger inst;
        return inst;
    }

    void log(log_level level, std::string_view message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_)
            return;

        std::string_view prefix;
        switch (level)
        {
            case log_level::debug:
                prefix = "[DEBUG] ";
                break;
            case log_level::info:
                prefix = "[INFO] ";
                break;
            case log_level::warning:
                prefix = "[WARN] ";
                break;
            case log_level::error:
                prefix = "[ERROR] ";
                break;
        }
        *out_ << prefix << message << std::endl;
    }

    template<typename... Args>
    void log(log_level level, fmt::format_string<Args...> format, Args&&... args)
    {
        if (!enabled(level))
            return;
        log(level, std::string_view{fmt::format(format, std::forward<Args>(args)...)});
    }

    bool enabled(log_level level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void set_level(log_level level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    // The stream must outlive every later log call.
    void set_output(std::ostream& out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = &out;
    }

  private:
    logger() = default;

    mutable std::mutex mutex_;
    log_level min_level_{log_level::info};
    std::ostream* out_{&std::clog};
};

template<typename... Args>
inline void log_debug(fmt::format_string<Args...> format, Args&&... args)
{
    logger::instance().log(log_level::debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(fmt::format_string<Args...> format, Args&&... args)
{
    logger::instance().log(log_level::info, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warning(fmt::format_string<Args...> format, Args&&... args)
{
    logger::instance().log(log_level::warning, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(fmt::format_string<Args...> format, Args&&... args)
{
    logger::instance().log(log_level::error, format, std::forward<Args>(args)...);
}

}  // namespace pylon
