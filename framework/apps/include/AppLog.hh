/* -- C++ -- */
/**
 *  @file  apps/include/AppLog.hh
 *
 *  @brief Logging helpers that format and emit consistent status messages for
 *         the fidnorm command line, safe to call from flavour worker threads.
 */
#ifndef FIDNORM_APPS_APPLOG_H
#define FIDNORM_APPS_APPLOG_H

#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>




enum class Level
{
    kInfo,
    kSuccess,
    kWarn,
    kError
};

inline const char *level_name(const Level level)
{
    switch (level)
    {
    case Level::kSuccess:
        return "DONE";
    case Level::kWarn:
        return "WARN";
    case Level::kError:
        return "ERROR";
    case Level::kInfo:
    default:
        return "INFO";
    }
}

inline std::string format_count(const long long count)
{
    std::ostringstream out;
    if (count >= 1000000)
    {
        out << std::fixed << std::setprecision(1)
            << (static_cast<double>(count) / 1000000.0) << "M";
    }
    else if (count >= 1000)
    {
        out << std::fixed << std::setprecision(1)
            << (static_cast<double>(count) / 1000.0) << "k";
    }
    else
    {
        out << count;
    }
    return out.str();
}

inline std::string format_seconds(const double seconds)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds;
    return out.str();
}

inline std::string join_names(const std::vector<std::string> &names)
{
    if (names.empty())
    {
        return "all";
    }
    std::string out;
    for (const auto &name : names)
    {
        if (!out.empty())
        {
            out += ",";
        }
        out += name;
    }
    return out;
}

inline std::mutex &log_mutex()
{
    static std::mutex mutex;
    return mutex;
}

inline void log_line(const std::string &log_prefix,
                     const Level level,
                     const std::string &message)
{
    std::ostringstream out;
    const std::string prefix = "[" + log_prefix + "]";
    const std::string level_label = level_name(level);
    out << prefix << " " << std::left << std::setw(5) << level_label << " ";
    out << message;

    std::lock_guard<std::mutex> guard(log_mutex());
    std::cerr << out.str() << "\n";
}

inline void log_info(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kInfo, message);
}

inline void log_success(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kSuccess, message);
}

inline void log_warning(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kWarn, message);
}

inline void log_error(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kError, message);
}

inline void log_stage(const std::string &log_prefix,
                      const std::string &stage,
                      const std::string &detail = "")
{
    std::ostringstream out;
    out << "stage=" << stage;
    if (!detail.empty())
    {
        out << " " << detail;
    }
    log_info(log_prefix, out.str());
}




#endif // FIDNORM_APPS_APPLOG_H
