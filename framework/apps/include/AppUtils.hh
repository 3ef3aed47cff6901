/* -- C++ -- */
/**
 *  @file  apps/include/AppUtils.hh
 *
 *  @brief Utility helpers that support command-line execution: argument
 *         collection, environment lookups, output placement and the guarded
 *         entry point that turns exceptions into exit codes.
 */
#ifndef FIDNORM_APPS_APP_UTILS_H
#define FIDNORM_APPS_APP_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppLog.hh"
inline std::string trim(std::string s)
{
    auto notspace = [](unsigned char c)
    {
        return std::isspace(c) == 0;
    };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
    return s;
}

inline std::vector<std::string> collect_args(int argc, char **argv, int start_index = 1)
{
    std::vector<std::string> args;
    if (argc <= start_index)
    {
        return args;
    }
    args.reserve(static_cast<size_t>(argc - start_index));
    for (int i = start_index; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return args;
}

inline const char *getenv_cstr(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
    {
        return nullptr;
    }
    return value;
}

/// Bare file names land in FIDNORM_OUT_DIR when it is set; other paths are kept.
inline std::string resolve_output_path(const std::string &output_file)
{
    const std::filesystem::path path(output_file);
    if (path.is_relative() && path.parent_path().empty())
    {
        if (const char *value = getenv_cstr("FIDNORM_OUT_DIR"))
        {
            return (std::filesystem::path(value) / path).string();
        }
    }
    return output_file;
}

inline int run_guarded(const std::string &log_prefix, const std::function<int()> &func)
{
    try
    {
        return func();
    }
    catch (const std::exception &e)
    {
        log_error(log_prefix, std::string("fatal_error=") + e.what());
        return 1;
    }
}

inline int run_guarded(const std::function<int()> &func)
{
    return run_guarded("fidnorm", func);
}

#endif
