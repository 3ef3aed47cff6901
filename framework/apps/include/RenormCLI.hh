/* -- C++ -- */
/**
 *  @file  apps/include/RenormCLI.hh
 *
 *  @brief CLI helpers for the renormalisation workflow: argument parsing,
 *         usage text and start/finish reporting.
 */
#ifndef FIDNORM_APPS_RENORMCLI_H
#define FIDNORM_APPS_RENORMCLI_H

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppLog.hh"
#include "AppUtils.hh"
#include "RenormConfigService.hh"
#include "RenormTableIO.hh"

inline const char *kRenormUsage =
    "Usage: fidnorm CONFIG.json [-o|--output_file PATH] [--systematics NAME...]\n"
    "               [--flavours NAME...] [--multiprocessing] [--threads N]\n"
    "\nOptions:\n"
    "  -o, --output_file PATH  CSV destination (default: renormalisation.csv)\n"
    "  --systematics NAME...   Restrict to the named systematics (default: all)\n"
    "  --flavours NAME...      Restrict to the named flavours (default: all)\n"
    "  --multiprocessing       Process flavours in parallel, one worker each\n"
    "  -t, --threads N         Implicit multithreading inside each scan (default: off)\n"
    "  -h, --help              Print this help\n"
    "\nEnvironment:\n"
    "  FIDNORM_OUT_DIR  Directory for a bare output file name\n";

inline const char *kDefaultOutputFile = "renormalisation.csv";

struct RenormArgs
{
    std::string config_path;
    std::string output_path = kDefaultOutputFile;
    std::vector<std::string> flavours;
    std::vector<std::string> systematics;
    bool multiprocessing = false;
    unsigned int threads = 0;
};

inline bool is_option(const std::string &arg)
{
    return arg.size() > 1 && arg[0] == '-';
}

inline RenormArgs parse_renorm_args(const std::vector<std::string> &args, const std::string &usage)
{
    RenormArgs out;
    bool have_config = false;

    auto take_value = [&](size_t &i, const std::string &flag) -> std::string
    {
        if (i + 1 >= args.size() || is_option(args[i + 1]))
        {
            throw std::runtime_error("Missing value for " + flag + "\n" + usage);
        }
        return trim(args[++i]);
    };

    auto take_names = [&](size_t &i, const std::string &flag, std::vector<std::string> &names)
    {
        const size_t before = names.size();
        while (i + 1 < args.size() && !is_option(args[i + 1]))
        {
            const std::string name = trim(args[++i]);
            if (!name.empty())
            {
                names.push_back(name);
            }
        }
        if (names.size() == before)
        {
            throw std::runtime_error("Missing names for " + flag + "\n" + usage);
        }
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string arg = trim(args[i]);
        if (arg == "-o" || arg == "--output_file" || arg == "--output-file")
        {
            out.output_path = take_value(i, arg);
            continue;
        }
        if (arg.rfind("--output_file=", 0) == 0)
        {
            out.output_path = trim(arg.substr(std::string("--output_file=").size()));
            continue;
        }
        if (arg == "--systematics")
        {
            take_names(i, arg, out.systematics);
            continue;
        }
        if (arg == "--flavours")
        {
            take_names(i, arg, out.flavours);
            continue;
        }
        if (arg == "--multiprocessing")
        {
            out.multiprocessing = true;
            continue;
        }
        if (arg == "-t" || arg == "--threads")
        {
            const std::string value = take_value(i, arg);
            int n = 0;
            size_t pos = 0;
            try
            {
                n = std::stoi(value, &pos);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid value for " + arg + ": " + value);
            }
            if (pos != value.size())
            {
                throw std::runtime_error("Invalid value for " + arg + ": " + value);
            }
            if (n < 0)
            {
                throw std::runtime_error("Thread count must not be negative");
            }
            out.threads = static_cast<unsigned int>(n);
            continue;
        }
        if (is_option(arg))
        {
            throw std::runtime_error("Unknown option: " + arg + "\n" + usage);
        }
        if (have_config)
        {
            throw std::runtime_error("Unexpected argument: " + arg + "\n" + usage);
        }
        out.config_path = arg;
        have_config = true;
    }

    if (!have_config || out.config_path.empty())
    {
        throw std::runtime_error(usage);
    }
    if (out.output_path.empty())
    {
        throw std::runtime_error("Invalid arguments (empty output path)");
    }

    out.output_path = resolve_output_path(out.output_path);
    return out;
}

inline void log_renorm_start(const std::string &log_prefix,
                             const RenormArgs &args,
                             const size_t flavour_count,
                             const long long yield_count)
{
    std::ostringstream out;
    out << "action=renorm_build status=start config=" << args.config_path
        << " flavours=" << join_names(args.flavours)
        << " systematics=" << join_names(args.systematics)
        << " selected_flavours=" << flavour_count
        << " scans=" << format_count(yield_count)
        << " mode=" << (args.multiprocessing ? "parallel" : "sequential");
    log_info(log_prefix, out.str());
}

inline void log_renorm_finish(const std::string &log_prefix,
                              const size_t row_count,
                              const std::string &output_path,
                              const double elapsed_seconds)
{
    std::ostringstream out;
    out << "action=renorm_build status=complete rows="
        << format_count(static_cast<long long>(row_count))
        << " output=" << output_path
        << " elapsed_s=" << format_seconds(elapsed_seconds);
    log_success(log_prefix, out.str());
}

std::vector<RenormRow> compute_rows(const RenormConfig &config,
                                    const RenormArgs &renorm_args,
                                    const std::string &log_prefix);

int run(const RenormArgs &renorm_args, const std::string &log_prefix);

#endif
