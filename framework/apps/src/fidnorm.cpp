/* -- C++ -- */
/**
 *  @file  apps/src/fidnorm.cpp
 *
 *  @brief Command-line entry point for fiducial cross-section
 *         renormalisation of systematic samples.
 */

#include <iostream>
#include <string>
#include <vector>

#include "AppUtils.hh"
#include "RenormCLI.hh"


namespace
{

bool is_help_arg(const std::string &arg)
{
    return arg == "-h" || arg == "--help";
}

void print_main_help(std::ostream &out)
{
    out << "fidnorm: fiducial cross-section renormalisation factors for systematic variations.\n\n"
        << kRenormUsage;
}

} // namespace

int main(int argc, char **argv)
{
    return run_guarded(
        "fidnorm",
        [argc, argv]()
        {
            const std::vector<std::string> args = collect_args(argc, argv, 1);
            if (args.empty())
            {
                print_main_help(std::cerr);
                return 1;
            }
            for (const auto &arg : args)
            {
                if (is_help_arg(arg))
                {
                    print_main_help(std::cout);
                    return 0;
                }
            }

            const RenormArgs renorm_args = parse_renorm_args(args, kRenormUsage);
            return run(renorm_args, "fidnorm");
        });
}
