/* -- C++ -- */
/**
 *  @file  ana/src/RDataFrameService.cpp
 *
 *  @brief Dataset loading and threading policy for ROOT RDataFrame.
 */

#include "RDataFrameService.hh"

#include <iostream>
#include <mutex>

#include <TROOT.h>


ROOT::RDataFrame RDataFrameService::load_files(const std::vector<std::string> &files,
                                               const std::string &tree_name)
{
    return ROOT::RDataFrame(tree_name, files);
}

void RDataFrameService::configure_implicit_mt(unsigned int n_threads)
{
    if (n_threads == 0)
    {
        if (ROOT::IsImplicitMTEnabled())
        {
            ROOT::DisableImplicitMT();
        }
        return;
    }

    if (ROOT::IsImplicitMTEnabled())
    {
        ROOT::DisableImplicitMT();
    }
    ROOT::EnableImplicitMT(n_threads);
    std::cerr << "[RDataFrameService] implicit MT enabled (nThreads=" << n_threads << ")\n";
}

void RDataFrameService::enable_thread_safety()
{
    static std::once_flag once;
    std::call_once(once, []() { ROOT::EnableThreadSafety(); });
}
