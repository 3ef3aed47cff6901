/* -- C++ -- */
/**
 *  @file  ana/include/RDataFrameService.hh
 *
 *  @brief Dataset loading and threading policy for ROOT RDataFrame,
 *         covering multi-file dataset unions and implicit MT set-up.
 */

#ifndef FIDNORM_ANA_RDATA_FRAME_SERVICE_H
#define FIDNORM_ANA_RDATA_FRAME_SERVICE_H

#include <string>
#include <vector>

#include <ROOT/RDataFrame.hxx>


class RDataFrameService
{
  public:
    /// Ordered concatenation of @p files into a single dataset.
    static ROOT::RDataFrame load_files(const std::vector<std::string> &files,
                                       const std::string &tree_name);

    static void configure_implicit_mt(unsigned int n_threads);
    static void enable_thread_safety();
};


#endif // FIDNORM_ANA_RDATA_FRAME_SERVICE_H
