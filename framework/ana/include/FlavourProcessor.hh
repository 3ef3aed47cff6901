/* -- C++ -- */
/**
 *  @file  ana/include/FlavourProcessor.hh
 *
 *  @brief End-to-end renormalisation of one flavour: dataset slices per
 *         folder, nominal and systematic yields, and the resulting rows.
 */

#ifndef FIDNORM_ANA_FLAVOUR_PROCESSOR_H
#define FIDNORM_ANA_FLAVOUR_PROCESSOR_H

#include <atomic>
#include <string>
#include <vector>

#include "RenormConfigService.hh"
#include "RenormTableIO.hh"
#include "SelectionService.hh"
#include "YieldService.hh"


/// Yield scans finished so far; shared read-only with the status heartbeat.
struct ScanProgress
{
    std::atomic<long long> done{0};
    long long total = 0;
};

class FlavourProcessor
{
  public:
    FlavourProcessor(const RenormConfig &config,
                     const ExtraSelectionRegistry &registry,
                     const YieldService &yields,
                     ScanProgress *progress = nullptr);

    std::vector<DatasetSlice> build_slices(const FlavourSpec &flavour,
                                           const std::vector<std::string> &files) const;

    std::string direction_weight(const SystematicSpec &syst, Direction direction) const;

    YieldResult nominal_yield(const FlavourSpec &flavour) const;
    YieldResult systematic_yield(const FlavourSpec &flavour,
                                 const SystematicSpec &syst,
                                 Direction direction) const;

    std::vector<RenormRow> process(const FlavourWork &work) const;

    static long long yield_count(const FlavourWork &work) noexcept;

  private:
    YieldResult scan(const std::string &flavour,
                     const std::string &systematic,
                     Direction direction,
                     const std::vector<DatasetSlice> &slices,
                     const std::string &weight) const;

    const RenormConfig &m_config;
    const ExtraSelectionRegistry &m_registry;
    const YieldService &m_yields;
    ScanProgress *m_progress;
};


#endif // FIDNORM_ANA_FLAVOUR_PROCESSOR_H
