/* -- C++ -- */
/**
 *  @file  apps/src/RenormWorkflow.cpp
 *
 *  @brief Renormalisation workflow (invoked by the fidnorm CLI).
 */

#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "AppUtils.hh"
#include "FlavourProcessor.hh"
#include "RDataFrameService.hh"
#include "RenormCLI.hh"
#include "RenormConfigService.hh"
#include "RenormTableIO.hh"
#include "SampleIO.hh"
#include "SelectionService.hh"
#include "StatusMonitor.hh"
#include "YieldService.hh"

std::vector<RenormRow> compute_rows(const RenormConfig &config,
                                    const RenormArgs &renorm_args,
                                    const std::string &log_prefix)
{
    const std::vector<FlavourWork> work =
        RenormConfigService::select(config, renorm_args.flavours, renorm_args.systematics);

    const ExtraSelectionRegistry registry = ExtraSelectionRegistry::with_defaults();
    for (const auto &name : registry.unregistered(config.extra_selections))
    {
        log_warning(log_prefix,
                    "action=extra_selection status=ignored name=" + name +
                        " message=no folder rule registered");
    }

    ScanProgress progress;
    for (const auto &item : work)
    {
        progress.total += FlavourProcessor::yield_count(item);
        for (const auto &name : item.missing_systematics)
        {
            log_warning(log_prefix,
                        "action=select status=skipped flavour=" + item.flavour->name +
                            " systematic=" + name + " message=systematic not defined for flavour");
        }
        if (item.systematics.empty())
        {
            log_warning(log_prefix,
                        "action=select status=empty flavour=" + item.flavour->name +
                            " message=no systematics to renormalise");
        }
    }

    log_renorm_start(log_prefix, renorm_args, work.size(), progress.total);

    if (renorm_args.multiprocessing)
    {
        RDataFrameService::enable_thread_safety();
    }
    RDataFrameService::configure_implicit_mt(renorm_args.threads);

    const YieldService yields(SampleIO::tree_name());
    const FlavourProcessor processor(config, registry, yields, &progress);

    StatusMonitor status_monitor(
        log_prefix,
        "action=renorm_build status=running message=processing",
        [&progress]()
        {
            return "scans=" + std::to_string(progress.done.load()) + "/" + std::to_string(progress.total);
        });

    std::vector<RenormRow> rows;
    if (renorm_args.multiprocessing && work.size() > 1)
    {
        std::vector<std::future<std::vector<RenormRow>>> workers;
        workers.reserve(work.size());
        for (const auto &item : work)
        {
            log_stage(log_prefix, "spawn_worker", "flavour=" + item.flavour->name);
            workers.push_back(std::async(std::launch::async,
                                         [&processor, &item]()
                                         {
                                             return processor.process(item);
                                         }));
        }

        // Collected in configuration order, whatever order the workers finish in.
        for (auto &worker : workers)
        {
            std::vector<RenormRow> flavour_rows = worker.get();
            rows.insert(rows.end(),
                        std::make_move_iterator(flavour_rows.begin()),
                        std::make_move_iterator(flavour_rows.end()));
        }
    }
    else
    {
        for (const auto &item : work)
        {
            log_stage(log_prefix, "process_flavour", "flavour=" + item.flavour->name);
            std::vector<RenormRow> flavour_rows = processor.process(item);
            rows.insert(rows.end(),
                        std::make_move_iterator(flavour_rows.begin()),
                        std::make_move_iterator(flavour_rows.end()));
        }
    }
    status_monitor.stop();

    return rows;
}

int run(const RenormArgs &renorm_args, const std::string &log_prefix)
{
    const auto start_time = std::chrono::steady_clock::now();

    log_stage(log_prefix, "load_config", "config=" + renorm_args.config_path);
    const RenormConfig config = RenormConfigService::load(renorm_args.config_path);

    // Fatal errors propagate from here; no CSV is written for a partial run.
    const std::vector<RenormRow> rows = compute_rows(config, renorm_args, log_prefix);

    RenormTableIO::print_table(rows, std::cout);
    std::cout.flush();

    log_stage(log_prefix, "write_csv", "output=" + renorm_args.output_path);
    RenormTableIO::write_csv(rows, renorm_args.output_path);

    const auto end_time = std::chrono::steady_clock::now();
    const double elapsed_seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(end_time - start_time).count();
    log_renorm_finish(log_prefix, rows.size(), renorm_args.output_path, elapsed_seconds);

    return 0;
}
