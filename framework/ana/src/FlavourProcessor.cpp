/* -- C++ -- */
/**
 *  @file  ana/src/FlavourProcessor.cpp
 *
 *  @brief End-to-end renormalisation of one flavour.
 */

#include "FlavourProcessor.hh"

#include <iostream>
#include <sstream>
#include <utility>

#include "RenormalisationService.hh"
#include "SampleIO.hh"


namespace
{

void log_processor(const std::string &message)
{
    std::ostringstream out;
    out << "[FlavourProcessor] " << message << "\n";
    std::cerr << out.str();
}

} // namespace

FlavourProcessor::FlavourProcessor(const RenormConfig &config,
                                   const ExtraSelectionRegistry &registry,
                                   const YieldService &yields,
                                   ScanProgress *progress)
    : m_config(config),
      m_registry(registry),
      m_yields(yields),
      m_progress(progress)
{
}

std::vector<DatasetSlice> FlavourProcessor::build_slices(const FlavourSpec &flavour,
                                                         const std::vector<std::string> &files) const
{
    const auto groups = SampleIO::resolve(m_config.base_path, m_config.folders, files);

    std::vector<DatasetSlice> slices;
    slices.reserve(groups.size());
    for (const auto &group : groups)
    {
        DatasetSlice slice;
        slice.folder = group.folder;
        slice.files = group.paths;
        slice.selection = SelectionService::folder_selection(m_config, flavour, group.folder, m_registry);
        slices.push_back(std::move(slice));
    }
    return slices;
}

std::string FlavourProcessor::direction_weight(const SystematicSpec &syst, Direction direction) const
{
    const std::optional<std::string> *overlay = nullptr;
    if (direction == Direction::kUp)
    {
        overlay = &syst.up_weight;
    }
    else if (direction == Direction::kDown)
    {
        overlay = &syst.down_weight;
    }

    if (!overlay || !overlay->has_value())
    {
        return SelectionService::compose_weight(m_config.nominal_weight, SelectionService::identity_weight());
    }
    return SelectionService::compose_weight(m_config.nominal_weight, **overlay);
}

YieldResult FlavourProcessor::scan(const std::string &flavour,
                                   const std::string &systematic,
                                   Direction direction,
                                   const std::vector<DatasetSlice> &slices,
                                   const std::string &weight) const
{
    for (const auto &slice : slices)
    {
        for (const auto &path : slice.files)
        {
            log_processor("Processing " + path + " flavour=" + flavour +
                          " systematic=" + systematic + " direction=" + direction_name(direction));
        }
    }

    const YieldSum sum = m_yields.compute_yield(slices, weight);

    YieldResult out;
    out.flavour = flavour;
    out.systematic = systematic;
    out.direction = direction;
    out.weighted_sum = sum.weighted_sum;
    out.event_count = sum.event_count;

    if (m_progress)
    {
        ++m_progress->done;
    }

    std::ostringstream message;
    message << "action=yield status=complete flavour=" << flavour
            << " systematic=" << systematic
            << " direction=" << direction_name(direction)
            << " yield=" << RenormTableIO::format_value(out.weighted_sum)
            << " events=" << out.event_count;
    log_processor(message.str());
    return out;
}

YieldResult FlavourProcessor::nominal_yield(const FlavourSpec &flavour) const
{
    return scan(flavour.name,
                "nominal",
                Direction::kNominal,
                build_slices(flavour, flavour.files),
                SelectionService::compose_weight(m_config.nominal_weight, SelectionService::identity_weight()));
}

YieldResult FlavourProcessor::systematic_yield(const FlavourSpec &flavour,
                                               const SystematicSpec &syst,
                                               Direction direction) const
{
    const std::vector<std::string> *files = &flavour.files;
    if (syst.kind == SystematicKind::kSample)
    {
        files = (direction == Direction::kDown) ? &syst.down_files : &syst.up_files;
    }
    return scan(flavour.name,
                syst.name,
                direction,
                build_slices(flavour, *files),
                direction_weight(syst, direction));
}

std::vector<RenormRow> FlavourProcessor::process(const FlavourWork &work) const
{
    const FlavourSpec &flavour = *work.flavour;

    std::ostringstream start;
    start << "action=flavour status=start flavour=" << flavour.name
          << " systematics=" << work.systematics.size();
    log_processor(start.str());

    std::vector<RenormRow> rows;
    if (work.systematics.empty())
    {
        return rows;
    }

    // Nominal once per flavour; every systematic is normalised to it.
    const YieldResult nominal = nominal_yield(flavour);

    rows.reserve(work.systematics.size());
    for (const SystematicSpec *syst : work.systematics)
    {
        const YieldResult up = systematic_yield(flavour, *syst, Direction::kUp);
        const YieldResult down = systematic_yield(flavour, *syst, Direction::kDown);

        RenormRow row = RenormalisationService::make_row(flavour.name, syst->name, nominal, up, down);
        if (RenormalisationService::is_undefined(row.renorm_up) ||
            RenormalisationService::is_undefined(row.renorm_down))
        {
            log_processor("WARN action=renorm status=undefined flavour=" + flavour.name +
                          " systematic=" + syst->name +
                          " direction=up,down value=nan message=nominal yield is zero");
        }
        rows.push_back(std::move(row));
    }

    log_processor("action=flavour status=complete flavour=" + flavour.name +
                  " rows=" + std::to_string(rows.size()));
    return rows;
}

long long FlavourProcessor::yield_count(const FlavourWork &work) noexcept
{
    if (work.systematics.empty())
    {
        return 0;
    }
    return 1 + 2 * static_cast<long long>(work.systematics.size());
}
