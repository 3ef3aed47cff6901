/* -- C++ -- */
/**
 *  @file  ana/src/YieldService.cpp
 *
 *  @brief Weighted event yields over selected rows of sample datasets.
 */

#include "YieldService.hh"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <ROOT/RDataFrame.hxx>

#include "RDataFrameService.hh"
#include "RenormErrors.hh"
#include "SampleIO.hh"
#include "SelectionService.hh"


namespace
{

const char *kWeightColumn = "fidnorm_event_weight";

std::string describe_files(const std::vector<std::string> &files)
{
    std::ostringstream out;
    out << files.size() << " file(s)";
    if (!files.empty())
    {
        out << " first=" << files.front();
    }
    return out.str();
}

std::string join_files(const std::vector<std::string> &files)
{
    std::string out;
    for (const auto &path : files)
    {
        out += (out.empty() ? "" : ", ") + path;
    }
    return out;
}

} // namespace

const char *direction_name(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::kUp:
        return "up";
    case Direction::kDown:
        return "down";
    case Direction::kNominal:
    default:
        return "nominal";
    }
}

YieldService::YieldService(std::string tree_name) : m_tree_name(std::move(tree_name))
{
}

YieldSum YieldService::compute_yield(const std::vector<std::string> &files,
                                     const std::string &selection,
                                     const std::string &weight_expr) const
{
    SampleIO::ensure_tree_present(files, m_tree_name);

    {
        std::ostringstream log;
        log << "[YieldService] stage=scan tree=" << m_tree_name
            << " files=" << describe_files(files)
            << " selection=\"" << selection << "\""
            << " weight=\"" << weight_expr << "\"\n";
        std::cerr << log.str();
    }

    ROOT::RDataFrame rdf = RDataFrameService::load_files(files, m_tree_name);
    ROOT::RDF::RNode node = rdf;
    try
    {
        if (!SelectionService::is_select_all(selection))
        {
            node = node.Filter(selection, "fidnorm_selection");
        }
        node = node.Define(kWeightColumn, "static_cast<double>(" + weight_expr + ")");
    }
    catch (const std::runtime_error &e)
    {
        throw ExpressionError("cannot evaluate selection \"" + selection + "\" with weight \"" +
                              weight_expr + "\" on tree '" + m_tree_name + "' (" +
                              describe_files(files) + "): " + e.what());
    }

    auto sum = node.Sum<double>(kWeightColumn);
    auto count = node.Count();

    YieldSum out;
    try
    {
        out.weighted_sum = sum.GetValue();
        out.event_count = static_cast<long long>(count.GetValue());
    }
    catch (const std::runtime_error &e)
    {
        throw MissingFileError("event loop failed reading tree '" + m_tree_name + "' from " +
                               join_files(files) + ": " + e.what());
    }

    return out;
}

YieldSum YieldService::compute_yield(const std::vector<DatasetSlice> &slices,
                                     const std::string &weight_expr) const
{
    if (slices.empty())
    {
        throw MissingFileError("yield requested over an empty dataset");
    }

    YieldSum total;
    for (const auto &slice : slices)
    {
        total += compute_yield(slice.files, slice.selection, weight_expr);
    }
    return total;
}
