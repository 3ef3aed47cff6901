/* -- C++ -- */
/**
 *  @file  io/src/RenormTableIO.cpp
 *
 *  @brief Implementation of the renormalisation CSV and terminal table.
 */

#include "RenormTableIO.hh"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>


namespace
{

constexpr int kShortestDigits = std::numeric_limits<double>::digits10;
constexpr int kRoundTripDigits = std::numeric_limits<double>::max_digits10;

std::vector<std::string> row_fields(const RenormRow &row)
{
    return {row.flavour,
            row.systematic,
            RenormTableIO::format_value(row.nominal_yield),
            RenormTableIO::format_value(row.syst_yield_up),
            RenormTableIO::format_value(row.syst_yield_down),
            RenormTableIO::format_value(row.renorm_up),
            RenormTableIO::format_value(row.renorm_down)};
}

} // namespace

const std::vector<std::string> &RenormTableIO::column_names()
{
    static const std::vector<std::string> names = {
        "Flavour",
        "Systematic",
        "Nominal yield",
        "Syst yield (up)",
        "Syst yield (down)",
        "Renorm. value (up)",
        "Renorm. value (down)"};
    return names;
}

std::string RenormTableIO::format_value(double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value > 0 ? "inf" : "-inf";
    }
    // Fewest significant digits that read back to the same double.
    std::string text;
    for (int digits = kShortestDigits; digits <= kRoundTripDigits; ++digits)
    {
        std::ostringstream out;
        out << std::setprecision(digits) << value;
        text = out.str();
        if (std::strtod(text.c_str(), nullptr) == value)
        {
            break;
        }
    }
    return text;
}

std::string RenormTableIO::csv_escape(const std::string &field)
{
    if (field.find_first_of(",\"\n\r") == std::string::npos)
    {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field)
    {
        if (c == '"')
        {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

void RenormTableIO::write_csv(const std::vector<RenormRow> &rows, std::ostream &out)
{
    const auto &names = column_names();
    for (size_t i = 0; i < names.size(); ++i)
    {
        out << (i == 0 ? "" : ",") << csv_escape(names[i]);
    }
    out << "\n";

    for (const auto &row : rows)
    {
        const auto fields = row_fields(row);
        for (size_t i = 0; i < fields.size(); ++i)
        {
            out << (i == 0 ? "" : ",") << csv_escape(fields[i]);
        }
        out << "\n";
    }
}

void RenormTableIO::write_csv(const std::vector<RenormRow> &rows, const std::string &out_file)
{
    const std::filesystem::path out_path(out_file);
    if (!out_path.parent_path().empty())
    {
        std::filesystem::create_directories(out_path.parent_path());
    }

    std::ofstream fout(out_file, std::ios::trunc);
    if (!fout)
    {
        throw std::runtime_error("Failed to open CSV for writing: " + out_file +
                                 " (errno=" + std::to_string(errno) + " " + std::strerror(errno) + ")");
    }
    write_csv(rows, fout);
    fout.flush();
    if (!fout)
    {
        throw std::runtime_error("Failed to write CSV: " + out_file);
    }
}

void RenormTableIO::print_table(const std::vector<RenormRow> &rows, std::ostream &out)
{
    const auto &names = column_names();

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto &row : rows)
    {
        cells.push_back(row_fields(row));
    }

    std::vector<size_t> widths(names.size(), 0);
    for (size_t i = 0; i < names.size(); ++i)
    {
        widths[i] = names[i].size();
        for (const auto &line : cells)
        {
            widths[i] = std::max(widths[i], line[i].size());
        }
    }

    auto rule = [&]()
    {
        out << "+";
        for (const size_t w : widths)
        {
            out << std::string(w + 2, '-') << "+";
        }
        out << "\n";
    };

    // Names left-aligned, numbers right-aligned.
    auto emit = [&](const std::vector<std::string> &line)
    {
        out << "|";
        for (size_t i = 0; i < line.size(); ++i)
        {
            out << " " << (i < 2 ? std::left : std::right)
                << std::setw(static_cast<int>(widths[i])) << line[i] << " |";
        }
        out << "\n";
    };

    rule();
    emit(names);
    rule();
    for (const auto &line : cells)
    {
        emit(line);
    }
    rule();
    out << std::right;
}
