/* -- C++ -- */
/**
 *  @file  io/include/RenormTableIO.hh
 *
 *  @brief Renormalisation table records together with their CSV and
 *         terminal renderings.
 */

#ifndef FIDNORM_IO_RENORM_TABLE_IO_H
#define FIDNORM_IO_RENORM_TABLE_IO_H

#include <ostream>
#include <string>
#include <vector>


struct RenormRow
{
    std::string flavour;
    std::string systematic;

    double nominal_yield = 0.0;
    double syst_yield_up = 0.0;
    double syst_yield_down = 0.0;

    double renorm_up = 0.0;   ///< NaN when the nominal yield is zero.
    double renorm_down = 0.0; ///< NaN when the nominal yield is zero.
};

class RenormTableIO
{
  public:
    static const std::vector<std::string> &column_names();

    static std::string format_value(double value);
    static std::string csv_escape(const std::string &field);

    static void write_csv(const std::vector<RenormRow> &rows, std::ostream &out);
    static void write_csv(const std::vector<RenormRow> &rows, const std::string &out_file);

    static void print_table(const std::vector<RenormRow> &rows, std::ostream &out);
};


#endif // FIDNORM_IO_RENORM_TABLE_IO_H
