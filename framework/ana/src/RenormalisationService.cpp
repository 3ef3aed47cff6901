/* -- C++ -- */
/**
 *  @file  ana/src/RenormalisationService.cpp
 *
 *  @brief Renormalisation ratios of systematic to nominal yields.
 */

#include "RenormalisationService.hh"

#include <cmath>
#include <limits>


double RenormalisationService::renorm(double nominal_yield, double syst_yield) noexcept
{
    if (nominal_yield == 0.0)
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return syst_yield / nominal_yield;
}

bool RenormalisationService::is_undefined(double value) noexcept
{
    return std::isnan(value);
}

RenormRow RenormalisationService::make_row(const std::string &flavour,
                                           const std::string &systematic,
                                           const YieldResult &nominal,
                                           const YieldResult &up,
                                           const YieldResult &down)
{
    RenormRow row;
    row.flavour = flavour;
    row.systematic = systematic;
    row.nominal_yield = nominal.weighted_sum;
    row.syst_yield_up = up.weighted_sum;
    row.syst_yield_down = down.weighted_sum;
    row.renorm_up = renorm(nominal.weighted_sum, up.weighted_sum);
    row.renorm_down = renorm(nominal.weighted_sum, down.weighted_sum);
    return row;
}
