/* -- C++ -- */
/**
 *  @file  ana/include/RenormalisationService.hh
 *
 *  @brief Renormalisation ratios of systematic to nominal yields, and the
 *         table rows built from them.
 */

#ifndef FIDNORM_ANA_RENORMALISATION_SERVICE_H
#define FIDNORM_ANA_RENORMALISATION_SERVICE_H

#include <string>

#include "RenormTableIO.hh"
#include "YieldService.hh"


class RenormalisationService
{
  public:
    /// syst_yield / nominal_yield, or NaN when the nominal yield is zero.
    static double renorm(double nominal_yield, double syst_yield) noexcept;
    static bool is_undefined(double value) noexcept;

    static RenormRow make_row(const std::string &flavour,
                              const std::string &systematic,
                              const YieldResult &nominal,
                              const YieldResult &up,
                              const YieldResult &down);
};


#endif // FIDNORM_ANA_RENORMALISATION_SERVICE_H
