#include <cmath>

#include <gtest/gtest.h>

#include "RenormalisationService.hh"

namespace
{

YieldResult make_yield(const char *systematic, Direction direction, double sum)
{
    YieldResult out;
    out.flavour = "ttH_had";
    out.systematic = systematic;
    out.direction = direction;
    out.weighted_sum = sum;
    out.event_count = 10;
    return out;
}

} // namespace

TEST(RenormalisationService, IdenticalYieldsGiveUnity)
{
    for (const double y : {1e-6, 0.5, 1.0, 42.0, 3.5e7})
    {
        EXPECT_EQ(RenormalisationService::renorm(y, y), 1.0);
    }
}

TEST(RenormalisationService, RatioIsSystOverNominal)
{
    EXPECT_EQ(RenormalisationService::renorm(4.0, 5.0), 5.0 / 4.0);
    EXPECT_EQ(RenormalisationService::renorm(123.456, 98.7), 98.7 / 123.456);
    EXPECT_EQ(RenormalisationService::renorm(-2.0, 1.0), 1.0 / -2.0);
    EXPECT_EQ(RenormalisationService::renorm(3.0, 0.0), 0.0);
}

TEST(RenormalisationService, ZeroNominalIsUndefined)
{
    const double value = RenormalisationService::renorm(0.0, 12.0);
    EXPECT_TRUE(std::isnan(value));
    EXPECT_TRUE(RenormalisationService::is_undefined(value));
    EXPECT_TRUE(RenormalisationService::is_undefined(RenormalisationService::renorm(0.0, 0.0)));
    EXPECT_FALSE(RenormalisationService::is_undefined(RenormalisationService::renorm(1.0, 0.0)));
}

TEST(RenormalisationService, RowCarriesYieldsAndRatios)
{
    const RenormRow row = RenormalisationService::make_row(
        "ttH_had",
        "ht_reweight",
        make_yield("nominal", Direction::kNominal, 8.0),
        make_yield("ht_reweight", Direction::kUp, 10.0),
        make_yield("ht_reweight", Direction::kDown, 6.0));

    EXPECT_EQ(row.flavour, "ttH_had");
    EXPECT_EQ(row.systematic, "ht_reweight");
    EXPECT_EQ(row.nominal_yield, 8.0);
    EXPECT_EQ(row.syst_yield_up, 10.0);
    EXPECT_EQ(row.syst_yield_down, 6.0);
    EXPECT_EQ(row.renorm_up, 1.25);
    EXPECT_EQ(row.renorm_down, 0.75);
}

TEST(RenormalisationService, RowWithZeroNominalIsStillEmitted)
{
    const RenormRow row = RenormalisationService::make_row(
        "ttc",
        "pdf",
        make_yield("nominal", Direction::kNominal, 0.0),
        make_yield("pdf", Direction::kUp, 1.0),
        make_yield("pdf", Direction::kDown, 2.0));

    EXPECT_EQ(row.syst_yield_up, 1.0);
    EXPECT_EQ(row.syst_yield_down, 2.0);
    EXPECT_TRUE(std::isnan(row.renorm_up));
    EXPECT_TRUE(std::isnan(row.renorm_down));
}

TEST(YieldService, DirectionNames)
{
    EXPECT_STREQ(direction_name(Direction::kNominal), "nominal");
    EXPECT_STREQ(direction_name(Direction::kUp), "up");
    EXPECT_STREQ(direction_name(Direction::kDown), "down");
}
