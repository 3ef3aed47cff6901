#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "SelectionService.hh"

TEST(SelectionService, NominalWeightWithIdentityDirectionIsUnchanged)
{
    EXPECT_EQ(SelectionService::compose_weight("w", "1"), "w");
    EXPECT_EQ(SelectionService::compose_weight("w", ""), "w");
    EXPECT_EQ(SelectionService::compose_weight(" evt_weight ", " 1 "), "evt_weight");
}

TEST(SelectionService, DirectionWeightMultipliesNominal)
{
    EXPECT_EQ(SelectionService::compose_weight("w", "s"), "(w)*(s)");
    EXPECT_EQ(SelectionService::compose_weight("a+b", "c-d"), "(a+b)*(c-d)");
}

TEST(SelectionService, IdentityNominalKeepsDirectionWeight)
{
    EXPECT_EQ(SelectionService::compose_weight("1", "w_up"), "w_up");
    EXPECT_EQ(SelectionService::compose_weight("1", "1"), "1");
}

TEST(SelectionService, WeightOverlaysCompose)
{
    const std::string base = SelectionService::compose_weight("w", "kin_rw");
    EXPECT_EQ(SelectionService::compose_weight(base, "1"), "(w)*(kin_rw)");
    EXPECT_EQ(SelectionService::compose_weight(base, "x"), "((w)*(kin_rw))*(x)");
}

TEST(SelectionService, EmptySelectionsSelectAll)
{
    EXPECT_EQ(SelectionService::compose_selection("", ""), "true");
    EXPECT_TRUE(SelectionService::is_select_all(SelectionService::compose_selection("", "")));
    EXPECT_TRUE(SelectionService::is_select_all("  "));
    EXPECT_TRUE(SelectionService::is_select_all("true"));
    EXPECT_FALSE(SelectionService::is_select_all("nJets>=4"));
}

TEST(SelectionService, SingleSelectionIsPassedThrough)
{
    EXPECT_EQ(SelectionService::compose_selection("nJets>=4", ""), "nJets>=4");
    EXPECT_EQ(SelectionService::compose_selection("", "nBTags>=2"), "nBTags>=2");
    EXPECT_EQ(SelectionService::compose_selection("true", "nBTags>=2"), "nBTags>=2");
}

TEST(SelectionService, SelectionsAreAndedWithParentheses)
{
    EXPECT_EQ(SelectionService::compose_selection("a", "b"), "(a) && (b)");
    EXPECT_EQ(SelectionService::compose_selection(std::vector<std::string>{"a || c", "", "b"}),
              "(a || c) && (b)");
}

TEST(ExtraSelectionRegistry, ResolvedAppliesOutsideBoostedFolders)
{
    const ExtraSelectionRegistry registry = ExtraSelectionRegistry::with_defaults();
    EXPECT_TRUE(registry.applies("resolved", "1l_resolved"));
    EXPECT_TRUE(registry.applies("resolved", "mc16a"));
    EXPECT_FALSE(registry.applies("resolved", "1l_boosted"));

    EXPECT_TRUE(registry.applies("boosted", "1l_boosted"));
    EXPECT_FALSE(registry.applies("boosted", "mc16a"));
}

TEST(ExtraSelectionRegistry, UnknownNamesNeverApply)
{
    ExtraSelectionRegistry registry = ExtraSelectionRegistry::with_defaults();
    EXPECT_FALSE(registry.has_rule("dilepton"));
    EXPECT_FALSE(registry.applies("dilepton", "mc16a"));

    const std::vector<ExtraSelection> extras = {{"resolved", "a"}, {"dilepton", "b"}, {"boosted", "c"}};
    EXPECT_EQ(registry.unregistered(extras), std::vector<std::string>{"dilepton"});

    registry.register_rule("dilepton", [](const std::string &folder) { return folder.find("2l") != std::string::npos; });
    EXPECT_TRUE(registry.has_rule("dilepton"));
    EXPECT_TRUE(registry.applies("dilepton", "2l_resolved"));
    EXPECT_FALSE(registry.applies("dilepton", "1l_resolved"));
    EXPECT_TRUE(registry.unregistered(extras).empty());
}

TEST(SelectionService, FolderSelectionAddsApplicableExtras)
{
    RenormConfig config;
    config.extra_selections = {{"resolved", "nJets>=5"}, {"boosted", "nFatJets>=1"}, {"unused", "x>0"}};

    FlavourSpec flavour;
    flavour.name = "ttb";
    flavour.selection = "HF_SimpleClassification==1";

    const ExtraSelectionRegistry registry = ExtraSelectionRegistry::with_defaults();
    EXPECT_EQ(SelectionService::folder_selection(config, flavour, "1l", registry),
              "(HF_SimpleClassification==1) && (nJets>=5)");
    EXPECT_EQ(SelectionService::folder_selection(config, flavour, "1l_boosted", registry),
              "(HF_SimpleClassification==1) && (nFatJets>=1)");

    flavour.selection.clear();
    EXPECT_EQ(SelectionService::folder_selection(config, flavour, "1l", registry), "nJets>=5");

    config.extra_selections.clear();
    EXPECT_EQ(SelectionService::folder_selection(config, flavour, "1l", registry), "true");
}
