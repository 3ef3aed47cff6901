#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "RenormErrors.hh"
#include "SampleIO.hh"
#include "TestSamples.hh"

TEST(SampleIO, SuffixIsAppendedWhenAbsent)
{
    EXPECT_EQ(SampleIO::normalise_identifier("sigA"), "sigA.root");
    EXPECT_EQ(SampleIO::normalise_identifier("sigA.root"), "sigA.root");
    EXPECT_EQ(SampleIO::normalise_identifier("mc16a/410470"), "mc16a/410470.root");
    EXPECT_TRUE(SampleIO::has_sample_suffix("x.root"));
    EXPECT_FALSE(SampleIO::has_sample_suffix("x.root.bak"));
}

TEST(SampleIO, NormalisedListsDropDuplicatesKeepingOrder)
{
    const std::vector<std::string> in = {"b", "a.root", "b.root", "c", "a"};
    EXPECT_EQ(SampleIO::normalise_identifiers(in),
              (std::vector<std::string>{"b.root", "a.root", "c.root"}));
}

TEST(SampleIO, TreeNameIsFixed)
{
    EXPECT_STREQ(SampleIO::tree_name(), "nominal_Loose");
}

TEST(SampleIO, ResolveCollectsMatchesFromEveryFolder)
{
    ScratchDir scratch("sampleio_resolve");
    scratch.make_folder("1l");
    scratch.make_folder("1l_boosted");
    write_text(scratch.file("1l/sigA.root"), "");
    write_text(scratch.file("1l/sigB.root"), "");
    write_text(scratch.file("1l_boosted/sigA.root"), "");

    const auto groups = SampleIO::resolve(scratch.path().string(), {"1l", "1l_boosted"}, {"sigA", "sigB.root"});
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].folder, "1l");
    EXPECT_EQ(groups[0].paths, (std::vector<std::string>{scratch.file("1l/sigA.root"), scratch.file("1l/sigB.root")}));
    EXPECT_EQ(groups[1].folder, "1l_boosted");
    EXPECT_EQ(groups[1].paths, std::vector<std::string>{scratch.file("1l_boosted/sigA.root")});

    EXPECT_EQ(SampleIO::flatten(groups).size(), 3u);
}

TEST(SampleIO, ResolveDropsFoldersWithoutMatches)
{
    ScratchDir scratch("sampleio_partial");
    scratch.make_folder("a");
    scratch.make_folder("b");
    write_text(scratch.file("b/sigA.root"), "");

    const auto groups = SampleIO::resolve(scratch.path().string(), {"a", "b"}, {"sigA"});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].folder, "b");
}

TEST(SampleIO, ResolveFailsWhenNoFolderHasTheFile)
{
    ScratchDir scratch("sampleio_missing");
    scratch.make_folder("1l");
    write_text(scratch.file("1l/sigA.root"), "");

    try
    {
        SampleIO::resolve(scratch.path().string(), {"1l"}, {"sigA", "sigZ"});
        FAIL() << "expected MissingFileError";
    }
    catch (const MissingFileError &e)
    {
        const std::string what = e.what();
        EXPECT_NE(what.find("sigZ.root"), std::string::npos) << what;
        EXPECT_NE(what.find(scratch.file("1l/sigZ.root")), std::string::npos) << what;
    }

    EXPECT_THROW(SampleIO::resolve(scratch.path().string(), {"1l"}, {}), MissingFileError);
    EXPECT_THROW(SampleIO::resolve(scratch.path().string(), {}, {"sigA"}), MissingFileError);
}

TEST(SampleIO, EnsureTreePresentAcceptsValidSamples)
{
    ScratchDir scratch("sampleio_tree");
    const std::string path = scratch.file("sigA.root");
    write_sample(path, 10);
    EXPECT_NO_THROW(SampleIO::ensure_tree_present({path}, SampleIO::tree_name()));
}

TEST(SampleIO, EnsureTreePresentReportsMissingTree)
{
    ScratchDir scratch("sampleio_notree");
    const std::string path = scratch.file("sigA.root");
    write_sample(path, 10, 0, 1.0, "other_tree");

    try
    {
        SampleIO::ensure_tree_present({path}, SampleIO::tree_name());
        FAIL() << "expected MissingTreeError";
    }
    catch (const MissingTreeError &e)
    {
        EXPECT_EQ(e.path(), path);
        EXPECT_EQ(e.tree_name(), "nominal_Loose");
    }
}

TEST(SampleIO, EnsureTreePresentReportsUnreadableFile)
{
    ScratchDir scratch("sampleio_zombie");
    const std::string path = scratch.file("broken.root");
    write_text(path, "this is not a ROOT file");
    EXPECT_THROW(SampleIO::ensure_tree_present({path}, SampleIO::tree_name()), MissingFileError);
    EXPECT_THROW(SampleIO::ensure_tree_present({}, SampleIO::tree_name()), MissingFileError);
}
