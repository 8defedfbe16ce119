#include "gtest/gtest.h"
#include "../../src/Logic/SchemeRenamer.h"
#include <string>
#include <vector>

TEST(SchemeRenamerNumbering, FormatNumber)
{
    EXPECT_STREQ(SchemeRenamer::FormatNumber(0, 3, 1, 1).c_str(), "001");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(2, 2, 1, 10).c_str(), "21");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(6, 1, 1, 1).c_str(), "7");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(0, 2, 12345, 1).c_str(), "12345");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(3, 2, 10, -5).c_str(), "-5");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(0, 3, -5, 1).c_str(), "-05");
    EXPECT_STREQ(SchemeRenamer::FormatNumber(4, 0, 1, 1).c_str(), "5");
}

TEST(SchemeRenamerNumbering, AddSequentialNumber)
{
    NumberOptions options;
    EXPECT_STREQ(SchemeRenamer::AddSequentialNumber("image.jpg", 0, options).c_str(), "image_01.jpg");

    options.position = NumberPosition::Prefix;
    EXPECT_STREQ(SchemeRenamer::AddSequentialNumber("image.jpg", 1, options).c_str(), "02_image.jpg");

    options.padding = 3;
    options.start = 10;
    options.step = 5;
    options.separator = "-";
    EXPECT_STREQ(SchemeRenamer::AddSequentialNumber("test.jpg", 4, options).c_str(), "030-test.jpg");
    EXPECT_STREQ(SchemeRenamer::AddSequentialNumber("notes", ".txt", 0, options).c_str(), "010-notes.txt");
    EXPECT_STREQ(SchemeRenamer::AddSequentialNumber("README", 0, options).c_str(), "010-README");
}

TEST(SchemeRenamerCompose, SplitExtension)
{
    NameParts parts = SchemeRenamer::SplitExtension("archive.tar.gz");
    EXPECT_EQ(parts.stem, "archive.tar");
    EXPECT_EQ(parts.extension, ".gz");

    parts = SchemeRenamer::SplitExtension("README");
    EXPECT_EQ(parts.stem, "README");
    EXPECT_EQ(parts.extension, "");

    parts = SchemeRenamer::SplitExtension(".bashrc");
    EXPECT_EQ(parts.stem, ".bashrc");
    EXPECT_EQ(parts.extension, "");

    parts = SchemeRenamer::SplitExtension("..hidden.txt");
    EXPECT_EQ(parts.stem, "..hidden");
    EXPECT_EQ(parts.extension, ".txt");

    parts = SchemeRenamer::SplitExtension("trailing.");
    EXPECT_EQ(parts.stem, "trailing");
    EXPECT_EQ(parts.extension, ".");

    parts = SchemeRenamer::SplitExtension("");
    EXPECT_EQ(parts.stem, "");
    EXPECT_EQ(parts.extension, "");
}

TEST(SchemeRenamerCompose, PerformFindReplace)
{
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("image_01", "image", "photo").c_str(), "photo_01");
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("a.b.c", ".", "-").c_str(), "a-b-c");
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("aaa", "a", "aa").c_str(), "aaaaaa");
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("Case Test", "test", "Match").c_str(), "Case Test");
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("keep", "", "x").c_str(), "keep");
    EXPECT_STREQ(SchemeRenamer::PerformFindReplace("remove me", " me", "").c_str(), "remove");
}

TEST(SchemeRenamerCompose, FullPipeline)
{
    SchemeConfig config;
    config.prefix = "pre_";
    config.suffix = "_post";
    config.find = "test";
    config.replace = "new";
    config.caseOption = CaseOption::Title;
    config.useNumbering = true;
    config.numberOptions.padding = 2;
    config.numberOptions.start = 10;
    config.numberOptions.step = 5;
    config.numberOptions.position = NumberPosition::Prefix;
    config.numberOptions.separator = "-";

    EXPECT_EQ(SchemeRenamer::ComposeName("/p/test_image.jpg", 0, config), "10-Pre_New_Image_Post.jpg");
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/test_image.jpg", 1, config), "15-Pre_New_Image_Post.jpg");
}

TEST(SchemeRenamerCompose, DefaultSchemeKeepsName)
{
    const SchemeConfig config;
    const std::vector<std::string> paths = {"/p/test_image.jpg", "/p/README", "/p/.bashrc", "/p/archive.tar.gz", "/p/Mixed Case.JPG", "/p/trailing."};
    for (const auto &path : paths)
    {
        EXPECT_EQ(SchemeRenamer::ComposeName(path, 3, config), fs::path(path).filename().string());
    }
}

TEST(SchemeRenamerCompose, ReplaceNameKeepsExtension)
{
    SchemeConfig config;
    config.replaceName = true;
    config.newName = "Stary Jack";
    config.prefix = "ignored_";
    config.suffix = "_ignored";
    config.caseOption = CaseOption::Title;

    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/some_image.jpg", 0, config), "Stary Jack.jpg");
    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/another_file.png", 1, config), "Stary Jack.png");
    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/document", 2, config), "Stary Jack");
}

TEST(SchemeRenamerCompose, CombinedOptions)
{
    SchemeConfig config;
    config.replaceName = true;
    config.newName = "vacation photo";
    config.find = "photo";
    config.replace = "picture";
    config.caseOption = CaseOption::Title;
    config.useNumbering = true;
    config.numberOptions.start = 10;

    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/test_image_1.jpg", 0, config), "Vacation Picture_10.jpg");
    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/test_image_2.jpg", 1, config), "Vacation Picture_11.jpg");
    EXPECT_EQ(SchemeRenamer::ComposeName("/path/to/test_image_3.jpg", 2, config), "Vacation Picture_12.jpg");
}

TEST(SchemeRenamerCompose, ExtensionIsNeverTransformed)
{
    SchemeConfig config;
    config.find = "jpg";
    config.replace = "png";
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/jpg_file.jpg", 0, config), "png_file.jpg");

    config = SchemeConfig();
    config.caseOption = CaseOption::Lower;
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/PHOTO.JPG", 0, config), "photo.JPG");

    config.caseOption = CaseOption::Upper;
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/photo.jpg", 0, config), "PHOTO.jpg");
}

TEST(SchemeRenamerCompose, DotsAddedToStemStayInStem)
{
    SchemeConfig config;
    config.prefix = "v1.2_";
    config.useNumbering = true;
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/file", 0, config), "v1.2_file_01");
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/.profile", 0, config), "v1.2_.profile_01");
}

TEST(SchemeRenamerCompose, CaseRunsBeforeNumbering)
{
    SchemeConfig config;
    config.caseOption = CaseOption::Upper;
    config.useNumbering = true;
    config.numberOptions.separator = "x";
    EXPECT_EQ(SchemeRenamer::ComposeName("/p/img.png", 0, config), "IMGx01.png");
}

TEST(SchemeRenamerCompose, GetExamplePreviews)
{
    std::vector<fs::path> paths;
    for (int i = 0; i < 7; ++i)
    {
        paths.push_back("/photos/img" + std::to_string(i) + ".jpg");
    }
    SchemeConfig config;
    config.useNumbering = true;

    const std::vector<PreviewPair> previews = SchemeRenamer::GetExamplePreviews(paths, config, 5);
    ASSERT_EQ(previews.size(), 5u);
    EXPECT_EQ(previews[0].first, "img0.jpg");
    EXPECT_EQ(previews[0].second, "img0_01.jpg");
    EXPECT_EQ(previews[4].first, "img4.jpg");
    EXPECT_EQ(previews[4].second, "img4_05.jpg");

    EXPECT_EQ(SchemeRenamer::GetExamplePreviews(paths, config, 100).size(), 7u);
    EXPECT_TRUE(SchemeRenamer::GetExamplePreviews(paths, config, 0).empty());
    EXPECT_TRUE(SchemeRenamer::GetExamplePreviews({}, config).empty());
}

TEST(SchemeRenamerUtils, ParseAndFormatOptions)
{
    EXPECT_EQ(SchemeRenamer::ParseCaseOption("lower"), CaseOption::Lower);
    EXPECT_EQ(SchemeRenamer::ParseCaseOption("UPPER"), CaseOption::Upper);
    EXPECT_EQ(SchemeRenamer::ParseCaseOption("Title Case"), CaseOption::Title);
    EXPECT_EQ(SchemeRenamer::ParseCaseOption("title"), CaseOption::Title);
    EXPECT_EQ(SchemeRenamer::ParseCaseOption("preserve"), CaseOption::Preserve);
    EXPECT_FALSE(SchemeRenamer::ParseCaseOption("sentence").has_value());

    EXPECT_EQ(SchemeRenamer::ParseNumberPosition("prefix"), NumberPosition::Prefix);
    EXPECT_EQ(SchemeRenamer::ParseNumberPosition("Suffix"), NumberPosition::Suffix);
    EXPECT_FALSE(SchemeRenamer::ParseNumberPosition("middle").has_value());

    EXPECT_EQ(SchemeRenamer::ToString(CaseOption::Title), "title");
    EXPECT_EQ(SchemeRenamer::ToString(NumberPosition::Prefix), "prefix");
    EXPECT_EQ(SchemeRenamer::ToString(BatchStatus::Partial), "partial");

    EntryResult result;
    EXPECT_EQ(SchemeRenamer::ToLabel(result), "success");
    result.outcome = EntryOutcome::DestinationExists;
    EXPECT_EQ(SchemeRenamer::ToLabel(result), "Destination file already exists");
    result.outcome = EntryOutcome::Error;
    result.message = "boom";
    EXPECT_EQ(SchemeRenamer::ToLabel(result), "Error: boom");
}

TEST(SchemeRenamerUtils, FormatOutcomeLine)
{
    EntryResult result{"/photos/a.jpg", "/photos/a_01.jpg", EntryOutcome::Success, ""};
    EXPECT_EQ(SchemeRenamer::FormatOutcomeLine(result), "/photos/a.jpg -> /photos/a_01.jpg");

    result.outcome = EntryOutcome::PermissionDenied;
    EXPECT_EQ(SchemeRenamer::FormatOutcomeLine(result), "/photos/a.jpg -> /photos/a_01.jpg: Permission denied");
}
