#include "lint/FileFinder.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using testsupport::TempDir;
namespace fs = std::filesystem;

TEST(GlobMatchTest, SingleStarStaysInComponent) {
    EXPECT_TRUE(lint::glob_match("*.adoc", "a.adoc"));
    EXPECT_FALSE(lint::glob_match("*.adoc", "dir/a.adoc"));
    EXPECT_TRUE(lint::glob_match("dir/?.adoc", "dir/a.adoc"));
    EXPECT_FALSE(lint::glob_match("dir?a.adoc", "dir/a.adoc"));
}

TEST(GlobMatchTest, DoubleStarSpansComponents) {
    EXPECT_TRUE(lint::glob_match("**/*.adoc", "a.adoc"));
    EXPECT_TRUE(lint::glob_match("**/*.adoc", "x/y/z.adoc"));
    EXPECT_TRUE(lint::glob_match("docs/**", "docs/a/b.adoc"));
    EXPECT_TRUE(lint::glob_match("docs/**/x.adoc", "docs/x.adoc"));
    EXPECT_FALSE(lint::glob_match("docs/**", "other/a.adoc"));
}

TEST(ExcludeTest, MatchesAnyTrailingRun) {
    const std::vector<std::string> ex = {"node_modules/**", "*.tmp.adoc"};
    EXPECT_TRUE(lint::is_excluded("node_modules/x.adoc", ex));
    EXPECT_TRUE(lint::is_excluded("docs/node_modules/x.adoc", ex));
    EXPECT_TRUE(lint::is_excluded("./docs/draft.tmp.adoc", ex));
    EXPECT_FALSE(lint::is_excluded("docs/x.adoc", ex));
    EXPECT_FALSE(lint::is_excluded("docs/x.adoc", {}));
}

TEST(FindMarkupFilesTest, DirectoryGlobAndFilePatterns) {
    TempDir dir("finder");
    dir.write("docs/a.adoc", "= A\n");
    dir.write("docs/sub/b.asciidoc", "= B\n");
    dir.write("docs/sub/notes.txt", "text");
    dir.write("docs/dist/c.adoc", "= C\n");
    dir.write("single.asc", "= S\n");

    const std::vector<std::string> ex = {"dist/**"};
    const fs::path root = dir.path();

    auto walked = lint::find_markup_files({(root / "docs").string()}, ex);
    ASSERT_EQ(walked.size(), 2u);
    EXPECT_EQ(walked[0].filename(), "a.adoc");
    EXPECT_EQ(walked[1].filename(), "b.asciidoc");

    auto globbed = lint::find_markup_files({(root / "docs" / "**" / "*.adoc").string()}, ex);
    ASSERT_EQ(globbed.size(), 1u);
    EXPECT_EQ(globbed[0].filename(), "a.adoc");

    auto both = lint::find_markup_files({(root / "single.asc").string(), (root / "docs").string(),
                                         (root / "docs" / "a.adoc").string()}, ex);
    EXPECT_EQ(both.size(), 3u);
    EXPECT_TRUE(std::is_sorted(both.begin(), both.end()));
}

TEST(FindMarkupFilesTest, MissingPathsAreIgnored) {
    TempDir dir("finder_missing");
    EXPECT_TRUE(lint::find_markup_files({(dir.path() / "nope").string()}, {}).empty());
}
