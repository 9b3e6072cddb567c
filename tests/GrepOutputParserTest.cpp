#include "GrepOutputParser.hpp"
#include "TestUtils.hpp"

static const QString Root = QStringLiteral("/home/user/project");

TEST(GrepOutputParserTest, GroupsMatchesByFileInFirstSeenOrder)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("a.txt:1:alpha\n"
                                               "a.txt:2:beta alpha\n"
                                               "b.txt:1:alpha\n"));
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("a.txt"));
    EXPECT_EQ(results[0].path, QStringLiteral("/home/user/project/a.txt"));
    EXPECT_EQ(results[0].matches, (QList<SearchMatch>{{1, "alpha"}, {2, "beta alpha"}}));
    EXPECT_EQ(results[1].relativePath, QStringLiteral("b.txt"));
    EXPECT_EQ(results[1].matches, (QList<SearchMatch>{{1, "alpha"}}));
    EXPECT_EQ(countMatches(results), 3);
}

TEST(GrepOutputParserTest, InterleavedFilesKeepFirstSeenOrder)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("z.txt:4:one\na.txt:1:two\nz.txt:9:three\n"));
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("z.txt"));
    EXPECT_EQ(results[0].matches, (QList<SearchMatch>{{4, "one"}, {9, "three"}}));
    EXPECT_EQ(results[1].relativePath, QStringLiteral("a.txt"));
}

TEST(GrepOutputParserTest, ContentKeepsColonsAndWhitespace)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("cfg/app.yaml:3:  key: value: x  \n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].matches[0].lineContent, QStringLiteral("  key: value: x  "));
    EXPECT_EQ(results[0].directoryPath(), QStringLiteral("cfg"));
    EXPECT_EQ(results[0].fileName(), QStringLiteral("app.yaml"));
}

TEST(GrepOutputParserTest, EmptyContentIsAllowed)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("a.txt:7:\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].matches, (QList<SearchMatch>{{7, ""}}));
}

TEST(GrepOutputParserTest, MalformedLinesAreDropped)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("no separators here\n"
                                               "a.txt:abc:not a number\n"
                                               "a.txt:0:zero is not a line\n"
                                               "a.txt:-2:negative\n"
                                               "a.txt:12\n"
                                               ":3:no path\n"
                                               "\n"
                                               "good.txt:5:kept\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("good.txt"));
    EXPECT_EQ(results[0].matches, (QList<SearchMatch>{{5, "kept"}}));
}

TEST(GrepOutputParserTest, EmptyOutputYieldsNoResults)
{
    GrepOutputParser parser(Root);
    EXPECT_TRUE(parser.parse(QString()).isEmpty());
    EXPECT_TRUE(parser.parse(QStringLiteral("\n\n")).isEmpty());
}

TEST(GrepOutputParserTest, CurrentDirectoryPrefixIsStripped)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("./src/main.cpp:10:int main()\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("src/main.cpp"));
    EXPECT_EQ(results[0].path, QStringLiteral("/home/user/project/src/main.cpp"));
}

TEST(GrepOutputParserTest, AbsolutePathsAreKept)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("/elsewhere/notes.txt:2:todo\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].path, QStringLiteral("/elsewhere/notes.txt"));
    EXPECT_EQ(results[0].relativePath, QStringLiteral("/elsewhere/notes.txt"));
}

TEST(GrepOutputParserTest, CarriageReturnsStayInContent)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("a.txt:1:dos line\r\nb.txt:2:unix line\n"));
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].matches[0].lineContent, QStringLiteral("dos line\r"));
    EXPECT_EQ(results[1].matches[0].lineContent, QStringLiteral("unix line"));
}

TEST(GrepOutputParserTest, QuotedPathsAreUnescaped)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("\"odd \\\"name\\\":x.txt\":4:hit\n"
                                               "\"tab\\there.txt\":1:other\n"));
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("odd \"name\":x.txt"));
    EXPECT_EQ(results[0].matches, (QList<SearchMatch>{{4, "hit"}}));
    EXPECT_EQ(results[1].relativePath, QStringLiteral("tab\there.txt"));
}

TEST(GrepOutputParserTest, OctalEscapesDecodeAsUtf8)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("\"caf\\303\\251.txt\":1:menu\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].relativePath, QString::fromUtf8("caf\xc3\xa9.txt"));
}

TEST(GrepOutputParserTest, EscapedColonBelongsToPath)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("dir\\:x/f.txt:1:content\n"));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("dir:x/f.txt"));
}

TEST(GrepOutputParserTest, TruncateKeepsLeadingMatches)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("a:1:x\na:2:x\nb:1:x\nb:2:x\nc:1:x\n"));
    ASSERT_EQ(countMatches(results), 5);

    auto copy = results;
    EXPECT_FALSE(GrepOutputParser::truncate(copy, 5));
    EXPECT_EQ(copy, results);

    EXPECT_TRUE(GrepOutputParser::truncate(results, 3));
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].matches.size(), 2);
    EXPECT_EQ(results[1].matches, (QList<SearchMatch>{{1, "x"}}));
    EXPECT_EQ(countMatches(results), 3);
}

TEST(GrepOutputParserTest, TruncateAtFileBoundaryDropsFollowingFiles)
{
    GrepOutputParser parser(Root);
    auto results = parser.parse(QStringLiteral("a:1:x\na:2:x\nb:1:x\n"));
    EXPECT_TRUE(GrepOutputParser::truncate(results, 2));
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].relativePath, QStringLiteral("a"));
}
