#include "SearchBackend.hpp"
#include "TestUtils.hpp"

static SearchOptions makeOptions(const QString &query, const QString &fileFilter = QString())
{
    SearchOptions options;
    options.query = query;
    options.fileFilter = fileFilter;
    return options;
}

// Index of the argument following `flag`, or -1.
static qsizetype valueAfter(const QStringList &args, const QString &flag)
{
    auto index = args.indexOf(flag);
    return index < 0 || index + 1 >= args.size() ? -1 : index + 1;
}

TEST(SearchBackendTest, FactoryCreatesRequestedBackend)
{
    SearchSettings settings;
    settings.gitExecutable = QStringLiteral("/opt/git/bin/git");
    settings.grepExecutable = QStringLiteral("/usr/local/bin/ggrep");

    auto git = SearchBackend::create(SearchBackend::VersionedTree, settings);
    EXPECT_EQ(git->kind(), SearchBackend::VersionedTree);
    EXPECT_EQ(git->program(), QStringLiteral("/opt/git/bin/git"));

    auto grep = SearchBackend::create(SearchBackend::PlainFilesystem, settings);
    EXPECT_EQ(grep->kind(), SearchBackend::PlainFilesystem);
    EXPECT_EQ(grep->program(), QStringLiteral("/usr/local/bin/ggrep"));
}

TEST(SearchBackendTest, ZeroAndOneAreSuccessfulExits)
{
    GitGrepBackend git{SearchSettings()};
    GrepBackend grep{SearchSettings()};
    for (const SearchBackend *backend : {static_cast<const SearchBackend *>(&git), static_cast<const SearchBackend *>(&grep)}) {
        EXPECT_TRUE(backend->isSuccessExit(0));
        EXPECT_TRUE(backend->isSuccessExit(1));
        EXPECT_FALSE(backend->isSuccessExit(2));
        EXPECT_FALSE(backend->isSuccessExit(128));
        EXPECT_FALSE(backend->isSuccessExit(-1));
    }
}

TEST(SearchBackendTest, GitGrepLiteralCaseInsensitive)
{
    GitGrepBackend backend{SearchSettings()};
    auto args = backend.arguments(makeOptions(QStringLiteral("  needle ")));

    EXPECT_TRUE(args.contains("grep"));
    EXPECT_TRUE(args.contains("-n"));
    EXPECT_TRUE(args.contains("--color=never"));
    EXPECT_TRUE(args.contains("-I"));
    EXPECT_TRUE(args.contains("--max-count=50"));
    EXPECT_TRUE(args.contains("--untracked"));
    EXPECT_TRUE(args.contains("-i"));
    EXPECT_TRUE(args.contains("--fixed-strings"));
    EXPECT_FALSE(args.contains("-E"));
    EXPECT_FALSE(args.contains("-w"));
    EXPECT_FALSE(args.contains("--"));

    auto pattern = valueAfter(args, "-e");
    ASSERT_GE(pattern, 0);
    EXPECT_EQ(args[pattern], QStringLiteral("needle"));
}

TEST(SearchBackendTest, GitGrepRegexCaseSensitiveWholeWord)
{
    SearchSettings settings;
    settings.maxMatchesPerFile = 7;
    settings.searchUntracked = false;
    GitGrepBackend backend(settings);

    auto options = makeOptions(QStringLiteral("fo+"));
    options.useRegex = true;
    options.caseSensitive = true;
    options.wholeWord = true;
    auto args = backend.arguments(options);

    EXPECT_TRUE(args.contains("-E"));
    EXPECT_TRUE(args.contains("-w"));
    EXPECT_TRUE(args.contains("--max-count=7"));
    EXPECT_FALSE(args.contains("-i"));
    EXPECT_FALSE(args.contains("--fixed-strings"));
    EXPECT_FALSE(args.contains("--untracked"));
}

TEST(SearchBackendTest, GitGrepPassesFilterAsPathspecs)
{
    GitGrepBackend backend{SearchSettings()};
    auto args = backend.arguments(makeOptions(QStringLiteral("x"), QStringLiteral(" *.swift, src/ ,")));

    auto separator = args.indexOf(QStringLiteral("--"));
    ASSERT_GE(separator, 0);
    EXPECT_EQ(args.mid(separator + 1), (QStringList{"*.swift", "src/"}));
    EXPECT_LT(valueAfter(args, "-e"), separator);
}

TEST(SearchBackendTest, QueryStartingWithDashStaysAPattern)
{
    GrepBackend backend{SearchSettings()};
    auto args = backend.arguments(makeOptions(QStringLiteral("--version")));
    auto pattern = valueAfter(args, "-e");
    ASSERT_GE(pattern, 0);
    EXPECT_EQ(args[pattern], QStringLiteral("--version"));
}

TEST(SearchBackendTest, GrepExcludesNoiseDirectoriesAndSearchesCurrentDirectory)
{
    GrepBackend backend{SearchSettings()};
    auto args = backend.arguments(makeOptions(QStringLiteral("needle")));

    EXPECT_TRUE(args.contains("-rn"));
    EXPECT_TRUE(args.contains("--color=never"));
    EXPECT_TRUE(args.contains("-I"));
    EXPECT_TRUE(args.contains("--exclude-dir=.git"));
    EXPECT_TRUE(args.contains("--exclude-dir=.build"));
    EXPECT_TRUE(args.contains("--exclude-dir=node_modules"));
    EXPECT_TRUE(args.contains("--exclude-dir=.swiftpm"));
    EXPECT_TRUE(args.contains("--fixed-strings"));
    EXPECT_EQ(args.last(), QStringLiteral("."));
}

TEST(SearchBackendTest, GrepSplitsGlobsAndDirectories)
{
    SearchSettings settings;
    settings.excludedDirectories = {QStringLiteral("target")};
    GrepBackend backend(settings);
    auto args = backend.arguments(makeOptions(QStringLiteral("needle"), QStringLiteral("*.cpp, src/, docs, *.h")));

    EXPECT_TRUE(args.contains("--include=*.cpp"));
    EXPECT_TRUE(args.contains("--include=*.h"));
    EXPECT_TRUE(args.contains("--exclude-dir=target"));
    EXPECT_FALSE(args.contains("--exclude-dir=.git"));
    EXPECT_FALSE(args.contains("."));
    EXPECT_EQ(args.mid(args.size() - 2), (QStringList{"src/", "docs"}));
}
