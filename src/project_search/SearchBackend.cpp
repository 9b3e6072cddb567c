#include "SearchBackend.hpp"
#include "SearchPattern.hpp"

std::unique_ptr<SearchBackend> SearchBackend::create(Kind kind, const SearchSettings &settings)
{
    switch (kind) {
    case VersionedTree:
        return std::make_unique<GitGrepBackend>(settings);
    case PlainFilesystem:
        break;
    }
    return std::make_unique<GrepBackend>(settings);
}

static void appendMatchFlags(QStringList &args, const SearchOptions &options)
{
    if (!options.caseSensitive)
        args << "-i";
    if (options.wholeWord)
        args << "-w";
}

static void appendPattern(QStringList &args, const SearchOptions &options)
{
    if (options.useRegex)
        args << "-E";
    else
        args << "--fixed-strings";
    args << "-e" << options.trimmedQuery();
}

QString GitGrepBackend::program() const
{
    return m_settings.gitExecutable;
}

QStringList GitGrepBackend::arguments(const SearchOptions &options) const
{
    QStringList args;
    args << "-c" << "core.quotePath=false";
    args << "grep" << "-n" << "--color=never" << "-I";
    args << QStringLiteral("--max-count=%1").arg(m_settings.maxMatchesPerFile);
    if (m_settings.searchUntracked)
        args << "--untracked";
    appendMatchFlags(args, options);
    appendPattern(args, options);

    // git understands globs and directory prefixes alike as pathspecs.
    auto tokens = SearchPattern::filterTokens(options.fileFilter);
    if (!tokens.isEmpty())
        args << "--" << tokens;
    return args;
}

QString GrepBackend::program() const
{
    return m_settings.grepExecutable;
}

QStringList GrepBackend::arguments(const SearchOptions &options) const
{
    QStringList args;
    args << "-rn" << "--color=never" << "-I" << "-s";
    appendMatchFlags(args, options);
    for (const auto &dir : m_settings.excludedDirectories)
        args << QStringLiteral("--exclude-dir=%1").arg(dir);

    auto filter = SearchPattern::parseFileFilter(options.fileFilter);
    for (const auto &glob : filter.globs)
        args << QStringLiteral("--include=%1").arg(glob);
    appendPattern(args, options);

    if (filter.directories.isEmpty())
        args << ".";
    else
        args << filter.directories;
    return args;
}
