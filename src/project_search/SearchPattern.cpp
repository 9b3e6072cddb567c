#include "SearchPattern.hpp"

namespace SearchPattern
{
QStringList filterTokens(const QString &fileFilter)
{
    QStringList tokens;
    for (const auto &part : fileFilter.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        auto token = part.trimmed();
        if (!token.isEmpty())
            tokens << token;
    }
    return tokens;
}

bool isDirectoryToken(const QString &token)
{
    if (token.endsWith(QLatin1Char('/')))
        return true;
    return !token.contains(QLatin1Char('*')) && !token.contains(QLatin1Char('.'));
}

FileFilter parseFileFilter(const QString &fileFilter)
{
    FileFilter filter;
    for (const auto &token : filterTokens(fileFilter)) {
        if (isDirectoryToken(token))
            filter.directories << token;
        else
            filter.globs << token;
    }
    return filter;
}

// Same semantics as grep -w: no word character directly before or after the match.
static QString wordBounded(const QString &pattern)
{
    return QStringLiteral("(?<!\\w)(?:%1)(?!\\w)").arg(pattern);
}

QString patternText(const SearchOptions &options)
{
    auto query = options.trimmedQuery();
    if (options.useRegex)
        return options.wholeWord ? wordBounded(query) : query;

    auto escaped = QRegularExpression::escape(query);
    return options.wholeWord ? wordBounded(escaped) : escaped;
}

QRegularExpression::PatternOptions patternOptions(const SearchOptions &options)
{
    // Backends match line by line, so ^ and $ anchor at every line here too.
    QRegularExpression::PatternOptions flags = QRegularExpression::UseUnicodePropertiesOption | QRegularExpression::MultilineOption;
    if (!options.caseSensitive)
        flags |= QRegularExpression::CaseInsensitiveOption;
    return flags;
}

QRegularExpression buildRegularExpression(const SearchOptions &options)
{
    return QRegularExpression(patternText(options), patternOptions(options));
}
}
