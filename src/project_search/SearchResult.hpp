#pragma once

#include <QFileInfo>
#include <QList>
#include <QMetaType>
#include <QString>

struct SearchMatch {
    int lineNumber = 0;
    QString lineContent;

    bool operator==(const SearchMatch &other) const
    {
        return lineNumber == other.lineNumber && lineContent == other.lineContent;
    }
};

struct SearchFileResult {
    QString path;
    QString relativePath;
    QList<SearchMatch> matches;

    QString fileName() const
    {
        return QFileInfo(path).fileName();
    }

    // Directory part of relativePath, empty for files at the root.
    QString directoryPath() const
    {
        auto slash = relativePath.lastIndexOf(QLatin1Char('/'));
        return slash < 0 ? QString() : relativePath.left(slash);
    }

    bool operator==(const SearchFileResult &other) const
    {
        return path == other.path && relativePath == other.relativePath && matches == other.matches;
    }
};

using SearchFileResults = QList<SearchFileResult>;

inline int countMatches(const SearchFileResults &results)
{
    int total = 0;
    for (const auto &file : results)
        total += file.matches.size();
    return total;
}

struct ReplaceOutcome {
    int filesChanged = 0;
    int replacementsCount = 0;

    bool operator==(const ReplaceOutcome &other) const
    {
        return filesChanged == other.filesChanged && replacementsCount == other.replacementsCount;
    }
};

Q_DECLARE_METATYPE(SearchMatch)
Q_DECLARE_METATYPE(SearchFileResult)
Q_DECLARE_METATYPE(ReplaceOutcome)
