#pragma once

#include <QMetaType>
#include <QString>

struct SearchOptions {
    QString query;
    bool caseSensitive = false;
    bool useRegex = false;
    bool wholeWord = false;
    QString fileFilter;

    QString trimmedQuery() const
    {
        return query.trimmed();
    }

    bool operator==(const SearchOptions &other) const
    {
        return query == other.query && caseSensitive == other.caseSensitive && useRegex == other.useRegex
            && wholeWord == other.wholeWord && fileFilter == other.fileFilter;
    }
    bool operator!=(const SearchOptions &other) const
    {
        return !(*this == other);
    }
};

Q_DECLARE_METATYPE(SearchOptions)
