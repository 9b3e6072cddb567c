#pragma once

#include "SearchResult.hpp"

#include <QStringView>

class GrepOutputParser
{
public:
    explicit GrepOutputParser(const QString &rootDir);

    // Groups `path:line:content` records by file, keeping first-seen file order.
    SearchFileResults parse(const QString &output) const;

    // Keeps at most maxMatches matches overall. Returns true if anything was dropped.
    static bool truncate(SearchFileResults &results, int maxMatches);

private:
    struct Record {
        QString relativePath;
        int lineNumber = 0;
        QString content;
    };

    bool parseLine(QStringView line, Record &record) const;
    QString absolutePath(const QString &relativePath) const;

    QString m_rootDir;
};
