#pragma once

#include "SearchOptions.hpp"
#include "SearchResult.hpp"

#include <QRegularExpression>

class ReplaceEngine
{
public:
    struct Replacement {
        QString content;
        int count = 0;
    };

    // options.query is the search text; fileFilter is ignored.
    ReplaceEngine(const SearchOptions &options, const QString &replacement);

    bool isValid() const;
    QString errorString() const;

    Replacement apply(const QString &content) const;

    // Rewrites the file atomically. Returns the number of replacements written,
    // 0 on any read, decode or write failure.
    int replaceInFile(const QString &filePath) const;

    ReplaceOutcome replaceInFiles(const SearchFileResults &files, const QString &rootDir) const;

    static bool isInsideRoot(const QString &filePath, const QString &rootDir);

private:
    QString expandTemplate(const QRegularExpressionMatch &match) const;

    SearchOptions m_options;
    QString m_replacement;
    QRegularExpression m_regex;
};
