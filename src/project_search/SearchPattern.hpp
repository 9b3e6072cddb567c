#pragma once

#include "SearchOptions.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace SearchPattern
{
// Tokens of a comma separated file filter, split by how backends consume them.
struct FileFilter {
    QStringList globs;
    QStringList directories;
};

QStringList filterTokens(const QString &fileFilter);
bool isDirectoryToken(const QString &token);
FileFilter parseFileFilter(const QString &fileFilter);

QString patternText(const SearchOptions &options);
QRegularExpression::PatternOptions patternOptions(const SearchOptions &options);
QRegularExpression buildRegularExpression(const SearchOptions &options);
}
