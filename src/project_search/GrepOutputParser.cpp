#include "GrepOutputParser.hpp"

#include <QDir>
#include <QHash>

GrepOutputParser::GrepOutputParser(const QString &rootDir)
    : m_rootDir(QDir::cleanPath(rootDir))
{
}

static QChar unescapeChar(QChar c)
{
    switch (c.unicode()) {
    case 'n':
        return QLatin1Char('\n');
    case 't':
        return QLatin1Char('\t');
    case 'r':
        return QLatin1Char('\r');
    case 'a':
        return QLatin1Char('\a');
    case 'b':
        return QLatin1Char('\b');
    case 'f':
        return QLatin1Char('\f');
    case 'v':
        return QLatin1Char('\v');
    default:
        return c;
    }
}

// git prints paths with unusual characters as C-style quoted strings.
static qsizetype readQuotedPath(QStringView line, QString &path)
{
    QByteArray bytes;
    qsizetype i = 1;
    while (i < line.size()) {
        auto c = line[i];
        if (c == QLatin1Char('"')) {
            path = QString::fromUtf8(bytes);
            return i + 1;
        }
        if (c == QLatin1Char('\\') && i + 1 < line.size()) {
            auto next = line[i + 1];
            if (next >= QLatin1Char('0') && next <= QLatin1Char('7') && i + 3 < line.size()) {
                bool ok = false;
                auto octal = line.mid(i + 1, 3).toString().toInt(&ok, 8);
                if (ok) {
                    bytes.append(char(octal));
                    i += 4;
                    continue;
                }
            }
            bytes.append(QString(unescapeChar(next)).toUtf8());
            i += 2;
            continue;
        }
        bytes.append(QString(c).toUtf8());
        i++;
    }
    return -1;
}

bool GrepOutputParser::parseLine(QStringView line, Record &record) const
{
    qsizetype pathEnd = -1;
    if (line.startsWith(QLatin1Char('"'))) {
        pathEnd = readQuotedPath(line, record.relativePath);
        if (pathEnd < 0 || pathEnd >= line.size() || line[pathEnd] != QLatin1Char(':'))
            return false;
    } else {
        QString path;
        for (qsizetype i = 0; i < line.size(); i++) {
            auto c = line[i];
            if (c == QLatin1Char('\\') && i + 1 < line.size() && line[i + 1] == QLatin1Char(':')) {
                path += QLatin1Char(':');
                i++;
            } else if (c == QLatin1Char(':')) {
                pathEnd = i;
                break;
            } else {
                path += c;
            }
        }
        if (pathEnd <= 0)
            return false;
        record.relativePath = path;
    }

    auto lineStart = pathEnd + 1;
    auto lineEnd = line.indexOf(QLatin1Char(':'), lineStart);
    if (lineEnd < 0)
        return false;

    bool ok = false;
    record.lineNumber = line.mid(lineStart, lineEnd - lineStart).toInt(&ok);
    if (!ok || record.lineNumber <= 0)
        return false;

    record.content = line.mid(lineEnd + 1).toString();
    record.relativePath = QDir::cleanPath(record.relativePath);
    return !record.relativePath.isEmpty();
}

QString GrepOutputParser::absolutePath(const QString &relativePath) const
{
    if (QDir::isAbsolutePath(relativePath))
        return relativePath;
    return QDir::cleanPath(m_rootDir + QLatin1Char('/') + relativePath);
}

SearchFileResults GrepOutputParser::parse(const QString &output) const
{
    SearchFileResults results;
    QHash<QString, qsizetype> indexByPath;

    for (const auto &line : QStringView(output).split(QLatin1Char('\n'), Qt::SkipEmptyParts)) {
        Record record;
        if (!parseLine(line, record))
            continue;

        auto it = indexByPath.constFind(record.relativePath);
        if (it == indexByPath.constEnd()) {
            it = indexByPath.insert(record.relativePath, results.size());
            results.append({absolutePath(record.relativePath), record.relativePath, {}});
        }
        results[*it].matches.append({record.lineNumber, record.content});
    }
    return results;
}

bool GrepOutputParser::truncate(SearchFileResults &results, int maxMatches)
{
    int remaining = maxMatches;
    for (qsizetype i = 0; i < results.size(); i++) {
        auto &matches = results[i].matches;
        if (matches.size() <= remaining) {
            remaining -= matches.size();
            continue;
        }
        if (remaining > 0) {
            matches.resize(remaining);
            results.resize(i + 1);
        } else {
            results.resize(i);
        }
        return true;
    }
    return false;
}
