#include "ReplaceEngine.hpp"
#include "ProjectSearchDebug.hpp"
#include "SearchPattern.hpp"

#include <QDir>
#include <QException>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStringDecoder>
#include <QStringEncoder>

struct ReplaceError : public QException {
    QString message;
    ReplaceError(const QString &message)
        : message(message)
    {
    }
};

struct TextFile {
    QString text;
    QStringConverter::Encoding encoding = QStringConverter::Utf8;
};

static TextFile readTextFile(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly))
        throw ReplaceError(file.errorString());
    auto data = file.readAll();
    if (file.error() != QFileDevice::NoError)
        throw ReplaceError(file.errorString());

    TextFile result;
    result.encoding = QStringConverter::encodingForData(data).value_or(QStringConverter::Utf8);
    // Keep a leading BOM in the text so it is written back unchanged.
    QStringDecoder decoder(result.encoding, QStringConverter::Flag::ConvertInitialBom);
    result.text = decoder.decode(data);
    if (decoder.hasError())
        throw ReplaceError(QStringLiteral("content is not valid %1 text").arg(QLatin1String(QStringConverter::nameForEncoding(result.encoding))));
    return result;
}

static void writeTextFile(const QString &filePath, const TextFile &file)
{
    QStringEncoder encoder(file.encoding);
    QByteArray data = encoder.encode(file.text);
    if (encoder.hasError())
        throw ReplaceError(QStringLiteral("cannot encode replacement text"));

    QSaveFile out(filePath);
    if (!out.open(QIODevice::WriteOnly))
        throw ReplaceError(out.errorString());
    if (out.write(data) != data.size()) {
        auto message = out.errorString();
        out.cancelWriting();
        throw ReplaceError(message);
    }
    if (!out.commit())
        throw ReplaceError(out.errorString());
}

ReplaceEngine::ReplaceEngine(const SearchOptions &options, const QString &replacement)
    : m_options(options)
    , m_replacement(replacement)
    , m_regex(SearchPattern::buildRegularExpression(options))
{
}

bool ReplaceEngine::isValid() const
{
    return !m_options.trimmedQuery().isEmpty() && m_regex.isValid();
}

QString ReplaceEngine::errorString() const
{
    if (m_options.trimmedQuery().isEmpty())
        return QStringLiteral("empty query");
    return m_regex.errorString();
}

// Supports $N, $NN, ${name} and \N group references; $$ and \\ are literal.
QString ReplaceEngine::expandTemplate(const QRegularExpressionMatch &match) const
{
    const auto &tmpl = m_replacement;
    const int groups = m_regex.captureCount();
    QString out;
    out.reserve(tmpl.size());

    for (qsizetype i = 0; i < tmpl.size(); i++) {
        auto c = tmpl[i];
        bool hasNext = i + 1 < tmpl.size();
        if (c == QLatin1Char('$') && hasNext) {
            auto next = tmpl[i + 1];
            if (next == QLatin1Char('$')) {
                out += QLatin1Char('$');
                i++;
                continue;
            }
            if (next.isDigit()) {
                int group = next.digitValue();
                i++;
                if (i + 1 < tmpl.size() && tmpl[i + 1].isDigit()) {
                    int wider = group * 10 + tmpl[i + 1].digitValue();
                    if (wider <= groups) {
                        group = wider;
                        i++;
                    }
                }
                out += match.captured(group);
                continue;
            }
            if (next == QLatin1Char('{')) {
                auto close = tmpl.indexOf(QLatin1Char('}'), i + 2);
                if (close > i + 2) {
                    auto name = tmpl.mid(i + 2, close - i - 2);
                    bool isNumber = false;
                    int group = name.toInt(&isNumber);
                    out += isNumber ? match.captured(group) : match.captured(name);
                    i = close;
                    continue;
                }
            }
        } else if (c == QLatin1Char('\\') && hasNext) {
            auto next = tmpl[i + 1];
            i++;
            if (next.isDigit())
                out += match.captured(next.digitValue());
            else
                out += next;
            continue;
        }
        out += c;
    }
    return out;
}

ReplaceEngine::Replacement ReplaceEngine::apply(const QString &content) const
{
    if (!isValid())
        return {content, 0};

    Replacement result;
    result.content.reserve(content.size());
    qsizetype last = 0;
    auto it = m_regex.globalMatch(content);
    while (it.hasNext()) {
        auto match = it.next();
        result.content += QStringView(content).mid(last, match.capturedStart() - last);
        result.content += m_options.useRegex ? expandTemplate(match) : m_replacement;
        last = match.capturedEnd();
        result.count++;
    }
    if (result.count == 0)
        return {content, 0};
    result.content += QStringView(content).mid(last);
    return result;
}

int ReplaceEngine::replaceInFile(const QString &filePath) const
{
    if (!isValid())
        return 0;
    try {
        auto file = readTextFile(filePath);
        auto replaced = apply(file.text);
        if (replaced.count == 0 || replaced.content == file.text)
            return 0;
        writeTextFile(filePath, {replaced.content, file.encoding});
        qCDebug(PROJECTSEARCH_LOG) << "Replaced" << replaced.count << "occurrences in" << filePath;
        return replaced.count;
    } catch (ReplaceError &err) {
        qCWarning(PROJECTSEARCH_LOG) << "Replace failed for" << filePath << ":" << err.message;
    }
    return 0;
}

bool ReplaceEngine::isInsideRoot(const QString &filePath, const QString &rootDir)
{
    if (rootDir.isEmpty() || filePath.isEmpty())
        return false;
    auto root = QDir::cleanPath(QDir(rootDir).absolutePath());
    auto path = QDir::cleanPath(QFileInfo(filePath).absoluteFilePath());
    if (root == QLatin1String("/"))
        return path.size() > 1;
    return path.startsWith(root + QLatin1Char('/'));
}

ReplaceOutcome ReplaceEngine::replaceInFiles(const SearchFileResults &files, const QString &rootDir) const
{
    ReplaceOutcome outcome;
    if (!isValid()) {
        qCWarning(PROJECTSEARCH_LOG) << "Not replacing, invalid pattern:" << errorString();
        return outcome;
    }
    for (const auto &file : files) {
        if (!isInsideRoot(file.path, rootDir)) {
            qCDebug(PROJECTSEARCH_LOG) << "Skipping" << file.path << "outside of" << rootDir;
            continue;
        }
        auto count = replaceInFile(file.path);
        if (count > 0) {
            outcome.filesChanged++;
            outcome.replacementsCount += count;
        }
    }
    return outcome;
}
