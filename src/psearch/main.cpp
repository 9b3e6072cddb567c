#include "ProjectSearchModel.hpp"
#include "SearchSettings.hpp"

#include <KSharedConfig>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

enum ExitCode {
    MatchesFound = 0,
    NoMatches = 1,
    SearchFailed = 2,
};

static void printResults(QTextStream &out, const ProjectSearchModel &model)
{
    for (const auto &file : model.results()) {
        out << file.relativePath << Qt::endl;
        for (const auto &match : file.matches)
            out << "  " << match.lineNumber << ": " << match.lineContent << Qt::endl;
    }
    auto files = model.results().size();
    out << QCoreApplication::translate("main", "%1 matches in %2 files").arg(model.totalMatches()).arg(files);
    if (model.isTruncated())
        out << QCoreApplication::translate("main", " (truncated)");
    out << Qt::endl;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("psearch"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Search and replace text across a project tree."));
    parser.addHelpOption();
    QCommandLineOption caseSensitiveOption(QStringList{"s", "case-sensitive"}, QCoreApplication::translate("main", "Match case."));
    QCommandLineOption regexOption(QStringList{"E", "regex"}, QCoreApplication::translate("main", "Treat the query as an extended regular expression."));
    QCommandLineOption wordOption(QStringList{"w", "word"}, QCoreApplication::translate("main", "Match whole words only."));
    QCommandLineOption filterOption(QStringList{"f", "filter"},
                                    QCoreApplication::translate("main", "Comma separated globs or directories to search."),
                                    QCoreApplication::translate("main", "patterns"));
    QCommandLineOption replaceOption(QStringList{"r", "replace"},
                                     QCoreApplication::translate("main", "Replace every match with <text>."),
                                     QCoreApplication::translate("main", "text"));
    QCommandLineOption configOption(QStringList{"c", "config"},
                                    QCoreApplication::translate("main", "Read settings from <file> instead of projectsearchrc."),
                                    QCoreApplication::translate("main", "file"));
    parser.addOptions({caseSensitiveOption, regexOption, wordOption, filterOption, replaceOption, configOption});
    parser.addPositionalArgument(QStringLiteral("query"), QCoreApplication::translate("main", "Text to search for."));
    parser.addPositionalArgument(QStringLiteral("root"), QCoreApplication::translate("main", "Project directory, defaults to the current one."), QStringLiteral("[root]"));
    parser.process(app);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty() || positional.size() > 2)
        parser.showHelp(SearchFailed);

    auto settings = parser.isSet(configOption)
        ? SearchSettings::load(KSharedConfig::openConfig(QFileInfo(parser.value(configOption)).absoluteFilePath(), KConfig::SimpleConfig))
        : SearchSettings::loadDefault();

    ProjectSearchModel model(settings);
    model.setQuery(positional.at(0));
    model.setCaseSensitive(parser.isSet(caseSensitiveOption));
    model.setUseRegex(parser.isSet(regexOption));
    model.setWholeWord(parser.isSet(wordOption));
    model.setFileFilter(parser.value(filterOption));
    model.setReplaceText(parser.value(replaceOption));

    QTextStream out(stdout);
    QTextStream err(stderr);
    const bool replacing = parser.isSet(replaceOption);
    bool replaceDone = false;

    QObject::connect(&model, &ProjectSearchModel::searchFinished, &app, [&] {
        if (!model.regexError().isEmpty()) {
            err << QCoreApplication::translate("main", "Invalid pattern: %1").arg(model.regexError()) << Qt::endl;
            app.exit(SearchFailed);
            return;
        }
        if (!model.unavailableReason().isEmpty()) {
            err << QCoreApplication::translate("main", "Search unavailable: %1").arg(model.unavailableReason()) << Qt::endl;
            app.exit(SearchFailed);
            return;
        }
        printResults(out, model);
        if (replacing && !replaceDone && model.totalMatches() > 0) {
            model.replaceAll();
            return;
        }
        app.exit(model.totalMatches() > 0 || replaceDone ? MatchesFound : NoMatches);
    });
    QObject::connect(&model, &ProjectSearchModel::replaceFinished, &app, [&](const ReplaceOutcome &outcome) {
        replaceDone = true;
        out << QCoreApplication::translate("main", "Replaced %1 occurrences in %2 files").arg(outcome.replacementsCount).arg(outcome.filesChanged)
            << Qt::endl;
        // A successful replace triggers a rescan that reports the remaining matches.
        if (outcome.replacementsCount == 0)
            app.exit(NoMatches);
    });

    const auto root = positional.size() > 1 ? positional.at(1) : QDir::currentPath();
    model.setRootDirectory(root);
    if (model.query().trimmed().isEmpty())
        return NoMatches;
    return app.exec();
}
