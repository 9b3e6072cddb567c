#include "SearchWorker.hpp"
#include "GrepOutputParser.hpp"
#include "ProjectSearchDebug.hpp"
#include "ReplaceEngine.hpp"
#include "SearchCommand.hpp"

SearchWorker::SearchWorker(const SearchSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
{
}

void SearchWorker::abort()
{
    m_aborted = true;
}

void SearchWorker::scan(const ScanRequest &request)
{
    if (m_aborted)
        return;

    SearchCommand command;
    command.setAbortCheck([this] {
        return m_aborted.load();
    });

    auto backend = SearchBackend::create(request.backend, m_settings);
    auto result = interpret(request, *backend, command);
    if (m_aborted)
        return;
    emit scanFinished(result);
}

ScanResult SearchWorker::interpret(const ScanRequest &request, const SearchBackend &backend, SearchCommand &command) const
{
    ScanResult result;
    result.generation = request.generation;

    const SearchBackend *active = &backend;
    std::unique_ptr<SearchBackend> fallback;
    auto output = command.run(*active, request.options, request.rootDir);
    if (!output.started() && active->kind() == SearchBackend::VersionedTree) {
        qCWarning(PROJECTSEARCH_LOG) << "Falling back to plain grep:" << output.firstErrorLine();
        fallback = SearchBackend::create(SearchBackend::PlainFilesystem, m_settings);
        active = fallback.get();
        output = command.run(*active, request.options, request.rootDir);
    }
    if (output.exitCode == SearchCommand::Aborted)
        return result;

    const bool success = active->isSuccessExit(output.exitCode);
    const auto errorLine = output.firstErrorLine();
    if (!success && request.options.useRegex && output.exitCode >= 0 && !errorLine.isEmpty()) {
        qCDebug(PROJECTSEARCH_LOG) << "Pattern rejected:" << errorLine;
        result.regexError = errorLine;
        return result;
    }

    GrepOutputParser parser(request.rootDir);
    result.results = parser.parse(output.stdOut.value_or(QString()));
    result.truncated = GrepOutputParser::truncate(result.results, m_settings.maxResults);
    result.totalMatches = countMatches(result.results);

    if (!success && result.results.isEmpty()) {
        result.unavailableReason = errorLine.isEmpty() ? QStringLiteral("%1 exited with code %2").arg(active->program()).arg(output.exitCode) : errorLine;
        qCWarning(PROJECTSEARCH_LOG) << "Search unavailable:" << result.unavailableReason;
    }
    qCDebug(PROJECTSEARCH_LOG) << "Scan" << request.generation << "found" << result.totalMatches << "matches in" << result.results.size() << "files";
    return result;
}

void SearchWorker::replace(const ReplaceRequest &request)
{
    if (m_aborted)
        return;
    ReplaceEngine engine(request.options, request.replacement);
    auto outcome = engine.replaceInFiles(request.files, request.rootDir);
    emit replaceFinished(request.rootEpoch, outcome);
}
