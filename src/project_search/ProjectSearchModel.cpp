#include "ProjectSearchModel.hpp"
#include "ProjectSearchDebug.hpp"
#include "ReplaceEngine.hpp"

#include <QDir>
#include <QFileInfo>

ProjectSearchModel::ProjectSearchModel(const SearchSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_vcsDetector(&ProjectSearchModel::isGitWorkTree)
    , m_worker(new SearchWorker(settings))
{
    qRegisterMetaType<ScanResult>();
    qRegisterMetaType<ReplaceOutcome>();
    qRegisterMetaType<SearchFileResult>();

    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(m_settings.debounceInterval);
    connect(&m_debounceTimer, &QTimer::timeout, this, &ProjectSearchModel::startSearch);

    m_thread.setObjectName(QStringLiteral("ProjectSearchWorker"));
    m_worker->moveToThread(&m_thread);
    connect(&m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
    connect(m_worker, &SearchWorker::scanFinished, this, &ProjectSearchModel::applyScanResult);
    connect(m_worker, &SearchWorker::replaceFinished, this, &ProjectSearchModel::applyReplaceOutcome);
    m_thread.start();
}

ProjectSearchModel::~ProjectSearchModel()
{
    m_worker->abort();
    m_thread.quit();
    m_thread.wait();
}

const SearchSettings &ProjectSearchModel::settings() const
{
    return m_settings;
}

QString ProjectSearchModel::rootDirectory() const
{
    return m_rootDir;
}

const SearchOptions &ProjectSearchModel::options() const
{
    return m_options;
}

QString ProjectSearchModel::query() const
{
    return m_options.query;
}

bool ProjectSearchModel::caseSensitive() const
{
    return m_options.caseSensitive;
}

bool ProjectSearchModel::useRegex() const
{
    return m_options.useRegex;
}

bool ProjectSearchModel::wholeWord() const
{
    return m_options.wholeWord;
}

QString ProjectSearchModel::fileFilter() const
{
    return m_options.fileFilter;
}

QString ProjectSearchModel::replaceText() const
{
    return m_replaceText;
}

SearchFileResults ProjectSearchModel::results() const
{
    return m_results;
}

int ProjectSearchModel::totalMatches() const
{
    return m_totalMatches;
}

bool ProjectSearchModel::isSearching() const
{
    return m_searching;
}

bool ProjectSearchModel::isTruncated() const
{
    return m_truncated;
}

QString ProjectSearchModel::regexError() const
{
    return m_regexError;
}

QString ProjectSearchModel::unavailableReason() const
{
    return m_unavailableReason;
}

bool ProjectSearchModel::isReplacing() const
{
    return m_pendingReplaces > 0;
}

std::optional<ReplaceOutcome> ProjectSearchModel::lastReplaceResult() const
{
    return m_lastReplaceResult;
}

quint64 ProjectSearchModel::generation() const
{
    return m_generation;
}

void ProjectSearchModel::setVcsDetector(VcsDetector detector)
{
    m_vcsDetector = detector ? std::move(detector) : VcsDetector(&ProjectSearchModel::isGitWorkTree);
}

bool ProjectSearchModel::isGitWorkTree(const QString &rootDir)
{
    // .git is a file for worktrees and submodules.
    return !rootDir.isEmpty() && QFileInfo::exists(QDir(rootDir).filePath(QStringLiteral(".git")));
}

void ProjectSearchModel::setRootDirectory(const QString &rootDir)
{
    m_rootDir = rootDir.isEmpty() ? QString() : QDir::cleanPath(QDir(rootDir).absolutePath());
    m_rootEpoch++;
    qCDebug(PROJECTSEARCH_LOG) << "Search root set to" << m_rootDir;
    emit rootDirectoryChanged(m_rootDir);

    resetResults();
    if (m_lastReplaceResult) {
        m_lastReplaceResult.reset();
        emit lastReplaceResultChanged();
    }
    // Scans right away when a query is set, otherwise just invalidates running scans.
    startSearch();
}

void ProjectSearchModel::closeRootDirectory()
{
    setRootDirectory(QString());
}

void ProjectSearchModel::setQuery(const QString &query)
{
    if (m_options.query == query)
        return;
    m_options.query = query;
    emit queryChanged(query);
    emit searchOptionsChanged();
    scheduleSearch();
}

void ProjectSearchModel::setCaseSensitive(bool newValue)
{
    if (m_options.caseSensitive == newValue)
        return;
    m_options.caseSensitive = newValue;
    emit searchOptionsChanged();
    scheduleSearch();
}

void ProjectSearchModel::setUseRegex(bool newValue)
{
    if (m_options.useRegex == newValue)
        return;
    m_options.useRegex = newValue;
    emit searchOptionsChanged();
    scheduleSearch();
}

void ProjectSearchModel::setWholeWord(bool newValue)
{
    if (m_options.wholeWord == newValue)
        return;
    m_options.wholeWord = newValue;
    emit searchOptionsChanged();
    scheduleSearch();
}

void ProjectSearchModel::setFileFilter(const QString &filter)
{
    if (m_options.fileFilter == filter)
        return;
    m_options.fileFilter = filter;
    emit searchOptionsChanged();
    scheduleSearch();
}

void ProjectSearchModel::setReplaceText(const QString &text)
{
    if (m_replaceText == text)
        return;
    m_replaceText = text;
    emit replaceTextChanged(text);
}

void ProjectSearchModel::scheduleSearch()
{
    m_debounceTimer.start();
}

void ProjectSearchModel::refreshSearch()
{
    startSearch();
}

void ProjectSearchModel::startSearch()
{
    m_debounceTimer.stop();
    m_generation++;

    const auto query = m_options.trimmedQuery();
    if (query.isEmpty() || m_rootDir.isEmpty()) {
        resetResults();
        return;
    }

    ScanRequest request;
    request.generation = m_generation;
    request.rootDir = m_rootDir;
    request.options = m_options;
    request.options.query = query;
    request.backend = m_vcsDetector(m_rootDir) ? SearchBackend::VersionedTree : SearchBackend::PlainFilesystem;

    qCDebug(PROJECTSEARCH_LOG) << "Dispatching scan" << request.generation << "for" << query
                               << (request.backend == SearchBackend::VersionedTree ? "with git grep" : "with grep");
    setRegexError(QString());
    setSearching(true);
    QMetaObject::invokeMethod(
        m_worker,
        [worker = m_worker, request] {
            worker->scan(request);
        },
        Qt::QueuedConnection);
}

void ProjectSearchModel::applyScanResult(const ScanResult &result)
{
    if (result.generation != m_generation) {
        qCDebug(PROJECTSEARCH_LOG) << "Dropping stale scan" << result.generation << "current is" << m_generation;
        return;
    }

    setRegexError(result.regexError);
    setUnavailableReason(result.unavailableReason);
    if (!result.regexError.isEmpty())
        setResults({}, false);
    else
        setResults(result.results, result.truncated);
    setSearching(false);
    emit searchFinished();
}

void ProjectSearchModel::clear()
{
    m_debounceTimer.stop();
    m_generation++;

    m_options.query.clear();
    m_options.fileFilter.clear();
    m_replaceText.clear();
    m_results.clear();
    m_totalMatches = 0;
    m_truncated = false;
    m_searching = false;
    m_regexError.clear();
    m_unavailableReason.clear();
    m_lastReplaceResult.reset();

    emit queryChanged(m_options.query);
    emit searchOptionsChanged();
    emit replaceTextChanged(m_replaceText);
    emit resultsChanged();
    emit searchingChanged(false);
    emit regexErrorChanged(m_regexError);
    emit unavailableReasonChanged(m_unavailableReason);
    emit lastReplaceResultChanged();
}

void ProjectSearchModel::replaceInFile(const SearchFileResult &fileResult)
{
    if (m_options.trimmedQuery().isEmpty() || m_rootDir.isEmpty())
        return;
    if (!ReplaceEngine::isInsideRoot(fileResult.path, m_rootDir)) {
        qCWarning(PROJECTSEARCH_LOG) << "Refusing to replace in" << fileResult.path << "outside of" << m_rootDir;
        return;
    }
    dispatchReplace({fileResult});
}

void ProjectSearchModel::replaceAll()
{
    if (m_options.trimmedQuery().isEmpty() || m_rootDir.isEmpty())
        return;
    dispatchReplace(m_results);
}

void ProjectSearchModel::dispatchReplace(const SearchFileResults &files)
{
    ReplaceRequest request;
    request.rootEpoch = m_rootEpoch;
    request.rootDir = m_rootDir;
    request.options = m_options;
    request.options.query = m_options.trimmedQuery();
    request.replacement = m_replaceText;
    request.files = files;

    qCDebug(PROJECTSEARCH_LOG) << "Dispatching replace of" << request.options.query << "in" << files.size() << "files";
    m_pendingReplaces++;
    if (m_pendingReplaces == 1)
        emit replacingChanged(true);
    QMetaObject::invokeMethod(
        m_worker,
        [worker = m_worker, request] {
            worker->replace(request);
        },
        Qt::QueuedConnection);
}

void ProjectSearchModel::applyReplaceOutcome(quint64 rootEpoch, const ReplaceOutcome &outcome)
{
    if (m_pendingReplaces > 0 && --m_pendingReplaces == 0)
        emit replacingChanged(false);

    if (rootEpoch != m_rootEpoch) {
        qCDebug(PROJECTSEARCH_LOG) << "Ignoring replace outcome for a previous root";
        return;
    }

    m_lastReplaceResult = outcome;
    emit lastReplaceResultChanged();
    emit replaceFinished(outcome);
    if (outcome.replacementsCount > 0)
        refreshSearch();
}

void ProjectSearchModel::resetResults()
{
    setResults({}, false);
    setRegexError(QString());
    setUnavailableReason(QString());
    setSearching(false);
}

void ProjectSearchModel::setResults(const SearchFileResults &results, bool truncated)
{
    if (results.isEmpty() && m_results.isEmpty() && m_truncated == truncated)
        return;
    m_results = results;
    m_totalMatches = countMatches(m_results);
    m_truncated = truncated;
    emit resultsChanged();
}

void ProjectSearchModel::setSearching(bool searching)
{
    if (m_searching == searching)
        return;
    m_searching = searching;
    emit searchingChanged(searching);
}

void ProjectSearchModel::setRegexError(const QString &error)
{
    if (m_regexError == error)
        return;
    m_regexError = error;
    emit regexErrorChanged(error);
}

void ProjectSearchModel::setUnavailableReason(const QString &reason)
{
    if (m_unavailableReason == reason)
        return;
    m_unavailableReason = reason;
    emit unavailableReasonChanged(reason);
}
