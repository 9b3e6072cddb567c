#pragma once

#include "SearchOptions.hpp"
#include "SearchResult.hpp"
#include "SearchSettings.hpp"
#include "SearchWorker.hpp"

#include <QObject>
#include <QThread>
#include <QTimer>

#include <functional>
#include <optional>

/**
 * Project wide search and replace state.
 *
 * Option setters restart a debounce timer; when it fires the current options are
 * scanned on a single background thread. Every scan gets a new generation number
 * and only the result of the latest generation is published, so slow scans that
 * were superseded are dropped instead of overwriting newer results.
 *
 * All state changes happen on the thread owning the model and are announced
 * through the change signals below.
 */
class ProjectSearchModel : public QObject
{
    Q_OBJECT
public:
    using VcsDetector = std::function<bool(const QString &rootDir)>;

    explicit ProjectSearchModel(const SearchSettings &settings = SearchSettings(), QObject *parent = nullptr);
    ~ProjectSearchModel() override;

    const SearchSettings &settings() const;
    QString rootDirectory() const;

    const SearchOptions &options() const;
    QString query() const;
    bool caseSensitive() const;
    bool useRegex() const;
    bool wholeWord() const;
    QString fileFilter() const;
    QString replaceText() const;

    SearchFileResults results() const;
    int totalMatches() const;
    bool isSearching() const;
    bool isTruncated() const;
    QString regexError() const;
    QString unavailableReason() const;
    bool isReplacing() const;
    std::optional<ReplaceOutcome> lastReplaceResult() const;
    quint64 generation() const;

    // Decides between git grep and plain grep for a root. Defaults to isGitWorkTree().
    void setVcsDetector(VcsDetector detector);
    static bool isGitWorkTree(const QString &rootDir);

public slots:
    void setRootDirectory(const QString &rootDir);
    void closeRootDirectory();

    void setQuery(const QString &query);
    void setCaseSensitive(bool newValue);
    void setUseRegex(bool newValue);
    void setWholeWord(bool newValue);
    void setFileFilter(const QString &filter);
    void setReplaceText(const QString &text);

    void refreshSearch();
    void clear();

    void replaceInFile(const SearchFileResult &fileResult);
    void replaceAll();

signals:
    void queryChanged(const QString &query);
    void searchOptionsChanged();
    void replaceTextChanged(const QString &text);
    void rootDirectoryChanged(const QString &rootDir);
    void resultsChanged();
    void searchingChanged(bool searching);
    void regexErrorChanged(const QString &error);
    void unavailableReasonChanged(const QString &reason);
    void replacingChanged(bool replacing);
    void lastReplaceResultChanged();
    void searchFinished();
    void replaceFinished(const ReplaceOutcome &outcome);

private slots:
    void startSearch();
    void applyScanResult(const ScanResult &result);
    void applyReplaceOutcome(quint64 rootEpoch, const ReplaceOutcome &outcome);

private:
    void scheduleSearch();
    void resetResults();
    void setResults(const SearchFileResults &results, bool truncated);
    void setSearching(bool searching);
    void setRegexError(const QString &error);
    void setUnavailableReason(const QString &reason);
    void dispatchReplace(const SearchFileResults &files);

    SearchSettings m_settings;
    SearchOptions m_options;
    QString m_replaceText;
    QString m_rootDir;
    VcsDetector m_vcsDetector;

    quint64 m_generation = 0;
    quint64 m_rootEpoch = 0;
    SearchFileResults m_results;
    int m_totalMatches = 0;
    bool m_truncated = false;
    bool m_searching = false;
    QString m_regexError;
    QString m_unavailableReason;
    int m_pendingReplaces = 0;
    std::optional<ReplaceOutcome> m_lastReplaceResult;

    QTimer m_debounceTimer;
    QThread m_thread;
    SearchWorker *m_worker = nullptr;
};
