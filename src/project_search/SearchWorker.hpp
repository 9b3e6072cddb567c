#pragma once

#include "SearchBackend.hpp"
#include "SearchOptions.hpp"
#include "SearchResult.hpp"
#include "SearchSettings.hpp"

#include <QObject>

#include <atomic>

class SearchCommand;

struct ScanRequest {
    quint64 generation = 0;
    QString rootDir;
    SearchOptions options;
    SearchBackend::Kind backend = SearchBackend::PlainFilesystem;
};

struct ScanResult {
    quint64 generation = 0;
    SearchFileResults results;
    int totalMatches = 0;
    bool truncated = false;
    QString regexError;
    QString unavailableReason;
};

struct ReplaceRequest {
    quint64 rootEpoch = 0;
    QString rootDir;
    SearchOptions options;
    QString replacement;
    SearchFileResults files;
};

Q_DECLARE_METATYPE(ScanResult)

// Lives on the search thread; every job runs to completion before the next starts.
class SearchWorker : public QObject
{
    Q_OBJECT
public:
    explicit SearchWorker(const SearchSettings &settings, QObject *parent = nullptr);

    // Thread-safe. Kills a running backend and turns pending jobs into no-ops.
    void abort();

public slots:
    void scan(const ScanRequest &request);
    void replace(const ReplaceRequest &request);

signals:
    void scanFinished(const ScanResult &result);
    void replaceFinished(quint64 rootEpoch, const ReplaceOutcome &outcome);

private:
    ScanResult interpret(const ScanRequest &request, const SearchBackend &backend, SearchCommand &command) const;

    SearchSettings m_settings;
    std::atomic<bool> m_aborted{false};
};
