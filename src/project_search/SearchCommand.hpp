#pragma once

#include <QProcess>

#include <functional>
#include <optional>

class SearchBackend;
struct SearchOptions;

class SearchCommand : public QProcess
{
    Q_OBJECT
public:
    enum SentinelExitCode {
        FailedToStart = -1,
        Crashed = -2,
        Aborted = -3,
    };

    struct Result {
        std::optional<QString> stdOut;
        std::optional<QString> stdErr;
        int exitCode = FailedToStart;

        bool started() const
        {
            return exitCode != FailedToStart;
        }
        QString firstErrorLine() const;
    };

    using AbortCheck = std::function<bool()>;

    explicit SearchCommand(QObject *parent = nullptr);
    ~SearchCommand();

    void setAbortCheck(AbortCheck check);

    // Blocks until the backend exits. Both output channels are drained while the
    // child runs so it can never stall on a full pipe.
    Result run(const SearchBackend &backend, const SearchOptions &options, const QString &dir);
    Result run(const QString &program, const QStringList &args, const QString &dir);

private:
    using QProcess::setArguments;
    using QProcess::setProgram;
    using QProcess::start;
    using QProcess::startCommand;

    void ensureStopped();
    bool abortRequested() const;
    void drain();

    QByteArray m_stdOut;
    QByteArray m_stdErr;
    AbortCheck m_abortCheck;
};
