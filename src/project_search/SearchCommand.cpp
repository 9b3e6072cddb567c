#include "SearchCommand.hpp"
#include "ProjectSearchDebug.hpp"
#include "SearchBackend.hpp"

static constexpr int PollInterval = 100;

QString SearchCommand::Result::firstErrorLine() const
{
    if (!stdErr)
        return QString();
    auto text = stdErr->trimmed();
    auto newline = text.indexOf(QLatin1Char('\n'));
    return newline < 0 ? text : text.left(newline).trimmed();
}

SearchCommand::SearchCommand(QObject *parent)
    : QProcess(parent)
{
    setProcessChannelMode(QProcess::SeparateChannels);
    setStandardInputFile(QProcess::nullDevice());
}

SearchCommand::~SearchCommand()
{
    ensureStopped();
}

void SearchCommand::setAbortCheck(AbortCheck check)
{
    m_abortCheck = std::move(check);
}

void SearchCommand::ensureStopped()
{
    if (state() != NotRunning) {
        kill();
        waitForFinished();
    }
}

bool SearchCommand::abortRequested() const
{
    return m_abortCheck && m_abortCheck();
}

void SearchCommand::drain()
{
    m_stdOut += readAllStandardOutput();
    m_stdErr += readAllStandardError();
}

SearchCommand::Result SearchCommand::run(const SearchBackend &backend, const SearchOptions &options, const QString &dir)
{
    return run(backend.program(), backend.arguments(options), dir);
}

SearchCommand::Result SearchCommand::run(const QString &program, const QStringList &args, const QString &dir)
{
    ensureStopped();
    m_stdOut.clear();
    m_stdErr.clear();

    qCDebug(PROJECTSEARCH_LOG) << "Running" << program << args << "in" << dir;
    setWorkingDirectory(dir);
    start(program, args, QIODevice::ReadOnly);
    if (!waitForStarted()) {
        qCWarning(PROJECTSEARCH_LOG) << "Failed to start" << program << ":" << errorString();
        return {std::nullopt, errorString(), FailedToStart};
    }

    while (state() != NotRunning) {
        if (abortRequested()) {
            qCDebug(PROJECTSEARCH_LOG) << "Aborting" << program;
            kill();
            waitForFinished();
            drain();
            return {QString::fromUtf8(m_stdOut), QString::fromUtf8(m_stdErr), Aborted};
        }
        // Returns false on timeout and when the child exits; in both cases keep polling.
        if (!waitForReadyRead(PollInterval) && state() != NotRunning)
            waitForFinished(PollInterval);
        drain();
    }
    drain();

    Result result{QString::fromUtf8(m_stdOut), QString::fromUtf8(m_stdErr), exitCode()};
    if (exitStatus() == CrashExit) {
        qCWarning(PROJECTSEARCH_LOG) << program << "crashed";
        result.exitCode = Crashed;
    }
    return result;
}
