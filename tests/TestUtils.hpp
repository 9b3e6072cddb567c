#pragma once

#include "SearchResult.hpp"

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QSignalSpy>
#include <QStandardPaths>

#include <ostream>

inline void PrintTo(const QString &str, std::ostream *os)
{
    *os << '"' << str.toStdString() << '"';
}

inline bool writeFile(const QString &path, const QByteArray &content)
{
    QFileInfo(path).dir().mkpath(QStringLiteral("."));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(content) == content.size();
}

inline QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}

inline bool hasExecutable(const QString &name)
{
    return !QStandardPaths::findExecutable(name).isEmpty();
}

inline bool runGit(const QString &dir, const QStringList &args)
{
    QProcess git;
    git.setWorkingDirectory(dir);
    git.start(QStringLiteral("git"), args);
    return git.waitForFinished(10000) && git.exitStatus() == QProcess::NormalExit && git.exitCode() == 0;
}

inline const SearchFileResult *findFile(const SearchFileResults &results, const QString &relativePath)
{
    for (const auto &file : results) {
        if (file.relativePath == relativePath)
            return &file;
    }
    return nullptr;
}

inline bool waitForSignals(QSignalSpy &spy, int count, int timeout = 10000)
{
    while (spy.count() < count) {
        if (!spy.wait(timeout))
            return false;
    }
    return true;
}
