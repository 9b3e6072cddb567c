#pragma once

#include <QString>
#include <QStringList>

#include <KSharedConfig>

class KConfigGroup;

struct SearchSettings {
    int debounceInterval = 300;
    int maxResults = 1000;
    int maxMatchesPerFile = 50;
    QStringList excludedDirectories = {
        QStringLiteral(".git"),
        QStringLiteral(".build"),
        QStringLiteral("node_modules"),
        QStringLiteral(".swiftpm"),
    };
    QString gitExecutable = QStringLiteral("git");
    QString grepExecutable = QStringLiteral("grep");
    bool searchUntracked = true;

    static SearchSettings load(const KConfigGroup &group);
    static SearchSettings load(const KSharedConfigPtr &config);
    static SearchSettings loadDefault();

    void save(KConfigGroup &group) const;
};
