#include "SearchSettings.hpp"
#include "ProjectSearchDebug.hpp"

#include <KConfigGroup>

static const char SettingsGroup[] = "Search";

static int readPositive(const KConfigGroup &group, const char *key, int fallback)
{
    auto value = group.readEntry(key, fallback);
    if (value <= 0) {
        qCWarning(PROJECTSEARCH_LOG) << "Ignoring non-positive" << key << value;
        return fallback;
    }
    return value;
}

SearchSettings SearchSettings::load(const KConfigGroup &group)
{
    SearchSettings defaults;
    SearchSettings settings;
    // 0 is a valid debounce: scan on the next event loop iteration.
    settings.debounceInterval = qMax(0, group.readEntry("DebounceInterval", defaults.debounceInterval));
    settings.maxResults = readPositive(group, "MaxResults", defaults.maxResults);
    settings.maxMatchesPerFile = readPositive(group, "MaxMatchesPerFile", defaults.maxMatchesPerFile);
    settings.excludedDirectories = group.readEntry("ExcludedDirectories", defaults.excludedDirectories);
    settings.gitExecutable = group.readEntry("GitExecutable", defaults.gitExecutable);
    settings.grepExecutable = group.readEntry("GrepExecutable", defaults.grepExecutable);
    settings.searchUntracked = group.readEntry("SearchUntracked", defaults.searchUntracked);

    if (settings.gitExecutable.isEmpty())
        settings.gitExecutable = defaults.gitExecutable;
    if (settings.grepExecutable.isEmpty())
        settings.grepExecutable = defaults.grepExecutable;
    return settings;
}

SearchSettings SearchSettings::load(const KSharedConfigPtr &config)
{
    return load(KConfigGroup(config, QString::fromLatin1(SettingsGroup)));
}

SearchSettings SearchSettings::loadDefault()
{
    return load(KSharedConfig::openConfig(QStringLiteral("projectsearchrc")));
}

void SearchSettings::save(KConfigGroup &group) const
{
    group.writeEntry("DebounceInterval", debounceInterval);
    group.writeEntry("MaxResults", maxResults);
    group.writeEntry("MaxMatchesPerFile", maxMatchesPerFile);
    group.writeEntry("ExcludedDirectories", excludedDirectories);
    group.writeEntry("GitExecutable", gitExecutable);
    group.writeEntry("GrepExecutable", grepExecutable);
    group.writeEntry("SearchUntracked", searchUntracked);
}
