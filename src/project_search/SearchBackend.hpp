#pragma once

#include "SearchOptions.hpp"
#include "SearchSettings.hpp"

#include <QStringList>

#include <memory>

class SearchBackend
{
public:
    enum Kind {
        VersionedTree,
        PlainFilesystem,
    };

    explicit SearchBackend(const SearchSettings &settings)
        : m_settings(settings)
    {
    }
    virtual ~SearchBackend() = default;

    virtual Kind kind() const = 0;
    virtual QString program() const = 0;
    virtual QStringList arguments(const SearchOptions &options) const = 0;

    // 0 means matches found, 1 means none; both are successful scans.
    virtual bool isSuccessExit(int exitCode) const
    {
        return exitCode == 0 || exitCode == 1;
    }

    static std::unique_ptr<SearchBackend> create(Kind kind, const SearchSettings &settings);

protected:
    SearchSettings m_settings;
};

class GitGrepBackend : public SearchBackend
{
public:
    using SearchBackend::SearchBackend;

    Kind kind() const override
    {
        return VersionedTree;
    }
    QString program() const override;
    QStringList arguments(const SearchOptions &options) const override;
};

class GrepBackend : public SearchBackend
{
public:
    using SearchBackend::SearchBackend;

    Kind kind() const override
    {
        return PlainFilesystem;
    }
    QString program() const override;
    QStringList arguments(const SearchOptions &options) const override;
};
