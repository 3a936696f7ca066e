#pragma once
#include "SessionAggregator.hpp"
#include <memory>
#include <string>
#include <vector>

struct sqlite3;

/** Where session snapshots go. upsert() throws PersistenceError on failure. */
class SnapshotSink
{
public:
    virtual ~SnapshotSink() = default;
    virtual void upsert(const SessionSnapshot& snapshot) = 0;
};

struct StoredSession
{
    std::string stream_url;
    std::string object_type;
    int         direction1 = 0;
    int         direction2 = 0;
    int         total      = 0;
    std::string session_start;
    std::string session_end;
};

/** SQLite `analytics` table, one row per (stream_url, session_start). */
class SessionStore : public SnapshotSink
{
public:
    explicit SessionStore(const std::string& path);

    void upsert(const SessionSnapshot& snapshot) override;

    /** Newest session first. */
    std::vector<StoredSession> sessions() const;
    std::vector<StoredSession> sessions(const std::string& stream_url) const;

    std::vector<std::string> stream_urls() const;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);
    std::vector<StoredSession> query(const char* sql, const std::string* stream_url) const;

    std::string path_;
    std::unique_ptr<sqlite3, int (*)(sqlite3*)> db_;
};
