#include "SessionStore.hpp"
#include "Errors.hpp"
#include <sqlite3.h>

using namespace std;

namespace {

const char* kCreateTable = R"(
    CREATE TABLE IF NOT EXISTS analytics (
        stream_url    TEXT,
        object_type   TEXT,
        direction1    INTEGER,
        direction2    INTEGER,
        total         INTEGER,
        session_start TEXT,
        session_end   TEXT,
        PRIMARY KEY (stream_url, session_start)
    ))";

const char* kUpsert = R"(
    INSERT INTO analytics (stream_url, object_type, direction1, direction2,
                           total, session_start, session_end)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(stream_url, session_start) DO UPDATE SET
        object_type = excluded.object_type,
        direction1  = excluded.direction1,
        direction2  = excluded.direction2,
        total       = excluded.total,
        session_end = excluded.session_end)";

const char* kSelectAll =
    "SELECT stream_url, object_type, direction1, direction2, total, session_start, session_end "
    "FROM analytics ORDER BY rowid DESC";

const char* kSelectStream =
    "SELECT stream_url, object_type, direction1, direction2, total, session_start, session_end "
    "FROM analytics WHERE stream_url = ? ORDER BY rowid DESC";

const char* kSelectUrls = "SELECT DISTINCT stream_url FROM analytics ORDER BY stream_url";

// Finalizes the statement on every exit path
struct Statement
{
    Statement(sqlite3* db, const char* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            throw PersistenceError(string("prepare failed: ") + sqlite3_errmsg(db));
    }
    ~Statement() { sqlite3_finalize(stmt); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* stmt = nullptr;
};

string column_text(sqlite3_stmt* stmt, int col)
{
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

} // namespace

SessionStore::SessionStore(const string& path)
    : path_(path), db_(nullptr, &sqlite3_close)
{
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    db_.reset(raw);
    if (rc != SQLITE_OK) {
        string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
        throw PersistenceError("cannot open " + path + ": " + msg);
    }
    sqlite3_busy_timeout(raw, 2000);
    exec(kCreateTable);
}

void SessionStore::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
        string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw PersistenceError(msg);
    }
}

void SessionStore::upsert(const SessionSnapshot& s)
{
    Statement st(db_.get(), kUpsert);
    const string start = format_session_time(s.session_start);
    const string end   = format_session_time(s.session_end);

    sqlite3_bind_text(st.stmt, 1, s.stream_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 2, s.object_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st.stmt, 3, s.dir1);
    sqlite3_bind_int(st.stmt, 4, s.dir2);
    sqlite3_bind_int(st.stmt, 5, s.total);
    sqlite3_bind_text(st.stmt, 6, start.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 7, end.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.stmt) != SQLITE_DONE)
        throw PersistenceError(string("upsert failed: ") + sqlite3_errmsg(db_.get()));
}

vector<StoredSession> SessionStore::query(const char* sql, const string* stream_url) const
{
    Statement st(db_.get(), sql);
    if (stream_url)
        sqlite3_bind_text(st.stmt, 1, stream_url->c_str(), -1, SQLITE_TRANSIENT);

    vector<StoredSession> rows;
    int rc;
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
        StoredSession r;
        r.stream_url    = column_text(st.stmt, 0);
        r.object_type   = column_text(st.stmt, 1);
        r.direction1    = sqlite3_column_int(st.stmt, 2);
        r.direction2    = sqlite3_column_int(st.stmt, 3);
        r.total         = sqlite3_column_int(st.stmt, 4);
        r.session_start = column_text(st.stmt, 5);
        r.session_end   = column_text(st.stmt, 6);
        rows.push_back(move(r));
    }
    if (rc != SQLITE_DONE)
        throw PersistenceError(string("query failed: ") + sqlite3_errmsg(db_.get()));
    return rows;
}

vector<StoredSession> SessionStore::sessions() const
{
    return query(kSelectAll, nullptr);
}

vector<StoredSession> SessionStore::sessions(const string& stream_url) const
{
    return query(kSelectStream, &stream_url);
}

vector<string> SessionStore::stream_urls() const
{
    Statement st(db_.get(), kSelectUrls);
    vector<string> urls;
    int rc;
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW)
        urls.push_back(column_text(st.stmt, 0));
    if (rc != SQLITE_DONE)
        throw PersistenceError(string("query failed: ") + sqlite3_errmsg(db_.get()));
    return urls;
}
