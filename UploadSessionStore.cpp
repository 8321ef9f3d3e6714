#include "UploadSessionStore.h"
#include "Clock.h"
#include "SqliteDatabase.h"
#include "logger.h"

UploadSessionStore::UploadSessionStore(SqliteDatabase& database, const Clock& clk)
    : db(database),
      clock(clk)
{
}

UploadSessionStore::~UploadSessionStore()
{
}

bool UploadSessionStore::initialize()
{
    return db.exec(
        "CREATE TABLE IF NOT EXISTS upload_sessions ("
        "  fingerprint TEXT PRIMARY KEY,"
        "  resource    TEXT NOT NULL,"
        "  progress    INTEGER NOT NULL DEFAULT 0,"
        "  updated_at  INTEGER NOT NULL"
        ");");
}

bool UploadSessionStore::find(const std::string& fingerprint, std::string& resource_out)
{
    int64_t progress = 0;
    return find(fingerprint, resource_out, progress);
}

bool UploadSessionStore::find(const std::string& fingerprint, std::string& resource_out,
                              int64_t& progress_out)
{
    SqliteStatement stmt(db, "SELECT resource, progress FROM upload_sessions WHERE fingerprint = ?");
    if (!stmt.bind_text(1, fingerprint)) {
        return false;
    }
    if (stmt.step() != SQLITE_ROW) {
        return false;
    }
    resource_out = stmt.column_text(0);
    progress_out = stmt.column_int64(1);
    return !resource_out.empty();
}

bool UploadSessionStore::save(const std::string& fingerprint, const std::string& resource,
                              int64_t progress)
{
    SqliteStatement stmt(db,
        "INSERT INTO upload_sessions (fingerprint, resource, progress, updated_at) VALUES (?, ?, ?, ?)"
        " ON CONFLICT(fingerprint) DO UPDATE SET resource = excluded.resource,"
        " progress = excluded.progress, updated_at = excluded.updated_at");
    bool ok = stmt.bind_text(1, fingerprint) &&
              stmt.bind_text(2, resource) &&
              stmt.bind_int64(3, progress) &&
              stmt.bind_int64(4, clock.now_ms()) &&
              stmt.step() == SQLITE_DONE;
    if (!ok) {
        LOG_WARN_CTX("upload_sessions", "Cannot remember %s: %s", fingerprint.c_str(),
                     db.last_error().c_str());
    }
    return ok;
}

bool UploadSessionStore::forget(const std::string& fingerprint)
{
    SqliteStatement stmt(db, "DELETE FROM upload_sessions WHERE fingerprint = ?");
    return stmt.bind_text(1, fingerprint) && stmt.step() == SQLITE_DONE;
}

int UploadSessionStore::expire(int64_t max_age_ms)
{
    SqliteStatement stmt(db, "DELETE FROM upload_sessions WHERE updated_at < ?");
    if (!stmt.bind_int64(1, clock.now_ms() - max_age_ms) || stmt.step() != SQLITE_DONE) {
        return -1;
    }
    return sqlite3_changes(db.handle());
}
