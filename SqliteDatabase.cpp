#include "SqliteDatabase.h"
#include "logger.h"

#include <cstring>

SqliteDatabase::SqliteDatabase()
    : db(nullptr)
{
}

SqliteDatabase::~SqliteDatabase()
{
    close();
}

bool SqliteDatabase::open(const std::string& db_path)
{
    close();
    path = db_path;

    int rc = sqlite3_open_v2(db_path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR_CTX("database", "Cannot open %s: %s", db_path.c_str(),
                      db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        close();
        return false;
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, 5000);

    if (!exec("PRAGMA journal_mode=WAL;") ||
        !exec("PRAGMA synchronous=FULL;") ||
        !exec("PRAGMA foreign_keys=ON;")) {
        close();
        return false;
    }

    LOG_INFO_CTX("database", "Opened %s (WAL, synchronous=FULL)", db_path.c_str());
    return true;
}

void SqliteDatabase::close()
{
    if (db) {
        sqlite3_close_v2(db);
        db = nullptr;
    }
}

bool SqliteDatabase::exec(const char* sql)
{
    if (!db) {
        return false;
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        LOG_ERROR_CTX("database", "SQL failed (%d): %s | %s", rc,
                      err ? err : sqlite3_errstr(rc), sql);
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SqliteDatabase::begin()
{
    return exec("BEGIN IMMEDIATE;");
}

bool SqliteDatabase::commit()
{
    return exec("COMMIT;");
}

void SqliteDatabase::rollback()
{
    if (db && !sqlite3_get_autocommit(db)) {
        exec("ROLLBACK;");
    }
}

int SqliteDatabase::last_error_code() const
{
    return db ? sqlite3_extended_errcode(db) : SQLITE_CANTOPEN;
}

std::string SqliteDatabase::last_error() const
{
    return db ? sqlite3_errmsg(db) : "database not open";
}

// ---------- statement ----------

SqliteStatement::SqliteStatement(SqliteDatabase& database, const char* sql)
    : stmt(nullptr)
{
    if (!database.is_open()) {
        return;
    }
    int rc = sqlite3_prepare_v2(database.handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR_CTX("database", "Prepare failed: %s | %s",
                      sqlite3_errmsg(database.handle()), sql);
        stmt = nullptr;
    }
}

SqliteStatement::~SqliteStatement()
{
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

bool SqliteStatement::bind_text(int index, const std::string& value)
{
    return stmt && sqlite3_bind_text(stmt, index, value.c_str(),
                                     static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT) == SQLITE_OK;
}

bool SqliteStatement::bind_int64(int index, int64_t value)
{
    return stmt && sqlite3_bind_int64(stmt, index, value) == SQLITE_OK;
}

bool SqliteStatement::bind_blob(int index, const std::vector<uint8_t>& value)
{
    if (!stmt) {
        return false;
    }
    if (value.empty()) {
        return sqlite3_bind_zeroblob(stmt, index, 0) == SQLITE_OK;
    }
    return sqlite3_bind_blob64(stmt, index, &value[0], value.size(),
                               SQLITE_TRANSIENT) == SQLITE_OK;
}

int SqliteStatement::step()
{
    if (!stmt) {
        return SQLITE_MISUSE;
    }
    return sqlite3_step(stmt);
}

void SqliteStatement::reset()
{
    if (stmt) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
}

std::string SqliteStatement::column_text(int col) const
{
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) {
        return std::string();
    }
    int len = sqlite3_column_bytes(stmt, col);
    return std::string(reinterpret_cast<const char*>(text), len);
}

int64_t SqliteStatement::column_int64(int col) const
{
    return sqlite3_column_int64(stmt, col);
}

void SqliteStatement::column_blob(int col, std::vector<uint8_t>& out) const
{
    const void* data = sqlite3_column_blob(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    out.clear();
    if (data && len > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        out.assign(bytes, bytes + len);
    }
}
