#ifndef SQLITE_DATABASE_H
#define SQLITE_DATABASE_H

#include <cstdint>
#include <string>
#include <vector>
#include <sqlite3.h>

// Owns one sqlite3 connection in WAL mode with synchronous=FULL, so a
// COMMIT that returned is on disk.
class SqliteDatabase
{
public:
    SqliteDatabase();
    ~SqliteDatabase();

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db != nullptr; }

    bool exec(const char* sql);

    bool begin();
    bool commit();
    void rollback();

    sqlite3* handle() const { return db; }
    const std::string& get_path() const { return path; }

    // Extended error code and message of the last failure on this connection
    int last_error_code() const;
    std::string last_error() const;

private:
    sqlite3* db;
    std::string path;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;
};

// RAII prepared statement. Bind indexes are 1-based, column indexes 0-based.
class SqliteStatement
{
public:
    SqliteStatement(SqliteDatabase& database, const char* sql);
    ~SqliteStatement();

    bool is_valid() const { return stmt != nullptr; }

    bool bind_text(int index, const std::string& value);
    bool bind_int64(int index, int64_t value);
    bool bind_blob(int index, const std::vector<uint8_t>& value);

    // SQLITE_ROW, SQLITE_DONE or an error code
    int step();
    void reset();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    void column_blob(int col, std::vector<uint8_t>& out) const;

private:
    sqlite3_stmt* stmt;

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
};

#endif // SQLITE_DATABASE_H
