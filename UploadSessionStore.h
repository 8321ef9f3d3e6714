#ifndef UPLOAD_SESSION_STORE_H
#define UPLOAD_SESSION_STORE_H

#include <cstdint>
#include <string>

class Clock;
class SqliteDatabase;

// Remembers fingerprint -> server-side upload so an interrupted transfer
// resumes after a restart. tus sessions store their URL and ask the server
// for the offset; chunked uploads store their upload id and the byte
// offset the server has acknowledged.
class UploadSessionStore
{
public:
    UploadSessionStore(SqliteDatabase& db, const Clock& clock);
    ~UploadSessionStore();

    bool initialize();

    bool find(const std::string& fingerprint, std::string& resource_out);
    bool find(const std::string& fingerprint, std::string& resource_out, int64_t& progress_out);
    bool save(const std::string& fingerprint, const std::string& resource, int64_t progress = 0);
    bool forget(const std::string& fingerprint);

    // Drops sessions not touched for max_age_ms. Returns the number removed.
    int expire(int64_t max_age_ms);

private:
    SqliteDatabase& db;
    const Clock& clock;

    UploadSessionStore(const UploadSessionStore&) = delete;
    UploadSessionStore& operator=(const UploadSessionStore&) = delete;
};

#endif // UPLOAD_SESSION_STORE_H
