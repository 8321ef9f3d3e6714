#include "PersistentQueue.h"
#include "Clock.h"
#include "EventBus.h"
#include "SqliteDatabase.h"
#include "StateLogger.h"
#include "Utility.h"
#include "logger.h"

#include <algorithm>
#include <cstdio>

using json = nlohmann::json;

namespace {

const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS submissions ("
    "  seq          INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  id           TEXT NOT NULL UNIQUE,"
    "  instance_id  TEXT NOT NULL,"
    "  file_name    TEXT NOT NULL,"
    "  mime_type    TEXT NOT NULL,"
    "  timestamp    INTEGER NOT NULL,"
    "  payload      BLOB NOT NULL,"
    "  payload_size INTEGER NOT NULL,"
    "  form_fields  TEXT NOT NULL,"
    "  metadata     TEXT NOT NULL,"
    "  retry_count  INTEGER NOT NULL DEFAULT 0,"
    "  last_attempt INTEGER NOT NULL DEFAULT 0,"
    "  error        TEXT NOT NULL DEFAULT '',"
    "  status       TEXT NOT NULL DEFAULT 'pending'"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_submissions_order ON submissions(timestamp, seq);";

const char* SELECT_RECORD_COLUMNS =
    "SELECT id, instance_id, file_name, mime_type, timestamp, payload, form_fields,"
    " metadata, retry_count, last_attempt, error, status FROM submissions";

const char* SELECT_SUMMARY_COLUMNS =
    "SELECT id, file_name, retry_count, error, timestamp, last_attempt, payload_size,"
    " status FROM submissions";

} // namespace

PersistentQueue::PersistentQueue(SqliteDatabase& database, const Clock& clk,
                                 const PipelineConfig& config, EventBus* event_bus)
    : db(database),
      clock(clk),
      bus(event_bus),
      max_retries(config.max_retries),
      max_blob_size(config.max_blob_size_bytes),
      max_total_bytes(config.max_total_bytes)
{
}

PersistentQueue::~PersistentQueue()
{
}

PipelineError PersistentQueue::storage_error(const std::string& operation) const
{
    int code = db.last_error_code();
    std::string msg = operation + ": " + db.last_error();
    if ((code & 0xFF) == SQLITE_FULL) {
        return PipelineError(ERR_STORAGE_QUOTA, msg);
    }
    return PipelineError(ERR_STORAGE_IO, msg);
}

bool PersistentQueue::initialize(PipelineError& error)
{
    if (!db.is_open()) {
        error = PipelineError(ERR_STORAGE_IO, "queue database is not open");
        return false;
    }
    if (!db.exec(SCHEMA_SQL)) {
        error = storage_error("create schema");
        return false;
    }

    // A terminated process leaves its in-flight record marked 'uploading'
    SqliteStatement reset(db, "UPDATE submissions SET status = 'pending' "
                              "WHERE status = 'uploading'");
    if (reset.step() != SQLITE_DONE) {
        error = storage_error("reset orphaned records");
        return false;
    }
    int orphans = sqlite3_changes(db.handle());
    if (orphans > 0) {
        LOG_WARN_CTX("queue", "Returned %d orphaned upload(s) to pending", orphans);
        LOG_STATE("QUEUE RECOVERY: %d orphaned record(s) returned to pending", orphans);
    }

    LOG_INFO_CTX("queue", "Queue ready: %d pending, %lld bytes stored (cap %lld), "
                 "max_retries=%d", pending_count(), (long long)total_bytes(),
                 (long long)max_total_bytes, max_retries);
    return true;
}

bool PersistentQueue::add(const SubmissionRecord& draft, std::string& id_out,
                          PipelineError& error)
{
    // Size guard runs before anything touches storage
    int64_t size = static_cast<int64_t>(draft.payload.size());
    if (size > max_blob_size) {
        char buffer[160];
        snprintf(buffer, sizeof(buffer), "payload of %lld bytes exceeds the %lld byte limit",
                 (long long)size, (long long)max_blob_size);
        error = PipelineError(ERR_VALIDATION, buffer);
        LOG_ERROR_CTX("queue", "Rejected %s: %s", draft.file_name.c_str(), buffer);
        return false;
    }

    if (!db.is_open()) {
        error = PipelineError(ERR_STORAGE_IO, "queue database is not open");
        return false;
    }

    int64_t stored_bytes = total_bytes();
    if (stored_bytes < 0) {
        error = storage_error("measure queue size");
        return false;
    }
    if (stored_bytes + size > max_total_bytes) {
        char buffer[160];
        snprintf(buffer, sizeof(buffer), "queue holds %lld bytes, adding %lld exceeds %lld",
                 (long long)stored_bytes, (long long)size, (long long)max_total_bytes);
        error = PipelineError(ERR_STORAGE_QUOTA, buffer);
        LOG_ERROR_CTX("queue", "Quota exceeded for %s: %s", draft.file_name.c_str(), buffer);
        return false;
    }

    // Storage-owned copy; the producer may reuse its buffer once we return
    SubmissionRecord record = draft;
    if (record.id.empty()) {
        record.id = generate_submission_id(clock.now_ms());
    }
    if (record.created_at == 0) {
        record.created_at = clock.now_ms();
    }
    record.retry_count = std::min(std::max(record.retry_count, 0), max_retries);

    std::string fields_text = form_fields_to_json(record.form_fields).dump();
    std::string metadata_text = record.metadata.to_json().dump();

    if (!db.begin()) {
        error = storage_error("begin");
        return false;
    }

    SqliteStatement insert(db,
        "INSERT INTO submissions (id, instance_id, file_name, mime_type, timestamp,"
        " payload, payload_size, form_fields, metadata, retry_count, last_attempt, error,"
        " status) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    bool bound = insert.bind_text(1, record.id) &&
                 insert.bind_text(2, record.instance_id) &&
                 insert.bind_text(3, record.file_name) &&
                 insert.bind_text(4, record.mime_type) &&
                 insert.bind_int64(5, record.created_at) &&
                 insert.bind_blob(6, record.payload) &&
                 insert.bind_int64(7, size) &&
                 insert.bind_text(8, fields_text) &&
                 insert.bind_text(9, metadata_text) &&
                 insert.bind_int64(10, record.retry_count) &&
                 insert.bind_int64(11, record.last_attempt_at) &&
                 insert.bind_text(12, record.last_error) &&
                 insert.bind_text(13, record_status_to_string(record.status));

    int rc = bound ? insert.step() : SQLITE_MISUSE;
    if (rc != SQLITE_DONE) {
        if ((db.last_error_code() & 0xFF) == SQLITE_CONSTRAINT) {
            error = PipelineError(ERR_VALIDATION, "duplicate submission id " + record.id);
        } else {
            error = storage_error("insert");
        }
        db.rollback();
        LOG_ERROR_CTX("queue", "Insert of %s failed: %s", record.id.c_str(),
                      error.to_string().c_str());
        return false;
    }

    if (!db.commit()) {
        error = storage_error("commit");
        db.rollback();
        LOG_ERROR_CTX("queue", "Commit of %s failed: %s", record.id.c_str(),
                      error.to_string().c_str());
        return false;
    }

    id_out = record.id;
    LOG_INFO_CTX("queue", "Queued %s (%s, %lld bytes, instance %s)", record.id.c_str(),
                 record.file_name.c_str(), (long long)size, record.instance_id.c_str());
    LOG_STATE("QUEUE ADD: %s | %s | %lld bytes", record.id.c_str(),
              record.file_name.c_str(), (long long)size);
    publish_update();
    return true;
}

void PersistentQueue::read_summary(const SqliteStatement& stmt, QueueEntrySummary& out) const
{
    out.id = stmt.column_text(0);
    out.file_name = stmt.column_text(1);
    out.retry_count = static_cast<int>(stmt.column_int64(2));
    out.error = stmt.column_text(3);
    out.created_at = stmt.column_int64(4);
    out.last_attempt_at = stmt.column_int64(5);
    out.payload_size = stmt.column_int64(6);
    out.status = record_status_from_string(stmt.column_text(7));
}

bool PersistentQueue::read_record(const SqliteStatement& stmt, SubmissionRecord& out) const
{
    out.id = stmt.column_text(0);
    out.instance_id = stmt.column_text(1);
    out.file_name = stmt.column_text(2);
    out.mime_type = stmt.column_text(3);
    out.created_at = stmt.column_int64(4);
    stmt.column_blob(5, out.payload);
    out.retry_count = static_cast<int>(stmt.column_int64(8));
    out.last_attempt_at = stmt.column_int64(9);
    out.last_error = stmt.column_text(10);
    out.status = record_status_from_string(stmt.column_text(11));

    json fields = json::parse(stmt.column_text(6), nullptr, false);
    json metadata = json::parse(stmt.column_text(7), nullptr, false);
    if (fields.is_discarded() || !form_fields_from_json(fields, out.form_fields)) {
        LOG_ERROR_CTX("queue", "Record %s has unreadable form fields", out.id.c_str());
        return false;
    }
    if (metadata.is_discarded() || !SubmissionMetadata::from_json(metadata, out.metadata)) {
        LOG_ERROR_CTX("queue", "Record %s has unreadable metadata", out.id.c_str());
        return false;
    }
    return true;
}

bool PersistentQueue::get_all(std::vector<SubmissionRecord>& out, PipelineError& error)
{
    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " ORDER BY timestamp, seq";
    SqliteStatement stmt(db, sql.c_str());
    if (!stmt.is_valid()) {
        error = storage_error("select records");
        return false;
    }

    std::vector<SubmissionRecord> records;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        SubmissionRecord record;
        if (read_record(stmt, record)) {
            records.push_back(record);
        }
    }
    if (rc != SQLITE_DONE) {
        error = storage_error("read records");
        return false;
    }
    out.swap(records);
    return true;
}

bool PersistentQueue::list(std::vector<QueueEntrySummary>& out, PipelineError& error)
{
    std::string sql = std::string(SELECT_SUMMARY_COLUMNS) + " ORDER BY timestamp, seq";
    SqliteStatement stmt(db, sql.c_str());
    if (!stmt.is_valid()) {
        error = storage_error("select summaries");
        return false;
    }

    std::vector<QueueEntrySummary> entries;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        QueueEntrySummary entry;
        read_summary(stmt, entry);
        entries.push_back(entry);
    }
    if (rc != SQLITE_DONE) {
        error = storage_error("read summaries");
        return false;
    }
    out.swap(entries);
    return true;
}

bool PersistentQueue::get(const std::string& id, SubmissionRecord& out, PipelineError& error)
{
    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " WHERE id = ?";
    SqliteStatement stmt(db, sql.c_str());
    if (!stmt.bind_text(1, id)) {
        error = storage_error("select record");
        return false;
    }

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        error = PipelineError(ERR_VALIDATION, "no queued record " + id);
        return false;
    }
    if (rc != SQLITE_ROW) {
        error = storage_error("read record");
        return false;
    }
    if (!read_record(stmt, out)) {
        error = PipelineError(ERR_STORAGE_IO, "record " + id + " is corrupt");
        return false;
    }
    return true;
}

bool PersistentQueue::contains(const std::string& id)
{
    SqliteStatement stmt(db, "SELECT 1 FROM submissions WHERE id = ?");
    return stmt.bind_text(1, id) && stmt.step() == SQLITE_ROW;
}

bool PersistentQueue::remove(const std::string& id, PipelineError& error)
{
    SqliteStatement stmt(db, "DELETE FROM submissions WHERE id = ?");
    if (!stmt.bind_text(1, id) || stmt.step() != SQLITE_DONE) {
        error = storage_error("delete");
        return false;
    }
    if (sqlite3_changes(db.handle()) == 0) {
        error = PipelineError(ERR_VALIDATION, "no queued record " + id);
        return false;
    }

    LOG_INFO_CTX("queue", "Removed %s", id.c_str());
    LOG_STATE("QUEUE REMOVE: %s", id.c_str());
    publish_update();
    return true;
}

bool PersistentQueue::update_retry(const std::string& id, int retry_count,
                                   const std::string& error_message, PipelineError& error)
{
    SqliteStatement stmt(db,
        "UPDATE submissions SET"
        " retry_count = MIN(MAX(retry_count, ?), ?),"
        " last_attempt = ?,"
        " error = ?,"
        " status = CASE WHEN status = 'uploading' THEN 'pending' ELSE status END"
        " WHERE id = ?");
    bool bound = stmt.bind_int64(1, retry_count) &&
                 stmt.bind_int64(2, max_retries) &&
                 stmt.bind_int64(3, clock.now_ms()) &&
                 stmt.bind_text(4, error_message) &&
                 stmt.bind_text(5, id);
    if (!bound || stmt.step() != SQLITE_DONE) {
        error = storage_error("update retry");
        return false;
    }
    if (sqlite3_changes(db.handle()) == 0) {
        error = PipelineError(ERR_VALIDATION, "no queued record " + id);
        return false;
    }

    LOG_INFO_CTX("queue", "Record %s retry count -> %d (%s)", id.c_str(),
                 std::min(retry_count, max_retries), error_message.c_str());
    publish_update();
    return true;
}

bool PersistentQueue::mark_status(const std::string& id, RecordStatus status,
                                  const std::string& error_message, PipelineError& error)
{
    SqliteStatement stmt(db,
        "UPDATE submissions SET status = ?,"
        " error = CASE WHEN ? = '' THEN error ELSE ? END,"
        " last_attempt = CASE WHEN ? = 'uploading' THEN ? ELSE last_attempt END"
        " WHERE id = ?");
    const char* status_text = record_status_to_string(status);
    bool bound = stmt.bind_text(1, status_text) &&
                 stmt.bind_text(2, error_message) &&
                 stmt.bind_text(3, error_message) &&
                 stmt.bind_text(4, status_text) &&
                 stmt.bind_int64(5, clock.now_ms()) &&
                 stmt.bind_text(6, id);
    if (!bound || stmt.step() != SQLITE_DONE) {
        error = storage_error("update status");
        return false;
    }
    if (sqlite3_changes(db.handle()) == 0) {
        error = PipelineError(ERR_VALIDATION, "no queued record " + id);
        return false;
    }

    if (status == RECORD_FAILED) {
        LOG_WARN_CTX("queue", "Record %s halted for manual review: %s", id.c_str(),
                     error_message.c_str());
        LOG_STATE("QUEUE HALT: %s | %s", id.c_str(), error_message.c_str());
    }
    publish_update();
    return true;
}

int PersistentQueue::pending_count()
{
    SqliteStatement stmt(db, "SELECT COUNT(*) FROM submissions "
                             "WHERE status IN ('pending', 'uploading')");
    if (stmt.step() != SQLITE_ROW) {
        return -1;
    }
    return static_cast<int>(stmt.column_int64(0));
}

int64_t PersistentQueue::total_bytes()
{
    SqliteStatement stmt(db, "SELECT COALESCE(SUM(payload_size), 0) FROM submissions");
    if (stmt.step() != SQLITE_ROW) {
        return -1;
    }
    return stmt.column_int64(0);
}

int PersistentQueue::purge_expired(int64_t max_age_ms)
{
    SqliteStatement stmt(db,
        "DELETE FROM submissions WHERE timestamp < ?"
        " AND (retry_count >= ? OR status = 'failed')");
    bool bound = stmt.bind_int64(1, clock.now_ms() - max_age_ms) &&
                 stmt.bind_int64(2, max_retries);
    if (!bound || stmt.step() != SQLITE_DONE) {
        LOG_ERROR_CTX("queue", "Purge failed: %s", db.last_error().c_str());
        return -1;
    }

    int removed = sqlite3_changes(db.handle());
    if (removed > 0) {
        LOG_INFO_CTX("queue", "Purged %d expired record(s)", removed);
        LOG_STATE("QUEUE PURGE: %d expired record(s)", removed);
        publish_update();
    }
    return removed;
}

void PersistentQueue::publish_update()
{
    if (!bus) {
        return;
    }
    PipelineEvent event(EVENT_QUEUE_UPDATED);
    event.timestamp = clock.now_ms();
    PipelineError error;
    if (!list(event.queue, error)) {
        LOG_WARN_CTX("queue", "queue-updated sent without entries: %s",
                     error.to_string().c_str());
    }
    bus->publish(event);
}
