#ifndef PERSISTENT_QUEUE_H
#define PERSISTENT_QUEUE_H

#include <cstdint>
#include <string>
#include <vector>
#include "PipelineConfig.h"
#include "PipelineError.h"
#include "SubmissionRecord.h"

class Clock;
class EventBus;
class SqliteDatabase;
class SqliteStatement;

/**
 * Durable store of submissions waiting for upload.
 *
 * Every mutation is its own SQLite transaction; add() reports success only
 * after COMMIT returned, so a record it acknowledged survives a crash or
 * power loss. Records are returned in creation order.
 *
 * Payload size and total-quota checks run before any write. A rejected
 * add() leaves the store untouched.
 */
class PersistentQueue
{
public:
    PersistentQueue(SqliteDatabase& db, const Clock& clock,
                    const PipelineConfig& config, EventBus* bus = nullptr);
    ~PersistentQueue();

    // Creates the schema and returns orphaned 'uploading' records to 'pending'
    bool initialize(PipelineError& error);

    // Assigns id (when draft.id is empty) and created_at. The payload is
    // copied before the transaction starts.
    bool add(const SubmissionRecord& draft, std::string& id_out, PipelineError& error);

    bool get_all(std::vector<SubmissionRecord>& out, PipelineError& error);
    bool list(std::vector<QueueEntrySummary>& out, PipelineError& error);
    bool get(const std::string& id, SubmissionRecord& out, PipelineError& error);
    bool contains(const std::string& id);

    bool remove(const std::string& id, PipelineError& error);

    // retry_count never decreases and is capped at max_retries.
    // Stamps last_attempt and returns an 'uploading' record to 'pending'.
    bool update_retry(const std::string& id, int retry_count,
                      const std::string& error_message, PipelineError& error);

    bool mark_status(const std::string& id, RecordStatus status,
                     const std::string& error_message, PipelineError& error);

    // Records still eligible for upload ('pending' or 'uploading')
    int pending_count();

    // Deletes exhausted or halted records older than max_age_ms.
    // Returns the number removed, -1 on error.
    int purge_expired(int64_t max_age_ms);

    int64_t total_bytes();
    int get_max_retries() const { return max_retries; }
    int64_t get_max_blob_size() const { return max_blob_size; }

private:
    void publish_update();
    PipelineError storage_error(const std::string& operation) const;
    void read_summary(const SqliteStatement& stmt, QueueEntrySummary& out) const;
    bool read_record(const SqliteStatement& stmt, SubmissionRecord& out) const;

    SqliteDatabase& db;
    const Clock& clock;
    EventBus* bus;
    int max_retries;
    int64_t max_blob_size;
    int64_t max_total_bytes;

    PersistentQueue(const PersistentQueue&) = delete;
    PersistentQueue& operator=(const PersistentQueue&) = delete;
};

#endif // PERSISTENT_QUEUE_H
