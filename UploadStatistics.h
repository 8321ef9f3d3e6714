#ifndef UPLOAD_STATISTICS_H
#define UPLOAD_STATISTICS_H

#include <cstdint>

class UploadStatistics
{
public:
    UploadStatistics();
    ~UploadStatistics();

    // Event tracking
    void on_request_sent(int64_t body_bytes);
    void on_chunk_committed(int64_t bytes);
    void on_chunk_retry();
    void on_offset_resync();
    void set_resumed_from(int64_t offset) { resumed_from = offset; }

    // Getters
    int get_requests_sent() const { return requests_sent; }
    int get_chunks_committed() const { return chunks_committed; }
    int get_chunk_retries() const { return chunk_retries; }
    int get_offset_resyncs() const { return offset_resyncs; }
    int64_t get_bytes_sent() const { return bytes_sent; }
    int64_t get_resumed_from() const { return resumed_from; }

    // Share of transmitted payload bytes the server kept
    double get_efficiency_percent() const {
        return (bytes_sent > 0) ?
            (100.0 * bytes_committed / bytes_sent) : 0.0;
    }

private:
    int requests_sent;
    int chunks_committed;
    int chunk_retries;
    int offset_resyncs;
    int64_t bytes_sent;
    int64_t bytes_committed;
    int64_t resumed_from;
};

#endif // UPLOAD_STATISTICS_H
