#ifndef UPLOAD_CHUNK_TRACKER_H
#define UPLOAD_CHUNK_TRACKER_H

#include <cstdint>

// Tracks the committed byte offset of a resumable transfer. Chunks are
// strictly sequential: the next chunk always starts at the committed offset.
class UploadChunkTracker
{
public:
    UploadChunkTracker();
    ~UploadChunkTracker();

    // Initialize for a new transfer (offset > 0 when resuming)
    bool initialize(int64_t total_bytes, int64_t chunk_size, int64_t offset = 0);

    // Length of the chunk starting at the committed offset
    int64_t next_chunk_length() const;

    // Server acknowledged bytes up to new_offset. Rejects offsets that move
    // backwards, skip past the chunk that was sent, or exceed the total.
    bool commit(int64_t new_offset);

    // Server reported a different offset (409 / HEAD). Any value in
    // [0, total] is accepted.
    bool resync(int64_t server_offset);

    int64_t get_offset() const { return offset; }
    int64_t get_total() const { return total; }
    int64_t get_chunk_size() const { return chunk_size; }
    int get_chunks_committed() const { return chunks_committed; }

    bool is_complete() const;

    // Fraction committed, 0..1
    double progress() const;

    void reset();

private:
    int64_t total;
    int64_t chunk_size;
    int64_t offset;
    int chunks_committed;
};

#endif // UPLOAD_CHUNK_TRACKER_H
