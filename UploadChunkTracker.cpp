#include "UploadChunkTracker.h"
#include <algorithm>

UploadChunkTracker::UploadChunkTracker()
    : total(0),
      chunk_size(0),
      offset(0),
      chunks_committed(0)
{
}

UploadChunkTracker::~UploadChunkTracker()
{
}

bool UploadChunkTracker::initialize(int64_t total_bytes, int64_t chunk, int64_t start_offset)
{
    reset();
    if (total_bytes < 0 || chunk <= 0 || start_offset < 0 || start_offset > total_bytes) {
        return false;
    }

    total = total_bytes;
    chunk_size = chunk;
    offset = start_offset;
    return true;
}

int64_t UploadChunkTracker::next_chunk_length() const
{
    return std::min(chunk_size, total - offset);
}

bool UploadChunkTracker::commit(int64_t new_offset)
{
    if (new_offset <= offset) {
        return false;  // No progress or moved backwards
    }

    if (new_offset > offset + next_chunk_length() || new_offset > total) {
        return false;  // Server claims bytes we never sent
    }

    offset = new_offset;
    chunks_committed++;
    return true;
}

bool UploadChunkTracker::resync(int64_t server_offset)
{
    if (server_offset < 0 || server_offset > total) {
        return false;
    }
    offset = server_offset;
    return true;
}

bool UploadChunkTracker::is_complete() const
{
    return offset == total;
}

double UploadChunkTracker::progress() const
{
    if (total <= 0) {
        return 1.0;
    }
    return (double)offset / (double)total;
}

void UploadChunkTracker::reset()
{
    total = 0;
    chunk_size = 0;
    offset = 0;
    chunks_committed = 0;
}
