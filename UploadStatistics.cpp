#include "UploadStatistics.h"

UploadStatistics::UploadStatistics()
    : requests_sent(0),
      chunks_committed(0),
      chunk_retries(0),
      offset_resyncs(0),
      bytes_sent(0),
      bytes_committed(0),
      resumed_from(0)
{
}

UploadStatistics::~UploadStatistics()
{
}

void UploadStatistics::on_request_sent(int64_t body_bytes)
{
    requests_sent++;
    bytes_sent += body_bytes;
}

void UploadStatistics::on_chunk_committed(int64_t bytes)
{
    chunks_committed++;
    bytes_committed += bytes;
}

void UploadStatistics::on_chunk_retry()
{
    chunk_retries++;
}

void UploadStatistics::on_offset_resync()
{
    offset_resyncs++;
}
