#ifndef RESUMABLE_UPLOAD_CLIENT_H
#define RESUMABLE_UPLOAD_CLIENT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "HttpTransport.h"
#include "PipelineConfig.h"
#include "PipelineError.h"
#include "SubmissionTypes.h"

class EventLoop;
class UploadSessionStore;

struct UploadRequest {
    std::string submission_id;
    std::string instance_id;
    std::string file_name;
    std::string mime_type;
    std::shared_ptr<const std::vector<uint8_t>> payload;
    FieldList form_fields;
    nlohmann::json metadata;
    Tier tier;
    ConnectionQuality quality;

    UploadRequest() : metadata(nlohmann::json::object()), tier(TIER_A), quality(QUALITY_HIGH) {}

    int64_t payload_size() const { return payload ? (int64_t)payload->size() : 0; }
};

struct UploadResult {
    bool success;
    UploadStrategy strategy;
    std::string url;                // final resource location
    std::string response_body;      // fallback path: the server's JSON body
    PipelineError error;
    int64_t bytes_total;
    int64_t bytes_sent;
    int64_t resumed_from;
    int chunks;
    int chunk_retries;
    int fallbacks;                  // strategies abandoned before this one
    int64_t duration_ms;

    UploadResult()
        : success(false), strategy(STRATEGY_NONE), bytes_total(0), bytes_sent(0),
          resumed_from(0), chunks(0), chunk_retries(0), fallbacks(0), duration_ms(0) {}
};

typedef std::function<void(int64_t bytes_uploaded, int64_t bytes_total)> UploadProgressCallback;
typedef std::function<void(const UploadResult&)> UploadDoneCallback;

/**
 * Transfers one artifact to the server.
 *
 * Large payloads on capable devices use the tus 1.0.0 resumable protocol:
 * a fingerprint of the file attributes finds an earlier session in the
 * UploadSessionStore, HEAD reports how far the server got, and strictly
 * sequential PATCH chunks carry the rest. A failed chunk is retried on its
 * own after a tier-dependent delay.
 *
 * A configured chunked endpoint takes one multipart POST per chunk under a
 * server-issued upload_id and a final finalize POST. The upload_id and the
 * acknowledged offset are kept in the UploadSessionStore as well.
 *
 * Everything else is sent as one multipart POST. That path never resumes;
 * a failure ends the attempt and retrying is the caller's business.
 *
 * Strategies form a chain: resumable, then chunked, then single-shot, each
 * only if its endpoint is configured. When a strategy fails for any reason
 * other than a network error the next one runs with the same request. A
 * network error ends the attempt because another endpoint behind the same
 * link would fail the same way.
 *
 * Progress never goes backwards within one upload() call. When a session
 * restarts from zero or a fallback begins, reports are held back until the
 * transfer passes the previous high-water mark.
 *
 * upload() never blocks and never calls `done` synchronously. The client
 * must outlive every transfer it started.
 */
class ResumableUploadClient
{
public:
    ResumableUploadClient(const PipelineConfig& config, HttpTransport& transport,
                          EventLoop& loop, UploadSessionStore* sessions,
                          RequestAuthenticator* authenticator = nullptr);
    ~ResumableUploadClient();

    void upload(const UploadRequest& request, UploadProgressCallback progress,
                UploadDoneCallback done);

    // Resumable only when enabled, an endpoint is set, the payload exceeds
    // the threshold and the device is not tier C. Chunked for the same
    // payloads when tus is unavailable, or for any payload when it is the
    // only endpoint.
    UploadStrategy select_strategy(int64_t payload_size, Tier tier) const;

    // select_strategy() followed by the configured fallbacks. Empty when no
    // endpoint can take the payload.
    std::vector<UploadStrategy> plan_strategies(int64_t payload_size, Tier tier) const;

    int64_t chunk_size_for(Tier tier, ConnectionQuality quality) const;
    std::vector<int64_t> chunk_retry_delays(ConnectionQuality quality) const;
    int max_chunk_retries(ConnectionQuality quality) const;

    static std::string fingerprint(const std::string& file_name, int64_t size,
                                   const std::string& mime_type);

    // Session store key of a chunked upload
    static std::string chunked_key(const std::string& instance_id, const std::string& file_name,
                                   int64_t size);

    // Upload-Metadata header value: comma separated "key base64(value)"
    static std::string encode_metadata(const UploadRequest& request);

    // Location may be absolute, host-relative or relative to the endpoint
    static std::string resolve_location(const std::string& endpoint,
                                        const std::string& location);

    int get_active_transfers() const { return active_transfers; }

private:
    class TusSession;
    class ChunkedSession;
    class DirectSession;
    friend class TusSession;
    friend class ChunkedSession;
    friend class DirectSession;

    // Configured headers, then the authenticator
    void prepare(HttpRequest& request) const;

    void run_chain(const UploadRequest& request, const std::vector<UploadStrategy>& chain,
                   size_t step, UploadProgressCallback progress, UploadDoneCallback done);
    void start_session(UploadStrategy strategy, const UploadRequest& request,
                       UploadProgressCallback progress, UploadDoneCallback done);

    void fail_async(UploadStrategy strategy, const PipelineError& error, UploadDoneCallback done);

    PipelineConfig config;
    HttpTransport& transport;
    EventLoop& loop;
    UploadSessionStore* sessions;
    RequestAuthenticator* authenticator;
    int active_transfers;

    ResumableUploadClient(const ResumableUploadClient&) = delete;
    ResumableUploadClient& operator=(const ResumableUploadClient&) = delete;
};

#endif // RESUMABLE_UPLOAD_CLIENT_H
