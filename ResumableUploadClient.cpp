#include "ResumableUploadClient.h"
#include "EventLoop.h"
#include "MultipartBuilder.h"
#include "PipelineConstants.h"
#include "UploadChunkTracker.h"
#include "UploadSessionStore.h"
#include "UploadStatistics.h"
#include "UploadTimeoutManager.h"
#include "Utility.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace {

bool parse_offset(const std::string& text, int64_t& out)
{
    std::string value = trim_copy(text);
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' || parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool session_is_gone(int status)
{
    return status == 404 || status == 410 || status == 403;
}

template <size_t N>
std::vector<int64_t> table(const int64_t (&values)[N])
{
    return std::vector<int64_t>(values, values + N);
}

// Final resource location from a JSON reply, "url" before "location"
std::string extract_url(const nlohmann::json& body)
{
    if (!body.is_object()) {
        return std::string();
    }
    if (body.contains("url") && body["url"].is_string()) {
        return body["url"].get<std::string>();
    }
    if (body.contains("location") && body["location"].is_string()) {
        return body["location"].get<std::string>();
    }
    return std::string();
}

std::string id_value(const nlohmann::json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return std::string();
}

// upload_id at the top level or under "data"
std::string extract_upload_id(const nlohmann::json& body)
{
    if (!body.is_object()) {
        return std::string();
    }
    if (body.contains("upload_id")) {
        return id_value(body["upload_id"]);
    }
    if (body.contains("data") && body["data"].is_object() && body["data"].contains("upload_id")) {
        return id_value(body["data"]["upload_id"]);
    }
    return std::string();
}

} // namespace

//=============================================================================
// tus session
//=============================================================================

class ResumableUploadClient::TusSession : public std::enable_shared_from_this<TusSession>
{
public:
    TusSession(ResumableUploadClient& owner, const UploadRequest& req,
               UploadProgressCallback on_progress, UploadDoneCallback on_done)
        : client(owner),
          request(req),
          progress(on_progress),
          done(on_done),
          timeouts(owner.loop.get_clock()),
          chunk_size(owner.chunk_size_for(req.tier, req.quality)),
          delays(owner.chunk_retry_delays(req.quality)),
          max_retries(owner.max_chunk_retries(req.quality)),
          attempt(0),
          finished(false)
    {
        fp = fingerprint(req.file_name, req.payload_size(), req.mime_type);
    }

    void start()
    {
        timeouts.start_attempt();

        std::string stored;
        if (client.sessions && client.sessions->find(fp, stored)) {
            upload_url = stored;
            LOG_INFO_CTX("upload_client", "[%s] Found earlier session %s, asking for its offset",
                         request.submission_id.c_str(), upload_url.c_str());
            head_resume();
        } else {
            create_session();
        }
    }

private:
    HttpRequest make_request(const std::string& method, const std::string& url)
    {
        HttpRequest http;
        http.method = method;
        http.url = url;
        http.set_header("Tus-Resumable", PipelineDefaults::TUS_VERSION);
        client.prepare(http);
        return http;
    }

    void head_resume() { send_head(true); }
    void head_resync() { send_head(false); }

    void send_head(bool resuming)
    {
        HttpRequest http = make_request("HEAD", upload_url);
        http.timeout_ms = timeouts.get_progressive_timeout_ms(request.quality, PHASE_INIT, 0, attempt);
        stats.on_request_sent(0);

        std::shared_ptr<TusSession> self = shared_from_this();
        client.transport.send(http, [self, resuming](const HttpResponse& response) {
            self->on_head(response, resuming);
        });
    }

    void on_head(const HttpResponse& response, bool resuming)
    {
        if (!response.transport_ok) {
            retry_or_fail(PipelineError(ERR_NETWORK, "HEAD failed: " + response.error),
                          resuming ? &TusSession::head_resume : &TusSession::head_resync);
            return;
        }

        if (session_is_gone(response.status)) {
            LOG_INFO_CTX("upload_client", "[%s] Server no longer has %s (HTTP %d), starting over",
                         request.submission_id.c_str(), upload_url.c_str(), response.status);
            forget_session();
            create_session();
            return;
        }

        if (!response.is_success()) {
            retry_or_fail(PipelineError::from_http_status(response.status, "HEAD"),
                          resuming ? &TusSession::head_resume : &TusSession::head_resync);
            return;
        }

        int64_t server_offset = 0;
        if (!parse_offset(response.header("Upload-Offset"), server_offset)) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "HEAD response without a valid Upload-Offset",
                                 response.status));
            return;
        }

        if (resuming) {
            if (!tracker.initialize(request.payload_size(), chunk_size, server_offset)) {
                LOG_WARN_CTX("upload_client", "[%s] Stored session reports offset %lld beyond %lld bytes",
                             request.submission_id.c_str(), (long long)server_offset,
                             (long long)request.payload_size());
                forget_session();
                create_session();
                return;
            }
            stats.set_resumed_from(server_offset);
            LOG_INFO_CTX("upload_client", "[%s] Resuming at byte %lld of %lld",
                         request.submission_id.c_str(), (long long)server_offset,
                         (long long)request.payload_size());
        } else if (!tracker.resync(server_offset)) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "Server offset out of range", response.status));
            return;
        } else {
            LOG_INFO_CTX("upload_client", "[%s] Offset re-synced to %lld",
                         request.submission_id.c_str(), (long long)server_offset);
        }

        if (tracker.is_complete()) {
            finish(PipelineError());
        } else {
            send_chunk();
        }
    }

    void create_session()
    {
        HttpRequest http = make_request("POST", client.config.resumable_endpoint);
        http.set_header("Upload-Length", std::to_string(request.payload_size()));
        http.set_header("Upload-Metadata", encode_metadata(request));
        http.timeout_ms = timeouts.get_progressive_timeout_ms(request.quality, PHASE_INIT, 0, attempt);
        stats.on_request_sent(0);

        std::shared_ptr<TusSession> self = shared_from_this();
        client.transport.send(http, [self](const HttpResponse& response) {
            self->on_create(response);
        });
    }

    void on_create(const HttpResponse& response)
    {
        if (!response.transport_ok) {
            retry_or_fail(PipelineError(ERR_NETWORK, "Session create failed: " + response.error),
                          &TusSession::create_session);
            return;
        }
        if (!response.is_success()) {
            retry_or_fail(PipelineError::from_http_status(response.status, "Session create"),
                          &TusSession::create_session);
            return;
        }

        std::string location = response.header("Location");
        if (location.empty()) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "Session create response without Location",
                                 response.status));
            return;
        }

        upload_url = resolve_location(client.config.resumable_endpoint, location);
        if (client.sessions) {
            client.sessions->save(fp, upload_url);
        }
        tracker.initialize(request.payload_size(), chunk_size, 0);
        attempt = 0;

        LOG_INFO_CTX("upload_client", "[%s] Created session %s (%lld bytes, %lld byte chunks)",
                     request.submission_id.c_str(), upload_url.c_str(),
                     (long long)request.payload_size(), (long long)chunk_size);
        send_chunk();
    }

    void send_chunk()
    {
        int64_t offset = tracker.get_offset();
        int64_t length = tracker.next_chunk_length();

        HttpRequest http = make_request("PATCH", upload_url);
        http.set_header("Upload-Offset", std::to_string(offset));
        http.set_header("Content-Type", "application/offset+octet-stream");
        http.body.assign(reinterpret_cast<const char*>(request.payload->data()) + offset, (size_t)length);
        http.timeout_ms = timeouts.get_progressive_timeout_ms(request.quality, PHASE_UPLOAD, length, attempt);
        stats.on_request_sent(length);

        std::shared_ptr<TusSession> self = shared_from_this();
        client.transport.send(http, [self](const HttpResponse& response) {
            self->on_patch(response);
        });
    }

    void on_patch(const HttpResponse& response)
    {
        if (!response.transport_ok) {
            retry_or_fail(PipelineError(ERR_NETWORK, "Chunk failed: " + response.error),
                          &TusSession::send_chunk);
            return;
        }

        if (response.status == 409) {
            // Offset mismatch: ask the server where it is
            stats.on_offset_resync();
            if (attempt >= max_retries) {
                finish(PipelineError::from_http_status(409, "PATCH"));
                return;
            }
            attempt++;
            head_resync();
            return;
        }

        if (response.status == 404 || response.status == 410) {
            if (attempt >= max_retries) {
                finish(PipelineError::from_http_status(response.status, "PATCH"));
                return;
            }
            attempt++;
            LOG_WARN_CTX("upload_client", "[%s] Session expired mid-transfer, starting over",
                         request.submission_id.c_str());
            forget_session();
            create_session();
            return;
        }

        if (!response.is_success()) {
            retry_or_fail(PipelineError::from_http_status(response.status, "PATCH"),
                          &TusSession::send_chunk);
            return;
        }

        int64_t previous = tracker.get_offset();
        int64_t server_offset = 0;
        if (!parse_offset(response.header("Upload-Offset"), server_offset)) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "PATCH response without a valid Upload-Offset",
                                 response.status));
            return;
        }
        if (!tracker.commit(server_offset)) {
            char buffer[128];
            snprintf(buffer, sizeof(buffer), "Server acknowledged offset %lld after sending from %lld",
                     (long long)server_offset, (long long)previous);
            finish(PipelineError(ERR_MALFORMED_RESPONSE, buffer, response.status));
            return;
        }

        stats.on_chunk_committed(server_offset - previous);
        timeouts.mark_progress();
        attempt = 0;

        if (progress) {
            progress(tracker.get_offset(), tracker.get_total());
        }

        if (tracker.is_complete()) {
            finish(PipelineError());
        } else {
            send_chunk();
        }
    }

    void retry_or_fail(const PipelineError& error, void (TusSession::*step)())
    {
        if (!error.is_retryable() || attempt >= max_retries) {
            finish(error);
            return;
        }

        size_t index = std::min((size_t)attempt, delays.size() - 1);
        int64_t delay = delays.empty() ? 0 : delays[index];
        attempt++;
        stats.on_chunk_retry();

        LOG_WARN_CTX("upload_client", "[%s] %s - retry %d/%d in %lld ms",
                     request.submission_id.c_str(), error.to_string().c_str(),
                     attempt, max_retries, (long long)delay);

        std::shared_ptr<TusSession> self = shared_from_this();
        client.loop.schedule_after(delay, [self, step]() {
            ((*self).*step)();
        });
    }

    void forget_session()
    {
        if (client.sessions) {
            client.sessions->forget(fp);
        }
        upload_url.clear();
    }

    void finish(const PipelineError& error)
    {
        if (finished) {
            return;
        }
        finished = true;
        client.active_transfers--;

        UploadResult result;
        result.success = error.ok();
        result.strategy = STRATEGY_RESUMABLE;
        result.error = error;
        result.url = upload_url;
        result.bytes_total = request.payload_size();
        result.bytes_sent = stats.get_bytes_sent();
        result.resumed_from = stats.get_resumed_from();
        result.chunks = stats.get_chunks_committed();
        result.chunk_retries = stats.get_chunk_retries();
        result.duration_ms = timeouts.get_ms_since_attempt_start();

        if (result.success) {
            if (client.sessions) {
                client.sessions->forget(fp);
            }
            LOG_INFO_CTX("upload_client", "[%s] Resumable upload complete: %s (%d chunks, %d retries, "
                         "%d requests, %d resyncs, %.1f%% efficiency)",
                         request.submission_id.c_str(), upload_url.c_str(),
                         result.chunks, result.chunk_retries, stats.get_requests_sent(),
                         stats.get_offset_resyncs(), stats.get_efficiency_percent());
        } else {
            // The fingerprint stays so the next attempt resumes
            LOG_ERROR_CTX("upload_client", "[%s] Resumable upload failed at byte %lld/%lld after %d requests "
                          "(%d resyncs): %s",
                          request.submission_id.c_str(), (long long)tracker.get_offset(),
                          (long long)request.payload_size(), stats.get_requests_sent(),
                          stats.get_offset_resyncs(), error.to_string().c_str());
        }

        if (done) {
            done(result);
        }
    }

    ResumableUploadClient& client;
    UploadRequest request;
    UploadProgressCallback progress;
    UploadDoneCallback done;
    std::string fp;
    std::string upload_url;
    UploadChunkTracker tracker;
    UploadStatistics stats;
    UploadTimeoutManager timeouts;
    int64_t chunk_size;
    std::vector<int64_t> delays;
    int max_retries;
    int attempt;        // retries of the current step
    bool finished;
};

//=============================================================================
// Chunked multipart POSTs under a server-issued upload_id
//=============================================================================

class ResumableUploadClient::ChunkedSession : public std::enable_shared_from_this<ChunkedSession>
{
public:
    ChunkedSession(ResumableUploadClient& owner, const UploadRequest& req,
                   UploadProgressCallback on_progress, UploadDoneCallback on_done)
        : client(owner),
          request(req),
          progress(on_progress),
          done(on_done),
          timeouts(owner.loop.get_clock()),
          chunk_size(owner.chunk_size_for(req.tier, req.quality)),
          delays(owner.chunk_retry_delays(req.quality)),
          max_retries(owner.max_chunk_retries(req.quality)),
          chunk_index(0),
          total_chunks(0),
          pending_length(0),
          attempt(0),
          finished(false)
    {
        key = chunked_key(req.instance_id, req.file_name, req.payload_size());
    }

    void start()
    {
        timeouts.start_attempt();

        std::string stored;
        int64_t stored_offset = 0;
        if (client.sessions && client.sessions->find(key, stored, stored_offset) &&
            tracker.initialize(request.payload_size(), chunk_size, stored_offset)) {
            upload_id = stored;
            stats.set_resumed_from(stored_offset);
            LOG_INFO_CTX("upload_client", "[%s] Continuing chunked upload %s at byte %lld of %lld",
                         request.submission_id.c_str(), upload_id.c_str(),
                         (long long)stored_offset, (long long)request.payload_size());
        } else {
            restart();
        }
        plan_chunks();
        advance();
    }

private:
    void restart()
    {
        if (client.sessions) {
            client.sessions->forget(key);
        }
        upload_id.clear();
        tracker.initialize(request.payload_size(), chunk_size, 0);
    }

    void plan_chunks()
    {
        int64_t offset = tracker.get_offset();
        int64_t remaining = request.payload_size() - offset;
        chunk_index = (int)((offset + chunk_size - 1) / chunk_size);
        total_chunks = chunk_index + (int)((remaining + chunk_size - 1) / chunk_size);
        if (total_chunks == 0) {
            total_chunks = 1;   // an empty payload still needs an upload_id
        }
    }

    void advance()
    {
        if (tracker.is_complete() && !upload_id.empty()) {
            finalize();
        } else {
            send_chunk();
        }
    }

    HttpRequest make_request(MultipartBuilder& form, int64_t body_hint)
    {
        HttpRequest http;
        http.method = "POST";
        http.url = client.config.chunked_endpoint;
        http.set_header("Content-Type", form.content_type());
        http.body = form.finish();
        http.timeout_ms = timeouts.get_progressive_timeout_ms(request.quality, PHASE_UPLOAD,
                                                              body_hint, attempt);
        client.prepare(http);
        return http;
    }

    void add_common_fields(MultipartBuilder& form)
    {
        for (const auto& field : request.form_fields) {
            form.add_field(field.first, field.second);
        }
        if (upload_id.empty()) {
            form.add_field("create_upload_id", "1");
        } else {
            form.add_field("upload_id", upload_id);
        }
        form.add_field("metadata", request.metadata.dump());
    }

    void send_chunk()
    {
        int64_t offset = tracker.get_offset();
        pending_length = tracker.next_chunk_length();

        MultipartBuilder form;
        add_common_fields(form);
        form.add_field("chunk_index", std::to_string(chunk_index));
        form.add_field("chunk_offset", std::to_string(offset));
        form.add_field("total_chunks", std::to_string(total_chunks));
        form.add_file("audio_chunk", request.file_name + ".part" + std::to_string(chunk_index),
                      "application/octet-stream", request.payload->data() + offset,
                      (size_t)pending_length);

        HttpRequest http = make_request(form, pending_length);
        stats.on_request_sent(pending_length);

        std::shared_ptr<ChunkedSession> self = shared_from_this();
        client.transport.send(http, [self](const HttpResponse& response) {
            self->on_chunk(response);
        });
    }

    void on_chunk(const HttpResponse& response)
    {
        if (!response.transport_ok) {
            retry_or_fail(PipelineError(ERR_NETWORK, "Chunk failed: " + response.error),
                          &ChunkedSession::send_chunk);
            return;
        }

        if ((response.status == 404 || response.status == 410) && !upload_id.empty()) {
            if (attempt >= max_retries) {
                finish(PipelineError::from_http_status(response.status, "Chunk"));
                return;
            }
            attempt++;
            LOG_WARN_CTX("upload_client", "[%s] Server dropped upload %s (HTTP %d), starting over",
                         request.submission_id.c_str(), upload_id.c_str(), response.status);
            restart();
            plan_chunks();
            send_chunk();
            return;
        }

        if (!response.is_success()) {
            retry_or_fail(PipelineError::from_http_status(response.status, "Chunk"),
                          &ChunkedSession::send_chunk);
            return;
        }

        nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "Chunk response is not a JSON object",
                                 response.status));
            return;
        }
        if (upload_id.empty()) {
            upload_id = extract_upload_id(body);
            if (upload_id.empty()) {
                finish(PipelineError(ERR_MALFORMED_RESPONSE, "Chunk response without an upload_id",
                                     response.status));
                return;
            }
            LOG_INFO_CTX("upload_client", "[%s] Server opened chunked upload %s (%d chunks of %lld bytes)",
                         request.submission_id.c_str(), upload_id.c_str(), total_chunks,
                         (long long)chunk_size);
        }

        if (pending_length > 0) {
            tracker.commit(tracker.get_offset() + pending_length);
        }
        stats.on_chunk_committed(pending_length);
        timeouts.mark_progress();
        chunk_index++;
        attempt = 0;

        if (client.sessions) {
            client.sessions->save(key, upload_id, tracker.get_offset());
        }
        if (progress) {
            progress(tracker.get_offset(), tracker.get_total());
        }
        advance();
    }

    void finalize()
    {
        MultipartBuilder form;
        add_common_fields(form);
        form.add_field("finalize", "1");

        HttpRequest http = make_request(form, 0);
        stats.on_request_sent(0);

        std::shared_ptr<ChunkedSession> self = shared_from_this();
        client.transport.send(http, [self](const HttpResponse& response) {
            self->on_finalize(response);
        });
    }

    void on_finalize(const HttpResponse& response)
    {
        if (!response.transport_ok) {
            retry_or_fail(PipelineError(ERR_NETWORK, "Finalize failed: " + response.error),
                          &ChunkedSession::finalize);
            return;
        }
        if (!response.is_success()) {
            retry_or_fail(PipelineError::from_http_status(response.status, "Finalize"),
                          &ChunkedSession::finalize);
            return;
        }

        nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded()) {
            finish(PipelineError(ERR_MALFORMED_RESPONSE, "Finalize response is not JSON",
                                 response.status));
            return;
        }
        url = extract_url(body);
        response_body = response.body;
        finish(PipelineError());
    }

    void retry_or_fail(const PipelineError& error, void (ChunkedSession::*step)())
    {
        if (!error.is_retryable() || attempt >= max_retries) {
            finish(error);
            return;
        }

        size_t index = std::min((size_t)attempt, delays.size() - 1);
        int64_t delay = delays.empty() ? 0 : delays[index];
        attempt++;
        stats.on_chunk_retry();

        LOG_WARN_CTX("upload_client", "[%s] %s - chunk %d retry %d/%d in %lld ms",
                     request.submission_id.c_str(), error.to_string().c_str(), chunk_index,
                     attempt, max_retries, (long long)delay);

        std::shared_ptr<ChunkedSession> self = shared_from_this();
        client.loop.schedule_after(delay, [self, step]() {
            ((*self).*step)();
        });
    }

    void finish(const PipelineError& error)
    {
        if (finished) {
            return;
        }
        finished = true;
        client.active_transfers--;

        UploadResult result;
        result.success = error.ok();
        result.strategy = STRATEGY_CHUNKED;
        result.error = error;
        result.url = url;
        result.response_body = response_body;
        result.bytes_total = request.payload_size();
        result.bytes_sent = stats.get_bytes_sent();
        result.resumed_from = stats.get_resumed_from();
        result.chunks = stats.get_chunks_committed();
        result.chunk_retries = stats.get_chunk_retries();
        result.duration_ms = timeouts.get_ms_since_attempt_start();

        if (result.success) {
            if (client.sessions) {
                client.sessions->forget(key);
            }
            LOG_INFO_CTX("upload_client", "[%s] Chunked upload %s complete (%d chunks, %d retries, "
                         "%d requests, %.1f%% efficiency)",
                         request.submission_id.c_str(), upload_id.c_str(), result.chunks,
                         result.chunk_retries, stats.get_requests_sent(),
                         stats.get_efficiency_percent());
        } else {
            // The upload_id stays so the next attempt continues
            LOG_ERROR_CTX("upload_client", "[%s] Chunked upload failed at chunk %d/%d after %d requests: %s",
                          request.submission_id.c_str(), chunk_index, total_chunks,
                          stats.get_requests_sent(), error.to_string().c_str());
        }

        if (done) {
            done(result);
        }
    }

    ResumableUploadClient& client;
    UploadRequest request;
    UploadProgressCallback progress;
    UploadDoneCallback done;
    std::string key;
    std::string upload_id;
    std::string url;
    std::string response_body;
    UploadChunkTracker tracker;
    UploadStatistics stats;
    UploadTimeoutManager timeouts;
    int64_t chunk_size;
    std::vector<int64_t> delays;
    int max_retries;
    int chunk_index;
    int total_chunks;
    int64_t pending_length;
    int attempt;
    bool finished;
};

//=============================================================================
// Single-shot multipart POST
//=============================================================================

class ResumableUploadClient::DirectSession : public std::enable_shared_from_this<DirectSession>
{
public:
    DirectSession(ResumableUploadClient& owner, const UploadRequest& req,
                  UploadProgressCallback on_progress, UploadDoneCallback on_done)
        : client(owner),
          request(req),
          progress(on_progress),
          done(on_done),
          timeouts(owner.loop.get_clock())
    {
    }

    void start()
    {
        timeouts.start_attempt();

        MultipartBuilder form;
        for (const auto& field : request.form_fields) {
            form.add_field(field.first, field.second);
        }
        form.add_field("metadata", request.metadata.dump());
        form.add_file("audio_file", request.file_name, request.mime_type, *request.payload);

        HttpRequest http;
        http.method = "POST";
        http.url = client.config.direct_endpoint;
        http.set_header("Content-Type", form.content_type());
        http.body = form.finish();
        http.timeout_ms = timeouts.get_request_timeout_ms(request.quality, PHASE_UPLOAD,
                                                          (int64_t)http.body.size());
        client.prepare(http);
        bytes_sent = (int64_t)http.body.size();

        LOG_INFO_CTX("upload_client", "[%s] Single-shot POST of %lld bytes to %s",
                     request.submission_id.c_str(), (long long)bytes_sent, http.url.c_str());

        std::shared_ptr<DirectSession> self = shared_from_this();
        client.transport.send(http, [self](const HttpResponse& response) {
            self->on_response(response);
        });
    }

private:
    void on_response(const HttpResponse& response)
    {
        UploadResult result;
        result.strategy = STRATEGY_SINGLE_SHOT;
        result.bytes_total = request.payload_size();
        result.bytes_sent = bytes_sent;
        result.duration_ms = timeouts.get_ms_since_attempt_start();

        if (!response.transport_ok) {
            result.error = PipelineError(ERR_NETWORK, "POST failed: " + response.error);
        } else if (!response.is_success()) {
            result.error = PipelineError::from_http_status(response.status, "POST");
        } else {
            nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
            if (body.is_discarded()) {
                result.error = PipelineError(ERR_MALFORMED_RESPONSE, "Response body is not JSON",
                                             response.status);
            } else {
                result.success = true;
                result.chunks = 1;
                result.response_body = response.body;
                result.url = extract_url(body);
            }
        }

        client.active_transfers--;

        if (result.success) {
            if (progress) {
                progress(result.bytes_total, result.bytes_total);
            }
            LOG_INFO_CTX("upload_client", "[%s] Single-shot upload complete (HTTP %d)",
                         request.submission_id.c_str(), response.status);
        } else {
            LOG_ERROR_CTX("upload_client", "[%s] Single-shot upload failed: %s",
                          request.submission_id.c_str(), result.error.to_string().c_str());
        }

        if (done) {
            done(result);
        }
    }

    ResumableUploadClient& client;
    UploadRequest request;
    UploadProgressCallback progress;
    UploadDoneCallback done;
    UploadTimeoutManager timeouts;
    int64_t bytes_sent;
};

//=============================================================================
// ResumableUploadClient
//=============================================================================

ResumableUploadClient::ResumableUploadClient(const PipelineConfig& cfg, HttpTransport& http,
                                             EventLoop& event_loop, UploadSessionStore* store,
                                             RequestAuthenticator* auth)
    : config(cfg),
      transport(http),
      loop(event_loop),
      sessions(store),
      authenticator(auth),
      active_transfers(0)
{
}

ResumableUploadClient::~ResumableUploadClient()
{
    if (active_transfers > 0) {
        LOG_WARN_CTX("upload_client", "Destroyed with %d transfers in flight", active_transfers);
    }
}

UploadStrategy ResumableUploadClient::select_strategy(int64_t payload_size, Tier tier) const
{
    bool large = payload_size > config.resumable_threshold_bytes && tier != TIER_C;
    if (large && config.resumable_enabled && !config.resumable_endpoint.empty()) {
        return STRATEGY_RESUMABLE;
    }
    if (!config.chunked_endpoint.empty() && (large || config.direct_endpoint.empty())) {
        return STRATEGY_CHUNKED;
    }
    return STRATEGY_SINGLE_SHOT;
}

std::vector<UploadStrategy> ResumableUploadClient::plan_strategies(int64_t payload_size, Tier tier) const
{
    UploadStrategy first = select_strategy(payload_size, tier);

    std::vector<UploadStrategy> chain;
    if (first == STRATEGY_RESUMABLE) {
        chain.push_back(STRATEGY_RESUMABLE);
    }
    if (first != STRATEGY_SINGLE_SHOT && !config.chunked_endpoint.empty()) {
        chain.push_back(STRATEGY_CHUNKED);
    }
    if (!config.direct_endpoint.empty()) {
        chain.push_back(STRATEGY_SINGLE_SHOT);
    }
    return chain;
}

int64_t ResumableUploadClient::chunk_size_for(Tier tier, ConnectionQuality quality) const
{
    if (config.chunk_size > 0) {
        return config.chunk_size;
    }
    if (quality == QUALITY_VERY_LOW || tier == TIER_C) {
        return PipelineDefaults::CHUNK_SIZE_MINIMAL;
    }
    if (tier == TIER_A) {
        return quality == QUALITY_HIGH ? PipelineDefaults::CHUNK_SIZE_TIER_A_HIGH
                                       : PipelineDefaults::CHUNK_SIZE_TIER_A_LOW;
    }
    return quality == QUALITY_HIGH ? PipelineDefaults::CHUNK_SIZE_TIER_B_HIGH
                                   : PipelineDefaults::CHUNK_SIZE_TIER_B_LOW;
}

std::vector<int64_t> ResumableUploadClient::chunk_retry_delays(ConnectionQuality quality) const
{
    if (!config.retry_delays_ms.empty()) {
        return config.retry_delays_ms;
    }
    if (quality == QUALITY_VERY_LOW) {
        return table(PipelineDefaults::CHUNK_RETRY_DELAYS_VERY_LOW_MS);
    }
    return table(PipelineDefaults::CHUNK_RETRY_DELAYS_MS);
}

int ResumableUploadClient::max_chunk_retries(ConnectionQuality quality) const
{
    return quality == QUALITY_VERY_LOW ? PipelineDefaults::MAX_CHUNK_RETRIES_VERY_LOW
                                       : PipelineDefaults::MAX_CHUNK_RETRIES;
}

std::string ResumableUploadClient::fingerprint(const std::string& file_name, int64_t size,
                                               const std::string& mime_type)
{
    return "clip_uplink-" + file_name + "-" + std::to_string(size) + "-" + mime_type;
}

std::string ResumableUploadClient::chunked_key(const std::string& instance_id,
                                               const std::string& file_name, int64_t size)
{
    return "clip_uplink-chunked-" + instance_id + "-" + file_name + "-" + std::to_string(size);
}

std::string ResumableUploadClient::encode_metadata(const UploadRequest& request)
{
    const size_t max_chars = PipelineDefaults::METADATA_VALUE_MAX_CHARS;

    FieldList pairs;
    pairs.push_back(std::make_pair("filename", request.file_name));
    pairs.push_back(std::make_pair("filetype", request.mime_type));
    for (const auto& field : request.form_fields) {
        pairs.push_back(field);
    }
    pairs.push_back(std::make_pair("metadata", request.metadata.dump()));

    std::string header;
    for (const auto& pair : pairs) {
        std::string key = sanitize_metadata_key(pair.first);
        if (key.empty()) {
            continue;
        }
        if (!header.empty()) {
            header += ",";
        }
        header += key + " " + base64_encode(sanitize_metadata_value(pair.second, max_chars));
    }
    return header;
}

std::string ResumableUploadClient::resolve_location(const std::string& endpoint,
                                                    const std::string& location)
{
    if (location.compare(0, 7, "http://") == 0 || location.compare(0, 8, "https://") == 0) {
        return location;
    }

    size_t scheme = endpoint.find("://");
    size_t host_end = (scheme == std::string::npos) ? std::string::npos
                                                    : endpoint.find('/', scheme + 3);
    std::string origin = (host_end == std::string::npos) ? endpoint : endpoint.substr(0, host_end);

    if (!location.empty() && location[0] == '/') {
        return origin + location;
    }

    std::string base = endpoint;
    if (base.empty() || base[base.size() - 1] != '/') {
        base += "/";
    }
    return base + location;
}

void ResumableUploadClient::prepare(HttpRequest& request) const
{
    for (const auto& header : config.headers) {
        request.set_header(header.first, header.second);
    }
    if (authenticator) {
        authenticator->authenticate(request);
    }
}

void ResumableUploadClient::fail_async(UploadStrategy strategy, const PipelineError& error,
                                       UploadDoneCallback done)
{
    LOG_ERROR_CTX("upload_client", "Upload rejected before any I/O: %s", error.to_string().c_str());

    UploadResult result;
    result.strategy = strategy;
    result.error = error;
    loop.post([done, result]() {
        if (done) {
            done(result);
        }
    });
}

void ResumableUploadClient::upload(const UploadRequest& request, UploadProgressCallback progress,
                                   UploadDoneCallback done)
{
    if (!request.payload) {
        fail_async(STRATEGY_NONE, PipelineError(ERR_VALIDATION, "No payload to upload"), done);
        return;
    }

    int64_t size = request.payload_size();
    if (size > config.max_blob_size_bytes) {
        char buffer[128];
        snprintf(buffer, sizeof(buffer), "Payload of %lld bytes exceeds the %lld byte limit",
                 (long long)size, (long long)config.max_blob_size_bytes);
        fail_async(STRATEGY_NONE, PipelineError(ERR_PAYLOAD_TOO_LARGE, buffer), done);
        return;
    }

    std::vector<UploadStrategy> chain = plan_strategies(size, request.tier);
    if (chain.empty()) {
        fail_async(STRATEGY_NONE, PipelineError(ERR_CONFIGURATION, "No upload endpoint configured"), done);
        return;
    }

    LOG_INFO_CTX("upload_client", "[%s] Uploading %s (%lld bytes, tier %s, %s link) via %s",
                 request.submission_id.c_str(), request.file_name.c_str(), (long long)size,
                 tier_to_string(request.tier), quality_to_string(request.quality),
                 strategy_to_string(chain[0]));

    // Restarts and fallbacks begin again at zero; hold reports back until
    // the transfer passes the furthest point already reported
    UploadProgressCallback monotonic;
    if (progress) {
        std::shared_ptr<int64_t> high_water = std::make_shared<int64_t>(-1);
        monotonic = [progress, high_water](int64_t sent, int64_t total) {
            if (sent <= *high_water) {
                return;
            }
            *high_water = sent;
            progress(sent, total);
        };
    }

    run_chain(request, chain, 0, monotonic, done);
}

void ResumableUploadClient::run_chain(const UploadRequest& request,
                                      const std::vector<UploadStrategy>& chain, size_t step,
                                      UploadProgressCallback progress, UploadDoneCallback done)
{
    ResumableUploadClient* self = this;
    start_session(chain[step], request, progress,
                  [self, request, chain, step, progress, done](const UploadResult& result) {
        if (!result.success && result.error.kind != ERR_NETWORK && step + 1 < chain.size()) {
            LOG_WARN_CTX("upload_client", "[%s] %s upload failed (%s), falling back to %s",
                         request.submission_id.c_str(), strategy_to_string(chain[step]),
                         result.error.to_string().c_str(), strategy_to_string(chain[step + 1]));
            self->run_chain(request, chain, step + 1, progress, done);
            return;
        }

        UploadResult final_result = result;
        final_result.fallbacks = (int)step;
        if (done) {
            done(final_result);
        }
    });
}

void ResumableUploadClient::start_session(UploadStrategy strategy, const UploadRequest& request,
                                          UploadProgressCallback progress, UploadDoneCallback done)
{
    active_transfers++;
    if (strategy == STRATEGY_RESUMABLE) {
        std::shared_ptr<TusSession> session =
            std::make_shared<TusSession>(*this, request, progress, done);
        session->start();
    } else if (strategy == STRATEGY_CHUNKED) {
        std::shared_ptr<ChunkedSession> session =
            std::make_shared<ChunkedSession>(*this, request, progress, done);
        session->start();
    } else {
        std::shared_ptr<DirectSession> session =
            std::make_shared<DirectSession>(*this, request, progress, done);
        session->start();
    }
}
