#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <dirent.h>
#include <unistd.h>

#include "Clock.h"
#include "ConnectivityMonitor.h"
#include "EnvironmentProbe.h"
#include "EventBus.h"
#include "EventLoop.h"
#include "HttpTransport.h"
#include "PersistentQueue.h"
#include "PipelineConfig.h"
#include "PipelineServices.h"
#include "ResumableUploadClient.h"
#include "RetryScheduler.h"
#include "SqliteDatabase.h"
#include "TierClassifier.h"
#include "UploadCoordinator.h"
#include "UploadSessionStore.h"

// Time only moves when the test says so
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000LL) : now(start_ms) {}

    int64_t now_ms() const override { return now; }
    void advance(int64_t ms) { now += ms; }
    void set(int64_t ms) { now = ms; }

private:
    int64_t now;
};

inline HttpResponse http_response(int status, const FieldList& headers = FieldList(),
                                  const std::string& body = std::string())
{
    HttpResponse r;
    r.transport_ok = true;
    r.status = status;
    for (const auto& h : headers) {
        std::string name = h.first;
        for (char& c : name) {
            c = (char)tolower((unsigned char)c);
        }
        r.headers[name] = h.second;
    }
    r.body = body;
    return r;
}

inline HttpResponse network_failure(const std::string& reason = "Connection refused")
{
    HttpResponse r;
    r.transport_ok = false;
    r.error = reason;
    return r;
}

// Scripted HTTP. Requests are answered by `handler` on the next poll(),
// never from inside send().
class FakeHttpTransport : public HttpTransport {
public:
    typedef std::function<HttpResponse(const HttpRequest&)> Handler;

    FakeHttpTransport() : handler([](const HttpRequest&) { return network_failure(); }) {}

    void set_handler(Handler h) { handler = h; }

    void send(const HttpRequest& request, HttpCallback callback) override {
        requests.push_back(request);
        pending.push_back(std::make_pair(request, callback));
    }

    bool poll() override {
        std::deque<std::pair<HttpRequest, HttpCallback>> batch;
        batch.swap(pending);
        for (auto& item : batch) {
            HttpResponse response = handler(item.first);
            item.second(response);
        }
        return !pending.empty();
    }

    size_t count(const std::string& method) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.method == method) n++;
        }
        return n;
    }

    static std::string header(const HttpRequest& request, const std::string& name) {
        for (const auto& h : request.headers) {
            if (h.first == name) return h.second;
        }
        return std::string();
    }

    std::vector<HttpRequest> requests;

private:
    Handler handler;
    std::deque<std::pair<HttpRequest, HttpCallback>> pending;
};

class FakeProbe : public EnvironmentProbe {
public:
    FakeProbe() : ok(true), link_up(true) {
        caps.has_recorder_api = true;
        caps.has_realtime_api = true;
        caps.device_memory_gb = 8.0;
        caps.logical_cores = 8;
        caps.effective_type = "4g";
        caps.downlink_mbps = 10.0;
        caps.rtt_ms = 50;
        caps.storage_available_bytes = 10LL * 1024 * 1024 * 1024;
        caps.user_agent = "clip_uplink-test";
        caps.mic_permission = MIC_GRANTED;
    }

    bool probe(CapabilityDescriptor& out) override {
        if (ok) out = caps;
        return ok;
    }
    bool link_is_up() override { return link_up; }

    CapabilityDescriptor caps;
    bool ok;
    bool link_up;
};

// Flat temporary directory, removed with its files
class TempDir {
public:
    TempDir() {
        char pattern[] = "/tmp/clip_uplink_test_XXXXXX";
        char* made = mkdtemp(pattern);
        path = made ? made : "/tmp";
    }

    ~TempDir() {
        if (path == "/tmp") return;
        DIR* dir = opendir(path.c_str());
        if (dir) {
            struct dirent* entry;
            while ((entry = readdir(dir)) != nullptr) {
                std::string name = entry->d_name;
                if (name != "." && name != "..") {
                    unlink((path + "/" + name).c_str());
                }
            }
            closedir(dir);
        }
        rmdir(path.c_str());
    }

    std::string file(const std::string& name) const { return path + "/" + name; }

    std::string path;

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

inline PipelineConfig make_config()
{
    PipelineConfig c;
    c.resumable_endpoint = "https://uploads.example.org/files/";
    c.direct_endpoint = "https://api.example.org/submit";
    c.jitter_factor = 0.0;
    return c;
}

inline std::shared_ptr<std::vector<uint8_t>> make_payload(size_t size, uint8_t seed = 7)
{
    std::shared_ptr<std::vector<uint8_t>> data = std::make_shared<std::vector<uint8_t>>(size);
    for (size_t i = 0; i < size; i++) {
        (*data)[i] = (uint8_t)((i * 31 + seed) & 0xFF);
    }
    return data;
}

inline SubmissionRecord make_record(const std::string& file_name, size_t size)
{
    SubmissionRecord r;
    r.instance_id = "instance-1";
    r.file_name = file_name;
    r.mime_type = "audio/webm";
    r.payload = *make_payload(size);
    r.form_fields.push_back(std::make_pair("site", "7"));
    r.metadata.transcript = "hello";
    return r;
}

// Runs the loop until idle, then jumps the clock to each pending timer
// until none remain (or max_jumps is reached)
inline void drain(EventLoop& loop, ManualClock& clock, int max_jumps = 1000)
{
    loop.run_until_idle();
    for (int i = 0; i < max_jumps && loop.pending_timers() > 0; i++) {
        clock.advance(loop.ms_until_next_timer());
        loop.run_until_idle();
    }
}

// Runs until idle and only fires timers that are due within `horizon_ms`
inline void drain_for(EventLoop& loop, ManualClock& clock, int64_t horizon_ms)
{
    int64_t end = clock.now_ms() + horizon_ms;
    loop.run_until_idle();
    while (loop.pending_timers() > 0) {
        int64_t next = clock.now_ms() + loop.ms_until_next_timer();
        if (next > end) break;
        clock.set(next);
        loop.run_until_idle();
    }
    clock.set(end);
    loop.run_until_idle();
}

// Everything a submission or flush needs, wired against fakes
struct TestPipeline {
    explicit TestPipeline(const PipelineConfig& cfg = make_config())
        : config(cfg),
          loop(clock),
          connectivity(nullptr, true),
          classifier(&probe)
    {
        config.database_file = dir.file("queue.db");
        db.open(config.database_file);
        queue.reset(new PersistentQueue(db, clock, config, &bus));
        PipelineError error;
        queue->initialize(error);
        sessions.reset(new UploadSessionStore(db, clock));
        sessions->initialize();
        loop.add_poller([this]() { return transport.poll(); });

        classifier.detect();
        scheduler.reset(new RetryScheduler(clock, config, []() { return 0.0; }));
        client.reset(new ResumableUploadClient(config, transport, loop, sessions.get()));
        coordinator.reset(new UploadCoordinator(*client, *scheduler, loop, &bus));

        services.config = config;
        services.loop = &loop;
        services.bus = &bus;
        services.classifier = &classifier;
        services.connectivity = &connectivity;
        services.queue = queue.get();
        services.coordinator = coordinator.get();
    }

    void drain_all() { drain(loop, clock); }

    TempDir dir;
    PipelineConfig config;
    ManualClock clock;
    EventLoop loop;
    EventBus bus;
    SqliteDatabase db;
    FakeHttpTransport transport;
    FakeProbe probe;
    ConnectivityMonitor connectivity;
    TierClassifier classifier;
    std::unique_ptr<PersistentQueue> queue;
    std::unique_ptr<UploadSessionStore> sessions;
    std::unique_ptr<RetryScheduler> scheduler;
    std::unique_ptr<ResumableUploadClient> client;
    std::unique_ptr<UploadCoordinator> coordinator;
    PipelineServices services;
};

#endif // TEST_SUPPORT_H
