// main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <stdio.h>
#include <curl/curl.h>

#include "ConfigManager.h"
#include "logger.h"
#include "StateLogger.h"
#include "Clock.h"
#include "EventLoop.h"
#include "EventBus.h"
#include "SqliteDatabase.h"
#include "PersistentQueue.h"
#include "UploadSessionStore.h"
#include "CurlHttpTransport.h"
#include "LinuxEnvironmentProbe.h"
#include "TierClassifier.h"
#include "ConnectivityMonitor.h"
#include "RetryScheduler.h"
#include "ResumableUploadClient.h"
#include "UploadCoordinator.h"
#include "SessionManager.h"
#include "SyncTrigger.h"
#include "PipelineConfig.h"
#include "PipelineConstants.h"
#include "MainLoopConstants.h"
#include "Utility.h"

using namespace std;

//
const auto VERSION = std::string("1.0.0");

// ===== Command-line options =====
struct CommandLineOptions {
    bool show_help = false;
    bool list_queue = false;
    bool flush = false;
    bool daemon = false;
    std::string config_file = "./config.txt";
    std::string submit_file;
    std::string instance_id = "cli";
    std::string transcript;
    std::string mime_type;
    FieldList fields;
};

// ===== Globals (needed for signal handlers) =====
static std::atomic<bool> g_running{true};

// ===== Help text =====
static void print_help(const char* program_name) {
    printf("\nUsage: %s [OPTIONS]\n", program_name);
    printf("\nOptions:\n");
    printf("  --config FILE       Specify config file path (default: ./config.txt)\n");
    printf("  --submit FILE       Submit FILE; queued for later if the upload fails\n");
    printf("  --instance ID       Instance id for --submit (default: cli)\n");
    printf("  --field KEY=VALUE   Form field sent with --submit (repeatable)\n");
    printf("  --transcript TEXT   Transcript sent with --submit\n");
    printf("  --mime TYPE         Mime type for --submit (default: from extension)\n");
    printf("  --list              List queued submissions and exit\n");
    printf("  --flush             Upload due queued submissions once and exit\n");
    printf("  --daemon            Keep running and drain the queue in the background\n");
    printf("  --help              Display this help message and exit\n");
    printf("\nDescription:\n");
    printf("  clip_uplink - offline-first resumable submission of audio clips\n");
    printf("\n");
    printf("  Without --list, --submit or --flush the program runs as a daemon.\n");
    printf("\n");
    printf("Examples:\n");
    printf("  %s --submit clip.webm --field site=7       # Submit one clip\n", program_name);
    printf("  %s --list                                 # Show the offline queue\n", program_name);
    printf("  %s --config /etc/clip_uplink.conf --daemon # Background sync\n", program_name);
    printf("\n");
}

// ===== Command-line parsing =====
static bool require_value(int argc, char** argv, int& i, const std::string& arg, std::string& out) {
    if (i + 1 < argc) {
        out = argv[++i];
        return true;
    }
    fprintf(stderr, "Error: %s requires an argument\n", arg.c_str());
    return false;
}

static bool parse_command_line(int argc, char** argv, CommandLineOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return true;
        }
        else if (arg == "--list") {
            options.list_queue = true;
        }
        else if (arg == "--flush") {
            options.flush = true;
        }
        else if (arg == "--daemon") {
            options.daemon = true;
        }
        else if (arg == "--config") {
            if (!require_value(argc, argv, i, arg, options.config_file)) return false;
        }
        else if (arg == "--submit") {
            if (!require_value(argc, argv, i, arg, options.submit_file)) return false;
        }
        else if (arg == "--instance") {
            if (!require_value(argc, argv, i, arg, options.instance_id)) return false;
        }
        else if (arg == "--transcript") {
            if (!require_value(argc, argv, i, arg, options.transcript)) return false;
        }
        else if (arg == "--mime") {
            if (!require_value(argc, argv, i, arg, options.mime_type)) return false;
        }
        else if (arg == "--field") {
            std::string field;
            if (!require_value(argc, argv, i, arg, field)) return false;
            size_t eq = field.find('=');
            if (eq == std::string::npos || eq == 0) {
                fprintf(stderr, "Error: --field expects KEY=VALUE, got '%s'\n", field.c_str());
                return false;
            }
            options.fields.push_back(std::make_pair(field.substr(0, eq), field.substr(eq + 1)));
        }
        else {
            fprintf(stderr, "Error: Unknown option '%s'\n", arg.c_str());
            return false;
        }
    }
    return true;
}

// ===== Helpers =====
static void handle_stop_signal(int) {
    g_running = false;
}

// Runs the loop until done() holds, a stop signal arrives or timeout_sec passes
static bool run_loop_until(EventLoop& loop, std::function<bool()> done, int timeout_sec) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (g_running.load() && !done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_ERROR("Gave up waiting after %d s", timeout_sec);
            return false;
        }
        if (!loop.run_once()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(MAIN_LOOP_IDLE_SLEEP_MS));
        }
    }
    return done();
}

// ===== Config validation (sane ranges, endpoints) =====
static bool validate_config(const PipelineConfig& config) {
    bool ok = true;

    if (config.max_retries < MAX_RETRIES_MIN || config.max_retries > MAX_RETRIES_MAX) {
        LOG_ERROR("queue.max_retries=%d out of range [%d..%d]",
                  config.max_retries, MAX_RETRIES_MIN, MAX_RETRIES_MAX);
        ok = false;
    }
    if (config.max_blob_size_bytes < BLOB_SIZE_MIN_BYTES || config.max_blob_size_bytes > BLOB_SIZE_MAX_BYTES) {
        LOG_ERROR("queue.max_blob_size_bytes=%lld out of range [%lld..%lld]",
                  (long long)config.max_blob_size_bytes, (long long)BLOB_SIZE_MIN_BYTES,
                  (long long)BLOB_SIZE_MAX_BYTES);
        ok = false;
    }
    if (config.max_total_bytes < config.max_blob_size_bytes) {
        LOG_ERROR("queue.max_total_bytes=%lld is smaller than queue.max_blob_size_bytes",
                  (long long)config.max_total_bytes);
        ok = false;
    }
    if (config.max_age_hours < MAX_AGE_MIN_HOURS || config.max_age_hours > MAX_AGE_MAX_HOURS) {
        LOG_ERROR("queue.max_age_hours=%d out of range [%d..%d]",
                  config.max_age_hours, MAX_AGE_MIN_HOURS, MAX_AGE_MAX_HOURS);
        ok = false;
    }
    if (config.chunk_size != 0 &&
        (config.chunk_size < CHUNK_SIZE_MIN_BYTES || config.chunk_size > CHUNK_SIZE_MAX_BYTES)) {
        LOG_ERROR("upload.chunk_size=%lld out of range [%lld..%lld] (0 = tier table)",
                  (long long)config.chunk_size, (long long)CHUNK_SIZE_MIN_BYTES,
                  (long long)CHUNK_SIZE_MAX_BYTES);
        ok = false;
    }
    if (config.live_attempts < LIVE_ATTEMPTS_MIN || config.live_attempts > LIVE_ATTEMPTS_MAX) {
        LOG_ERROR("retry.live_attempts=%d out of range [%d..%d]",
                  config.live_attempts, LIVE_ATTEMPTS_MIN, LIVE_ATTEMPTS_MAX);
        ok = false;
    }
    if (config.base_delay_ms < BASE_DELAY_MIN_MS || config.base_delay_ms > BASE_DELAY_MAX_MS) {
        LOG_ERROR("retry.base_delay_ms=%d out of range [%d..%d]",
                  config.base_delay_ms, BASE_DELAY_MIN_MS, BASE_DELAY_MAX_MS);
        ok = false;
    }
    if (config.cap_multiplier < CAP_MULTIPLIER_MIN || config.cap_multiplier > CAP_MULTIPLIER_MAX) {
        LOG_ERROR("retry.cap_multiplier=%d out of range [%d..%d]",
                  config.cap_multiplier, CAP_MULTIPLIER_MIN, CAP_MULTIPLIER_MAX);
        ok = false;
    }
    if (config.jitter_factor < 0.0 || config.jitter_factor > 1.0) {
        LOG_ERROR("retry.jitter_factor=%.3f out of range [0..1]", config.jitter_factor);
        ok = false;
    }
    if (config.breaker_threshold < BREAKER_THRESHOLD_MIN || config.breaker_threshold > BREAKER_THRESHOLD_MAX) {
        LOG_ERROR("breaker.threshold=%d out of range [%d..%d]",
                  config.breaker_threshold, BREAKER_THRESHOLD_MIN, BREAKER_THRESHOLD_MAX);
        ok = false;
    }
    if (config.breaker_timeout_ms < BREAKER_TIMEOUT_MIN_MS || config.breaker_timeout_ms > BREAKER_TIMEOUT_MAX_MS) {
        LOG_ERROR("breaker.timeout_ms=%lld out of range [%lld..%lld]",
                  (long long)config.breaker_timeout_ms, (long long)BREAKER_TIMEOUT_MIN_MS,
                  (long long)BREAKER_TIMEOUT_MAX_MS);
        ok = false;
    }
    if (config.sync_period_seconds < SYNC_PERIOD_MIN_SEC || config.sync_period_seconds > SYNC_PERIOD_MAX_SEC) {
        LOG_ERROR("sync.period_seconds=%d out of range [%d..%d]",
                  config.sync_period_seconds, SYNC_PERIOD_MIN_SEC, SYNC_PERIOD_MAX_SEC);
        ok = false;
    }
    if (config.sync_startup_delay_ms < 0 || config.sync_startup_delay_ms > SYNC_STARTUP_DELAY_MAX_MS) {
        LOG_ERROR("sync.startup_delay_ms=%d out of range [0..%d]",
                  config.sync_startup_delay_ms, SYNC_STARTUP_DELAY_MAX_MS);
        ok = false;
    }

    // No endpoint at all means nothing can ever leave the queue (warning only)
    if (config.direct_endpoint.empty() && config.chunked_endpoint.empty() &&
        (!config.resumable_enabled || config.resumable_endpoint.empty())) {
        LOG_WARN("No upload endpoint configured; submissions will only be queued");
    } else if (config.direct_endpoint.empty() && config.chunked_endpoint.empty()) {
        LOG_WARN("upload.direct_endpoint not set; small files and tier C devices cannot upload");
    }

    if (!ok) LOG_ERROR("Configuration invalid.");
    else     LOG_INFO("Configuration validated.");
    return ok;
}

static void print_queue(PersistentQueue& queue) {
    std::vector<QueueEntrySummary> entries;
    PipelineError error;
    if (!queue.list(entries, error)) {
        fprintf(stderr, "Error: cannot read queue: %s\n", error.to_string().c_str());
        return;
    }
    printf("%zu queued submission(s), %lld bytes\n", entries.size(), (long long)queue.total_bytes());
    for (const auto& e : entries) {
        printf("  %-36s %-10s retries=%-3d %10lld B  %s%s%s\n",
               e.id.c_str(), record_status_to_string(e.status), e.retry_count,
               (long long)e.payload_size, e.file_name.c_str(),
               e.error.empty() ? "" : "  last error: ", e.error.c_str());
    }
}

int main(int argc, char** argv) {
    // ---- Parse command-line arguments ----
    CommandLineOptions options;
    if (!parse_command_line(argc, argv, options)) {
        print_help(argv[0]);
        return EXIT_FAILURE;
    }

    if (options.show_help) {
        print_help(argv[0]);
        return EXIT_SUCCESS;
    }

    // ---- Config first ----
    const std::string cfg_path = options.config_file;
    auto& cfg = ConfigManager::instance();
    if (!cfg.load(cfg_path)) {
        // Can't log yet, so use cerr
        std::cerr << "ERROR: Failed to load config file: " << cfg_path << std::endl;
        return EXIT_FAILURE;
    }

    // ---- Logger initialization with config ----
    std::string log_directory = cfg.get_log_directory();
    if (!init_logger(log_directory, cfg.get_log_level())) {
        return EXIT_FAILURE;
    }
    if (!StateLogger::instance().init(log_directory)) {
        LOG_WARN("State log not available in %s", log_directory.c_str());
    }

    LOG_INFO("clip_uplink %s starting", cfg.get("system.version", std::string(VERSION)).c_str());
    LOG_INFO("Config loaded from: %s", cfg_path.c_str());
    LOG_INFO("system.log_directory: %s", log_directory.c_str());
    LOG_INFO("system.log_level: %s", cfg.get_log_level().c_str());

    const PipelineConfig config = PipelineConfig::from_config(cfg);
    config.log_values();
    if (!validate_config(config)) return EXIT_FAILURE;

    // ---- Signals ----
    signal(SIGTERM, &handle_stop_signal);
    signal(SIGINT, &handle_stop_signal);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_CRITICAL("curl_global_init failed");
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    {
        // ---- Storage ----
        SystemClock clock;
        EventLoop loop(clock);
        EventBus bus;

        SqliteDatabase db;
        if (!db.open(config.database_file)) {
            LOG_CRITICAL("Cannot open queue database %s: %s", config.database_file.c_str(),
                         db.last_error().c_str());
            curl_global_cleanup();
            return EXIT_FAILURE;
        }

        PersistentQueue queue(db, clock, config, &bus);
        PipelineError error;
        if (!queue.initialize(error)) {
            LOG_CRITICAL("Queue initialization failed: %s", error.to_string().c_str());
            curl_global_cleanup();
            return EXIT_FAILURE;
        }
        UploadSessionStore session_store(db, clock);
        bool sessions_ok = session_store.initialize();
        if (!sessions_ok) {
            LOG_WARN("Resumable session store unavailable; interrupted uploads restart from zero");
        }

        if (options.list_queue) {
            print_queue(queue);
            if (options.submit_file.empty() && !options.flush && !options.daemon) {
                curl_global_cleanup();
                return EXIT_SUCCESS;
            }
        }

        // ---- Network & environment ----
        CurlHttpTransport transport;
        if (!transport.is_ready()) {
            LOG_CRITICAL("libcurl multi handle unavailable");
            curl_global_cleanup();
            return EXIT_FAILURE;
        }
        loop.add_poller([&transport]() { return transport.poll(); });

        LinuxEnvironmentProbe probe(LinuxProbeOptions::from_config(cfg));
        TierClassifier classifier(&probe);
        if (!classifier.detect()) {
            LOG_WARN("Environment probe failed; using minimal settings");
        }
        ConnectivityMonitor connectivity(&probe, probe.link_is_up());

        // ---- Pipeline ----
        RetryScheduler scheduler(clock, config);
        ResumableUploadClient client(config, transport, loop,
                                     sessions_ok ? &session_store : nullptr);
        UploadCoordinator coordinator(client, scheduler, loop, &bus);

        PipelineServices services;
        services.config = config;
        services.loop = &loop;
        services.bus = &bus;
        services.classifier = &classifier;
        services.connectivity = &connectivity;
        services.queue = &queue;
        services.coordinator = &coordinator;

        SessionManager session_manager(services);
        SyncTrigger sync(queue, coordinator, scheduler, classifier, connectivity, loop, config);

        bus.subscribe([](const PipelineEvent& event) {
            if (event.type == EVENT_UPLOAD_PROGRESS || event.type == EVENT_QUEUE_UPDATED) {
                return;
            }
            printf("[%s] %s%s%s\n", event_type_to_string(event.type), event.submission_id.c_str(),
                   event.message.empty() ? "" : ": ", event.message.c_str());
        });

        // Link state is polled; the probe has no change notification
        std::function<void()> poll_connectivity;
        poll_connectivity = [&]() {
            connectivity.refresh();
            loop.schedule_after(PipelineDefaults::CONNECTIVITY_POLL_MS, poll_connectivity);
        };
        loop.schedule_after(PipelineDefaults::CONNECTIVITY_POLL_MS, poll_connectivity);

        std::function<void()> expire_sessions;
        expire_sessions = [&]() {
            int removed = sessions_ok ? session_store.expire((int64_t)SESSION_MAX_AGE_HOURS * 3600 * 1000) : 0;
            if (removed > 0) {
                LOG_INFO("Forgot %d stale resumable sessions", removed);
            }
            loop.schedule_after((int64_t)SESSION_EXPIRY_CHECK_INTERVAL_SEC * 1000, expire_sessions);
        };
        loop.post(expire_sessions);

        LOG_INFO("Startup complete: tier %s, connection %s, %s, %d queued",
                 tier_to_string(classifier.get_tier()), quality_to_string(classifier.get_quality()),
                 connectivity.is_online() ? "online" : "offline", queue.pending_count());

        // ---- One-shot submit ----
        if (!options.submit_file.empty()) {
            std::shared_ptr<std::vector<uint8_t>> data = std::make_shared<std::vector<uint8_t>>();
            std::shared_ptr<SubmissionStateMachine> machine;
            if (!read_file_bytes(options.submit_file, *data)) {
                fprintf(stderr, "Error: cannot read %s\n", options.submit_file.c_str());
                exit_code = EXIT_FAILURE;
            } else if (!(machine = session_manager.create(options.instance_id, error))) {
                fprintf(stderr, "Error: %s\n", error.to_string().c_str());
                exit_code = EXIT_FAILURE;
            } else {
                std::string file_name = base_name(options.submit_file);
                std::string mime = options.mime_type.empty() ? guess_mime_type(file_name)
                                                             : options.mime_type;
                bool ok = session_manager.attach_file(options.instance_id, file_name, mime, data, error);
                if (ok && !options.transcript.empty()) {
                    ok = session_manager.update_transcript(options.instance_id, options.transcript, error);
                }
                if (ok) {
                    ok = session_manager.submit(options.instance_id, options.fields, error);
                }
                if (!ok) {
                    fprintf(stderr, "Error: %s\n", error.to_string().c_str());
                    exit_code = EXIT_FAILURE;
                } else {
                    run_loop_until(loop, [&machine]() {
                        SubmissionStatus s = machine->get_status();
                        return s == SUB_COMPLETE || s == SUB_QUEUED || s == SUB_ERROR;
                    }, ONE_SHOT_TIMEOUT_SEC);

                    const ApplicationState& state = machine->get_state();
                    switch (state.status) {
                        case SUB_COMPLETE:
                            printf("Submitted %s%s%s\n", state.submission.submission_id.c_str(),
                                   state.submission.final_url.empty() ? "" : " -> ",
                                   state.submission.final_url.c_str());
                            break;
                        case SUB_QUEUED:
                            printf("Queued %s: %s\n", state.submission.submission_id.c_str(),
                                   state.message.c_str());
                            break;
                        default:
                            fprintf(stderr, "Submission failed: %s\n", state.message.empty()
                                    ? state.error.to_string().c_str() : state.message.c_str());
                            exit_code = EXIT_FAILURE;
                            break;
                    }
                }
            }
        }

        // ---- One-shot flush ----
        if (options.flush && g_running.load()) {
            if (!sync.flush_now("manual")) {
                printf("Flush skipped (%s)\n", connectivity.is_online() ? "already running" : "offline");
            } else {
                run_loop_until(loop, [&sync]() { return !sync.is_flushing(); }, ONE_SHOT_TIMEOUT_SEC);
                const FlushSummary& s = sync.get_last_summary();
                printf("Flush: examined=%d uploaded=%d rescheduled=%d halted=%d skipped=%d (%s)\n",
                       s.examined, s.uploaded, s.rescheduled, s.halted, s.skipped,
                       s.stop_reason.c_str());
            }
        }

        // ---- Daemon ----
        bool one_shot = options.list_queue || !options.submit_file.empty() || options.flush;
        if (g_running.load() && (options.daemon || !one_shot)) {
            sync.start();
            LOG_INFO("Entering main loop.");
            loop.run(g_running, MAIN_LOOP_IDLE_SLEEP_MS);
            LOG_INFO("Stop requested, shutting down...");
            sync.stop();
        }

        // Let finished transfers report before the pipeline goes away
        loop.run_until_idle(1000);
        LOG_INFO("%d submissions still queued", queue.pending_count());
    }

    curl_global_cleanup();
    StateLogger::instance().close();
    cleanup_logger();
    return exit_code;
}
