#include <gtest/gtest.h>

#include <stdexcept>

#include "SessionManager.h"
#include "SubmissionStateMachine.h"
#include "TestSupport.h"

class SubmissionStateMachineTest : public ::testing::Test {
protected:
    explicit SubmissionStateMachineTest(const PipelineConfig& config = make_config())
        : p(config), sessions(p.services) {}

    void SetUp() override
    {
        p.bus.subscribe([this](const PipelineEvent& event) {
            if (event.type != EVENT_QUEUE_UPDATED) {
                events.push_back(event);
            }
        });
        PipelineError error;
        machine = sessions.create("instance-1", error);
        ASSERT_TRUE(machine != nullptr) << error.to_string();
    }

    void make_ready(size_t size = 4096)
    {
        PipelineError error;
        ASSERT_TRUE(sessions.attach_file("instance-1", "clip.webm", "audio/webm",
                                         make_payload(size), error)) << error.to_string();
        ASSERT_EQ(SUB_READY_TO_SUBMIT, machine->get_status());
    }

    bool submit(PipelineError& error)
    {
        FieldList fields;
        fields.push_back(std::make_pair("site", "7"));
        return sessions.submit("instance-1", fields, error);
    }

    bool saw(PipelineEventType type) const
    {
        for (const PipelineEvent& e : events) {
            if (e.type == type) return true;
        }
        return false;
    }

    TestPipeline p;
    SessionManager sessions;
    std::shared_ptr<SubmissionStateMachine> machine;
    std::vector<PipelineEvent> events;
};

TEST_F(SubmissionStateMachineTest, InitializeCapturesEnvironmentAndTier)
{
    EXPECT_EQ(SUB_IDLE, machine->get_status());
    EXPECT_EQ(TIER_A, machine->get_state().tier);
    EXPECT_EQ("A", machine->get_state().environment["tier"].get<std::string>());
    EXPECT_EQ("instance-1", machine->get_instance_id());
}

TEST_F(SubmissionStateMachineTest, RecordingLifecycleEndsComplete)
{
    const std::string reply = "{\"url\":\"https://api.example.org/clips/1\"}";
    p.transport.set_handler([&reply](const HttpRequest&) { return http_response(200, {}, reply); });
    PipelineError error;

    ASSERT_TRUE(sessions.start_calibration("instance-1", error));
    EXPECT_EQ(SUB_CALIBRATING, machine->get_status());
    CalibrationSnapshot snapshot;
    snapshot.gain = 1.8;
    ASSERT_TRUE(sessions.complete_calibration("instance-1", snapshot, error));
    EXPECT_TRUE(machine->get_state().calibration.complete);

    ASSERT_TRUE(sessions.start_recording("instance-1", error));
    EXPECT_EQ(SUB_RECORDING, machine->get_status());
    ASSERT_TRUE(sessions.stop_recording("instance-1", error));
    EXPECT_EQ(SUB_PROCESSING, machine->get_status());
    ASSERT_TRUE(sessions.recording_available("instance-1", "", "", make_payload(4096), error));
    EXPECT_EQ(SUB_READY_TO_SUBMIT, machine->get_status());
    EXPECT_EQ("recording", machine->get_state().source.kind);
    EXPECT_EQ("recording.webm", machine->get_state().source.file_name);
    EXPECT_EQ("audio/webm", machine->get_state().source.mime_type);

    ASSERT_TRUE(sessions.update_transcript("instance-1", "the quick brown fox", error));
    ASSERT_TRUE(submit(error));
    EXPECT_EQ(SUB_SUBMITTING, machine->get_status());
    EXPECT_EQ(0u, machine->get_state().submission.submission_id.find("sub-"));

    p.drain_all();
    EXPECT_EQ(SUB_COMPLETE, machine->get_status());
    EXPECT_EQ("https://api.example.org/clips/1", machine->get_state().submission.final_url);
    EXPECT_DOUBLE_EQ(1.0, machine->get_state().submission.progress);
    EXPECT_EQ(STRATEGY_SINGLE_SHOT, machine->get_state().submission.strategy);
    EXPECT_TRUE(saw(EVENT_SUBMISSION_STARTED));
    EXPECT_TRUE(saw(EVENT_UPLOAD_PROGRESS));
    EXPECT_TRUE(saw(EVENT_SUBMISSION_COMPLETE));
    EXPECT_EQ(0, p.queue->pending_count());

    // Metadata travels with the upload
    ASSERT_EQ(1u, p.transport.requests.size());
    EXPECT_NE(std::string::npos, p.transport.requests[0].body.find("the quick brown fox"));
}

TEST_F(SubmissionStateMachineTest, OfflineSubmitIsQueuedWithoutNetworkAttempt)
{
    make_ready();
    p.connectivity.set_online(false);
    int before = p.queue->pending_count();

    PipelineError error;
    ASSERT_TRUE(sessions.update_transcript("instance-1", "offline words", error));
    ASSERT_TRUE(submit(error));

    EXPECT_EQ(SUB_QUEUED, machine->get_status());
    EXPECT_TRUE(machine->get_state().submission.is_queued);
    EXPECT_EQ("Saved offline, will retry automatically", machine->get_state().message);
    EXPECT_EQ(before + 1, p.queue->pending_count());
    EXPECT_TRUE(p.transport.requests.empty());
    EXPECT_TRUE(saw(EVENT_SUBMISSION_QUEUED));

    std::vector<SubmissionRecord> records;
    ASSERT_TRUE(p.queue->get_all(records, error));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(machine->get_state().submission.submission_id, records[0].id);
    EXPECT_EQ("offline words", records[0].metadata.transcript);
    EXPECT_EQ(*make_payload(4096), records[0].payload);
    EXPECT_EQ(0, records[0].last_attempt_at);
    ASSERT_EQ(1u, records[0].form_fields.size());
    EXPECT_EQ("7", records[0].form_fields[0].second);
}

TEST_F(SubmissionStateMachineTest, NetworkFailureAfterLiveRetriesIsQueued)
{
    make_ready();
    PipelineError error;
    ASSERT_TRUE(submit(error));
    p.drain_all();

    EXPECT_EQ(SUB_QUEUED, machine->get_status());
    EXPECT_EQ(ERR_NETWORK, machine->get_state().error.kind);
    EXPECT_EQ(2u, p.transport.requests.size());
    EXPECT_EQ(1, p.queue->pending_count());

    std::vector<SubmissionRecord> records;
    ASSERT_TRUE(p.queue->get_all(records, error));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(RECORD_PENDING, records[0].status);
    EXPECT_GT(records[0].last_attempt_at, 0);
}

TEST_F(SubmissionStateMachineTest, RejectedSubmissionIsKeptForReview)
{
    p.transport.set_handler([](const HttpRequest&) { return http_response(422); });
    make_ready();
    PipelineError error;
    ASSERT_TRUE(submit(error));
    p.drain_all();

    EXPECT_EQ(SUB_QUEUED, machine->get_status());
    EXPECT_EQ("The server rejected this submission. It was kept for review",
              machine->get_state().message);
    EXPECT_EQ(0, p.queue->pending_count());

    std::vector<SubmissionRecord> records;
    ASSERT_TRUE(p.queue->get_all(records, error));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(RECORD_FAILED, records[0].status);
}

TEST_F(SubmissionStateMachineTest, OpenBreakerQueuesWithoutAnAttempt)
{
    for (int i = 0; i < 5; i++) {
        p.scheduler->breaker().record_failure();
    }
    make_ready();
    PipelineError error;
    ASSERT_TRUE(submit(error));

    EXPECT_EQ(SUB_QUEUED, machine->get_status());
    EXPECT_EQ(ERR_CIRCUIT_OPEN, machine->get_state().error.kind);
    EXPECT_EQ("Retries paused, the server is not responding. Next attempt in 300 s",
              machine->get_state().message);
    EXPECT_TRUE(p.transport.requests.empty());
    EXPECT_TRUE(saw(EVENT_RETRIES_PAUSED));
    EXPECT_EQ(1, p.queue->pending_count());
}

TEST_F(SubmissionStateMachineTest, CommandsOutsideTheirStateAreRejected)
{
    PipelineError error;
    EXPECT_FALSE(submit(error));
    EXPECT_EQ(ERR_VALIDATION, error.kind);
    EXPECT_FALSE(sessions.stop_recording("instance-1", error));
    EXPECT_FALSE(sessions.complete_calibration("instance-1", CalibrationSnapshot(), error));
    EXPECT_EQ(SUB_IDLE, machine->get_status());

    ASSERT_TRUE(sessions.start_recording("instance-1", error));
    EXPECT_FALSE(sessions.attach_file("instance-1", "a.wav", "", make_payload(10), error));
    EXPECT_EQ(SUB_RECORDING, machine->get_status());
}

TEST_F(SubmissionStateMachineTest, EmptyOrOversizePayloadIsRefused)
{
    PipelineError error;
    std::shared_ptr<std::vector<uint8_t>> empty = std::make_shared<std::vector<uint8_t>>();
    EXPECT_FALSE(sessions.attach_file("instance-1", "a.wav", "", empty, error));
    EXPECT_EQ(ERR_VALIDATION, error.kind);

    EXPECT_FALSE(sessions.attach_file("instance-1", "a.wav", "",
                                      make_payload((size_t)p.queue->get_max_blob_size() + 1), error));
    EXPECT_EQ(ERR_PAYLOAD_TOO_LARGE, error.kind);
    EXPECT_EQ(SUB_IDLE, machine->get_status());

    ASSERT_TRUE(sessions.attach_file("instance-1", "a.wav", "", make_payload(10), error));
    EXPECT_EQ("audio/wav", machine->get_state().source.mime_type);
}

TEST_F(SubmissionStateMachineTest, ResetKeepsIdentityAndTier)
{
    make_ready();
    PipelineError error;
    ASSERT_TRUE(sessions.update_transcript("instance-1", "words", error));
    ASSERT_TRUE(sessions.reset("instance-1", error));

    const ApplicationState& state = machine->get_state();
    EXPECT_EQ(SUB_IDLE, state.status);
    EXPECT_EQ("instance-1", state.instance_id);
    EXPECT_EQ(TIER_A, state.tier);
    EXPECT_EQ("A", state.environment["tier"].get<std::string>());
    EXPECT_TRUE(state.transcript.empty());
    EXPECT_FALSE(state.source.data);
}

TEST_F(SubmissionStateMachineTest, LateFailureAfterResetIsStillQueued)
{
    make_ready();
    PipelineError error;
    ASSERT_TRUE(submit(error));
    ASSERT_TRUE(sessions.reset("instance-1", error));

    p.drain_all();
    EXPECT_EQ(SUB_IDLE, machine->get_status());
    EXPECT_EQ(1, p.queue->pending_count());
}

TEST_F(SubmissionStateMachineTest, LateFailureAfterDestroyIsStillQueued)
{
    make_ready();
    PipelineError error;
    ASSERT_TRUE(submit(error));
    machine.reset();
    ASSERT_TRUE(sessions.destroy("instance-1"));

    p.drain_all();
    EXPECT_EQ(1, p.queue->pending_count());
}

TEST_F(SubmissionStateMachineTest, FailMovesToErrorAndResetRecovers)
{
    PipelineError error;
    ASSERT_TRUE(sessions.start_recording("instance-1", error));
    ASSERT_TRUE(sessions.fail("instance-1", PipelineError(ERR_VALIDATION, "microphone lost"), error));
    EXPECT_EQ(SUB_ERROR, machine->get_status());
    EXPECT_TRUE(saw(EVENT_SUBMISSION_FAILED));

    ASSERT_TRUE(sessions.reset("instance-1", error));
    EXPECT_EQ(SUB_IDLE, machine->get_status());
}

TEST_F(SubmissionStateMachineTest, ThrowingListenerDoesNotLoseTheSubmission)
{
    int later_listener_calls = 0;
    p.bus.subscribe([](const PipelineEvent& event) {
        if (event.type == EVENT_SUBMISSION_QUEUED) {
            throw std::runtime_error("ui crashed");
        }
    });
    p.bus.subscribe([&later_listener_calls](const PipelineEvent& event) {
        if (event.type == EVENT_SUBMISSION_QUEUED) {
            later_listener_calls++;
        }
    });

    make_ready();
    p.connectivity.set_online(false);
    PipelineError error;
    ASSERT_TRUE(submit(error));

    EXPECT_EQ(SUB_QUEUED, machine->get_status());
    EXPECT_EQ(1, p.queue->pending_count());
    EXPECT_EQ(1, later_listener_calls);
    EXPECT_EQ(1, p.bus.get_listener_failures());
}

TEST_F(SubmissionStateMachineTest, ReentrantCommandFromListenerIsDropped)
{
    PipelineError nested_error;
    p.bus.subscribe([this, &nested_error](const PipelineEvent& event) {
        if (event.type == EVENT_SUBMISSION_STARTED) {
            submit(nested_error);
        }
    });

    make_ready();
    p.connectivity.set_online(false);
    PipelineError error;
    ASSERT_TRUE(submit(error));

    EXPECT_EQ(ERR_REENTRANCY_GUARD, nested_error.kind);
    EXPECT_EQ(1, sessions.get_dropped_commands());
    EXPECT_EQ(1, p.queue->pending_count());
}

TEST_F(SubmissionStateMachineTest, InstancesAreIsolated)
{
    PipelineError error;
    std::shared_ptr<SubmissionStateMachine> other = sessions.create("instance-2", error);
    ASSERT_TRUE(other != nullptr);
    EXPECT_EQ(2u, sessions.count());

    ASSERT_TRUE(sessions.start_recording("instance-2", error));
    EXPECT_EQ(SUB_RECORDING, other->get_status());
    EXPECT_EQ(SUB_IDLE, machine->get_status());
}

TEST_F(SubmissionStateMachineTest, RegistryRejectsUnknownAndDuplicateIds)
{
    PipelineError error;
    EXPECT_FALSE(sessions.start_recording("nobody", error));
    EXPECT_EQ(ERR_VALIDATION, error.kind);

    EXPECT_TRUE(sessions.create("instance-1", error) == nullptr);
    EXPECT_EQ(ERR_VALIDATION, error.kind);
    EXPECT_TRUE(sessions.create("", error) == nullptr);

    EXPECT_TRUE(sessions.destroy("instance-1"));
    EXPECT_FALSE(sessions.destroy("instance-1"));
    EXPECT_TRUE(sessions.get("instance-1") == nullptr);
}

class FullQueueTest : public SubmissionStateMachineTest {
protected:
    static PipelineConfig tiny_queue()
    {
        PipelineConfig config = make_config();
        config.max_total_bytes = 1000;
        return config;
    }

    FullQueueTest() : SubmissionStateMachineTest(tiny_queue()) {}
};

TEST_F(FullQueueTest, FailedUploadThatCannotBeStoredIsAnError)
{
    make_ready(4096);
    p.connectivity.set_online(false);
    PipelineError error;
    ASSERT_TRUE(submit(error));

    EXPECT_EQ(SUB_ERROR, machine->get_status());
    EXPECT_EQ(ERR_STORAGE_QUOTA, machine->get_state().error.kind);
    EXPECT_EQ("Device storage is full. Free some space and try again", machine->get_state().message);
    EXPECT_TRUE(saw(EVENT_SUBMISSION_FAILED));
    EXPECT_EQ(0, p.queue->pending_count());
}
