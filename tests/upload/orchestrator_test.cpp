#include "mpu/upload/orchestrator.hpp"
#include "mpu/events/components.hpp"
#include "support/recording_gateway.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using mpu::ErrorCode;
using mpu::UploadConfig;
using mpu::events::EventBus;
using mpu::events::MetricsComponent;
using mpu::storage::FileByteSource;
using mpu::testing::RecordingGateway;
using mpu::testing::patterned_bytes;
using mpu::testing::write_file;
using mpu::upload::ProgressEvent;
using mpu::upload::ProgressStatus;
using mpu::upload::TransferPhase;
using mpu::upload::TransferRegistry;
using mpu::upload::UploadOrchestrator;
using mpu::upload::UploadOutcome;

namespace {

constexpr std::uint64_t kPart = 1024;

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("mpu_orchestrator_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

UploadConfig small_config(std::size_t concurrency = 3) {
    UploadConfig config;
    config.multipart_threshold = kPart;
    config.part_size = kPart;
    config.max_concurrent_parts = concurrency;
    config.max_part_retries = 3;
    config.retry_base_delay = std::chrono::milliseconds(1);
    return config;
}

class ProgressLog {
public:
    mpu::upload::ProgressCallback callback() {
        return [this](const ProgressEvent& event) {
            std::lock_guard lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<ProgressEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::size_t count(ProgressStatus status) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
            [status](const ProgressEvent& e) { return e.status == status; }));
    }

    ProgressStatus last_status() const {
        std::lock_guard lock(mutex_);
        return events_.back().status;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

std::vector<std::uint32_t> sorted(std::vector<std::uint32_t> values) {
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        gateway_.backend().create_bucket("bucket");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path make_file(const std::string& name, std::size_t size) {
        const fs::path path = dir_ / name;
        write_file(path, patterned_bytes(size));
        return path;
    }

    fs::path dir_;
    RecordingGateway gateway_{kPart};
    FileByteSource source_;
    TransferRegistry registry_;
    EventBus bus_;
    MetricsComponent metrics_{bus_};
};

TEST_F(UploadOrchestratorTest, SmallFileUsesSinglePut) {
    UploadConfig config;
    config.retry_base_delay = std::chrono::milliseconds(1);
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, config);

    const auto file = make_file("small.bin", 3 * UploadConfig::kMiB);
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "small", file, progress.callback());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);

    EXPECT_EQ(gateway_.put_calls(), 1);
    EXPECT_EQ(gateway_.initiate_calls(), 0);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_FALSE(orchestrator.upload_state("bucket", "small").has_value());

    ASSERT_EQ(progress.count(ProgressStatus::Completed), 1u);
    const auto last = progress.events().back();
    EXPECT_EQ(last.status, ProgressStatus::Completed);
    EXPECT_DOUBLE_EQ(last.percentage, 100.0);
    EXPECT_FALSE(last.total_parts.has_value());

    auto stored = gateway_.backend().object("bucket", "small");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, patterned_bytes(3 * UploadConfig::kMiB));
    EXPECT_EQ(metrics_.get_stats().simple_uploads.load(), 1u);
}

TEST_F(UploadOrchestratorTest, EmptyFileCompletesAtFullPercentage) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("empty.bin", 0);
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "empty", file, progress.callback());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(gateway_.put_calls(), 1);
    EXPECT_EQ(progress.last_status(), ProgressStatus::Completed);
    EXPECT_DOUBLE_EQ(progress.events().back().percentage, 100.0);

    auto stored = gateway_.backend().object("bucket", "empty");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->empty());
}

TEST_F(UploadOrchestratorTest, SimpleTransferFailureReportsFailed) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("tiny.bin", 100);
    ProgressLog progress;

    auto result = orchestrator.upload_file("missing-bucket", "tiny", file, progress.callback());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::GatewayError);
    EXPECT_EQ(progress.last_status(), ProgressStatus::Failed);
    EXPECT_EQ(metrics_.get_stats().uploads_failed.load(), 1u);
}

TEST_F(UploadOrchestratorTest, MissingSourceIsSourceError) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "nothing", dir_ / "absent.bin", progress.callback());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SourceError);
    EXPECT_EQ(progress.last_status(), ProgressStatus::Failed);
}

TEST_F(UploadOrchestratorTest, InvalidConfigIsRejected) {
    auto config = small_config();
    config.part_size = 0;
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, config);
    const auto file = make_file("data.bin", 4 * kPart);

    auto result = orchestrator.upload_file("bucket", "data", file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_EQ(gateway_.initiate_calls(), 0);
}

TEST_F(UploadOrchestratorTest, ChunkedUploadAssemblesObject) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("chunked.bin", 5 * kPart + 100);
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "chunked", file, progress.callback());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);

    const auto completes = gateway_.complete_calls();
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0], (std::vector<std::uint32_t>{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(sorted(gateway_.uploaded_parts()), (std::vector<std::uint32_t>{1, 2, 3, 4, 5, 6}));

    auto stored = gateway_.backend().object("bucket", "chunked");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, patterned_bytes(5 * kPart + 100));

    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(gateway_.backend().pending_transfers(), 0u);
    EXPECT_EQ(metrics_.get_stats().parts_uploaded.load(), 6u);
    EXPECT_EQ(metrics_.get_stats().chunked_uploads.load(), 1u);
}

TEST_F(UploadOrchestratorTest, ProgressIsMonotonicAndEndsOnce) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("progress.bin", 8 * kPart);
    ProgressLog progress;

    ASSERT_TRUE(orchestrator.upload_file("bucket", "progress", file, progress.callback()).is_ok());

    const auto events = progress.events();
    ASSERT_GE(events.size(), 10u); // start + 8 parts + completed
    EXPECT_EQ(events.front().status, ProgressStatus::Uploading);
    EXPECT_EQ(events.front().uploaded_bytes, 0u);

    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].uploaded_bytes, events[i - 1].uploaded_bytes);
    }
    EXPECT_EQ(progress.count(ProgressStatus::Completed), 1u);
    EXPECT_EQ(events.back().status, ProgressStatus::Completed);
    EXPECT_EQ(events.back().uploaded_bytes, 8 * kPart);
    ASSERT_TRUE(events.back().total_parts.has_value());
    EXPECT_EQ(*events.back().total_parts, 8u);
}

TEST_F(UploadOrchestratorTest, PauseAfterFirstPartThenResume) {
    UploadConfig config;
    config.max_concurrent_parts = 1;
    config.retry_base_delay = std::chrono::milliseconds(1);
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, config);

    const auto file = make_file("twelve.bin", 12 * UploadConfig::kMiB);
    gateway_.on_part_stored([&](std::uint32_t index) {
        if (index == 1) {
            orchestrator.pause_upload("bucket", "twelve");
        }
    });

    ProgressLog first_run;
    auto paused = orchestrator.upload_file("bucket", "twelve", file, first_run.callback());
    ASSERT_TRUE(paused.is_ok());
    EXPECT_EQ(paused.value(), UploadOutcome::Paused);
    EXPECT_EQ(first_run.last_status(), ProgressStatus::Paused);

    auto state = orchestrator.upload_state("bucket", "twelve");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->total_parts, 3u);
    EXPECT_EQ(state->completed_count, 1u);
    EXPECT_EQ(state->completed_bytes, 5 * UploadConfig::kMiB);
    EXPECT_TRUE(state->paused);
    EXPECT_EQ(state->phase, TransferPhase::Paused);
    EXPECT_TRUE(gateway_.complete_calls().empty());

    gateway_.on_part_stored(nullptr);
    ProgressLog second_run;
    auto resumed = orchestrator.resume_upload("bucket", "twelve", second_run.callback());
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), UploadOutcome::Completed);

    const auto completes = gateway_.complete_calls();
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0], (std::vector<std::uint32_t>{1, 2, 3}));
    EXPECT_EQ(gateway_.uploaded_parts(), (std::vector<std::uint32_t>{1, 2, 3}));
    EXPECT_EQ(gateway_.initiate_calls(), 1);
    EXPECT_EQ(second_run.last_status(), ProgressStatus::Completed);
    EXPECT_FALSE(orchestrator.upload_state("bucket", "twelve").has_value());

    auto stored = gateway_.backend().object("bucket", "twelve");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->size(), 12 * UploadConfig::kMiB);
    EXPECT_EQ(metrics_.get_stats().uploads_paused.load(), 1u);
}

TEST_F(UploadOrchestratorTest, UploadFileContinuesPausedTransfer) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("again.bin", 3 * kPart);
    gateway_.on_part_stored([&](std::uint32_t) { orchestrator.pause_upload("bucket", "again"); });

    auto paused = orchestrator.upload_file("bucket", "again", file);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);

    gateway_.on_part_stored(nullptr);
    auto finished = orchestrator.upload_file("bucket", "again", file);
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(finished.value(), UploadOutcome::Completed);
    EXPECT_EQ(gateway_.initiate_calls(), 1);
    EXPECT_EQ(gateway_.complete_calls().size(), 1u);
}

TEST_F(UploadOrchestratorTest, ResumeFromSnapshotFillsOnlyGaps) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto data = patterned_bytes(5 * kPart);
    const auto file = dir_ / "gaps.bin";
    write_file(file, data);

    auto& backend = gateway_.backend();
    auto initiated = backend.initiate_transfer("bucket", "gaps");
    ASSERT_TRUE(initiated.is_ok());
    for (std::uint32_t index : {2u, 4u}) {
        const auto offset = (index - 1) * kPart;
        mpu::storage::Bytes part(data.begin() + offset, data.begin() + offset + kPart);
        ASSERT_TRUE(backend.upload_part("bucket", "gaps", initiated.value(), index, part).is_ok());
    }

    mpu::upload::UploadSnapshot snapshot;
    snapshot.bucket = "bucket";
    snapshot.key = "gaps";
    snapshot.source_path = file.string();
    snapshot.transfer_id = initiated.value();
    snapshot.total_bytes = data.size();
    snapshot.part_size = kPart;

    auto result = orchestrator.resume_upload(snapshot);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);

    EXPECT_EQ(sorted(gateway_.uploaded_parts()), (std::vector<std::uint32_t>{1, 3, 5}));
    EXPECT_EQ(gateway_.initiate_calls(), 0);
    const auto completes = gateway_.complete_calls();
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0], (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));

    auto stored = backend.object("bucket", "gaps");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, data);
}

TEST_F(UploadOrchestratorTest, ResumeWithEveryPartStoredOnlyFinalizes) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto data = patterned_bytes(3 * kPart);
    const auto file = dir_ / "done.bin";
    write_file(file, data);

    auto& backend = gateway_.backend();
    auto initiated = backend.initiate_transfer("bucket", "done");
    ASSERT_TRUE(initiated.is_ok());
    for (std::uint32_t index = 1; index <= 3; ++index) {
        const auto offset = (index - 1) * kPart;
        mpu::storage::Bytes part(data.begin() + offset, data.begin() + offset + kPart);
        ASSERT_TRUE(backend.upload_part("bucket", "done", initiated.value(), index, part).is_ok());
    }

    mpu::upload::UploadSnapshot snapshot;
    snapshot.bucket = "bucket";
    snapshot.key = "done";
    snapshot.source_path = file.string();
    snapshot.transfer_id = initiated.value();
    snapshot.total_bytes = data.size();
    snapshot.part_size = kPart;

    auto result = orchestrator.resume_upload(snapshot);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);
    EXPECT_TRUE(gateway_.uploaded_parts().empty());
    ASSERT_EQ(gateway_.complete_calls().size(), 1u);
    EXPECT_EQ(gateway_.complete_calls()[0], (std::vector<std::uint32_t>{1, 2, 3}));
}

TEST_F(UploadOrchestratorTest, SnapshotSurvivesJsonAndNewProcess) {
    UploadOrchestrator first(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("persist.bin", 4 * kPart);
    gateway_.on_part_stored([&](std::uint32_t index) {
        if (index == 2) {
            first.pause_upload("bucket", "persist");
        }
    });

    auto paused = first.upload_file("bucket", "persist", file);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);

    auto state = first.upload_state("bucket", "persist");
    ASSERT_TRUE(state.has_value());
    const auto persisted = mpu::upload::serialize_snapshot(*state);

    gateway_.on_part_stored(nullptr);
    gateway_.clear_records();

    TransferRegistry fresh_registry;
    UploadOrchestrator second(gateway_, source_, fresh_registry, bus_, small_config(1));
    auto restored = mpu::upload::parse_snapshot(persisted);
    ASSERT_TRUE(restored.is_ok());

    auto result = second.resume_upload(restored.value());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);
    EXPECT_EQ(gateway_.uploaded_parts(), (std::vector<std::uint32_t>{3, 4}));
    EXPECT_EQ(fresh_registry.size(), 0u);
}

TEST_F(UploadOrchestratorTest, PartRetriedUntilSuccessIsRecordedOnce) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("retry.bin", 3 * kPart);
    gateway_.fail_part(2, 2);

    auto result = orchestrator.upload_file("bucket", "retry", file);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);

    EXPECT_EQ(gateway_.attempts_for(2), 3);
    const auto uploaded = gateway_.uploaded_parts();
    EXPECT_EQ(std::count(uploaded.begin(), uploaded.end(), 2u), 1);
    ASSERT_EQ(gateway_.complete_calls().size(), 1u);
    EXPECT_EQ(gateway_.complete_calls()[0], (std::vector<std::uint32_t>{1, 2, 3}));
    EXPECT_EQ(metrics_.get_stats().part_retries.load(), 2u);
}

TEST_F(UploadOrchestratorTest, ExhaustedRetriesFailAndKeepState) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("flaky.bin", 3 * kPart);
    gateway_.fail_part(2, 10);
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "flaky", file, progress.callback());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::GatewayError);
    EXPECT_EQ(gateway_.attempts_for(2), 4);
    EXPECT_EQ(progress.last_status(), ProgressStatus::Failed);
    EXPECT_TRUE(gateway_.complete_calls().empty());

    auto state = orchestrator.upload_state("bucket", "flaky");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->phase, TransferPhase::Failed);
    EXPECT_EQ(state->completed_count, 2u);

    gateway_.fail_part(2, 0);
    auto resumed = orchestrator.resume_upload("bucket", "flaky");
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), UploadOutcome::Completed);
    EXPECT_EQ(gateway_.complete_calls().size(), 1u);
}

TEST_F(UploadOrchestratorTest, FailedCompletionCanBeRetried) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("finalize.bin", 3 * kPart);
    gateway_.fail_complete(true);

    auto result = orchestrator.upload_file("bucket", "finalize", file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::GatewayError);

    auto state = orchestrator.upload_state("bucket", "finalize");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->phase, TransferPhase::Failed);
    EXPECT_EQ(state->completed_count, 3u);

    gateway_.fail_complete(false);
    gateway_.clear_records();
    auto resumed = orchestrator.resume_upload("bucket", "finalize");
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_TRUE(gateway_.uploaded_parts().empty());
    EXPECT_EQ(gateway_.complete_calls().size(), 1u);
}

TEST_F(UploadOrchestratorTest, AbortPausedTransferReleasesBackend) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("abort.bin", 3 * kPart);
    gateway_.on_part_stored([&](std::uint32_t) { orchestrator.pause_upload("bucket", "abort"); });

    auto paused = orchestrator.upload_file("bucket", "abort", file);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);
    EXPECT_EQ(gateway_.backend().pending_transfers(), 1u);

    EXPECT_TRUE(orchestrator.abort_upload("bucket", "abort").is_ok());
    EXPECT_FALSE(orchestrator.upload_state("bucket", "abort").has_value());
    EXPECT_EQ(gateway_.backend().pending_transfers(), 0u);
    EXPECT_EQ(metrics_.get_stats().uploads_aborted.load(), 1u);

    // Second abort is a no-op
    EXPECT_TRUE(orchestrator.abort_upload("bucket", "abort").is_ok());
    EXPECT_EQ(gateway_.abort_calls(), 1);
}

TEST_F(UploadOrchestratorTest, AbortDuringRunResolvesAsAborted) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("cancel.bin", 4 * kPart);
    gateway_.on_part_stored([&](std::uint32_t index) {
        if (index == 1) {
            EXPECT_TRUE(orchestrator.abort_upload("bucket", "cancel").is_ok());
        }
    });
    ProgressLog progress;

    auto result = orchestrator.upload_file("bucket", "cancel", file, progress.callback());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Aborted);
    EXPECT_EQ(progress.last_status(), ProgressStatus::Aborted);
    EXPECT_EQ(gateway_.uploaded_parts(), (std::vector<std::uint32_t>{1}));
    EXPECT_TRUE(gateway_.complete_calls().empty());
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(gateway_.backend().pending_transfers(), 0u);
}

TEST_F(UploadOrchestratorTest, UnknownKeysAreReported) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());

    auto resumed = orchestrator.resume_upload("bucket", "nothing");
    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().code, ErrorCode::NoSuchTransfer);

    EXPECT_FALSE(orchestrator.pause_upload("bucket", "nothing"));
    EXPECT_TRUE(orchestrator.abort_upload("bucket", "nothing").is_ok());
}

TEST_F(UploadOrchestratorTest, ActiveRunMakesSecondRunBusy) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("busy.bin", 3 * kPart);

    auto created = registry_.create("upload-external", "bucket", "busy", file, 3 * kPart, kPart);
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(created.value()->try_activate());

    auto result = orchestrator.upload_file("bucket", "busy", file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::TransferBusy);
    EXPECT_EQ(gateway_.initiate_calls(), 0);
}

TEST_F(UploadOrchestratorTest, SnapshotWithOtherTransferIdIsRejected) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config());
    const auto file = make_file("mismatch.bin", 3 * kPart);
    ASSERT_TRUE(registry_.create("upload-a", "bucket", "mismatch", file, 3 * kPart, kPart).is_ok());

    mpu::upload::UploadSnapshot snapshot;
    snapshot.bucket = "bucket";
    snapshot.key = "mismatch";
    snapshot.source_path = file.string();
    snapshot.transfer_id = "upload-b";
    snapshot.total_bytes = 3 * kPart;
    snapshot.part_size = kPart;

    auto result = orchestrator.resume_upload(snapshot);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(UploadOrchestratorTest, ChangedSourceSizeFailsResume) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("shifting.bin", 3 * kPart);
    gateway_.on_part_stored([&](std::uint32_t) { orchestrator.pause_upload("bucket", "shifting"); });

    auto paused = orchestrator.upload_file("bucket", "shifting", file);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);

    gateway_.on_part_stored(nullptr);
    write_file(file, patterned_bytes(4 * kPart));

    auto resumed = orchestrator.resume_upload("bucket", "shifting");
    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().code, ErrorCode::SourceError);
    EXPECT_TRUE(orchestrator.upload_state("bucket", "shifting").has_value());
}

TEST_F(UploadOrchestratorTest, InFlightPartsNeverExceedConcurrencyLimit) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(3));
    const auto file = make_file("bounded.bin", 7 * kPart);
    gateway_.set_part_delay(std::chrono::milliseconds(30));

    auto result = orchestrator.upload_file("bucket", "bounded", file);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Completed);

    EXPECT_LE(gateway_.peak_in_flight("bounded"), 3);
    EXPECT_EQ(gateway_.peak_in_flight("bounded"), 3);
    EXPECT_EQ(sorted(gateway_.uploaded_parts()), (std::vector<std::uint32_t>{1, 2, 3, 4, 5, 6, 7}));
}

TEST_F(UploadOrchestratorTest, TransfersOnDifferentKeysOverlap) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(3));
    const auto left = make_file("left.bin", 3 * kPart);
    const auto right = make_file("right.bin", 3 * kPart);
    gateway_.set_part_delay(std::chrono::milliseconds(200));

    mpu::Result<UploadOutcome> left_result = mpu::Err<UploadOutcome>(ErrorCode::InvalidArgument, "not run");
    mpu::Result<UploadOutcome> right_result = mpu::Err<UploadOutcome>(ErrorCode::InvalidArgument, "not run");
    std::thread left_run([&] { left_result = orchestrator.upload_file("bucket", "left", left); });
    std::thread right_run([&] { right_result = orchestrator.upload_file("bucket", "right", right); });
    left_run.join();
    right_run.join();

    ASSERT_TRUE(left_result.is_ok());
    ASSERT_TRUE(right_result.is_ok());
    EXPECT_EQ(left_result.value(), UploadOutcome::Completed);
    EXPECT_EQ(right_result.value(), UploadOutcome::Completed);

    // Each transfer keeps its own bound, and together they exceed it
    EXPECT_EQ(gateway_.peak_in_flight("left"), 3);
    EXPECT_EQ(gateway_.peak_in_flight("right"), 3);
    EXPECT_GT(gateway_.peak_in_flight(), 3);
    EXPECT_EQ(metrics_.get_stats().uploads_completed.load(), 2u);
}

TEST_F(UploadOrchestratorTest, BusyResumeKeepsRequestedPause) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("contended.bin", 3 * kPart);

    std::atomic<bool> requested{false};
    mpu::Result<UploadOutcome> rejected = mpu::Ok(UploadOutcome::Completed);
    gateway_.on_part_stored([&](std::uint32_t) {
        if (requested.exchange(true)) {
            return;
        }
        orchestrator.pause_upload("bucket", "contended");
        rejected = orchestrator.resume_upload("bucket", "contended");
    });

    auto result = orchestrator.upload_file("bucket", "contended", file);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::TransferBusy);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), UploadOutcome::Paused);
    EXPECT_EQ(gateway_.uploaded_parts(), (std::vector<std::uint32_t>{1}));

    auto state = orchestrator.upload_state("bucket", "contended");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->phase, TransferPhase::Paused);

    gateway_.on_part_stored(nullptr);
    auto finished = orchestrator.resume_upload("bucket", "contended");
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(finished.value(), UploadOutcome::Completed);
}

TEST_F(UploadOrchestratorTest, RegisteredTransferIsNotReplacedBySimplePut) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto file = make_file("shrunk.bin", 3 * kPart);
    gateway_.on_part_stored([&](std::uint32_t) { orchestrator.pause_upload("bucket", "shrunk"); });

    auto paused = orchestrator.upload_file("bucket", "shrunk", file);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);
    const auto transfer_id = orchestrator.upload_state("bucket", "shrunk")->transfer_id;

    gateway_.on_part_stored(nullptr);
    write_file(file, patterned_bytes(100));

    auto result = orchestrator.upload_file("bucket", "shrunk", file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SourceError);
    EXPECT_EQ(gateway_.put_calls(), 0);
    EXPECT_FALSE(gateway_.backend().object("bucket", "shrunk").has_value());

    auto state = orchestrator.upload_state("bucket", "shrunk");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->transfer_id, transfer_id);
    auto stored = gateway_.backend().list_completed_parts("bucket", "shrunk", transfer_id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().size(), 1u);
}

TEST_F(UploadOrchestratorTest, RegisteredTransferRejectsOtherSourcePath) {
    UploadOrchestrator orchestrator(gateway_, source_, registry_, bus_, small_config(1));
    const auto original = make_file("original.bin", 3 * kPart);
    const auto impostor = make_file("impostor.bin", 3 * kPart);
    gateway_.on_part_stored([&](std::uint32_t) { orchestrator.pause_upload("bucket", "doc"); });

    auto paused = orchestrator.upload_file("bucket", "doc", original);
    ASSERT_TRUE(paused.is_ok());
    ASSERT_EQ(paused.value(), UploadOutcome::Paused);

    gateway_.on_part_stored(nullptr);
    auto result = orchestrator.upload_file("bucket", "doc", impostor);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(gateway_.uploaded_parts(), (std::vector<std::uint32_t>{1}));

    auto state = orchestrator.upload_state("bucket", "doc");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->source_path, original.string());
    EXPECT_EQ(state->phase, TransferPhase::Paused);
}
