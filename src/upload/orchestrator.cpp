#include "mpu/upload/orchestrator.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <thread>
#include <vector>

namespace mpu::upload {
namespace fs = std::filesystem;
namespace asio = boost::asio;

namespace {

bool is_resting(TransferPhase phase) {
    return phase == TransferPhase::Paused ||
           phase == TransferPhase::Failed ||
           phase == TransferPhase::Done ||
           phase == TransferPhase::Aborted;
}

void move_to(TransferState& state, TransferPhase next) {
    if (auto moved = state.transition_to(next); moved.is_error()) {
        spdlog::warn("{}/{}: {}", state.bucket(), state.key(), moved.error().message);
    }
}

/**
 * @brief Releases the single-run claim on a transfer on every exit path
 *
 * A run that unwinds in a non-resting phase leaves the transfer Failed so a
 * later resume can re-enter Initiating.
 */
class ActiveRunGuard {
public:
    explicit ActiveRunGuard(TransferState& state) : state_(state) {}

    ~ActiveRunGuard() {
        if (!is_resting(state_.phase())) {
            move_to(state_, TransferPhase::Failed);
        }
        state_.deactivate();
    }

    ActiveRunGuard(const ActiveRunGuard&) = delete;
    ActiveRunGuard& operator=(const ActiveRunGuard&) = delete;

private:
    TransferState& state_;
};

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

const char* to_string(UploadOutcome outcome) noexcept {
    switch (outcome) {
        case UploadOutcome::Completed: return "completed";
        case UploadOutcome::Paused: return "paused";
        case UploadOutcome::Aborted: return "aborted";
    }
    return "unknown";
}

UploadOrchestrator::UploadOrchestrator(storage::StorageGateway& gateway,
                                       storage::ByteSource& source,
                                       TransferRegistry& registry,
                                       events::EventBus& bus,
                                       UploadConfig config)
    : gateway_(gateway),
      source_(source),
      registry_(registry),
      event_bus_(bus),
      config_(std::move(config)) {}

Result<UploadOutcome> UploadOrchestrator::upload_file(const std::string& bucket,
                                                      const std::string& key,
                                                      const fs::path& path,
                                                      ProgressCallback on_progress) {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<UploadOutcome>(valid.error());
    }

    auto size = source_.size(path);
    if (size.is_error()) {
        ProgressReporter reporter(on_progress, path.string(), bucket, key, 0);
        reporter.report(ProgressStatus::Failed, 0);
        event_bus_.emit(events::UploadFailedEvent{bucket, key, "", describe(size.error())});
        return Err<UploadOutcome>(size.error());
    }

    const auto total_bytes = size.value();
    // A registered chunked transfer owns the key until it completes or is
    // aborted, even if the file has since shrunk below the threshold
    const bool registered = registry_.get(bucket, key) != nullptr;
    if (!registered && (total_bytes == 0 || total_bytes < config_.multipart_threshold)) {
        return run_simple(bucket, key, path, total_bytes, on_progress);
    }
    return run_chunked(bucket, key, path, total_bytes, on_progress, std::nullopt);
}

bool UploadOrchestrator::pause_upload(const std::string& bucket, const std::string& key) {
    auto state = registry_.get(bucket, key);
    if (!state) {
        spdlog::debug("Pause ignored, no transfer registered for {}/{}", bucket, key);
        return false;
    }
    state->set_paused(true);
    spdlog::info("Pause requested for {}/{}", bucket, key);
    return true;
}

Result<UploadOutcome> UploadOrchestrator::resume_upload(const std::string& bucket,
                                                        const std::string& key,
                                                        ProgressCallback on_progress) {
    auto state = registry_.get(bucket, key);
    if (!state) {
        return Err<UploadOutcome>(ErrorCode::NoSuchTransfer, "No paused upload found for " + bucket + "/" + key);
    }

    UploadSnapshot snapshot = state->snapshot();
    return resume_upload(snapshot, std::move(on_progress));
}

Result<UploadOutcome> UploadOrchestrator::resume_upload(const UploadSnapshot& snapshot,
                                                        ProgressCallback on_progress) {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<UploadOutcome>(valid.error());
    }
    if (snapshot.bucket.empty() || snapshot.key.empty() || snapshot.transfer_id.empty()) {
        return Err<UploadOutcome>(ErrorCode::InvalidArgument, "Snapshot is missing bucket, key or transfer id");
    }
    if (snapshot.part_size == 0) {
        return Err<UploadOutcome>(ErrorCode::InvalidArgument, "Snapshot part_size must be > 0");
    }

    const fs::path path(snapshot.source_path);
    auto size = source_.size(path);
    if (size.is_ok() && size.value() != snapshot.total_bytes) {
        size = Err<std::uint64_t>(ErrorCode::SourceError,
                                  "Source " + snapshot.source_path + " changed size: expected " +
                                      std::to_string(snapshot.total_bytes) + " bytes, found " +
                                      std::to_string(size.value()));
    }
    if (size.is_error()) {
        ProgressReporter reporter(on_progress, snapshot.source_path, snapshot.bucket, snapshot.key,
                                  snapshot.total_bytes, total_parts(snapshot.total_bytes, snapshot.part_size));
        reporter.report(ProgressStatus::Failed, snapshot.completed_bytes);
        event_bus_.emit(events::UploadFailedEvent{snapshot.bucket, snapshot.key, snapshot.transfer_id,
                                                  describe(size.error())});
        return Err<UploadOutcome>(size.error());
    }

    return run_chunked(snapshot.bucket, snapshot.key, path, snapshot.total_bytes, on_progress,
                       ResumeRequest{snapshot.transfer_id, snapshot.part_size});
}

Result<void> UploadOrchestrator::abort_upload(const std::string& bucket, const std::string& key) {
    auto state = registry_.get(bucket, key);
    if (!state) {
        spdlog::debug("Abort ignored, no transfer registered for {}/{}", bucket, key);
        return Ok();
    }

    state->mark_aborted();
    if (!state->try_begin_abort()) {
        return Ok();
    }

    auto released = gateway_.abort_transfer(bucket, key, state->transfer_id());
    state->end_abort();
    if (released.is_error()) {
        spdlog::error("Failed to abort transfer {} for {}/{}: {}",
                      state->transfer_id(), bucket, key, released.error().message);
        return released;
    }

    if (!state->active()) {
        move_to(*state, TransferPhase::Aborted);
    }
    registry_.remove(bucket, key, state.get());
    event_bus_.emit(events::UploadAbortedEvent{bucket, key, state->transfer_id()});
    return Ok();
}

std::optional<UploadSnapshot> UploadOrchestrator::upload_state(const std::string& bucket,
                                                               const std::string& key) const {
    auto state = registry_.get(bucket, key);
    if (!state) {
        return std::nullopt;
    }
    return state->snapshot();
}

// ════════════════════════════════════════════════════════
// Simple transfer
// ════════════════════════════════════════════════════════

Result<UploadOutcome> UploadOrchestrator::run_simple(const std::string& bucket,
                                                     const std::string& key,
                                                     const fs::path& path,
                                                     std::uint64_t total_bytes,
                                                     const ProgressCallback& on_progress) {
    const auto started_at = std::chrono::steady_clock::now();
    ProgressReporter reporter(on_progress, path.string(), bucket, key, total_bytes);

    event_bus_.emit(events::UploadStartedEvent{bucket, key, "", events::UploadStrategy::Simple, total_bytes, false});
    reporter.report(ProgressStatus::Uploading, 0);

    auto fail = [&](const Error& error) {
        reporter.report(ProgressStatus::Failed, 0);
        event_bus_.emit(events::UploadFailedEvent{bucket, key, "", describe(error)});
        return Err<UploadOutcome>(error);
    };

    auto reader = source_.open(path);
    if (reader.is_error()) {
        return fail(reader.error());
    }

    auto data = reader.value()->read_range(0, total_bytes);
    if (data.is_error()) {
        return fail(data.error());
    }

    auto put = gateway_.put_object(bucket, key, data.value());
    if (put.is_error()) {
        return fail(put.error());
    }

    reporter.report(ProgressStatus::Completed, total_bytes);
    event_bus_.emit(events::UploadCompletedEvent{bucket, key, "", events::UploadStrategy::Simple, total_bytes,
                                                 elapsed_since(started_at)});
    return Ok(UploadOutcome::Completed);
}

// ════════════════════════════════════════════════════════
// Chunked transfer
// ════════════════════════════════════════════════════════

Result<UploadOutcome> UploadOrchestrator::run_chunked(const std::string& bucket,
                                                      const std::string& key,
                                                      const fs::path& path,
                                                      std::uint64_t total_bytes,
                                                      const ProgressCallback& on_progress,
                                                      std::optional<ResumeRequest> resume) {
    const auto started_at = std::chrono::steady_clock::now();

    std::uint64_t part_size = resume ? resume->part_size : config_.part_size;
    if (auto existing = registry_.get(bucket, key)) {
        part_size = existing->planner().part_size();
    }

    ProgressReporter reporter(on_progress, path.string(), bucket, key, total_bytes,
                              total_parts(total_bytes, part_size));
    reporter.report(ProgressStatus::Uploading, 0, 0);

    bool resumed = false;
    auto acquired = acquire(bucket, key, path, total_bytes, part_size, resume, resumed);
    if (acquired.is_error()) {
        reporter.report(ProgressStatus::Failed, 0);
        event_bus_.emit(events::UploadFailedEvent{bucket, key, resume ? resume->transfer_id : "",
                                                  describe(acquired.error())});
        return Err<UploadOutcome>(acquired.error());
    }

    auto state = acquired.value();
    ActiveRunGuard guard(*state);

    if (state->aborted()) {
        return finish_aborted(*state, reporter);
    }

    if (resumed) {
        state->set_paused(false);
        move_to(*state, TransferPhase::Initiating);

        auto listed = gateway_.list_completed_parts(bucket, key, state->transfer_id());
        if (listed.is_error()) {
            return fail(*state, reporter, listed.error());
        }
        const auto added = state->merge_parts(listed.value());
        spdlog::debug("Resuming {}/{} transfer={} with {}/{} parts stored ({} found only on backend)",
                      bucket, key, state->transfer_id(), state->completed_count(), state->total_parts(), added);
    }

    auto reader = source_.open(path);
    if (reader.is_error()) {
        return fail(*state, reporter, reader.error());
    }

    move_to(*state, TransferPhase::Transferring);
    event_bus_.emit(events::UploadStartedEvent{bucket, key, state->transfer_id(),
                                               events::UploadStrategy::Chunked, total_bytes, resumed});

    return transfer_parts(*state, *reader.value(), reporter, started_at);
}

Result<std::shared_ptr<TransferState>> UploadOrchestrator::acquire(const std::string& bucket,
                                                                   const std::string& key,
                                                                   const fs::path& path,
                                                                   std::uint64_t total_bytes,
                                                                   std::uint64_t part_size,
                                                                   const std::optional<ResumeRequest>& resume,
                                                                   bool& resumed) {
    if (auto state = registry_.get(bucket, key)) {
        if (resume && resume->transfer_id != state->transfer_id()) {
            return Err<std::shared_ptr<TransferState>>(
                ErrorCode::InvalidArgument,
                "Transfer " + state->transfer_id() + " is registered for " + bucket + "/" + key +
                    ", cannot resume " + resume->transfer_id);
        }
        if (state->source_path() != path) {
            return Err<std::shared_ptr<TransferState>>(
                ErrorCode::InvalidArgument,
                "Transfer " + state->transfer_id() + " for " + bucket + "/" + key + " reads " +
                    state->source_path().string() + ", not " + path.string());
        }
        if (state->total_bytes() != total_bytes) {
            return Err<std::shared_ptr<TransferState>>(
                ErrorCode::SourceError,
                "Source " + path.string() + " changed size: expected " + std::to_string(state->total_bytes()) +
                    " bytes, found " + std::to_string(total_bytes));
        }
        if (!state->try_activate()) {
            return Err<std::shared_ptr<TransferState>>(ErrorCode::TransferBusy,
                                                       "Upload already running for " + bucket + "/" + key);
        }
        resumed = true;
        return Ok(std::move(state));
    }

    std::string transfer_id;
    if (resume) {
        transfer_id = resume->transfer_id;
        resumed = true;
    } else {
        auto initiated = gateway_.initiate_transfer(bucket, key);
        if (initiated.is_error()) {
            return Err<std::shared_ptr<TransferState>>(initiated.error());
        }
        transfer_id = std::move(initiated.value());
        spdlog::debug("Started chunked transfer {} for {}/{}", transfer_id, bucket, key);
    }

    auto created = registry_.create(transfer_id, bucket, key, path, total_bytes, part_size);
    if (created.is_error()) {
        if (!resume) {
            // Lost a race with another run for the same key; release our orphan
            if (auto released = gateway_.abort_transfer(bucket, key, transfer_id); released.is_error()) {
                spdlog::warn("Failed to release orphan transfer {} for {}/{}: {}",
                             transfer_id, bucket, key, released.error().message);
            }
        }
        return created;
    }

    created.value()->try_activate();
    return created;
}

Result<UploadOutcome> UploadOrchestrator::transfer_parts(TransferState& state,
                                                         storage::ByteReader& reader,
                                                         ProgressReporter& reporter,
                                                         std::chrono::steady_clock::time_point started_at) {
    // Workers live as long as this run; every batch is settled before the pool is destroyed
    asio::thread_pool workers(std::max<std::size_t>(1, config_.effective_worker_threads()));

    while (true) {
        if (state.aborted()) {
            return finish_aborted(state, reporter);
        }

        if (state.paused()) {
            move_to(state, TransferPhase::Paused);
            const auto completed = state.completed_count();
            reporter.report(ProgressStatus::Paused, state.completed_bytes(),
                            static_cast<std::uint32_t>(completed));
            event_bus_.emit(events::UploadPausedEvent{state.bucket(), state.key(), state.transfer_id(),
                                                      completed, state.total_parts()});
            return Ok(UploadOutcome::Paused);
        }

        if (state.is_complete()) {
            return complete(state, reporter, started_at);
        }

        const auto batch = state.claim_missing(config_.max_concurrent_parts);
        if (batch.empty()) {
            return fail(state, reporter,
                        make_error(ErrorCode::IncompleteTransfer,
                                   "No schedulable parts left but only " + std::to_string(state.completed_count()) +
                                       "/" + std::to_string(state.total_parts()) + " are stored"));
        }

        std::vector<std::future<Result<void>>> pending;
        pending.reserve(batch.size());
        for (const auto index : batch) {
            auto task = std::make_shared<std::packaged_task<Result<void>()>>(
                [this, &state, &reader, &reporter, index] {
                    return upload_part(state, reader, reporter, index);
                });
            pending.push_back(task->get_future());
            asio::post(workers, [task] { (*task)(); });
        }

        // Every task references this frame; let all of them settle before inspecting results
        for (auto& settled : pending) {
            settled.wait();
        }

        std::optional<Error> failure;
        for (auto& settled : pending) {
            auto result = settled.get();
            if (result.is_error() && !failure) {
                failure = result.error();
            }
        }

        if (failure) {
            if (state.aborted()) {
                return finish_aborted(state, reporter);
            }
            return fail(state, reporter, std::move(*failure));
        }
    }
}

Result<void> UploadOrchestrator::upload_part(TransferState& state,
                                             storage::ByteReader& reader,
                                             ProgressReporter& reporter,
                                             std::uint32_t index) {
    if (state.aborted()) {
        state.release(index);
        return Err<void>(ErrorCode::Aborted, "Transfer aborted before part " + std::to_string(index));
    }

    const auto part = state.planner().describe(index);
    auto data = reader.read_range(part.offset, part.length);
    if (data.is_error()) {
        state.release(index);
        return Err<void>(data.error());
    }

    const std::size_t max_retries = config_.max_part_retries;
    for (std::size_t attempt = 0;; ++attempt) {
        auto tag = gateway_.upload_part(state.bucket(), state.key(), state.transfer_id(), index, data.value());
        if (tag.is_ok()) {
            if (!state.record_part(index, std::move(tag.value()))) {
                spdlog::debug("Part {} of {}/{} was already recorded", index, state.bucket(), state.key());
            }
            reporter.report(ProgressStatus::Uploading, state.completed_bytes(),
                            static_cast<std::uint32_t>(state.completed_count()));
            event_bus_.emit(events::PartUploadedEvent{state.bucket(), state.key(), state.transfer_id(), index,
                                                      state.total_parts(), part.length});
            return Ok();
        }

        if (state.aborted()) {
            state.release(index);
            return Err<void>(ErrorCode::Aborted, "Transfer aborted while uploading part " + std::to_string(index));
        }

        if (attempt >= max_retries) {
            state.release(index);
            auto error = tag.error();
            error.message = "Part " + std::to_string(index) + " failed after " + std::to_string(attempt + 1) +
                            " attempts: " + error.message;
            return Err<void>(std::move(error));
        }

        const auto retry_number = attempt + 1;
        event_bus_.emit(events::PartRetryEvent{state.bucket(), state.key(), state.transfer_id(), index,
                                               retry_number, max_retries, tag.error().message});
        std::this_thread::sleep_for(config_.retry_base_delay *
                                    static_cast<std::chrono::milliseconds::rep>(retry_number));
    }
}

Result<UploadOutcome> UploadOrchestrator::complete(TransferState& state,
                                                   ProgressReporter& reporter,
                                                   std::chrono::steady_clock::time_point started_at) {
    move_to(state, TransferPhase::Completing);

    const auto parts = state.ordered_parts();
    if (parts.size() != state.total_parts()) {
        return fail(state, reporter,
                    make_error(ErrorCode::IncompleteTransfer,
                               "Upload incomplete: " + std::to_string(parts.size()) + "/" +
                                   std::to_string(state.total_parts()) + " parts uploaded"));
    }

    auto completed = gateway_.complete_transfer(state.bucket(), state.key(), state.transfer_id(), parts);
    if (completed.is_error()) {
        return fail(state, reporter, completed.error());
    }

    move_to(state, TransferPhase::Done);
    registry_.remove(state.bucket(), state.key(), &state);

    reporter.report(ProgressStatus::Completed, state.total_bytes(), state.total_parts());
    event_bus_.emit(events::UploadCompletedEvent{state.bucket(), state.key(), state.transfer_id(),
                                                 events::UploadStrategy::Chunked, state.total_bytes(),
                                                 elapsed_since(started_at)});
    return Ok(UploadOutcome::Completed);
}

Result<UploadOutcome> UploadOrchestrator::fail(TransferState& state, ProgressReporter& reporter, Error error) {
    move_to(state, TransferPhase::Failed);
    reporter.report(ProgressStatus::Failed, state.completed_bytes(),
                    static_cast<std::uint32_t>(state.completed_count()));
    event_bus_.emit(events::UploadFailedEvent{state.bucket(), state.key(), state.transfer_id(), describe(error)});
    return Err<UploadOutcome>(std::move(error));
}

Result<UploadOutcome> UploadOrchestrator::finish_aborted(TransferState& state, ProgressReporter& reporter) {
    move_to(state, TransferPhase::Aborted);
    reporter.report(ProgressStatus::Aborted, state.completed_bytes(),
                    static_cast<std::uint32_t>(state.completed_count()));
    spdlog::debug("Run for {}/{} stopped after abort", state.bucket(), state.key());
    return Ok(UploadOutcome::Aborted);
}

} // namespace mpu::upload
