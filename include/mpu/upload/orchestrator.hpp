#pragma once

#include "mpu/core/config.hpp"
#include "mpu/core/result.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"
#include "mpu/storage/byte_source.hpp"
#include "mpu/storage/gateway.hpp"
#include "mpu/upload/progress.hpp"
#include "mpu/upload/snapshot.hpp"
#include "mpu/upload/transfer_state.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace mpu::upload {

/**
 * @brief How a successful call ended
 *
 * Failures are reported through the Result error instead.
 */
enum class UploadOutcome {
    Completed,
    Paused,
    Aborted
};

const char* to_string(UploadOutcome outcome) noexcept;

/**
 * @brief Drives uploads to an object store
 *
 * Files below config.multipart_threshold go out in a single put. Larger files
 * use a chunked transfer: parts are uploaded in batches of at most
 * max_concurrent_parts on a worker pool owned by that run, each part retried
 * with linear backoff, and the transfer is finalized once every part is
 * stored. Runs on different keys never share workers, so each of them gets
 * its full max_concurrent_parts overlap.
 * Chunked transfers can be paused, resumed (also from a persisted snapshot in
 * another process) and aborted.
 *
 * THREAD SAFETY:
 * All public methods may be called from any thread. upload_file and
 * resume_upload block the calling thread until the run reaches Completed,
 * Paused, Aborted or fails; pause_upload and abort_upload are meant to be
 * called from other threads (or from a progress callback) meanwhile.
 * Pause and abort are cooperative: they are observed between batches and
 * never cancel part uploads already in flight.
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(storage::StorageGateway& gateway,
                       storage::ByteSource& source,
                       TransferRegistry& registry,
                       events::EventBus& bus,
                       UploadConfig config = {});

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    /**
     * @brief Upload `path` to bucket/key, choosing simple or chunked transfer
     *
     * If a chunked transfer is already registered for bucket/key (paused or
     * failed earlier) it is resumed instead of restarted, whatever the current
     * size of the file. A different path or size than the registered one is
     * rejected.
     */
    Result<UploadOutcome> upload_file(const std::string& bucket,
                                      const std::string& key,
                                      const std::filesystem::path& path,
                                      ProgressCallback on_progress = {});

    /**
     * @brief Request a cooperative pause
     *
     * @return false if no transfer is registered for bucket/key
     */
    bool pause_upload(const std::string& bucket, const std::string& key);

    /**
     * @brief Continue a registered transfer; NoSuchTransfer if none exists
     */
    Result<UploadOutcome> resume_upload(const std::string& bucket,
                                        const std::string& key,
                                        ProgressCallback on_progress = {});

    /**
     * @brief Continue a transfer described by a persisted snapshot
     *
     * Works without a registry entry (e.g. after a restart): the parts already
     * stored under snapshot.transfer_id are listed from the backend.
     */
    Result<UploadOutcome> resume_upload(const UploadSnapshot& snapshot,
                                        ProgressCallback on_progress = {});

    /**
     * @brief Abort and release the backend transfer for bucket/key
     *
     * A missing entry is not an error. If the backend abort fails the entry
     * stays registered (flagged aborted) so the call can be repeated.
     */
    Result<void> abort_upload(const std::string& bucket, const std::string& key);

    std::optional<UploadSnapshot> upload_state(const std::string& bucket, const std::string& key) const;

    [[nodiscard]] const UploadConfig& config() const noexcept { return config_; }

private:
    struct ResumeRequest {
        std::string transfer_id;
        std::uint64_t part_size = 0;
    };

    Result<UploadOutcome> run_simple(const std::string& bucket,
                                     const std::string& key,
                                     const std::filesystem::path& path,
                                     std::uint64_t total_bytes,
                                     const ProgressCallback& on_progress);

    Result<UploadOutcome> run_chunked(const std::string& bucket,
                                      const std::string& key,
                                      const std::filesystem::path& path,
                                      std::uint64_t total_bytes,
                                      const ProgressCallback& on_progress,
                                      std::optional<ResumeRequest> resume);

    // Returns the registered state for bucket/key, claimed for this run,
    // initiating a backend transfer when nothing is registered yet
    Result<std::shared_ptr<TransferState>> acquire(const std::string& bucket,
                                                   const std::string& key,
                                                   const std::filesystem::path& path,
                                                   std::uint64_t total_bytes,
                                                   std::uint64_t part_size,
                                                   const std::optional<ResumeRequest>& resume,
                                                   bool& resumed);

    Result<UploadOutcome> transfer_parts(TransferState& state,
                                         storage::ByteReader& reader,
                                         ProgressReporter& reporter,
                                         std::chrono::steady_clock::time_point started_at);

    Result<void> upload_part(TransferState& state,
                             storage::ByteReader& reader,
                             ProgressReporter& reporter,
                             std::uint32_t index);

    Result<UploadOutcome> complete(TransferState& state,
                                   ProgressReporter& reporter,
                                   std::chrono::steady_clock::time_point started_at);

    Result<UploadOutcome> fail(TransferState& state, ProgressReporter& reporter, Error error);

    Result<UploadOutcome> finish_aborted(TransferState& state, ProgressReporter& reporter);

    storage::StorageGateway& gateway_;
    storage::ByteSource& source_;
    TransferRegistry& registry_;
    events::EventBus& event_bus_;
    const UploadConfig config_;
};

} // namespace mpu::upload
