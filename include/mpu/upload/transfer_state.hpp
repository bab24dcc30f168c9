#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/types.hpp"
#include "mpu/upload/part_planner.hpp"
#include "mpu/upload/snapshot.hpp"
#include "mpu/upload/transfer_phase.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mpu::upload {

/**
 * @brief Mutable record of one chunked transfer
 *
 * Identity fields are immutable. The completed-part set, in-flight set, cursor
 * and phase are guarded by a per-transfer mutex so concurrent part tasks of the
 * same transfer can record completions safely. The pause/abort flags are atomics
 * read by the driving loop at batch boundaries.
 *
 * INVARIANTS:
 * - completed parts are unique by index and within [1, total_parts()]
 * - every index below cursor() is either completed or in flight
 */
class TransferState {
public:
    TransferState(std::string transfer_id,
                  std::string bucket,
                  std::string key,
                  std::filesystem::path source_path,
                  std::uint64_t total_bytes,
                  std::uint64_t part_size);

    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    [[nodiscard]] const std::string& transfer_id() const noexcept { return transfer_id_; }
    [[nodiscard]] const std::string& bucket() const noexcept { return bucket_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return planner_.total_bytes(); }
    [[nodiscard]] std::uint32_t total_parts() const noexcept { return planner_.total_parts(); }
    [[nodiscard]] const PartPlanner& planner() const noexcept { return planner_; }

    /**
     * @brief Record a gateway-acknowledged part and clear its in-flight mark
     *
     * @return false if the index was already recorded (the stored tag is kept)
     */
    bool record_part(std::uint32_t index, std::string tag);

    /**
     * @brief Merge parts reported by the backend; backend tags replace local ones
     *
     * Indices outside [1, total_parts()] are ignored. Returns the number of
     * parts that were not known locally.
     */
    std::size_t merge_parts(const std::vector<storage::CompletedPart>& parts);

    /**
     * @brief Select up to `limit` missing parts and mark them in flight
     *
     * Scans for gaps rather than following a monotonic counter, so arbitrary
     * non-contiguous completion sets are handled.
     */
    std::vector<std::uint32_t> claim_missing(std::size_t limit);

    /**
     * @brief Drop the in-flight mark of a part that did not complete
     */
    void release(std::uint32_t index);

    [[nodiscard]] bool has_part(std::uint32_t index) const;
    [[nodiscard]] std::size_t completed_count() const;
    [[nodiscard]] std::size_t in_flight_count() const;
    [[nodiscard]] std::uint64_t completed_bytes() const;
    [[nodiscard]] bool is_complete() const;
    [[nodiscard]] std::uint32_t cursor() const;

    /**
     * @brief Completed parts ascending by index, as required for finalize
     */
    [[nodiscard]] std::vector<storage::CompletedPart> ordered_parts() const;

    void set_paused(bool paused) noexcept { paused_.store(paused); }
    [[nodiscard]] bool paused() const noexcept { return paused_.load(); }

    void mark_aborted() noexcept { aborted_.store(true); }
    [[nodiscard]] bool aborted() const noexcept { return aborted_.load(); }

    /**
     * @brief Claim the right to drive this transfer; false if a run is active
     */
    bool try_activate() noexcept;
    void deactivate() noexcept { active_.store(false); }
    [[nodiscard]] bool active() const noexcept { return active_.load(); }

    /**
     * @brief Claim the right to issue the backend abort; false if one is running
     */
    bool try_begin_abort() noexcept;
    void end_abort() noexcept { abort_in_progress_.store(false); }

    [[nodiscard]] TransferPhase phase() const;
    Result<void> transition_to(TransferPhase next);

    [[nodiscard]] UploadSnapshot snapshot() const;

private:
    std::uint64_t completed_bytes_locked() const;

    const std::string transfer_id_;
    const std::string bucket_;
    const std::string key_;
    const std::filesystem::path source_path_;
    const PartPlanner planner_;

    mutable std::mutex mutex_;
    std::map<std::uint32_t, std::string> completed_;
    std::set<std::uint32_t> in_flight_;
    std::uint32_t cursor_ = 1;
    PhaseTracker phase_;

    std::atomic<bool> paused_{false};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> active_{false};
    std::atomic<bool> abort_in_progress_{false};
};

/**
 * @brief Thread-safe map of (bucket, key) to TransferState
 *
 * One registry per orchestrator. The map lock is held only for the lookup or
 * insertion itself, so transfers on different keys never wait on each other.
 */
class TransferRegistry {
public:
    TransferRegistry() = default;

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * @brief Register a new transfer; fails if (bucket, key) is already registered
     */
    Result<std::shared_ptr<TransferState>> create(std::string transfer_id,
                                                  const std::string& bucket,
                                                  const std::string& key,
                                                  std::filesystem::path source_path,
                                                  std::uint64_t total_bytes,
                                                  std::uint64_t part_size);

    std::shared_ptr<TransferState> get(const std::string& bucket, const std::string& key) const;

    /**
     * @brief Remove the entry for (bucket, key)
     *
     * When `expected` is given the entry is only removed if it is that state.
     */
    bool remove(const std::string& bucket,
                const std::string& key,
                const TransferState* expected = nullptr);

    std::size_t size() const;

    std::vector<UploadSnapshot> snapshots() const;

private:
    struct Key {
        std::string bucket;
        std::string key;

        bool operator==(const Key& other) const {
            return bucket == other.bucket && key == other.key;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& k) const noexcept {
            const std::size_t h1 = std::hash<std::string>{}(k.bucket);
            const std::size_t h2 = std::hash<std::string>{}(k.key);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, std::shared_ptr<TransferState>, KeyHash> entries_;
};

} // namespace mpu::upload
