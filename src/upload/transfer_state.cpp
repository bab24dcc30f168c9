#include "mpu/upload/transfer_state.hpp"

#include <spdlog/spdlog.h>

namespace mpu::upload {

TransferState::TransferState(std::string transfer_id,
                             std::string bucket,
                             std::string key,
                             std::filesystem::path source_path,
                             std::uint64_t total_bytes,
                             std::uint64_t part_size)
    : transfer_id_(std::move(transfer_id)),
      bucket_(std::move(bucket)),
      key_(std::move(key)),
      source_path_(std::move(source_path)),
      planner_(total_bytes, part_size) {}

bool TransferState::record_part(std::uint32_t index, std::string tag) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(index);
    return completed_.emplace(index, std::move(tag)).second;
}

std::size_t TransferState::merge_parts(const std::vector<storage::CompletedPart>& parts) {
    std::lock_guard lock(mutex_);
    std::size_t added = 0;
    for (const auto& part : parts) {
        if (part.index == 0 || part.index > planner_.total_parts()) {
            spdlog::warn("Ignoring part {} outside plan of {} parts for {}/{}",
                         part.index, planner_.total_parts(), bucket_, key_);
            continue;
        }
        if (completed_.insert_or_assign(part.index, part.tag).second) {
            ++added;
        }
    }
    cursor_ = 1;
    return added;
}

std::vector<std::uint32_t> TransferState::claim_missing(std::size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<std::uint32_t> batch;
    const auto total = planner_.total_parts();

    auto is_taken = [this](std::uint32_t index) {
        return completed_.count(index) > 0 || in_flight_.count(index) > 0;
    };

    for (std::uint32_t index = cursor_; index <= total && batch.size() < limit; ++index) {
        if (!is_taken(index)) {
            batch.push_back(index);
            in_flight_.insert(index);
        }
    }

    while (cursor_ <= total && is_taken(cursor_)) {
        ++cursor_;
    }
    return batch;
}

void TransferState::release(std::uint32_t index) {
    std::lock_guard lock(mutex_);
    if (in_flight_.erase(index) > 0 && completed_.count(index) == 0 && index < cursor_) {
        cursor_ = index;
    }
}

bool TransferState::has_part(std::uint32_t index) const {
    std::lock_guard lock(mutex_);
    return completed_.count(index) > 0;
}

std::size_t TransferState::completed_count() const {
    std::lock_guard lock(mutex_);
    return completed_.size();
}

std::size_t TransferState::in_flight_count() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

std::uint64_t TransferState::completed_bytes() const {
    std::lock_guard lock(mutex_);
    return completed_bytes_locked();
}

bool TransferState::is_complete() const {
    std::lock_guard lock(mutex_);
    return completed_.size() == planner_.total_parts();
}

std::uint32_t TransferState::cursor() const {
    std::lock_guard lock(mutex_);
    return cursor_;
}

std::vector<storage::CompletedPart> TransferState::ordered_parts() const {
    std::lock_guard lock(mutex_);
    std::vector<storage::CompletedPart> parts;
    parts.reserve(completed_.size());
    for (const auto& [index, tag] : completed_) {
        parts.push_back(storage::CompletedPart{index, tag});
    }
    return parts;
}

bool TransferState::try_activate() noexcept {
    bool expected = false;
    return active_.compare_exchange_strong(expected, true);
}

bool TransferState::try_begin_abort() noexcept {
    bool expected = false;
    return abort_in_progress_.compare_exchange_strong(expected, true);
}

TransferPhase TransferState::phase() const {
    std::lock_guard lock(mutex_);
    return phase_.phase();
}

Result<void> TransferState::transition_to(TransferPhase next) {
    std::lock_guard lock(mutex_);
    return phase_.transition_to(next);
}

UploadSnapshot TransferState::snapshot() const {
    std::lock_guard lock(mutex_);
    UploadSnapshot snapshot;
    snapshot.bucket = bucket_;
    snapshot.key = key_;
    snapshot.source_path = source_path_.string();
    snapshot.transfer_id = transfer_id_;
    snapshot.total_bytes = planner_.total_bytes();
    snapshot.part_size = planner_.part_size();
    snapshot.total_parts = planner_.total_parts();
    for (const auto& [index, tag] : completed_) {
        snapshot.completed_parts.push_back(storage::CompletedPart{index, tag});
    }
    snapshot.completed_count = completed_.size();
    snapshot.completed_bytes = completed_bytes_locked();
    snapshot.paused = paused_.load();
    snapshot.aborted = aborted_.load();
    snapshot.phase = phase_.phase();
    return snapshot;
}

std::uint64_t TransferState::completed_bytes_locked() const {
    std::uint64_t bytes = 0;
    for (const auto& entry : completed_) {
        bytes += planner_.length_of(entry.first);
    }
    return bytes;
}

// ════════════════════════════════════════════════════════
// TransferRegistry
// ════════════════════════════════════════════════════════

Result<std::shared_ptr<TransferState>> TransferRegistry::create(std::string transfer_id,
                                                                const std::string& bucket,
                                                                const std::string& key,
                                                                std::filesystem::path source_path,
                                                                std::uint64_t total_bytes,
                                                                std::uint64_t part_size) {
    auto state = std::make_shared<TransferState>(std::move(transfer_id), bucket, key,
                                                 std::move(source_path), total_bytes, part_size);

    std::unique_lock lock(mutex_);
    if (!entries_.emplace(Key{bucket, key}, state).second) {
        return Err<std::shared_ptr<TransferState>>(ErrorCode::TransferBusy,
                                                   "Transfer already registered for " + bucket + "/" + key);
    }
    return Ok(std::move(state));
}

std::shared_ptr<TransferState> TransferRegistry::get(const std::string& bucket, const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(Key{bucket, key});
    return it != entries_.end() ? it->second : nullptr;
}

bool TransferRegistry::remove(const std::string& bucket,
                              const std::string& key,
                              const TransferState* expected) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(Key{bucket, key});
    if (it == entries_.end()) {
        return false;
    }
    if (expected != nullptr && it->second.get() != expected) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::size_t TransferRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<UploadSnapshot> TransferRegistry::snapshots() const {
    std::vector<std::shared_ptr<TransferState>> states;
    {
        std::shared_lock lock(mutex_);
        states.reserve(entries_.size());
        for (const auto& [key, state] : entries_) {
            states.push_back(state);
        }
    }

    std::vector<UploadSnapshot> result;
    result.reserve(states.size());
    for (const auto& state : states) {
        result.push_back(state->snapshot());
    }
    return result;
}

} // namespace mpu::upload
