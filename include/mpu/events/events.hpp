/**
 * @file events.hpp
 * @brief Upload lifecycle events published by the orchestrator
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadStartedEvent, PartUploadedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mpu::events {

enum class UploadStrategy {
    Simple,
    Chunked
};

inline const char* to_string(UploadStrategy strategy) {
    return strategy == UploadStrategy::Simple ? "simple" : "chunked";
}

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when upload_file or resume_upload starts driving a transfer
 *
 * transfer_id is empty for simple transfers. resumed is true when the
 * transfer identity already existed (resume path).
 */
struct UploadStartedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    UploadStrategy strategy = UploadStrategy::Simple;
    std::uint64_t total_bytes = 0;
    bool resumed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the backend acknowledged one part
 */
struct PartUploadedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    std::uint32_t part_index = 0;
    std::uint32_t total_parts = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted before a failed part is retried
 */
struct PartRetryEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    std::uint32_t part_index = 0;
    std::size_t attempt = 0;       ///< 1-based retry number
    std::size_t max_attempts = 0;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadPausedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    std::size_t completed_parts = 0;
    std::uint32_t total_parts = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    UploadStrategy strategy = UploadStrategy::Simple;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a transfer was aborted and its backend identity released
 */
struct UploadAbortedEvent {
    std::string bucket;
    std::string key;
    std::string transfer_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace mpu::events
