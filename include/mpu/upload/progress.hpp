#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mpu::upload {

enum class ProgressStatus {
    Uploading,
    Paused,
    Completed,
    Failed,
    Aborted
};

const char* to_string(ProgressStatus status) noexcept;

struct ProgressEvent {
    std::string file_name;   ///< Source path
    std::string bucket;
    std::string key;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double percentage = 0.0;
    std::optional<std::uint32_t> current_part; ///< Completed part count (chunked only)
    std::optional<std::uint32_t> total_parts;  ///< Chunked only
    ProgressStatus status = ProgressStatus::Uploading;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Delivers progress events for one run of one transfer
 *
 * Calls are serialized, so a callback never runs concurrently with itself even
 * when parts complete on different worker threads. Uploaded bytes and the part
 * count never go backwards between events. Once a Completed, Failed or
 * Aborted event has been delivered every later report is dropped. A throwing
 * callback is logged and otherwise ignored.
 */
class ProgressReporter {
public:
    ProgressReporter(ProgressCallback callback,
                     std::string file_name,
                     std::string bucket,
                     std::string key,
                     std::uint64_t total_bytes,
                     std::optional<std::uint32_t> total_parts = std::nullopt);

    void report(ProgressStatus status,
                std::uint64_t uploaded_bytes,
                std::optional<std::uint32_t> current_part = std::nullopt);

    [[nodiscard]] bool finished() const;

private:
    static bool is_terminal(ProgressStatus status) noexcept {
        return status == ProgressStatus::Completed ||
               status == ProgressStatus::Failed ||
               status == ProgressStatus::Aborted;
    }

    ProgressCallback callback_;
    std::string file_name_;
    std::string bucket_;
    std::string key_;
    std::uint64_t total_bytes_;
    std::optional<std::uint32_t> total_parts_;

    mutable std::mutex mutex_;
    bool finished_ = false;
    std::uint64_t last_bytes_ = 0;
    std::uint32_t last_part_ = 0;
};

} // namespace mpu::upload
