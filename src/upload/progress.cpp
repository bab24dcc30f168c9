#include "mpu/upload/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace mpu::upload {

const char* to_string(ProgressStatus status) noexcept {
    switch (status) {
        case ProgressStatus::Uploading: return "uploading";
        case ProgressStatus::Paused: return "paused";
        case ProgressStatus::Completed: return "completed";
        case ProgressStatus::Failed: return "failed";
        case ProgressStatus::Aborted: return "aborted";
    }
    return "unknown";
}

ProgressReporter::ProgressReporter(ProgressCallback callback,
                                   std::string file_name,
                                   std::string bucket,
                                   std::string key,
                                   std::uint64_t total_bytes,
                                   std::optional<std::uint32_t> total_parts)
    : callback_(std::move(callback)),
      file_name_(std::move(file_name)),
      bucket_(std::move(bucket)),
      key_(std::move(key)),
      total_bytes_(total_bytes),
      total_parts_(total_parts) {}

void ProgressReporter::report(ProgressStatus status,
                              std::uint64_t uploaded_bytes,
                              std::optional<std::uint32_t> current_part) {
    std::lock_guard lock(mutex_);
    if (finished_) {
        return;
    }
    finished_ = is_terminal(status);

    // Parts finishing on different workers may report out of order
    uploaded_bytes = std::max(std::min(uploaded_bytes, total_bytes_), last_bytes_);
    last_bytes_ = uploaded_bytes;
    if (current_part) {
        current_part = std::max(*current_part, last_part_);
        last_part_ = *current_part;
    }

    if (!callback_) {
        return;
    }

    ProgressEvent event;
    event.file_name = file_name_;
    event.bucket = bucket_;
    event.key = key_;
    event.uploaded_bytes = uploaded_bytes;
    event.total_bytes = total_bytes_;
    if (total_bytes_ == 0) {
        event.percentage = status == ProgressStatus::Completed ? 100.0 : 0.0;
    } else {
        event.percentage = static_cast<double>(event.uploaded_bytes) * 100.0 /
                           static_cast<double>(total_bytes_);
    }
    event.current_part = current_part;
    event.total_parts = total_parts_;
    event.status = status;

    try {
        callback_(event);
    } catch (const std::exception& e) {
        spdlog::error("Progress callback for {}/{} threw: {}", bucket_, key_, e.what());
    }
}

bool ProgressReporter::finished() const {
    std::lock_guard lock(mutex_);
    return finished_;
}

} // namespace mpu::upload
