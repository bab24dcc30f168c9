/**
 * @file components.hpp
 * @brief Event-driven logging and metrics for the upload engine
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every upload event is now logged and counted
 */

#pragma once

#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace mpu::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Part-level events go to debug, retries to warn, failures to error.
 * Handlers are detached when the component is destroyed, so it may live
 * shorter than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe_scoped<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<PartRetryEvent>([this](const PartRetryEvent& e) {
            on_part_retry(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadPausedEvent>([this](const UploadPausedEvent& e) {
            on_upload_paused(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            on_upload_aborted(e);
        }));
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] {}/{} strategy={} bytes={} transfer={} resumed={}",
                     e.bucket, e.key, to_string(e.strategy), e.total_bytes,
                     e.transfer_id.empty() ? "-" : e.transfer_id, e.resumed);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] {}/{} transfer={} part={}/{} bytes={}",
                      e.bucket, e.key, e.transfer_id, e.part_index, e.total_parts, e.bytes);
    }

    void on_part_retry(const PartRetryEvent& e) {
        spdlog::warn("[PartRetry] {}/{} transfer={} part={} attempt={}/{} error={}",
                     e.bucket, e.key, e.transfer_id, e.part_index, e.attempt, e.max_attempts,
                     e.error_message);
    }

    void on_upload_paused(const UploadPausedEvent& e) {
        spdlog::info("[UploadPaused] {}/{} transfer={} parts={}/{}",
                     e.bucket, e.key, e.transfer_id, e.completed_parts, e.total_parts);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] {}/{} strategy={} bytes={} duration={}ms",
                     e.bucket, e.key, to_string(e.strategy), e.total_bytes, e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] {}/{} transfer={} error={}",
                      e.bucket, e.key, e.transfer_id.empty() ? "-" : e.transfer_id, e.error_message);
    }

    void on_upload_aborted(const UploadAbortedEvent& e) {
        spdlog::info("[UploadAborted] {}/{} transfer={}", e.bucket, e.key, e.transfer_id);
    }

    EventBus& bus_;
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts upload activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().parts_uploaded.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_paused{0};
        std::atomic<uint64_t> uploads_aborted{0};
        std::atomic<uint64_t> simple_uploads{0};
        std::atomic<uint64_t> chunked_uploads{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> part_retries{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe_scoped<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<PartRetryEvent>([this](const PartRetryEvent&) {
            stats_.part_retries++;
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadPausedEvent>([this](const UploadPausedEvent&) {
            stats_.uploads_paused++;
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        }));

        subscriptions_.push_back(bus_.subscribe_scoped<UploadAbortedEvent>([this](const UploadAbortedEvent&) {
            stats_.uploads_aborted++;
        }));
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Started:         {}", stats_.uploads_started.load());
        spdlog::info("  Completed:       {}", stats_.uploads_completed.load());
        spdlog::info("  Failed:          {}", stats_.uploads_failed.load());
        spdlog::info("  Paused:          {}", stats_.uploads_paused.load());
        spdlog::info("  Aborted:         {}", stats_.uploads_aborted.load());
        spdlog::info("  Simple/chunked:  {}/{}", stats_.simple_uploads.load(), stats_.chunked_uploads.load());
        spdlog::info("  Parts uploaded:  {}", stats_.parts_uploaded.load());
        spdlog::info("  Part retries:    {}", stats_.part_retries.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_upload_completed(const UploadCompletedEvent& e) {
        stats_.uploads_completed++;
        if (e.strategy == UploadStrategy::Simple) {
            stats_.simple_uploads++;
            // Simple transfers emit no part events
            stats_.bytes_uploaded += e.total_bytes;
        } else {
            stats_.chunked_uploads++;
        }
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace mpu::events
