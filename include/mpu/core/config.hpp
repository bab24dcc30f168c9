#pragma once

#include "mpu/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mpu {

/**
 * @brief Tunables for the upload orchestrator
 *
 * Defaults match S3-compatible backends: 5 MiB is the smallest part size such
 * backends accept for every part except the last one.
 */
struct UploadConfig {
    static constexpr std::uint64_t kMiB = 1024 * 1024;

    std::uint64_t multipart_threshold = 5 * kMiB; ///< Files below this use a single put
    std::uint64_t part_size = 5 * kMiB;
    std::size_t max_concurrent_parts = 3;
    std::size_t max_part_retries = 3;             ///< Additional attempts after the first failure
    std::chrono::milliseconds retry_base_delay{1000};
    std::size_t worker_threads = 0;               ///< Per chunked run; 0 means max_concurrent_parts
    std::string log_level = "info";

    [[nodiscard]] std::size_t effective_worker_threads() const noexcept {
        return worker_threads == 0 ? max_concurrent_parts : worker_threads;
    }

    Result<void> validate() const;
};

/**
 * @brief Parse a JSON document into an UploadConfig
 *
 * Recognised keys: multipart_threshold, part_size, max_concurrent_parts,
 * max_part_retries, retry_base_delay_ms, worker_threads, log_level.
 * Missing keys keep their defaults. The parsed config is validated.
 */
Result<UploadConfig> parse_config(const std::string& text);

Result<UploadConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Apply config.log_level to the default spdlog logger
 */
void apply_log_level(const UploadConfig& config);

} // namespace mpu
