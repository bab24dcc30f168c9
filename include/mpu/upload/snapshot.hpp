#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/types.hpp"
#include "mpu/upload/transfer_phase.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mpu::upload {

/**
 * @brief Point-in-time copy of a registered chunked transfer
 *
 * Carries everything needed to resume the transfer from another process:
 * persist it (see serialize_snapshot) and hand it back to
 * UploadOrchestrator::resume_upload.
 */
struct UploadSnapshot {
    std::string bucket;
    std::string key;
    std::string source_path;
    std::string transfer_id;
    std::uint64_t total_bytes = 0;
    std::uint64_t part_size = 0;
    std::uint32_t total_parts = 0;
    std::vector<storage::CompletedPart> completed_parts; ///< Ascending by index
    std::size_t completed_count = 0;
    std::uint64_t completed_bytes = 0;
    bool paused = false;
    bool aborted = false;
    TransferPhase phase = TransferPhase::Initiating;
};

void to_json(nlohmann::json& j, const UploadSnapshot& snapshot);
void from_json(const nlohmann::json& j, UploadSnapshot& snapshot);

std::string serialize_snapshot(const UploadSnapshot& snapshot);

Result<UploadSnapshot> parse_snapshot(const std::string& text);

} // namespace mpu::upload
