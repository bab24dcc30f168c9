/**
 * @file pause_resume_example.cpp
 * @brief Chunked upload that is paused, persisted and resumed
 *
 * WHAT IT SHOWS:
 * - Small files go out in a single put, large ones in parts
 * - A progress callback pauses the transfer after the first part
 * - The paused transfer is written to disk as JSON and resumed from it
 *   with a fresh registry, as a restarted process would do
 * - Logging and metrics are driven by the EventBus
 *
 * USAGE:
 *   pause_resume_example [file] [config.json]
 *
 * Without a file argument a 12 MiB scratch file is generated.
 */

#include "mpu/core/config.hpp"
#include "mpu/events/components.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/storage/byte_source.hpp"
#include "mpu/storage/memory_gateway.hpp"
#include "mpu/upload/orchestrator.hpp"
#include "mpu/upload/snapshot.hpp"
#include "mpu/upload/transfer_state.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mpu;
using namespace mpu::upload;
namespace fs = std::filesystem;

namespace {

constexpr const char* kBucket = "demo-bucket";

fs::path make_scratch_file(std::uint64_t size) {
    const fs::path path = fs::temp_directory_path() / "mpu_pause_resume_example.bin";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (std::uint64_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i % 251));
    }
    return path;
}

void log_progress(const ProgressEvent& e) {
    spdlog::info("  {} {}/{}: {:.1f}% ({}/{} bytes)", to_string(e.status), e.bucket, e.key,
                 e.percentage, e.uploaded_bytes, e.total_bytes);
}

} // namespace

int main(int argc, char* argv[]) {
    UploadConfig config;
    if (argc > 2) {
        auto loaded = load_config(argv[2]);
        if (loaded.is_error()) {
            spdlog::error("{}", describe(loaded.error()));
            return 1;
        }
        config = loaded.value();
    }
    config.retry_base_delay = std::chrono::milliseconds(100);
    apply_log_level(config);

    const fs::path file = argc > 1 ? fs::path(argv[1]) : make_scratch_file(12 * UploadConfig::kMiB);
    const std::string key = file.filename().string();

    // ════════════════════════════════════════════════════════
    // Wiring
    // ════════════════════════════════════════════════════════

    storage::InMemoryStorageGateway gateway;
    gateway.create_bucket(kBucket);
    storage::FileByteSource source;

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    const fs::path snapshot_path = fs::temp_directory_path() / "mpu_pause_resume_example.json";

    {
        TransferRegistry registry;
        UploadOrchestrator orchestrator(gateway, source, registry, bus, config);

        spdlog::info("Uploading {} to {}/{}", file.string(), kBucket, key);
        auto first = orchestrator.upload_file(kBucket, key, file, [&](const ProgressEvent& e) {
            log_progress(e);
            if (e.current_part.value_or(0) >= 1 && e.status == ProgressStatus::Uploading) {
                orchestrator.pause_upload(kBucket, key);
            }
        });

        if (first.is_error()) {
            spdlog::error("Upload failed: {}", describe(first.error()));
            return 1;
        }
        if (first.value() != UploadOutcome::Paused) {
            spdlog::info("Upload finished without pausing ({})", to_string(first.value()));
            metrics.print_stats();
            return 0;
        }

        auto state = orchestrator.upload_state(kBucket, key);
        if (!state) {
            spdlog::error("Paused transfer has no state");
            return 1;
        }
        std::ofstream out(snapshot_path);
        out << serialize_snapshot(*state);
        spdlog::info("Saved transfer {} ({}/{} parts) to {}",
                     state->transfer_id, state->completed_count, state->total_parts, snapshot_path.string());
    }

    // ════════════════════════════════════════════════════════
    // "Restart": new registry and orchestrator, state from disk
    // ════════════════════════════════════════════════════════

    std::ifstream in(snapshot_path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto snapshot = parse_snapshot(buffer.str());
    if (snapshot.is_error()) {
        spdlog::error("{}", describe(snapshot.error()));
        return 1;
    }

    TransferRegistry registry;
    UploadOrchestrator orchestrator(gateway, source, registry, bus, config);
    auto resumed = orchestrator.resume_upload(snapshot.value(), log_progress);
    if (resumed.is_error()) {
        spdlog::error("Resume failed: {}", describe(resumed.error()));
        return 1;
    }

    const auto stored = gateway.object(kBucket, key);
    spdlog::info("Resume ended {}; stored object is {} bytes", to_string(resumed.value()),
                 stored ? stored->size() : 0);
    metrics.print_stats();
    return 0;
}
