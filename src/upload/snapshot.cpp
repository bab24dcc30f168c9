#include "mpu/upload/snapshot.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace mpu::upload {

using json = nlohmann::json;

void to_json(json& j, const UploadSnapshot& snapshot) {
    json parts = json::array();
    for (const auto& part : snapshot.completed_parts) {
        parts.push_back(json{{"index", part.index}, {"tag", part.tag}});
    }

    j = json{
        {"bucket", snapshot.bucket},
        {"key", snapshot.key},
        {"source_path", snapshot.source_path},
        {"transfer_id", snapshot.transfer_id},
        {"total_bytes", snapshot.total_bytes},
        {"part_size", snapshot.part_size},
        {"total_parts", snapshot.total_parts},
        {"completed_parts", parts},
        {"completed_count", snapshot.completed_count},
        {"completed_bytes", snapshot.completed_bytes},
        {"paused", snapshot.paused},
        {"aborted", snapshot.aborted},
        {"phase", to_string(snapshot.phase)},
    };
}

void from_json(const json& j, UploadSnapshot& snapshot) {
    j.at("bucket").get_to(snapshot.bucket);
    j.at("key").get_to(snapshot.key);
    j.at("source_path").get_to(snapshot.source_path);
    j.at("transfer_id").get_to(snapshot.transfer_id);
    j.at("total_bytes").get_to(snapshot.total_bytes);
    j.at("part_size").get_to(snapshot.part_size);
    snapshot.total_parts = j.value("total_parts", 0u);
    snapshot.paused = j.value("paused", false);
    snapshot.aborted = j.value("aborted", false);

    snapshot.completed_parts.clear();
    if (auto it = j.find("completed_parts"); it != j.end()) {
        for (const auto& entry : *it) {
            storage::CompletedPart part;
            entry.at("index").get_to(part.index);
            entry.at("tag").get_to(part.tag);
            snapshot.completed_parts.push_back(std::move(part));
        }
    }
    snapshot.completed_count = j.value("completed_count", snapshot.completed_parts.size());
    snapshot.completed_bytes = j.value("completed_bytes", std::uint64_t{0});

    const auto phase = phase_from_string(j.value("phase", std::string("initiating")));
    if (!phase) {
        throw std::invalid_argument("unknown transfer phase");
    }
    snapshot.phase = *phase;
}

std::string serialize_snapshot(const UploadSnapshot& snapshot) {
    return json(snapshot).dump(2);
}

Result<UploadSnapshot> parse_snapshot(const std::string& text) {
    try {
        return Ok(json::parse(text).get<UploadSnapshot>());
    } catch (const json::exception& e) {
        return Err<UploadSnapshot>(ErrorCode::InvalidArgument, std::string("Invalid upload snapshot: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Err<UploadSnapshot>(ErrorCode::InvalidArgument, std::string("Invalid upload snapshot: ") + e.what());
    }
}

} // namespace mpu::upload
