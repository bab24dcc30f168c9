#include "mpu/storage/memory_gateway.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace mpu::storage {

InMemoryStorageGateway::InMemoryStorageGateway(std::uint64_t min_part_size)
    : min_part_size_(min_part_size) {}

void InMemoryStorageGateway::create_bucket(const std::string& bucket) {
    std::lock_guard lock(mutex_);
    buckets_.insert(bucket);
}

bool InMemoryStorageGateway::has_bucket(const std::string& bucket) const {
    std::lock_guard lock(mutex_);
    return buckets_.count(bucket) > 0;
}

Result<void> InMemoryStorageGateway::put_object(const std::string& bucket,
                                                const std::string& key,
                                                const Bytes& data) {
    std::lock_guard lock(mutex_);
    if (buckets_.count(bucket) == 0) {
        return Err<void>(ErrorCode::GatewayError, "NoSuchBucket: " + bucket);
    }
    objects_[{bucket, key}] = data;
    return Ok();
}

Result<std::string> InMemoryStorageGateway::initiate_transfer(const std::string& bucket,
                                                              const std::string& key) {
    std::lock_guard lock(mutex_);
    if (buckets_.count(bucket) == 0) {
        return Err<std::string>(ErrorCode::GatewayError, "NoSuchBucket: " + bucket);
    }

    const auto transfer_id = "upload-" + std::to_string(++transfer_counter_);
    PendingTransfer pending;
    pending.bucket = bucket;
    pending.key = key;
    transfers_.emplace(transfer_id, std::move(pending));
    spdlog::debug("Initiated transfer {} for {}/{}", transfer_id, bucket, key);
    return Ok(transfer_id);
}

Result<std::vector<CompletedPart>> InMemoryStorageGateway::list_completed_parts(const std::string& bucket,
                                                                                const std::string& key,
                                                                                const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    auto found = find_transfer(bucket, key, transfer_id);
    if (found.is_error()) {
        return Err<std::vector<CompletedPart>>(found.error());
    }

    std::vector<CompletedPart> parts;
    for (const auto& [index, entry] : found.value()->parts) {
        parts.push_back(CompletedPart{index, entry.first});
    }
    return Ok(std::move(parts));
}

Result<std::string> InMemoryStorageGateway::upload_part(const std::string& bucket,
                                                        const std::string& key,
                                                        const std::string& transfer_id,
                                                        std::uint32_t part_index,
                                                        const Bytes& data) {
    if (part_index == 0 || part_index > kMaxPartIndex) {
        return Err<std::string>(ErrorCode::GatewayError,
                                "InvalidArgument: part index out of range: " + std::to_string(part_index));
    }

    auto tag = compute_tag(data);

    std::lock_guard lock(mutex_);
    auto found = find_transfer(bucket, key, transfer_id);
    if (found.is_error()) {
        return Err<std::string>(found.error());
    }
    // Re-uploading an index replaces the stored part
    found.value()->parts[part_index] = {tag, data};
    return Ok(std::move(tag));
}

Result<void> InMemoryStorageGateway::complete_transfer(const std::string& bucket,
                                                       const std::string& key,
                                                       const std::string& transfer_id,
                                                       const std::vector<CompletedPart>& parts) {
    std::lock_guard lock(mutex_);
    auto found = find_transfer(bucket, key, transfer_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto* pending = found.value();

    if (parts.empty()) {
        return Err<void>(ErrorCode::GatewayError, "MalformedXML: empty part list");
    }

    Bytes assembled;
    std::uint32_t previous_index = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part.index <= previous_index) {
            return Err<void>(ErrorCode::GatewayError, "InvalidPartOrder: part " + std::to_string(part.index));
        }
        previous_index = part.index;

        auto stored = pending->parts.find(part.index);
        if (stored == pending->parts.end() || stored->second.first != part.tag) {
            return Err<void>(ErrorCode::GatewayError, "InvalidPart: part " + std::to_string(part.index));
        }

        const auto& bytes = stored->second.second;
        const bool last = (i + 1 == parts.size());
        if (!last && bytes.size() < min_part_size_) {
            return Err<void>(ErrorCode::GatewayError, "EntityTooSmall: part " + std::to_string(part.index));
        }
        assembled.insert(assembled.end(), bytes.begin(), bytes.end());
    }

    objects_[{bucket, key}] = std::move(assembled);
    transfers_.erase(transfer_id);
    spdlog::debug("Completed transfer {} for {}/{} ({} parts)", transfer_id, bucket, key, parts.size());
    return Ok();
}

Result<void> InMemoryStorageGateway::abort_transfer(const std::string& bucket,
                                                    const std::string& key,
                                                    const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    auto found = find_transfer(bucket, key, transfer_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    transfers_.erase(transfer_id);
    return Ok();
}

std::optional<Bytes> InMemoryStorageGateway::object(const std::string& bucket, const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find({bucket, key});
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryStorageGateway::pending_transfers() const {
    std::lock_guard lock(mutex_);
    return transfers_.size();
}

std::string InMemoryStorageGateway::compute_tag(const Bytes& data) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (std::uint8_t byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= prime;
    }
    std::ostringstream oss;
    oss << '"' << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash << '"';
    return oss.str();
}

Result<InMemoryStorageGateway::PendingTransfer*> InMemoryStorageGateway::find_transfer(const std::string& bucket,
                                                                                       const std::string& key,
                                                                                       const std::string& transfer_id) {
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end() || it->second.bucket != bucket || it->second.key != key) {
        return Err<PendingTransfer*>(ErrorCode::GatewayError, "NoSuchUpload: " + transfer_id);
    }
    return Ok(&it->second);
}

} // namespace mpu::storage
