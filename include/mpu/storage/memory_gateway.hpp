#pragma once

/**
 * @file memory_gateway.hpp
 * @brief In-process object store implementing StorageGateway
 *
 * Behaves like an S3-compatible backend for everything the upload engine
 * relies on: buckets must exist, part indices are 1..10000, tags are digests of
 * the part bytes, completion validates the part list and assembles the object.
 * Used by the test suite and the example programs.
 */

#include "mpu/storage/gateway.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace mpu::storage {

class InMemoryStorageGateway : public StorageGateway {
public:
    static constexpr std::uint32_t kMaxPartIndex = 10000;
    static constexpr std::uint64_t kDefaultMinPartSize = 5 * 1024 * 1024;

    explicit InMemoryStorageGateway(std::uint64_t min_part_size = kDefaultMinPartSize);

    void create_bucket(const std::string& bucket);
    [[nodiscard]] bool has_bucket(const std::string& bucket) const;

    Result<void> put_object(const std::string& bucket,
                            const std::string& key,
                            const Bytes& data) override;

    Result<std::string> initiate_transfer(const std::string& bucket,
                                          const std::string& key) override;

    Result<std::vector<CompletedPart>> list_completed_parts(const std::string& bucket,
                                                            const std::string& key,
                                                            const std::string& transfer_id) override;

    Result<std::string> upload_part(const std::string& bucket,
                                    const std::string& key,
                                    const std::string& transfer_id,
                                    std::uint32_t part_index,
                                    const Bytes& data) override;

    Result<void> complete_transfer(const std::string& bucket,
                                   const std::string& key,
                                   const std::string& transfer_id,
                                   const std::vector<CompletedPart>& parts) override;

    Result<void> abort_transfer(const std::string& bucket,
                                const std::string& key,
                                const std::string& transfer_id) override;

    std::optional<Bytes> object(const std::string& bucket, const std::string& key) const;

    /**
     * @brief Number of initiated transfers neither completed nor aborted
     */
    std::size_t pending_transfers() const;

    static std::string compute_tag(const Bytes& data);

private:
    struct PendingTransfer {
        std::string bucket;
        std::string key;
        std::map<std::uint32_t, std::pair<std::string, Bytes>> parts; ///< index -> (tag, bytes)
    };

    Result<PendingTransfer*> find_transfer(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& transfer_id);

    const std::uint64_t min_part_size_;
    std::atomic<std::uint64_t> transfer_counter_{0};

    mutable std::mutex mutex_;
    std::set<std::string> buckets_;
    std::map<std::pair<std::string, std::string>, Bytes> objects_;
    std::unordered_map<std::string, PendingTransfer> transfers_;
};

} // namespace mpu::storage
