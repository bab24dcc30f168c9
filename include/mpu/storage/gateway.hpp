#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mpu::storage {

/**
 * @brief Semantic operations the upload engine needs from an object store
 *
 * Implementations wrap a concrete protocol client (S3, MinIO, ...). Every call
 * reports failure through Result with ErrorCode::GatewayError; per-call timeouts
 * are the implementation's responsibility.
 *
 * THREAD SAFETY:
 * upload_part is called concurrently for different part indices of the same
 * transfer. Implementations must tolerate that.
 */
class StorageGateway {
public:
    virtual ~StorageGateway() = default;

    virtual Result<void> put_object(const std::string& bucket,
                                    const std::string& key,
                                    const Bytes& data) = 0;

    /**
     * @brief Start a chunked transfer and return its backend-assigned identity
     */
    virtual Result<std::string> initiate_transfer(const std::string& bucket,
                                                  const std::string& key) = 0;

    /**
     * @brief Parts already durably stored under transfer_id, ascending by index
     */
    virtual Result<std::vector<CompletedPart>> list_completed_parts(const std::string& bucket,
                                                                    const std::string& key,
                                                                    const std::string& transfer_id) = 0;

    /**
     * @brief Store one part and return its receipt tag
     */
    virtual Result<std::string> upload_part(const std::string& bucket,
                                            const std::string& key,
                                            const std::string& transfer_id,
                                            std::uint32_t part_index,
                                            const Bytes& data) = 0;

    /**
     * @brief Assemble the object from parts; parts must be ascending by index
     */
    virtual Result<void> complete_transfer(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& transfer_id,
                                           const std::vector<CompletedPart>& parts) = 0;

    virtual Result<void> abort_transfer(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& transfer_id) = 0;
};

} // namespace mpu::storage
