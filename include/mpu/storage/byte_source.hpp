#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace mpu::storage {

/**
 * @brief An open, random-access handle on a source file
 *
 * The handle is released when the reader is destroyed. read_range may be called
 * from several worker threads at once.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    /**
     * @brief Read exactly `length` bytes starting at `offset`
     *
     * A short read is reported as ErrorCode::SourceError.
     */
    virtual Result<Bytes> read_range(std::uint64_t offset, std::uint64_t length) = 0;
};

/**
 * @brief File-system capability consumed by the orchestrator
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual Result<std::uint64_t> size(const std::filesystem::path& path) const = 0;

    virtual Result<std::unique_ptr<ByteReader>> open(const std::filesystem::path& path) const = 0;
};

/**
 * @brief ByteSource over the local file system
 */
class FileByteSource : public ByteSource {
public:
    Result<std::uint64_t> size(const std::filesystem::path& path) const override;

    Result<std::unique_ptr<ByteReader>> open(const std::filesystem::path& path) const override;
};

/**
 * @brief ByteReader backed by a std::ifstream; seek+read is serialized
 */
class FileByteReader : public ByteReader {
public:
    FileByteReader(std::filesystem::path path, std::ifstream stream);

    Result<Bytes> read_range(std::uint64_t offset, std::uint64_t length) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ifstream stream_;
};

} // namespace mpu::storage
