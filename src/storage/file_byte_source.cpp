#include "mpu/storage/byte_source.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace mpu::storage {
namespace fs = std::filesystem;

Result<std::uint64_t> FileByteSource::size(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::uint64_t>(ErrorCode::SourceError, "Not a regular file: " + path.string());
    }

    const auto bytes = fs::file_size(path, ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::SourceError,
                                  "Failed to stat " + path.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(bytes));
}

Result<std::unique_ptr<ByteReader>> FileByteSource::open(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<ByteReader>>(ErrorCode::SourceError,
                                                "Failed to open source file: " + path.string());
    }
    spdlog::debug("Opened source {}", path.string());
    return Ok<std::unique_ptr<ByteReader>>(std::make_unique<FileByteReader>(path, std::move(input)));
}

FileByteReader::FileByteReader(fs::path path, std::ifstream stream)
    : path_(std::move(path)), stream_(std::move(stream)) {}

Result<Bytes> FileByteReader::read_range(std::uint64_t offset, std::uint64_t length) {
    Bytes buffer(static_cast<std::size_t>(length));

    std::lock_guard lock(mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        return Err<Bytes>(ErrorCode::SourceError,
                          "Failed to seek to offset " + std::to_string(offset) + " in " + path_.string());
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    const auto bytes_read = static_cast<std::uint64_t>(stream_.gcount());
    if (bytes_read != length) {
        return Err<Bytes>(ErrorCode::SourceError,
                          "Short read from " + path_.string() + ": expected " + std::to_string(length) +
                              " bytes at offset " + std::to_string(offset) + ", got " +
                              std::to_string(bytes_read));
    }
    return Ok(std::move(buffer));
}

} // namespace mpu::storage
