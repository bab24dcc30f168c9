#pragma once

#include <cstdint>
#include <vector>

namespace mpu::upload {

/**
 * @brief Byte range of one part of a chunked transfer
 */
struct PartDescriptor {
    std::uint32_t index = 0; ///< 1-based
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

/**
 * @brief ceil(total_bytes / part_size); 0 for an empty file
 */
std::uint32_t total_parts(std::uint64_t total_bytes, std::uint64_t part_size) noexcept;

/**
 * @brief Splits a file of known size into fixed-size parts
 */
class PartPlanner {
public:
    PartPlanner(std::uint64_t total_bytes, std::uint64_t part_size) noexcept;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] std::uint64_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] std::uint32_t total_parts() const noexcept { return total_parts_; }

    /**
     * @brief Descriptor for `index`; requires 1 <= index <= total_parts()
     */
    [[nodiscard]] PartDescriptor describe(std::uint32_t index) const noexcept;

    [[nodiscard]] std::uint64_t length_of(std::uint32_t index) const noexcept {
        return describe(index).length;
    }

    [[nodiscard]] std::vector<PartDescriptor> plan() const;

private:
    std::uint64_t total_bytes_;
    std::uint64_t part_size_;
    std::uint32_t total_parts_;
};

} // namespace mpu::upload
