#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mpu::storage {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief A part acknowledged by the backend: its 1-based index and receipt tag
 */
struct CompletedPart {
    std::uint32_t index = 0;
    std::string tag;

    bool operator==(const CompletedPart& other) const {
        return index == other.index && tag == other.tag;
    }
};

} // namespace mpu::storage
