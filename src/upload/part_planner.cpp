#include "mpu/upload/part_planner.hpp"

#include <algorithm>

namespace mpu::upload {

std::uint32_t total_parts(std::uint64_t total_bytes, std::uint64_t part_size) noexcept {
    if (part_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((total_bytes + part_size - 1) / part_size);
}

PartPlanner::PartPlanner(std::uint64_t total_bytes, std::uint64_t part_size) noexcept
    : total_bytes_(total_bytes),
      part_size_(part_size),
      total_parts_(upload::total_parts(total_bytes, part_size)) {}

PartDescriptor PartPlanner::describe(std::uint32_t index) const noexcept {
    PartDescriptor part;
    part.index = index;
    part.offset = static_cast<std::uint64_t>(index - 1) * part_size_;
    part.length = std::min(part_size_, total_bytes_ - part.offset);
    return part;
}

std::vector<PartDescriptor> PartPlanner::plan() const {
    std::vector<PartDescriptor> parts;
    parts.reserve(total_parts_);
    for (std::uint32_t index = 1; index <= total_parts_; ++index) {
        parts.push_back(describe(index));
    }
    return parts;
}

} // namespace mpu::upload
