#pragma once

#include "mpu/core/result.hpp"

#include <optional>
#include <string>

namespace mpu::upload {

enum class TransferPhase {
    Initiating,
    Transferring,
    Paused,
    Completing,
    Done,
    Failed,
    Aborted
};

const char* to_string(TransferPhase phase) noexcept;

std::optional<TransferPhase> phase_from_string(const std::string& name) noexcept;

/**
 * @brief Whether a chunked transfer may move from `current` to `target`
 *
 * Failed and Aborted are reachable from every non-terminal phase. Paused and
 * Failed re-enter Initiating on resume. Done and Aborted are final.
 */
bool can_transition(TransferPhase current, TransferPhase target) noexcept;

/**
 * @brief Tracks the phase of one chunked transfer and rejects illegal moves
 */
class PhaseTracker {
public:
    explicit PhaseTracker(TransferPhase initial = TransferPhase::Initiating) noexcept
        : phase_(initial) {}

    [[nodiscard]] TransferPhase phase() const noexcept { return phase_; }

    Result<void> transition_to(TransferPhase next);

private:
    TransferPhase phase_;
};

} // namespace mpu::upload
