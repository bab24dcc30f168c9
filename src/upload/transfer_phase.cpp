#include "mpu/upload/transfer_phase.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <vector>

namespace mpu::upload {
namespace {

constexpr std::array<TransferPhase, 7> kAllPhases{
    TransferPhase::Initiating, TransferPhase::Transferring, TransferPhase::Paused,
    TransferPhase::Completing, TransferPhase::Done, TransferPhase::Failed,
    TransferPhase::Aborted};

bool is_progressive(TransferPhase current, TransferPhase target) {
    static const std::unordered_map<TransferPhase, std::vector<TransferPhase>> transitions {
        {TransferPhase::Initiating, {TransferPhase::Transferring}},
        {TransferPhase::Transferring, {TransferPhase::Paused, TransferPhase::Completing}},
        {TransferPhase::Paused, {TransferPhase::Initiating}},
        {TransferPhase::Completing, {TransferPhase::Done}},
        {TransferPhase::Failed, {TransferPhase::Initiating}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::Initiating: return "initiating";
        case TransferPhase::Transferring: return "transferring";
        case TransferPhase::Paused: return "paused";
        case TransferPhase::Completing: return "completing";
        case TransferPhase::Done: return "done";
        case TransferPhase::Failed: return "failed";
        case TransferPhase::Aborted: return "aborted";
    }
    return "unknown";
}

std::optional<TransferPhase> phase_from_string(const std::string& name) noexcept {
    for (auto phase : kAllPhases) {
        if (name == to_string(phase)) {
            return phase;
        }
    }
    return std::nullopt;
}

bool can_transition(TransferPhase current, TransferPhase target) noexcept {
    if (current == target) {
        return true;
    }

    if (current == TransferPhase::Done || current == TransferPhase::Aborted) {
        return false;
    }

    if (target == TransferPhase::Failed || target == TransferPhase::Aborted) {
        return true;
    }

    return is_progressive(current, target);
}

Result<void> PhaseTracker::transition_to(TransferPhase next) {
    if (!can_transition(phase_, next)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("Illegal transfer phase transition: ") + to_string(phase_) +
                             " -> " + to_string(next));
    }
    phase_ = next;
    return Ok();
}

} // namespace mpu::upload
