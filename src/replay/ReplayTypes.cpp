#include "replay/ReplayTypes.hpp"

#include <chrono>

namespace blockdrop::replay {

Frame frameOf(const ReplayEvent& event) noexcept {
    if (const auto* in = std::get_if<PlayerInput>(&event)) {
        return in->frame;
    }
    return std::get_if<PieceSpawn>(&event)->frame;
}

bool operator==(const PlayerInput& a, const PlayerInput& b) noexcept {
    return a.input == b.input && a.frame == b.frame;
}

bool operator==(const PieceSpawn& a, const PieceSpawn& b) noexcept {
    return a.shape == b.shape && a.frame == b.frame;
}

bool operator==(const ReplayMetadata& a, const ReplayMetadata& b) noexcept {
    return a.version == b.version
        && a.startTimestamp == b.startTimestamp
        && a.boardWidth == b.boardWidth
        && a.boardHeight == b.boardHeight
        && a.startLevel == b.startLevel
        && a.firstShape == b.firstShape
        && a.secondShape == b.secondShape
        && a.finalScore == b.finalScore
        && a.finalLevel == b.finalLevel
        && a.finalLines == b.finalLines
        && a.durationMs == b.durationMs;
}

bool operator==(const ReplayData& a, const ReplayData& b) noexcept {
    return a.metadata == b.metadata && a.events == b.events;
}

std::int64_t currentTimeMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace blockdrop::replay
