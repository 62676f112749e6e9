#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "core/Input.hpp"
#include "core/Types.hpp"

namespace blockdrop::replay {

using Frame = std::uint64_t;

inline constexpr const char* CurrentReplayVersion = "1.0";

// ---------- Events ----------

struct PlayerInput {
    core::Input input;
    Frame frame{};
};

struct PieceSpawn {
    core::TetrominoType shape;
    Frame frame{};
};

using ReplayEvent = std::variant<PlayerInput, PieceSpawn>;

Frame frameOf(const ReplayEvent& event) noexcept;

// ---------- Session ----------

struct ReplayMetadata {
    std::string version{CurrentReplayVersion};
    std::int64_t startTimestamp{};  // ms since epoch
    int boardWidth{};
    int boardHeight{};
    int startLevel{1};
    core::TetrominoType firstShape{core::TetrominoType::I};
    core::TetrominoType secondShape{core::TetrominoType::I};
    std::uint64_t finalScore{};
    int finalLevel{};
    int finalLines{};
    std::int64_t durationMs{};
};

struct ReplayData {
    ReplayMetadata metadata;
    std::vector<ReplayEvent> events; // ordered by frame

    std::size_t eventCount() const noexcept { return events.size(); }
};

bool operator==(const PlayerInput& a, const PlayerInput& b) noexcept;
bool operator==(const PieceSpawn& a, const PieceSpawn& b) noexcept;
bool operator==(const ReplayMetadata& a, const ReplayMetadata& b) noexcept;
bool operator==(const ReplayData& a, const ReplayData& b) noexcept;

// Wall-clock milliseconds since the Unix epoch.
std::int64_t currentTimeMillis();

} // namespace blockdrop::replay
