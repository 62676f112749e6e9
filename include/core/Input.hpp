#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blockdrop::core {

// Inputs understood by the game state machine.
enum class Input : std::uint8_t {
    MoveLeft,
    MoveRight,
    MoveDown,
    RotateClockwise,
    RotateCounterClockwise,
    HardDrop,
    Pause,
    Quit,
    Tick
};

// Stable names used in recorded replays ("MoveLeft", "Tick", ...).
std::string toString(Input input);
std::optional<Input> inputFromString(const std::string& name);

} // namespace blockdrop::core
