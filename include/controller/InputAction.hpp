#pragma once

#include <optional>

#include "core/Input.hpp"

namespace blockdrop::controller {

// Commands delivered to the game loop by the keyboard and timer producers.
// These are UI- and platform-agnostic.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDrop,
    HardDrop,
    RotateCW,
    RotateCCW,
    TogglePause,
    Tick,
    Quit
};

// State-machine input for a command; std::nullopt for Quit, which only the loop handles.
std::optional<core::Input> toInput(InputAction action) noexcept;

} // namespace blockdrop::controller
