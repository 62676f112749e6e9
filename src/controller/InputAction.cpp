#include "controller/InputAction.hpp"

namespace blockdrop::controller {

std::optional<core::Input> toInput(InputAction action) noexcept {
    using core::Input;

    switch (action) {
    case InputAction::MoveLeft:    return Input::MoveLeft;
    case InputAction::MoveRight:   return Input::MoveRight;
    case InputAction::SoftDrop:    return Input::MoveDown;
    case InputAction::HardDrop:    return Input::HardDrop;
    case InputAction::RotateCW:    return Input::RotateClockwise;
    case InputAction::RotateCCW:   return Input::RotateCounterClockwise;
    case InputAction::TogglePause: return Input::Pause;
    case InputAction::Tick:        return Input::Tick;
    case InputAction::Quit:        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace blockdrop::controller
