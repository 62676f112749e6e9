#include "core/Input.hpp"

#include <array>

namespace blockdrop::core {

namespace {
    constexpr std::array<Input, 9> kAllInputs{
        Input::MoveLeft, Input::MoveRight, Input::MoveDown,
        Input::RotateClockwise, Input::RotateCounterClockwise,
        Input::HardDrop, Input::Pause, Input::Quit, Input::Tick
    };
}

std::string toString(Input input) {
    switch (input) {
    case Input::MoveLeft:               return "MoveLeft";
    case Input::MoveRight:              return "MoveRight";
    case Input::MoveDown:               return "MoveDown";
    case Input::RotateClockwise:        return "RotateClockwise";
    case Input::RotateCounterClockwise: return "RotateCounterClockwise";
    case Input::HardDrop:               return "HardDrop";
    case Input::Pause:                  return "Pause";
    case Input::Quit:                   return "Quit";
    case Input::Tick:                   return "Tick";
    }
    return "Unknown";
}

std::optional<Input> inputFromString(const std::string& name) {
    for (Input input : kAllInputs) {
        if (toString(input) == name) {
            return input;
        }
    }
    return std::nullopt;
}

} // namespace blockdrop::core
