#include "controller/KeyMapping.hpp"

namespace blockdrop::controller {

std::optional<InputAction> keyToAction(int key) noexcept {
    switch (key) {
    case 'h': case 'H': return InputAction::MoveLeft;
    case 'l': case 'L': return InputAction::MoveRight;
    case 'j': case 'J': return InputAction::SoftDrop;
    case 'k': case 'K': return InputAction::RotateCW;
    case 'z': case 'Z': return InputAction::RotateCCW;
    case ' ':           return InputAction::HardDrop;
    case 'p': case 'P': return InputAction::TogglePause;
    case 'q': case 'Q': return InputAction::Quit;
    default:            return std::nullopt;
    }
}

std::optional<InputAction> arrowToAction(int key) noexcept {
    switch (key) {
    case 'A': return InputAction::RotateCW;
    case 'B': return InputAction::SoftDrop;
    case 'C': return InputAction::MoveRight;
    case 'D': return InputAction::MoveLeft;
    default:  return std::nullopt;
    }
}

bool isQuitKey(int key) noexcept {
    return key == 'q' || key == 'Q';
}

std::optional<InputAction> toAction(const KeyParseResult& result) noexcept {
    switch (result.kind) {
    case KeyParseResult::Kind::Arrow:   return result.arrow;
    case KeyParseResult::Kind::Regular: return keyToAction(result.key);
    case KeyParseResult::Kind::Timeout:
    case KeyParseResult::Kind::Unknown: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace blockdrop::controller
