#pragma once

#include <optional>

#include "controller/InputAction.hpp"

namespace blockdrop::controller {

inline constexpr int EscapeKeyCode = 27;

// Outcome of one attempt to read a key from the terminal.
struct KeyParseResult {
    enum class Kind {
        Arrow,   // ESC [ A..D, already decoded into `arrow`
        Regular, // single byte in `key`
        Timeout, // nothing available
        Unknown  // unsupported or truncated escape sequence
    };

    Kind kind{Kind::Timeout};
    int key{0};
    std::optional<InputAction> arrow;

    static KeyParseResult timeout() { return KeyParseResult{Kind::Timeout, 0, std::nullopt}; }
    static KeyParseResult unknown() { return KeyParseResult{Kind::Unknown, 0, std::nullopt}; }
    static KeyParseResult regular(int key) { return KeyParseResult{Kind::Regular, key, std::nullopt}; }
    static KeyParseResult arrowKey(InputAction action) { return KeyParseResult{Kind::Arrow, 0, action}; }
};

// h/l move, j soft drop, k rotate CW, z rotate CCW, space hard drop, p pause, q quit
std::optional<InputAction> keyToAction(int key) noexcept;

// Final byte of ESC [ x: A rotate, B soft drop, C right, D left
std::optional<InputAction> arrowToAction(int key) noexcept;

bool isQuitKey(int key) noexcept;

std::optional<InputAction> toAction(const KeyParseResult& result) noexcept;

} // namespace blockdrop::controller
