#include <catch2/catch.hpp>

#include "controller/KeyMapping.hpp"

using namespace blockdrop::controller;

TEST_CASE("Regular keys map to commands", "[keys]") {
    CHECK(keyToAction('h') == InputAction::MoveLeft);
    CHECK(keyToAction('l') == InputAction::MoveRight);
    CHECK(keyToAction('j') == InputAction::SoftDrop);
    CHECK(keyToAction('k') == InputAction::RotateCW);
    CHECK(keyToAction('z') == InputAction::RotateCCW);
    CHECK(keyToAction(' ') == InputAction::HardDrop);
    CHECK(keyToAction('p') == InputAction::TogglePause);
    CHECK(keyToAction('q') == InputAction::Quit);
    CHECK(keyToAction('Q') == InputAction::Quit);
    CHECK(keyToAction('H') == InputAction::MoveLeft);

    CHECK_FALSE(keyToAction('x').has_value());
    CHECK_FALSE(keyToAction('\n').has_value());
}

TEST_CASE("Arrow sequences map to commands", "[keys]") {
    CHECK(arrowToAction('A') == InputAction::RotateCW);
    CHECK(arrowToAction('B') == InputAction::SoftDrop);
    CHECK(arrowToAction('C') == InputAction::MoveRight);
    CHECK(arrowToAction('D') == InputAction::MoveLeft);
    CHECK_FALSE(arrowToAction('E').has_value());
}

TEST_CASE("Parse results resolve to at most one command", "[keys]") {
    CHECK(toAction(KeyParseResult::regular('l')) == InputAction::MoveRight);
    CHECK(toAction(KeyParseResult::arrowKey(InputAction::MoveLeft)) == InputAction::MoveLeft);
    CHECK_FALSE(toAction(KeyParseResult::timeout()).has_value());
    CHECK_FALSE(toAction(KeyParseResult::unknown()).has_value());

    CHECK(isQuitKey('q'));
    CHECK(isQuitKey('Q'));
    CHECK_FALSE(isQuitKey('w'));
}
