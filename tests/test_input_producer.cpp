#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "FakeKeySource.hpp"
#include "core/GameConfig.hpp"
#include "runtime/CommandQueue.hpp"
#include "runtime/InputProducer.hpp"
#include "runtime/TickProducer.hpp"

using blockdrop::controller::InputAction;
using blockdrop::controller::KeyParseResult;
using blockdrop::core::TerminalConfig;
using blockdrop::runtime::CommandQueue;
using blockdrop::runtime::InputProducer;
using blockdrop::runtime::TickProducer;

TEST_CASE("InputProducer decodes single keys", "[runtime][input]") {
    CommandQueue queue;
    FakeKeySource keys;
    InputProducer producer(queue, keys, TerminalConfig{});

    REQUIRE(producer.readKey().kind == KeyParseResult::Kind::Timeout);

    keys.type("k");
    const auto result = producer.readKey();
    REQUIRE(result.kind == KeyParseResult::Kind::Regular);
    REQUIRE(result.key == 'k');
}

TEST_CASE("InputProducer decodes arrow escape sequences", "[runtime][input]") {
    CommandQueue queue;
    FakeKeySource keys;
    InputProducer producer(queue, keys, TerminalConfig{});

    keys.type("\x1b[D");
    auto result = producer.readKey();
    REQUIRE(result.kind == KeyParseResult::Kind::Arrow);
    REQUIRE(result.arrow == InputAction::MoveLeft);

    keys.type("\x1b[A");
    result = producer.readKey();
    REQUIRE(result.arrow == InputAction::RotateCW);
}

TEST_CASE("InputProducer gives up on broken escape sequences", "[runtime][input]") {
    CommandQueue queue;
    FakeKeySource keys;
    InputProducer producer(queue, keys, TerminalConfig{});

    SECTION("lone escape") {
        keys.type("\x1b");
        REQUIRE(producer.readKey().kind == KeyParseResult::Kind::Unknown);
    }
    SECTION("escape followed by something else") {
        keys.type("\x1bx");
        REQUIRE(producer.readKey().kind == KeyParseResult::Kind::Unknown);
    }
    SECTION("unsupported final byte") {
        keys.type("\x1b[Z");
        REQUIRE(producer.readKey().kind == KeyParseResult::Kind::Unknown);
        REQUIRE(keys.available() == 0);
    }
}

TEST_CASE("InputProducer thread pushes mapped commands in order", "[runtime][input]") {
    CommandQueue queue;
    FakeKeySource keys;
    keys.type("hxl\x1b[B q");

    InputProducer producer(queue, keys, TerminalConfig{});
    producer.start();

    REQUIRE(queue.pop() == InputAction::MoveLeft);
    REQUIRE(queue.pop() == InputAction::MoveRight); // 'x' is unmapped
    REQUIRE(queue.pop() == InputAction::SoftDrop);
    REQUIRE(queue.pop() == InputAction::HardDrop);
    REQUIRE(queue.pop() == InputAction::Quit);

    queue.close();
    producer.stop();
    REQUIRE(keys.readCount == 8);
}

TEST_CASE("TickProducer pushes ticks at the shared interval", "[runtime][tick]") {
    CommandQueue queue;
    std::atomic<int> intervalMs{5};

    TickProducer ticker(queue, intervalMs);
    ticker.start();

    for (int i = 0; i < 3; ++i) {
        REQUIRE(queue.pop() == InputAction::Tick);
    }

    // A long interval keeps the producer asleep until stop() interrupts it
    intervalMs = 60000;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const auto start = std::chrono::steady_clock::now();
    ticker.stop();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}
