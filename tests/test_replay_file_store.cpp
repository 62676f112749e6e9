#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "replay/ReplayFileStore.hpp"

using namespace blockdrop::replay;
using blockdrop::core::Input;
using blockdrop::core::TetrominoType;

namespace fs = std::filesystem;

namespace {

// Unique directory under the system temp dir, removed on scope exit
struct TempDir {
    fs::path path;

    TempDir()
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("blockdrop_store_" + std::to_string(stamp));
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

ReplayData smallReplay(std::uint64_t score)
{
    ReplayData data;
    data.metadata.startTimestamp = 10;
    data.metadata.boardWidth = 10;
    data.metadata.boardHeight = 20;
    data.metadata.firstShape = TetrominoType::I;
    data.metadata.secondShape = TetrominoType::T;
    data.metadata.finalScore = score;
    data.metadata.finalLevel = 1;
    data.events = {PlayerInput{Input::HardDrop, 0}, PieceSpawn{TetrominoType::S, 1}};
    return data;
}

} // namespace

TEST_CASE("File store saves and loads replays by name", "[replay][store]") {
    TempDir dir;
    const ReplayFileStore store{dir.path / "nested"};

    REQUIRE(store.list().empty());
    REQUIRE_FALSE(store.exists("first"));

    store.save("first", smallReplay(100));
    REQUIRE(fs::exists(dir.path / "nested" / "first.replay"));
    REQUIRE(store.exists("first"));
    REQUIRE(store.load("first") == smallReplay(100));

    // Saving again overwrites
    store.save("first", smallReplay(250));
    REQUIRE(store.load("first").metadata.finalScore == 250);
}

TEST_CASE("File store lists replay names sorted", "[replay][store]") {
    TempDir dir;
    const ReplayFileStore store{dir.path};

    store.save("zeta", smallReplay(1));
    store.save("alpha", smallReplay(2));
    store.save("mid", smallReplay(3));
    std::ofstream(dir.path / "notes.txt") << "ignored";

    const auto names = store.list();
    REQUIRE(names == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("File store removes replays", "[replay][store]") {
    TempDir dir;
    const ReplayFileStore store{dir.path};

    store.save("gone", smallReplay(5));
    store.remove("gone");
    REQUIRE_FALSE(store.exists("gone"));
    REQUIRE(store.list().empty());
}

TEST_CASE("File store reports missing and corrupt replays", "[replay][store]") {
    TempDir dir;
    const ReplayFileStore store{dir.path};

    REQUIRE_THROWS_AS(store.load("missing"), std::runtime_error);

    fs::create_directories(dir.path);
    std::ofstream(dir.path / "broken.replay") << "METADATA;version=1.0\n";
    REQUIRE_THROWS_AS(store.load("broken"), std::runtime_error);
}

TEST_CASE("File store rejects names that escape the directory", "[replay][store]") {
    TempDir dir;
    const ReplayFileStore store{dir.path};

    REQUIRE_THROWS_AS(store.save("../outside", smallReplay(1)), std::invalid_argument);
    REQUIRE_THROWS_AS(store.load(""), std::invalid_argument);
}
