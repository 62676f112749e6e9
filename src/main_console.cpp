#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Tetromino.hpp"
#include "core/TetrominoFactory.hpp"
#include "core/Types.hpp"
#include "replay/ReplayFileStore.hpp"
#include "runtime/GameLoop.hpp"
#include "runtime/ReplayRunner.hpp"
#include "runtime/TerminalKeySource.hpp"

using namespace blockdrop::core;
using blockdrop::replay::ReplayData;
using blockdrop::replay::ReplayFileStore;

namespace {

struct Options {
    std::string mode{"play"};
    std::string name;
    GameConfig config;
    std::optional<std::uint32_t> seed;
    bool bag{false};
    std::optional<std::string> directory;
};

char glyphFor(TetrominoType type)
{
    return toString(type).front();
}

const char* statusName(GameStatus status)
{
    switch (status) {
    case GameStatus::Playing:  return "Playing";
    case GameStatus::Paused:   return "Paused";
    case GameStatus::GameOver: return "GameOver";
    }
    return "?";
}

// Render the current board + active tetromino as ASCII, from the top-left corner
void printGame(const GameState& game, const std::string& footer)
{
    const Board& board = game.board();
    const int rows = board.height();
    const int cols = board.width();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const auto cell = board.get({x, y});
            if (cell && cell->isFilled()) {
                lines[y][x] = '#'; // locked blocks
            }
        }
    }

    // Overlay active tetromino with its letter
    if (!game.isGameOver()) {
        for (const auto& b : game.activeTetromino().blocks()) {
            if (board.isInBounds(b)) {
                lines[b.y][b.x] = glyphFor(game.activeTetromino().type());
            }
        }
    }

    std::cout << "\x1b[H\x1b[2J";
    std::cout << "==== BLOCKDROP ====\r\n";
    std::cout << "Score: " << game.score()
              << " | Level: " << game.level()
              << " | Lines: " << game.linesCleared()
              << " | Next: " << toString(game.nextTetromino())
              << " | " << statusName(game.status()) << "\r\n";

    std::cout << '+' << std::string(cols, '-') << "+\r\n";
    for (int y = 0; y < rows; ++y) {
        std::cout << '|' << lines[y] << "|\r\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\r\n";
    std::cout << footer << "\r\n";
    std::cout.flush();
}

void printUsage(const char* prog)
{
    std::cerr << "Usage:\n"
              << "  " << prog << " [play] [options]\n"
              << "  " << prog << " record <name> [options]\n"
              << "  " << prog << " replay <name> [--dir <path>]\n"
              << "  " << prog << " list [--dir <path>]\n"
              << "  " << prog << " delete <name> [--dir <path>]\n"
              << "Options:\n"
              << "  --width <n>   board width (default 10)\n"
              << "  --height <n>  board height (default 20)\n"
              << "  --level <n>   start level (default 1)\n"
              << "  --seed <n>    seed for the piece generator\n"
              << "  --bag         draw pieces from a shuffled 7-bag\n"
              << "  --dir <path>  replay directory\n";
}

int parseInt(const std::string& flag, const std::string& value)
{
    std::size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    return result;
}

Options parseArgs(int argc, char* argv[])
{
    Options opts;
    int i = 1;

    if (i < argc && argv[i][0] != '-') {
        opts.mode = argv[i++];
        if (opts.mode == "record" || opts.mode == "replay" || opts.mode == "delete") {
            if (i >= argc) {
                throw std::invalid_argument("Missing replay name for " + opts.mode);
            }
            opts.name = argv[i++];
        } else if (opts.mode != "play" && opts.mode != "list") {
            throw std::invalid_argument("Unknown mode: " + opts.mode);
        }
    }

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--bag") {
            opts.bag = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--width") {
            opts.config.board.width = parseInt(arg, value);
        } else if (arg == "--height") {
            opts.config.board.height = parseInt(arg, value);
        } else if (arg == "--level") {
            opts.config.level.startLevel = parseInt(arg, value);
        } else if (arg == "--seed") {
            opts.seed = static_cast<std::uint32_t>(parseInt(arg, value));
        } else if (arg == "--dir") {
            opts.directory = value;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    opts.config.validate();
    return opts;
}

int playSession(const Options& opts, const ReplayFileStore& store, bool record)
{
    const auto distribution = opts.bag ? TetrominoFactory::Distribution::SevenBag
                                       : TetrominoFactory::Distribution::Uniform;
    TetrominoFactory factory = opts.seed ? TetrominoFactory(*opts.seed, distribution)
                                         : TetrominoFactory(distribution);

    const TetrominoType first = factory.nextShape();
    const TetrominoType second = factory.nextShape();
    const GameState initial = GameState::initial(first, second,
                                                 opts.config.board.width,
                                                 opts.config.board.height,
                                                 opts.config.level.startLevel);

    std::cout << "[GAME] Starting " << opts.config.board.width << "x"
              << opts.config.board.height << " game at level "
              << opts.config.level.startLevel
              << (record ? " (recording)" : "") << std::endl;

    blockdrop::runtime::GameLoop loop(opts.config, factory.supply());
    loop.setRenderHook([](const GameState& state) {
        printGame(state, "h/l move, j soft drop, k/z rotate, space hard drop, p pause, q quit");
    });

    blockdrop::runtime::LoopResult result = [&] {
        blockdrop::runtime::TerminalKeySource keys;
        return loop.run(initial, keys, record);
    }();

    const GameState& end = result.finalState;
    std::cout << "[GAME] " << (end.isGameOver() ? "Game over" : "Quit")
              << ". Score: " << end.score()
              << " | Lines: " << end.linesCleared()
              << " | Level: " << end.level() << std::endl;

    if (record && result.replay) {
        store.save(opts.name, *result.replay);
        std::cout << "[REPLAY] Saved " << result.replay->eventCount()
                  << " events to " << (store.directory() / (opts.name + ReplayFileStore::FileExtension)).string()
                  << std::endl;
    }
    return 0;
}

void requireReplay(const ReplayFileStore& store, const std::string& name)
{
    if (!store.exists(name)) {
        throw std::runtime_error("Replay not found: " + name + " (in "
                                 + store.directory().string() + ")");
    }
}

int replaySession(const Options& opts, const ReplayFileStore& store)
{
    requireReplay(store, opts.name);
    const ReplayData data = store.load(opts.name);
    std::cout << "[REPLAY] Loaded " << opts.name << ": " << data.eventCount()
              << " events, level " << data.metadata.startLevel
              << ", final score " << data.metadata.finalScore << std::endl;

    GameConfig config = opts.config;
    config.board.width = data.metadata.boardWidth;
    config.board.height = data.metadata.boardHeight;

    GameState last = GameState::initial(data.metadata.firstShape, data.metadata.secondShape,
                                        config.board.width, config.board.height,
                                        data.metadata.startLevel);
    {
        blockdrop::runtime::TerminalKeySource keys;
        blockdrop::runtime::ReplayRunner runner(config, keys);
        runner.setRenderHook([](const GameState& state,
                                const blockdrop::runtime::PlaybackStatus& status) {
            std::ostringstream footer;
            footer << "Replay " << std::fixed << std::setprecision(2) << status.speed
                   << "x | " << static_cast<int>(status.progress * 100.0) << "%"
                   << " | +/- speed, q quit";
            printGame(state, footer.str());
        });
        last = runner.run(data);
    }

    std::cout << "[REPLAY] Finished. Score: " << last.score()
              << " (recorded " << data.metadata.finalScore << ")" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        const Options opts = parseArgs(argc, argv);
        const ReplayFileStore store(opts.directory ? std::filesystem::path(*opts.directory)
                                                   : ReplayFileStore::defaultDirectory());

        if (opts.mode == "play") {
            return playSession(opts, store, false);
        }
        if (opts.mode == "record") {
            return playSession(opts, store, true);
        }
        if (opts.mode == "replay") {
            return replaySession(opts, store);
        }
        if (opts.mode == "delete") {
            requireReplay(store, opts.name);
            store.remove(opts.name);
            std::cout << "[REPLAY] Deleted " << opts.name << std::endl;
            return 0;
        }

        // list
        const auto names = store.list();
        if (names.empty()) {
            std::cout << "[REPLAY] No replays in " << store.directory().string() << std::endl;
        }
        for (const auto& name : names) {
            std::cout << name << '\n';
        }
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
