#pragma once

#include "Types.hpp"
#include "GameState.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace blockdrop::core {

class TetrominoFactory {
public:
    enum class Distribution {
        Uniform, // every shape equally likely on every draw
        SevenBag // each run of 7 draws is a shuffled permutation of all shapes
    };

    explicit TetrominoFactory(Distribution distribution = Distribution::Uniform);

    // Same seed, same sequence.
    TetrominoFactory(std::uint32_t seed, Distribution distribution);

    TetrominoType nextShape();

    // Callback view for GameState::update / GameLoop. The factory must outlive it.
    PieceSupply supply();

private:
    std::mt19937 rng_;
    Distribution distribution_;
    std::vector<TetrominoType> bag_;

    void refillBag();
};

} // namespace blockdrop::core
