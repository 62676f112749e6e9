#include "core/TetrominoFactory.hpp"
#include <algorithm>
#include <random>

namespace blockdrop::core {

TetrominoFactory::TetrominoFactory(Distribution distribution)
    : rng_{std::random_device{}()}
    , distribution_{distribution}
{
}

TetrominoFactory::TetrominoFactory(std::uint32_t seed, Distribution distribution)
    : rng_{seed}
    , distribution_{distribution}
{
}

TetrominoType TetrominoFactory::nextShape() {
    if (distribution_ == Distribution::Uniform) {
        std::uniform_int_distribution<int> dist(0, static_cast<int>(AllTetrominoTypes.size()) - 1);
        return AllTetrominoTypes[static_cast<std::size_t>(dist(rng_))];
    }

    if (bag_.empty()) {
        refillBag();
    }
    const TetrominoType shape = bag_.back();
    bag_.pop_back();
    return shape;
}

PieceSupply TetrominoFactory::supply() {
    return [this]() { return nextShape(); };
}

void TetrominoFactory::refillBag() {
    bag_.assign(AllTetrominoTypes.begin(), AllTetrominoTypes.end());
    std::shuffle(bag_.begin(), bag_.end(), rng_);
}

} // namespace blockdrop::core
