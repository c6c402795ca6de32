#pragma once
#include <cstdint>
#include <random>
#include "MazeGrid.h"

// perfect maze generation via iterative recursive backtracking
// https://en.wikipedia.org/wiki/Maze_generation_algorithm#Recursive_backtracker
class MazeGenerator {
public:
    // seed 0 draws a fresh seed from std::random_device
    explicit MazeGenerator(uint32_t seed = 0);

    // carves a maze from (0,0); start is (0,0) and end is (width-1, height-1).
    // throws std::invalid_argument for non-positive sizes
    MazeGrid generate(int width, int height);

    void reseed(uint32_t seed);
    uint32_t getSeed() const { return seed_; }

private:
    uint32_t seed_;
    std::mt19937 gen_;
};
