#include "MazeGenerator.h"
#include <stack>
#include <vector>

namespace {

uint32_t resolveSeed(uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    uint32_t drawn = rd();
    return drawn != 0 ? drawn : 1u;
}

}

MazeGenerator::MazeGenerator(uint32_t seed)
    : seed_(resolveSeed(seed)), gen_(seed_) {
}

void MazeGenerator::reseed(uint32_t seed) {
    seed_ = resolveSeed(seed);
    gen_.seed(seed_);
}

MazeGrid MazeGenerator::generate(int width, int height) {
    // the grid constructor rejects bad sizes before anything is carved
    MazeGrid maze(width, height);

    // passages live on even coordinates, the cell between two of them is the wall we knock out
    const int dx[] = {-2, 2, 0, 0};
    const int dy[] = {0, 0, -2, 2};

    std::stack<GridCell> stack;
    stack.push({0, 0});
    maze.setCell(0, 0, CellState::Open);

    std::vector<GridCell> candidates;
    candidates.reserve(4);

    while (!stack.empty()) {
        GridCell current = stack.top();

        candidates.clear();
        for (int i = 0; i < 4; i++) {
            int nx = current.x + dx[i];
            int ny = current.y + dy[i];
            if (maze.inBounds(nx, ny) && maze.isWall(nx, ny)) {
                candidates.push_back({nx, ny});
            }
        }

        if (candidates.empty()) {
            stack.pop();  // dead end, backtrack
            continue;
        }

        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        GridCell next = candidates[pick(gen_)];

        maze.setCell(next, CellState::Open);
        maze.setCell(current.x + (next.x - current.x) / 2,
                     current.y + (next.y - current.y) / 2,
                     CellState::Open);
        stack.push(next);
    }

    maze.setStart({0, 0});
    maze.setEnd({width - 1, height - 1});
    return maze;
}
