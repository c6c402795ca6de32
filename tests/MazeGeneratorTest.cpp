#include <gtest/gtest.h>

#include <queue>
#include <stdexcept>
#include <vector>

#include "MazeGenerator.h"

namespace {

// open cells reachable from (0,0) by open unit steps
int reachableFromOrigin(const MazeGrid& maze) {
    std::vector<bool> seen(maze.getWidth() * maze.getHeight(), false);
    std::queue<GridCell> queue;
    queue.push({0, 0});
    seen[0] = true;
    int count = 0;

    while (!queue.empty()) {
        GridCell cell = queue.front();
        queue.pop();
        count++;
        for (const GridCell& next : maze.getNeighbors(cell)) {
            int index = next.y * maze.getWidth() + next.x;
            if (!seen[index]) {
                seen[index] = true;
                queue.push(next);
            }
        }
    }
    return count;
}

// each adjacent open pair counted once
int openAdjacencies(const MazeGrid& maze) {
    int edges = 0;
    for (int y = 0; y < maze.getHeight(); y++) {
        for (int x = 0; x < maze.getWidth(); x++) {
            if (!maze.isOpen(x, y)) continue;
            if (maze.isOpen(x + 1, y)) edges++;
            if (maze.isOpen(x, y + 1)) edges++;
        }
    }
    return edges;
}

bool sameLayout(const MazeGrid& a, const MazeGrid& b) {
    if (a.getWidth() != b.getWidth() || a.getHeight() != b.getHeight()) return false;
    for (int y = 0; y < a.getHeight(); y++) {
        for (int x = 0; x < a.getWidth(); x++) {
            if (a.getCell(x, y) != b.getCell(x, y)) return false;
        }
    }
    return true;
}

}

TEST(MazeGeneratorTest, EveryOpenCellIsReachableFromOrigin) {
    const int sizes[][2] = {{45, 45}, {21, 11}, {10, 7}, {2, 2}, {3, 1}};
    for (uint32_t seed = 1; seed <= 5; ++seed) {
        MazeGenerator generator(seed);
        for (const auto& size : sizes) {
            MazeGrid maze = generator.generate(size[0], size[1]);
            EXPECT_TRUE(maze.isOpen(0, 0));
            EXPECT_EQ(reachableFromOrigin(maze), maze.openCellCount())
                << "seed " << seed << " size " << size[0] << "x" << size[1];
        }
    }
}

TEST(MazeGeneratorTest, CarvedPassagesFormATree) {
    MazeGenerator generator(7);
    MazeGrid maze = generator.generate(31, 25);
    // connected and acyclic: edges == vertices - 1
    EXPECT_EQ(openAdjacencies(maze), maze.openCellCount() - 1);
}

TEST(MazeGeneratorTest, OddSizesOpenEveryEvenCell) {
    MazeGenerator generator(3);
    MazeGrid maze = generator.generate(45, 45);
    for (int y = 0; y < 45; y += 2) {
        for (int x = 0; x < 45; x += 2) {
            EXPECT_TRUE(maze.isOpen(x, y)) << x << "," << y;
        }
    }
    EXPECT_EQ(maze.getStart(), (GridCell{0, 0}));
    EXPECT_EQ(maze.getEnd(), (GridCell{44, 44}));
    EXPECT_TRUE(maze.isOpen(maze.getEnd()));
}

TEST(MazeGeneratorTest, SingleCellMazeIsOneOpenCell) {
    MazeGenerator generator(11);
    MazeGrid maze = generator.generate(1, 1);
    EXPECT_EQ(maze.openCellCount(), 1);
    EXPECT_EQ(maze.getStart(), maze.getEnd());
}

TEST(MazeGeneratorTest, RejectsNonPositiveSizes) {
    MazeGenerator generator(1);
    EXPECT_THROW(generator.generate(0, 10), std::invalid_argument);
    EXPECT_THROW(generator.generate(10, -1), std::invalid_argument);
}

TEST(MazeGeneratorTest, SameSeedSameMaze) {
    MazeGenerator first(1234);
    MazeGenerator second(1234);
    EXPECT_TRUE(sameLayout(first.generate(25, 25), second.generate(25, 25)));
}

TEST(MazeGeneratorTest, ReseedRestartsTheSequence) {
    MazeGenerator generator(99);
    MazeGrid firstMaze = generator.generate(25, 25);
    generator.generate(25, 25);

    generator.reseed(99);
    EXPECT_EQ(generator.getSeed(), 99u);
    EXPECT_TRUE(sameLayout(firstMaze, generator.generate(25, 25)));
}

TEST(MazeGeneratorTest, ZeroSeedDrawsARealSeed) {
    MazeGenerator generator(0);
    EXPECT_NE(generator.getSeed(), 0u);
}
