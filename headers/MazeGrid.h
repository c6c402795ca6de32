#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// column x, row y; (0,0) is the top left corner
struct GridCell {
    int x = 0;
    int y = 0;

    bool operator==(const GridCell& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridCell& other) const { return !(*this == other); }

    // column first, then row. equal heap priorities pop in this order
    bool operator<(const GridCell& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }
};

struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        const uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(cell.x)) << 32) |
                                static_cast<uint32_t>(cell.y);
        return std::hash<uint64_t>()(packed);
    }
};

enum class CellState : uint8_t {
    Open,
    Wall
};

// the maze data: a width x height block of open/wall cells plus start and end.
// once a maze is handed to the driver it is only ever replaced, never edited
class MazeGrid {
public:
    // throws std::invalid_argument for non-positive sizes
    MazeGrid(int width, int height);

    // same check the constructor runs, for callers that need to fail before building one
    static void checkDimensions(int width, int height);

    // '#' wall, '.' open, 'S' open start, 'E' open end
    static MazeGrid fromRows(const std::vector<std::string>& rows);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

    const GridCell& getStart() const { return start_; }
    const GridCell& getEnd() const { return end_; }
    void setStart(const GridCell& cell) { start_ = cell; }
    void setEnd(const GridCell& cell) { end_ = cell; }

    bool inBounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }
    bool inBounds(const GridCell& cell) const { return inBounds(cell.x, cell.y); }

    // out of bounds reads as wall
    bool isWall(int x, int y) const;
    bool isWall(const GridCell& cell) const { return isWall(cell.x, cell.y); }
    bool isOpen(int x, int y) const { return !isWall(x, y); }
    bool isOpen(const GridCell& cell) const { return !isWall(cell.x, cell.y); }

    CellState getCell(int x, int y) const { return cells_[getIndex(x, y)]; }
    void setCell(int x, int y, CellState state);
    void setCell(const GridCell& cell, CellState state) { setCell(cell.x, cell.y, state); }

    // open unit-step neighbors in the order (+x, -x, +y, -y)
    std::vector<GridCell> getNeighbors(const GridCell& cell) const;

    int openCellCount() const;

private:
    int width_, height_;
    std::vector<CellState> cells_;   // row major
    GridCell start_;
    GridCell end_;

    int getIndex(int x, int y) const { return y * width_ + x; }
};
