#include "MazeGrid.h"
#include <algorithm>
#include <stdexcept>

namespace {

int checkedDimension(int value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string("maze ") + name + " must be positive, got " +
                                    std::to_string(value));
    }
    return value;
}

}

void MazeGrid::checkDimensions(int width, int height) {
    checkedDimension(width, "width");
    checkedDimension(height, "height");
}

// validated before the cell buffer is sized so a bad request never allocates
MazeGrid::MazeGrid(int width, int height)
    : width_(checkedDimension(width, "width")),
      height_(checkedDimension(height, "height")),
      cells_(static_cast<size_t>(width_) * static_cast<size_t>(height_), CellState::Wall),
      start_{0, 0},
      end_{width_ - 1, height_ - 1} {
}

MazeGrid MazeGrid::fromRows(const std::vector<std::string>& rows) {
    if (rows.empty() || rows[0].empty()) {
        throw std::invalid_argument("maze rows must not be empty");
    }

    const int width = static_cast<int>(rows[0].size());
    const int height = static_cast<int>(rows.size());
    MazeGrid grid(width, height);

    for (int y = 0; y < height; y++) {
        const std::string& row = rows[y];
        if (static_cast<int>(row.size()) != width) {
            throw std::invalid_argument("maze row " + std::to_string(y) + " has length " +
                                        std::to_string(row.size()) + ", expected " +
                                        std::to_string(width));
        }
        for (int x = 0; x < width; x++) {
            switch (row[x]) {
                case '#':
                    break;
                case '.':
                    grid.setCell(x, y, CellState::Open);
                    break;
                case 'S':
                    grid.setCell(x, y, CellState::Open);
                    grid.setStart({x, y});
                    break;
                case 'E':
                    grid.setCell(x, y, CellState::Open);
                    grid.setEnd({x, y});
                    break;
                default:
                    throw std::invalid_argument(std::string("unknown maze character '") + row[x] + "'");
            }
        }
    }
    return grid;
}

bool MazeGrid::isWall(int x, int y) const {
    if (!inBounds(x, y)) {
        return true;
    }
    return cells_[getIndex(x, y)] == CellState::Wall;
}

void MazeGrid::setCell(int x, int y, CellState state) {
    if (inBounds(x, y)) {
        cells_[getIndex(x, y)] = state;
    }
}

std::vector<GridCell> MazeGrid::getNeighbors(const GridCell& cell) const {
    std::vector<GridCell> neighbors;
    neighbors.reserve(4);

    // this order is the tie-break for which predecessor wins in BFS/DFS
    const int dx[] = {1, -1, 0, 0};
    const int dy[] = {0, 0, 1, -1};

    for (int i = 0; i < 4; i++) {
        int nx = cell.x + dx[i];
        int ny = cell.y + dy[i];
        if (isOpen(nx, ny)) {
            neighbors.push_back({nx, ny});
        }
    }
    return neighbors;
}

int MazeGrid::openCellCount() const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), CellState::Open));
}
