#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include "Frontier.h"
#include "MazeGrid.h"
#include "SearchAlgorithm.h"

// route from the cell after start up to and including end. start itself is
// not part of it, so size() is the number of edges walked
using Path = std::vector<GridCell>;

// visited cell -> the cell it was discovered from (none for the start cell).
// keeps the order cells were first recorded in, which is what gets drawn each step
class VisitationRecord {
public:
    void seed(const GridCell& start);
    void clear();

    // records or overwrites the predecessor. returns true when the cell is new
    bool record(const GridCell& cell, const GridCell& predecessor);

    bool contains(const GridCell& cell) const { return cameFrom_.count(cell) > 0; }
    std::optional<GridCell> predecessor(const GridCell& cell) const;

    const std::vector<GridCell>& order() const { return order_; }
    size_t size() const { return order_.size(); }

    // walks predecessors back from end. empty if end was never recorded
    Path pathTo(const GridCell& end) const;

private:
    std::unordered_map<GridCell, std::optional<GridCell>, GridCellHash> cameFrom_;
    std::vector<GridCell> order_;
};

enum class SearchState {
    Running,    // more expansions to do
    Found,      // end was popped from the frontier
    Exhausted   // frontier ran dry without popping end
};

int manhattanDistance(const GridCell& a, const GridCell& b);

// one search, advanced one expansion at a time so the caller owns pacing.
// the grid must outlive the run
class SearchRun {
public:
    SearchRun(const MazeGrid& grid, SearchAlgorithm algo);
    SearchRun(const MazeGrid& grid, SearchAlgorithm algo, const GridCell& start, const GridCell& end);

    // drops all state from the previous attempt and seeds the start cell again
    void restart();

    // expands one cell. popping end (or running out of frontier) finishes the
    // run without counting an expansion
    SearchState step();

    SearchState getState() const { return state_; }
    bool isFinished() const { return state_ != SearchState::Running; }
    SearchAlgorithm getAlgorithm() const { return algo_; }
    int getNodesExpanded() const { return nodesExpanded_; }

    // snapshot of every cell recorded so far
    const std::vector<GridCell>& visited() const { return record_.order(); }
    const VisitationRecord& getRecord() const { return record_; }

    Path reconstructPath() const { return record_.pathTo(end_); }

private:
    const MazeGrid& grid_;
    SearchAlgorithm algo_;
    GridCell start_;
    GridCell end_;

    std::unique_ptr<Frontier> frontier_;
    VisitationRecord record_;
    std::unordered_map<GridCell, int, GridCellHash> distance_;  // Dijkstra / A* only
    SearchState state_ = SearchState::Running;
    int nodesExpanded_ = 0;

    bool usesDistances() const {
        return algo_ == SearchAlgorithm::Dijkstra || algo_ == SearchAlgorithm::AStar;
    }
    int priorityFor(const GridCell& cell, int distance) const;
    void expand(const GridCell& current);
};

// result of a pathfinding run
struct SearchResult {
    Path path;
    std::vector<GridCell> visitedOrder;
    int nodesExpanded = 0;
    bool found = false;         // end was reached (true with an empty path when start == end)
    bool cancelled = false;     // the step callback asked to stop
    double computeTimeMs = 0.0; // wall clock for the whole run, callbacks included
};

class SearchEngine {
public:
    // called after every expansion with the visited snapshot. return false to cancel
    using StepCallback = std::function<bool(const std::vector<GridCell>&)>;

    static SearchResult search(const MazeGrid& grid, SearchAlgorithm algo,
                               const StepCallback& onStep = nullptr);
    static SearchResult search(const MazeGrid& grid, SearchAlgorithm algo,
                               const GridCell& start, const GridCell& end,
                               const StepCallback& onStep = nullptr);
};
