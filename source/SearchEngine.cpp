#include "SearchEngine.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>

void VisitationRecord::seed(const GridCell& start) {
    clear();
    cameFrom_.emplace(start, std::nullopt);
    order_.push_back(start);
}

void VisitationRecord::clear() {
    cameFrom_.clear();
    order_.clear();
}

bool VisitationRecord::record(const GridCell& cell, const GridCell& predecessor) {
    auto it = cameFrom_.find(cell);
    if (it != cameFrom_.end()) {
        // relaxation: better route found, the cell keeps its place in the drawing order
        it->second = predecessor;
        return false;
    }
    cameFrom_.emplace(cell, predecessor);
    order_.push_back(cell);
    return true;
}

std::optional<GridCell> VisitationRecord::predecessor(const GridCell& cell) const {
    auto it = cameFrom_.find(cell);
    if (it == cameFrom_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Path VisitationRecord::pathTo(const GridCell& end) const {
    Path path;
    GridCell current = end;

    // walking backwards through the parent map until we hit the start (no predecessor)
    auto it = cameFrom_.find(current);
    while (it != cameFrom_.end() && it->second.has_value()) {
        path.push_back(current);
        current = *it->second;
        it = cameFrom_.find(current);
    }

    // building end->start so flip it to start->end
    std::reverse(path.begin(), path.end());
    return path;
}

int manhattanDistance(const GridCell& a, const GridCell& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

SearchRun::SearchRun(const MazeGrid& grid, SearchAlgorithm algo)
    : SearchRun(grid, algo, grid.getStart(), grid.getEnd()) {
}

SearchRun::SearchRun(const MazeGrid& grid, SearchAlgorithm algo, const GridCell& start, const GridCell& end)
    : grid_(grid), algo_(algo), start_(start), end_(end) {
    restart();
}

void SearchRun::restart() {
    frontier_ = makeFrontier(algo_);
    record_.seed(start_);
    distance_.clear();
    state_ = SearchState::Running;
    nodesExpanded_ = 0;

    if (usesDistances()) {
        distance_[start_] = 0;
    }
    frontier_->push(start_, priorityFor(start_, 0));
}

int SearchRun::priorityFor(const GridCell& cell, int distance) const {
    switch (algo_) {
        case SearchAlgorithm::Dijkstra:
            return distance;
        case SearchAlgorithm::AStar:
            return distance + manhattanDistance(cell, end_);  // f = g + h
        default:
            return 0;
    }
}

SearchState SearchRun::step() {
    while (state_ == SearchState::Running) {
        if (frontier_->isEmpty()) {
            state_ = SearchState::Exhausted;
            break;
        }

        FrontierEntry entry = frontier_->popNext();

        // lazy deletion: a cheaper route to this cell was pushed after this entry
        if (usesDistances() && entry.priority != priorityFor(entry.cell, distance_.at(entry.cell))) {
            continue;
        }

        if (entry.cell == end_) {
            state_ = SearchState::Found;
            break;
        }

        expand(entry.cell);
        nodesExpanded_++;
        return state_;
    }
    return state_;
}

void SearchRun::expand(const GridCell& current) {
    for (const GridCell& next : grid_.getNeighbors(current)) {
        if (!usesDistances()) {
            // bfs/dfs: first discovery wins, never reconsidered
            if (!record_.contains(next)) {
                record_.record(next, current);
                frontier_->push(next, 0);
            }
            continue;
        }

        int newCost = distance_[current] + 1;
        auto known = distance_.find(next);
        if (known == distance_.end() || newCost < known->second) {
            distance_[next] = newCost;
            record_.record(next, current);
            frontier_->push(next, priorityFor(next, newCost));
        }
    }
}

SearchResult SearchEngine::search(const MazeGrid& grid, SearchAlgorithm algo, const StepCallback& onStep) {
    return search(grid, algo, grid.getStart(), grid.getEnd(), onStep);
}

SearchResult SearchEngine::search(const MazeGrid& grid, SearchAlgorithm algo,
                                  const GridCell& start, const GridCell& end,
                                  const StepCallback& onStep) {
    auto startTime = std::chrono::high_resolution_clock::now();
    SearchResult result;

    SearchRun run(grid, algo, start, end);
    while (run.step() == SearchState::Running) {
        if (onStep && !onStep(run.visited())) {
            result.cancelled = true;
            break;
        }
    }

    result.nodesExpanded = run.getNodesExpanded();
    result.visitedOrder = run.visited();
    if (!result.cancelled) {
        result.found = run.getState() == SearchState::Found;
        result.path = run.reconstructPath();
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    return result;
}
