#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <queue>
#include <stack>
#include <utility>
#include <vector>
#include "MazeGrid.h"
#include "SearchAlgorithm.h"

struct FrontierEntry {
    GridCell cell;
    int priority = 0;   // cumulative cost (Dijkstra) or cost + heuristic (A*), 0 otherwise
};

// the discovered but not yet expanded cells of one search
class Frontier {
public:
    virtual ~Frontier() = default;

    virtual void push(const GridCell& cell, int priority) = 0;
    // precondition: !isEmpty()
    virtual FrontierEntry popNext() = 0;
    virtual bool isEmpty() const = 0;
    virtual size_t size() const = 0;
};

// FIFO, breadth first
class QueueFrontier : public Frontier {
public:
    void push(const GridCell& cell, int priority) override;
    FrontierEntry popNext() override;
    bool isEmpty() const override { return queue_.empty(); }
    size_t size() const override { return queue_.size(); }

private:
    std::queue<GridCell> queue_;
};

// LIFO, depth first
class StackFrontier : public Frontier {
public:
    void push(const GridCell& cell, int priority) override;
    FrontierEntry popNext() override;
    bool isEmpty() const override { return stack_.empty(); }
    size_t size() const override { return stack_.size(); }

private:
    std::stack<GridCell> stack_;
};

// min-heap keyed by (priority, cell). stale entries are never removed,
// the search skips them when they surface
class PriorityFrontier : public Frontier {
public:
    void push(const GridCell& cell, int priority) override;
    FrontierEntry popNext() override;
    bool isEmpty() const override { return heap_.empty(); }
    size_t size() const override { return heap_.size(); }

private:
    using PQElement = std::pair<int, GridCell>;
    std::priority_queue<PQElement, std::vector<PQElement>, std::greater<PQElement>> heap_;
};

std::unique_ptr<Frontier> makeFrontier(SearchAlgorithm algo);
