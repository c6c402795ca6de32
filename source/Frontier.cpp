#include "Frontier.h"

void QueueFrontier::push(const GridCell& cell, int /*priority*/) {
    queue_.push(cell);
}

FrontierEntry QueueFrontier::popNext() {
    FrontierEntry entry{queue_.front(), 0};
    queue_.pop();
    return entry;
}

void StackFrontier::push(const GridCell& cell, int /*priority*/) {
    stack_.push(cell);
}

FrontierEntry StackFrontier::popNext() {
    FrontierEntry entry{stack_.top(), 0};
    stack_.pop();
    return entry;
}

void PriorityFrontier::push(const GridCell& cell, int priority) {
    heap_.push({priority, cell});
}

FrontierEntry PriorityFrontier::popNext() {
    FrontierEntry entry{heap_.top().second, heap_.top().first};
    heap_.pop();
    return entry;
}

std::unique_ptr<Frontier> makeFrontier(SearchAlgorithm algo) {
    switch (algo) {
        case SearchAlgorithm::BFS:
            return std::make_unique<QueueFrontier>();
        case SearchAlgorithm::DFS:
            return std::make_unique<StackFrontier>();
        case SearchAlgorithm::Dijkstra:
        case SearchAlgorithm::AStar:
            return std::make_unique<PriorityFrontier>();
    }
    return std::make_unique<QueueFrontier>();
}
