#pragma once
#include <array>

enum class SearchAlgorithm {
    BFS,        // breadth first: FIFO frontier, uniform expansion
    DFS,        // depth first: LIFO frontier, dives before backtracking
    Dijkstra,   // uniform cost search on cumulative distance
    AStar       // distance + manhattan heuristic toward the end cell
};

inline const char* algorithmName(SearchAlgorithm algo) {
    switch (algo) {
        case SearchAlgorithm::BFS:
            return "BFS";
        case SearchAlgorithm::DFS:
            return "DFS";
        case SearchAlgorithm::Dijkstra:
            return "Dijkstra";
        case SearchAlgorithm::AStar:
            return "A*";
        default:
            return "Unknown";
    }
}

// selection order used by the 1-4 keys
inline const std::array<SearchAlgorithm, 4>& allAlgorithms() {
    static const std::array<SearchAlgorithm, 4> algos = {
        SearchAlgorithm::BFS, SearchAlgorithm::DFS, SearchAlgorithm::Dijkstra, SearchAlgorithm::AStar};
    return algos;
}
