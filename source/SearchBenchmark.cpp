#include "SearchBenchmark.h"
#include <iomanip>
#include <ostream>
#include "SearchEngine.h"

std::vector<AlgorithmStats> SearchBenchmark::runComparison(const MazeGrid& maze) {
    std::vector<AlgorithmStats> stats;
    stats.reserve(allAlgorithms().size());

    for (SearchAlgorithm algo : allAlgorithms()) {
        SearchResult result = SearchEngine::search(maze, algo);

        AlgorithmStats entry;
        entry.algorithm = algo;
        entry.name = algorithmName(algo);
        entry.found = result.found;
        entry.pathLength = static_cast<int>(result.path.size());
        entry.nodesExpanded = result.nodesExpanded;
        entry.cellsVisited = static_cast<int>(result.visitedOrder.size());
        entry.computeTimeMs = result.computeTimeMs;
        stats.push_back(entry);
    }
    return stats;
}

void SearchBenchmark::printComparison(const std::vector<AlgorithmStats>& stats, std::ostream& out) {
    out << std::left << std::setw(10) << "Algorithm"
        << std::right << std::setw(8) << "Path"
        << std::setw(10) << "Expanded"
        << std::setw(10) << "Visited"
        << std::setw(12) << "Time (ms)" << "\n";

    for (const auto& s : stats) {
        out << std::left << std::setw(10) << s.name << std::right;
        if (s.found) {
            out << std::setw(8) << s.pathLength;
        } else {
            out << std::setw(8) << "-";
        }
        out << std::setw(10) << s.nodesExpanded
            << std::setw(10) << s.cellsVisited
            << std::setw(12) << std::fixed << std::setprecision(3) << s.computeTimeMs << "\n";
    }
}
