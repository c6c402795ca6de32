#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "MazeGrid.h"
#include "SearchAlgorithm.h"

// statistics for a single algorithm in the comparison
struct AlgorithmStats {
    SearchAlgorithm algorithm;
    std::string name;
    bool found = false;
    int pathLength = 0;            // edges from start to end
    int nodesExpanded = 0;
    int cellsVisited = 0;          // cells that made it into the visitation record
    double computeTimeMs = 0.0;
};

// runs every algorithm unpaced on the same maze
class SearchBenchmark {
public:
    static std::vector<AlgorithmStats> runComparison(const MazeGrid& maze);
    static void printComparison(const std::vector<AlgorithmStats>& stats, std::ostream& out);
};
