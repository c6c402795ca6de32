#pragma once
#include <cstdint>
#include <string>
#include "SearchAlgorithm.h"

// plain rgb so the core stays free of any windowing library
struct CellColor {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const CellColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const CellColor& other) const { return !(*this == other); }
};

class VisualizerSettings
{
public:
    // maze settings
    int mazeWidth = 45;     // cells horizontally
    int mazeHeight = 45;    // cells vertically
    int cellSize = 15;      // pixels per cell
    int targetFps = 60;     // animation pace, one search step per frame
    uint32_t seed = 0;      // 0 = fresh random maze every time
    int initialAlgorithm = 0;

    // palette
    CellColor colorOpen{255, 255, 255};
    CellColor colorWall{0, 0, 0};
    CellColor colorBFS{50, 150, 255};
    CellColor colorDFS{255, 50, 50};
    CellColor colorDijkstra{50, 255, 100};
    CellColor colorAStar{255, 255, 100};
    CellColor colorPath{255, 165, 0};
    CellColor colorStart{50, 255, 100};
    CellColor colorEnd{255, 50, 50};

    // hue used for cells visited by the given algorithm
    const CellColor& algorithmColor(SearchAlgorithm algo) const;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    static bool parseColor(const std::string &value, CellColor &out);
};
