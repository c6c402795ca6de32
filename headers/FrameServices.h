#pragma once
#include <optional>
#include <vector>
#include "MazeGrid.h"
#include "SearchAlgorithm.h"
#include "SearchEngine.h"
#include "VisualizerSettings.h"

// the things the driver needs from a window, kept abstract so the
// driver runs headless in tests

enum class DriverStatus {
    Idle,
    Searching
};

// outcome of the last completed animated run
struct RunStats {
    bool found = false;
    int pathLength = 0;          // edges walked from start to end
    int nodesExpanded = 0;
    int cellsVisited = 0;
    double elapsedSeconds = 0.0; // wall clock, pacing included
};

struct HudState {
    SearchAlgorithm algorithm = SearchAlgorithm::BFS;
    DriverStatus status = DriverStatus::Idle;
    std::optional<RunStats> lastRun;
};

// everything needed to paint one frame. z-order: start/end over path over visited over base
struct FrameView {
    const MazeGrid& grid;
    const std::vector<GridCell>& visited;
    const Path& path;
    CellColor highlight;     // hue for visited cells
    GridCell start;
    GridCell end;
    HudState hud;
};

class Renderer {
public:
    virtual ~Renderer() = default;
    virtual void drawFrame(const FrameView& frame) = 0;
};

class FrameClock {
public:
    virtual ~FrameClock() = default;
    // blocks until the next frame boundary
    virtual void tick(int targetFps) = 0;
};

struct InputEvent {
    enum class Type {
        Quit,
        SelectAlgorithm,
        Regenerate,
        RunSearch,
        PrintComparison,
        SaveSettings
    };

    Type type;
    int algorithmIndex = 0;  // SelectAlgorithm only, 0..3

    static InputEvent quit() { return {Type::Quit}; }
    static InputEvent select(int index) { return {Type::SelectAlgorithm, index}; }
    static InputEvent regenerate() { return {Type::Regenerate}; }
    static InputEvent runSearch() { return {Type::RunSearch}; }
    static InputEvent printComparison() { return {Type::PrintComparison}; }
    static InputEvent saveSettings() { return {Type::SaveSettings}; }
};

class InputSource {
public:
    virtual ~InputSource() = default;
    // drains whatever arrived since the last call
    virtual std::vector<InputEvent> pollEvents() = 0;
};
