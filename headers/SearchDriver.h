#pragma once
#include <optional>
#include <string>
#include <vector>
#include "FrameServices.h"
#include "MazeGenerator.h"
#include "MazeGrid.h"
#include "SearchAlgorithm.h"
#include "SearchEngine.h"
#include "VisualizerSettings.h"

// owns the maze and the selected algorithm, and plays one search at a time
// step by step: draw, wait a frame, poll for quit, repeat
class SearchDriver {
public:
    // generates the first maze. throws std::invalid_argument on bad maze sizes
    SearchDriver(const VisualizerSettings& settings, Renderer& renderer,
                 FrameClock& clock, InputSource& input,
                 std::string settingsPath = "maze_settings.txt");

    // idle loop until quit
    void run();

    // one idle frame: handle pending input, draw, tick
    void runFrame();

    void handleEvent(const InputEvent& event);

    // animates the selected algorithm to completion (or until quit)
    void runSearch();
    void selectAlgorithm(SearchAlgorithm algo);
    void regenerateMaze();
    void printComparison() const;
    bool saveSettings();

    // accessors
    const MazeGrid& getMaze() const { return maze_; }
    SearchAlgorithm getAlgorithm() const { return algorithm_; }
    DriverStatus getStatus() const { return status_; }
    const Path& getDisplayedPath() const { return displayedPath_; }
    const std::optional<RunStats>& getLastStats() const { return lastStats_; }
    bool isQuitRequested() const { return quitRequested_; }
    uint32_t getSeed() const { return generator_.getSeed(); }

private:
    VisualizerSettings settings_;
    std::string settingsPath_;

    Renderer& renderer_;
    FrameClock& clock_;
    InputSource& input_;

    MazeGenerator generator_;
    MazeGrid maze_;
    SearchAlgorithm algorithm_;

    DriverStatus status_ = DriverStatus::Idle;
    Path displayedPath_;
    std::optional<RunStats> lastStats_;
    bool quitRequested_ = false;

    // non-quit input that arrived mid-search, handled once the run is over
    std::vector<InputEvent> deferredEvents_;

    HudState hudState() const;
    void drawIdleFrame();
};
