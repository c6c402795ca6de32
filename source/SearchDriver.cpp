#include "SearchDriver.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>
#include "SearchBenchmark.h"

namespace {

// caps only; a non-positive maze size still reaches MazeGrid and throws
VisualizerSettings clampedCopy(const VisualizerSettings& settings) {
    VisualizerSettings copy = settings;
    copy.validateAndClamp();
    return copy;
}

}

SearchDriver::SearchDriver(const VisualizerSettings& settings, Renderer& renderer,
                           FrameClock& clock, InputSource& input, std::string settingsPath)
    : settings_(clampedCopy(settings)),
      settingsPath_(std::move(settingsPath)),
      renderer_(renderer),
      clock_(clock),
      input_(input),
      generator_(settings_.seed),
      maze_(generator_.generate(settings_.mazeWidth, settings_.mazeHeight)),
      algorithm_(allAlgorithms()[settings_.initialAlgorithm]) {
    std::cout << "Maze " << maze_.getWidth() << "x" << maze_.getHeight()
              << " generated (seed " << generator_.getSeed() << ", "
              << maze_.openCellCount() << " open cells)" << std::endl;
}

void SearchDriver::run() {
    while (!quitRequested_) {
        runFrame();
    }
}

void SearchDriver::runFrame() {
    // input deferred during the last search goes first, in arrival order
    std::vector<InputEvent> events = std::move(deferredEvents_);
    deferredEvents_.clear();
    for (const InputEvent& event : input_.pollEvents()) {
        events.push_back(event);
    }

    for (const InputEvent& event : events) {
        if (quitRequested_) {
            return;
        }
        handleEvent(event);
    }
    if (quitRequested_) {
        return;
    }

    drawIdleFrame();
    clock_.tick(settings_.targetFps);
}

void SearchDriver::handleEvent(const InputEvent& event) {
    switch (event.type) {
        case InputEvent::Type::Quit:
            quitRequested_ = true;
            break;
        case InputEvent::Type::SelectAlgorithm:
            if (event.algorithmIndex >= 0 &&
                event.algorithmIndex < static_cast<int>(allAlgorithms().size())) {
                selectAlgorithm(allAlgorithms()[event.algorithmIndex]);
            }
            break;
        case InputEvent::Type::Regenerate:
            regenerateMaze();
            break;
        case InputEvent::Type::RunSearch:
            runSearch();
            break;
        case InputEvent::Type::PrintComparison:
            printComparison();
            break;
        case InputEvent::Type::SaveSettings:
            saveSettings();
            break;
    }
}

void SearchDriver::runSearch() {
    status_ = DriverStatus::Searching;
    displayedPath_.clear();

    const CellColor highlight = settings_.algorithmColor(algorithm_);
    const Path noPath;

    auto startTime = std::chrono::high_resolution_clock::now();

    // a fresh run every time, nothing carries over from the previous one
    SearchRun search(maze_, algorithm_);
    bool cancelled = false;

    while (search.step() == SearchState::Running) {
        renderer_.drawFrame({maze_, search.visited(), noPath, highlight,
                             maze_.getStart(), maze_.getEnd(), hudState()});
        clock_.tick(settings_.targetFps);

        for (const InputEvent& event : input_.pollEvents()) {
            if (event.type == InputEvent::Type::Quit) {
                cancelled = true;
                quitRequested_ = true;
            } else {
                deferredEvents_.push_back(event);
            }
        }
        if (cancelled) {
            break;
        }
    }

    status_ = DriverStatus::Idle;

    if (cancelled) {
        std::cout << algorithmName(algorithm_) << " cancelled after "
                  << search.getNodesExpanded() << " expansions" << std::endl;
        return;
    }

    auto endTime = std::chrono::high_resolution_clock::now();

    RunStats stats;
    stats.found = search.getState() == SearchState::Found;
    stats.nodesExpanded = search.getNodesExpanded();
    stats.cellsVisited = static_cast<int>(search.visited().size());
    if (stats.found) {
        displayedPath_ = search.reconstructPath();
        stats.pathLength = static_cast<int>(displayedPath_.size());
        stats.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();
    }
    lastStats_ = stats;

    if (stats.found) {
        std::cout << algorithmName(algorithm_) << ": path length " << stats.pathLength
                  << ", " << stats.cellsVisited << " cells visited, "
                  << std::fixed << std::setprecision(4) << stats.elapsedSeconds << " s" << std::endl;
    } else {
        std::cout << algorithmName(algorithm_) << ": no path found after visiting "
                  << stats.cellsVisited << " cells" << std::endl;
    }

    const std::vector<GridCell> noVisited;
    renderer_.drawFrame({maze_, noVisited, displayedPath_, settings_.colorPath,
                         maze_.getStart(), maze_.getEnd(), hudState()});
}

void SearchDriver::selectAlgorithm(SearchAlgorithm algo) {
    algorithm_ = algo;
    displayedPath_.clear();
}

void SearchDriver::regenerateMaze() {
    // sizes were accepted when the first maze was built and do not change afterwards
    maze_ = generator_.generate(settings_.mazeWidth, settings_.mazeHeight);

    displayedPath_.clear();
    lastStats_.reset();
    std::cout << "Maze regenerated (" << maze_.openCellCount() << " open cells)" << std::endl;
}

void SearchDriver::printComparison() const {
    SearchBenchmark::printComparison(SearchBenchmark::runComparison(maze_), std::cout);
}

bool SearchDriver::saveSettings() {
    for (size_t i = 0; i < allAlgorithms().size(); ++i) {
        if (allAlgorithms()[i] == algorithm_) {
            settings_.initialAlgorithm = static_cast<int>(i);
        }
    }

    if (!settings_.saveToFile(settingsPath_)) {
        return false;
    }
    std::cout << "Settings saved to " << settingsPath_ << std::endl;
    return true;
}

HudState SearchDriver::hudState() const {
    HudState hud;
    hud.algorithm = algorithm_;
    hud.status = status_;
    hud.lastRun = lastStats_;
    return hud;
}

void SearchDriver::drawIdleFrame() {
    const std::vector<GridCell> noVisited;
    renderer_.drawFrame({maze_, noVisited, displayedPath_, settings_.colorPath,
                         maze_.getStart(), maze_.getEnd(), hudState()});
}
