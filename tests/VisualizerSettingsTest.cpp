#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "VisualizerSettings.h"

namespace {

std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + name;
}

}

TEST(VisualizerSettingsTest, DefaultsMatchReferencePalette) {
    VisualizerSettings settings;
    EXPECT_EQ(settings.mazeWidth, 45);
    EXPECT_EQ(settings.mazeHeight, 45);
    EXPECT_EQ(settings.cellSize, 15);
    EXPECT_EQ(settings.targetFps, 60);
    EXPECT_EQ(settings.algorithmColor(SearchAlgorithm::BFS), (CellColor{50, 150, 255}));
    EXPECT_EQ(settings.algorithmColor(SearchAlgorithm::DFS), (CellColor{255, 50, 50}));
    EXPECT_EQ(settings.algorithmColor(SearchAlgorithm::Dijkstra), (CellColor{50, 255, 100}));
    EXPECT_EQ(settings.algorithmColor(SearchAlgorithm::AStar), (CellColor{255, 255, 100}));
    EXPECT_EQ(settings.colorPath, (CellColor{255, 165, 0}));
}

TEST(VisualizerSettingsTest, SavedFileLoadsBack) {
    VisualizerSettings saved;
    saved.mazeWidth = 31;
    saved.mazeHeight = 21;
    saved.targetFps = 120;
    saved.seed = 777;
    saved.initialAlgorithm = 3;
    saved.colorPath = {10, 20, 30};

    const std::string path = tempPath("maze_settings_roundtrip.txt");
    ASSERT_TRUE(saved.saveToFile(path));

    VisualizerSettings loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded.mazeWidth, 31);
    EXPECT_EQ(loaded.mazeHeight, 21);
    EXPECT_EQ(loaded.targetFps, 120);
    EXPECT_EQ(loaded.seed, 777u);
    EXPECT_EQ(loaded.initialAlgorithm, 3);
    EXPECT_EQ(loaded.colorPath, (CellColor{10, 20, 30}));
    std::remove(path.c_str());
}

TEST(VisualizerSettingsTest, MissingFileKeepsDefaults) {
    VisualizerSettings settings;
    EXPECT_FALSE(settings.loadFromFile(tempPath("does_not_exist/settings.txt")));
    EXPECT_EQ(settings.mazeWidth, 45);
}

TEST(VisualizerSettingsTest, MalformedLinesAreSkipped) {
    const std::string path = tempPath("maze_settings_malformed.txt");
    {
        std::ofstream file(path);
        file << "# comment\n"
             << "mazeWidth=abc\n"
             << "no equals sign here\n"
             << "mazeHeight=17\n"
             << "colorWall=1,2\n"
             << "colorOpen=9,8,7\n"
             << "unknownKey=5\n";
    }

    VisualizerSettings settings;
    ASSERT_TRUE(settings.loadFromFile(path));
    EXPECT_EQ(settings.mazeWidth, 45);
    EXPECT_EQ(settings.mazeHeight, 17);
    EXPECT_EQ(settings.colorWall, (CellColor{0, 0, 0}));
    EXPECT_EQ(settings.colorOpen, (CellColor{9, 8, 7}));
    std::remove(path.c_str());
}

TEST(VisualizerSettingsTest, ValuesAreClampedAfterLoad) {
    const std::string path = tempPath("maze_settings_clamp.txt");
    {
        std::ofstream file(path);
        file << "mazeWidth=100000\n"
             << "mazeHeight=600\n"
             << "cellSize=1\n"
             << "targetFps=-5\n"
             << "initialAlgorithm=9\n";
    }

    VisualizerSettings settings;
    ASSERT_TRUE(settings.loadFromFile(path));
    EXPECT_EQ(settings.mazeWidth, 400);
    EXPECT_EQ(settings.mazeHeight, 400);
    EXPECT_EQ(settings.cellSize, 2);
    EXPECT_EQ(settings.targetFps, 1);
    EXPECT_EQ(settings.initialAlgorithm, 3);
    std::remove(path.c_str());
}

TEST(VisualizerSettingsTest, ParseColor) {
    CellColor color;
    EXPECT_TRUE(VisualizerSettings::parseColor("255,165,0", color));
    EXPECT_EQ(color, (CellColor{255, 165, 0}));
    EXPECT_TRUE(VisualizerSettings::parseColor(" 1, 2, 3", color));
    EXPECT_EQ(color, (CellColor{1, 2, 3}));

    EXPECT_FALSE(VisualizerSettings::parseColor("256,0,0", color));
    EXPECT_FALSE(VisualizerSettings::parseColor("1;2;3", color));
    EXPECT_FALSE(VisualizerSettings::parseColor("", color));
}

TEST(VisualizerSettingsTest, NonPositiveSizesAreNotLifted) {
    VisualizerSettings settings;
    settings.mazeWidth = 0;
    settings.mazeHeight = -3;
    settings.validateAndClamp();

    // left as given so building the maze rejects them
    EXPECT_EQ(settings.mazeWidth, 0);
    EXPECT_EQ(settings.mazeHeight, -3);
}
