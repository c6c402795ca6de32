#include "VisualizerSettings.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

void writeColor(std::ofstream &file, const char *key, const CellColor &color)
{
    file << key << "=" << static_cast<int>(color.r) << ","
         << static_cast<int>(color.g) << "," << static_cast<int>(color.b) << "\n";
}

}

const CellColor &VisualizerSettings::algorithmColor(SearchAlgorithm algo) const
{
    switch (algo)
    {
    case SearchAlgorithm::BFS:
        return colorBFS;
    case SearchAlgorithm::DFS:
        return colorDFS;
    case SearchAlgorithm::Dijkstra:
        return colorDijkstra;
    case SearchAlgorithm::AStar:
        return colorAStar;
    default:
        return colorBFS;
    }
}

bool VisualizerSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Maze Pathfinder Visualizer Settings\n";
    file << "mazeWidth=" << mazeWidth << "\n";
    file << "mazeHeight=" << mazeHeight << "\n";
    file << "cellSize=" << cellSize << "\n";
    file << "targetFps=" << targetFps << "\n";
    file << "seed=" << seed << "\n";
    file << "initialAlgorithm=" << initialAlgorithm << "\n";

    writeColor(file, "colorOpen", colorOpen);
    writeColor(file, "colorWall", colorWall);
    writeColor(file, "colorBFS", colorBFS);
    writeColor(file, "colorDFS", colorDFS);
    writeColor(file, "colorDijkstra", colorDijkstra);
    writeColor(file, "colorAStar", colorAStar);
    writeColor(file, "colorPath", colorPath);
    writeColor(file, "colorStart", colorStart);
    writeColor(file, "colorEnd", colorEnd);

    return true;
}

bool VisualizerSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            // parse basic settings
            if (key == "mazeWidth")
                mazeWidth = std::stoi(value);
            else if (key == "mazeHeight")
                mazeHeight = std::stoi(value);
            else if (key == "cellSize")
                cellSize = std::stoi(value);
            else if (key == "targetFps")
                targetFps = std::stoi(value);
            else if (key == "seed")
                seed = static_cast<uint32_t>(std::stoul(value));
            else if (key == "initialAlgorithm")
                initialAlgorithm = std::stoi(value);
            // parse palette
            else if (key.find("color") == 0)
            {
                CellColor parsed;
                if (!parseColor(value, parsed))
                {
                    std::cerr << "Warning: bad color on line " << lineNumber << ": " << line << std::endl;
                    continue;
                }

                if (key == "colorOpen")
                    colorOpen = parsed;
                else if (key == "colorWall")
                    colorWall = parsed;
                else if (key == "colorBFS")
                    colorBFS = parsed;
                else if (key == "colorDFS")
                    colorDFS = parsed;
                else if (key == "colorDijkstra")
                    colorDijkstra = parsed;
                else if (key == "colorAStar")
                    colorAStar = parsed;
                else if (key == "colorPath")
                    colorPath = parsed;
                else if (key == "colorStart")
                    colorStart = parsed;
                else if (key == "colorEnd")
                    colorEnd = parsed;
            }
        }
        catch (const std::exception &e)
        {
            // std::stoi family throws invalid_argument / out_of_range
            std::cerr << "Warning: skipping line " << lineNumber << " (" << line << "): " << e.what() << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void VisualizerSettings::validateAndClamp()
{
    // sizes are only capped, a non-positive size is rejected when the maze is built
    mazeWidth = std::min(mazeWidth, 400);
    mazeHeight = std::min(mazeHeight, 400);
    cellSize = std::clamp(cellSize, 2, 64);
    targetFps = std::clamp(targetFps, 1, 1000);
    initialAlgorithm = std::clamp(initialAlgorithm, 0, static_cast<int>(allAlgorithms().size()) - 1);
}

bool VisualizerSettings::parseColor(const std::string &value, CellColor &out)
{
    std::istringstream in(value);
    int channels[3];
    char comma = 0;

    for (int i = 0; i < 3; ++i)
    {
        if (!(in >> channels[i]))
            return false;
        if (channels[i] < 0 || channels[i] > 255)
            return false;
        if (i < 2 && (!(in >> comma) || comma != ','))
            return false;
    }

    out.r = static_cast<uint8_t>(channels[0]);
    out.g = static_cast<uint8_t>(channels[1]);
    out.b = static_cast<uint8_t>(channels[2]);
    return true;
}
