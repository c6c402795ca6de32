#include <SFML/Graphics.hpp>
#include <SFML/System.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>

#include "MazeGenerator.h"
#include "MazeWindow.h"
#include "SearchBenchmark.h"
#include "SearchDriver.h"
#include "VisualizerSettings.h"

// command line overrides, applied on top of the settings file
struct CommandLine
{
    std::string configPath = "maze_settings.txt";
    bool configGiven = false;
    bool compareOnly = false;
    bool showHelp = false;

    bool hasSeed = false;
    uint32_t seed = 0;
    bool hasWidth = false;
    int width = 0;
    bool hasHeight = false;
    int height = 0;
    int fps = -1;
};

void printUsage(const char *program)
{
    std::cout << "usage: " << program
              << " [--config FILE] [--seed N] [--width W] [--height H] [--fps F] [--compare]\n"
              << "  --config FILE  key=value settings file (default maze_settings.txt)\n"
              << "  --seed N       maze seed, 0 for random\n"
              << "  --width W      maze width in cells\n"
              << "  --height H     maze height in cells\n"
              << "  --fps F        animation frames per second\n"
              << "  --compare      run all four searches on one maze, print the table and exit\n"
              << std::endl;
}

// returns false on unknown flags or bad values
bool parseCommandLine(int argc, char **argv, CommandLine &out)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool needsValue = arg == "--config" || arg == "--seed" || arg == "--width" ||
                          arg == "--height" || arg == "--fps";

        if (arg == "--compare")
        {
            out.compareOnly = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            out.showHelp = true;
            continue;
        }
        if (!needsValue)
        {
            std::cerr << "Error: unknown argument " << arg << std::endl;
            return false;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Error: " << arg << " needs a value" << std::endl;
            return false;
        }

        std::string value = argv[++i];
        try
        {
            if (arg == "--config")
            {
                out.configPath = value;
                out.configGiven = true;
            }
            else if (arg == "--seed")
            {
                out.seed = static_cast<uint32_t>(std::stoul(value));
                out.hasSeed = true;
            }
            else if (arg == "--width")
            {
                out.width = std::stoi(value);
                out.hasWidth = true;
            }
            else if (arg == "--height")
            {
                out.height = std::stoi(value);
                out.hasHeight = true;
            }
            else if (arg == "--fps")
                out.fps = std::stoi(value);
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: bad value for " << arg << ": " << value << std::endl;
            return false;
        }
    }
    return true;
}

int main(int argc, char **argv)
{
    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli))
    {
        printUsage(argv[0]);
        return 1;
    }
    if (cli.showHelp)
    {
        printUsage(argv[0]);
        return 0;
    }

    VisualizerSettings settings;

    // the default file is optional, an explicitly named one is not
    if (cli.configGiven || std::ifstream(cli.configPath).good())
    {
        if (!settings.loadFromFile(cli.configPath) && cli.configGiven)
            return 1;
    }

    if (cli.hasSeed)
        settings.seed = cli.seed;
    if (cli.hasWidth)
        settings.mazeWidth = cli.width;
    if (cli.hasHeight)
        settings.mazeHeight = cli.height;
    if (cli.fps > 0)
        settings.targetFps = cli.fps;
    settings.validateAndClamp();

    try
    {
        // a bad size is an error here, before any window is opened
        MazeGrid::checkDimensions(settings.mazeWidth, settings.mazeHeight);

        if (cli.compareOnly)
        {
            MazeGenerator generator(settings.seed);
            MazeGrid maze = generator.generate(settings.mazeWidth, settings.mazeHeight);
            std::cout << "Maze " << maze.getWidth() << "x" << maze.getHeight()
                      << " (seed " << generator.getSeed() << ")" << std::endl;
            SearchBenchmark::printComparison(SearchBenchmark::runComparison(maze), std::cout);
            return 0;
        }

        // initialize font
        sf::Font font;
        const sf::Font *hudFont = &font;
        if (!font.openFromFile("DejaVuSans.ttf") &&
            !font.openFromFile("bin/DejaVuSans.ttf") &&
            !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
        {
            std::cout << "Warning: Could not load font file, HUD text will not be displayed" << std::endl;
            hudFont = nullptr;
        }

        MazeWindow window(settings, hudFont);
        SfmlFrameClock clock;
        SearchDriver driver(settings, window, clock, window, cli.configPath);

        driver.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
