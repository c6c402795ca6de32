#include "MazeWindow.h"
#include <unordered_set>

namespace {

sf::Color toSfColor(const CellColor &color)
{
    return sf::Color(color.r, color.g, color.b);
}

}

MazeWindow::MazeWindow(const VisualizerSettings &settings, const sf::Font *font)
    : settings_(settings),
      window_(sf::VideoMode({static_cast<unsigned int>(settings.mazeWidth * settings.cellSize),
                             static_cast<unsigned int>(settings.mazeHeight * settings.cellSize)}),
              "Maze Pathfinder Visualizer"),
      ui_(font),
      cells_(sf::PrimitiveType::Triangles)
{
}

void MazeWindow::drawFrame(const FrameView &frame)
{
    if (!window_.isOpen())
        return;

    buildCellMesh(frame);

    window_.clear(sf::Color::Black);
    window_.draw(cells_);
    ui_.drawHUD(window_, frame.hud);
    window_.display();
}

std::vector<InputEvent> MazeWindow::pollEvents()
{
    std::vector<InputEvent> events;

    // handle events
    while (const std::optional event = window_.pollEvent())
    {
        if (event->is<sf::Event::Closed>())
        {
            window_.close();
            events.push_back(InputEvent::quit());
        }

        if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
        {
            // help overlay is purely cosmetic, handled here
            if (keyPressed->code == sf::Keyboard::Key::H)
            {
                ui_.toggleHelp();
                continue;
            }

            if (auto translated = ui_.translateKey(*keyPressed))
                events.push_back(*translated);
        }
    }

    return events;
}

void MazeWindow::buildCellMesh(const FrameView &frame)
{
    const MazeGrid &grid = frame.grid;
    std::unordered_set<GridCell, GridCellHash> visited(frame.visited.begin(), frame.visited.end());
    std::unordered_set<GridCell, GridCellHash> path(frame.path.begin(), frame.path.end());

    const sf::Color openColor = toSfColor(settings_.colorOpen);
    const sf::Color wallColor = toSfColor(settings_.colorWall);
    const sf::Color visitedColor = toSfColor(frame.highlight);
    const sf::Color pathColor = toSfColor(settings_.colorPath);
    const sf::Color startColor = toSfColor(settings_.colorStart);
    const sf::Color endColor = toSfColor(settings_.colorEnd);

    cells_.clear();
    for (int y = 0; y < grid.getHeight(); y++)
    {
        for (int x = 0; x < grid.getWidth(); x++)
        {
            GridCell cell{x, y};

            // base, then visited, then path, start/end win at their own coordinates
            sf::Color color = grid.isOpen(cell) ? openColor : wallColor;
            if (visited.count(cell))
                color = visitedColor;
            if (path.count(cell))
                color = pathColor;
            if (cell == frame.start)
                color = startColor;
            if (cell == frame.end)
                color = endColor;

            appendCell(x, y, color);
        }
    }
}

void MazeWindow::appendCell(int x, int y, const sf::Color &color)
{
    const float size = static_cast<float>(settings_.cellSize);
    const sf::Vector2f topLeft(x * size, y * size);
    const sf::Vector2f topRight(topLeft.x + size, topLeft.y);
    const sf::Vector2f bottomLeft(topLeft.x, topLeft.y + size);
    const sf::Vector2f bottomRight(topLeft.x + size, topLeft.y + size);

    // two triangles per cell (sfml 3 dropped quads)
    cells_.append(sf::Vertex{topLeft, color});
    cells_.append(sf::Vertex{topRight, color});
    cells_.append(sf::Vertex{bottomRight, color});
    cells_.append(sf::Vertex{topLeft, color});
    cells_.append(sf::Vertex{bottomRight, color});
    cells_.append(sf::Vertex{bottomLeft, color});
}

void SfmlFrameClock::tick(int targetFps)
{
    const sf::Time frame = sf::seconds(1.0f / static_cast<float>(targetFps > 0 ? targetFps : 1));
    const sf::Time elapsed = clock_.getElapsedTime();
    if (elapsed < frame)
        sf::sleep(frame - elapsed);
    clock_.restart();
}
