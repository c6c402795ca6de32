#include "UIManager.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

UIManager::UIManager(const sf::Font *font) : font_(font) {}

std::optional<InputEvent> UIManager::translateKey(const sf::Event::KeyPressed &keyEvent) const
{
    switch (keyEvent.code)
    {
    case sf::Keyboard::Key::Escape:
        return InputEvent::quit();
    case sf::Keyboard::Key::Num1:
        return InputEvent::select(0);
    case sf::Keyboard::Key::Num2:
        return InputEvent::select(1);
    case sf::Keyboard::Key::Num3:
        return InputEvent::select(2);
    case sf::Keyboard::Key::Num4:
        return InputEvent::select(3);
    case sf::Keyboard::Key::R:
        return InputEvent::regenerate();
    case sf::Keyboard::Key::Space:
    case sf::Keyboard::Key::Enter:
        return InputEvent::runSearch();
    case sf::Keyboard::Key::B:
        return InputEvent::printComparison();
    case sf::Keyboard::Key::S:
        return InputEvent::saveSettings();
    default:
        return std::nullopt;
    }
}

void UIManager::drawHUD(sf::RenderWindow &window, const HudState &hud)
{
    if (!font_)
        return;

    std::vector<std::string> lines;
    lines.push_back(std::string("Algorithm: ") + algorithmName(hud.algorithm) + "  (press 1-4 to change)");
    if (showHelp_)
    {
        lines.push_back("Controls: [Space] run  [R] regenerate maze  [B] compare  [S] save  [H] hide help  [Esc] quit");
    }
    lines.push_back(hud.status == DriverStatus::Searching ? "Status: Searching..." : "Status: Idle");

    bool noPath = false;
    if (hud.lastRun)
    {
        const RunStats &run = *hud.lastRun;
        if (run.found)
        {
            std::ostringstream oss;
            oss << "Last path length: " << run.pathLength;
            lines.push_back(oss.str());

            oss.str("");
            oss << "Cells visited: " << run.cellsVisited;
            lines.push_back(oss.str());

            oss.str("");
            oss << std::fixed << std::setprecision(4) << "Time taken: " << run.elapsedSeconds << " seconds";
            lines.push_back(oss.str());
        }
        else
        {
            noPath = true;
            lines.push_back("No path found");
        }
    }

    // one text per line so the "no path" line can take its own color
    const unsigned int characterSize = 14;
    sf::Vector2f pos(10.0f, 8.0f);
    std::vector<sf::Text> texts;
    float maxWidth = 0.0f;
    float totalHeight = 0.0f;

    for (size_t i = 0; i < lines.size(); ++i)
    {
        sf::Text text(*font_, lines[i], characterSize);
        bool warning = noPath && i + 1 == lines.size();
        text.setFillColor(warning ? hudWarningColor_ : hudTextColor_);
        text.setPosition({pos.x, pos.y + totalHeight});

        sf::FloatRect bounds = text.getLocalBounds();
        maxWidth = std::max(maxWidth, bounds.size.x);
        totalHeight += characterSize + 4.0f;
        texts.push_back(text);
    }

    drawBackground(window, sf::FloatRect({4, 4}, {maxWidth + 12, totalHeight + 8}));
    for (const auto &text : texts)
    {
        window.draw(text);
    }
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(sf::Vector2f(bounds.size.x, bounds.size.y));
    background.setPosition({bounds.position.x, bounds.position.y});
    background.setFillColor(hudBackgroundColor_);
    background.setOutlineThickness(1.0f);
    background.setOutlineColor(sf::Color(0, 0, 0));
    window.draw(background);
}
