#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include "FrameServices.h"

class UIManager
{
public:
    // font may be null when no font file could be loaded, the hud is skipped then
    explicit UIManager(const sf::Font *font);

    // event handling: keyboard shortcuts -> driver events
    std::optional<InputEvent> translateKey(const sf::Event::KeyPressed &keyEvent) const;

    // rendering
    void drawHUD(sf::RenderWindow &window, const HudState &hud);

    // ui state
    bool isHelpVisible() const { return showHelp_; }
    void toggleHelp() { showHelp_ = !showHelp_; }

private:
    const sf::Font *font_;
    bool showHelp_ = true;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(245, 245, 245, 230);
    sf::Color hudTextColor_ = sf::Color::Black;
    sf::Color hudWarningColor_ = sf::Color(180, 0, 0);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
};
