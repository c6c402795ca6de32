#pragma once
#include <SFML/Graphics.hpp>
#include <vector>
#include "FrameServices.h"
#include "UIManager.h"
#include "VisualizerSettings.h"

// the sfml window: paints frames for the driver and turns window events into driver input
class MazeWindow : public Renderer, public InputSource
{
public:
    MazeWindow(const VisualizerSettings &settings, const sf::Font *font);

    void drawFrame(const FrameView &frame) override;
    std::vector<InputEvent> pollEvents() override;

    bool isOpen() const { return window_.isOpen(); }

private:
    VisualizerSettings settings_;
    sf::RenderWindow window_;
    UIManager ui_;
    sf::VertexArray cells_;

    // per cell color after applying the overlay z-order
    void buildCellMesh(const FrameView &frame);
    void appendCell(int x, int y, const sf::Color &color);
};

// holds the loop to the target frame rate
class SfmlFrameClock : public FrameClock
{
public:
    void tick(int targetFps) override;

private:
    sf::Clock clock_;
};
