#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/DrawingSession.hpp"
#include "ui/CellTile.hpp"
#include "ui/PanelButton.hpp"

class ModalOverlay;

class GridDrawerUI {
public:
    explicit GridDrawerUI(const AppConfig& config);

    int run();

private:
    enum class Command { NEXT, SAVE_CSV, SAVE_PNG, RESET, EXIT, LABEL_CIRCLE, LABEL_CROSS };

    struct Button {
        PanelButton widget;
        Command command;

        Button(const sf::Font& font, const std::string& label, const sf::FloatRect& bounds, Command cmd);
    };

    bool loadFont();
    void buildLayout();
    void addButton(const std::string& label, Command command, float& y);
    void applyCellUpdate(const CellUpdate& update);
    void updateTileColors();
    void updateLabelButtons();
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateHover(const sf::RenderWindow& window);
    void handlePointer(const sf::Event& event, sf::RenderWindow& window);
    void execute(Command command, sf::RenderWindow& window, ModalOverlay& overlay);
    void report(const Notification& notification, ModalOverlay& overlay) const;
    int pickButton(const sf::Vector2f& pos) const;
    void drawScene(sf::RenderTarget& target) const;

    AppConfig config_;
    DrawingSession session_;

    sf::Font font_;
    sf::Text labelHeader_;
    sf::Text statusText_;
    sf::Vector2u windowSize_{0, 0};
    float canvasSize_ = 0.0f;
    bool stroking_ = false;
    PointerButton strokeButton_ = PointerButton::PRIMARY;

    std::vector<CellTile> tiles_;
    std::vector<Button> buttons_;
    std::string error_;
};
