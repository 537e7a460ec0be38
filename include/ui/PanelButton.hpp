#pragma once

#include <SFML/Graphics.hpp>
#include <string>

// Clickable panel entry. A "selected" button is drawn highlighted (radio buttons).
class PanelButton {
public:
    PanelButton(const sf::Font& font, const std::string& label, const sf::FloatRect& bounds);

    bool contains(const sf::Vector2f& pos) const;
    void setSelected(bool selected);
    void setHovered(bool hovered);

    void draw(sf::RenderTarget& target) const;

private:
    void updateColors();

    sf::RectangleShape box_;
    sf::Text text_;
    sf::FloatRect bounds_;
    bool selected_ = false;
    bool hovered_ = false;
};
