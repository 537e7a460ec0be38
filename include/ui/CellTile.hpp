#pragma once

#include <SFML/Graphics.hpp>

class CellTile {
public:
    CellTile(const sf::Font* font, int index, float size);

    void setPosition(float x, float y);
    void setFillColor(const sf::Color& color);
    void setIndexColor(const sf::Color& color);

    int getIndex() const;

    void draw(sf::RenderTarget& target) const;

private:
    sf::RectangleShape rect_;
    sf::Text indexText_;
    bool hasText_ = false;
    int index_ = 0;
};
