#include "ui/CellTile.hpp"

#include <string>

CellTile::CellTile(const sf::Font* font, int index, float size) : index_(index) {
    rect_.setSize(sf::Vector2f(size, size));
    rect_.setOutlineThickness(-1.0f); // keep the outline inside the cell
    rect_.setOutlineColor(sf::Color(128, 128, 128));
    rect_.setFillColor(sf::Color::White);

    if (font != nullptr) {
        indexText_.setFont(*font);
        indexText_.setString(std::to_string(index));
        indexText_.setCharacterSize(static_cast<unsigned int>(size * 0.3f));
        indexText_.setStyle(sf::Text::Bold);
        indexText_.setFillColor(sf::Color(179, 179, 179));
        sf::FloatRect bounds = indexText_.getLocalBounds();
        indexText_.setOrigin(bounds.left + bounds.width / 2.0f, bounds.top + bounds.height / 2.0f);
        hasText_ = true;
    }
}

void CellTile::setPosition(float x, float y) {
    rect_.setPosition(x, y);
    const sf::Vector2f size = rect_.getSize();
    indexText_.setPosition(x + size.x / 2.0f, y + size.y / 2.0f);
}

void CellTile::setFillColor(const sf::Color& color) {
    rect_.setFillColor(color);
}

void CellTile::setIndexColor(const sf::Color& color) {
    indexText_.setFillColor(color);
}

int CellTile::getIndex() const {
    return index_;
}

void CellTile::draw(sf::RenderTarget& target) const {
    target.draw(rect_);
    if (hasText_) {
        target.draw(indexText_);
    }
}
