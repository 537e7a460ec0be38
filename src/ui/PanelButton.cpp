#include "ui/PanelButton.hpp"

#include <algorithm>

PanelButton::PanelButton(
    const sf::Font& font,
    const std::string& label,
    const sf::FloatRect& bounds)
    : bounds_(bounds) {
    box_.setPosition(bounds.left, bounds.top);
    box_.setSize(sf::Vector2f(bounds.width, bounds.height));
    box_.setOutlineThickness(1.0f);

    text_.setFont(font);
    text_.setString(label);
    text_.setCharacterSize(static_cast<unsigned int>(std::max(12.0f, bounds.height * 0.42f)));
    const sf::FloatRect textBounds = text_.getLocalBounds();
    text_.setPosition(
        bounds.left + (bounds.width - textBounds.width) / 2.0f - textBounds.left,
        bounds.top + (bounds.height - textBounds.height) / 2.0f - textBounds.top);
    updateColors();
}

bool PanelButton::contains(const sf::Vector2f& pos) const {
    return bounds_.contains(pos);
}

void PanelButton::setSelected(bool selected) {
    selected_ = selected;
    updateColors();
}

void PanelButton::setHovered(bool hovered) {
    if (hovered_ == hovered) {
        return;
    }
    hovered_ = hovered;
    updateColors();
}

void PanelButton::updateColors() {
    if (selected_) {
        box_.setFillColor(sf::Color(70, 120, 210));
        box_.setOutlineColor(sf::Color(40, 70, 140));
        text_.setFillColor(sf::Color::White);
        return;
    }
    box_.setFillColor(hovered_ ? sf::Color(225, 225, 235) : sf::Color(240, 240, 240));
    box_.setOutlineColor(sf::Color(150, 150, 160));
    text_.setFillColor(sf::Color(30, 30, 40));
}

void PanelButton::draw(sf::RenderTarget& target) const {
    target.draw(box_);
    target.draw(text_);
}
