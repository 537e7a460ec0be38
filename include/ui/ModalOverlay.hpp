#pragma once

#include <SFML/Graphics.hpp>
#include <functional>
#include <optional>
#include <string>

#include "core/DrawingSession.hpp"

/**
 * Blocking dialogs drawn over the current frame.
 *
 * Each call runs its own event loop on the window and returns once the user
 * answers, so the session behind it stays inert meanwhile.
 */
class ModalOverlay {
public:
    using BackgroundPainter = std::function<void(sf::RenderTarget&)>;

    ModalOverlay(sf::RenderWindow& window, const sf::Font& font, BackgroundPainter painter);

    /// Text prompt for a file path. Enter confirms, Escape cancels.
    std::optional<std::string> askPath(const std::string& title, const std::string& initial);

    /// Shows the message until OK, Enter, Space or Escape.
    void showNotification(const Notification& notification);

private:
    sf::FloatRect layoutBox(float heightRatio) const;
    void drawFrame(const sf::FloatRect& box, const sf::Color& accent);
    std::string wrapText(const std::string& message, unsigned int size, float maxWidth) const;

    sf::RenderWindow& window_;
    const sf::Font& font_;
    BackgroundPainter painter_;
};
