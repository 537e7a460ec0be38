#include "ui/ModalOverlay.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

constexpr float kBoxWidthRatio = 0.8f;
constexpr float kBoxPadding = 14.0f;
constexpr unsigned int kTitleSize = 18;
constexpr unsigned int kBodySize = 15;
constexpr sf::Uint8 kDimAlpha = 150;

namespace {
sf::Color AccentFor(NotificationLevel level) {
    switch (level) {
    case NotificationLevel::WARNING:
        return sf::Color(220, 160, 40);
    case NotificationLevel::ERROR:
        return sf::Color(210, 70, 70);
    case NotificationLevel::INFO:
        break;
    }
    return sf::Color(70, 120, 210);
}

bool IsPrintable(sf::Uint32 unicode) {
    return unicode >= 32 && unicode < 127;
}
} // namespace

ModalOverlay::ModalOverlay(
    sf::RenderWindow& window,
    const sf::Font& font,
    BackgroundPainter painter)
    : window_(window), font_(font), painter_(std::move(painter)) {}

sf::FloatRect ModalOverlay::layoutBox(float heightRatio) const {
    const sf::Vector2u size = window_.getSize();
    const float width = static_cast<float>(size.x) * kBoxWidthRatio;
    const float height = std::max(120.0f, static_cast<float>(size.y) * heightRatio);
    return sf::FloatRect(
        (static_cast<float>(size.x) - width) / 2.0f,
        (static_cast<float>(size.y) - height) / 2.0f,
        width,
        height);
}

void ModalOverlay::drawFrame(const sf::FloatRect& box, const sf::Color& accent) {
    window_.clear(sf::Color(30, 30, 40));
    painter_(window_);

    sf::RectangleShape dim(sf::Vector2f(
        static_cast<float>(window_.getSize().x),
        static_cast<float>(window_.getSize().y)));
    dim.setFillColor(sf::Color(0, 0, 0, kDimAlpha));
    window_.draw(dim);

    sf::RectangleShape panel(sf::Vector2f(box.width, box.height));
    panel.setPosition(box.left, box.top);
    panel.setFillColor(sf::Color(250, 250, 250));
    panel.setOutlineColor(accent);
    panel.setOutlineThickness(3.0f);
    window_.draw(panel);
}

std::string ModalOverlay::wrapText(
    const std::string& message,
    unsigned int size,
    float maxWidth) const {
    sf::Text probe("", font_, size);
    std::istringstream words(message);
    std::string word;
    std::string line;
    std::string out;
    while (words >> word) {
        const std::string candidate = line.empty() ? word : line + " " + word;
        probe.setString(candidate);
        if (!line.empty() && probe.getLocalBounds().width > maxWidth) {
            out += line + "\n";
            line = word;
        } else {
            line = candidate;
        }
    }
    out += line;
    return out;
}

std::optional<std::string> ModalOverlay::askPath(
    const std::string& title,
    const std::string& initial) {
    std::string input = initial;
    const sf::FloatRect box = layoutBox(0.4f);
    const sf::Color accent(70, 120, 210);

    sf::Text titleText(title, font_, kTitleSize);
    titleText.setStyle(sf::Text::Bold);
    titleText.setFillColor(sf::Color(30, 30, 40));
    titleText.setPosition(box.left + kBoxPadding, box.top + kBoxPadding);

    sf::RectangleShape field(sf::Vector2f(box.width - 2.0f * kBoxPadding, kBodySize * 2.0f));
    field.setPosition(box.left + kBoxPadding, box.top + box.height / 2.0f - kBodySize);
    field.setFillColor(sf::Color::White);
    field.setOutlineColor(sf::Color(150, 150, 160));
    field.setOutlineThickness(1.0f);

    sf::Text inputText("", font_, kBodySize);
    inputText.setFillColor(sf::Color(20, 20, 20));
    inputText.setPosition(field.getPosition().x + 6.0f, field.getPosition().y + kBodySize * 0.4f);

    sf::Text hint("Enter = save    Esc = cancel", font_, kBodySize - 3);
    hint.setFillColor(sf::Color(110, 110, 120));
    hint.setPosition(box.left + kBoxPadding, box.top + box.height - kBoxPadding - kBodySize);

    while (window_.isOpen()) {
        sf::Event event;
        while (window_.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window_.close();
                return std::nullopt;
            }
            if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) {
                    return std::nullopt;
                }
                if (event.key.code == sf::Keyboard::Enter) {
                    return input;
                }
                if (event.key.code == sf::Keyboard::Backspace && !input.empty()) {
                    input.pop_back();
                }
            }
            if (event.type == sf::Event::TextEntered && IsPrintable(event.text.unicode)) {
                input.push_back(static_cast<char>(event.text.unicode));
            }
        }

        // Show the tail of long paths.
        std::string shown = input + "_";
        inputText.setString(shown);
        while (shown.size() > 1 && inputText.getLocalBounds().width > field.getSize().x - 12.0f) {
            shown.erase(0, 1);
            inputText.setString(shown);
        }

        drawFrame(box, accent);
        window_.draw(titleText);
        window_.draw(field);
        window_.draw(inputText);
        window_.draw(hint);
        window_.display();
    }
    return std::nullopt;
}

void ModalOverlay::showNotification(const Notification& notification) {
    const sf::FloatRect box = layoutBox(0.45f);
    const sf::Color accent = AccentFor(notification.level);

    sf::Text titleText(notification.title, font_, kTitleSize);
    titleText.setStyle(sf::Text::Bold);
    titleText.setFillColor(accent);
    titleText.setPosition(box.left + kBoxPadding, box.top + kBoxPadding);

    sf::Text body(
        wrapText(notification.message, kBodySize, box.width - 2.0f * kBoxPadding),
        font_,
        kBodySize);
    body.setFillColor(sf::Color(30, 30, 40));
    body.setPosition(box.left + kBoxPadding, box.top + kBoxPadding + kTitleSize * 2.0f);

    const sf::Vector2f okSize(80.0f, 30.0f);
    sf::RectangleShape okButton(okSize);
    okButton.setPosition(
        box.left + (box.width - okSize.x) / 2.0f,
        box.top + box.height - kBoxPadding - okSize.y);
    okButton.setFillColor(accent);
    sf::Text okText("OK", font_, kBodySize);
    okText.setFillColor(sf::Color::White);
    const sf::FloatRect okBounds = okText.getLocalBounds();
    okText.setPosition(
        okButton.getPosition().x + (okSize.x - okBounds.width) / 2.0f - okBounds.left,
        okButton.getPosition().y + (okSize.y - okBounds.height) / 2.0f - okBounds.top);

    while (window_.isOpen()) {
        sf::Event event;
        while (window_.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window_.close();
                return;
            }
            if (event.type == sf::Event::KeyPressed &&
                (event.key.code == sf::Keyboard::Enter ||
                 event.key.code == sf::Keyboard::Escape ||
                 event.key.code == sf::Keyboard::Space)) {
                return;
            }
            if (event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window_.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                if (okButton.getGlobalBounds().contains(pos)) {
                    return;
                }
            }
        }

        drawFrame(box, accent);
        window_.draw(titleText);
        window_.draw(body);
        window_.draw(okButton);
        window_.draw(okText);
        window_.display();
    }
}
