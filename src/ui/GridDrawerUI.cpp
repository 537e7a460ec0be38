#include "ui/GridDrawerUI.hpp"

#include "ui/ModalOverlay.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>

constexpr float kPanelWidth = 170.0f;
constexpr float kPanelMargin = 12.0f;
constexpr float kButtonHeight = 34.0f;
constexpr float kButtonGap = 8.0f;
constexpr unsigned int kPanelTextSize = 15;

namespace {
const sf::Color kPaintedColor = sf::Color::Black;
const sf::Color kUnpaintedColor = sf::Color::White;
const sf::Color kIndexOnPainted(90, 90, 90);
const sf::Color kIndexOnUnpainted(179, 179, 179);
} // namespace

GridDrawerUI::Button::Button(
    const sf::Font& font,
    const std::string& label,
    const sf::FloatRect& bounds,
    Command cmd)
    : widget(font, label, bounds), command(cmd) {}

GridDrawerUI::GridDrawerUI(const AppConfig& config)
    : config_(config), session_(config) {
    if (!loadFont()) {
        return;
    }
    buildLayout();
    updateTileColors();
    updateLabelButtons();
}

bool GridDrawerUI::loadFont() {
    std::vector<std::string> candidates;
    if (!config_.fontPath.empty()) {
        candidates.push_back(config_.fontPath);
    }
    candidates.push_back("../assets/DejaVuSans.ttf");
    candidates.push_back("assets/DejaVuSans.ttf");
    candidates.push_back("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    candidates.push_back("/usr/share/fonts/dejavu/DejaVuSans.ttf");

    for (const auto& path : candidates) {
        if (font_.loadFromFile(path)) {
            return true;
        }
    }
    error_ = "Failed to load font (tried --font, ../assets and system DejaVuSans).";
    return false;
}

void GridDrawerUI::addButton(const std::string& label, Command command, float& y) {
    const sf::FloatRect bounds(
        canvasSize_ + kPanelMargin, y, kPanelWidth - 2.0f * kPanelMargin, kButtonHeight);
    buttons_.emplace_back(font_, label, bounds, command);
    y += kButtonHeight + kButtonGap;
}

void GridDrawerUI::buildLayout() {
    const int n = config_.gridSize;
    const float cell = static_cast<float>(config_.cellSize);
    canvasSize_ = cell * static_cast<float>(n);

    tiles_.clear();
    tiles_.reserve(static_cast<std::size_t>(n * n));
    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            int idx = row * n + col;
            tiles_.emplace_back(&font_, idx, cell);
            tiles_.back().setPosition(col * cell, row * cell);
        }
    }

    buttons_.clear();
    float y = kPanelMargin;
    if (config_.labeled) {
        labelHeader_.setFont(font_);
        labelHeader_.setString("Shape label:");
        labelHeader_.setCharacterSize(kPanelTextSize);
        labelHeader_.setFillColor(sf::Color(30, 30, 40));
        labelHeader_.setPosition(canvasSize_ + kPanelMargin, y);
        y += kPanelTextSize + kButtonGap * 1.5f;
        addButton("Circle (0)", Command::LABEL_CIRCLE, y);
        addButton("Cross (1)", Command::LABEL_CROSS, y);
        y += kButtonGap;
    }
    addButton("Next", Command::NEXT, y);
    addButton("Save CSV", Command::SAVE_CSV, y);
    addButton("Save PNG", Command::SAVE_PNG, y);
    addButton("Reset", Command::RESET, y);
    addButton("Exit", Command::EXIT, y);

    statusText_.setFont(font_);
    statusText_.setCharacterSize(kPanelTextSize - 2);
    statusText_.setFillColor(sf::Color(200, 200, 210));
    statusText_.setPosition(canvasSize_ + kPanelMargin, y);
    y += kPanelTextSize + kPanelMargin;

    windowSize_ = sf::Vector2u(
        static_cast<unsigned int>(std::ceil(canvasSize_ + kPanelWidth)),
        static_cast<unsigned int>(std::ceil(std::max(canvasSize_, y))));
}

void GridDrawerUI::applyCellUpdate(const CellUpdate& update) {
    if (!update.changed) {
        return;
    }
    CellTile& tile = tiles_[static_cast<std::size_t>(update.row * config_.gridSize + update.col)];
    tile.setFillColor(update.value ? kPaintedColor : kUnpaintedColor);
    tile.setIndexColor(update.value ? kIndexOnPainted : kIndexOnUnpainted);
}

void GridDrawerUI::updateTileColors() {
    const Grid& grid = session_.grid();
    for (auto& tile : tiles_) {
        int row = tile.getIndex() / grid.N;
        int col = tile.getIndex() % grid.N;
        bool painted = grid.cells[row][col] != 0;
        tile.setFillColor(painted ? kPaintedColor : kUnpaintedColor);
        tile.setIndexColor(painted ? kIndexOnPainted : kIndexOnUnpainted);
    }
    statusText_.setString("Samples: " + std::to_string(session_.store().size()));
}

void GridDrawerUI::updateLabelButtons() {
    for (auto& button : buttons_) {
        if (button.command == Command::LABEL_CIRCLE) {
            button.widget.setSelected(session_.label() == ShapeLabel::CIRCLE);
        } else if (button.command == Command::LABEL_CROSS) {
            button.widget.setSelected(session_.label() == ShapeLabel::CROSS);
        }
    }
}

void GridDrawerUI::updateWindowTitle(sf::RenderWindow& window) const {
    const int n = config_.gridSize;
    window.setTitle(
        config_.title + " - " + std::to_string(n) + "x" + std::to_string(n) +
        " - samples: " + std::to_string(session_.store().size()));
}

void GridDrawerUI::updateHover(const sf::RenderWindow& window) {
    sf::Vector2i pixelPos = sf::Mouse::getPosition(window);
    sf::Vector2f pos = window.mapPixelToCoords(pixelPos);
    for (auto& button : buttons_) {
        button.widget.setHovered(button.widget.contains(pos));
    }
}

int GridDrawerUI::pickButton(const sf::Vector2f& pos) const {
    for (std::size_t i = 0; i < buttons_.size(); ++i) {
        if (buttons_[i].widget.contains(pos)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void GridDrawerUI::handlePointer(const sf::Event& event, sf::RenderWindow& window) {
    PointerEvent pointer;
    if (event.type == sf::Event::MouseButtonPressed) {
        sf::Vector2f pos = window.mapPixelToCoords(
            sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
        if (pos.x >= canvasSize_ || pos.y >= canvasSize_) {
            return;
        }
        if (event.mouseButton.button == sf::Mouse::Left) {
            pointer.button = PointerButton::PRIMARY;
        } else if (event.mouseButton.button == sf::Mouse::Right) {
            pointer.button = PointerButton::SECONDARY;
        } else {
            return;
        }
        pointer.action = PointerAction::PRESS;
        pointer.x = static_cast<int>(std::floor(pos.x));
        pointer.y = static_cast<int>(std::floor(pos.y));
        stroking_ = true;
        strokeButton_ = pointer.button;
    } else if (event.type == sf::Event::MouseMoved) {
        if (!stroking_) {
            return;
        }
        sf::Vector2f pos = window.mapPixelToCoords(
            sf::Vector2i(event.mouseMove.x, event.mouseMove.y));
        pointer.button = strokeButton_;
        pointer.action = PointerAction::DRAG;
        pointer.x = static_cast<int>(std::floor(pos.x));
        pointer.y = static_cast<int>(std::floor(pos.y));
    } else if (event.type == sf::Event::MouseButtonReleased) {
        if (!stroking_) {
            return;
        }
        stroking_ = false;
        pointer.button = strokeButton_;
        pointer.action = PointerAction::RELEASE;
    } else {
        return;
    }

    applyCellUpdate(session_.HandlePointer(pointer));
}

void GridDrawerUI::report(const Notification& notification, ModalOverlay& overlay) const {
    if (!notification.visible) {
        return;
    }
    overlay.showNotification(notification);
}

void GridDrawerUI::execute(Command command, sf::RenderWindow& window, ModalOverlay& overlay) {
    // Any stroke in progress ends when a command runs.
    stroking_ = false;

    auto choosePath = [&overlay](const std::string& title) {
        return [&overlay, title](const std::string& defaultName) {
            return overlay.askPath(title, defaultName);
        };
    };

    switch (command) {
    case Command::NEXT:
        report(session_.Commit(), overlay);
        break;
    case Command::SAVE_CSV:
        report(session_.ExportTable(choosePath("Save all drawings to...")), overlay);
        break;
    case Command::SAVE_PNG:
        report(session_.ExportImage(choosePath("Save current image to...")), overlay);
        break;
    case Command::RESET:
        report(session_.Reset(), overlay);
        break;
    case Command::EXIT:
        window.close();
        return;
    case Command::LABEL_CIRCLE:
        session_.SetLabel(ShapeLabel::CIRCLE);
        break;
    case Command::LABEL_CROSS:
        session_.SetLabel(ShapeLabel::CROSS);
        break;
    }

    updateTileColors();
    updateLabelButtons();
    updateWindowTitle(window);
}

void GridDrawerUI::drawScene(sf::RenderTarget& target) const {
    for (const auto& tile : tiles_) {
        tile.draw(target);
    }
    if (config_.labeled) {
        target.draw(labelHeader_);
    }
    for (const auto& button : buttons_) {
        button.widget.draw(target);
    }
    target.draw(statusText_);
}

int GridDrawerUI::run() {
    if (!error_.empty()) {
        std::cerr << error_ << "\n";
        return 1;
    }
    if (windowSize_.x == 0 || windowSize_.y == 0) {
        std::cerr << "Invalid window size.\n";
        return 1;
    }

    sf::RenderWindow window(
        sf::VideoMode(windowSize_.x, windowSize_.y),
        config_.title,
        sf::Style::Titlebar | sf::Style::Close);
    window.setFramerateLimit(60);
    updateWindowTitle(window);

    ModalOverlay overlay(window, font_, [this](sf::RenderTarget& target) { drawScene(target); });

    std::cout << "[session] " << config_.variant << " variant, " << config_.gridSize << "x"
              << config_.gridSize << " cells of " << config_.cellSize << "px"
              << (config_.labeled ? ", labeled" : "") << "\n";

    while (window.isOpen()) {
        sf::Event event;
        while (window.isOpen() && window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                execute(Command::EXIT, window, overlay);
                break;
            }
            if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) {
                    execute(Command::EXIT, window, overlay);
                    break;
                }
                if (event.key.code == sf::Keyboard::Enter) {
                    execute(Command::NEXT, window, overlay);
                }
                continue;
            }
            // Letter shortcuts come from TextEntered so that the same keystroke
            // is not delivered again to a path prompt opened by it.
            if (event.type == sf::Event::TextEntered) {
                switch (event.text.unicode) {
                case 'n': case 'N':
                    execute(Command::NEXT, window, overlay);
                    break;
                case 's': case 'S':
                    execute(Command::SAVE_CSV, window, overlay);
                    break;
                case 'p': case 'P':
                    execute(Command::SAVE_PNG, window, overlay);
                    break;
                case 'r': case 'R':
                    execute(Command::RESET, window, overlay);
                    break;
                case '0':
                    if (config_.labeled) execute(Command::LABEL_CIRCLE, window, overlay);
                    break;
                case '1':
                    if (config_.labeled) execute(Command::LABEL_CROSS, window, overlay);
                    break;
                default:
                    break;
                }
                continue;
            }
            if (event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                int buttonIdx = pickButton(pos);
                if (buttonIdx >= 0) {
                    execute(buttons_[static_cast<std::size_t>(buttonIdx)].command, window, overlay);
                    continue;
                }
            }
            handlePointer(event, window);
        }
        if (!window.isOpen()) {
            break;
        }

        updateHover(window);

        window.clear(sf::Color(30, 30, 40));
        drawScene(window);
        window.display();
    }
    return 0;
}
