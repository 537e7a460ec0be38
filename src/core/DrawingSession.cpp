#include "core/DrawingSession.hpp"

#include "core/Exporter.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

namespace {
Notification Info(std::string title, std::string message) {
    return Notification{NotificationLevel::INFO, std::move(title), std::move(message), true};
}

Notification Warning(std::string title, std::string message) {
    return Notification{NotificationLevel::WARNING, std::move(title), std::move(message), true};
}

Notification Error(std::string title, std::string message) {
    return Notification{NotificationLevel::ERROR, std::move(title), std::move(message), true};
}

Notification Cancelled(const std::string& what) {
    return Notification{NotificationLevel::INFO, what, what + " cancelled.", false};
}

// A name typed without an extension gets the one of the default name.
std::string WithDefaultExtension(const std::string& path, const std::string& defaultName) {
    std::filesystem::path chosen(path);
    if (chosen.has_extension()) {
        return path;
    }
    chosen += std::filesystem::path(defaultName).extension();
    return chosen.string();
}
} // namespace

DrawingSession::DrawingSession(const AppConfig& config)
    : config_(config),
      grid_(config.gridSize),
      interaction_(grid_, config.cellSize) {}

CellUpdate DrawingSession::HandlePointer(const PointerEvent& event) {
    return interaction_.Handle(event);
}

void DrawingSession::SetLabel(ShapeLabel label) {
    label_ = label;
}

void DrawingSession::clearCanvas() {
    grid_.Clear();
    label_ = ShapeLabel::CIRCLE;
}

Sample DrawingSession::currentSample() const {
    return MakeSample(grid_, config_.labeled, label_);
}

Notification DrawingSession::Commit() {
    if (grid_.IsEmpty()) {
        std::cout << "[commit] rejected: empty drawing\n";
        return Warning("Empty", "The drawing is empty. Draw something before pressing Next.");
    }

    store_.append(currentSample());
    grid_.print();
    clearCanvas();
    std::cout << "[commit] sample #" << store_.size() << " stored\n";
    return Info("Next", "Sample #" + std::to_string(store_.size()) +
                            " stored. Total samples: " + std::to_string(store_.size()));
}

Notification DrawingSession::Reset() {
    clearCanvas();
    std::cout << "[reset] canvas cleared\n";
    Notification n = Info("Reset", "Canvas cleared.");
    n.visible = config_.announceReset;
    return n;
}

Notification DrawingSession::ExportTable(const PathChooser& choosePath) {
    const bool hasPending = !grid_.IsEmpty();
    std::vector<Sample> rows(store_.samples());
    if (hasPending) {
        rows.push_back(currentSample());
    }
    if (rows.empty()) {
        std::cout << "[export] nothing to save\n";
        return Warning("Nothing to save", "No samples stored.");
    }

    std::optional<std::string> path;
    try {
        path = choosePath(config_.csvDefaultName);
    } catch (const std::exception& e) {
        std::cerr << "[export] path prompt failed: " << e.what() << "\n";
        return Error("Error", std::string("Could not save: ") + e.what());
    }
    if (!path || path->empty()) {
        std::cout << "[export] cancelled\n";
        return Cancelled("Save CSV");
    }
    path = WithDefaultExtension(*path, config_.csvDefaultName);

    try {
        Exporter::writeCsv(rows, *path);
    } catch (const std::exception& e) {
        std::cerr << "[export] " << e.what() << "\n";
        return Error("Error", std::string("Could not save: ") + e.what());
    }

    if (hasPending) {
        store_.append(rows.back());
        clearCanvas();
    }
    if (config_.clearAfterExport) {
        store_.clear();
    }
    std::cout << "[export] wrote " << rows.size() << " samples to " << *path << "\n";
    return Info("Saved", std::to_string(rows.size()) + " samples saved to " + *path);
}

Notification DrawingSession::ExportImage(const PathChooser& choosePath) {
    if (config_.rejectEmptyImage && grid_.IsEmpty()) {
        std::cout << "[image] rejected: empty drawing\n";
        return Warning("Empty", "The drawing is empty.");
    }

    std::optional<std::string> path;
    try {
        path = choosePath(config_.imageDefaultName);
    } catch (const std::exception& e) {
        std::cerr << "[image] path prompt failed: " << e.what() << "\n";
        return Error("Error", std::string("Could not save: ") + e.what());
    }
    if (!path || path->empty()) {
        std::cout << "[image] cancelled\n";
        return Cancelled("Save PNG");
    }
    path = WithDefaultExtension(*path, config_.imageDefaultName);

    try {
        const Raster raster = Exporter::rasterize(grid_, config_.cellSize, config_.polarity);
        Exporter::writeImage(raster, *path);
    } catch (const std::exception& e) {
        std::cerr << "[image] " << e.what() << "\n";
        return Error("Error", std::string("Could not save: ") + e.what());
    }

    std::cout << "[image] wrote " << *path << "\n";
    return Info("Saved", "Image saved to " + *path);
}
