#pragma once

#include <functional>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/Grid.hpp"
#include "core/Interaction.hpp"
#include "core/SampleStore.hpp"

enum class NotificationLevel { INFO, WARNING, ERROR };

struct Notification {
    NotificationLevel level{NotificationLevel::INFO};
    std::string title;
    std::string message;
    bool visible{true}; // false for outcomes that are only logged (cancel, silent reset)
};

/// Asks for a destination path. Returns std::nullopt when the user cancels.
using PathChooser = std::function<std::optional<std::string>(const std::string& defaultName)>;

/**
 * One drawing session: the current grid, its label and the accumulated samples.
 *
 * Every command runs to completion and reports its outcome as a Notification.
 * Commands never throw; exporter failures are converted at this boundary and
 * leave the session state untouched.
 */
class DrawingSession {
public:
    explicit DrawingSession(const AppConfig& config);
    DrawingSession(const DrawingSession&) = delete;
    DrawingSession& operator=(const DrawingSession&) = delete;

    CellUpdate HandlePointer(const PointerEvent& event);

    /// Appends the current drawing to the store and clears the canvas.
    Notification Commit();
    /// Clears the canvas and the label. The store is not touched.
    Notification Reset();
    /// Writes every stored sample, plus the unsaved drawing, as CSV rows.
    Notification ExportTable(const PathChooser& choosePath);
    /// Writes the current drawing only, as an image.
    Notification ExportImage(const PathChooser& choosePath);

    const Grid& grid() const { return grid_; }
    const SampleStore& store() const { return store_; }
    ShapeLabel label() const { return label_; }
    void SetLabel(ShapeLabel label);

private:
    void clearCanvas();
    Sample currentSample() const;

    AppConfig config_;
    Grid grid_;
    InteractionHandler interaction_;
    SampleStore store_;
    ShapeLabel label_ = ShapeLabel::CIRCLE;
};
