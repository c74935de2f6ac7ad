#pragma once

// ============================================================================
// PointerEvent - Unified pointer sample
// ============================================================================
// Mouse, touch and pen input all arrive as one value type in screen space.
// InkDocument maps them to world space and routes them to the capture
// engine per pointerId.
// ============================================================================

#include <QPointF>
#include <optional>

class QMouseEvent;
class QTabletEvent;

struct PointerEvent {
    enum class Type { Mouse, Touch, Pen };
    enum class Phase { Down, Move, Up, Cancel };

    /// Pen eraser button in the buttons bitmask
    static constexpr int ERASER_BUTTON = 32;

    int pointerId = 0;
    Type pointerType = Type::Mouse;
    Phase phase = Phase::Move;
    bool isPrimary = true;
    QPointF client;                     ///< Screen-space position
    qreal pressure = 0.5;
    std::optional<QPointF> tilt;        ///< Degrees; absent when the device has none
    int buttons = 0;
    qreal timestamp = 0.0;              ///< Milliseconds

    bool isEraserButton() const { return (buttons & ERASER_BUTTON) != 0; }

    /**
     * @brief Build from a Qt mouse event.
     *
     * Pressure is 1 while any button is held and 0 otherwise.
     */
    static PointerEvent fromMouseEvent(const QMouseEvent* event, Phase phase);

    /**
     * @brief Build from a Qt tablet event, carrying pressure and tilt.
     *
     * The eraser end of a stylus sets ERASER_BUTTON.
     */
    static PointerEvent fromTabletEvent(const QTabletEvent* event, Phase phase);
};
