#pragma once

// ============================================================================
// InkPoint - A single sample on a stroke spine
// ============================================================================
// Produced by the capture engine (resampled, smoothed) or by the ISF decoder.
// Immutable once appended to a stroke.
// ============================================================================

#include <QPointF>
#include <optional>

/**
 * @brief A single point in an ink stroke.
 *
 * Besides the raw sample data (position, pressure, tilt, time) each point
 * carries two derived values that the capture engine fills in when the
 * point is emitted:
 * - length: cumulative arc length from the first point
 * - velocity: exponentially smoothed speed (world units per millisecond)
 *
 * The per-point render width is NOT stored here; it is computed on demand
 * by StrokeEngine::pointWidth() because the tail taper depends on the
 * final stroke length.
 */
struct InkPoint {
    QPointF pos;                    ///< Position in world coordinates
    qreal pressure = 1.0;           ///< Pen pressure, 0.0 to 1.0
    std::optional<QPointF> tilt;    ///< Stylus tilt in device units, if reported
    qreal time = 0.0;               ///< Monotonic timestamp in milliseconds
    qreal length = 0.0;             ///< Cumulative arc length up to this point
    qreal velocity = 0.0;           ///< Smoothed velocity at this point

    InkPoint() = default;

    InkPoint(const QPointF& position, qreal p, qreal t = 0.0)
        : pos(position), pressure(p), time(t) {}

    qreal x() const { return pos.x(); }
    qreal y() const { return pos.y(); }
};
