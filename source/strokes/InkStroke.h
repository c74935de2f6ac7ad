#pragma once

// ============================================================================
// InkStroke - A complete stroke (pointer down → pointer up)
// ============================================================================
// Created on pointer-down, grown by pointer-move, sealed on pointer-up or
// pointer-cancel. Once isFinished is set the stroke is never mutated again;
// any further edit requires a new stroke.
// ============================================================================

#include "InkPoint.h"

#include <QColor>
#include <QRectF>
#include <QString>
#include <QVector>

/**
 * @brief A variable-width ink stroke.
 *
 * The smoothing state used while capturing (last raw samples, last filtered
 * position, last velocity) lives on the stroke itself so that concurrent
 * pointers never share filter state.
 */
struct InkStroke {
    /// Largest |x| or |y| a point may have (world units)
    static constexpr qreal MAX_COORDINATE = 100000.0;
    /// Largest accepted base width
    static constexpr qreal MAX_BASE_WIDTH = 1000.0;

    quint32 id = 0;                 ///< Unique within a session
    QColor color = Qt::black;       ///< Stroke color (RGBA)
    qreal baseWidth = 2.0;          ///< Base width before pressure/speed scaling
    QVector<InkPoint> points;       ///< Emitted (resampled) points
    QRectF bounds;                  ///< Axis-aligned bounds including point radii
    qreal totalLength = 0.0;        ///< Arc length of the emitted spine
    bool isFinished = false;        ///< Sealed on pointer-up/cancel
    bool isEraser = false;          ///< Erase strokes are composited destination-out
    qreal createdAt = 0.0;          ///< Timestamp of the first sample (ms)
    qreal updatedAt = 0.0;          ///< Timestamp of the latest sample (ms)

    // ----- Capture state (owned by the stroke, driven by StrokeEngine) -----
    QPointF lastFiltered;           ///< Output of the exponential position filter
    qreal lastVelocity = 0.0;       ///< Last smoothed velocity
    QPointF lastRaw;                ///< Most recent raw sample
    QPointF prevRaw;                ///< Raw sample before lastRaw
    qreal lastRawTime = 0.0;        ///< Timestamp of lastRaw
    int rawCount = 0;               ///< Number of raw samples ingested

    static bool isWithinWorld(const QPointF& pos) {
        return qAbs(pos.x()) <= MAX_COORDINATE && qAbs(pos.y()) <= MAX_COORDINATE;
    }

    bool isEmpty() const { return points.isEmpty(); }
    int pointCount() const { return points.size(); }

    /**
     * @brief Radius used for bounds at a given pressure.
     */
    qreal boundsRadius(qreal pressure) const {
        return baseWidth * qMax<qreal>(0.25, pressure) / 2.0;
    }

    /**
     * @brief Grow bounds to include a point (monotonic while unfinished).
     */
    void expandBounds(const QPointF& pos, qreal pressure);

    /**
     * @brief Recompute bounds as the tight union of per-point radius boxes.
     *
     * Called when the stroke is sealed and after loading from ISF.
     */
    void updateBoundingBox();

    /**
     * @brief Recompute totalLength and per-point length from the positions.
     *
     * Used for decoded strokes, which carry no derived fields.
     */
    void recomputeLengths();

    /**
     * @brief Parse a CSS-style color string.
     * @param text "#rrggbb", "#rrggbbaa", "rgb(r,g,b)" or "rgba(r,g,b,a)".
     * @return The parsed color, or opaque black if the string is not understood.
     */
    static QColor parseColor(const QString& text);
};
