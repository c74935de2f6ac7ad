#pragma once

// ============================================================================
// StrokeEngine - Stroke capture and geometry smoothing
// ============================================================================
// Converts raw pointer samples into a resampled, exponentially smoothed
// point stream. One stroke per active pointer; strokes from different
// pointers never share points or filter state.
//
// addPoint()/pointerMove() run on every pointer-move and are synchronous,
// non-blocking and bounded in time.
// ============================================================================

#include "InkStroke.h"
#include "StrokeOptimizer.h"
#include "../core/InkSettings.h"

#include <QColor>
#include <QPointF>
#include <QVector>
#include <memory>
#include <optional>
#include <unordered_map>

/**
 * @brief Per-pointer capture state machine.
 *
 * Typical flow:
 * @code
 *   engine.pointerDown(id, pos, color, width, pressure, tilt, t);
 *   engine.pointerMove(id, pos, pressure, tilt, t);   // many times
 *   std::unique_ptr<InkStroke> s = engine.pointerUp(id);
 * @endcode
 *
 * startStroke()/addPoint()/finishStroke() are the single-pointer
 * convenience API and drive the primary pointer.
 */
class StrokeEngine {
public:
    /// Pointer id used by the single-stroke convenience API
    static constexpr int PRIMARY_POINTER = -1;

    explicit StrokeEngine(const InkSettings& settings = InkSettings());

    // ===== Configuration (live-tunable) =====

    const InkSettings& settings() const { return m_settings; }
    void setSettings(const InkSettings& settings) { m_settings = settings; }
    void applySmoothing(const SmoothingUpdate& update) { m_settings.applySmoothing(update); }
    void setSmoothingEnabled(bool enabled) { m_settings.smoothingEnabled = enabled; }
    void setAngleCulling(bool enabled) { m_settings.angleCulling = enabled; }

    // ===== Single active stroke =====

    /**
     * @brief Create a one-point stroke on the primary pointer.
     * @return The live stroke (owned by the engine), or nullptr if the
     *         coordinates are not finite or lie beyond InkStroke::MAX_COORDINATE.
     *
     * An unfinished primary stroke is sealed and discarded first.
     */
    InkStroke* startStroke(qreal x, qreal y, const QColor& color, qreal width,
                           qreal pressure, std::optional<QPointF> tilt, qreal time);

    /**
     * @brief Overload taking a CSS color string; unparseable strings become black.
     */
    InkStroke* startStroke(qreal x, qreal y, const QString& color, qreal width,
                           qreal pressure, std::optional<QPointF> tilt, qreal time);

    /**
     * @brief Append a raw sample to the primary stroke.
     */
    void addPoint(qreal x, qreal y, qreal pressure, std::optional<QPointF> tilt, qreal time);

    /**
     * @brief Seal the primary stroke and hand it over.
     * @return The finished stroke, or nullptr if no stroke is active.
     */
    std::unique_ptr<InkStroke> finishStroke();

    /**
     * @brief The live primary stroke, or nullptr.
     */
    InkStroke* activeStroke() const { return liveStroke(PRIMARY_POINTER); }

    // ===== Multi-pointer capture =====

    InkStroke* pointerDown(int pointerId, const QPointF& pos, const QColor& color, qreal width,
                           qreal pressure, std::optional<QPointF> tilt, qreal time,
                           bool isEraser = false);
    void pointerMove(int pointerId, const QPointF& pos, qreal pressure,
                     std::optional<QPointF> tilt, qreal time);
    std::unique_ptr<InkStroke> pointerUp(int pointerId);

    /**
     * @brief Pointer-cancel seals the stroke exactly like pointer-up.
     */
    std::unique_ptr<InkStroke> pointerCancel(int pointerId) { return pointerUp(pointerId); }

    InkStroke* liveStroke(int pointerId) const;
    QVector<const InkStroke*> liveStrokes() const;
    int activePointerCount() const { return static_cast<int>(m_live.size()); }

    /**
     * @brief Drop all live strokes without sealing them.
     */
    void reset();

    // ===== Stroke-level primitives =====

    /**
     * @brief Ingest one raw sample into a stroke.
     *
     * Sealed strokes ignore further samples. Samples outside the world
     * limit are dropped like non-finite ones.
     */
    void appendSample(InkStroke& stroke, const QPointF& pos, qreal pressure,
                      std::optional<QPointF> tilt, qreal time) const;

    /**
     * @brief Mark a stroke finished, flush the filter tail, cull nodes if
     *        enabled and shrink the bounds to the tight per-point union.
     */
    void seal(InkStroke& stroke) const;

    // ===== Width =====

    /**
     * @brief Render width at a point index.
     *
     * Always within [baseWidth*minWidthScale, baseWidth*maxWidthScale].
     */
    qreal pointWidth(const InkStroke& stroke, int index) const;

    /**
     * @brief Widths for every point of a stroke.
     */
    QVector<float> pointWidths(const InkStroke& stroke) const;

    /**
     * @brief Next id that will be assigned (ids are unique per engine).
     */
    quint32 nextStrokeId() const { return m_nextId; }

    /**
     * @brief Make sure future ids do not collide with loaded strokes.
     */
    void reserveStrokeIds(quint32 nextId) { m_nextId = qMax(m_nextId, nextId); }

    static qreal smoothstep(qreal edge0, qreal edge1, qreal x);
    static qreal lerp(qreal a, qreal b, qreal t) { return a + (b - a) * t; }

private:
    qreal spacingFor(const InkStroke& stroke) const;
    void sealAtCap(InkStroke& stroke) const;
    void emitPoint(InkStroke& stroke, const QPointF& pos, qreal pressure,
                   const std::optional<QPointF>& tilt, qreal time) const;

    InkSettings m_settings;
    StrokeOptimizer m_optimizer;
    quint32 m_nextId = 1;
    std::unordered_map<int, std::unique_ptr<InkStroke>> m_live;
};
