#pragma once

// ============================================================================
// CanvasViewport - World <-> screen mapping for the infinite canvas
// ============================================================================
// screen = (world - worldOffset) * scale
// world  = screen / scale + worldOffset
//
// Plain value type; the owner decides when a change requires a redraw.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>

class CanvasViewport {
public:
    static constexpr qreal MIN_SCALE = 0.1;
    static constexpr qreal MAX_SCALE = 5.0;
    static constexpr qreal ZOOM_IN_FACTOR = 1.1;
    static constexpr qreal ZOOM_OUT_FACTOR = 0.9;

    CanvasViewport() = default;
    CanvasViewport(qreal screenWidth, qreal screenHeight)
        : m_screenWidth(screenWidth), m_screenHeight(screenHeight) {}

    // ===== State =====

    QPointF worldOffset() const { return m_worldOffset; }
    void setWorldOffset(const QPointF& offset) { m_worldOffset = offset; }

    qreal scale() const { return m_scale; }

    /**
     * @brief Set the scale directly, clamped to [MIN_SCALE, MAX_SCALE].
     */
    void setScale(qreal scale);

    qreal screenWidth() const { return m_screenWidth; }
    qreal screenHeight() const { return m_screenHeight; }
    QSizeF screenSize() const { return QSizeF(m_screenWidth, m_screenHeight); }

    // ===== Mapping =====

    QPointF screenToWorld(const QPointF& screen) const {
        return QPointF(m_worldOffset.x() + screen.x() / m_scale,
                       m_worldOffset.y() + screen.y() / m_scale);
    }

    QPointF worldToScreen(const QPointF& world) const {
        return QPointF((world.x() - m_worldOffset.x()) * m_scale,
                       (world.y() - m_worldOffset.y()) * m_scale);
    }

    /**
     * @brief World rectangle currently on screen.
     */
    QRectF visibleWorldRect() const;

    /**
     * @brief Painter transform mapping world coordinates to screen pixels.
     */
    QTransform worldToScreenTransform() const;

    // ===== Navigation =====

    /**
     * @brief Move the view by a screen-space drag delta.
     */
    void pan(qreal dx, qreal dy);

    /**
     * @brief Step the zoom one notch, keeping the world point under center fixed.
     * @param delta > 0 zooms in (×1.1), otherwise zooms out (×0.9).
     * @return true if the scale changed (false when already at a limit).
     */
    bool zoom(qreal delta, const QPointF& center);

    void resize(qreal screenWidth, qreal screenHeight);

    /**
     * @brief Back to the origin at scale 1. Screen size is kept.
     */
    void reset();

private:
    QPointF m_worldOffset;
    qreal m_scale = 1.0;
    qreal m_screenWidth = 0.0;
    qreal m_screenHeight = 0.0;
};
