#include "CanvasViewport.h"

#include <QtGlobal>
#include <cmath>

void CanvasViewport::setScale(qreal scale)
{
    if (!std::isfinite(scale)) {
        return;
    }
    m_scale = qBound(MIN_SCALE, scale, MAX_SCALE);
}

QRectF CanvasViewport::visibleWorldRect() const
{
    return QRectF(m_worldOffset, QSizeF(m_screenWidth / m_scale, m_screenHeight / m_scale));
}

QTransform CanvasViewport::worldToScreenTransform() const
{
    QTransform transform;
    transform.scale(m_scale, m_scale);
    transform.translate(-m_worldOffset.x(), -m_worldOffset.y());
    return transform;
}

void CanvasViewport::pan(qreal dx, qreal dy)
{
    m_worldOffset.rx() -= dx / m_scale;
    m_worldOffset.ry() -= dy / m_scale;
}

bool CanvasViewport::zoom(qreal delta, const QPointF& center)
{
    const qreal oldScale = m_scale;
    const qreal newScale = qBound(MIN_SCALE,
                                  oldScale * (delta > 0 ? ZOOM_IN_FACTOR : ZOOM_OUT_FACTOR),
                                  MAX_SCALE);
    if (qFuzzyCompare(newScale, oldScale)) {
        return false;
    }

    const QPointF anchor = screenToWorld(center);
    m_scale = newScale;
    m_worldOffset = QPointF(anchor.x() - center.x() / m_scale,
                            anchor.y() - center.y() / m_scale);
    return true;
}

void CanvasViewport::resize(qreal screenWidth, qreal screenHeight)
{
    m_screenWidth = qMax<qreal>(0.0, screenWidth);
    m_screenHeight = qMax<qreal>(0.0, screenHeight);
}

void CanvasViewport::reset()
{
    m_worldOffset = QPointF();
    m_scale = 1.0;
}
