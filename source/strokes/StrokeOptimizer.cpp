#include "StrokeOptimizer.h"

#include <QtMath>

qreal StrokeOptimizer::angleDeltaFromLast(const QPointF& prev, const QPointF& curr, qreal& lastAngle)
{
    const qreal dx = curr.x() - prev.x();
    const qreal dy = curr.y() - prev.y();
    if (qAbs(dx) < 0.001 && qAbs(dy) < 0.001) {
        return 0.0;
    }

    qreal angle = qRadiansToDegrees(qAtan2(dy, dx));
    if (angle < 0) {
        angle += 360.0;
    }

    if (lastAngle < 0) {
        lastAngle = angle;
        return 0.0;
    }

    qreal delta = qAbs(angle - lastAngle);
    if (delta > 180.0) {
        delta = 360.0 - delta;  // 359° → 1° is 2°, not 358°
    }
    lastAngle = angle;
    return delta;
}

StrokeOptimizer::Result StrokeOptimizer::optimize(const QVector<InkPoint>& points, qreal width,
                                                  bool complexTransform) const
{
    Result result;
    const int count = points.size();
    if (count == 0) {
        return result;
    }
    result.nodes.reserve(count);

    qreal lastAngle = -1.0;
    QRectF lastRect;
    bool previousPreviousNodeRendered = false;
    int lastPushedIndex = -1;

    for (int index = 0; index < count; ++index) {
        const InkPoint& node = points[index];
        const qreal radius = width * qBound<qreal>(0.0, node.pressure, 1.0) / 2.0;
        const QRectF nodeRect(node.x() - radius, node.y() - radius, radius * 2, radius * 2);

        result.bounds = result.bounds.isNull() ? nodeRect : result.bounds.united(nodeRect);

        qreal tolerance = m_options.angleTolerance;
        if (complexTransform) {
            tolerance = m_options.transformAngleTolerance;
        } else if (nodeRect.width() > m_options.largeNodeThreshold
                   || nodeRect.height() > m_options.largeNodeThreshold) {
            tolerance = m_options.largeNodeAngleTolerance;
        }

        const qreal delta = index > 0
            ? angleDeltaFromLast(points[index - 1].pos, node.pos, lastAngle)
            : 0.0;
        const bool directionChanged = delta > tolerance && delta < (360.0 - tolerance);

        bool areaChanged = false;
        if (index > 0) {
            const qreal prevArea = lastRect.width() * lastRect.height();
            const qreal currArea = nodeRect.width() * nodeRect.height();
            const qreal maxArea = qMax(prevArea, currArea);
            if (maxArea > 0 && qMin(prevArea, currArea) / maxArea <= m_options.areaChangeThreshold) {
                areaChanged = true;
            }
        }
        lastRect = nodeRect;

        const bool keep = index <= 1 || index >= count - 2 || directionChanged || areaChanged;
        if (keep) {
            // An isolated turn also needs the node right before it
            if (directionChanged && !previousPreviousNodeRendered
                && index > 1 && index < count - 1 && lastPushedIndex != index - 1) {
                result.nodes.append(points[index - 1]);
                previousPreviousNodeRendered = true;
            }
            result.nodes.append(node);
            lastPushedIndex = index;
        }

        if (!directionChanged) {
            previousPreviousNodeRendered = false;
        }
    }

    return result;
}
