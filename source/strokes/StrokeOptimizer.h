#pragma once

// ============================================================================
// StrokeOptimizer - Angle-based node culling for finished strokes
// ============================================================================
// Drops spine nodes that neither change direction nor change footprint
// noticeably. Based on the WPF ink renderer's node culling rules:
// 45° tolerance for normal nodes, 20° for large nodes (> 40 units) and
// 10° when the stroke is drawn under a complex transform.
// ============================================================================

#include "InkPoint.h"

#include <QRectF>
#include <QVector>

class StrokeOptimizer {
public:
    struct Options {
        qreal angleTolerance = 45.0;
        qreal largeNodeAngleTolerance = 20.0;
        qreal transformAngleTolerance = 10.0;
        qreal largeNodeThreshold = 40.0;
        qreal areaChangeThreshold = 0.70;   ///< min/max footprint area ratio
    };

    struct Result {
        QVector<InkPoint> nodes;    ///< Surviving nodes, in order
        QRectF bounds;              ///< Union of all node footprints (culled ones included)
    };

    StrokeOptimizer() = default;
    explicit StrokeOptimizer(const Options& options) : m_options(options) {}

    const Options& options() const { return m_options; }

    /**
     * @brief Cull redundant nodes.
     * @param points The stroke spine.
     * @param width Base stroke width (node footprint = width * pressure).
     * @param complexTransform True when drawn under rotation/skew.
     *
     * The first two and last two nodes always survive.
     */
    Result optimize(const QVector<InkPoint>& points, qreal width,
                    bool complexTransform = false) const;

    /**
     * @brief Direction change between two successive segments, in degrees.
     * @param lastAngle In/out: direction of the previous segment (< 0 = none yet).
     * @return Absolute change in [0, 180], or 0 for degenerate segments.
     */
    static qreal angleDeltaFromLast(const QPointF& prev, const QPointF& curr, qreal& lastAngle);

private:
    Options m_options;
};
