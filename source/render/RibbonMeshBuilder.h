#pragma once

// ============================================================================
// RibbonMeshBuilder - Object-level reference triangulation
// ============================================================================
// Readable QPointF implementation of the ribbon algorithm. Used on the
// owning thread for the live stroke and as the synchronous fallback.
// ============================================================================

#include "MeshBuilder.h"

#include <QPointF>

class RibbonMeshBuilder : public MeshBuilder {
public:
    QVector<float> build(const MeshInput& input) const override;

    Kind kind() const override { return Kind::Reference; }
    const char* name() const override { return "reference"; }

private:
    struct Joint {
        QPointF leftPrev;       ///< Offsets used by the incoming segment
        QPointF rightPrev;
        QPointF leftNext;       ///< Offsets used by the outgoing segment
        QPointF rightNext;
        bool round = false;
    };

    class TriangleWriter {
    public:
        TriangleWriter(QVector<float>& out, const float* rgba) : m_out(out), m_rgba(rgba) {}
        void triangle(const QPointF& a, const QPointF& b, const QPointF& c);
        void fan(const QPointF& center, qreal radius, qreal startAngle, qreal sweep, int steps);

    private:
        void vertex(const QPointF& p);
        QVector<float>& m_out;
        const float* m_rgba;
    };
};
