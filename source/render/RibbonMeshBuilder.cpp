#include "RibbonMeshBuilder.h"

#include <QtMath>
#include <cmath>

namespace {

qreal cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

qreal dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

QPointF leftNormal(const QPointF& dir)
{
    return QPointF(-dir.y(), dir.x());
}

} // namespace

void RibbonMeshBuilder::TriangleWriter::vertex(const QPointF& p)
{
    m_out.append(static_cast<float>(p.x()));
    m_out.append(static_cast<float>(p.y()));
    m_out.append(m_rgba[0]);
    m_out.append(m_rgba[1]);
    m_out.append(m_rgba[2]);
    m_out.append(m_rgba[3]);
}

void RibbonMeshBuilder::TriangleWriter::triangle(const QPointF& a, const QPointF& b, const QPointF& c)
{
    vertex(a);
    vertex(b);
    vertex(c);
}

void RibbonMeshBuilder::TriangleWriter::fan(const QPointF& center, qreal radius, qreal startAngle,
                                            qreal sweep, int steps)
{
    for (int s = 0; s < steps; ++s) {
        const qreal a0 = startAngle + sweep * s / steps;
        const qreal a1 = startAngle + sweep * (s + 1) / steps;
        triangle(center,
                 center + QPointF(std::cos(a0), std::sin(a0)) * radius,
                 center + QPointF(std::cos(a1), std::sin(a1)) * radius);
    }
}

QVector<float> RibbonMeshBuilder::build(const MeshInput& input) const
{
    QVector<float> out;
    if (!input.isValid() || input.pointCount() == 0) {
        return out;
    }

    const int count = input.pointCount();
    QVector<QPointF> points(count);
    QVector<qreal> radii(count);
    for (int i = 0; i < count; ++i) {
        points[i] = QPointF(input.positions[i * 2], input.positions[i * 2 + 1]);
        radii[i] = input.widths[i] * 0.5;
    }

    TriangleWriter writer(out, input.rgba);

    // Tap without drag: filled disc
    if (count == 1) {
        out.reserve(DISC_SEGMENTS * 3 * FLOATS_PER_VERTEX);
        writer.fan(points[0], radii[0], 0.0, 2.0 * M_PI, DISC_SEGMENTS);
        return out;
    }

    // Segment directions; zero-length segments borrow a neighbour's direction
    const int segments = count - 1;
    QVector<QPointF> dirs(segments);
    QVector<bool> valid(segments, false);
    for (int i = 0; i < segments; ++i) {
        const QPointF d = points[i + 1] - points[i];
        const qreal len = std::hypot(d.x(), d.y());
        if (len > 1e-9) {
            dirs[i] = d / len;
            valid[i] = true;
        }
    }
    int firstValid = -1;
    for (int i = 0; i < segments; ++i) {
        if (valid[i]) {
            firstValid = i;
            break;
        }
    }
    QPointF carry = firstValid >= 0 ? dirs[firstValid] : QPointF(1.0, 0.0);
    for (int i = 0; i < segments; ++i) {
        if (valid[i]) {
            carry = dirs[i];
        } else {
            dirs[i] = carry;
        }
    }

    QVector<QPointF> norms(segments);
    for (int i = 0; i < segments; ++i) {
        norms[i] = leftNormal(dirs[i]);
    }

    // Joints
    QVector<Joint> joints(count);
    for (int i = 0; i < count; ++i) {
        const QPointF& p = points[i];
        const qreal r = radii[i];
        Joint& j = joints[i];

        if (i == 0 || i == count - 1) {
            const QPointF& n = norms[i == 0 ? 0 : segments - 1];
            j.leftPrev = j.leftNext = p + n * r;
            j.rightPrev = j.rightNext = p - n * r;
            continue;
        }

        const QPointF& n0 = norms[i - 1];
        const QPointF& n1 = norms[i];
        const QPointF miter = n0 + n1;
        const qreal miterLen = std::hypot(miter.x(), miter.y());

        bool useMiter = false;
        QPointF miterOffset;
        if (miterLen >= MITER_EPSILON) {
            const QPointF miterDir = miter / miterLen;
            const qreal d = dot(miterDir, n1);
            const qreal miterLength = d != 0.0 ? r / d : r;
            if (qAbs(miterLength) <= MITER_LIMIT * r) {
                useMiter = true;
                miterOffset = miterDir * miterLength;
            }
        }

        if (useMiter) {
            j.leftPrev = j.leftNext = p + miterOffset;
            j.rightPrev = j.rightNext = p - miterOffset;
        } else {
            j.leftPrev = p + n0 * r;
            j.rightPrev = p - n0 * r;
            j.leftNext = p + n1 * r;
            j.rightNext = p - n1 * r;
            j.round = true;
        }
    }

    // Segment quads
    for (int i = 0; i < segments; ++i) {
        const Joint& a = joints[i];
        const Joint& b = joints[i + 1];
        writer.triangle(a.leftNext, a.rightNext, b.rightPrev);
        writer.triangle(a.leftNext, b.rightPrev, b.leftPrev);
    }

    // Round joins fill the wedge on the outer side of the turn
    for (int i = 1; i < count - 1; ++i) {
        if (!joints[i].round) {
            continue;
        }
        const QPointF& d0 = dirs[i - 1];
        const QPointF& d1 = dirs[i];
        const bool turnsLeft = cross(d0, d1) >= 0.0;
        const QPointF outer0 = turnsLeft ? -norms[i - 1] : norms[i - 1];
        const QPointF outer1 = turnsLeft ? -norms[i] : norms[i];

        const qreal start = std::atan2(outer0.y(), outer0.x());
        const qreal sweep = std::atan2(cross(outer0, outer1), dot(outer0, outer1));
        writer.fan(points[i], radii[i], start, sweep, joinSteps(sweep));
    }

    // Round caps: half discs bulging away from the stroke body
    const QPointF& startNormal = norms[0];
    writer.fan(points[0], radii[0], std::atan2(startNormal.y(), startNormal.x()), M_PI, capSteps(M_PI));
    const QPointF endNormal = -norms[segments - 1];
    writer.fan(points[count - 1], radii[count - 1], std::atan2(endNormal.y(), endNormal.x()), M_PI,
               capSteps(M_PI));

    return out;
}
