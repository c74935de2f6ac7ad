#include "PackedMeshBuilder.h"

#include <cmath>
#include <vector>

namespace {

struct Emitter {
    float* cursor;
    const float* rgba;

    void vertex(double x, double y)
    {
        *cursor++ = static_cast<float>(x);
        *cursor++ = static_cast<float>(y);
        *cursor++ = rgba[0];
        *cursor++ = rgba[1];
        *cursor++ = rgba[2];
        *cursor++ = rgba[3];
    }

    void fan(double cx, double cy, double radius, double start, double sweep, int steps)
    {
        for (int s = 0; s < steps; ++s) {
            const double a0 = start + sweep * s / steps;
            const double a1 = start + sweep * (s + 1) / steps;
            vertex(cx, cy);
            vertex(cx + std::cos(a0) * radius, cy + std::sin(a0) * radius);
            vertex(cx + std::cos(a1) * radius, cy + std::sin(a1) * radius);
        }
    }
};

} // namespace

QVector<float> PackedMeshBuilder::build(const MeshInput& input) const
{
    if (!input.isValid() || input.pointCount() == 0) {
        return QVector<float>();
    }

    const int n = input.pointCount();
    const float* pos = input.positions.constData();
    const float* widths = input.widths.constData();

    if (n == 1) {
        QVector<float> out(DISC_SEGMENTS * 3 * FLOATS_PER_VERTEX);
        Emitter writer{out.data(), input.rgba};
        writer.fan(pos[0], pos[1], widths[0] * 0.5, 0.0, 2.0 * M_PI, DISC_SEGMENTS);
        return out;
    }

    const int segs = n - 1;

    // Directions, zero-length segments inherit a neighbour's direction
    std::vector<double> dx(segs), dy(segs);
    int firstValid = -1;
    for (int i = 0; i < segs; ++i) {
        const double ex = static_cast<double>(pos[i * 2 + 2]) - pos[i * 2];
        const double ey = static_cast<double>(pos[i * 2 + 3]) - pos[i * 2 + 1];
        const double len = std::hypot(ex, ey);
        if (len > 1e-9) {
            dx[i] = ex / len;
            dy[i] = ey / len;
            if (firstValid < 0) {
                firstValid = i;
            }
        } else {
            dx[i] = std::nan("");
            dy[i] = 0.0;
        }
    }
    double cdx = firstValid >= 0 ? dx[firstValid] : 1.0;
    double cdy = firstValid >= 0 ? dy[firstValid] : 0.0;
    for (int i = 0; i < segs; ++i) {
        if (std::isnan(dx[i])) {
            dx[i] = cdx;
            dy[i] = cdy;
        } else {
            cdx = dx[i];
            cdy = dy[i];
        }
    }

    // Left normals are (-dy, dx); joints stored as [lpx lpy rpx rpy lnx lny rnx rny]
    std::vector<double> joint(static_cast<size_t>(n) * 8);
    std::vector<unsigned char> isRound(n, 0);
    std::vector<double> joinStart(n, 0.0), joinSweep(n, 0.0);
    std::vector<int> joinFan(n, 0);

    for (int i = 0; i < n; ++i) {
        const double px = pos[i * 2];
        const double py = pos[i * 2 + 1];
        const double r = widths[i] * 0.5;
        double* j = &joint[static_cast<size_t>(i) * 8];

        if (i == 0 || i == n - 1) {
            const int s = i == 0 ? 0 : segs - 1;
            const double nx = -dy[s];
            const double ny = dx[s];
            j[0] = j[4] = px + nx * r;
            j[1] = j[5] = py + ny * r;
            j[2] = j[6] = px - nx * r;
            j[3] = j[7] = py - ny * r;
            continue;
        }

        const double n0x = -dy[i - 1], n0y = dx[i - 1];
        const double n1x = -dy[i], n1y = dx[i];
        const double mx = n0x + n1x;
        const double my = n0y + n1y;
        const double mlen = std::hypot(mx, my);

        if (mlen >= MITER_EPSILON) {
            const double mdx = mx / mlen;
            const double mdy = my / mlen;
            const double d = mdx * n1x + mdy * n1y;
            const double miterLength = d != 0.0 ? r / d : r;
            if (std::fabs(miterLength) <= MITER_LIMIT * r) {
                j[0] = j[4] = px + mdx * miterLength;
                j[1] = j[5] = py + mdy * miterLength;
                j[2] = j[6] = px - mdx * miterLength;
                j[3] = j[7] = py - mdy * miterLength;
                continue;
            }
        }

        j[0] = px + n0x * r;
        j[1] = py + n0y * r;
        j[2] = px - n0x * r;
        j[3] = py - n0y * r;
        j[4] = px + n1x * r;
        j[5] = py + n1y * r;
        j[6] = px - n1x * r;
        j[7] = py - n1y * r;
        isRound[i] = 1;

        const double crossTurn = dx[i - 1] * dy[i] - dy[i - 1] * dx[i];
        const double sign = crossTurn >= 0.0 ? -1.0 : 1.0;
        const double o0x = n0x * sign, o0y = n0y * sign;
        const double o1x = n1x * sign, o1y = n1y * sign;
        joinStart[i] = std::atan2(o0y, o0x);
        joinSweep[i] = std::atan2(o0x * o1y - o0y * o1x, o0x * o1x + o0y * o1y);
        joinFan[i] = joinSteps(joinSweep[i]);
    }

    // Exact output size: 2 triangles per segment, join fans, two caps
    const int capFan = capSteps(M_PI);
    int triangles = segs * 2 + capFan * 2;
    for (int i = 1; i < n - 1; ++i) {
        triangles += joinFan[i];
    }

    QVector<float> out(triangles * 3 * FLOATS_PER_VERTEX);
    Emitter writer{out.data(), input.rgba};

    for (int i = 0; i < segs; ++i) {
        const double* a = &joint[static_cast<size_t>(i) * 8];
        const double* b = &joint[static_cast<size_t>(i + 1) * 8];
        // a.leftNext, a.rightNext, b.rightPrev
        writer.vertex(a[4], a[5]);
        writer.vertex(a[6], a[7]);
        writer.vertex(b[2], b[3]);
        // a.leftNext, b.rightPrev, b.leftPrev
        writer.vertex(a[4], a[5]);
        writer.vertex(b[2], b[3]);
        writer.vertex(b[0], b[1]);
    }

    for (int i = 1; i < n - 1; ++i) {
        if (isRound[i]) {
            writer.fan(pos[i * 2], pos[i * 2 + 1], widths[i] * 0.5, joinStart[i], joinSweep[i], joinFan[i]);
        }
    }

    // Start cap sweeps from the left normal, end cap from the right normal
    writer.fan(pos[0], pos[1], widths[0] * 0.5, std::atan2(dx[0], -dy[0]), M_PI, capFan);
    const int last = n - 1;
    writer.fan(pos[last * 2], pos[last * 2 + 1], widths[last] * 0.5,
             std::atan2(-dx[segs - 1], dy[segs - 1]), M_PI, capFan);

    return out;
}
