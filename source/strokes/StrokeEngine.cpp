#include "StrokeEngine.h"

#include <QDebug>
#include <QLineF>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace {

bool isFinitePoint(const QPointF& p)
{
    return std::isfinite(p.x()) && std::isfinite(p.y());
}

qreal sanitizePressure(qreal pressure)
{
    if (!std::isfinite(pressure)) {
        return 1.0;
    }
    return qBound<qreal>(0.0, pressure, 1.0);
}

std::optional<QPointF> sanitizeTilt(const std::optional<QPointF>& tilt)
{
    if (tilt && isFinitePoint(*tilt)) {
        return tilt;
    }
    return std::nullopt;
}

// Distance under which the filtered tail is not worth an extra point on seal
constexpr qreal TAIL_FLUSH_EPSILON = 0.01;

} // namespace

StrokeEngine::StrokeEngine(const InkSettings& settings)
    : m_settings(settings)
{
}

qreal StrokeEngine::smoothstep(qreal edge0, qreal edge1, qreal x)
{
    if (edge1 <= edge0) {
        return x < edge0 ? 0.0 : 1.0;
    }
    const qreal t = qBound<qreal>(0.0, (x - edge0) / (edge1 - edge0), 1.0);
    return t * t * (3.0 - 2.0 * t);
}

// ===== Single active stroke =====

InkStroke* StrokeEngine::startStroke(qreal x, qreal y, const QColor& color, qreal width,
                                     qreal pressure, std::optional<QPointF> tilt, qreal time)
{
    return pointerDown(PRIMARY_POINTER, QPointF(x, y), color, width, pressure, tilt, time);
}

InkStroke* StrokeEngine::startStroke(qreal x, qreal y, const QString& color, qreal width,
                                     qreal pressure, std::optional<QPointF> tilt, qreal time)
{
    return startStroke(x, y, InkStroke::parseColor(color), width, pressure, tilt, time);
}

void StrokeEngine::addPoint(qreal x, qreal y, qreal pressure, std::optional<QPointF> tilt, qreal time)
{
    pointerMove(PRIMARY_POINTER, QPointF(x, y), pressure, tilt, time);
}

std::unique_ptr<InkStroke> StrokeEngine::finishStroke()
{
    return pointerUp(PRIMARY_POINTER);
}

// ===== Multi-pointer capture =====

InkStroke* StrokeEngine::pointerDown(int pointerId, const QPointF& pos, const QColor& color, qreal width,
                                     qreal pressure, std::optional<QPointF> tilt, qreal time,
                                     bool isEraser)
{
    if (!InkStroke::isWithinWorld(pos)) {
        qWarning() << "StrokeEngine::pointerDown: dropping position" << pos << "for pointer" << pointerId;
        return nullptr;
    }

    auto existing = m_live.find(pointerId);
    if (existing != m_live.end()) {
        qWarning() << "StrokeEngine::pointerDown: pointer" << pointerId
                   << "already has a live stroke, discarding it";
        m_live.erase(existing);
    }

    if (!std::isfinite(time)) {
        time = 0.0;
    }
    if (!std::isfinite(width) || width <= 0.0) {
        width = 1.0;
    } else if (width > InkStroke::MAX_BASE_WIDTH) {
        qWarning() << "StrokeEngine::pointerDown: width" << width << "clamped to" << InkStroke::MAX_BASE_WIDTH;
        width = InkStroke::MAX_BASE_WIDTH;
    }

    auto stroke = std::make_unique<InkStroke>();
    stroke->id = m_nextId++;
    stroke->color = color.isValid() ? color : QColor(Qt::black);
    stroke->baseWidth = width;
    stroke->isEraser = isEraser;
    stroke->createdAt = time;
    stroke->updatedAt = time;

    InkPoint first(pos, sanitizePressure(pressure), time);
    first.tilt = sanitizeTilt(tilt);
    stroke->points.append(first);
    stroke->expandBounds(pos, first.pressure);

    stroke->lastFiltered = pos;
    stroke->lastRaw = pos;
    stroke->prevRaw = pos;
    stroke->lastRawTime = time;
    stroke->rawCount = 1;

    InkStroke* raw = stroke.get();
    m_live[pointerId] = std::move(stroke);
    return raw;
}

void StrokeEngine::pointerMove(int pointerId, const QPointF& pos, qreal pressure,
                               std::optional<QPointF> tilt, qreal time)
{
    auto it = m_live.find(pointerId);
    if (it == m_live.end()) {
        return;
    }
    appendSample(*it->second, pos, pressure, tilt, time);
}

std::unique_ptr<InkStroke> StrokeEngine::pointerUp(int pointerId)
{
    auto it = m_live.find(pointerId);
    if (it == m_live.end()) {
        return nullptr;
    }
    std::unique_ptr<InkStroke> stroke = std::move(it->second);
    m_live.erase(it);

    if (!stroke->isFinished) {
        seal(*stroke);
    }
    return stroke;
}

InkStroke* StrokeEngine::liveStroke(int pointerId) const
{
    auto it = m_live.find(pointerId);
    return it == m_live.end() ? nullptr : it->second.get();
}

QVector<const InkStroke*> StrokeEngine::liveStrokes() const
{
    QVector<const InkStroke*> result;
    result.reserve(static_cast<int>(m_live.size()));
    for (const auto& entry : m_live) {
        result.append(entry.second.get());
    }
    // unordered_map iteration order is unspecified; keep output stable
    std::sort(result.begin(), result.end(), [](const InkStroke* a, const InkStroke* b) {
        return a->id < b->id;
    });
    return result;
}

void StrokeEngine::reset()
{
    m_live.clear();
}

// ===== Stroke-level primitives =====

qreal StrokeEngine::spacingFor(const InkStroke& stroke) const
{
    if (m_settings.smoothingEnabled) {
        return qMax<qreal>(0.35, stroke.baseWidth * m_settings.resampleSpacing);
    }
    return qMax<qreal>(0.15, stroke.baseWidth * 0.15);
}

void StrokeEngine::emitPoint(InkStroke& stroke, const QPointF& pos, qreal pressure,
                             const std::optional<QPointF>& tilt, qreal time) const
{
    const InkPoint& last = stroke.points.last();
    const qreal segment = QLineF(last.pos, pos).length();
    const qreal dt = qMax<qreal>(1.0, time - last.time);
    const qreal instantaneous = segment / dt;

    InkPoint pt(pos, pressure, time);
    pt.tilt = tilt;
    pt.length = last.length + segment;
    pt.velocity = lerp(stroke.lastVelocity, instantaneous, m_settings.velocitySmoothing);

    stroke.points.append(pt);
    stroke.lastVelocity = pt.velocity;
    stroke.totalLength = pt.length;
    stroke.expandBounds(pos, pressure);
}

void StrokeEngine::appendSample(InkStroke& stroke, const QPointF& pos, qreal pressure,
                                std::optional<QPointF> tilt, qreal time) const
{
    if (stroke.isFinished || !InkStroke::isWithinWorld(pos)) {
        return;
    }
    if (stroke.points.isEmpty()) {
        qWarning() << "StrokeEngine::appendSample: stroke" << stroke.id << "has no first point";
        return;
    }

    pressure = sanitizePressure(pressure);
    tilt = sanitizeTilt(tilt);
    if (!std::isfinite(time)) {
        time = stroke.lastRawTime;
    }
    // Emitted points keep monotonic timestamps even if the device does not
    time = qMax(time, stroke.lastRawTime);

    // 1-2: raw displacement and speed
    const qreal dist = QLineF(stroke.lastRaw, pos).length();
    const qreal dt = qMax<qreal>(1.0, time - stroke.lastRawTime);
    const qreal speedRaw = dist / dt;

    QPointF filtered = pos;
    if (m_settings.smoothingEnabled) {
        // 3: filter alpha follows pointer speed
        const qreal t = smoothstep(m_settings.speedLow, m_settings.speedHigh, speedRaw);
        qreal alpha = lerp(m_settings.minSmoothing, m_settings.maxSmoothing, t);

        // 4: turn angle scales alpha down
        if (stroke.rawCount >= 2) {
            const QPointF v1 = stroke.lastRaw - stroke.prevRaw;
            const QPointF v2 = pos - stroke.lastRaw;
            const qreal len1 = std::hypot(v1.x(), v1.y());
            const qreal len2 = std::hypot(v2.x(), v2.y());
            if (len1 > 1e-9 && len2 > 1e-9) {
                const qreal cosTheta = qBound<qreal>(
                    -1.0, (v1.x() * v2.x() + v1.y() * v2.y()) / (len1 * len2), 1.0);
                const qreal curvature = qMin<qreal>(1.0, 1.0 - cosTheta);
                alpha *= (1.0 - curvature * m_settings.curvatureBoost);
            }
        }

        // 5: exponential position filter
        filtered = QPointF(lerp(stroke.lastFiltered.x(), pos.x(), alpha),
                           lerp(stroke.lastFiltered.y(), pos.y(), alpha));
    }
    stroke.lastFiltered = filtered;

    if (dist > 1e-9) {
        stroke.prevRaw = stroke.lastRaw;
        stroke.lastRaw = pos;
        ++stroke.rawCount;
    }
    stroke.lastRawTime = time;
    stroke.updatedAt = time;

    // 6-7: spacing-gated emission
    const InkPoint last = stroke.points.last();
    const qreal spacing = spacingFor(stroke);
    const qreal emitDist = QLineF(last.pos, filtered).length();
    if (emitDist <= spacing) {
        return;
    }

    const int cap = m_settings.maxPointsPerStroke;
    const int steps = static_cast<int>(std::ceil(emitDist / spacing));
    for (int i = 1; i <= steps; ++i) {
        if (cap > 0 && stroke.points.size() >= cap) {
            sealAtCap(stroke);
            return;
        }
        const qreal t = static_cast<qreal>(i) / steps;
        const QPointF p(lerp(last.x(), filtered.x(), t), lerp(last.y(), filtered.y(), t));
        emitPoint(stroke, p, lerp(last.pressure, pressure, t), tilt, lerp(last.time, time, t));
    }

    if (cap > 0 && stroke.points.size() >= cap) {
        sealAtCap(stroke);
    }
}

void StrokeEngine::sealAtCap(InkStroke& stroke) const
{
    qDebug() << "StrokeEngine::appendSample: stroke" << stroke.id
             << "reached" << stroke.points.size() << "points, sealing";
    // No tail flush past the cap
    stroke.lastFiltered = stroke.points.last().pos;
    seal(stroke);
}

void StrokeEngine::seal(InkStroke& stroke) const
{
    if (stroke.isFinished) {
        return;
    }

    // Flush the filter lag so the stroke ends where the filtered pen was
    if (!stroke.points.isEmpty()) {
        const InkPoint& last = stroke.points.last();
        if (QLineF(last.pos, stroke.lastFiltered).length() > TAIL_FLUSH_EPSILON) {
            emitPoint(stroke, stroke.lastFiltered, last.pressure, last.tilt,
                      qMax(last.time, stroke.lastRawTime));
        }
    }

    stroke.isFinished = true;

    if (m_settings.angleCulling && stroke.points.size() > 4) {
        StrokeOptimizer::Result culled = m_optimizer.optimize(stroke.points, stroke.baseWidth);
        if (culled.nodes.size() < stroke.points.size()) {
            qDebug() << "StrokeEngine::seal: culled stroke" << stroke.id << "from"
                     << stroke.points.size() << "to" << culled.nodes.size() << "points";
            stroke.points = culled.nodes;
            stroke.recomputeLengths();
        }
    }

    stroke.updateBoundingBox();
}

// ===== Width =====

qreal StrokeEngine::pointWidth(const InkStroke& stroke, int index) const
{
    const qreal base = stroke.baseWidth;
    if (index < 0 || index >= stroke.points.size()) {
        return base;
    }
    const InkPoint& pt = stroke.points[index];

    const qreal pressureScale = qMax<qreal>(0.25, pt.pressure);
    const qreal speedScale = 1.0 / (1.0 + qMax<qreal>(0.0, pt.velocity) * m_settings.speedInfluence);

    const qreal total = stroke.totalLength;
    const qreal headLength = qMin(qMax<qreal>(6.0, base * m_settings.headTaperFactor), total * 0.45);
    const qreal tailLength = qMin(qMax<qreal>(8.0, base * m_settings.tailTaperFactor), total * 0.45);

    const qreal headTaper = headLength > 0.0 ? smoothstep(0.0, headLength, pt.length) : 1.0;
    qreal tailTaper = 1.0;
    if (stroke.isFinished && tailLength > 0.0) {
        tailTaper = smoothstep(0.0, tailLength, total - pt.length);
    }

    const qreal width = base * pressureScale * speedScale * headTaper * tailTaper;
    return qBound(base * m_settings.minWidthScale, width, base * m_settings.maxWidthScale);
}

QVector<float> StrokeEngine::pointWidths(const InkStroke& stroke) const
{
    QVector<float> widths(stroke.points.size());
    for (int i = 0; i < stroke.points.size(); ++i) {
        widths[i] = static_cast<float>(pointWidth(stroke, i));
    }
    return widths;
}
