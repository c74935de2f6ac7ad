#include "SpatialIndex.h"

#include <QtMath>
#include <cmath>

namespace {

int tileIndex(qreal world)
{
    if (std::isnan(world)) {
        return 0;
    }
    const qreal index = std::floor(world / TileCoord::TILE_SIZE);
    return static_cast<int>(qBound<qreal>(-TileCoord::MAX_INDEX, index, TileCoord::MAX_INDEX));
}

} // namespace

TileCoord TileCoord::fromWorld(const QPointF& world)
{
    return TileCoord(tileIndex(world.x()), tileIndex(world.y()));
}

QVector<TileCoord> TileCoord::covering(const QRectF& rect)
{
    QVector<TileCoord> result;
    if (rect.isNull() || !std::isfinite(rect.left()) || !std::isfinite(rect.top())
        || !std::isfinite(rect.right()) || !std::isfinite(rect.bottom())) {
        return result;
    }

    const QRectF r = rect.normalized();
    const qreal low = -qreal(MAX_INDEX) * TILE_SIZE;
    const qreal high = qreal(MAX_INDEX + 1) * TILE_SIZE;
    if (r.right() < low || r.bottom() < low || r.left() >= high || r.top() >= high) {
        return result;
    }

    const TileCoord start = fromWorld(r.topLeft());
    const TileCoord end = fromWorld(r.bottomRight());

    result.reserve((end.x - start.x + 1) * (end.y - start.y + 1));
    for (int ty = start.y; ty <= end.y; ++ty) {
        for (int tx = start.x; tx <= end.x; ++tx) {
            result.append(TileCoord(tx, ty));
        }
    }
    return result;
}

QVector<TileCoord> SpatialIndex::insert(quint32 strokeId, const QRectF& bounds)
{
    const QVector<TileCoord> tiles = TileCoord::covering(bounds);
    for (const TileCoord& coord : tiles) {
        m_buckets[coord].insert(strokeId);
    }
    return tiles;
}

QSet<quint32> SpatialIndex::query(const QRectF& rect) const
{
    QSet<quint32> result;
    for (const TileCoord& coord : TileCoord::covering(rect)) {
        auto it = m_buckets.constFind(coord);
        if (it != m_buckets.constEnd()) {
            result.unite(it.value());
        }
    }
    return result;
}
