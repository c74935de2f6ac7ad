#pragma once

// ============================================================================
// SpatialIndex - Tile-bucketed stroke lookup
// ============================================================================
// The world plane is cut into TILE_SIZE squares. Every stroke is registered
// in each bucket its bounding box touches, so a bucket may name strokes that
// miss it (false positive) but never misses a stroke that hits it.
// ============================================================================

#include "../compat/qt_compat.h"

#include <QHash>
#include <QPointF>
#include <QRectF>
#include <QSet>
#include <QString>
#include <QVector>

/**
 * @brief Integer tile address: (floor(x / TILE_SIZE), floor(y / TILE_SIZE)).
 */
struct TileCoord {
    static constexpr int TILE_SIZE = 256;
    /// Tile indices are clamped to [-MAX_INDEX, MAX_INDEX]; the range holds
    /// InkStroke::MAX_COORDINATE plus the widest ribbon around it
    static constexpr int MAX_INDEX = 1024;

    int x = 0;
    int y = 0;

    TileCoord() = default;
    TileCoord(int tileX, int tileY) : x(tileX), y(tileY) {}

    /**
     * @brief Diagnostic key, "x,y".
     */
    QString key() const { return QStringLiteral("%1,%2").arg(x).arg(y); }

    /**
     * @brief Covered world square, TILE_SIZE × TILE_SIZE units.
     */
    QRectF worldRect() const {
        return QRectF(qreal(x) * TILE_SIZE, qreal(y) * TILE_SIZE, TILE_SIZE, TILE_SIZE);
    }

    /**
     * @brief Tile holding a world point, clamped to the index range.
     */
    static TileCoord fromWorld(const QPointF& world);

    /**
     * @brief Every tile overlapping rect, edges inclusive, row-major.
     *
     * Returns nothing for a null or non-finite rect, or one wholly outside
     * the index range; a rect reaching past the range is cut at its edge.
     */
    static QVector<TileCoord> covering(const QRectF& rect);

    bool operator==(const TileCoord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const TileCoord& other) const { return !(*this == other); }
};

inline IB_HashType qHash(const TileCoord& coord, IB_HashType seed = 0)
{
    return qHash(qMakePair(coord.x, coord.y), seed);
}

/// std::unordered_map adaptor
struct TileCoordHasher {
    size_t operator()(const TileCoord& coord) const {
        return static_cast<size_t>(qHash(coord));
    }
};

Q_DECLARE_METATYPE(TileCoord)

class SpatialIndex {
public:
    /**
     * @brief Register a stroke in every bucket its bounds touch.
     * @return The buckets it was added to.
     */
    QVector<TileCoord> insert(quint32 strokeId, const QRectF& bounds);

    QSet<quint32> strokesInBucket(const TileCoord& coord) const { return m_buckets.value(coord); }

    /**
     * @brief Candidate strokes for a world rectangle (superset).
     */
    QSet<quint32> query(const QRectF& rect) const;

    int bucketCount() const { return m_buckets.size(); }
    bool isEmpty() const { return m_buckets.isEmpty(); }
    void clear() { m_buckets.clear(); }

private:
    QHash<TileCoord, QSet<quint32>> m_buckets;
};
