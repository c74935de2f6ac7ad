#pragma once

// ============================================================================
// TileCache - Lazily created raster tiles over the infinite canvas
// ============================================================================
// A Tile caches the composite of the strokes whose bounds touch it, minus
// the erasers whose bounds touch it. Any membership or device-scale change
// marks it dirty; a dirty tile is rebaked from scratch before it is shown.
//
// Each change also bumps the tile's generation. Bake results (synchronous
// or from TileBakeWorker) are accepted only for the generation they were
// snapshotted at, so a late worker result can never overwrite newer state.
// ============================================================================

#include "CanvasViewport.h"
#include "SpatialIndex.h"
#include "TileBakeWorker.h"

#include <QImage>
#include <QObject>
#include <QSet>
#include <QTimer>
#include <memory>
#include <unordered_map>

/**
 * @brief Source of stroke meshes for tile baking.
 */
class MeshProvider {
public:
    virtual ~MeshProvider() = default;

    /**
     * @return The stroke's mesh, or an empty buffer for an unknown id.
     */
    virtual QVector<float> meshForStroke(quint32 strokeId) = 0;
};

class Tile {
public:
    Tile(const TileCoord& coord, int pixelSize);

    const TileCoord& coord() const { return m_coord; }
    QRectF worldRect() const { return m_coord.worldRect(); }

    /**
     * @brief Current surface. Null until the first bake; may be stale
     *        (older pixel size) while dirty.
     */
    const QImage& image() const { return m_image; }

    int pixelSize() const { return m_pixelSize; }
    bool isDirty() const { return m_dirty; }
    quint64 generation() const { return m_generation; }

    const QSet<quint32>& strokeIds() const { return m_strokeIds; }
    const QSet<quint32>& eraseIds() const { return m_eraseIds; }

    /**
     * @return true if the id was new (the tile is now dirty).
     */
    bool addStroke(quint32 strokeId);
    bool addEraseStroke(quint32 strokeId);

    void markDirty();

    /**
     * @brief Drop the surface and membership. Identity is kept.
     */
    void clear();

    /**
     * @brief Change the target pixel size; takes effect at the next bake.
     */
    void resize(int pixelSize);

    /**
     * @brief Install a baked surface.
     * @return false (and nothing changes) if the tile moved past generation.
     */
    bool setBakedImage(const QImage& image, quint64 generation);

private:
    TileCoord m_coord;
    QImage m_image;
    int m_pixelSize = TileCoord::TILE_SIZE;
    bool m_dirty = true;
    quint64 m_generation = 1;
    QSet<quint32> m_strokeIds;
    QSet<quint32> m_eraseIds;
};

class TileManager : public QObject {
    Q_OBJECT

public:
    static constexpr int TILE_SIZE = TileCoord::TILE_SIZE;
    static constexpr int REBAKE_DEBOUNCE_MS = 150;

    explicit TileManager(QObject* parent = nullptr);
    ~TileManager() override;

    // ===== Lookup =====

    /**
     * @brief The tile at coord, created on first use.
     */
    Tile* getTile(const TileCoord& coord);
    Tile* getTile(int tileX, int tileY) { return getTile(TileCoord(tileX, tileY)); }

    /**
     * @brief Existing tile at coord, or nullptr. Never creates.
     */
    Tile* findTile(const TileCoord& coord) const;

    int tileCount() const { return static_cast<int>(m_tiles.size()); }

    /**
     * @brief Every tile overlapping bounds (edges inclusive), created lazily.
     */
    QVector<Tile*> getAffectedTiles(const QRectF& bounds);

    /**
     * @brief Every tile overlapping the viewport's world rectangle.
     */
    QVector<Tile*> getVisibleTiles(const CanvasViewport& viewport);

    // ===== Membership =====

    QVector<Tile*> addStroke(quint32 strokeId, const QRectF& bounds);
    QVector<Tile*> addEraseStroke(quint32 strokeId, const QRectF& bounds);

    /**
     * @brief Clear every tile (surface and membership) and cancel bakes.
     */
    void clearAll();

    // ===== Baking =====

    /**
     * @brief Rebake dirty visible tiles synchronously.
     * @return All visible tiles. Dirty tiles outside the viewport stay dirty.
     */
    QVector<Tile*> renderTilesWithErase(MeshProvider& strokes, MeshProvider& erasers,
                                        const CanvasViewport& viewport);

    /**
     * @brief Rebake one tile from scratch: ink in id order, then erasers.
     */
    void bakeTile(Tile& tile, MeshProvider& strokes, MeshProvider& erasers);

    /**
     * @brief Snapshot of what bakeTile() would draw.
     */
    TileBakeJob makeBakeJob(const Tile& tile, MeshProvider& strokes, MeshProvider& erasers) const;

    /**
     * @brief Rebake dirty visible tiles now: on the worker if one is set,
     *        synchronously otherwise.
     * @return Number of tiles baked or queued.
     */
    int rebakeVisibleNow(MeshProvider& strokes, MeshProvider& erasers,
                         const CanvasViewport& viewport);

    // ===== Device scale =====

    qreal deviceScale() const { return m_deviceScale; }

    /**
     * @brief Mark every tile dirty at the new pixel density and (re)start
     *        the debounce timer. rebakeDue() fires once input settles.
     */
    void setDeviceScale(qreal scale);

    int tilePixelSize() const;

    bool isRebakeScheduled() const { return m_rebakeTimer.isActive(); }

    /**
     * @brief Bake worker used by rebakeVisibleNow(). Not owned.
     */
    void setBakeWorker(TileBakeWorker* worker);
    TileBakeWorker* bakeWorker() const { return m_worker; }

signals:
    /**
     * @brief The debounce window after a device-scale change has elapsed.
     */
    void rebakeDue();

    /**
     * @brief A worker result was installed on a tile.
     */
    void tileUpdated(TileCoord coord);

private slots:
    void onTileBaked(TileCoord coord, QImage image, quint64 generation);

private:
    std::unordered_map<TileCoord, std::unique_ptr<Tile>, TileCoordHasher> m_tiles;
    qreal m_deviceScale = 1.0;
    TileBakeWorker* m_worker = nullptr;
    QTimer m_rebakeTimer;
};
