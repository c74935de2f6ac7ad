#include "TileCache.h"

#include <QDebug>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace {

QList<quint32> sortedIds(const QSet<quint32>& ids)
{
    QList<quint32> list = ids.values();
    std::sort(list.begin(), list.end());
    return list;
}

} // namespace

// ============================================================================
// Tile
// ============================================================================

Tile::Tile(const TileCoord& coord, int pixelSize)
    : m_coord(coord)
    , m_pixelSize(qMax(1, pixelSize))
{
}

bool Tile::addStroke(quint32 strokeId)
{
    if (m_strokeIds.contains(strokeId)) {
        return false;
    }
    m_strokeIds.insert(strokeId);
    markDirty();
    return true;
}

bool Tile::addEraseStroke(quint32 strokeId)
{
    if (m_eraseIds.contains(strokeId)) {
        return false;
    }
    m_eraseIds.insert(strokeId);
    markDirty();
    return true;
}

void Tile::markDirty()
{
    m_dirty = true;
    ++m_generation;
}

void Tile::clear()
{
    m_image = QImage();
    m_strokeIds.clear();
    m_eraseIds.clear();
    markDirty();
}

void Tile::resize(int pixelSize)
{
    m_pixelSize = qMax(1, pixelSize);
    markDirty();
}

bool Tile::setBakedImage(const QImage& image, quint64 generation)
{
    if (generation != m_generation || image.isNull()) {
        return false;
    }
    m_image = image;
    m_dirty = false;
    return true;
}

// ============================================================================
// TileManager
// ============================================================================

TileManager::TileManager(QObject* parent)
    : QObject(parent)
{
    m_rebakeTimer.setSingleShot(true);
    m_rebakeTimer.setInterval(REBAKE_DEBOUNCE_MS);
    connect(&m_rebakeTimer, &QTimer::timeout, this, &TileManager::rebakeDue);
}

TileManager::~TileManager()
{
    m_rebakeTimer.stop();
}

Tile* TileManager::getTile(const TileCoord& coord)
{
    auto it = m_tiles.find(coord);
    if (it == m_tiles.end()) {
        it = m_tiles.emplace(coord, std::make_unique<Tile>(coord, tilePixelSize())).first;
    }
    return it->second.get();
}

Tile* TileManager::findTile(const TileCoord& coord) const
{
    auto it = m_tiles.find(coord);
    return it != m_tiles.end() ? it->second.get() : nullptr;
}

QVector<Tile*> TileManager::getAffectedTiles(const QRectF& bounds)
{
    QVector<Tile*> tiles;
    for (const TileCoord& coord : TileCoord::covering(bounds)) {
        tiles.append(getTile(coord));
    }
    return tiles;
}

QVector<Tile*> TileManager::getVisibleTiles(const CanvasViewport& viewport)
{
    return getAffectedTiles(viewport.visibleWorldRect());
}

QVector<Tile*> TileManager::addStroke(quint32 strokeId, const QRectF& bounds)
{
    QVector<Tile*> tiles = getAffectedTiles(bounds);
    for (Tile* tile : tiles) {
        tile->addStroke(strokeId);
    }
    return tiles;
}

QVector<Tile*> TileManager::addEraseStroke(quint32 strokeId, const QRectF& bounds)
{
    QVector<Tile*> tiles = getAffectedTiles(bounds);
    for (Tile* tile : tiles) {
        tile->addEraseStroke(strokeId);
    }
    return tiles;
}

void TileManager::clearAll()
{
    if (m_worker) {
        m_worker->cancelAll();
    }
    for (auto& entry : m_tiles) {
        entry.second->clear();
    }
}

QVector<Tile*> TileManager::renderTilesWithErase(MeshProvider& strokes, MeshProvider& erasers,
                                                 const CanvasViewport& viewport)
{
    QVector<Tile*> visible = getVisibleTiles(viewport);
    for (Tile* tile : visible) {
        if (tile->isDirty()) {
            bakeTile(*tile, strokes, erasers);
        }
    }
    return visible;
}

TileBakeJob TileManager::makeBakeJob(const Tile& tile, MeshProvider& strokes,
                                     MeshProvider& erasers) const
{
    TileBakeJob job;
    job.coord = tile.coord();
    job.generation = tile.generation();
    job.pixelSize = tile.pixelSize();

    for (quint32 id : sortedIds(tile.strokeIds())) {
        QVector<float> mesh = strokes.meshForStroke(id);
        if (!mesh.isEmpty()) {
            job.strokes.append(std::move(mesh));
        }
    }
    for (quint32 id : sortedIds(tile.eraseIds())) {
        QVector<float> mesh = erasers.meshForStroke(id);
        if (!mesh.isEmpty()) {
            job.erasers.append(std::move(mesh));
        }
    }
    return job;
}

void TileManager::bakeTile(Tile& tile, MeshProvider& strokes, MeshProvider& erasers)
{
    const TileBakeJob job = makeBakeJob(tile, strokes, erasers);
    if (!tile.setBakedImage(job.bake(), job.generation)) {
        qWarning() << "TileManager::bakeTile: bake rejected for tile" << tile.coord().key();
    }
}

int TileManager::rebakeVisibleNow(MeshProvider& strokes, MeshProvider& erasers,
                                  const CanvasViewport& viewport)
{
    m_rebakeTimer.stop();

    int count = 0;
    for (Tile* tile : getVisibleTiles(viewport)) {
        if (!tile->isDirty()) {
            continue;
        }
        if (m_worker && m_worker->isRunning()) {
            m_worker->requestBake(makeBakeJob(*tile, strokes, erasers));
        } else {
            bakeTile(*tile, strokes, erasers);
        }
        ++count;
    }
    return count;
}

void TileManager::setDeviceScale(qreal scale)
{
    if (!std::isfinite(scale) || scale <= 0) {
        qWarning() << "TileManager::setDeviceScale: ignoring invalid scale" << scale;
        return;
    }
    if (qFuzzyCompare(scale, m_deviceScale)) {
        return;
    }

    m_deviceScale = scale;
    const int pixels = tilePixelSize();
    for (auto& entry : m_tiles) {
        entry.second->resize(pixels);
    }
    qDebug() << "TileManager::setDeviceScale:" << scale << "tiles now" << pixels << "px";

    m_rebakeTimer.start();
}

int TileManager::tilePixelSize() const
{
    return qMax(1, qCeil(TILE_SIZE * m_deviceScale));
}

void TileManager::setBakeWorker(TileBakeWorker* worker)
{
    if (m_worker == worker) {
        return;
    }
    if (m_worker) {
        disconnect(m_worker, nullptr, this, nullptr);
    }
    m_worker = worker;
    if (m_worker) {
        connect(m_worker, &TileBakeWorker::tileBaked, this, &TileManager::onTileBaked);
    }
}

void TileManager::onTileBaked(TileCoord coord, QImage image, quint64 generation)
{
    Tile* tile = findTile(coord);
    if (!tile) {
        return;
    }
    if (!tile->setBakedImage(image, generation)) {
        qDebug() << "TileManager::onTileBaked: stale result for tile" << coord.key();
        return;
    }
    emit tileUpdated(coord);
}
