#pragma once

// ============================================================================
// TileBakeWorker - Async tile rasterization
// ============================================================================
// Bakes TileBakeJob snapshots on an owned QThreadPool and reports the result
// with tileBaked(). Jobs carry copies of every mesh they need; worker
// threads never touch TileManager, Tile or stroke objects.
//
// A newer request for the same tile supersedes the older one: the older
// result is dropped when it lands.
// ============================================================================

#include "SpatialIndex.h"

#include <QFutureWatcher>
#include <QHash>
#include <QImage>
#include <QObject>
#include <QThreadPool>
#include <QVector>

/**
 * @brief Everything needed to rebake one tile, copied on the owning thread.
 */
struct TileBakeJob {
    TileCoord coord;
    quint64 generation = 0;             ///< Tile generation the snapshot was taken at
    int pixelSize = 0;
    QVector<QVector<float>> strokes;    ///< Ink meshes, in stroke id order
    QVector<QVector<float>> erasers;    ///< Eraser meshes, in stroke id order

    QImage bake() const;
};

struct TileBakeResult {
    TileCoord coord;
    quint64 generation = 0;
    QImage image;
};

class TileBakeWorker : public QObject {
    Q_OBJECT

public:
    explicit TileBakeWorker(int maxThreads = 2, QObject* parent = nullptr);
    ~TileBakeWorker() override;

    /**
     * @brief Queue a bake. Returns immediately; tileBaked() follows.
     *
     * Ignored after shutdown().
     */
    void requestBake(TileBakeJob job);

    bool isPending(const TileCoord& coord) const { return m_active.contains(coord); }
    int pendingCount() const { return m_active.size(); }
    bool isRunning() const { return !m_shuttingDown; }

    /**
     * @brief Forget every in-flight bake; their results are discarded.
     */
    void cancelAll();

    /**
     * @brief Block until in-flight bakes finish and deliver their results.
     */
    void waitForIdle();

    /**
     * @brief Discard in-flight results and wait for the threads to drain.
     */
    void shutdown();

signals:
    void tileBaked(TileCoord coord, QImage image, quint64 generation);

private:
    using Watcher = QFutureWatcher<TileBakeResult>;

    void onBakeFinished(Watcher* watcher);

    QThreadPool m_pool;
    QHash<TileCoord, Watcher*> m_active;
    bool m_shuttingDown = false;
};
