#pragma once

// ============================================================================
// InkDocument - The whiteboard: strokes, erasers, tiles and capture
// ============================================================================
// Owns the capture engine, the finished ink and eraser strokes, the spatial
// index, the tile manager and the mesh cache, and wires them together:
//
//   handlePointer()  ->  StrokeEngine  ->  commitStroke()
//                                             |-> SpatialIndex (ink)
//                                             |-> TileManager  (dirty tiles)
//                                             '-> MeshCache    (warm + async)
//   renderFrame(sink) -> baked tiles + live meshes, backend-neutral
//
// Worker pools are optional and injected through setWorkers(); the document
// never creates or owns threads.
// ============================================================================

#include "CanvasViewport.h"
#include "InkSettings.h"
#include "PointerEvent.h"
#include "SpatialIndex.h"
#include "TileCache.h"
#include "../codec/IsfCodec.h"
#include "../render/MeshBuilder.h"
#include "../strokes/StrokeEngine.h"

#include <QByteArray>
#include <QColor>
#include <QHash>
#include <QObject>
#include <QRectF>
#include <map>
#include <memory>

class MeshCache;
class MeshWorkerPool;
class RenderSink;
class TileBakeWorker;

class InkDocument : public QObject {
    Q_OBJECT

public:
    explicit InkDocument(const InkSettings& settings = InkSettings(),
                         MeshBuilder::Kind meshBuilder = MeshBuilder::Kind::Packed,
                         QObject* parent = nullptr);
    ~InkDocument() override;

    // ===== Components =====

    StrokeEngine& engine() { return m_engine; }
    const StrokeEngine& engine() const { return m_engine; }

    CanvasViewport& viewport() { return m_viewport; }
    const CanvasViewport& viewport() const { return m_viewport; }

    TileManager& tiles() { return *m_tiles; }
    MeshCache& meshCache() { return *m_meshCache; }
    const SpatialIndex& spatialIndex() const { return m_index; }

    /**
     * @brief Inject (or remove, with nullptr) the worker pools. Not owned.
     */
    void setWorkers(MeshWorkerPool* meshPool, TileBakeWorker* bakeWorker);

    // ===== Tool =====

    QColor penColor() const { return m_penColor; }
    void setPenColor(const QColor& color) { m_penColor = color.isValid() ? color : QColor(Qt::black); }

    qreal penWidth() const { return m_penWidth; }
    void setPenWidth(qreal width) { if (width > 0) m_penWidth = width; }

    qreal eraserWidth() const { return m_eraserWidth; }
    void setEraserWidth(qreal width) { if (width > 0) m_eraserWidth = width; }

    /**
     * @brief In eraser mode every new stroke erases, whatever the buttons.
     */
    bool eraserMode() const { return m_eraserMode; }
    void setEraserMode(bool enabled) { m_eraserMode = enabled; }

    // ===== Input =====

    /**
     * @brief Route a screen-space pointer event to the capture engine.
     * @return true if the event started, extended or ended a stroke.
     */
    bool handlePointer(const PointerEvent& event);

    /**
     * @brief Add a stroke to the document, sealing it first if needed.
     * @return The stored stroke, or nullptr for a null or empty stroke.
     *
     * A stroke whose id is already taken gets a fresh id.
     */
    const InkStroke* commitStroke(std::unique_ptr<InkStroke> stroke);

    // ===== Queries =====

    /**
     * @brief Finished ink or eraser stroke by id, or nullptr.
     */
    const InkStroke* stroke(quint32 strokeId) const;

    /// Finished ink strokes in id order
    QVector<const InkStroke*> strokes() const;
    /// Finished eraser strokes in id order
    QVector<const InkStroke*> eraseStrokes() const;

    int strokeCount() const { return static_cast<int>(m_inkStore->strokes.size()); }
    int eraseStrokeCount() const { return static_cast<int>(m_eraseStore->strokes.size()); }
    bool isEmpty() const { return strokeCount() == 0 && eraseStrokeCount() == 0; }

    QSet<quint32> strokesInBucket(const TileCoord& coord) const { return m_index.strokesInBucket(coord); }
    QSet<quint32> queryStrokes(const QRectF& worldRect) const { return m_index.query(worldRect); }

    /**
     * @brief Union of the drawn extents of the finished ink strokes.
     */
    QRectF inkBounds() const;

    /**
     * @brief Area the stroke's baked mesh can touch; null for an unknown id.
     *
     * Contains the stroke's bounds and every mesh vertex. Tile membership
     * and spatial buckets are derived from this rect.
     */
    QRectF drawnBounds(quint32 strokeId) const { return m_drawnBounds.value(strokeId); }

    /**
     * @brief One vertex buffer with every finished and live ink stroke.
     *
     * Eraser strokes are not included.
     */
    QVector<float> allVertices();

    // ===== Rendering =====

    /**
     * @brief Bring the visible tiles up to date and return them.
     *
     * While a device-scale rebake is pending the tiles are returned as they
     * are, so the debounce window is not defeated by frame requests.
     */
    QVector<Tile*> renderVisibleTiles();

    /**
     * @brief Describe the current frame to a sink.
     */
    void renderFrame(RenderSink& sink);

    void setDeviceScale(qreal scale) { m_tiles->setDeviceScale(scale); }

    // ===== Persistence =====

    /**
     * @brief Every finished stroke (ink and eraser) in id order as one container.
     */
    QByteArray serializeAll(const IsfOptions& options = IsfOptions()) const;

    /**
     * @brief Replace the document with a container's strokes.
     *
     * All-or-nothing: on a decode error the document is left untouched.
     */
    bool loadFromIsf(const QByteArray& bytes, IsfParseError* error = nullptr);

    CompressionStats compressionStats(const IsfOptions& options = IsfOptions()) const;

    /**
     * @brief Drop every stroke (finished and live) and clear all tiles.
     */
    void clear();

public slots:
    /**
     * @brief Rebake dirty visible tiles now, on the bake worker when one is
     *        set and synchronously otherwise. Cancels a pending debounce.
     */
    void rebakeVisible();

signals:
    void strokeCommitted(quint32 strokeId);

    /**
     * @brief Visible content changed; a new frame should be rendered.
     */
    void changed();

private slots:
    void onMeshReady(quint32 strokeId);

private:
    /**
     * @brief Finished strokes of one role, meshed through the shared cache.
     */
    class StrokeStore : public MeshProvider {
    public:
        StrokeStore(MeshCache& cache, const StrokeEngine& engine)
            : m_cache(cache), m_engine(engine) {}

        QVector<float> meshForStroke(quint32 strokeId) override;
        const InkStroke* find(quint32 strokeId) const;
        QVector<const InkStroke*> ordered() const;

        std::map<quint32, std::unique_ptr<InkStroke>> strokes;

    private:
        MeshCache& m_cache;
        const StrokeEngine& m_engine;
    };

    void registerExtent(const InkStroke& stroke, const QRectF& extent);

    StrokeEngine m_engine;
    CanvasViewport m_viewport;
    SpatialIndex m_index;
    QHash<quint32, QRectF> m_drawnBounds;
    std::unique_ptr<MeshCache> m_meshCache;
    std::unique_ptr<TileManager> m_tiles;
    std::unique_ptr<StrokeStore> m_inkStore;
    std::unique_ptr<StrokeStore> m_eraseStore;

    QColor m_penColor = Qt::black;
    qreal m_penWidth = 3.0;
    qreal m_eraserWidth = 24.0;
    bool m_eraserMode = false;
};
