#include "InkDocument.h"
#include "TileBakeWorker.h"
#include "../render/MeshCache.h"
#include "../render/MeshWorkerPool.h"
#include "../render/RenderSink.h"

#include <QDebug>
#include <QSet>
#include <algorithm>

namespace {

// Slack for float rounding between the two mesh builders
constexpr qreal DRAWN_MARGIN = 0.5;

// Every pixel the baked mesh fills lies inside this rect. The mesh can reach
// past the per-point radius boxes (width floor, miter tips).
QRectF drawnExtent(const InkStroke& stroke, const QVector<float>& mesh)
{
    return stroke.bounds.united(MeshBuilder::vertexBounds(mesh))
        .adjusted(-DRAWN_MARGIN, -DRAWN_MARGIN, DRAWN_MARGIN, DRAWN_MARGIN);
}

} // namespace

// ============================================================================
// StrokeStore
// ============================================================================

QVector<float> InkDocument::StrokeStore::meshForStroke(quint32 strokeId)
{
    const InkStroke* s = find(strokeId);
    return s ? m_cache.meshFor(*s, m_engine) : QVector<float>();
}

const InkStroke* InkDocument::StrokeStore::find(quint32 strokeId) const
{
    auto it = strokes.find(strokeId);
    return it != strokes.end() ? it->second.get() : nullptr;
}

QVector<const InkStroke*> InkDocument::StrokeStore::ordered() const
{
    QVector<const InkStroke*> result;
    result.reserve(static_cast<int>(strokes.size()));
    for (const auto& entry : strokes) {
        result.append(entry.second.get());
    }
    return result;
}

// ============================================================================
// InkDocument
// ============================================================================

InkDocument::InkDocument(const InkSettings& settings, MeshBuilder::Kind meshBuilder, QObject* parent)
    : QObject(parent)
    , m_engine(settings)
    , m_meshCache(std::make_unique<MeshCache>(MeshBuilder::create(meshBuilder)))
    , m_tiles(std::make_unique<TileManager>())
{
    m_inkStore = std::make_unique<StrokeStore>(*m_meshCache, m_engine);
    m_eraseStore = std::make_unique<StrokeStore>(*m_meshCache, m_engine);

    connect(m_tiles.get(), &TileManager::rebakeDue, this, &InkDocument::rebakeVisible);
    connect(m_tiles.get(), &TileManager::tileUpdated, this, &InkDocument::changed);
    connect(m_meshCache.get(), &MeshCache::meshReady, this, &InkDocument::onMeshReady);
}

InkDocument::~InkDocument()
{
    // Workers belong to the caller; stop listening before members go away
    m_tiles->setBakeWorker(nullptr);
    m_meshCache->setWorkerPool(nullptr);
}

void InkDocument::setWorkers(MeshWorkerPool* meshPool, TileBakeWorker* bakeWorker)
{
    m_meshCache->setWorkerPool(meshPool);
    m_tiles->setBakeWorker(bakeWorker);
}

// ===== Input =====

bool InkDocument::handlePointer(const PointerEvent& event)
{
    const int id = event.pointerId;

    switch (event.phase) {
    case PointerEvent::Phase::Down: {
        const bool erase = m_eraserMode || event.isEraserButton();
        const QPointF world = m_viewport.screenToWorld(event.client);
        InkStroke* stroke = m_engine.pointerDown(id, world, m_penColor,
                                                 erase ? m_eraserWidth : m_penWidth,
                                                 event.pressure, event.tilt, event.timestamp, erase);
        if (!stroke) {
            return false;
        }
        emit changed();
        return true;
    }
    case PointerEvent::Phase::Move: {
        InkStroke* live = m_engine.liveStroke(id);
        if (!live) {
            return false;
        }
        m_engine.pointerMove(id, m_viewport.screenToWorld(event.client),
                             event.pressure, event.tilt, event.timestamp);
        if (live->isFinished) {
            // Point cap reached: the engine sealed it, store it now
            commitStroke(m_engine.pointerUp(id));
        }
        emit changed();
        return true;
    }
    case PointerEvent::Phase::Up:
    case PointerEvent::Phase::Cancel: {
        std::unique_ptr<InkStroke> stroke = event.phase == PointerEvent::Phase::Up
            ? m_engine.pointerUp(id)
            : m_engine.pointerCancel(id);
        if (!stroke) {
            return false;
        }
        commitStroke(std::move(stroke));
        return true;
    }
    }
    return false;
}

const InkStroke* InkDocument::commitStroke(std::unique_ptr<InkStroke> stroke)
{
    if (!stroke || stroke->isEmpty()) {
        return nullptr;
    }
    if (!stroke->isFinished) {
        m_engine.seal(*stroke);
    }

    if (stroke->id == 0 || m_inkStore->find(stroke->id) || m_eraseStore->find(stroke->id)) {
        const quint32 fresh = m_engine.nextStrokeId();
        qDebug() << "InkDocument::commitStroke: id" << stroke->id << "taken, using" << fresh;
        stroke->id = fresh;
    }
    m_engine.reserveStrokeIds(stroke->id + 1);

    const quint32 id = stroke->id;
    InkStroke* stored = stroke.get();
    StrokeStore& store = stroke->isEraser ? *m_eraseStore : *m_inkStore;
    store.strokes[id] = std::move(stroke);

    // Warm the cache; with a refining worker pool this also queues a job
    const QVector<float> mesh = m_meshCache->meshFor(*stored, m_engine);
    registerExtent(*stored, drawnExtent(*stored, mesh));

    emit strokeCommitted(id);
    emit changed();
    return stored;
}

// ===== Queries =====

const InkStroke* InkDocument::stroke(quint32 strokeId) const
{
    if (const InkStroke* s = m_inkStore->find(strokeId)) {
        return s;
    }
    return m_eraseStore->find(strokeId);
}

QVector<const InkStroke*> InkDocument::strokes() const
{
    return m_inkStore->ordered();
}

QVector<const InkStroke*> InkDocument::eraseStrokes() const
{
    return m_eraseStore->ordered();
}

QRectF InkDocument::inkBounds() const
{
    QRectF bounds;
    for (const auto& entry : m_inkStore->strokes) {
        bounds = bounds.united(drawnBounds(entry.first));
    }
    return bounds;
}

void InkDocument::registerExtent(const InkStroke& stroke, const QRectF& extent)
{
    m_drawnBounds.insert(stroke.id, extent);
    if (stroke.isEraser) {
        m_tiles->addEraseStroke(stroke.id, extent);
    } else {
        m_index.insert(stroke.id, extent);
        m_tiles->addStroke(stroke.id, extent);
    }
}

QVector<float> InkDocument::allVertices()
{
    QVector<float> vertices;
    for (const auto& entry : m_inkStore->strokes) {
        vertices += m_meshCache->meshFor(*entry.second, m_engine);
    }
    for (const InkStroke* live : m_engine.liveStrokes()) {
        if (!live->isEraser) {
            vertices += m_meshCache->meshFor(*live, m_engine);
        }
    }
    return vertices;
}

// ===== Rendering =====

QVector<Tile*> InkDocument::renderVisibleTiles()
{
    if (m_tiles->isRebakeScheduled()) {
        return m_tiles->getVisibleTiles(m_viewport);
    }
    return m_tiles->renderTilesWithErase(*m_inkStore, *m_eraseStore, m_viewport);
}

void InkDocument::renderFrame(RenderSink& sink)
{
    const QVector<Tile*> visible = renderVisibleTiles();

    sink.beginFrame(m_viewport);
    for (const Tile* tile : visible) {
        if (tile->strokeIds().isEmpty()) {
            continue;
        }
        sink.drawTile(tile->coord(), tile->image());
    }
    for (const InkStroke* live : m_engine.liveStrokes()) {
        sink.drawLiveMesh(m_meshCache->meshFor(*live, m_engine), live->isEraser);
    }
    sink.endFrame();
}

void InkDocument::rebakeVisible()
{
    const int count = m_tiles->rebakeVisibleNow(*m_inkStore, *m_eraseStore, m_viewport);
    qDebug() << "InkDocument::rebakeVisible:" << count << "tiles";
    emit changed();
}

void InkDocument::onMeshReady(quint32 strokeId)
{
    const InkStroke* s = stroke(strokeId);
    if (!s) {
        return;
    }
    // The refined mesh may reach tiles the synchronous one did not
    const QRectF extent = drawnExtent(*s, m_meshCache->cached(strokeId)).united(drawnBounds(strokeId));
    registerExtent(*s, extent);
    for (Tile* tile : m_tiles->getAffectedTiles(extent)) {
        tile->markDirty();
    }
    emit changed();
}

// ===== Persistence =====

QByteArray InkDocument::serializeAll(const IsfOptions& options) const
{
    QVector<const InkStroke*> all = strokes() + eraseStrokes();
    std::sort(all.begin(), all.end(), [](const InkStroke* a, const InkStroke* b) {
        return a->id < b->id;
    });
    return IsfSerializer::serializeContainer(all, options);
}

bool InkDocument::loadFromIsf(const QByteArray& bytes, IsfParseError* error)
{
    std::vector<std::unique_ptr<InkStroke>> loaded;
    IsfParseError parseError;
    if (!IsfSerializer::deserializeContainer(bytes, loaded, &parseError)) {
        qWarning() << "InkDocument::loadFromIsf:" << parseError.errorString()
                   << "at offset" << parseError.offset;
        if (error) {
            *error = parseError;
        }
        return false;
    }

    clear();

    quint32 nextId = 1;
    for (const auto& s : loaded) {
        nextId = qMax(nextId, s->id + 1);
    }

    QSet<quint32> seen;
    for (auto& s : loaded) {
        if (s->id == 0 || seen.contains(s->id)) {
            qDebug() << "InkDocument::loadFromIsf: duplicate id" << s->id << "reassigned to" << nextId;
            s->id = nextId++;
        }
        seen.insert(s->id);
    }
    m_engine.reserveStrokeIds(nextId);

    for (auto& s : loaded) {
        commitStroke(std::move(s));
    }

    if (error) {
        *error = IsfParseError();
    }
    return true;
}

CompressionStats InkDocument::compressionStats(const IsfOptions& options) const
{
    CompressionStats total;
    for (const auto& entry : m_inkStore->strokes) {
        total.add(IsfSerializer::compressionStats(*entry.second, options));
    }
    for (const auto& entry : m_eraseStore->strokes) {
        total.add(IsfSerializer::compressionStats(*entry.second, options));
    }
    return total;
}

void InkDocument::clear()
{
    m_engine.reset();
    m_inkStore->strokes.clear();
    m_eraseStore->strokes.clear();
    m_index.clear();
    m_drawnBounds.clear();
    m_tiles->clearAll();
    m_meshCache->clear();
    emit changed();
}
