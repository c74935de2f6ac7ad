#include "MeshCache.h"
#include "MeshWorkerPool.h"
#include "../strokes/InkStroke.h"
#include "../strokes/StrokeEngine.h"

#include <QDebug>

MeshCache::MeshCache(std::unique_ptr<MeshBuilder> builder, QObject* parent)
    : QObject(parent)
    , m_builder(builder ? std::move(builder) : MeshBuilder::create(MeshBuilder::Kind::Packed))
{
}

MeshCache::~MeshCache()
{
    m_shuttingDown = true;
    clear();
}

QVector<float> MeshCache::meshFor(const InkStroke& stroke, const StrokeEngine& engine)
{
    if (stroke.isFinished) {
        auto it = m_meshes.constFind(stroke.id);
        if (it != m_meshes.constEnd()) {
            return it.value();
        }
    }

    const MeshInput input = MeshInput::fromStroke(stroke, engine);
    QVector<float> mesh = m_builder->build(input);

    if (stroke.isFinished) {
        m_meshes.insert(stroke.id, mesh);
        if (needsRefinement() && m_pool && m_pool->isRunning()) {
            requestAsync(input);
        }
    }
    return mesh;
}

void MeshCache::requestAsync(const MeshInput& input)
{
    if (m_pending.contains(input.strokeId)) {
        return;
    }

    const quint32 id = input.strokeId;
    auto* watcher = new Watcher(this);
    connect(watcher, &Watcher::finished, this, [this, id, watcher]() {
        applyResult(id, watcher);
    });
    m_pending.insert(id, watcher);
    watcher->setFuture(m_pool->requestMesh(input));
}

void MeshCache::applyResult(quint32 strokeId, Watcher* watcher)
{
    if (m_shuttingDown) {
        return;
    }

    // A clear() since the request makes this watcher stale
    if (m_pending.value(strokeId) != watcher) {
        return;
    }
    m_pending.remove(strokeId);
    watcher->disconnect(this);
    watcher->deleteLater();

    const QFuture<QVector<float>> future = watcher->future();
    if (future.isCanceled() || future.resultCount() == 0) {
        qWarning() << "MeshCache::applyResult: worker produced no mesh for stroke" << strokeId
                   << "- keeping synchronous mesh";
        return;
    }

    const QVector<float> mesh = future.result();
    if (mesh.isEmpty() && !m_meshes.value(strokeId).isEmpty()) {
        qWarning() << "MeshCache::applyResult: empty worker mesh for stroke" << strokeId
                   << "- keeping synchronous mesh";
        return;
    }

    m_meshes.insert(strokeId, mesh);
    emit meshReady(strokeId);
}

void MeshCache::clear()
{
    for (Watcher* watcher : m_pending) {
        watcher->disconnect(this);
        watcher->deleteLater();
    }
    m_pending.clear();
    m_meshes.clear();
}

void MeshCache::waitForPending()
{
    const QList<quint32> ids = m_pending.keys();
    for (quint32 id : ids) {
        Watcher* watcher = m_pending.value(id);
        if (!watcher) {
            continue;
        }
        watcher->waitForFinished();
        applyResult(id, watcher);
    }
}
