#pragma once

// ============================================================================
// MeshCache - Finished-stroke mesh cache with async refinement
// ============================================================================
// Live strokes are meshed synchronously on every request and never cached.
// Finished strokes are meshed synchronously once and cached by stroke id.
// When a MeshWorkerPool is injected and the synchronous builder is not the
// packed kernel the pool runs, the stroke is rebuilt on the pool; the worker
// result replaces the cached mesh when it arrives and meshReady() is emitted.
//
// Entries are only dropped by clear().
// ============================================================================

#include "MeshBuilder.h"
#include "MeshWorkerPool.h"

#include <QFutureWatcher>
#include <QHash>
#include <QObject>
#include <memory>

class MeshCache : public QObject {
    Q_OBJECT

public:
    /**
     * @param builder Synchronous builder used on the owning thread.
     */
    explicit MeshCache(std::unique_ptr<MeshBuilder> builder, QObject* parent = nullptr);
    ~MeshCache() override;

    /**
     * @brief Route finished-stroke rebuilds through a worker pool.
     *
     * The pool is not owned and must outlive the cache or be reset to
     * nullptr first. Passing nullptr keeps everything synchronous.
     */
    void setWorkerPool(MeshWorkerPool* pool) { m_pool = pool; }
    MeshWorkerPool* workerPool() const { return m_pool; }

    const MeshBuilder& builder() const { return *m_builder; }

    /**
     * @brief Whether finished strokes are sent to the worker pool.
     *
     * False when the synchronous builder already is the pool's kernel.
     */
    bool needsRefinement() const { return m_builder->kind() != MeshWorkerPool::BUILDER_KIND; }

    /**
     * @brief Mesh for a stroke, from cache when the stroke is finished.
     */
    QVector<float> meshFor(const InkStroke& stroke, const StrokeEngine& engine);

    /**
     * @brief Cached mesh by id; empty if the stroke was never meshed.
     */
    QVector<float> cached(quint32 strokeId) const { return m_meshes.value(strokeId); }

    bool contains(quint32 strokeId) const { return m_meshes.contains(strokeId); }
    bool isPending(quint32 strokeId) const { return m_pending.contains(strokeId); }
    int size() const { return m_meshes.size(); }
    int pendingCount() const { return m_pending.size(); }

    /**
     * @brief Drop every cached mesh and forget pending worker results.
     */
    void clear();

    /**
     * @brief Block until every pending worker mesh has been applied.
     */
    void waitForPending();

signals:
    /**
     * @brief A worker mesh replaced the synchronous one for strokeId.
     */
    void meshReady(quint32 strokeId);

private:
    using Watcher = QFutureWatcher<QVector<float>>;

    void requestAsync(const MeshInput& input);
    void applyResult(quint32 strokeId, Watcher* watcher);

    std::unique_ptr<MeshBuilder> m_builder;
    MeshWorkerPool* m_pool = nullptr;
    QHash<quint32, QVector<float>> m_meshes;
    QHash<quint32, Watcher*> m_pending;
    bool m_shuttingDown = false;
};
