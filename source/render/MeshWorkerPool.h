#pragma once

// ============================================================================
// MeshWorkerPool - Off-thread ribbon meshing
// ============================================================================
// Owns its own QThreadPool (never the global instance) and a
// PackedMeshBuilder. Jobs are MeshInput snapshots taken on the owning
// thread; results are independent vertex buffers.
//
// Lifetime is explicit: the owner creates the pool, injects it where needed
// and calls shutdown() (or destroys it) before the consumers go away.
// ============================================================================

#include "MeshBuilder.h"
#include "PackedMeshBuilder.h"

#include <QFuture>
#include <QThreadPool>
#include <atomic>

class MeshWorkerPool {
public:
    static constexpr MeshBuilder::Kind BUILDER_KIND = MeshBuilder::Kind::Packed;

    explicit MeshWorkerPool(int maxThreads = 2);
    ~MeshWorkerPool();

    MeshWorkerPool(const MeshWorkerPool&) = delete;
    MeshWorkerPool& operator=(const MeshWorkerPool&) = delete;

    /**
     * @brief Queue a mesh build.
     * @return A future holding the vertex buffer. After shutdown() the future
     *         is already finished and carries no result.
     */
    QFuture<QVector<float>> requestMesh(MeshInput input);

    /**
     * @brief Stop accepting work and wait for queued and running jobs.
     */
    void shutdown();

    bool isRunning() const { return !m_shuttingDown.load(); }
    int maxThreads() const { return m_pool.maxThreadCount(); }

private:
    QThreadPool m_pool;
    PackedMeshBuilder m_builder;
    std::atomic<bool> m_shuttingDown{false};
};
