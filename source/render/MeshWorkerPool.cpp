#include "MeshWorkerPool.h"

#include <QDebug>
#include <QFutureInterface>
#include <QtConcurrent>

MeshWorkerPool::MeshWorkerPool(int maxThreads)
{
    m_pool.setMaxThreadCount(qMax(1, maxThreads));
}

MeshWorkerPool::~MeshWorkerPool()
{
    shutdown();
}

QFuture<QVector<float>> MeshWorkerPool::requestMesh(MeshInput input)
{
    if (m_shuttingDown.load()) {
        qDebug() << "MeshWorkerPool::requestMesh: pool is shut down, stroke" << input.strokeId;
        QFutureInterface<QVector<float>> done;
        done.reportStarted();
        done.reportFinished();
        return done.future();
    }

    const PackedMeshBuilder* builder = &m_builder;
    return QtConcurrent::run(&m_pool, [builder, input = std::move(input)]() {
        return builder->build(input);
    });
}

void MeshWorkerPool::shutdown()
{
    if (m_shuttingDown.exchange(true)) {
        return;
    }
    m_pool.waitForDone();
}
