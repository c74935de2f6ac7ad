#include "TileBakeWorker.h"
#include "../render/EraseCompositor.h"

#include <QDebug>
#include <QtConcurrent>

QImage TileBakeJob::bake() const
{
    return EraseCompositor::bake(coord.worldRect(), pixelSize, strokes, erasers);
}

TileBakeWorker::TileBakeWorker(int maxThreads, QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<TileCoord>("TileCoord");
    m_pool.setMaxThreadCount(qMax(1, maxThreads));
}

TileBakeWorker::~TileBakeWorker()
{
    shutdown();
}

void TileBakeWorker::requestBake(TileBakeJob job)
{
    if (m_shuttingDown) {
        return;
    }

    const TileCoord coord = job.coord;
    if (Watcher* previous = m_active.value(coord)) {
        // Superseded; let it run out but never report it
        previous->disconnect(this);
        previous->deleteLater();
    }

    auto* watcher = new Watcher(this);
    connect(watcher, &Watcher::finished, this, [this, watcher]() {
        onBakeFinished(watcher);
    });
    m_active.insert(coord, watcher);

    watcher->setFuture(QtConcurrent::run(&m_pool, [job = std::move(job)]() {
        TileBakeResult result;
        result.coord = job.coord;
        result.generation = job.generation;
        result.image = job.bake();
        return result;
    }));
}

void TileBakeWorker::onBakeFinished(Watcher* watcher)
{
    if (m_shuttingDown) {
        return;
    }

    const QFuture<TileBakeResult> future = watcher->future();
    if (future.isCanceled() || future.resultCount() == 0) {
        qWarning() << "TileBakeWorker::onBakeFinished: bake produced no result";
        for (auto it = m_active.begin(); it != m_active.end(); ++it) {
            if (it.value() == watcher) {
                m_active.erase(it);
                break;
            }
        }
        watcher->disconnect(this);
        watcher->deleteLater();
        return;
    }

    const TileBakeResult result = future.result();
    if (m_active.value(result.coord) != watcher) {
        return;
    }
    m_active.remove(result.coord);
    watcher->disconnect(this);
    watcher->deleteLater();

    if (result.image.isNull()) {
        qWarning() << "TileBakeWorker::onBakeFinished: empty image for tile" << result.coord.key();
        return;
    }
    emit tileBaked(result.coord, result.image, result.generation);
}

void TileBakeWorker::cancelAll()
{
    for (Watcher* watcher : m_active) {
        watcher->disconnect(this);
        watcher->deleteLater();
    }
    m_active.clear();
}

void TileBakeWorker::waitForIdle()
{
    while (!m_active.isEmpty()) {
        Watcher* watcher = m_active.begin().value();
        watcher->waitForFinished();
        const int before = m_active.size();
        onBakeFinished(watcher);
        if (m_active.size() == before) {
            // Stale watcher left behind; drop it so the loop terminates
            m_active.erase(m_active.begin());
            watcher->disconnect(this);
            watcher->deleteLater();
        }
    }
}

void TileBakeWorker::shutdown()
{
    if (m_shuttingDown) {
        return;
    }
    cancelAll();
    m_shuttingDown = true;
    m_pool.waitForDone();
}
