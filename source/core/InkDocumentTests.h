#ifndef INKDOCUMENTTESTS_H
#define INKDOCUMENTTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "InkDocument.h"
#include "TileBakeWorker.h"
#include "../render/MeshCache.h"
#include "../render/MeshWorkerPool.h"
#include "../render/RenderSink.h"

/**
 * Unit tests for InkDocument: commit, erase precedence, rendering and
 * ISF persistence.
 * Run with: inkboard_tests InkDocument
 */
class InkDocumentTests : public QObject {
    Q_OBJECT

private:
    static InkSettings unsmoothed()
    {
        InkSettings settings;
        settings.smoothingEnabled = false;
        return settings;
    }

    // Straight line at full pressure, 4 units every 16 ms
    static const InkStroke* drawLine(InkDocument& doc, QPointF from, QPointF to, qreal width,
                                     bool eraser = false)
    {
        StrokeEngine& engine = doc.engine();
        const int steps = qMax(1, int(QLineF(from, to).length() / 4.0));
        engine.pointerDown(9, from, Qt::black, width, 1.0, std::nullopt, 0.0, eraser);
        for (int i = 1; i <= steps; ++i) {
            engine.pointerMove(9, from + (to - from) * (qreal(i) / steps), 1.0, std::nullopt, i * 16.0);
        }
        return doc.commitStroke(engine.pointerUp(9));
    }

    static PointerEvent pointer(PointerEvent::Phase phase, QPointF pos, qreal time, int buttons = 0)
    {
        PointerEvent event;
        event.pointerId = 3;
        event.pointerType = PointerEvent::Type::Pen;
        event.phase = phase;
        event.client = pos;
        event.pressure = 0.8;
        event.buttons = buttons;
        event.timestamp = time;
        return event;
    }

    static QImage renderRaster(InkDocument& doc)
    {
        RasterRenderSink sink;
        doc.renderFrame(sink);
        return sink.image();
    }

private slots:
    void testCommitIndexesInkOnly() {
        InkDocument doc(unsmoothed());
        QSignalSpy committed(&doc, &InkDocument::strokeCommitted);

        const InkStroke* a = drawLine(doc, QPointF(20, 64), QPointF(236, 64), 12.0);
        const InkStroke* b = drawLine(doc, QPointF(128, 0), QPointF(128, 128), 30.0, true);
        QVERIFY(a && b);
        QVERIFY(a->isFinished && b->isFinished);
        QCOMPARE(doc.strokeCount(), 1);
        QCOMPARE(doc.eraseStrokeCount(), 1);
        QCOMPARE(int(committed.count()), 2);

        QVERIFY(doc.queryStrokes(QRectF(100, 50, 10, 10)).contains(a->id));
        QVERIFY(!doc.queryStrokes(QRectF(100, 50, 10, 10)).contains(b->id));
        QVERIFY(doc.strokesInBucket(TileCoord(0, 0)).contains(a->id));

        // Tiles know about both roles
        Tile* tile = doc.tiles().findTile(TileCoord(0, 0));
        QVERIFY(tile->strokeIds().contains(a->id));
        QVERIFY(tile->eraseIds().contains(b->id));
        QVERIFY(doc.inkBounds().contains(QPointF(128, 64)));

        QVERIFY(doc.commitStroke(nullptr) == nullptr);
        QVERIFY(doc.commitStroke(std::make_unique<InkStroke>()) == nullptr);
    }

    void testErasePrecedence() {
        InkDocument doc(unsmoothed());
        doc.viewport().resize(512, 256);

        // A is crossed by eraser B; C lies outside B; D is drawn after B across it
        drawLine(doc, QPointF(20, 64), QPointF(236, 64), 12.0);
        drawLine(doc, QPointF(128, 0), QPointF(128, 128), 30.0, true);
        drawLine(doc, QPointF(20, 200), QPointF(236, 200), 12.0);
        drawLine(doc, QPointF(60, 100), QPointF(200, 100), 12.0);

        const QImage frame = renderRaster(doc);
        QCOMPARE(frame.size(), QSize(512, 256));

        QVERIFY(qAlpha(frame.pixel(60, 64)) > 200);
        QCOMPARE(qAlpha(frame.pixel(128, 64)), 0);
        QVERIFY(qAlpha(frame.pixel(128, 200)) > 200);
        QCOMPARE(qAlpha(frame.pixel(128, 100)), 0);
        QVERIFY(qAlpha(frame.pixel(80, 100)) > 200);

        // Erasure survives a full rebake
        for (Tile* tile : doc.tiles().getVisibleTiles(doc.viewport())) {
            tile->markDirty();
        }
        QCOMPARE(qAlpha(renderRaster(doc).pixel(128, 64)), 0);
    }

    void testDrawnExtentCoversTileSeam() {
        InkDocument doc(unsmoothed());
        doc.viewport().resize(256, 512);

        // Light pressure: the width floor draws wider than the pressure-scaled
        // bounds, across the y = 256 tile seam
        StrokeEngine& engine = doc.engine();
        engine.pointerDown(9, QPointF(20, 253), Qt::black, 20.0, 0.25, std::nullopt, 0.0);
        for (int i = 1; i <= 54; ++i) {
            engine.pointerMove(9, QPointF(20 + i * 4.0, 253), 0.25, std::nullopt, i * 16.0);
        }
        const InkStroke* stroke = doc.commitStroke(engine.pointerUp(9));
        QVERIFY(stroke);
        QVERIFY(stroke->bounds.bottom() < 256.0);

        const QRectF drawn = doc.drawnBounds(stroke->id);
        QVERIFY(drawn.contains(stroke->bounds));
        QVERIFY(drawn.bottom() > 257.0);
        QVERIFY(doc.inkBounds().contains(drawn));

        Tile* below = doc.tiles().findTile(TileCoord(0, 1));
        QVERIFY(below != nullptr);
        QVERIFY(below->strokeIds().contains(stroke->id));
        QVERIFY(doc.strokesInBucket(TileCoord(0, 1)).contains(stroke->id));

        // Ink on both sides of the seam survives the bake
        const QImage frame = renderRaster(doc);
        QVERIFY(qAlpha(frame.pixel(128, 253)) > 200);
        QVERIFY(qAlpha(frame.pixel(128, 256)) > 200);
        QCOMPARE(qAlpha(frame.pixel(128, 260)), 0);
        QVERIFY(!below->isDirty());
        QVERIFY(qAlpha(below->image().pixel(128, 0)) > 200);
    }

    void testRenderFrameDescribesTilesAndLiveStrokes() {
        InkDocument doc(unsmoothed());
        doc.viewport().resize(300, 300);
        drawLine(doc, QPointF(20, 20), QPointF(100, 20), 6.0);

        VertexBufferSink sink;
        doc.renderFrame(sink);
        QCOMPARE(sink.frameCount(), 1);
        QVERIFY(!sink.inFrame());
        QCOMPARE(int(sink.tiles().size()), 1);
        QCOMPARE(sink.tiles().first().coord, TileCoord(0, 0));
        QCOMPARE(sink.tiles().first().worldRect, QRectF(0, 0, 256, 256));
        QVERIFY(sink.inkVertices().isEmpty());

        // Live pen stroke goes out as a mesh, not as a tile
        QVERIFY(doc.handlePointer(pointer(PointerEvent::Phase::Down, QPointF(50, 150), 0.0)));
        QVERIFY(doc.handlePointer(pointer(PointerEvent::Phase::Move, QPointF(120, 150), 16.0)));
        doc.renderFrame(sink);
        QVERIFY(!sink.inkVertices().isEmpty());
        QVERIFY(sink.eraseVertices().isEmpty());

        QVERIFY(doc.handlePointer(pointer(PointerEvent::Phase::Up, QPointF(120, 150), 32.0)));
        QCOMPARE(doc.strokeCount(), 2);
        QVERIFY(!doc.handlePointer(pointer(PointerEvent::Phase::Up, QPointF(120, 150), 48.0)));

        // Eraser button routes to an erase stroke
        doc.handlePointer(pointer(PointerEvent::Phase::Down, QPointF(10, 10), 0.0, PointerEvent::ERASER_BUTTON));
        doc.handlePointer(pointer(PointerEvent::Phase::Move, QPointF(60, 10), 16.0, PointerEvent::ERASER_BUTTON));
        doc.renderFrame(sink);
        QVERIFY(!sink.eraseVertices().isEmpty());
        doc.handlePointer(pointer(PointerEvent::Phase::Cancel, QPointF(60, 10), 32.0, PointerEvent::ERASER_BUTTON));
        QCOMPARE(doc.eraseStrokeCount(), 1);
    }

    void testViewportMapsPointerToWorld() {
        InkDocument doc(unsmoothed());
        doc.viewport().resize(400, 400);
        doc.viewport().setScale(2.0);
        doc.viewport().setWorldOffset(QPointF(1000, 1000));

        doc.handlePointer(pointer(PointerEvent::Phase::Down, QPointF(100, 100), 0.0));
        doc.handlePointer(pointer(PointerEvent::Phase::Move, QPointF(200, 100), 16.0));
        doc.handlePointer(pointer(PointerEvent::Phase::Up, QPointF(200, 100), 32.0));

        const QVector<const InkStroke*> strokes = doc.strokes();
        QCOMPARE(int(strokes.size()), 1);
        QCOMPARE(strokes.first()->points.first().pos, QPointF(1050, 1050));
        QVERIFY(qAbs(strokes.first()->points.last().x() - 1100.0) < 1e-6);
    }

    void testPointCapCommitsWithoutPointerUp() {
        InkSettings settings = unsmoothed();
        settings.maxPointsPerStroke = 20;
        InkDocument doc(settings);

        doc.handlePointer(pointer(PointerEvent::Phase::Down, QPointF(0, 0), 0.0));
        for (int i = 1; i < 100 && doc.strokeCount() == 0; ++i) {
            doc.handlePointer(pointer(PointerEvent::Phase::Move, QPointF(i * 2.0, 0), i * 4.0));
        }
        QCOMPARE(doc.strokeCount(), 1);
        QCOMPARE(doc.strokes().first()->pointCount(), 20);
        QVERIFY(!doc.handlePointer(pointer(PointerEvent::Phase::Up, QPointF(0, 0), 1000.0)));
    }

    void testAllVerticesExcludesErasers() {
        InkDocument doc(unsmoothed());
        const InkStroke* a = drawLine(doc, QPointF(0, 0), QPointF(50, 0), 4.0);
        const InkStroke* b = drawLine(doc, QPointF(0, 20), QPointF(50, 20), 4.0);
        drawLine(doc, QPointF(25, -10), QPointF(25, 30), 10.0, true);

        const int expected = doc.meshCache().cached(a->id).size() + doc.meshCache().cached(b->id).size();
        QCOMPARE(int(doc.allVertices().size()), expected);

        // Live ink is included too
        doc.engine().pointerDown(4, QPointF(0, 50), Qt::red, 4.0, 0.5, std::nullopt, 0.0);
        doc.engine().pointerMove(4, QPointF(40, 50), 0.5, std::nullopt, 10.0);
        QVERIFY(doc.allVertices().size() > expected);
    }

    void testSerializeAndLoad() {
        InkDocument doc(unsmoothed());
        drawLine(doc, QPointF(0, 0), QPointF(100, 0), 4.0);
        drawLine(doc, QPointF(50, -20), QPointF(50, 20), 10.0, true);
        drawLine(doc, QPointF(0, 40), QPointF(100, 60), 3.0);

        const QByteArray bytes = doc.serializeAll();
        QVERIFY(!bytes.isEmpty());

        InkDocument copy;
        IsfParseError error;
        QVERIFY2(copy.loadFromIsf(bytes, &error), qPrintable(error.errorString()));
        QCOMPARE(copy.strokeCount(), 2);
        QCOMPARE(copy.eraseStrokeCount(), 1);
        for (const InkStroke* s : doc.strokes()) {
            QVERIFY(copy.stroke(s->id) != nullptr);
            QCOMPARE(copy.stroke(s->id)->pointCount(), s->pointCount());
        }

        const CompressionStats stats = copy.compressionStats();
        QCOMPARE(stats.strokeCount, 3);
        QVERIFY(stats.compressionRatio > 1.0);

        // New strokes never collide with loaded ids
        const InkStroke* fresh = drawLine(copy, QPointF(0, 0), QPointF(10, 10), 2.0);
        QVERIFY(fresh->id > doc.strokes().last()->id);
    }

    void testLoadIsAllOrNothing() {
        InkDocument doc(unsmoothed());
        drawLine(doc, QPointF(0, 0), QPointF(100, 0), 4.0);
        const QByteArray good = doc.serializeAll();

        QByteArray broken = good;
        broken.chop(2);

        QSignalSpy changed(&doc, &InkDocument::changed);
        IsfParseError error;
        QVERIFY(!doc.loadFromIsf(broken, &error));
        QVERIFY(error.error != IsfParseError::NoError);
        QCOMPARE(doc.strokeCount(), 1);
        QCOMPARE(int(changed.count()), 0);

        QVERIFY(!doc.loadFromIsf(good + QByteArray(1, '\x01')));
        QCOMPARE(doc.strokeCount(), 1);
    }

    void testLoadRejectsOffCanvasStrokes() {
        InkDocument doc(unsmoothed());
        const InkStroke* kept = drawLine(doc, QPointF(0, 0), QPointF(100, 0), 4.0);
        const quint32 keptId = kept->id;

        std::unique_ptr<InkStroke> near = IsfSerializer::generateTestStroke(10, 1);
        std::unique_ptr<InkStroke> far = IsfSerializer::generateTestStroke(10, 2);
        far->points[3].pos = QPointF(-1e12, 1e12);
        const QByteArray bytes = IsfSerializer::serializeContainer({near.get(), far.get()});

        QSignalSpy changed(&doc, &InkDocument::changed);
        IsfParseError error;
        QVERIFY(!doc.loadFromIsf(bytes, &error));
        QCOMPARE(error.error, IsfParseError::InvalidPoints);
        QCOMPARE(doc.strokeCount(), 1);
        QVERIFY(doc.stroke(keptId) != nullptr);
        QCOMPARE(int(changed.count()), 0);
    }

    void testDuplicateIdsReassigned() {
        std::unique_ptr<InkStroke> first = IsfSerializer::generateTestStroke(10, 5);
        std::unique_ptr<InkStroke> second = IsfSerializer::generateTestStroke(10, 5);
        const QByteArray bytes = IsfSerializer::serializeContainer({first.get(), second.get()});

        InkDocument doc;
        QVERIFY(doc.loadFromIsf(bytes));
        QCOMPARE(doc.strokeCount(), 2);
        const QVector<const InkStroke*> strokes = doc.strokes();
        QVERIFY(strokes[0]->id != strokes[1]->id);
        QVERIFY(doc.engine().nextStrokeId() > qMax(strokes[0]->id, strokes[1]->id));
    }

    void testWorkersMatchSynchronousOutput() {
        InkDocument reference(unsmoothed());
        reference.viewport().resize(256, 256);
        drawLine(reference, QPointF(20, 64), QPointF(236, 64), 12.0);
        drawLine(reference, QPointF(128, 0), QPointF(128, 128), 30.0, true);
        const QImage expected = renderRaster(reference);

        MeshWorkerPool meshPool(2);
        TileBakeWorker bakeWorker(2);
        InkDocument doc(unsmoothed());
        doc.setWorkers(&meshPool, &bakeWorker);
        doc.viewport().resize(256, 256);
        QSignalSpy refined(&doc.meshCache(), &MeshCache::meshReady);
        drawLine(doc, QPointF(20, 64), QPointF(236, 64), 12.0);
        drawLine(doc, QPointF(128, 0), QPointF(128, 128), 30.0, true);

        // The packed builder already is the worker kernel: no second pass
        QCOMPARE(doc.meshCache().pendingCount(), 0);
        doc.meshCache().waitForPending();
        QCOMPARE(int(refined.count()), 0);
        QCOMPARE(doc.meshCache().pendingCount(), 0);
        doc.rebakeVisible();
        bakeWorker.waitForIdle();

        Tile* tile = doc.tiles().findTile(TileCoord(0, 0));
        QVERIFY(!tile->isDirty());
        QCOMPARE(renderRaster(doc), expected);

        doc.setWorkers(nullptr, nullptr);
    }

    void testRefinedMeshRebakesItsTiles() {
        MeshWorkerPool meshPool(1);
        InkDocument doc(unsmoothed(), MeshBuilder::Kind::Reference);
        doc.setWorkers(&meshPool, nullptr);
        doc.viewport().resize(256, 256);
        QSignalSpy refined(&doc.meshCache(), &MeshCache::meshReady);

        const InkStroke* stroke = drawLine(doc, QPointF(20, 64), QPointF(236, 64), 12.0);
        QVERIFY(doc.meshCache().isPending(stroke->id));
        renderRaster(doc);
        Tile* tile = doc.tiles().findTile(TileCoord(0, 0));
        QVERIFY(!tile->isDirty());

        doc.meshCache().waitForPending();
        QCOMPARE(int(refined.count()), 1);
        QVERIFY(tile->isDirty());
        const QRectF refinedMesh = MeshBuilder::vertexBounds(doc.meshCache().cached(stroke->id));
        QVERIFY(doc.drawnBounds(stroke->id).contains(refinedMesh));

        doc.setWorkers(nullptr, nullptr);
    }

    void testDeviceScaleDebounce() {
        InkDocument doc(unsmoothed());
        doc.viewport().resize(256, 256);
        drawLine(doc, QPointF(20, 64), QPointF(236, 64), 12.0);
        renderRaster(doc);

        doc.setDeviceScale(2.0);
        Tile* tile = doc.tiles().findTile(TileCoord(0, 0));
        QVERIFY(tile->isDirty());

        // Frames during the debounce window do not rebake
        renderRaster(doc);
        QVERIFY(tile->isDirty());
        QCOMPARE(tile->image().size(), QSize(256, 256));

        QSignalSpy changed(&doc, &InkDocument::changed);
        QVERIFY(changed.wait(2000));
        QVERIFY(!tile->isDirty());
        QCOMPARE(tile->image().size(), QSize(512, 512));
    }

    void testClear() {
        InkDocument doc(unsmoothed());
        drawLine(doc, QPointF(0, 0), QPointF(100, 0), 4.0);
        doc.engine().pointerDown(1, QPointF(0, 0), Qt::black, 2.0, 0.5, std::nullopt, 0.0);
        doc.clear();
        QVERIFY(doc.isEmpty());
        QCOMPARE(doc.engine().activePointerCount(), 0);
        QVERIFY(doc.spatialIndex().isEmpty());
        QCOMPARE(doc.meshCache().size(), 0);
        QVERIFY(doc.inkBounds().isNull());
    }
};

#endif // INKDOCUMENTTESTS_H
