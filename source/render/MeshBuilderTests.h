#ifndef MESHBUILDERTESTS_H
#define MESHBUILDERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QLineF>
#include <cmath>
#include "MeshBuilder.h"
#include "MeshCache.h"
#include "MeshWorkerPool.h"
#include "EraseCompositor.h"
#include "../codec/IsfCodec.h"
#include "../strokes/StrokeEngine.h"

/**
 * Unit tests for the ribbon mesh builders, the mesh cache and the
 * raster compositor.
 * Run with: inkboard_tests MeshBuilder
 */
class MeshBuilderTests : public QObject {
    Q_OBJECT

private:
    static MeshInput zigzagInput()
    {
        MeshInput input;
        input.strokeId = 1;
        const float xs[] = {0, 10, 20, 25, 25, 40, 41, 80};
        const float ys[] = {0, 0, 10, 10, 10, -5, 30, 30};
        for (int i = 0; i < 8; ++i) {
            input.positions << xs[i] << ys[i];
            input.widths << 2.0f + i * 0.5f;
        }
        input.rgba[0] = 1.0f;
        return input;
    }

    static std::unique_ptr<InkStroke> capturedStroke(StrokeEngine& engine)
    {
        std::unique_ptr<InkStroke> path = IsfSerializer::generateTestStroke(120);
        engine.startStroke(path->points[0].x(), path->points[0].y(), path->color, path->baseWidth,
                           path->points[0].pressure, std::nullopt, path->points[0].time);
        for (int i = 1; i < path->pointCount(); ++i) {
            const InkPoint& p = path->points[i];
            engine.addPoint(p.x(), p.y(), p.pressure, std::nullopt, p.time);
        }
        return engine.finishStroke();
    }

private slots:
    void testEmptyInput() {
        MeshInput empty;
        QVERIFY(MeshBuilder::create(MeshBuilder::Kind::Reference)->build(empty).isEmpty());
        QVERIFY(MeshBuilder::create(MeshBuilder::Kind::Packed)->build(empty).isEmpty());

        // Mismatched positions/widths are rejected
        MeshInput broken;
        broken.positions << 1.0f << 2.0f << 3.0f;
        broken.widths << 1.0f;
        QVERIFY(!broken.isValid());
        QVERIFY(MeshBuilder::create(MeshBuilder::Kind::Packed)->build(broken).isEmpty());
    }

    void testSinglePointDisc() {
        MeshInput input;
        input.positions << 50.0f << 60.0f;
        input.widths << 8.0f;

        for (MeshBuilder::Kind kind : {MeshBuilder::Kind::Reference, MeshBuilder::Kind::Packed}) {
            const QVector<float> mesh = MeshBuilder::create(kind)->build(input);
            QCOMPARE(MeshBuilder::vertexCount(mesh), MeshBuilder::DISC_SEGMENTS * 3);
            for (int v = 0; v < MeshBuilder::vertexCount(mesh); ++v) {
                const float x = mesh[v * MeshBuilder::FLOATS_PER_VERTEX];
                const float y = mesh[v * MeshBuilder::FLOATS_PER_VERTEX + 1];
                QVERIFY(std::hypot(x - 50.0f, y - 60.0f) <= 4.0f + 1e-4f);
            }
        }
    }

    void testTriangleListLayout() {
        const QVector<float> mesh = MeshBuilder::create(MeshBuilder::Kind::Reference)->build(zigzagInput());
        QVERIFY(!mesh.isEmpty());
        QCOMPARE(int(mesh.size()) % MeshBuilder::FLOATS_PER_VERTEX, 0);
        QCOMPARE(MeshBuilder::vertexCount(mesh) % 3, 0);

        // Color is carried on every vertex
        for (int v = 0; v < MeshBuilder::vertexCount(mesh); ++v) {
            QCOMPARE(mesh[v * MeshBuilder::FLOATS_PER_VERTEX + 2], 1.0f);
            QCOMPARE(mesh[v * MeshBuilder::FLOATS_PER_VERTEX + 5], 1.0f);
        }
    }

    void testBuildersAgree() {
        std::unique_ptr<MeshBuilder> reference = MeshBuilder::create(MeshBuilder::Kind::Reference);
        std::unique_ptr<MeshBuilder> packed = MeshBuilder::create(MeshBuilder::Kind::Packed);
        QCOMPARE(reference->kind(), MeshBuilder::Kind::Reference);
        QCOMPARE(packed->kind(), MeshBuilder::Kind::Packed);

        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = capturedStroke(engine);
        const MeshInput inputs[] = {zigzagInput(), MeshInput::fromStroke(*stroke, engine)};

        for (const MeshInput& input : inputs) {
            const QVector<float> a = reference->build(input);
            const QVector<float> b = packed->build(input);
            QCOMPARE(int(a.size()), int(b.size()));
            for (int i = 0; i < a.size(); ++i) {
                QVERIFY2(qAbs(a[i] - b[i]) < 1e-3f, qPrintable(QString("float %1: %2 vs %3").arg(i).arg(a[i]).arg(b[i])));
            }
        }
    }

    void testDeterministic() {
        std::unique_ptr<MeshBuilder> packed = MeshBuilder::create(MeshBuilder::Kind::Packed);
        const MeshInput input = zigzagInput();
        QCOMPARE(packed->build(input), packed->build(input));
    }

    void testMeshCoversSpine() {
        const MeshInput input = zigzagInput();
        const QPainterPath path = EraseCompositor::meshToPath(
            MeshBuilder::create(MeshBuilder::Kind::Packed)->build(input));
        for (int i = 0; i + 1 < input.pointCount(); ++i) {
            const QPointF a(input.positions[i * 2], input.positions[i * 2 + 1]);
            const QPointF b(input.positions[i * 2 + 2], input.positions[i * 2 + 3]);
            if (QLineF(a, b).length() < 1e-6) {
                continue;
            }
            // A quarter along each segment, clear of shared triangle edges
            QVERIFY(path.contains(a + (b - a) * 0.25));
        }
        QVERIFY(!path.contains(QPointF(0.0, 25.0)));
    }

    void testVertexBoundsReachMiterTips() {
        MeshInput input;
        input.positions << 0.0f << 0.0f << 50.0f << 50.0f << 100.0f << 0.0f;
        input.widths << 10.0f << 10.0f << 10.0f;

        for (MeshBuilder::Kind kind : {MeshBuilder::Kind::Reference, MeshBuilder::Kind::Packed}) {
            const QVector<float> mesh = MeshBuilder::create(kind)->build(input);
            const QRectF box = MeshBuilder::vertexBounds(mesh);
            for (int i = 0; i < MeshBuilder::vertexCount(mesh); ++i) {
                const float* v = mesh.constData() + i * MeshBuilder::FLOATS_PER_VERTEX;
                QVERIFY(box.contains(QPointF(v[0], v[1])));
            }
            // 90 degree turn: the miter tip sits r*sqrt(2) from the apex
            QVERIFY(box.bottom() > 55.0 + 1.0);
            QVERIFY(qAbs(box.bottom() - (50.0 + 5.0 * std::sqrt(2.0))) < 1e-3);
        }

        QVERIFY(MeshBuilder::vertexBounds(QVector<float>()).isNull());
    }

    void testCacheReusesFinishedMeshes() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = capturedStroke(engine);

        MeshCache cache(MeshBuilder::create(MeshBuilder::Kind::Reference));
        QCOMPARE(cache.builder().kind(), MeshBuilder::Kind::Reference);
        const QVector<float> first = cache.meshFor(*stroke, engine);
        QVERIFY(!first.isEmpty());
        QVERIFY(cache.contains(stroke->id));
        QCOMPARE(cache.meshFor(*stroke, engine), first);

        // Live strokes are rebuilt each time and never cached
        InkStroke* live = engine.startStroke(0, 0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        engine.addPoint(20, 0, 0.5, std::nullopt, 10.0);
        QVERIFY(!cache.meshFor(*live, engine).isEmpty());
        QVERIFY(!cache.contains(live->id));

        cache.clear();
        QCOMPARE(int(cache.size()), 0);
    }

    void testCacheRefinesOnWorkers() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = capturedStroke(engine);

        MeshWorkerPool pool(2);
        MeshCache cache(MeshBuilder::create(MeshBuilder::Kind::Reference));
        QVERIFY(cache.needsRefinement());
        cache.setWorkerPool(&pool);

        QSignalSpy spy(&cache, &MeshCache::meshReady);
        const QVector<float> sync = cache.meshFor(*stroke, engine);
        QVERIFY(!sync.isEmpty());
        QVERIFY(cache.isPending(stroke->id));

        cache.waitForPending();
        QCOMPARE(cache.pendingCount(), 0);
        QCOMPARE(int(spy.count()), 1);
        QCOMPARE(spy.takeFirst().at(0).value<quint32>(), stroke->id);
        const QVector<float> packed = MeshBuilder::create(MeshBuilder::Kind::Packed)
                                          ->build(MeshInput::fromStroke(*stroke, engine));
        QCOMPARE(cache.cached(stroke->id), packed);

        pool.shutdown();
        QVERIFY(!pool.isRunning());
        QFuture<QVector<float>> late = pool.requestMesh(MeshInput::fromStroke(*stroke, engine));
        QVERIFY(late.isFinished());
        QCOMPARE(late.resultCount(), 0);
    }

    void testPackedCacheSkipsWorkers() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = capturedStroke(engine);

        MeshWorkerPool pool(1);
        MeshCache cache(nullptr);
        QCOMPARE(cache.builder().kind(), MeshBuilder::Kind::Packed);
        QVERIFY(!cache.needsRefinement());
        cache.setWorkerPool(&pool);

        QSignalSpy spy(&cache, &MeshCache::meshReady);
        const QVector<float> sync = cache.meshFor(*stroke, engine);
        QVERIFY(!cache.isPending(stroke->id));
        QCOMPARE(cache.pendingCount(), 0);

        cache.waitForPending();
        QCOMPARE(int(spy.count()), 0);
        QCOMPARE(cache.cached(stroke->id), sync);
    }

    void testEraseWinsInBake() {
        MeshInput ink;
        ink.positions << 10.0f << 64.0f << 246.0f << 64.0f;
        ink.widths << 20.0f << 20.0f;
        MeshInput eraser = ink;
        eraser.positions = {128.0f, 0.0f, 128.0f, 256.0f};
        eraser.widths = {30.0f, 30.0f};

        std::unique_ptr<MeshBuilder> builder = MeshBuilder::create(MeshBuilder::Kind::Packed);
        const QImage image = EraseCompositor::bake(QRectF(0, 0, 256, 256), 256,
                                                   {builder->build(ink)}, {builder->build(eraser)});
        QCOMPARE(image.size(), QSize(256, 256));
        QCOMPARE(image.format(), QImage::Format_ARGB32_Premultiplied);
        QVERIFY(qAlpha(image.pixel(40, 64)) > 200);
        QCOMPARE(qAlpha(image.pixel(128, 64)), 0);
        QCOMPARE(qAlpha(image.pixel(40, 200)), 0);
    }
};

#endif // MESHBUILDERTESTS_H
