#ifndef STROKEENGINETESTS_H
#define STROKEENGINETESTS_H

#include <QObject>
#include <QTest>
#include <QLineF>
#include <cmath>
#include <limits>
#include "StrokeEngine.h"

/**
 * Unit tests for stroke capture, smoothing and the width function.
 * Run with: inkboard_tests StrokeEngine
 */
class StrokeEngineTests : public QObject {
    Q_OBJECT

private:
    // Wavy line with varying pressure, 1 ms apart
    static std::unique_ptr<InkStroke> drawWave(StrokeEngine& engine, int samples, qreal width = 3.0)
    {
        engine.startStroke(0.0, 0.0, QColor(Qt::black), width, 0.5, std::nullopt, 0.0);
        for (int i = 1; i < samples; ++i) {
            const qreal x = i * 2.0;
            const qreal y = std::sin(i * 0.1) * 40.0;
            const qreal pressure = 0.1 + 0.9 * (i % 17) / 16.0;
            engine.addPoint(x, y, pressure, std::nullopt, i * (1.0 + (i % 5)));
        }
        return engine.finishStroke();
    }

private slots:
    void testSingleTap() {
        StrokeEngine engine;
        InkStroke* live = engine.startStroke(10.0, 20.0, QStringLiteral("#ff0000"), 4.0, 0.5, std::nullopt, 5.0);
        QVERIFY(live != nullptr);
        QVERIFY(!live->isFinished);

        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        QVERIFY(stroke != nullptr);
        QVERIFY(stroke->isFinished);
        QCOMPARE(stroke->pointCount(), 1);
        QCOMPARE(stroke->color, QColor(255, 0, 0));
        QVERIFY(stroke->bounds.contains(QPointF(10.0, 20.0)));
        QVERIFY(stroke->bounds.width() > 0.0);

        // No active stroke left
        QVERIFY(engine.activeStroke() == nullptr);
        QVERIFY(engine.finishStroke() == nullptr);
    }

    void testWidthStaysWithinBounds() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = drawWave(engine, 300);
        QVERIFY(stroke->pointCount() > 10);

        const InkSettings& s = engine.settings();
        const qreal lo = stroke->baseWidth * s.minWidthScale;
        const qreal hi = stroke->baseWidth * s.maxWidthScale;
        for (int i = 0; i < stroke->pointCount(); ++i) {
            const qreal w = engine.pointWidth(*stroke, i);
            QVERIFY2(w >= lo - 1e-9 && w <= hi + 1e-9, qPrintable(QString("index %1 width %2").arg(i).arg(w)));
        }
    }

    void testWidthBoundsFollowSettings() {
        StrokeEngine engine;
        SmoothingUpdate update;
        update.minWidthScale = 0.8;
        update.maxWidthScale = 0.9;
        engine.applySmoothing(update);

        std::unique_ptr<InkStroke> stroke = drawWave(engine, 200, 10.0);
        for (float w : engine.pointWidths(*stroke)) {
            QVERIFY(w >= 8.0f - 1e-4f);
            QVERIFY(w <= 9.0f + 1e-4f);
        }
    }

    void testEmissionSpacing() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = drawWave(engine, 200, 3.0);

        // spacing = max(0.35, 3 * 0.2)
        const qreal spacing = 0.6;
        for (int i = 1; i < stroke->pointCount(); ++i) {
            const qreal d = QLineF(stroke->points[i - 1].pos, stroke->points[i].pos).length();
            QVERIFY2(d <= spacing + 1e-6, qPrintable(QString("segment %1 is %2").arg(i).arg(d)));
        }
    }

    void testLengthsAreCumulative() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = drawWave(engine, 120);
        QCOMPARE(stroke->points.first().length, 0.0);
        for (int i = 1; i < stroke->pointCount(); ++i) {
            QVERIFY(stroke->points[i].length >= stroke->points[i - 1].length);
        }
        QVERIFY(qAbs(stroke->totalLength - stroke->points.last().length) < 1e-9);
    }

    void testTimesStayMonotonic() {
        StrokeEngine engine;
        engine.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 100.0);
        // Device clock jumps backwards halfway through
        for (int i = 1; i < 50; ++i) {
            const qreal t = i < 25 ? 100.0 + i * 8.0 : 50.0 + i;
            engine.addPoint(i * 3.0, 0.0, 0.5, std::nullopt, t);
        }
        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        for (int i = 1; i < stroke->pointCount(); ++i) {
            QVERIFY(stroke->points[i].time >= stroke->points[i - 1].time);
        }
    }

    void testNonFiniteInput() {
        const qreal nan = std::numeric_limits<qreal>::quiet_NaN();
        const qreal inf = std::numeric_limits<qreal>::infinity();

        StrokeEngine engine;
        QVERIFY(engine.startStroke(nan, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0) == nullptr);
        QVERIFY(engine.activeStroke() == nullptr);

        InkStroke* live = engine.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        QVERIFY(live != nullptr);

        // Non-finite positions are dropped
        const int before = live->pointCount();
        engine.addPoint(inf, 10.0, 0.5, std::nullopt, 10.0);
        engine.addPoint(10.0, nan, 0.5, std::nullopt, 20.0);
        QCOMPARE(live->pointCount(), before);

        // Non-finite pressure is treated as full pressure, tilt is dropped
        engine.setSmoothingEnabled(false);
        engine.addPoint(20.0, 0.0, nan, QPointF(nan, 0.0), 30.0);
        QVERIFY(live->pointCount() > before);
        QCOMPARE(live->points.last().pressure, 1.0);
        QVERIFY(!live->points.last().tilt.has_value());

        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        QVERIFY(std::isfinite(stroke->bounds.width()));
        QVERIFY(std::isfinite(stroke->totalLength));
    }

    void testNonPositiveWidth() {
        StrokeEngine engine;
        engine.startStroke(0.0, 0.0, QColor(Qt::black), -3.0, 0.5, std::nullopt, 0.0);
        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        QCOMPARE(stroke->baseWidth, 1.0);
    }

    void testSealedStrokeIgnoresSamples() {
        StrokeEngine engine;
        std::unique_ptr<InkStroke> stroke = drawWave(engine, 40);
        const int count = stroke->pointCount();
        const QRectF bounds = stroke->bounds;

        engine.appendSample(*stroke, QPointF(500.0, 500.0), 1.0, std::nullopt, 9999.0);
        QCOMPARE(stroke->pointCount(), count);
        QCOMPARE(stroke->bounds, bounds);
    }

    void testMultiplePointersStayIndependent() {
        StrokeEngine engine;
        engine.setSmoothingEnabled(false);

        engine.pointerDown(1, QPointF(0.0, 0.0), Qt::red, 2.0, 0.5, std::nullopt, 0.0);
        engine.pointerDown(2, QPointF(0.0, 100.0), Qt::blue, 2.0, 0.5, std::nullopt, 0.0);
        QCOMPARE(engine.activePointerCount(), 2);

        for (int i = 1; i <= 40; ++i) {
            engine.pointerMove(1, QPointF(i * 2.0, 0.0), 0.5, std::nullopt, i * 4.0);
            engine.pointerMove(2, QPointF(i * 2.0, 100.0), 0.5, std::nullopt, i * 4.0 + 1.0);
        }

        std::unique_ptr<InkStroke> a = engine.pointerUp(1);
        QCOMPARE(engine.activePointerCount(), 1);
        std::unique_ptr<InkStroke> b = engine.pointerCancel(2);
        QCOMPARE(engine.activePointerCount(), 0);

        QVERIFY(a && b);
        QVERIFY(a->id != b->id);
        QVERIFY(a->isFinished && b->isFinished);
        for (const InkPoint& p : a->points) {
            QVERIFY(qAbs(p.y()) < 1e-9);
        }
        for (const InkPoint& p : b->points) {
            QVERIFY(qAbs(p.y() - 100.0) < 1e-9);
        }
    }

    void testDuplicatePointerDownReplacesStroke() {
        StrokeEngine engine;
        InkStroke* first = engine.pointerDown(7, QPointF(0, 0), Qt::black, 2.0, 0.5, std::nullopt, 0.0);
        const quint32 firstId = first->id;
        InkStroke* second = engine.pointerDown(7, QPointF(50, 50), Qt::black, 2.0, 0.5, std::nullopt, 10.0);
        QCOMPARE(engine.activePointerCount(), 1);
        QVERIFY(second->id != firstId);
        QCOMPARE(engine.liveStroke(7)->points.first().pos, QPointF(50, 50));
    }

    void testPointCapSealsStroke() {
        InkSettings settings;
        settings.maxPointsPerStroke = 50;
        StrokeEngine engine(settings);
        engine.setSmoothingEnabled(false);

        engine.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        for (int i = 1; i < 500; ++i) {
            engine.addPoint(i * 1.0, 0.0, 0.5, std::nullopt, i * 1.0);
        }
        InkStroke* live = engine.activeStroke();
        QVERIFY(live != nullptr);
        QVERIFY(live->isFinished);
        QCOMPARE(live->pointCount(), 50);

        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        QCOMPARE(stroke->pointCount(), 50);
    }

    void testAngleCullingReducesStraightLines() {
        StrokeEngine plain;
        plain.setSmoothingEnabled(false);
        plain.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        for (int i = 1; i <= 100; ++i) {
            plain.addPoint(i * 2.0, i * 1.0, 0.5, std::nullopt, i * 2.0);
        }
        std::unique_ptr<InkStroke> full = plain.finishStroke();

        StrokeEngine culling;
        culling.setSmoothingEnabled(false);
        culling.setAngleCulling(true);
        culling.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        for (int i = 1; i <= 100; ++i) {
            culling.addPoint(i * 2.0, i * 1.0, 0.5, std::nullopt, i * 2.0);
        }
        std::unique_ptr<InkStroke> culled = culling.finishStroke();

        QVERIFY(culled->pointCount() < full->pointCount());
        QVERIFY(culled->pointCount() >= 4);
        QCOMPARE(culled->points.first().pos, full->points.first().pos);
        QCOMPARE(culled->points.last().pos, full->points.last().pos);
    }

    void testFilterLagFollowsSpeed() {
        // One 10-unit move: 100 ms is below speedLow, 2 ms is above speedHigh
        StrokeEngine slow;
        InkStroke* slowStroke = slow.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        slow.addPoint(10.0, 0.0, 0.5, std::nullopt, 100.0);

        StrokeEngine fast;
        InkStroke* fastStroke = fast.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        fast.addPoint(10.0, 0.0, 0.5, std::nullopt, 2.0);

        const InkSettings& s = slow.settings();
        QVERIFY(qAbs(slowStroke->lastFiltered.x() - 10.0 * s.minSmoothing) < 1e-9);
        QVERIFY(qAbs(fastStroke->lastFiltered.x() - 10.0 * s.maxSmoothing) < 1e-9);
        QCOMPARE(slowStroke->lastFiltered.y(), 0.0);

        // Slow pens lag further behind the raw sample
        const qreal slowLag = QLineF(slowStroke->lastFiltered, QPointF(10.0, 0.0)).length();
        const qreal fastLag = QLineF(fastStroke->lastFiltered, QPointF(10.0, 0.0)).length();
        QVERIFY(slowLag > fastLag);

        // The sealed stroke still ends at the filtered pen position
        std::unique_ptr<InkStroke> sealed = slow.finishStroke();
        QCOMPARE(sealed->points.last().pos, sealed->lastFiltered);
    }

    void testCurvatureBoostDampsCorners() {
        const qreal boosts[] = { 0.0, 0.5, 1.0 };
        qreal previousY = std::numeric_limits<qreal>::max();
        for (qreal boost : boosts) {
            InkSettings settings;
            settings.curvatureBoost = boost;
            StrokeEngine engine(settings);
            InkStroke* live = engine.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);

            // Fast straight run, then a right-angle turn at the same speed
            engine.addPoint(10.0, 0.0, 0.5, std::nullopt, 2.0);
            const QPointF beforeTurn = live->lastFiltered;
            QVERIFY(qAbs(beforeTurn.x() - 10.0 * settings.maxSmoothing) < 1e-9);
            engine.addPoint(10.0, 10.0, 0.5, std::nullopt, 4.0);

            const qreal alpha = settings.maxSmoothing * (1.0 - boost);
            const QPointF expected(StrokeEngine::lerp(beforeTurn.x(), 10.0, alpha), 10.0 * alpha);
            QVERIFY2(QLineF(live->lastFiltered, expected).length() < 1e-9,
                     qPrintable(QString("boost %1").arg(boost)));

            // More boost, less of the turn followed
            QVERIFY(live->lastFiltered.y() < previousY);
            previousY = live->lastFiltered.y();
        }

        // A straight continuation is not damped
        InkSettings settings;
        settings.curvatureBoost = 1.0;
        StrokeEngine straight(settings);
        InkStroke* live = straight.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        straight.addPoint(10.0, 0.0, 0.5, std::nullopt, 2.0);
        const qreal x = live->lastFiltered.x();
        straight.addPoint(20.0, 0.0, 0.5, std::nullopt, 4.0);
        QVERIFY(qAbs(live->lastFiltered.x() - StrokeEngine::lerp(x, 20.0, settings.maxSmoothing)) < 1e-9);
    }

    void testVelocityIsExponentiallySmoothed() {
        StrokeEngine engine;
        engine.setSmoothingEnabled(false);
        InkStroke* live = engine.startStroke(0.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0);
        for (int i = 1; i <= 60; ++i) {
            // Speed ramps up, then drops sharply
            const qreal step = i <= 40 ? i * 0.25 : 1.0;
            engine.addPoint(live->lastRaw.x() + step, 0.0, 0.5, std::nullopt, i * 4.0);
        }
        QVERIFY(live->pointCount() > 20);
        QCOMPARE(live->points.first().velocity, 0.0);

        const qreal factor = engine.settings().velocitySmoothing;
        qreal peakInstantaneous = 0.0;
        for (int i = 1; i < live->pointCount(); ++i) {
            const InkPoint& prev = live->points[i - 1];
            const InkPoint& cur = live->points[i];
            const qreal instantaneous = QLineF(prev.pos, cur.pos).length() / qMax<qreal>(1.0, cur.time - prev.time);
            peakInstantaneous = qMax(peakInstantaneous, instantaneous);
            const qreal expected = StrokeEngine::lerp(prev.velocity, instantaneous, factor);
            QVERIFY2(qAbs(cur.velocity - expected) < 1e-9, qPrintable(QString("point %1").arg(i)));
        }
        QCOMPARE(live->lastVelocity, live->points.last().velocity);
        QVERIFY(live->points.last().velocity > 0.0);
        QVERIFY(live->points.last().velocity < peakInstantaneous);
    }

    void testHeadAndTailTaper() {
        StrokeEngine engine;
        engine.setSmoothingEnabled(false);
        engine.setAngleCulling(false);
        InkStroke* live = engine.startStroke(0.0, 0.0, QColor(Qt::black), 10.0, 1.0, std::nullopt, 0.0);
        for (int i = 1; i <= 100; ++i) {
            engine.addPoint(i * 2.0, 0.0, 1.0, std::nullopt, i * 10.0);
        }

        const InkSettings& s = engine.settings();
        const qreal minWidth = 10.0 * s.minWidthScale;
        const int last = live->pointCount() - 1;
        const int middle = live->pointCount() / 2;
        QVERIFY(last > 50);

        // Head taper applies while drawing, the tail only once sealed
        QVERIFY(qAbs(engine.pointWidth(*live, 0) - minWidth) < 1e-9);
        QVERIFY(engine.pointWidth(*live, last) > 9.0);
        QVERIFY(engine.pointWidth(*live, middle) > 9.0);

        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        QCOMPARE(stroke->pointCount() - 1, last);
        QVERIFY(qAbs(engine.pointWidth(*stroke, 0) - minWidth) < 1e-9);
        QVERIFY(qAbs(engine.pointWidth(*stroke, last) - minWidth) < 1e-9);
        QVERIFY(engine.pointWidth(*stroke, middle) > 9.0);

        // Partway into the head the width is between the floor and the body
        int inHead = 1;
        while (stroke->points[inHead].length < 10.0 * s.headTaperFactor * 0.5) {
            ++inHead;
        }
        const qreal headWidth = engine.pointWidth(*stroke, inHead);
        QVERIFY(headWidth > minWidth);
        QVERIFY(headWidth < engine.pointWidth(*stroke, middle));
    }

    void testWorldLimits() {
        StrokeEngine engine;
        const qreal limit = InkStroke::MAX_COORDINATE;
        QVERIFY(engine.startStroke(limit + 1.0, 0.0, QColor(Qt::black), 2.0, 0.5, std::nullopt, 0.0) == nullptr);
        QVERIFY(engine.pointerDown(3, QPointF(0.0, -1e13), Qt::black, 2.0, 0.5, std::nullopt, 0.0) == nullptr);
        QCOMPARE(engine.activePointerCount(), 0);

        InkStroke* live = engine.startStroke(limit, -limit, QColor(Qt::black), 5000.0, 0.5, std::nullopt, 0.0);
        QVERIFY(live != nullptr);
        QCOMPARE(live->baseWidth, InkStroke::MAX_BASE_WIDTH);

        // Samples off the canvas are dropped
        engine.setSmoothingEnabled(false);
        const int before = live->pointCount();
        engine.addPoint(limit + 5000.0, -limit, 0.5, std::nullopt, 10.0);
        QCOMPARE(live->pointCount(), before);
        QCOMPARE(live->lastRaw, QPointF(limit, -limit));

        std::unique_ptr<InkStroke> stroke = engine.finishStroke();
        for (const InkPoint& p : stroke->points) {
            QVERIFY(InkStroke::isWithinWorld(p.pos));
        }
    }

    void testSmoothstep() {
        QCOMPARE(StrokeEngine::smoothstep(0.0, 1.0, -1.0), 0.0);
        QCOMPARE(StrokeEngine::smoothstep(0.0, 1.0, 2.0), 1.0);
        QCOMPARE(StrokeEngine::smoothstep(0.0, 1.0, 0.5), 0.5);
        // Degenerate edges act as a step
        QCOMPARE(StrokeEngine::smoothstep(1.0, 1.0, 0.5), 0.0);
        QCOMPARE(StrokeEngine::smoothstep(1.0, 1.0, 1.5), 1.0);
    }

    void testColorParsing() {
        QCOMPARE(InkStroke::parseColor(QStringLiteral("#00ff00")), QColor(0, 255, 0));
        QCOMPARE(InkStroke::parseColor(QStringLiteral("rgb(1, 2, 3)")), QColor(1, 2, 3));
        QCOMPARE(InkStroke::parseColor(QStringLiteral("not a color")), QColor(Qt::black));
    }
};

#endif // STROKEENGINETESTS_H
