#ifndef VIEWPORTTESTS_H
#define VIEWPORTTESTS_H

#include <QObject>
#include <QTest>
#include <QTemporaryDir>
#include "Viewport.h"
#include "ScheduledTask.h"
#include "CanvasSettings.h"

/**
 * Unit tests for zoom, coordinate mapping, surface sizing, debouncing and
 * the persisted preferences.
 * Run with: notecanvas_tests --test-viewport
 */
class ViewportTests : public QObject {
    Q_OBJECT

private slots:
    void testZoomStaysInRange() {
        Viewport vp;
        for (int i = 0; i < 50; ++i) {
            vp.zoomIn();
            QVERIFY(vp.scale() <= Viewport::MAX_SCALE);
        }
        QCOMPARE(vp.scale(), Viewport::MAX_SCALE);
        QVERIFY(!vp.zoomIn());

        for (int i = 0; i < 50; ++i) {
            vp.zoomOut();
            QVERIFY(vp.scale() >= Viewport::MIN_SCALE);
        }
        QCOMPARE(vp.scale(), Viewport::MIN_SCALE);
    }

    void testZoomStep() {
        Viewport vp;
        QVERIFY(vp.zoomIn());
        QVERIFY(qFuzzyCompare(vp.scale(), 1.2));
        QVERIFY(vp.zoomOut());
        QVERIFY(qFuzzyCompare(vp.scale(), 1.0));
    }

    void testMappingRoundTrip() {
        Viewport vp;
        vp.setSurfaceOrigin(QPointF(12, 7));
        vp.setScrollOffset(QPointF(300, 45));

        const QVector<QPointF> points = {QPointF(0, 0), QPointF(123.5, 77.25), QPointF(-40, 9000)};
        for (qreal scale : {0.25, 0.5, 1.0, 1.44, 2.0, 4.0}) {
            vp.setScale(scale);
            for (const QPointF& p : points) {
                const QPointF back = vp.toCanvas(vp.toClient(p));
                QVERIFY(qAbs(back.x() - p.x()) < 1e-6);
                QVERIFY(qAbs(back.y() - p.y()) < 1e-6);
            }
        }
    }

    void testToCanvasAccountsForScrollAndScale() {
        Viewport vp;
        vp.setScale(2.0);
        vp.setScrollOffset(QPointF(100, 40));
        // (client - origin + scroll) / scale
        QCOMPARE(vp.toCanvas(QPointF(100, 60)), QPointF(100, 50));
    }

    void testSurfaceFillsViewport() {
        Viewport vp;
        vp.setScale(0.5);
        // Small content: the surface still covers the visible area
        QCOMPARE(vp.logicalSurfaceSize(QSize(800, 600), QSize(100, 100)), QSize(1600, 1200));
        QCOMPARE(vp.scaledSurfaceSize(QSize(800, 600), QSize(100, 100)), QSize(800, 600));
    }

    void testSurfaceContainsContentPlusPadding() {
        Viewport vp;
        vp.setScale(2.0);
        const QSize size = vp.logicalSurfaceSize(QSize(800, 600), QSize(3000, 250));
        QCOMPARE(size, QSize(3000 + Viewport::SURFACE_PADDING, 250 + Viewport::SURFACE_PADDING));
    }

    void testSurfaceBounds() {
        Viewport vp;
        QCOMPARE(vp.logicalSurfaceSize(QSize(0, 0), QSize(0, 0)),
                 QSize(Viewport::MIN_SURFACE, Viewport::MIN_SURFACE));
        QCOMPARE(vp.logicalSurfaceSize(QSize(100, 100), QSize(500000, 10)).width(),
                 Viewport::MAX_SURFACE);
    }

    void testScheduledTaskDebounces() {
        ScheduledTask task;
        int runs = 0;
        QString last;

        task.schedule(30, [&]() { ++runs; last = "a"; });
        task.schedule(30, [&]() { ++runs; last = "b"; });
        QVERIFY(task.isPending());

        QTRY_COMPARE(runs, 1);
        QCOMPARE(last, QString("b"));
        QVERIFY(!task.isPending());
    }

    void testScheduledTaskCancelAndFlush() {
        ScheduledTask task;
        int runs = 0;

        task.schedule(10, [&]() { ++runs; });
        task.cancel();
        QTest::qWait(40);
        QCOMPARE(runs, 0);

        task.schedule(10000, [&]() { ++runs; });
        task.flush();
        QCOMPARE(runs, 1);
        QVERIFY(!task.isPending());

        // Nothing pending: flush does nothing
        task.flush();
        QCOMPARE(runs, 1);
    }

    void testGridPreferencePersists() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString file = dir.filePath("settings.ini");

        {
            CanvasSettings settings(file);
            QVERIFY(!settings.showGrid());
            settings.setShowGrid(true);
        }
        CanvasSettings reopened(file);
        QVERIFY(reopened.showGrid());
    }
};

#endif // VIEWPORTTESTS_H
