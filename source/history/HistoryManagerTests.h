#ifndef HISTORYMANAGERTESTS_H
#define HISTORYMANAGERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <memory>

#include "HistoryManager.h"
#include "../core/ElementStore.h"
#include "../core/ElementSync.h"
#include "../network/FakeElementApi.h"

/**
 * Unit tests for the undo/redo log and its reconciliation with the service.
 * Run with: notecanvas_tests --test-history
 */
class HistoryManagerTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<FakeElementApi> m_api;
    std::unique_ptr<ElementStore> m_store;
    std::unique_ptr<ElementSync> m_sync;
    std::unique_ptr<HistoryManager> m_history;

    /// Create through the service and record it, like a finished drawing gesture.
    QString create(const CanvasElement& draft) {
        QString id;
        m_sync->create(draft, [&](const ServiceResult& r) {
            if (r.success && r.element) {
                id = r.element->id;
                m_history->push(HistoryAction::created(*r.element));
            }
        });
        return id;
    }

    QString createRect(int x) {
        return create(CanvasElement::makeRectangle(QRect(x, 10, 40, 40), StrokeStyle()));
    }

    /// Delete a group through the service and record one entry, like an eraser stroke.
    void deleteGroup(const QVector<QString>& ids) {
        const QVector<CanvasElement> snapshots = m_store->snapshot(ids);
        for (const QString& id : ids) {
            m_sync->remove(id);
        }
        m_history->push(HistoryAction::deleted(snapshots));
    }

private slots:
    void init() {
        m_api = std::make_unique<FakeElementApi>();
        m_store = std::make_unique<ElementStore>();
        m_sync = std::make_unique<ElementSync>(m_store.get(), m_api.get(), DocumentOwner::note("42"));
        m_history = std::make_unique<HistoryManager>(m_sync.get());
    }

    void cleanup() {
        m_history.reset();
        m_sync.reset();
        m_store.reset();
        m_api.reset();
    }

    // ===== Stack discipline =====

    void testCapacityIsBounded() {
        QCOMPARE(m_history->capacity(), 200);
        for (int i = 0; i < 205; ++i) {
            m_history->push(HistoryAction::updated(QString::number(i), ElementPatch::position(0, 0),
                                                   ElementPatch::position(i, i)));
        }
        QCOMPARE(m_history->undoCount(), 200);
        // Oldest entries went first
        QCOMPARE(m_history->undoStack().first().id, QString("5"));
        QCOMPARE(m_history->undoStack().last().id, QString("204"));
    }

    void testPushClearsRedo() {
        createRect(10);
        QVERIFY(m_history->undo());
        QVERIFY(m_history->canRedo());

        QSignalSpy redoSpy(m_history.get(), &HistoryManager::redoAvailableChanged);
        createRect(100);
        QVERIFY(!m_history->canRedo());
        QCOMPARE(redoSpy.count(), 1);
        QCOMPARE(redoSpy.first().at(0).toBool(), false);
    }

    void testEmptyStacksDoNothing() {
        QVERIFY(!m_history->undo());
        QVERIFY(!m_history->redo());
        QVERIFY(m_api->calls().isEmpty());
    }

    // ===== Create =====

    void testUndoCreateRemovesAndRedoRestoresSameId() {
        const QString id = createRect(10);
        QVERIFY(m_store->contains(id));

        QVERIFY(m_history->undo());
        QVERIFY(!m_store->contains(id));
        QCOMPARE(m_history->redoCount(), 1);

        QVERIFY(m_history->redo());
        QVERIFY(m_store->contains(id));
        QCOMPARE(m_api->callCount("undelete:" + id), 1);
        QCOMPARE(m_history->undoStack().last().element.id, id);
    }

    void testRedoCreateFallsBackToRecreate() {
        m_api->setUndeleteSupported(false);
        const QString id = createRect(10);
        m_history->undo();
        QVERIFY(m_store->isEmpty());

        QVERIFY(m_history->redo());
        QCOMPARE(m_store->elementCount(), 1);

        // New identity, and the undo entry follows it
        const QString newId = m_store->elements().first().id;
        QVERIFY(newId != id);
        QCOMPARE(m_history->undoStack().last().element.id, newId);
        QCOMPARE(m_store->element(newId)->rect(), QRect(10, 10, 40, 40));

        // Undo now removes the recreated copy
        QVERIFY(m_history->undo());
        QVERIFY(m_store->isEmpty());
    }

    void testFailedUndoKeepsAction() {
        const QString id = createRect(10);
        m_api->setFailingId(id, true);

        QSignalSpy errors(m_history.get(), &HistoryManager::errorOccurred);
        QVERIFY(m_history->undo());
        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.first().at(0).toString(), ServiceErrors::remove());

        QVERIFY(m_store->contains(id));
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->redoCount(), 0);
    }

    // ===== Update =====

    void testUndoRedoUpdate() {
        const QString id = createRect(10);
        m_sync->update(id, ElementPatch::position(200, 300), [&](const ServiceResult& r) {
            QVERIFY(r.success);
            m_history->push(HistoryAction::updated(id, ElementPatch::position(10, 10),
                                                   ElementPatch::position(200, 300)));
        });
        QCOMPARE(m_store->element(id)->x, 200);

        QVERIFY(m_history->undo());
        QCOMPARE(m_store->element(id)->rect(), QRect(10, 10, 40, 40));

        QVERIFY(m_history->redo());
        QCOMPARE(m_store->element(id)->rect(), QRect(200, 300, 40, 40));
        QCOMPARE(m_history->undoCount(), 2);
    }

    // ===== Grouped delete =====

    void testGroupDeleteUndoRestoresAll() {
        const QString a = createRect(10);
        const QString b = createRect(100);
        const QString c = createRect(200);
        deleteGroup({a, b, c});
        QVERIFY(m_store->isEmpty());
        QCOMPARE(m_history->undoStack().last().elements.size(), 3);

        QVERIFY(m_history->undo());
        QCOMPARE(m_store->elementCount(), 3);
        QVERIFY(m_store->contains(a) && m_store->contains(b) && m_store->contains(c));

        const HistoryAction redo = m_history->redoStack().last();
        QVERIFY(redo.identityPreserved);
        QCOMPARE(redo.liveIds, QVector<QString>({a, b, c}));

        QVERIFY(m_history->redo());
        QVERIFY(m_store->isEmpty());
        QCOMPARE(m_history->undoStack().last().type, HistoryAction::Delete);
        QCOMPARE(m_history->undoStack().last().elements.size(), 3);
    }

    void testGroupDeleteRecreatesWhenUndeleteUnavailable() {
        const QString a = createRect(10);
        const QString b = createRect(100);
        deleteGroup({a, b});

        m_api->setUndeleteSupported(false);
        QVERIFY(m_history->undo());
        QCOMPARE(m_store->elementCount(), 2);
        QVERIFY(!m_store->contains(a));

        const HistoryAction redo = m_history->redoStack().last();
        QVERIFY(!redo.identityPreserved);
        QCOMPARE(redo.recreated.size(), 2);
        QCOMPARE(redo.liveIds.size(), 2);

        // Redo removes the copies, not the original ids
        m_api->clearCalls();
        QVERIFY(m_history->redo());
        QVERIFY(m_store->isEmpty());
        for (const QString& id : redo.liveIds) {
            QCOMPARE(m_api->callCount("delete:" + id), 1);
        }
        QCOMPARE(m_api->callCount("delete:" + a), 0);
    }

    void testPartialRestoreReportsError() {
        const QString a = createRect(10);
        const QString b = createRect(100);
        deleteGroup({a, b});

        // b can neither be undeleted nor recreated
        m_api->setFailingId(b, true);
        m_api->setFailing(FakeElementApi::Operation::Create, true);

        QSignalSpy errors(m_history.get(), &HistoryManager::errorOccurred);
        QVERIFY(m_history->undo());
        QCOMPARE(errors.count(), 1);
        QVERIFY(m_store->contains(a));
        QVERIFY(!m_store->contains(b));

        // What came back can still be redone
        QCOMPARE(m_history->redoCount(), 1);
        QCOMPARE(m_history->redoStack().last().liveIds, QVector<QString>({a}));
    }

    // ===== Replay =====

    void testReplayBlocksConcurrentUndo() {
        createRect(10);
        createRect(100);
        m_api->setDeferred(true);

        QSignalSpy finished(m_history.get(), &HistoryManager::replayFinished);
        QVERIFY(m_history->undo());
        QVERIFY(m_history->isReplaying());
        QVERIFY(!m_history->undo());
        QVERIFY(!m_history->redo());

        m_api->flush();
        QVERIFY(!m_history->isReplaying());
        QCOMPARE(finished.count(), 1);
        QCOMPARE(m_store->elementCount(), 1);
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->redoCount(), 1);
    }

    void testPushDuringReplayRecordedWhenItEnds() {
        createRect(10);
        const QString second = createRect(100);
        m_api->setDeferred(true);

        QVERIFY(m_history->undo());
        CanvasElement confirmed = CanvasElement::makeTextBox(QRect(0, 0, 10, 10));
        confirmed.id = "late";
        m_history->push(HistoryAction::created(confirmed));
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->deferredCount(), 1);

        QSignalSpy redoSpy(m_history.get(), &HistoryManager::redoAvailableChanged);
        m_api->flush();
        QVERIFY(!m_history->isReplaying());
        QVERIFY(!m_store->contains(second));

        // The late push lands after the undone step and supersedes its redo
        QCOMPARE(m_history->deferredCount(), 0);
        QCOMPARE(m_history->undoCount(), 2);
        QCOMPARE(m_history->undoStack().last().type, HistoryAction::Create);
        QCOMPARE(m_history->undoStack().last().element.id, QString("late"));
        QCOMPARE(m_history->redoCount(), 0);
        QVERIFY(!m_history->canRedo());
        QVERIFY(!redoSpy.isEmpty());
        QCOMPARE(redoSpy.last().at(0).toBool(), false);
    }

    void testAvailabilitySignals() {
        QSignalSpy undoSpy(m_history.get(), &HistoryManager::undoAvailableChanged);
        createRect(10);
        QCOMPARE(undoSpy.count(), 1);
        QCOMPARE(undoSpy.last().at(0).toBool(), true);

        m_history->undo();
        QCOMPARE(undoSpy.last().at(0).toBool(), false);

        m_history->clear();
        QVERIFY(!m_history->canUndo());
        QVERIFY(!m_history->canRedo());
    }
};

#endif // HISTORYMANAGERTESTS_H
