#ifndef INTERACTIONCONTROLLERTESTS_H
#define INTERACTIONCONTROLLERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <memory>

#include "InteractionController.h"
#include "../core/ElementStore.h"
#include "../core/ElementSync.h"
#include "../core/Viewport.h"
#include "../history/HistoryManager.h"
#include "../network/FakeElementApi.h"

/**
 * Unit tests for the pointer state machine: drawing, dragging, resizing,
 * marquee selection, erasing and text edits.
 * Run with: notecanvas_tests --test-interaction
 */
class InteractionControllerTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<FakeElementApi> m_api;
    std::unique_ptr<ElementStore> m_store;
    std::unique_ptr<ElementSync> m_sync;
    std::unique_ptr<HistoryManager> m_history;
    std::unique_ptr<Viewport> m_viewport;
    std::unique_ptr<InteractionController> m_controller;

    void setUpController(const EditorOptions& options) {
        cleanup();
        m_api = std::make_unique<FakeElementApi>();
        m_store = std::make_unique<ElementStore>();
        m_sync = std::make_unique<ElementSync>(m_store.get(), m_api.get(), options.owner);
        m_history = std::make_unique<HistoryManager>(m_sync.get(), options.historyCapacity);
        m_viewport = std::make_unique<Viewport>();
        m_controller = std::make_unique<InteractionController>(
            m_store.get(), m_sync.get(), m_history.get(), m_viewport.get(), options);
    }

    static EditorOptions defaultOptions() {
        EditorOptions options;
        options.owner = DocumentOwner::note("42");
        return options;
    }

    /// An element known to both the local store and the service.
    void addExisting(CanvasElement el, const QString& id) {
        el.id = id;
        el.zIndex = m_store->nextZIndex();
        m_store->addElement(el);
        m_api->seed(el);
    }

    void addRect(const QString& id, const QRect& r) {
        addExisting(CanvasElement::makeRectangle(r, StrokeStyle()), id);
    }

    void press(const QPointF& p) {
        m_controller->handlePointerEvent(PointerEvent::make(PointerEvent::Press, p));
    }
    void move(const QPointF& p) {
        m_controller->handlePointerEvent(PointerEvent::make(PointerEvent::Move, p));
    }
    void release(const QPointF& p) {
        m_controller->handlePointerEvent(PointerEvent::make(PointerEvent::Release, p));
    }

private slots:
    void init() {
        setUpController(defaultOptions());
    }

    void cleanup() {
        m_controller.reset();
        m_viewport.reset();
        m_history.reset();
        m_sync.reset();
        m_store.reset();
        m_api.reset();
    }

    // ===== Tools =====

    void testSelectingActiveToolTurnsItOff() {
        QSignalSpy toolSpy(m_controller.get(), &InteractionController::toolChanged);
        m_controller->setTool(ToolType::Rectangle);
        QCOMPARE(m_controller->tool(), ToolType::Rectangle);
        QCOMPARE(m_controller->cursorShape(), Qt::CrossCursor);

        m_controller->setTool(ToolType::Rectangle);
        QCOMPARE(m_controller->tool(), ToolType::None);
        QCOMPARE(m_controller->cursorShape(), Qt::ArrowCursor);
        QCOMPARE(toolSpy.count(), 2);
    }

    void testArmingToolClearsSelection() {
        addRect("a", QRect(100, 100, 50, 50));
        m_controller->selectOnly("a");
        m_controller->setTool(ToolType::Eraser);
        QVERIFY(m_controller->selection().isEmpty());
    }

    // ===== Drawing =====

    void testRectangleFromReversedDrag() {
        m_controller->setTool(ToolType::Rectangle);
        press(QPointF(100, 80));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Drawing);
        QVERIFY(m_controller->overlay().drawing);
        // Preview only: nothing stored yet
        QVERIFY(m_store->isEmpty());

        release(QPointF(10, 10));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Idle);
        QCOMPARE(m_store->elementCount(), 1);

        const CanvasElement& el = m_store->elements().first();
        QCOMPARE(el.type(), ElementType::Rectangle);
        QCOMPARE(el.rect(), QRect(10, 10, 90, 70));
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_api->lastOwnerField(), QString("note_id"));

        // The tool stays armed for the next shape
        QCOMPARE(m_controller->tool(), ToolType::Rectangle);
    }

    void testSmallShapesAreDiscarded() {
        m_controller->setTool(ToolType::Circle);
        press(QPointF(10, 10));
        release(QPointF(15, 200));
        QCOMPARE(m_api->callCount("create"), 0);

        m_controller->setTool(ToolType::Line);
        press(QPointF(0, 0));
        release(QPointF(5, 5));
        QCOMPARE(m_api->callCount("create"), 0);
        QVERIFY(m_store->isEmpty());
    }

    void testLineKeepsDirection() {
        m_controller->setTool(ToolType::Line);
        press(QPointF(100, 100));
        release(QPointF(40, 60));

        QCOMPARE(m_store->elementCount(), 1);
        const CanvasElement& line = m_store->elements().first();
        QCOMPARE(line.type(), ElementType::Line);
        QCOMPARE(line.rect(), QRect(100, 100, -60, -40));
    }

    void testFreehandStrokeIsPadded() {
        m_controller->setStrokeWidth(3);
        m_controller->setTool(ToolType::Freehand);
        press(QPointF(50, 50));
        move(QPointF(60, 55));
        release(QPointF(70, 50));

        QCOMPARE(m_store->elementCount(), 1);
        const CanvasElement& el = m_store->elements().first();
        QCOMPARE(el.rect(), QRect(38, 38, 44, 29));

        const FreehandData* data = el.as<FreehandData>();
        QVERIFY(data);
        QCOMPARE(data->path.size(), 3);
        QCOMPARE(data->path.first(), QPointF(12, 12));
        QCOMPARE(data->stroke.width, 3);
    }

    void testSingleClickFreehandIsDiscarded() {
        m_controller->setTool(ToolType::Freehand);
        press(QPointF(50, 50));
        release(QPointF(50, 50));
        QCOMPARE(m_api->callCount("create"), 0);
    }

    void testTextBoxCreationRequestsFocus() {
        QSignalSpy created(m_controller.get(), &InteractionController::textBoxCreated);
        m_controller->setTool(ToolType::TextBox);
        press(QPointF(10, 10));
        release(QPointF(200, 60));

        QCOMPARE(created.count(), 1);
        QCOMPARE(created.first().at(0).toString(), m_store->elements().first().id);
    }

    void testFailedCreateReportsError() {
        m_api->setFailing(FakeElementApi::Operation::Create, true);
        QSignalSpy errors(m_controller.get(), &InteractionController::errorOccurred);

        m_controller->setTool(ToolType::Freehand);
        press(QPointF(10, 10));
        release(QPointF(80, 90));

        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.first().at(0).toString(), ServiceErrors::createDrawing());
        QVERIFY(m_store->isEmpty());
        QCOMPARE(m_history->undoCount(), 0);
    }

    void testCreateReplyWithoutElementReportsError() {
        m_api->setOmitReplyElement(true);
        QSignalSpy errors(m_controller.get(), &InteractionController::errorOccurred);

        m_controller->setTool(ToolType::Rectangle);
        press(QPointF(10, 10));
        release(QPointF(100, 100));

        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.first().at(0).toString(), ServiceErrors::createShape());
        QVERIFY(m_store->isEmpty());
        QCOMPARE(m_history->undoCount(), 0);
    }

    // ===== Dragging =====

    void testZeroDeltaDragSendsNothing() {
        addRect("a", QRect(100, 100, 50, 50));
        press(QPointF(125, 125));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Dragging);
        release(QPointF(125, 125));

        QCOMPARE(m_api->callCount("update:"), 0);
        QCOMPARE(m_controller->selection(), QVector<QString>({"a"}));
        QCOMPARE(m_history->undoCount(), 0);
    }

    void testDragMovesElement() {
        addRect("a", QRect(100, 100, 50, 50));
        press(QPointF(125, 125));
        move(QPointF(140, 130));

        // Preview only until release
        QCOMPARE(m_controller->overlay().geometryOverrides.value("a"), QRect(115, 105, 50, 50));
        QCOMPARE(m_store->element("a")->rect(), QRect(100, 100, 50, 50));

        release(QPointF(155, 145));
        QCOMPARE(m_api->callCount("update:a"), 1);
        QCOMPARE(m_store->element("a")->rect(), QRect(130, 120, 50, 50));
        QCOMPARE(m_history->undoCount(), 1);
        QVERIFY(m_controller->overlay().geometryOverrides.isEmpty());
    }

    void testDragNeverLeavesCanvas() {
        addRect("a", QRect(10, 10, 50, 50));
        press(QPointF(30, 30));
        release(QPointF(0, 0));
        QCOMPARE(m_store->element("a")->rect(), QRect(0, 0, 50, 50));
    }

    void testDragSnapsToGrid() {
        m_controller->setShowGrid(true);
        addRect("a", QRect(100, 100, 50, 50));
        press(QPointF(125, 125));
        release(QPointF(138, 147));
        // 113 -> 120, 122 -> 120
        QCOMPARE(m_store->element("a")->rect(), QRect(120, 120, 50, 50));
    }

    void testFailedDragRevertsGeometry() {
        addRect("a", QRect(100, 100, 50, 50));
        m_api->setFailing(FakeElementApi::Operation::Update, true);
        QSignalSpy errors(m_controller.get(), &InteractionController::errorOccurred);

        press(QPointF(125, 125));
        release(QPointF(200, 200));

        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.first().at(0).toString(), ServiceErrors::update());
        QCOMPARE(m_store->element("a")->rect(), QRect(100, 100, 50, 50));
        QVERIFY(m_controller->overlay().geometryOverrides.isEmpty());
        QCOMPARE(m_history->undoCount(), 0);
    }

    void testMultiSelectionMovesTogether() {
        addRect("a", QRect(100, 100, 50, 50));
        addRect("b", QRect(300, 100, 50, 50));
        m_controller->setSelection({"a", "b"});

        press(QPointF(125, 125));
        release(QPointF(135, 145));

        QCOMPARE(m_store->element("a")->rect(), QRect(110, 120, 50, 50));
        QCOMPARE(m_store->element("b")->rect(), QRect(310, 120, 50, 50));
        QCOMPARE(m_history->undoCount(), 2);
    }

    void testSecondDragStartsFromUnconfirmedPosition() {
        addRect("a", QRect(100, 100, 50, 50));
        m_api->setDeferred(true);

        press(QPointF(125, 125));
        release(QPointF(225, 225));
        QCOMPARE(m_controller->pendingCommits(), 1);
        QCOMPARE(m_store->element("a")->rect(), QRect(100, 100, 50, 50));

        // Grab the element where it is shown, not where the store has it
        QCOMPARE(m_controller->elementAt(QPointF(235, 235)), QString("a"));
        QVERIFY(m_controller->elementAt(QPointF(125, 125)).isEmpty());
        press(QPointF(235, 235));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Dragging);
        release(QPointF(245, 245));
        QCOMPARE(m_controller->overlay().geometryOverrides.value("a"), QRect(210, 210, 50, 50));

        QCOMPARE(m_api->flush(), 2);
        QCOMPARE(m_store->element("a")->rect(), QRect(210, 210, 50, 50));
        QVERIFY(m_controller->overlay().geometryOverrides.isEmpty());
        QCOMPARE(m_history->undoCount(), 2);
        QCOMPARE(m_history->undoStack().last().prev.x, std::optional<int>(200));
        QCOMPARE(m_history->undoStack().last().next.x, std::optional<int>(210));
    }

    void testResizeHandleFollowsUnconfirmedPosition() {
        addRect("a", QRect(100, 100, 100, 100));
        m_api->setDeferred(true);

        press(QPointF(150, 150));
        release(QPointF(250, 150));
        QCOMPARE(m_controller->handleAt(QPointF(300, 200)), ResizeHandle::SouthEast);
        QCOMPARE(m_controller->handleAt(QPointF(100, 100)), ResizeHandle::None);

        press(QPointF(300, 200));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Resizing);
        release(QPointF(320, 220));

        m_api->flush();
        QCOMPARE(m_store->element("a")->rect(), QRect(200, 100, 120, 120));
    }

    // ===== Resizing =====

    void testResizeHandleHitTest() {
        addRect("a", QRect(100, 100, 100, 100));
        QString owner;
        QCOMPARE(m_controller->handleAt(QPointF(203, 198), &owner), ResizeHandle::SouthEast);
        QCOMPARE(owner, QString("a"));
        QCOMPARE(m_controller->handleAt(QPointF(100, 100)), ResizeHandle::NorthWest);
        QCOMPARE(m_controller->handleAt(QPointF(150, 150)), ResizeHandle::None);

        // No handles while a tool is armed
        m_controller->setTool(ToolType::Line);
        QCOMPARE(m_controller->handleAt(QPointF(200, 200)), ResizeHandle::None);
    }

    void testResizeNeverBelowMinimum() {
        addRect("a", QRect(100, 100, 100, 100));
        press(QPointF(200, 200));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Resizing);
        release(QPointF(110, 110));

        QCOMPARE(m_store->element("a")->rect(), QRect(100, 100, 50, 50));
        QCOMPARE(m_history->undoCount(), 1);
    }

    void testResizeFromNorthWestAnchorsOppositeCorner() {
        addRect("a", QRect(100, 100, 100, 100));
        press(QPointF(100, 100));
        release(QPointF(80, 70));
        QCOMPARE(m_store->element("a")->rect(), QRect(80, 70, 120, 130));
    }

    // ===== Marquee =====

    void testMarqueeSelectsPartialOverlap() {
        addRect("a", QRect(100, 100, 50, 50));
        addRect("b", QRect(400, 400, 50, 50));

        press(QPointF(10, 10));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Marquee);
        move(QPointF(60, 60));
        QVERIFY(m_controller->overlay().marquee.has_value());

        release(QPointF(120, 120));
        QVERIFY(!m_controller->overlay().marquee.has_value());
        QCOMPARE(m_controller->selection(), QVector<QString>({"a"}));
    }

    void testEmptyClickClearsSelection() {
        addRect("a", QRect(100, 100, 50, 50));
        m_controller->selectOnly("a");
        press(QPointF(400, 400));
        release(QPointF(400, 400));
        QVERIFY(m_controller->selection().isEmpty());
    }

    // ===== Erasing =====

    void testEraserGestureIsOneHistoryEntry() {
        addRect("a", QRect(0, 0, 40, 40));
        addRect("b", QRect(100, 0, 40, 40));
        addRect("c", QRect(200, 0, 40, 40));

        m_controller->setTool(ToolType::Eraser);
        press(QPointF(20, 20));
        move(QPointF(120, 20));
        move(QPointF(220, 20));
        release(QPointF(220, 20));

        QVERIFY(m_store->isEmpty());
        QCOMPARE(m_api->callCount("delete:"), 3);
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->undoStack().last().type, HistoryAction::Delete);
        QCOMPARE(m_history->undoStack().last().elements.size(), 3);

        // One undo brings the whole stroke back
        QVERIFY(m_history->undo());
        QCOMPARE(m_store->elementCount(), 3);
        QVERIFY(m_store->contains("a") && m_store->contains("b") && m_store->contains("c"));
    }

    void testEraserWaitsForDeletesInFlight() {
        addRect("a", QRect(0, 0, 40, 40));
        addRect("b", QRect(100, 0, 40, 40));
        m_api->setDeferred(true);

        m_controller->setTool(ToolType::Eraser);
        press(QPointF(20, 20));
        move(QPointF(120, 20));
        release(QPointF(120, 20));
        QCOMPARE(m_history->undoCount(), 0);

        m_api->flush();
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->undoStack().last().elements.size(), 2);
    }

    // ===== Delete Key =====

    void testDeleteKeyRespectsTextFocus() {
        addRect("a", QRect(100, 100, 50, 50));
        addRect("b", QRect(300, 100, 50, 50));
        m_controller->setSelection({"a", "b"});

        QVERIFY(!m_controller->handleDeleteKey(true));
        QCOMPARE(m_store->elementCount(), 2);

        QVERIFY(m_controller->handleDeleteKey(false));
        QVERIFY(m_store->isEmpty());
        QVERIFY(m_controller->selection().isEmpty());
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->undoStack().last().elements.size(), 2);
    }

    // ===== Text =====

    void testTextEditsAreDebounced() {
        EditorOptions options = defaultOptions();
        options.textDebounceMs = 20;
        setUpController(options);
        addExisting(CanvasElement::makeTextBox(QRect(0, 0, 200, 100), "x"), "t");

        m_controller->editText("t", "a");
        m_controller->editText("t", "ab");
        QCOMPARE(m_api->callCount("update:"), 0);

        QTRY_COMPARE(m_api->callCount("update:t"), 1);
        QCOMPARE(m_store->element("t")->as<TextBoxData>()->text, QString("ab"));
        QCOMPARE(m_history->undoCount(), 1);

        // Undo goes back to the text before the edit
        QVERIFY(m_history->undo());
        QCOMPARE(m_store->element("t")->as<TextBoxData>()->text, QString("x"));
    }

    void testFlushSavesPendingText() {
        addExisting(CanvasElement::makeTextBox(QRect(0, 0, 200, 100)), "t");
        m_controller->editText("t", "hello");
        m_controller->flushTextEdits();
        QCOMPARE(m_api->callCount("update:t"), 1);
        QCOMPARE(m_api->record("t").as<TextBoxData>()->text, QString("hello"));
    }

    void testTextSaveForDeletedElementIsDropped() {
        addExisting(CanvasElement::makeTextBox(QRect(0, 0, 200, 100)), "t");
        m_controller->editText("t", "late");
        QCOMPARE(m_controller->textTaskCount(), 1);

        m_store->removeElement("t");
        m_controller->flushTextEdits();
        QCOMPARE(m_api->callCount("update:"), 0);
        QCOMPARE(m_controller->textTaskCount(), 0);
    }

    void testPruneDropsTextSavesOfRemovedElements() {
        addExisting(CanvasElement::makeTextBox(QRect(0, 0, 200, 100)), "t");
        addExisting(CanvasElement::makeTextBox(QRect(300, 0, 200, 100)), "u");
        m_controller->editText("t", "gone");
        m_controller->editText("u", "kept");

        m_store->removeElement("t");
        m_controller->pruneSelection();
        QCOMPARE(m_controller->textTaskCount(), 1);

        m_controller->flushTextEdits();
        QCOMPARE(m_api->callCount("update:t"), 0);
        QCOMPARE(m_api->callCount("update:u"), 1);
    }

    void testTextSavedDuringUndoIsRecorded() {
        addRect("a", QRect(100, 100, 50, 50));
        addExisting(CanvasElement::makeTextBox(QRect(300, 0, 200, 100)), "t");
        press(QPointF(125, 125));
        release(QPointF(145, 145));
        QCOMPARE(m_history->undoCount(), 1);

        m_api->setDeferred(true);
        m_controller->editText("t", "typed");
        m_controller->flushTextEdits();
        QVERIFY(m_history->undo());
        m_api->flush();

        QVERIFY(!m_history->isReplaying());
        QCOMPARE(m_store->element("a")->rect(), QRect(100, 100, 50, 50));
        QCOMPARE(m_store->element("t")->as<TextBoxData>()->text, QString("typed"));
        QCOMPARE(m_history->undoCount(), 1);
        QCOMPARE(m_history->undoStack().last().type, HistoryAction::Update);
        QCOMPARE(m_history->undoStack().last().id, QString("t"));
        QCOMPARE(m_history->redoCount(), 0);
    }

    // ===== Readonly =====

    void testReadonlyBlocksEditing() {
        EditorOptions options = defaultOptions();
        options.readonly = true;
        setUpController(options);
        addRect("a", QRect(100, 100, 50, 50));

        m_controller->setTool(ToolType::Rectangle);
        QCOMPARE(m_controller->tool(), ToolType::None);

        press(QPointF(125, 125));
        QCOMPARE(m_controller->mode(), InteractionController::Mode::Idle);
        release(QPointF(200, 200));

        m_controller->selectOnly("a");
        QVERIFY(!m_controller->handleDeleteKey(false));
        m_controller->editText("a", "nope");
        m_controller->flushTextEdits();

        QVERIFY(m_api->calls().isEmpty());
    }

    void testEnteringReadonlyDisarmsTool() {
        m_controller->setTool(ToolType::Freehand);
        m_controller->setReadonly(true);
        QCOMPARE(m_controller->tool(), ToolType::None);
    }
};

#endif // INTERACTIONCONTROLLERTESTS_H
