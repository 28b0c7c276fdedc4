// ============================================================================
// InteractionController - Implementation
// ============================================================================

#include "InteractionController.h"
#include "../core/ElementStore.h"
#include "../core/ElementSync.h"
#include "../core/ScheduledTask.h"
#include "../core/Viewport.h"
#include "../geometry/Geometry.h"
#include "../history/HistoryManager.h"

#include <QPointer>
#include <QSet>
#include <QtMath>
#include <QDebug>

/// One group of deletes that becomes a single undo entry (eraser stroke, Delete key).
struct InteractionController::DeleteBatch {
    QVector<CanvasElement> issued;      ///< Snapshots, in the order deletes were sent
    QSet<QString> seen;                 ///< Ids already sent in this batch
    QSet<QString> confirmed;
    int pending = 0;
    bool closed = false;
    bool finished = false;
    QString firstError;
};

/// Updates of one gesture; only the first failure is reported.
struct InteractionController::UpdateBatch {
    int pending = 0;
    bool closed = false;
    QString firstError;
};

InteractionController::InteractionController(ElementStore* store, ElementSync* sync,
                                             HistoryManager* history, Viewport* viewport,
                                             const EditorOptions& options, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_sync(sync)
    , m_history(history)
    , m_viewport(viewport)
    , m_options(options)
{
}

InteractionController::~InteractionController() = default;

// ============================================================================
// Tools & Options
// ============================================================================

void InteractionController::setTool(ToolType tool)
{
    const ToolType next = (tool == m_tool) ? ToolType::None : tool;
    if (m_options.readonly && next != ToolType::None) {
        return;
    }

    resetGesture();
    m_tool = next;
    if (m_tool != ToolType::None) {
        clearSelection();
    }

    qDebug() << "InteractionController::setTool:" << toolName(m_tool);
    emit toolChanged(m_tool);
    emit changed();
}

void InteractionController::clearTools()
{
    resetGesture();
    const bool hadTool = m_tool != ToolType::None;
    m_tool = ToolType::None;
    clearSelection();
    if (hadTool) {
        emit toolChanged(m_tool);
    }
    emit changed();
}

Qt::CursorShape InteractionController::cursorShape() const
{
    return m_tool == ToolType::None ? Qt::ArrowCursor : Qt::CrossCursor;
}

void InteractionController::setStrokeColor(const QString& color)
{
    m_options.strokeColor = color.isEmpty() ? QStringLiteral("default") : color;
}

void InteractionController::setStrokeWidth(int width)
{
    m_options.strokeWidth = qMax(1, width);
}

void InteractionController::setShowGrid(bool show)
{
    if (m_options.showGrid == show) {
        return;
    }
    m_options.showGrid = show;
    emit changed();
}

void InteractionController::setReadonly(bool readonly)
{
    if (m_options.readonly == readonly) {
        return;
    }
    m_options.readonly = readonly;
    if (readonly) {
        clearTools();
    }
    emit changed();
}

int InteractionController::snap(qreal value) const
{
    if (m_options.showGrid) {
        return Geometry::snapToGrid(value, m_options.gridSize);
    }
    return qRound(value);
}

// ============================================================================
// Selection
// ============================================================================

void InteractionController::setSelection(const QVector<QString>& ids)
{
    if (ids == m_selection) {
        return;
    }
    m_selection = ids;
    emit selectionChanged();
    emit changed();
}

void InteractionController::selectOnly(const QString& id)
{
    setSelection(QVector<QString>{id});
}

void InteractionController::clearSelection()
{
    setSelection(QVector<QString>());
}

void InteractionController::pruneSelection()
{
    QVector<QString> kept;
    for (const QString& id : m_selection) {
        if (m_store->contains(id)) {
            kept.append(id);
        }
    }
    setSelection(kept);

    const QList<QString> textIds = m_textTasks.keys();
    for (const QString& id : textIds) {
        if (!m_store->contains(id)) {
            dropTextTask(id);
        }
    }
}

// ============================================================================
// Hit Testing
// ============================================================================

ResizeHandle InteractionController::handleAt(const QPointF& canvasPt, QString* elementId) const
{
    if (m_tool != ToolType::None || m_options.readonly) {
        return ResizeHandle::None;
    }

    const qreal half = m_options.handleSize / m_viewport->scale() / 2.0;
    auto nearCorner = [&](const QPointF& corner) {
        return qAbs(canvasPt.x() - corner.x()) <= half && qAbs(canvasPt.y() - corner.y()) <= half;
    };

    const QVector<CanvasElement> ordered = m_store->paintOrder();
    for (int i = ordered.size() - 1; i >= 0; --i) {
        const CanvasElement el = shownElement(ordered[i]);
        const QRectF box = Geometry::elementBounds(el);

        ResizeHandle found = ResizeHandle::None;
        if (nearCorner(box.topLeft()))          found = ResizeHandle::NorthWest;
        else if (nearCorner(box.topRight()))    found = ResizeHandle::NorthEast;
        else if (nearCorner(box.bottomLeft()))  found = ResizeHandle::SouthWest;
        else if (nearCorner(box.bottomRight())) found = ResizeHandle::SouthEast;

        if (found != ResizeHandle::None) {
            if (elementId) {
                *elementId = el.id;
            }
            return found;
        }
    }
    return ResizeHandle::None;
}

QString InteractionController::elementAt(const QPointF& canvasPt) const
{
    // A couple of screen pixels of slack for thin strokes
    const qreal radius = 2.0 / m_viewport->scale();
    if (m_pendingGeometry.isEmpty()) {
        const CanvasElement* el = m_store->topmostAt(canvasPt, radius);
        return el ? el->id : QString();
    }

    // Same ordering as ElementStore::topmostAt, on the geometry being shown
    QString bestId;
    int bestZ = 0;
    for (const CanvasElement& stored : m_store->elements()) {
        if (!Geometry::hitTest(canvasPt, shownElement(stored), radius)) {
            continue;
        }
        if (bestId.isEmpty() || stored.zIndex >= bestZ) {
            bestId = stored.id;
            bestZ = stored.zIndex;
        }
    }
    return bestId;
}

CanvasElement InteractionController::shownElement(const CanvasElement& el) const
{
    CanvasElement shown = el;
    const auto pending = m_pendingGeometry.constFind(el.id);
    if (pending != m_pendingGeometry.constEnd()) {
        shown.setRect(pending.value());
    }
    return shown;
}

// ============================================================================
// Pointer Dispatch
// ============================================================================

void InteractionController::handlePointerEvent(const PointerEvent& pe)
{
    switch (pe.type) {
        case PointerEvent::Press:
            handlePointerPress(pe);
            break;
        case PointerEvent::Move:
            handlePointerMove(pe);
            break;
        case PointerEvent::Release:
            handlePointerRelease(pe);
            break;
    }
}

void InteractionController::handlePointerPress(const PointerEvent& pe)
{
    if (m_options.readonly || m_mode != Mode::Idle) {
        return;
    }

    const QPointF pt = m_viewport->toCanvas(pe.clientPos);

    if (m_tool == ToolType::Eraser) {
        beginErasing(pt);
        return;
    }
    if (isDrawingTool(m_tool)) {
        beginDrawing(pt);
        return;
    }

    QString handleOwner;
    const ResizeHandle handle = handleAt(pt, &handleOwner);
    if (handle != ResizeHandle::None) {
        beginResize(handleOwner, handle, pt);
        return;
    }

    const QString hitId = elementAt(pt);
    if (!hitId.isEmpty()) {
        beginDrag(hitId, pt);
        return;
    }

    beginMarquee(pt);
}

void InteractionController::handlePointerMove(const PointerEvent& pe)
{
    if (m_options.readonly || m_mode == Mode::Idle) {
        return;
    }

    const QPointF pt = m_viewport->toCanvas(pe.clientPos);

    switch (m_mode) {
        case Mode::Drawing:
            continueDrawing(pt);
            break;
        case Mode::Dragging:
            continueDrag(pt);
            break;
        case Mode::Resizing:
            continueResize(pt);
            break;
        case Mode::Marquee:
            continueMarquee(pt);
            break;
        case Mode::Erasing:
            eraseAt(pt);
            break;
        case Mode::Idle:
            break;
    }
}

void InteractionController::handlePointerRelease(const PointerEvent& pe)
{
    if (m_mode == Mode::Idle) {
        return;
    }

    // The release position counts as the last move
    if (!m_options.readonly) {
        handlePointerMove(pe);
    }

    const Mode finishing = m_mode;
    m_mode = Mode::Idle;

    switch (finishing) {
        case Mode::Drawing:
            finishDrawing();
            break;
        case Mode::Dragging:
            finishDrag();
            break;
        case Mode::Resizing:
            finishResize();
            break;
        case Mode::Marquee:
            finishMarquee();
            break;
        case Mode::Erasing:
            finishErasing();
            break;
        case Mode::Idle:
            break;
    }
    emit changed();
}

void InteractionController::resetGesture()
{
    if (m_mode == Mode::Erasing) {
        finishErasing();
    }
    m_mode = Mode::Idle;
    m_dragItems.clear();
    m_resizeId.clear();
    m_resizeHandle = ResizeHandle::None;

    m_overlay.geometryOverrides = m_pendingGeometry;
    m_overlay.marquee.reset();
    m_overlay.drawing = false;
    m_overlay.drawPath.clear();
    m_overlay.eraserPos.reset();
}

// ============================================================================
// Drawing
// ============================================================================

void InteractionController::beginDrawing(const QPointF& pt)
{
    m_mode = Mode::Drawing;
    m_overlay.drawing = true;
    m_overlay.drawTool = m_tool;
    m_overlay.drawStart = pt;
    m_overlay.drawEnd = pt;
    m_overlay.drawPath.clear();
    if (m_tool == ToolType::Freehand) {
        m_overlay.drawPath.append(pt);
    }
    m_overlay.drawStroke.color = m_options.strokeColor;
    m_overlay.drawStroke.width = m_options.strokeWidth;
    emit changed();
}

void InteractionController::continueDrawing(const QPointF& pt)
{
    m_overlay.drawEnd = pt;
    if (m_overlay.drawTool == ToolType::Freehand) {
        if (m_overlay.drawPath.isEmpty() || m_overlay.drawPath.last() != pt) {
            m_overlay.drawPath.append(pt);
        }
    }
    emit changed();
}

std::optional<CanvasElement> InteractionController::buildShape() const
{
    const QPointF start = m_overlay.drawStart;
    const QPointF end = m_overlay.drawEnd;
    const StrokeStyle stroke = m_overlay.drawStroke;

    if (m_overlay.drawTool == ToolType::Line) {
        // Signed deltas keep the drawing direction
        const int x = qRound(start.x());
        const int y = qRound(start.y());
        const int dx = qRound(end.x() - start.x());
        const int dy = qRound(end.y() - start.y());
        if (qSqrt(qreal(dx) * dx + qreal(dy) * dy) < MIN_SHAPE_SIZE) {
            qDebug() << "InteractionController: Line too short, discarded";
            return std::nullopt;
        }
        return CanvasElement::makeLine(QPoint(x, y), dx, dy, stroke);
    }

    const QRect r(qRound(qMin(start.x(), end.x())), qRound(qMin(start.y(), end.y())),
                  qRound(qAbs(end.x() - start.x())), qRound(qAbs(end.y() - start.y())));
    if (r.width() < MIN_SHAPE_SIZE || r.height() < MIN_SHAPE_SIZE) {
        qDebug() << "InteractionController: Shape too small, discarded" << r;
        return std::nullopt;
    }

    switch (m_overlay.drawTool) {
        case ToolType::TextBox:
            return CanvasElement::makeTextBox(r);
        case ToolType::Rectangle:
            return CanvasElement::makeRectangle(r, stroke);
        case ToolType::Circle:
            return CanvasElement::makeCircle(r, stroke);
        default:
            return std::nullopt;
    }
}

std::optional<CanvasElement> InteractionController::buildFreehand() const
{
    const QVector<QPointF>& pts = m_overlay.drawPath;
    if (pts.size() < 2) {
        qDebug() << "InteractionController: Stroke too short, discarded";
        return std::nullopt;
    }

    qreal minX = pts.first().x(), maxX = minX;
    qreal minY = pts.first().y(), maxY = minY;
    for (const QPointF& p : pts) {
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
        minY = qMin(minY, p.y());
        maxY = qMax(maxY, p.y());
    }

    // Pad so round caps are not clipped; the padded origin never goes negative
    const int margin = m_options.effectiveFreehandMargin();
    const int left = qMax(0, qFloor(minX) - margin);
    const int top = qMax(0, qFloor(minY) - margin);
    const int right = qCeil(maxX) + margin;
    const int bottom = qCeil(maxY) + margin;

    QVector<QPointF> relative;
    relative.reserve(pts.size());
    const QPointF origin(left, top);
    for (const QPointF& p : pts) {
        relative.append(p - origin);
    }

    return CanvasElement::makeFreehand(QRect(left, top, right - left, bottom - top), relative,
                                       m_overlay.drawStroke);
}

void InteractionController::finishDrawing()
{
    const std::optional<CanvasElement> draft =
        (m_overlay.drawTool == ToolType::Freehand) ? buildFreehand() : buildShape();

    m_overlay.drawing = false;
    m_overlay.drawPath.clear();

    if (draft) {
        createElement(*draft);
    }
}

void InteractionController::createElement(const CanvasElement& draft)
{
    CanvasElement el = draft;
    el.zIndex = m_store->nextZIndex();

    const QString fallbackError = el.type() == ElementType::Freehand
        ? ServiceErrors::createDrawing() : ServiceErrors::createShape();

    QPointer<InteractionController> self(this);
    m_sync->create(el, [self, fallbackError](const ServiceResult& result) {
        if (!self) return;
        if (!result.success || !result.element) {
            // A success without a readable element still failed to create
            emit self->errorOccurred(result.error.isEmpty() ? fallbackError : result.error);
            return;
        }
        self->m_history->push(HistoryAction::created(*result.element));
        if (result.element->type() == ElementType::TextBox) {
            emit self->textBoxCreated(result.element->id);
        }
    });
}

// ============================================================================
// Dragging
// ============================================================================

void InteractionController::beginDrag(const QString& clickedId, const QPointF& pt)
{
    m_dragItems.clear();

    QVector<QString> ids;
    if (isSelected(clickedId) && m_selection.size() > 1) {
        ids = m_selection;
    } else {
        selectOnly(clickedId);
        ids.append(clickedId);
    }

    for (const QString& id : ids) {
        if (const CanvasElement* el = m_store->element(id)) {
            m_dragItems.append({id, shownElement(*el).rect()});
        }
    }
    if (m_dragItems.isEmpty()) {
        return;
    }

    m_pressPos = pt;
    m_mode = Mode::Dragging;
}

QRect InteractionController::dragTarget(const DragItem& item, const QPointF& pt) const
{
    const QPointF delta = pt - m_pressPos;
    const int x = qMax(0, snap(item.start.x() + delta.x()));
    const int y = qMax(0, snap(item.start.y() + delta.y()));
    return QRect(x, y, item.start.width(), item.start.height());
}

void InteractionController::continueDrag(const QPointF& pt)
{
    m_overlay.geometryOverrides = m_pendingGeometry;
    for (const DragItem& item : m_dragItems) {
        m_overlay.geometryOverrides.insert(item.id, dragTarget(item, pt));
    }
    emit changed();
}

void InteractionController::finishDrag()
{
    const QVector<DragItem> items = m_dragItems;
    QVector<QPair<QString, QRect>> moves;
    for (const DragItem& item : items) {
        const QRect target = m_overlay.geometryOverrides.value(item.id, item.start);
        if (target.topLeft() != item.start.topLeft()) {
            moves.append({item.id, target});
        }
    }

    m_dragItems.clear();
    m_overlay.geometryOverrides = m_pendingGeometry;

    if (moves.isEmpty()) {
        return;
    }

    auto batch = std::make_shared<UpdateBatch>();
    for (const auto& move : moves) {
        commitGeometry(move.first, ElementPatch::position(move.second.x(), move.second.y()), batch);
    }
    batch->closed = true;
    if (batch->pending == 0 && !batch->firstError.isEmpty()) {
        emit errorOccurred(batch->firstError);
    }
}

// ============================================================================
// Resizing
// ============================================================================

void InteractionController::beginResize(const QString& id, ResizeHandle handle, const QPointF& pt)
{
    const CanvasElement* stored = m_store->element(id);
    if (!stored) {
        return;
    }
    const CanvasElement el = shownElement(*stored);

    selectOnly(id);
    m_resizeId = id;
    m_resizeHandle = handle;
    m_resizeStart = Geometry::elementBounds(el).toRect();
    m_resizeFlipX = el.type() == ElementType::Line && el.width < 0;
    m_resizeFlipY = el.type() == ElementType::Line && el.height < 0;
    m_pressPos = pt;
    m_mode = Mode::Resizing;
}

QRect InteractionController::resizeTarget(const QPointF& pt) const
{
    const qreal dx = pt.x() - m_pressPos.x();
    const qreal dy = pt.y() - m_pressPos.y();
    const QRect& s = m_resizeStart;

    qreal left = s.x();
    qreal top = s.y();
    qreal width = s.width();
    qreal height = s.height();

    const bool east = m_resizeHandle == ResizeHandle::NorthEast || m_resizeHandle == ResizeHandle::SouthEast;
    const bool west = m_resizeHandle == ResizeHandle::NorthWest || m_resizeHandle == ResizeHandle::SouthWest;
    const bool south = m_resizeHandle == ResizeHandle::SouthWest || m_resizeHandle == ResizeHandle::SouthEast;
    const bool north = m_resizeHandle == ResizeHandle::NorthWest || m_resizeHandle == ResizeHandle::NorthEast;

    // The opposite corner stays anchored
    if (east) {
        width = qMax<qreal>(MIN_RESIZE, s.width() + dx);
    }
    if (west) {
        width = qMax<qreal>(MIN_RESIZE, s.width() - dx);
        left = s.x() + (s.width() - width);
    }
    if (south) {
        height = qMax<qreal>(MIN_RESIZE, s.height() + dy);
    }
    if (north) {
        height = qMax<qreal>(MIN_RESIZE, s.height() - dy);
        top = s.y() + (s.height() - height);
    }

    const int x = snap(left);
    const int y = snap(top);
    const int w = qMax(int(MIN_RESIZE), snap(width));
    const int h = qMax(int(MIN_RESIZE), snap(height));

    // Lines keep their direction
    const QRect stored(m_resizeFlipX ? x + w : x, m_resizeFlipY ? y + h : y,
                       m_resizeFlipX ? -w : w, m_resizeFlipY ? -h : h);
    return stored;
}

void InteractionController::continueResize(const QPointF& pt)
{
    m_overlay.geometryOverrides = m_pendingGeometry;
    m_overlay.geometryOverrides.insert(m_resizeId, resizeTarget(pt));
    emit changed();
}

void InteractionController::finishResize()
{
    const QString id = m_resizeId;
    const CanvasElement* el = m_store->element(id);
    const QRect start = el ? shownElement(*el).rect() : QRect();
    const QRect target = m_overlay.geometryOverrides.value(id, start);

    m_resizeId.clear();
    m_resizeHandle = ResizeHandle::None;
    m_overlay.geometryOverrides = m_pendingGeometry;

    if (!el || target == start) {
        return;
    }

    auto batch = std::make_shared<UpdateBatch>();
    commitGeometry(id, ElementPatch::geometry(target), batch);
    batch->closed = true;
    if (batch->pending == 0 && !batch->firstError.isEmpty()) {
        emit errorOccurred(batch->firstError);
    }
}

// ============================================================================
// Marquee Selection
// ============================================================================

void InteractionController::beginMarquee(const QPointF& pt)
{
    m_pressPos = pt;
    m_mode = Mode::Marquee;
    m_overlay.marquee = QRectF(pt, QSizeF(0, 0));
    emit changed();
}

void InteractionController::continueMarquee(const QPointF& pt)
{
    m_overlay.marquee = Geometry::rectFromPoints(m_pressPos, pt);
    emit changed();
}

void InteractionController::finishMarquee()
{
    const QRectF rect = m_overlay.marquee.value_or(QRectF(m_pressPos, QSizeF(0, 0)));
    m_overlay.marquee.reset();
    setSelection(m_store->elementsInRect(rect));
}

// ============================================================================
// Erasing
// ============================================================================

void InteractionController::beginErasing(const QPointF& pt)
{
    m_mode = Mode::Erasing;
    m_eraseBatch = std::make_shared<DeleteBatch>();
    eraseAt(pt);
}

void InteractionController::eraseAt(const QPointF& pt)
{
    m_overlay.eraserPos = pt;
    if (!m_eraseBatch) {
        return;
    }

    QVector<CanvasElement> hits;
    for (const QString& id : m_store->elementsAtPoint(pt, m_options.eraserRadius)) {
        if (m_eraseBatch->seen.contains(id)) {
            continue;
        }
        if (const CanvasElement* el = m_store->element(id)) {
            hits.append(*el);
        }
    }
    if (!hits.isEmpty()) {
        deleteElements(hits, m_eraseBatch);
    }
    emit changed();
}

void InteractionController::finishErasing()
{
    m_overlay.eraserPos.reset();
    std::shared_ptr<DeleteBatch> batch = m_eraseBatch;
    m_eraseBatch.reset();
    if (batch) {
        closeDeleteBatch(batch);
    }
}

// ============================================================================
// Deleting
// ============================================================================

bool InteractionController::handleDeleteKey(bool textInputFocused)
{
    if (m_options.readonly || textInputFocused || m_selection.isEmpty()) {
        return false;
    }
    deleteSelection();
    return true;
}

void InteractionController::deleteSelection()
{
    if (m_options.readonly || m_selection.isEmpty()) {
        return;
    }

    QVector<CanvasElement> snapshots = m_store->snapshot(m_selection);
    clearSelection();
    if (snapshots.isEmpty()) {
        return;
    }

    auto batch = std::make_shared<DeleteBatch>();
    deleteElements(snapshots, batch);
    closeDeleteBatch(batch);
}

void InteractionController::deleteElements(const QVector<CanvasElement>& snapshots,
                                           std::shared_ptr<DeleteBatch> batch)
{
    QPointer<InteractionController> self(this);
    for (const CanvasElement& snap : snapshots) {
        if (batch->seen.contains(snap.id)) {
            continue;
        }
        batch->seen.insert(snap.id);
        batch->issued.append(snap);
        ++batch->pending;

        const QString id = snap.id;
        m_sync->remove(id, [self, batch, id](const ServiceResult& result) {
            if (!self) return;
            --batch->pending;
            if (result.success) {
                batch->confirmed.insert(id);
            } else if (batch->firstError.isEmpty()) {
                batch->firstError = result.error;
            }
            self->maybeFinishDeleteBatch(batch);
        });
    }
}

void InteractionController::closeDeleteBatch(std::shared_ptr<DeleteBatch> batch)
{
    batch->closed = true;
    maybeFinishDeleteBatch(batch);
}

void InteractionController::maybeFinishDeleteBatch(std::shared_ptr<DeleteBatch> batch)
{
    // Deletes still in flight are awaited before the group is recorded
    if (!batch->closed || batch->pending > 0 || batch->finished) {
        return;
    }
    batch->finished = true;

    QVector<CanvasElement> deleted;
    for (const CanvasElement& snap : batch->issued) {
        if (batch->confirmed.contains(snap.id)) {
            deleted.append(snap);
        }
    }
    if (!deleted.isEmpty()) {
        m_history->push(HistoryAction::deleted(deleted));
    }
    if (!batch->firstError.isEmpty()) {
        emit errorOccurred(batch->firstError);
    }
    pruneSelection();
    emit changed();
}

// ============================================================================
// Geometry & Text Commits
// ============================================================================

void InteractionController::commitGeometry(const QString& id, const ElementPatch& next,
                                           std::shared_ptr<UpdateBatch> batch)
{
    const CanvasElement* el = m_store->element(id);
    if (!el) {
        return;
    }

    // Undo returns to what was on screen, which may itself be unconfirmed
    CanvasElement shown = shownElement(*el);
    const ElementPatch prev = next.capture(shown);
    next.applyTo(shown);
    const QRect shownRect = shown.rect();

    // Keep showing the new geometry until the service answers
    m_pendingGeometry.insert(id, shownRect);
    m_overlay.geometryOverrides.insert(id, shownRect);
    ++m_pendingCommits;
    ++batch->pending;

    QPointer<InteractionController> self(this);
    m_sync->update(id, next, [self, id, prev, next, shownRect, batch](const ServiceResult& result) {
        if (!self) return;
        --self->m_pendingCommits;
        --batch->pending;

        if (self->m_pendingGeometry.value(id) == shownRect) {
            self->m_pendingGeometry.remove(id);
            if (self->m_mode != Mode::Dragging && self->m_mode != Mode::Resizing) {
                self->m_overlay.geometryOverrides = self->m_pendingGeometry;
            }
        }

        if (result.success) {
            self->m_history->push(HistoryAction::updated(id, prev, next));
        } else if (batch->firstError.isEmpty()) {
            // Stored geometry is still the last known-good value
            batch->firstError = result.error;
        }

        if (batch->closed && batch->pending == 0 && !batch->firstError.isEmpty()) {
            emit self->errorOccurred(batch->firstError);
        }
        emit self->changed();
    });
}

void InteractionController::editText(const QString& id, const QString& text)
{
    if (m_options.readonly || id.isEmpty()) {
        return;
    }

    ScheduledTask* task = m_textTasks.value(id, nullptr);
    if (!task) {
        task = new ScheduledTask(this);
        m_textTasks.insert(id, task);
    }

    QPointer<InteractionController> self(this);
    task->schedule(m_options.textDebounceMs, [self, id, text]() {
        if (self) {
            self->commitText(id, text);
        }
    });
}

void InteractionController::flushTextEdits()
{
    // A flushed save may drop its own task
    const QList<ScheduledTask*> tasks = m_textTasks.values();
    for (ScheduledTask* task : tasks) {
        task->flush();
    }
}

void InteractionController::dropTextTask(const QString& id)
{
    ScheduledTask* task = m_textTasks.take(id);
    if (!task) {
        return;
    }
    qDebug() << "InteractionController::dropTextTask: Element gone:" << id;
    task->cancel();
    // May be running the callback that got us here
    task->deleteLater();
}

void InteractionController::commitText(const QString& id, const QString& text)
{
    const CanvasElement* el = m_store->element(id);
    if (!el) {
        dropTextTask(id);
        return;
    }
    if (el->type() != ElementType::TextBox) {
        return;
    }

    const ElementPatch next = ElementPatch::textContent(text);
    const ElementPatch prev = next.capture(*el);
    if (prev == next) {
        return;
    }

    QPointer<InteractionController> self(this);
    m_sync->update(id, next, [self, id, prev, next](const ServiceResult& result) {
        if (!self) return;
        if (!result.success) {
            emit self->errorOccurred(result.error);
            return;
        }
        self->m_history->push(HistoryAction::updated(id, prev, next));
    });
}

// ============================================================================
// Images
// ============================================================================

void InteractionController::insertImage(const QString& filePath)
{
    if (m_options.readonly || filePath.isEmpty()) {
        return;
    }

    const QRect placement(50, 50, 200, 200);
    QPointer<InteractionController> self(this);
    m_sync->uploadImage(filePath, placement, m_store->nextZIndex(),
                        [self](const ServiceResult& result) {
        if (!self) return;
        if (!result.success || !result.element) {
            emit self->errorOccurred(result.error.isEmpty() ? ServiceErrors::upload() : result.error);
            return;
        }
        self->m_history->push(HistoryAction::created(*result.element));
    });
}
