// ============================================================================
// CanvasView - Implementation
// ============================================================================

#include "CanvasView.h"
#include "../CanvasEditor.h"
#include "../core/ElementStore.h"
#include "../core/Viewport.h"
#include "../input/InteractionController.h"

#include <QApplication>
#include <QDebug>
#include <QFile>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPainter>
#include <QPaintEvent>
#include <QPlainTextEdit>
#include <QResizeEvent>
#include <QScrollBar>
#include <QTabletEvent>
#include <QTouchEvent>
#include <QUrl>
#include <QWheelEvent>

namespace {
const char* const ELEMENT_ID_PROPERTY = "elementId";
}

CanvasView::CanvasView(CanvasEditor* editor, QWidget* parent)
    : QAbstractScrollArea(parent)
    , m_editor(editor)
{
    setFocusPolicy(Qt::StrongFocus);
    setFrameShape(QFrame::NoFrame);
    viewport()->setAttribute(Qt::WA_AcceptTouchEvents, true);
    viewport()->setMouseTracking(true);

    m_network = new QNetworkAccessManager(this);

    attachInput();
    refresh();
}

CanvasView::~CanvasView() = default;

bool CanvasView::attachInput()
{
    if (m_inputAttached || !m_editor) {
        return false;
    }
    m_inputAttached = true;

    connect(m_editor, &CanvasEditor::changed, this, &CanvasView::refresh);
    connect(m_editor, &CanvasEditor::scaleChanged, this, &CanvasView::refresh);
    connect(m_editor, &CanvasEditor::toolChanged, this, [this](ToolType) {
        updateCursor();
        refresh();
    });
    connect(m_editor, &CanvasEditor::readonlyChanged, this, &CanvasView::refresh);
    connect(m_editor, &CanvasEditor::textBoxCreated, this, &CanvasView::focusTextBox);
    return true;
}

// ============================================================================
// Scene
// ============================================================================

void CanvasView::refresh()
{
    updateScrollRange();
    m_scene = m_editor->buildScene(viewport()->size());
    syncTextEditors();
    requestImages();
    updateCursor();
    viewport()->update();
}

void CanvasView::updateScrollRange()
{
    const QSize visible = viewport()->size();
    const QSize scaled = m_editor->viewport()->scaledSurfaceSize(visible,
                                                                 m_editor->store()->contentExtent());

    horizontalScrollBar()->setPageStep(visible.width());
    verticalScrollBar()->setPageStep(visible.height());
    horizontalScrollBar()->setSingleStep(20);
    verticalScrollBar()->setSingleStep(20);
    horizontalScrollBar()->setRange(0, qMax(0, scaled.width() - visible.width()));
    verticalScrollBar()->setRange(0, qMax(0, scaled.height() - visible.height()));

    syncViewportOffset();
}

void CanvasView::syncViewportOffset()
{
    Viewport* vp = m_editor->viewport();
    vp->setSurfaceOrigin(QPointF(0, 0));
    vp->setScrollOffset(QPointF(horizontalScrollBar()->value(), verticalScrollBar()->value()));
}

void CanvasView::scrollContentsBy(int dx, int dy)
{
    Q_UNUSED(dx);
    Q_UNUSED(dy);
    syncViewportOffset();
    for (const RenderItem& item : m_scene.items) {
        if (QPlainTextEdit* edit = m_textEditors.value(item.id, nullptr)) {
            layoutTextEditor(edit, item);
        }
    }
    viewport()->update();
}

void CanvasView::paintEvent(QPaintEvent* event)
{
    QPainter painter(viewport());
    const Viewport* vp = m_editor->viewport();

    painter.translate(vp->surfaceOrigin() - vp->scrollOffset());
    painter.scale(vp->scale(), vp->scale());

    const QRectF exposed = painter.transform().inverted().mapRect(QRectF(event->rect()));
    CanvasRenderer::paint(painter, m_scene, exposed, m_images, false);
}

void CanvasView::resizeEvent(QResizeEvent* event)
{
    QAbstractScrollArea::resizeEvent(event);
    refresh();
}

void CanvasView::updateCursor()
{
    viewport()->setCursor(m_editor->controller()->cursorShape());
}

// ============================================================================
// Text Box Editors
// ============================================================================

void CanvasView::syncTextEditors()
{
    const bool readonly = m_editor->isReadonly();
    const bool toolArmed = m_editor->tool() != ToolType::None;

    QSet<QString> live;
    for (const RenderItem& item : m_scene.items) {
        if (item.type != ElementType::TextBox) {
            continue;
        }
        live.insert(item.id);

        QPlainTextEdit* edit = m_textEditors.value(item.id, nullptr);
        if (!edit) {
            edit = createTextEditor(item.id);
            m_textEditors.insert(item.id, edit);
        }

        // Never overwrite what the user is typing
        if (!edit->hasFocus() && edit->toPlainText() != item.text) {
            m_syncingText = true;
            edit->setPlainText(item.text);
            m_syncingText = false;
        }
        edit->setReadOnly(readonly);
        // Drawing tools work over text boxes too
        edit->setAttribute(Qt::WA_TransparentForMouseEvents, toolArmed);
        layoutTextEditor(edit, item);
    }

    for (auto it = m_textEditors.begin(); it != m_textEditors.end();) {
        if (!live.contains(it.key())) {
            it.value()->deleteLater();
            it = m_textEditors.erase(it);
        } else {
            ++it;
        }
    }
}

QPlainTextEdit* CanvasView::createTextEditor(const QString& id)
{
    auto* edit = new QPlainTextEdit(viewport());
    edit->setProperty(ELEMENT_ID_PROPERTY, id);
    edit->setFrameShape(QFrame::NoFrame);
    edit->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    edit->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    edit->setPlaceholderText(tr("Type here..."));
    edit->setStyleSheet(QStringLiteral("QPlainTextEdit { background: transparent; }"));
    edit->installEventFilter(this);

    connect(edit, &QPlainTextEdit::textChanged, this, [this, edit, id]() {
        if (m_syncingText) {
            return;
        }
        m_editor->controller()->editText(id, edit->toPlainText());
    });

    edit->show();
    return edit;
}

void CanvasView::layoutTextEditor(QPlainTextEdit* edit, const RenderItem& item)
{
    const Viewport* vp = m_editor->viewport();
    const QPointF topLeft = vp->toClient(item.bounds.topLeft());
    const QRect client = QRectF(topLeft, item.bounds.size() * vp->scale()).toAlignedRect();
    const QRect inner = client.adjusted(TEXT_GRAB_INSET, TEXT_GRAB_INSET,
                                        -TEXT_GRAB_INSET, -TEXT_GRAB_INSET);
    if (inner.width() <= 0 || inner.height() <= 0) {
        edit->hide();
        return;
    }

    QFont font = edit->font();
    font.setPointSizeF(qMax(4.0, TEXT_POINT_SIZE * vp->scale()));
    edit->setFont(font);

    QPalette pal = edit->palette();
    pal.setColor(QPalette::Text, m_scene.dark ? QColor(Qt::white) : QColor(Qt::black));
    edit->setPalette(pal);

    edit->setGeometry(inner);
    edit->show();
}

void CanvasView::focusTextBox(const QString& id)
{
    refresh();
    if (QPlainTextEdit* edit = m_textEditors.value(id, nullptr)) {
        edit->setFocus(Qt::OtherFocusReason);
        edit->moveCursor(QTextCursor::End);
    }
}

bool CanvasView::eventFilter(QObject* watched, QEvent* event)
{
    auto* edit = qobject_cast<QPlainTextEdit*>(watched);
    if (!edit) {
        return QAbstractScrollArea::eventFilter(watched, event);
    }

    const QString id = edit->property(ELEMENT_ID_PROPERTY).toString();
    switch (event->type()) {
        case QEvent::MouseButtonPress:
            // Clicking into a text box selects it; the editor still gets the click
            if (!m_editor->isReadonly() && m_editor->tool() == ToolType::None) {
                m_editor->controller()->selectOnly(id);
            }
            break;
        case QEvent::FocusOut:
            m_editor->controller()->flushTextEdits();
            break;
        default:
            break;
    }
    return false;
}

// ============================================================================
// Pointer Input
// ============================================================================

bool CanvasView::isSynthesized(const QMouseEvent* event)
{
    return event->source() == Qt::MouseEventSynthesizedBySystem
        || event->source() == Qt::MouseEventSynthesizedByQt;
}

void CanvasView::dispatch(const PointerEvent& pe)
{
    switch (pe.type) {
        case PointerEvent::Press:
            m_pointerActive = true;
            m_activeSource = pe.source;
            setFocus(Qt::MouseFocusReason);
            break;
        case PointerEvent::Release:
            m_pointerActive = false;
            break;
        case PointerEvent::Move:
            break;
    }
    m_editor->controller()->handlePointerEvent(pe);
    if (pe.type == PointerEvent::Release) {
        m_activeSource = PointerEvent::Unknown;
    }
}

void CanvasView::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || isSynthesized(event)) {
        event->ignore();
        return;
    }
    // Tablet events already drive this gesture
    if (m_pointerActive && m_activeSource != PointerEvent::Mouse) {
        event->accept();
        return;
    }

    PointerEvent pe = PointerEvent::make(PointerEvent::Press, event->position(), PointerEvent::Mouse);
    pe.buttons = event->buttons();
    pe.modifiers = event->modifiers();
    pe.timestamp = event->timestamp();
    dispatch(pe);
    event->accept();
}

void CanvasView::mouseMoveEvent(QMouseEvent* event)
{
    if (isSynthesized(event)) {
        event->ignore();
        return;
    }
    if (!m_pointerActive || m_activeSource != PointerEvent::Mouse) {
        event->accept();
        return;
    }

    PointerEvent pe = PointerEvent::make(PointerEvent::Move, event->position(), PointerEvent::Mouse);
    pe.buttons = event->buttons();
    pe.modifiers = event->modifiers();
    pe.timestamp = event->timestamp();
    dispatch(pe);
    event->accept();
}

void CanvasView::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || isSynthesized(event)) {
        event->ignore();
        return;
    }
    if (m_activeSource != PointerEvent::Mouse) {
        event->accept();
        return;
    }

    PointerEvent pe = PointerEvent::make(PointerEvent::Release, event->position(), PointerEvent::Mouse);
    pe.modifiers = event->modifiers();
    pe.timestamp = event->timestamp();
    dispatch(pe);
    event->accept();
}

bool CanvasView::handleTabletEvent(QTabletEvent* event)
{
    PointerEvent::Type type;
    switch (event->type()) {
        case QEvent::TabletPress:
            type = PointerEvent::Press;
            break;
        case QEvent::TabletMove:
            type = PointerEvent::Move;
            break;
        case QEvent::TabletRelease:
            type = PointerEvent::Release;
            break;
        default:
            return false;
    }

    // Hovering pen: nothing to do
    if (type == PointerEvent::Move && !m_pointerActive) {
        event->accept();
        return true;
    }
    if (type != PointerEvent::Press && m_activeSource != PointerEvent::Stylus) {
        event->accept();
        return true;
    }

    PointerEvent pe = PointerEvent::make(type, event->position(), PointerEvent::Stylus);
    pe.buttons = event->buttons();
    pe.modifiers = event->modifiers();
    pe.timestamp = event->timestamp();
    dispatch(pe);
    event->accept();
    return true;
}

bool CanvasView::handleTouchEvent(QTouchEvent* event)
{
    if (event->points().isEmpty()) {
        return false;
    }

    // Single-finger input only; extra fingers are ignored
    const QEventPoint& point = event->points().first();
    PointerEvent::Type type;
    switch (event->type()) {
        case QEvent::TouchBegin:
            type = PointerEvent::Press;
            break;
        case QEvent::TouchUpdate:
            type = PointerEvent::Move;
            break;
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            type = PointerEvent::Release;
            break;
        default:
            return false;
    }

    if (type != PointerEvent::Press && m_activeSource != PointerEvent::Touch) {
        event->accept();
        return true;
    }
    if (type == PointerEvent::Press && m_pointerActive) {
        event->accept();
        return true;
    }

    PointerEvent pe = PointerEvent::make(type, point.position(), PointerEvent::Touch);
    pe.modifiers = event->modifiers();
    pe.timestamp = event->timestamp();
    dispatch(pe);
    event->accept();
    return true;
}

bool CanvasView::viewportEvent(QEvent* event)
{
    switch (event->type()) {
        case QEvent::TabletPress:
        case QEvent::TabletMove:
        case QEvent::TabletRelease:
            return handleTabletEvent(static_cast<QTabletEvent*>(event));
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            return handleTouchEvent(static_cast<QTouchEvent*>(event));
        default:
            return QAbstractScrollArea::viewportEvent(event);
    }
}

void CanvasView::wheelEvent(QWheelEvent* event)
{
    if (!(event->modifiers() & Qt::ControlModifier)) {
        QAbstractScrollArea::wheelEvent(event);
        return;
    }

    const int steps = event->angleDelta().y();
    if (steps == 0) {
        event->accept();
        return;
    }

    // Keep the canvas point under the cursor in place
    Viewport* vp = m_editor->viewport();
    const QPointF cursor = event->position();
    const QPointF anchor = vp->toCanvas(cursor);

    if (steps > 0) {
        m_editor->zoomIn();
    } else {
        m_editor->zoomOut();
    }

    const QPointF moved = vp->toClient(anchor) - cursor;
    horizontalScrollBar()->setValue(horizontalScrollBar()->value() + qRound(moved.x()));
    verticalScrollBar()->setValue(verticalScrollBar()->value() + qRound(moved.y()));
    event->accept();
}

void CanvasView::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Delete || event->key() == Qt::Key_Backspace) {
        const bool textFocused = qobject_cast<QPlainTextEdit*>(QApplication::focusWidget()) != nullptr;
        if (m_editor->controller()->handleDeleteKey(textFocused)) {
            event->accept();
            return;
        }
    }
    if (event->key() == Qt::Key_Escape) {
        m_editor->controller()->clearTools();
        event->accept();
        return;
    }
    QAbstractScrollArea::keyPressEvent(event);
}

// ============================================================================
// Images
// ============================================================================

void CanvasView::requestImages()
{
    for (const RenderItem& item : m_scene.items) {
        if (item.type != ElementType::Image || item.imageUrl.isEmpty()) {
            continue;
        }
        if (m_images.contains(item.imageUrl) || m_requestedImages.contains(item.imageUrl)) {
            continue;
        }
        m_requestedImages.insert(item.imageUrl);

        const QString url = item.imageUrl;
        if (QFile::exists(url)) {
            QPixmap pix(url);
            if (!pix.isNull()) {
                m_images.insert(url, pix);
            }
            continue;
        }

        QUrl target(url);
        if (target.isRelative()) {
            const QString base = m_editor->options().baseUrl;
            if (base.isEmpty()) {
                qDebug() << "CanvasView::requestImages: no base URL for" << url;
                continue;
            }
            target = QUrl(base).resolved(target);
        }

        QNetworkReply* reply = m_network->get(QNetworkRequest(target));
        connect(reply, &QNetworkReply::finished, this, [this, reply, url]() {
            onImageReply(reply, url);
        });
    }
}

void CanvasView::onImageReply(QNetworkReply* reply, const QString& url)
{
    reply->deleteLater();
    if (reply->error() != QNetworkReply::NoError) {
        qWarning() << "CanvasView: failed to load image" << url << ":" << reply->errorString();
        return;
    }

    QPixmap pix;
    if (!pix.loadFromData(reply->readAll())) {
        qWarning() << "CanvasView: unreadable image data for" << url;
        return;
    }
    m_images.insert(url, pix);
    viewport()->update();
}
