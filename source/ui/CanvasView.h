#pragma once

// ============================================================================
// CanvasView - Scrollable widget that shows and edits one canvas
// ============================================================================
// Paints the editor's render scene with the viewport transform applied and
// turns mouse, tablet and touch input into PointerEvents for the
// InteractionController.
//
// Text boxes are live QPlainTextEdit children positioned over their element.
// They are created, moved and removed by diffing the scene by element id.
// ============================================================================

#include "../input/PointerEvent.h"
#include "../render/CanvasRenderer.h"

#include <QAbstractScrollArea>
#include <QHash>
#include <QPixmap>
#include <QSet>
#include <QString>

class CanvasEditor;
class QMouseEvent;
class QNetworkAccessManager;
class QNetworkReply;
class QPlainTextEdit;
class QTabletEvent;
class QTouchEvent;

class CanvasView : public QAbstractScrollArea {
    Q_OBJECT

public:
    static constexpr int TEXT_GRAB_INSET = 6;    ///< Screen px of border left uncovered by the editor
    static constexpr int TEXT_POINT_SIZE = 14;   ///< Text box font size at 100% zoom

    explicit CanvasView(CanvasEditor* editor, QWidget* parent = nullptr);
    ~CanvasView() override;

    CanvasEditor* editor() const { return m_editor; }

    /**
     * @brief Connect the view to the editor.
     * @return False if already attached (the call does nothing).
     */
    bool attachInput();
    bool isInputAttached() const { return m_inputAttached; }

    /**
     * @brief Scene as last built by refresh().
     */
    const RenderScene& scene() const { return m_scene; }

    /**
     * @brief Live text editor for a text box, or nullptr.
     */
    QPlainTextEdit* textEditor(const QString& id) const { return m_textEditors.value(id, nullptr); }
    int textEditorCount() const { return m_textEditors.size(); }

public slots:
    /**
     * @brief Rebuild the scene, resync scroll range and text editors, repaint.
     */
    void refresh();

    /**
     * @brief Give keyboard focus to a text box editor.
     */
    void focusTextBox(const QString& id);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void scrollContentsBy(int dx, int dy) override;
    bool viewportEvent(QEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;

    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    void dispatch(const PointerEvent& pe);
    bool handleTabletEvent(QTabletEvent* event);
    bool handleTouchEvent(QTouchEvent* event);
    static bool isSynthesized(const QMouseEvent* event);

    void updateScrollRange();
    void syncViewportOffset();
    void syncTextEditors();
    QPlainTextEdit* createTextEditor(const QString& id);
    void layoutTextEditor(QPlainTextEdit* edit, const RenderItem& item);
    void updateCursor();

    void requestImages();
    void onImageReply(QNetworkReply* reply, const QString& url);

    CanvasEditor* m_editor = nullptr;
    RenderScene m_scene;
    bool m_inputAttached = false;

    // Pointer tracking (one active source at a time)
    bool m_pointerActive = false;
    PointerEvent::Source m_activeSource = PointerEvent::Unknown;

    QHash<QString, QPlainTextEdit*> m_textEditors;
    bool m_syncingText = false;     ///< Programmatic setPlainText in progress

    QNetworkAccessManager* m_network = nullptr;
    QHash<QString, QPixmap> m_images;   ///< Loaded images by stored URL
    QSet<QString> m_requestedImages;    ///< Loading or failed
};
