#pragma once

// ============================================================================
// InteractionController - Pointer state machine for the canvas
// ============================================================================
// Turns normalized PointerEvents into element mutations. Exactly one mode is
// active at a time:
//
//   Idle      - nothing in progress
//   Drawing   - a shape or ink stroke is being drawn (preview only)
//   Dragging  - one or more elements are being moved (preview only)
//   Resizing  - one element is being resized from a corner handle
//   Marquee   - a selection rectangle is being dragged
//   Erasing   - the eraser is deleting whatever it touches
//
// Previews never touch the ElementStore. Gestures are committed on release
// through ElementSync, and every confirmed mutation is recorded in the
// HistoryManager.
// ============================================================================

#include "PointerEvent.h"
#include "../core/ToolType.h"
#include "../core/EditorOptions.h"
#include "../elements/CanvasElement.h"
#include "../elements/ElementPatch.h"

#include <QObject>
#include <QHash>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QVector>
#include <memory>
#include <optional>

class ElementStore;
class ElementSync;
class HistoryManager;
class ScheduledTask;
class Viewport;

/**
 * @brief Corner handles used for resizing.
 */
enum class ResizeHandle {
    None,
    NorthWest,
    NorthEast,
    SouthWest,
    SouthEast
};

/**
 * @brief Transient visual state for the renderer.
 *
 * Nothing in here is persisted.
 */
struct InteractionOverlay {
    /// Geometry shown instead of the stored one (drag/resize preview, unconfirmed commits)
    QHash<QString, QRect> geometryOverrides;

    std::optional<QRectF> marquee;      ///< Selection rectangle in canvas space

    bool drawing = false;               ///< A drawing preview is active
    ToolType drawTool = ToolType::None;
    QPointF drawStart;                  ///< Canvas space
    QPointF drawEnd;                    ///< Canvas space
    QVector<QPointF> drawPath;          ///< Freehand points, canvas space
    StrokeStyle drawStroke;

    std::optional<QPointF> eraserPos;   ///< Canvas position of the eraser while erasing
};

class InteractionController : public QObject {
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        Drawing,
        Dragging,
        Resizing,
        Marquee,
        Erasing
    };

    static constexpr int MIN_SHAPE_SIZE = 10;   ///< Smaller shapes and lines are discarded
    static constexpr int MIN_RESIZE = 50;       ///< Minimum width/height while resizing

    /**
     * @param store Element store (not owned).
     * @param sync Mutation path to the service (not owned).
     * @param history Undo log (not owned).
     * @param viewport Coordinate transform (not owned).
     */
    InteractionController(ElementStore* store, ElementSync* sync, HistoryManager* history,
                          Viewport* viewport, const EditorOptions& options,
                          QObject* parent = nullptr);
    ~InteractionController() override;

    // ===== Tools =====

    /**
     * @brief Activate a tool; selecting the active tool again turns it off.
     *
     * Activating any tool clears the selection.
     */
    void setTool(ToolType tool);

    /**
     * @brief Leave any tool and clear the selection.
     */
    void clearTools();

    ToolType tool() const { return m_tool; }
    Mode mode() const { return m_mode; }

    /**
     * @brief Crosshair while a tool is armed, arrow otherwise.
     */
    Qt::CursorShape cursorShape() const;

    // ===== Style & Options =====

    void setStrokeColor(const QString& color);
    QString strokeColor() const { return m_options.strokeColor; }

    void setStrokeWidth(int width);
    int strokeWidth() const { return m_options.strokeWidth; }

    /**
     * @brief Grid visibility; snapping follows it.
     */
    void setShowGrid(bool show);
    bool showGrid() const { return m_options.showGrid; }

    void setReadonly(bool readonly);
    bool isReadonly() const { return m_options.readonly; }

    const EditorOptions& options() const { return m_options; }

    // ===== Selection =====

    const QVector<QString>& selection() const { return m_selection; }
    bool isSelected(const QString& id) const { return m_selection.contains(id); }
    void setSelection(const QVector<QString>& ids);
    void selectOnly(const QString& id);
    void clearSelection();

    /**
     * @brief Drop selection entries and text saves whose element no longer exists.
     */
    void pruneSelection();

    // ===== Pointer Input =====

    void handlePointerEvent(const PointerEvent& pe);
    void handlePointerPress(const PointerEvent& pe);
    void handlePointerMove(const PointerEvent& pe);
    void handlePointerRelease(const PointerEvent& pe);

    /**
     * @brief Delete/Backspace.
     * @param textInputFocused True while a text editor has keyboard focus.
     * @return True if the key deleted the selection.
     */
    bool handleDeleteKey(bool textInputFocused);

    /**
     * @brief Hit test for a resize handle at a canvas point.
     * @param[out] elementId Element owning the handle.
     */
    ResizeHandle handleAt(const QPointF& canvasPt, QString* elementId = nullptr) const;

    /**
     * @brief Topmost element under a canvas point, or empty.
     */
    QString elementAt(const QPointF& canvasPt) const;

    // ===== Commands =====

    /**
     * @brief Delete every selected element as one undoable group.
     */
    void deleteSelection();

    /**
     * @brief Record a text edit; saved after the debounce delay.
     *
     * Each element has its own pending save.
     */
    void editText(const QString& id, const QString& text);

    /**
     * @brief Save all pending text edits now.
     */
    void flushTextEdits();

    /**
     * @brief Elements that currently own a text save task.
     */
    int textTaskCount() const { return m_textTasks.size(); }

    /**
     * @brief Upload an image and place it at (50, 50, 200 x 200).
     */
    void insertImage(const QString& filePath);

    // ===== Render Input =====

    const InteractionOverlay& overlay() const { return m_overlay; }

    /**
     * @brief Number of gesture commits sent and not yet answered.
     */
    int pendingCommits() const { return m_pendingCommits; }

signals:
    /**
     * @brief Preview or selection changed; the view should repaint.
     */
    void changed();

    void selectionChanged();
    void toolChanged(ToolType tool);

    /**
     * @brief A text box was created and should receive keyboard focus.
     */
    void textBoxCreated(const QString& id);

    void errorOccurred(const QString& message);

private:
    struct DragItem {
        QString id;
        QRect start;
    };
    struct DeleteBatch;
    struct UpdateBatch;

    // Drawing
    void beginDrawing(const QPointF& pt);
    void continueDrawing(const QPointF& pt);
    void finishDrawing();
    std::optional<CanvasElement> buildShape() const;
    std::optional<CanvasElement> buildFreehand() const;
    void createElement(const CanvasElement& draft);

    // Dragging
    void beginDrag(const QString& clickedId, const QPointF& pt);
    void continueDrag(const QPointF& pt);
    void finishDrag();
    QRect dragTarget(const DragItem& item, const QPointF& pt) const;

    // Resizing
    void beginResize(const QString& id, ResizeHandle handle, const QPointF& pt);
    void continueResize(const QPointF& pt);
    void finishResize();
    QRect resizeTarget(const QPointF& pt) const;

    // Marquee
    void beginMarquee(const QPointF& pt);
    void continueMarquee(const QPointF& pt);
    void finishMarquee();

    // Erasing
    void beginErasing(const QPointF& pt);
    void eraseAt(const QPointF& pt);
    void finishErasing();

    // Commits
    void deleteElements(const QVector<CanvasElement>& snapshots, std::shared_ptr<DeleteBatch> batch);
    void closeDeleteBatch(std::shared_ptr<DeleteBatch> batch);
    void maybeFinishDeleteBatch(std::shared_ptr<DeleteBatch> batch);
    void commitGeometry(const QString& id, const ElementPatch& next, std::shared_ptr<UpdateBatch> batch);
    void commitText(const QString& id, const QString& text);
    void dropTextTask(const QString& id);

    void resetGesture();
    int snap(qreal value) const;

    /**
     * @brief Copy of a stored element carrying its unconfirmed geometry, if any.
     */
    CanvasElement shownElement(const CanvasElement& el) const;

    ElementStore* m_store = nullptr;
    ElementSync* m_sync = nullptr;
    HistoryManager* m_history = nullptr;
    Viewport* m_viewport = nullptr;
    EditorOptions m_options;

    ToolType m_tool = ToolType::None;
    Mode m_mode = Mode::Idle;
    QVector<QString> m_selection;
    InteractionOverlay m_overlay;

    // Gesture state
    QPointF m_pressPos;                     ///< Canvas position of pointer-down
    QVector<DragItem> m_dragItems;
    QString m_resizeId;
    ResizeHandle m_resizeHandle = ResizeHandle::None;
    QRect m_resizeStart;                    ///< Normalized box at pointer-down
    bool m_resizeFlipX = false;             ///< Line drawn right-to-left
    bool m_resizeFlipY = false;             ///< Line drawn bottom-to-top
    std::shared_ptr<DeleteBatch> m_eraseBatch;

    QHash<QString, QRect> m_pendingGeometry;  ///< Committed, waiting for the service
    QHash<QString, ScheduledTask*> m_textTasks;
    int m_pendingCommits = 0;
};
