#pragma once

// ============================================================================
// CanvasEditor - One mounted canvas editor
// ============================================================================
// Owns the per-editor state (store, viewport, sync, history, controller) and
// exposes the operations the widgets and the host need. The remote service,
// the theme and the settings store are supplied by the host and outlive the
// editor.
// ============================================================================

#include "core/EditorOptions.h"
#include "core/ElementStore.h"
#include "core/ToolType.h"
#include "core/Viewport.h"
#include "render/CanvasRenderer.h"

#include <QJsonArray>
#include <QObject>
#include <QSize>
#include <QVector>

class CanvasSettings;
class ElementApi;
class ElementSync;
class HistoryManager;
class InteractionController;
class ThemeProvider;

class CanvasEditor : public QObject {
    Q_OBJECT

public:
    /**
     * @param api Remote element service (not owned).
     * @param theme Dark/light source for color resolution (not owned).
     * @param settings Per-machine preferences, may be nullptr (not owned).
     */
    CanvasEditor(const EditorOptions& options, ElementApi* api, ThemeProvider* theme,
                 CanvasSettings* settings = nullptr, QObject* parent = nullptr);
    ~CanvasEditor() override;

    // ===== Components =====

    ElementStore* store() { return &m_store; }
    const ElementStore* store() const { return &m_store; }
    Viewport* viewport() { return &m_viewport; }
    const Viewport* viewport() const { return &m_viewport; }
    ElementSync* sync() const { return m_sync; }
    HistoryManager* history() const { return m_history; }
    InteractionController* controller() const { return m_controller; }
    ThemeProvider* theme() const { return m_theme; }
    const EditorOptions& options() const { return m_options; }

    // ===== Content =====

    /**
     * @brief Load the initial elements (wire form). Malformed entries are skipped.
     * @return Number of elements loaded.
     */
    int setElements(const QJsonArray& elements);
    void setElements(const QVector<CanvasElement>& elements);

    // ===== Commands =====

    void setTool(ToolType tool);
    ToolType tool() const;

    void setStrokeColor(const QString& color);
    void setStrokeWidth(int width);

    /**
     * @brief Show or hide the grid (also turns snapping on/off) and persist it.
     */
    void setShowGrid(bool show);
    bool showGrid() const;

    void setReadonly(bool readonly);
    bool isReadonly() const;

    void zoomIn();
    void zoomOut();
    qreal scale() const { return m_viewport.scale(); }

    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;

    void deleteSelection();
    bool hasSelection() const;
    void insertImage(const QString& filePath);

    // ===== Rendering =====

    /**
     * @brief Current render scene for a viewport of the given client size.
     */
    RenderScene buildScene(const QSize& visibleSize) const;

signals:
    /**
     * @brief The service confirmed a mutation.
     */
    void elementsSaved();

    void errorOccurred(const QString& message);

    /**
     * @brief Anything visible changed; views should repaint.
     */
    void changed();

    void scaleChanged(qreal scale);
    void toolChanged(ToolType tool);
    void gridChanged(bool show);
    void readonlyChanged(bool readonly);
    void selectionChanged();
    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);
    void textBoxCreated(const QString& id);

private:
    void connectComponents();

    EditorOptions m_options;
    ElementApi* m_api = nullptr;
    ThemeProvider* m_theme = nullptr;
    CanvasSettings* m_settings = nullptr;

    ElementStore m_store;
    Viewport m_viewport;
    ElementSync* m_sync = nullptr;
    HistoryManager* m_history = nullptr;
    InteractionController* m_controller = nullptr;
};
