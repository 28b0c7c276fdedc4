#include "CanvasEditor.h"

#include "core/CanvasSettings.h"
#include "core/ElementSync.h"
#include "history/HistoryManager.h"
#include "input/InteractionController.h"
#include "render/ThemeProvider.h"

#include <QDebug>

CanvasEditor::CanvasEditor(const EditorOptions& options, ElementApi* api, ThemeProvider* theme,
                           CanvasSettings* settings, QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_api(api)
    , m_theme(theme)
    , m_settings(settings)
{
    // The stored preference wins over the host default
    if (m_settings) {
        m_options.showGrid = m_settings->showGrid();
    }

    m_sync = new ElementSync(&m_store, m_api, m_options.owner, this);
    m_history = new HistoryManager(m_sync, m_options.historyCapacity, this);
    m_controller = new InteractionController(&m_store, m_sync, m_history, &m_viewport,
                                             m_options, this);
    connectComponents();
}

CanvasEditor::~CanvasEditor() = default;

void CanvasEditor::connectComponents()
{
    connect(m_sync, &ElementSync::elementsChanged, this, [this]() {
        m_controller->pruneSelection();
        emit elementsSaved();
        emit changed();
    });

    connect(m_controller, &InteractionController::changed, this, &CanvasEditor::changed);
    connect(m_controller, &InteractionController::selectionChanged, this, &CanvasEditor::selectionChanged);
    connect(m_controller, &InteractionController::toolChanged, this, &CanvasEditor::toolChanged);
    connect(m_controller, &InteractionController::textBoxCreated, this, &CanvasEditor::textBoxCreated);
    connect(m_controller, &InteractionController::errorOccurred, this, &CanvasEditor::errorOccurred);

    connect(m_history, &HistoryManager::undoAvailableChanged, this, &CanvasEditor::undoAvailableChanged);
    connect(m_history, &HistoryManager::redoAvailableChanged, this, &CanvasEditor::redoAvailableChanged);
    connect(m_history, &HistoryManager::errorOccurred, this, &CanvasEditor::errorOccurred);
    connect(m_history, &HistoryManager::replayFinished, this, [this]() {
        m_controller->pruneSelection();
        emit changed();
    });
}

// ============================================================================
// Content
// ============================================================================

int CanvasEditor::setElements(const QJsonArray& elements)
{
    const QVector<CanvasElement> parsed = CanvasElement::listFromJson(elements);
    if (parsed.size() != elements.size()) {
        qWarning() << "CanvasEditor::setElements: skipped" << elements.size() - parsed.size()
                   << "malformed element(s)";
    }
    setElements(parsed);
    return parsed.size();
}

void CanvasEditor::setElements(const QVector<CanvasElement>& elements)
{
    m_store.setElements(elements);
    m_history->clear();
    m_controller->clearSelection();
    emit changed();
}

// ============================================================================
// Commands
// ============================================================================

void CanvasEditor::setTool(ToolType tool)
{
    m_controller->setTool(tool);
}

ToolType CanvasEditor::tool() const
{
    return m_controller->tool();
}

void CanvasEditor::setStrokeColor(const QString& color)
{
    m_controller->setStrokeColor(color);
}

void CanvasEditor::setStrokeWidth(int width)
{
    m_controller->setStrokeWidth(width);
}

void CanvasEditor::setShowGrid(bool show)
{
    if (m_options.showGrid == show) {
        return;
    }
    m_options.showGrid = show;
    m_controller->setShowGrid(show);
    if (m_settings) {
        m_settings->setShowGrid(show);
    }
    emit gridChanged(show);
    emit changed();
}

bool CanvasEditor::showGrid() const
{
    return m_options.showGrid;
}

void CanvasEditor::setReadonly(bool readonly)
{
    if (m_options.readonly == readonly) {
        return;
    }
    m_options.readonly = readonly;
    m_controller->setReadonly(readonly);
    emit readonlyChanged(readonly);
}

bool CanvasEditor::isReadonly() const
{
    return m_options.readonly;
}

void CanvasEditor::zoomIn()
{
    if (m_viewport.zoomIn()) {
        emit scaleChanged(m_viewport.scale());
        emit changed();
    }
}

void CanvasEditor::zoomOut()
{
    if (m_viewport.zoomOut()) {
        emit scaleChanged(m_viewport.scale());
        emit changed();
    }
}

bool CanvasEditor::undo()
{
    if (m_options.readonly) {
        return false;
    }
    m_controller->flushTextEdits();
    return m_history->undo();
}

bool CanvasEditor::redo()
{
    if (m_options.readonly) {
        return false;
    }
    return m_history->redo();
}

bool CanvasEditor::canUndo() const
{
    return m_history->canUndo();
}

bool CanvasEditor::canRedo() const
{
    return m_history->canRedo();
}

void CanvasEditor::deleteSelection()
{
    if (m_options.readonly) {
        return;
    }
    m_controller->deleteSelection();
}

bool CanvasEditor::hasSelection() const
{
    return !m_controller->selection().isEmpty();
}

void CanvasEditor::insertImage(const QString& filePath)
{
    if (m_options.readonly) {
        return;
    }
    m_controller->insertImage(filePath);
}

// ============================================================================
// Rendering
// ============================================================================

RenderScene CanvasEditor::buildScene(const QSize& visibleSize) const
{
    RenderInput input;
    input.store = &m_store;
    input.selection = &m_controller->selection();
    input.overlay = &m_controller->overlay();
    input.viewport = &m_viewport;
    input.theme = m_theme;
    input.tool = m_controller->tool();
    input.readonly = m_options.readonly;
    input.showGrid = m_options.showGrid;
    input.gridSize = m_options.gridSize;
    input.handleSize = m_options.handleSize;
    input.eraserRadius = m_options.eraserRadius;
    input.visibleSize = visibleSize;
    return CanvasRenderer::buildScene(input);
}
