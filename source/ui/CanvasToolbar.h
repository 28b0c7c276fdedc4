#pragma once

// ============================================================================
// CanvasToolbar - Tool selection and editor actions
// ============================================================================
// Layout:
// [Text][Rect][Circle][Line][Draw][Eraser] | [Image] | color width | [Grid] |
// [-] 100% [+] | [Undo][Redo] | [Delete]
//
// Tool buttons are exclusive but optional: clicking the active tool turns
// it off. Button state always follows the editor, never the other way round.
// ============================================================================

#include "../core/ToolType.h"

#include <QMap>
#include <QToolBar>

class CanvasEditor;
class QAction;
class QActionGroup;
class QComboBox;
class QLabel;
class QSpinBox;

class CanvasToolbar : public QToolBar {
    Q_OBJECT

public:
    explicit CanvasToolbar(CanvasEditor* editor, QWidget* parent = nullptr);

    QAction* toolAction(ToolType tool) const { return m_toolActions.value(tool, nullptr); }
    QAction* undoAction() const { return m_undoAction; }
    QAction* redoAction() const { return m_redoAction; }
    QAction* deleteAction() const { return m_deleteAction; }
    QAction* gridAction() const { return m_gridAction; }

public slots:
    /**
     * @brief Re-read every state from the editor.
     */
    void syncFromEditor();

signals:
    /**
     * @brief The image button was used; the host picks the file.
     */
    void insertImageRequested();

private:
    void setupUi();
    void connectSignals();
    QAction* addToolAction(ToolType tool, const QString& text, const QString& shortcut);

    CanvasEditor* m_editor = nullptr;

    QActionGroup* m_toolGroup = nullptr;
    QMap<ToolType, QAction*> m_toolActions;

    QAction* m_imageAction = nullptr;
    QComboBox* m_colorCombo = nullptr;
    QSpinBox* m_widthSpin = nullptr;
    QAction* m_gridAction = nullptr;
    QAction* m_zoomOutAction = nullptr;
    QAction* m_zoomInAction = nullptr;
    QLabel* m_zoomLabel = nullptr;
    QAction* m_undoAction = nullptr;
    QAction* m_redoAction = nullptr;
    QAction* m_deleteAction = nullptr;
};
