#include "CanvasToolbar.h"
#include "../CanvasEditor.h"
#include "../input/InteractionController.h"
#include "../render/CanvasColors.h"

#include <QAction>
#include <QActionGroup>
#include <QComboBox>
#include <QKeySequence>
#include <QLabel>
#include <QSignalBlocker>
#include <QSpinBox>

CanvasToolbar::CanvasToolbar(CanvasEditor* editor, QWidget* parent)
    : QToolBar(tr("Canvas"), parent)
    , m_editor(editor)
{
    setMovable(false);
    setupUi();

    m_widthSpin->setValue(m_editor->controller()->strokeWidth());
    const int colorIndex = m_colorCombo->findData(m_editor->controller()->strokeColor());
    m_colorCombo->setCurrentIndex(colorIndex >= 0 ? colorIndex : 0);

    connectSignals();
    syncFromEditor();
}

QAction* CanvasToolbar::addToolAction(ToolType tool, const QString& text, const QString& shortcut)
{
    QAction* action = addAction(text);
    action->setCheckable(true);
    action->setShortcut(QKeySequence(shortcut));
    action->setToolTip(QStringLiteral("%1 (%2)").arg(text, shortcut));
    m_toolGroup->addAction(action);
    m_toolActions.insert(tool, action);

    connect(action, &QAction::triggered, this, [this, tool]() {
        // The editor toggles; the buttons follow through toolChanged
        m_editor->setTool(tool);
        syncFromEditor();
    });
    return action;
}

void CanvasToolbar::setupUi()
{
    // === Tools (exclusive, clicking the active one turns it off) ===
    m_toolGroup = new QActionGroup(this);
    m_toolGroup->setExclusionPolicy(QActionGroup::ExclusionPolicy::ExclusiveOptional);

    addToolAction(ToolType::TextBox, tr("Text"), QStringLiteral("T"));
    addToolAction(ToolType::Rectangle, tr("Rectangle"), QStringLiteral("R"));
    addToolAction(ToolType::Circle, tr("Circle"), QStringLiteral("C"));
    addToolAction(ToolType::Line, tr("Line"), QStringLiteral("L"));
    addToolAction(ToolType::Freehand, tr("Draw"), QStringLiteral("D"));
    addToolAction(ToolType::Eraser, tr("Eraser"), QStringLiteral("E"));

    addSeparator();
    m_imageAction = addAction(tr("Image"));
    m_imageAction->setToolTip(tr("Insert Image"));

    // === Stroke style for new shapes ===
    addSeparator();
    m_colorCombo = new QComboBox(this);
    m_colorCombo->setToolTip(tr("Stroke Color"));
    for (const QString& name : CanvasColors::names()) {
        m_colorCombo->addItem(name, name);
    }
    addWidget(m_colorCombo);

    m_widthSpin = new QSpinBox(this);
    m_widthSpin->setToolTip(tr("Stroke Width"));
    m_widthSpin->setRange(1, 20);
    m_widthSpin->setSuffix(QStringLiteral(" px"));
    addWidget(m_widthSpin);

    addSeparator();
    m_gridAction = addAction(tr("Grid"));
    m_gridAction->setCheckable(true);
    m_gridAction->setToolTip(tr("Show Grid and Snap (G)"));
    m_gridAction->setShortcut(QKeySequence(QStringLiteral("G")));

    // === Zoom ===
    addSeparator();
    m_zoomOutAction = addAction(QStringLiteral("-"));
    m_zoomOutAction->setToolTip(tr("Zoom Out"));
    m_zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    m_zoomLabel = new QLabel(this);
    m_zoomLabel->setMinimumWidth(48);
    m_zoomLabel->setAlignment(Qt::AlignCenter);
    addWidget(m_zoomLabel);
    m_zoomInAction = addAction(QStringLiteral("+"));
    m_zoomInAction->setToolTip(tr("Zoom In"));
    m_zoomInAction->setShortcut(QKeySequence::ZoomIn);

    // === History ===
    addSeparator();
    m_undoAction = addAction(tr("Undo"));
    m_undoAction->setShortcut(QKeySequence::Undo);
    m_redoAction = addAction(tr("Redo"));
    m_redoAction->setShortcut(QKeySequence::Redo);

    addSeparator();
    m_deleteAction = addAction(tr("Delete"));
    m_deleteAction->setToolTip(tr("Delete Selection"));
}

void CanvasToolbar::connectSignals()
{
    connect(m_imageAction, &QAction::triggered, this, &CanvasToolbar::insertImageRequested);

    connect(m_colorCombo, qOverload<int>(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (index >= 0) {
            m_editor->setStrokeColor(m_colorCombo->itemData(index).toString());
        }
    });
    connect(m_widthSpin, qOverload<int>(&QSpinBox::valueChanged), this, [this](int width) {
        m_editor->setStrokeWidth(width);
    });

    connect(m_gridAction, &QAction::toggled, m_editor, &CanvasEditor::setShowGrid);
    connect(m_zoomInAction, &QAction::triggered, m_editor, &CanvasEditor::zoomIn);
    connect(m_zoomOutAction, &QAction::triggered, m_editor, &CanvasEditor::zoomOut);
    connect(m_undoAction, &QAction::triggered, m_editor, &CanvasEditor::undo);
    connect(m_redoAction, &QAction::triggered, m_editor, &CanvasEditor::redo);
    connect(m_deleteAction, &QAction::triggered, m_editor, &CanvasEditor::deleteSelection);

    connect(m_editor, &CanvasEditor::toolChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::scaleChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::gridChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::readonlyChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::selectionChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::undoAvailableChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::redoAvailableChanged, this, &CanvasToolbar::syncFromEditor);
    connect(m_editor, &CanvasEditor::changed, this, &CanvasToolbar::syncFromEditor);
}

void CanvasToolbar::syncFromEditor()
{
    const bool editable = !m_editor->isReadonly();
    const ToolType current = m_editor->tool();

    for (auto it = m_toolActions.constBegin(); it != m_toolActions.constEnd(); ++it) {
        QSignalBlocker block(it.value());
        it.value()->setChecked(it.key() == current);
        it.value()->setEnabled(editable);
    }

    {
        QSignalBlocker block(m_gridAction);
        m_gridAction->setChecked(m_editor->showGrid());
    }

    m_imageAction->setEnabled(editable);
    m_colorCombo->setEnabled(editable);
    m_widthSpin->setEnabled(editable);
    m_undoAction->setEnabled(editable && m_editor->canUndo());
    m_redoAction->setEnabled(editable && m_editor->canRedo());
    m_deleteAction->setEnabled(editable && m_editor->hasSelection());
    m_zoomLabel->setText(QStringLiteral("%1%").arg(qRound(m_editor->scale() * 100)));
}
