#include "CanvasWindow.h"
#include "CanvasToolbar.h"
#include "CanvasView.h"
#include "../CanvasEditor.h"

#include <QFileDialog>
#include <QStatusBar>

namespace {
constexpr int ERROR_MESSAGE_MS = 5000;
constexpr int SAVED_MESSAGE_MS = 1500;
}

CanvasWindow::CanvasWindow(CanvasEditor* editor, QWidget* parent)
    : QMainWindow(parent)
    , m_editor(editor)
{
    setWindowTitle(tr("NoteCanvas"));
    resize(1200, 800);

    m_toolbar = new CanvasToolbar(m_editor, this);
    addToolBar(Qt::TopToolBarArea, m_toolbar);

    m_view = new CanvasView(m_editor, this);
    setCentralWidget(m_view);

    connect(m_toolbar, &CanvasToolbar::insertImageRequested, this, &CanvasWindow::chooseImage);
    connect(m_editor, &CanvasEditor::errorOccurred, this, &CanvasWindow::showError);
    connect(m_editor, &CanvasEditor::elementsSaved, this, &CanvasWindow::showSaved);

    statusBar()->showMessage(m_editor->isReadonly() ? tr("Read-only") : tr("Ready"));
}

void CanvasWindow::chooseImage()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Insert Image"), QString(),
                                                      tr("Images (*.png *.jpg *.jpeg *.gif *.webp *.bmp)"));
    if (path.isEmpty()) {
        return;
    }
    m_editor->insertImage(path);
}

void CanvasWindow::showError(const QString& message)
{
    statusBar()->showMessage(message, ERROR_MESSAGE_MS);
}

void CanvasWindow::showSaved()
{
    statusBar()->showMessage(tr("Saved"), SAVED_MESSAGE_MS);
}
