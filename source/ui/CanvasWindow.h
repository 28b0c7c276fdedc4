#pragma once

// ============================================================================
// CanvasWindow - Top-level window hosting one canvas editor
// ============================================================================

#include <QMainWindow>

class CanvasEditor;
class CanvasToolbar;
class CanvasView;

class CanvasWindow : public QMainWindow {
    Q_OBJECT

public:
    /**
     * @param editor Editor to show (not owned).
     */
    explicit CanvasWindow(CanvasEditor* editor, QWidget* parent = nullptr);

    CanvasView* view() const { return m_view; }
    CanvasToolbar* toolbar() const { return m_toolbar; }

private slots:
    void chooseImage();
    void showError(const QString& message);
    void showSaved();

private:
    CanvasEditor* m_editor = nullptr;
    CanvasToolbar* m_toolbar = nullptr;
    CanvasView* m_view = nullptr;
};
