#pragma once

// ============================================================================
// CanvasSettings - Per-machine editor preferences
// ============================================================================
// Stored with QSettings("NoteCanvas", "App"). Nothing here is part of the
// element model.
// ============================================================================

#include <QSettings>

class CanvasSettings {
public:
    CanvasSettings();

    /**
     * @brief Use an explicit settings file (tests).
     */
    explicit CanvasSettings(const QString& fileName);

    bool showGrid() const;
    void setShowGrid(bool show);

private:
    QSettings m_settings;
};
