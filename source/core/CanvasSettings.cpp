#include "CanvasSettings.h"

namespace {
const char* const KEY_SHOW_GRID = "canvas.showGrid";
}

CanvasSettings::CanvasSettings()
    : m_settings("NoteCanvas", "App")
{
}

CanvasSettings::CanvasSettings(const QString& fileName)
    : m_settings(fileName, QSettings::IniFormat)
{
}

bool CanvasSettings::showGrid() const
{
    return m_settings.value(KEY_SHOW_GRID, false).toBool();
}

void CanvasSettings::setShowGrid(bool show)
{
    m_settings.setValue(KEY_SHOW_GRID, show);
}
