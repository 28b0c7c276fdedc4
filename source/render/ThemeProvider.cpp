#include "ThemeProvider.h"

#include <QGuiApplication>
#include <QPalette>
#include <QColor>

std::optional<bool> ThemeProvider::parseThemeValue(const QVariant& value)
{
    if (!value.isValid() || value.isNull()) {
        return std::nullopt;
    }
    if (value.typeId() == QMetaType::Bool) {
        return value.toBool();
    }

    const QString s = value.toString().trimmed().toLower();
    if (s == "dark" || s == "1" || s == "true") {
        return true;
    }
    if (s == "light" || s == "0" || s == "false") {
        return false;
    }
    if (s.contains("dark")) {
        return true;
    }
    if (s.contains("light")) {
        return false;
    }
    return std::nullopt;
}

bool PaletteThemeProvider::isDarkMode() const
{
    if (m_hostGetter) {
        if (const std::optional<bool> fromHost = parseThemeValue(m_hostGetter())) {
            return *fromHost;
        }
    }

    // Lightness scale: 0 (black) - 255 (white)
    const QColor bg = QGuiApplication::palette().color(QPalette::Window);
    return bg.lightness() < 128;
}
