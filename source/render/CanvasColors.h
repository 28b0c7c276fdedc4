#ifndef CANVASCOLORS_H
#define CANVASCOLORS_H

#include <QColor>
#include <QString>
#include <QStringList>

/**
 * @brief Palette for element stroke and fill colors.
 *
 * Elements store abstract names; these functions turn a name into a concrete
 * color for the current theme. The dark palette is brighter so strokes stay
 * visible on dark backgrounds.
 */
namespace CanvasColors {

// ============================================================================
// Named Palette
// ============================================================================

inline QStringList names()
{
    return {QStringLiteral("default"), QStringLiteral("red"), QStringLiteral("green"),
            QStringLiteral("blue"), QStringLiteral("yellow"), QStringLiteral("purple")};
}

inline QColor lightColor(const QString& name)
{
    if (name == "default") return QColor(0x00, 0x00, 0x00);  // #000000
    if (name == "red")     return QColor(0xef, 0x44, 0x44);  // #ef4444
    if (name == "green")   return QColor(0x10, 0xb9, 0x81);  // #10b981
    if (name == "blue")    return QColor(0x3b, 0x82, 0xf6);  // #3b82f6
    if (name == "yellow")  return QColor(0xf5, 0x9e, 0x0b);  // #f59e0b
    if (name == "purple")  return QColor(0x8b, 0x5c, 0xf6);  // #8b5cf6
    return QColor();
}

inline QColor darkColor(const QString& name)
{
    if (name == "default") return QColor(0xff, 0xff, 0xff);  // #ffffff
    if (name == "red")     return QColor(0xff, 0x4d, 0x4d);  // #ff4d4d
    if (name == "green")   return QColor(0x2d, 0xd4, 0xbf);  // #2dd4bf
    if (name == "blue")    return QColor(0x60, 0xa5, 0xfa);  // #60a5fa
    if (name == "yellow")  return QColor(0xff, 0xd1, 0x66);  // #ffd166
    if (name == "purple")  return QColor(0xc0, 0x84, 0xfc);  // #c084fc
    return QColor();
}

inline QColor defaultColor(bool dark) { return dark ? darkColor("default") : lightColor("default"); }

/**
 * @brief Resolve a stored color for the current theme.
 * @return The palette color, the literal "#hex" or named color, or the
 *         palette default for anything unrecognized. Invalid QColor for an
 *         empty name (meaning transparent).
 */
inline QColor resolve(const QString& stored, bool dark)
{
    const QString name = stored.trimmed().toLower();
    if (name.isEmpty()) {
        return QColor();
    }
    if (name.startsWith('#')) {
        const QColor hex = QColor::fromString(name);
        return hex.isValid() ? hex : defaultColor(dark);
    }

    const QColor named = dark ? darkColor(name) : lightColor(name);
    if (named.isValid()) {
        return named;
    }

    // Other valid color names ("orange", "teal", ...) pass through
    if (QColor::isValidColorName(name)) {
        return QColor::fromString(name);
    }
    return defaultColor(dark);
}

// ============================================================================
// Editor Chrome
// ============================================================================

inline QColor canvasBackground(bool dark) { return dark ? QColor(0x2a, 0x2e, 0x32) : QColor(Qt::white); }
inline QColor gridLine(bool dark)         { return dark ? QColor(255, 255, 255, 28) : QColor(0, 0, 0, 22); }
inline QColor selectionOutline(bool dark) { return dark ? QColor(138, 180, 248) : QColor(26, 115, 232); }
inline QColor handleFill(bool dark)       { return dark ? QColor(0x2a, 0x2e, 0x32) : QColor(Qt::white); }
inline QColor marqueeFill()               { return QColor(0, 120, 215, 30); }
inline QColor previewStroke(bool dark)    { return dark ? QColor(200, 200, 200) : QColor(90, 90, 90); }
inline QColor imagePlaceholder(bool dark) { return dark ? QColor(0x3a, 0x3e, 0x42) : QColor(0xE8, 0xE8, 0xE8); }

} // namespace CanvasColors

#endif // CANVASCOLORS_H
