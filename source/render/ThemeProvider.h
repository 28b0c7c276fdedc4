#pragma once

// ============================================================================
// ThemeProvider - Pluggable light/dark mode source
// ============================================================================
// Element colors are abstract names resolved at render time, so the same
// stored element reads well on either theme. The host decides what "dark"
// means by choosing a provider.
// ============================================================================

#include <QVariant>
#include <functional>
#include <optional>

class ThemeProvider {
public:
    virtual ~ThemeProvider() = default;
    virtual bool isDarkMode() const = 0;

    /**
     * @brief Interpret a host theme value.
     * @return true/false for a recognized value, std::nullopt otherwise.
     *
     * Booleans are taken as-is. Strings: "dark", "1", "true" -> dark;
     * "light", "0", "false" -> light; otherwise any string containing
     * "dark" or "light".
     */
    static std::optional<bool> parseThemeValue(const QVariant& value);
};

/**
 * @brief Fixed theme (tests, command line --dark).
 */
class StaticThemeProvider : public ThemeProvider {
public:
    explicit StaticThemeProvider(bool dark = false) : m_dark(dark) {}

    bool isDarkMode() const override { return m_dark; }
    void setDarkMode(bool dark) { m_dark = dark; }

private:
    bool m_dark = false;
};

/**
 * @brief Follows the application palette: dark when the window color is dark.
 *
 * An optional host getter is consulted first; when it yields nothing
 * recognizable the palette decides.
 */
class PaletteThemeProvider : public ThemeProvider {
public:
    using Getter = std::function<QVariant()>;

    explicit PaletteThemeProvider(Getter hostGetter = nullptr)
        : m_hostGetter(std::move(hostGetter)) {}

    bool isDarkMode() const override;

private:
    Getter m_hostGetter;
};
