#pragma once

// ============================================================================
// ElementPatch - Partial field set for element updates
// ============================================================================
// The update endpoint accepts any subset of x, y, width, height and
// text_content. The same struct records the before/after values of an update
// in the undo history.
// ============================================================================

#include "CanvasElement.h"

#include <QJsonObject>
#include <optional>

struct ElementPatch {
    std::optional<int> x;
    std::optional<int> y;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<QString> text;   ///< text_content (textbox only)

    bool isEmpty() const {
        return !x && !y && !width && !height && !text;
    }

    bool operator==(const ElementPatch& other) const {
        return x == other.x && y == other.y && width == other.width
            && height == other.height && text == other.text;
    }
    bool operator!=(const ElementPatch& other) const { return !(*this == other); }

    /**
     * @brief Patch moving an element to a new position.
     */
    static ElementPatch position(int newX, int newY);

    /**
     * @brief Patch setting position and size.
     */
    static ElementPatch geometry(const QRect& rect);

    static ElementPatch textContent(const QString& newText);

    /**
     * @brief Capture the current values of the fields this patch sets.
     *
     * Used to build the "previous" half of an update history entry.
     */
    ElementPatch capture(const CanvasElement& element) const;

    /**
     * @brief Write the set fields into an element.
     *
     * Text is ignored for element types without text.
     */
    void applyTo(CanvasElement& element) const;

    /**
     * @brief Serialize the set fields only.
     */
    QJsonObject toJson() const;
};
