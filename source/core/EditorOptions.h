#pragma once

// ============================================================================
// EditorOptions - Configuration of one canvas editor instance
// ============================================================================

#include <QString>
#include <QJsonObject>

/**
 * @brief The document that owns the elements.
 *
 * Exactly one of note / shared note. Requests carry either note_id or
 * shared_note_id, never both.
 */
struct DocumentOwner {
    enum class Kind {
        Note,
        SharedNote
    };

    Kind kind = Kind::Note;
    QString id;

    static DocumentOwner note(const QString& noteId) { return {Kind::Note, noteId}; }
    static DocumentOwner sharedNote(const QString& sharedId) { return {Kind::SharedNote, sharedId}; }

    bool isValid() const { return !id.isEmpty(); }

    /**
     * @brief "note_id" or "shared_note_id".
     */
    QString fieldName() const {
        return kind == Kind::Note ? QStringLiteral("note_id") : QStringLiteral("shared_note_id");
    }

    /**
     * @brief Add the owner field to a request body.
     */
    void writeTo(QJsonObject& obj) const { obj[fieldName()] = id; }
};

/**
 * @brief Editor configuration with defaults.
 */
struct EditorOptions {
    DocumentOwner owner;
    QString csrfToken;
    QString baseUrl;                 ///< Element service root, e.g. "https://host"

    bool readonly = false;
    bool showGrid = false;           ///< Grid visible and snapping on

    int gridSize = 20;               ///< CUSTOMIZABLE: Grid spacing in canvas px (range: 5-100)
    int freehandMargin = 12;         ///< CUSTOMIZABLE: Padding around ink bounds (never below 4)
    qreal eraserRadius = 8.0;        ///< CUSTOMIZABLE: Eraser reach in canvas px (range: 1-50)

    QString strokeColor = QStringLiteral("default");   ///< Color name for new shapes
    int strokeWidth = 2;             ///< CUSTOMIZABLE: Stroke width for new shapes (range: 1-20)

    int textDebounceMs = 500;        ///< Delay before a text edit is saved
    int historyCapacity = 200;       ///< Undo entries kept
    int handleSize = 10;             ///< Resize handle size in screen px

    /**
     * @brief freehandMargin with the 4px floor applied.
     */
    int effectiveFreehandMargin() const { return freehandMargin < 4 ? 4 : freehandMargin; }
};
