#pragma once

// ============================================================================
// HistoryAction - One undoable, server-confirmed change
// ============================================================================

#include "../elements/CanvasElement.h"
#include "../elements/ElementPatch.h"

#include <QString>
#include <QVector>

/**
 * @brief Represents an undoable action on the canvas.
 *
 * Only pushed after the service confirmed the mutation.
 */
struct HistoryAction {
    enum Type {
        Create,     ///< An element was created (undo = delete it)
        Delete,     ///< One or more elements were deleted as a group (undo = restore all)
        Update      ///< Fields of one element changed (undo = reapply prev)
    };

    Type type = Create;

    CanvasElement element;              ///< For Create: the element as it now exists
    QVector<CanvasElement> elements;    ///< For Delete: snapshots taken before deletion

    /**
     * @brief For Delete on the redo stack: true when undo restored every
     *        snapshot under its original id.
     */
    bool identityPreserved = true;
    QVector<CanvasElement> recreated;   ///< For Delete: copies created because undelete failed
    QVector<QString> liveIds;           ///< For Delete: ids that now stand for the group on the server

    QString id;                         ///< For Update
    ElementPatch prev;                  ///< For Update: values before the change
    ElementPatch next;                  ///< For Update: values after the change

    static HistoryAction created(const CanvasElement& el) {
        HistoryAction a;
        a.type = Create;
        a.element = el;
        return a;
    }

    static HistoryAction deleted(const QVector<CanvasElement>& snapshots) {
        HistoryAction a;
        a.type = Delete;
        a.elements = snapshots;
        return a;
    }

    static HistoryAction updated(const QString& elementId, const ElementPatch& before,
                                 const ElementPatch& after) {
        HistoryAction a;
        a.type = Update;
        a.id = elementId;
        a.prev = before;
        a.next = after;
        return a;
    }

    /**
     * @brief Ids a redo of this Delete must remove.
     *
     * The recorded live ids when undo ran, else the snapshot ids.
     */
    QVector<QString> idsToDelete() const {
        if (!liveIds.isEmpty()) {
            return liveIds;
        }
        QVector<QString> ids;
        for (const CanvasElement& el : elements) {
            if (!el.id.isEmpty()) {
                ids.append(el.id);
            }
        }
        return ids;
    }
};
