#pragma once

// ============================================================================
// ElementStore - The ordered element collection of one canvas note
// ============================================================================
// Single source of truth for rendering. Pure data: no input handling and no
// network. Mutations are applied only after the element service confirmed
// them (see ElementSync).
// ============================================================================

#include "../elements/CanvasElement.h"
#include "../elements/ElementPatch.h"

#include <QString>
#include <QVector>
#include <QRectF>
#include <QSize>

/**
 * @brief In-memory ordered collection of canvas elements.
 *
 * Array order is insertion order and breaks z-index ties when painting.
 */
class ElementStore {
public:
    ElementStore() = default;

    // ===== Element Management =====

    /**
     * @brief Replace the whole collection (initial load).
     */
    void setElements(const QVector<CanvasElement>& elements) { m_elements = elements; }

    /**
     * @brief Append an element.
     *
     * If an element with the same id already exists it is replaced in place,
     * so a late undelete response cannot produce a duplicate.
     */
    void addElement(const CanvasElement& element);

    /**
     * @brief Remove an element by id.
     * @return True if the element was found and removed.
     */
    bool removeElement(const QString& id);

    /**
     * @brief Apply a patch to an element.
     * @return True if the element exists.
     */
    bool applyPatch(const QString& id, const ElementPatch& patch);

    /**
     * @brief Find an element.
     * @return Pointer into the store (invalidated by the next mutation), or nullptr.
     */
    const CanvasElement* element(const QString& id) const;

    bool contains(const QString& id) const { return indexOf(id) >= 0; }

    const QVector<CanvasElement>& elements() const { return m_elements; }

    int elementCount() const { return m_elements.size(); }

    bool isEmpty() const { return m_elements.isEmpty(); }

    void clear() { m_elements.clear(); }

    /**
     * @brief z_index for the next new element (the current element count).
     */
    int nextZIndex() const { return m_elements.size(); }

    // ===== Queries =====

    /**
     * @brief Elements sorted ascending by z_index; equal z_index keeps array order.
     */
    QVector<CanvasElement> paintOrder() const;

    /**
     * @brief Ids of elements hit at a canvas point (shape-aware, for the eraser).
     */
    QVector<QString> elementsAtPoint(const QPointF& pt, qreal eraserRadius) const;

    /**
     * @brief Ids of elements whose bounding box intersects a rectangle (marquee).
     */
    QVector<QString> elementsInRect(const QRectF& rect) const;

    /**
     * @brief Topmost element hit at a canvas point, or nullptr.
     * @param radius Pick radius added to the hit tolerance.
     */
    const CanvasElement* topmostAt(const QPointF& pt, qreal radius) const;

    /**
     * @brief Right/bottom extent of all elements (max of x+width, y+height).
     */
    QSize contentExtent() const;

    /**
     * @brief Copies of the elements with the given ids, in store order.
     */
    QVector<CanvasElement> snapshot(const QVector<QString>& ids) const;

private:
    int indexOf(const QString& id) const;

    QVector<CanvasElement> m_elements;
};
