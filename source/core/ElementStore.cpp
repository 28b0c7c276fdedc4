// ============================================================================
// ElementStore - Implementation
// ============================================================================

#include "ElementStore.h"
#include "../geometry/Geometry.h"

#include <QtMath>
#include <algorithm>

int ElementStore::indexOf(const QString& id) const
{
    if (id.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < m_elements.size(); ++i) {
        if (m_elements[i].id == id) {
            return i;
        }
    }
    return -1;
}

void ElementStore::addElement(const CanvasElement& element)
{
    const int idx = indexOf(element.id);
    if (idx >= 0) {
        m_elements[idx] = element;
        return;
    }
    m_elements.append(element);
}

bool ElementStore::removeElement(const QString& id)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    m_elements.removeAt(idx);
    return true;
}

bool ElementStore::applyPatch(const QString& id, const ElementPatch& patch)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    patch.applyTo(m_elements[idx]);
    return true;
}

const CanvasElement* ElementStore::element(const QString& id) const
{
    const int idx = indexOf(id);
    return idx >= 0 ? &m_elements[idx] : nullptr;
}

QVector<CanvasElement> ElementStore::paintOrder() const
{
    QVector<CanvasElement> sorted = m_elements;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CanvasElement& a, const CanvasElement& b) {
                         return a.zIndex < b.zIndex;
                     });
    return sorted;
}

QVector<QString> ElementStore::elementsAtPoint(const QPointF& pt, qreal eraserRadius) const
{
    QVector<QString> result;
    for (const CanvasElement& el : m_elements) {
        if (Geometry::hitTest(pt, el, eraserRadius)) {
            result.append(el.id);
        }
    }
    return result;
}

QVector<QString> ElementStore::elementsInRect(const QRectF& rect) const
{
    QVector<QString> result;
    for (const CanvasElement& el : m_elements) {
        if (Geometry::boxesIntersect(Geometry::elementBounds(el), rect)) {
            result.append(el.id);
        }
    }
    return result;
}

const CanvasElement* ElementStore::topmostAt(const QPointF& pt, qreal radius) const
{
    // Highest z wins; on ties the later array entry is painted last
    const CanvasElement* best = nullptr;
    for (const CanvasElement& el : m_elements) {
        if (!Geometry::hitTest(pt, el, radius)) {
            continue;
        }
        if (!best || el.zIndex >= best->zIndex) {
            best = &el;
        }
    }
    return best;
}

QSize ElementStore::contentExtent() const
{
    int maxW = 0;
    int maxH = 0;
    for (const CanvasElement& el : m_elements) {
        const QRectF box = Geometry::elementBounds(el);
        maxW = qMax(maxW, static_cast<int>(qCeil(box.right())));
        maxH = qMax(maxH, static_cast<int>(qCeil(box.bottom())));
    }
    return QSize(maxW, maxH);
}

QVector<CanvasElement> ElementStore::snapshot(const QVector<QString>& ids) const
{
    QVector<CanvasElement> result;
    for (const CanvasElement& el : m_elements) {
        if (ids.contains(el.id)) {
            result.append(el);
        }
    }
    return result;
}
