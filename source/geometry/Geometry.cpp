// ============================================================================
// Geometry - Implementation
// ============================================================================

#include "Geometry.h"

#include <QLineF>
#include <QtMath>
#include <cmath>

namespace Geometry {

qreal distance(const QPointF& a, const QPointF& b)
{
    return QLineF(a, b).length();
}

qreal pointToSegmentDistance(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const qreal lenSq = ab.x() * ab.x() + ab.y() * ab.y();
    if (lenSq == 0.0) {
        return distance(p, a);
    }
    const QPointF ap = p - a;
    const qreal t = qBound(0.0, (ap.x() * ab.x() + ap.y() * ab.y()) / lenSq, 1.0);
    return distance(p, a + t * ab);
}

QRectF elementBounds(const CanvasElement& element)
{
    return QRectF(QPointF(element.x, element.y),
                  QPointF(element.x + element.width, element.y + element.height)).normalized();
}

QPointF elementCenter(const CanvasElement& element)
{
    if (element.type() == ElementType::Freehand) {
        // Midpoint by arc length, so the center lies on the ink
        const QVector<QPointF> pts = absolutePath(element);
        if (pts.size() >= 2) {
            qreal total = 0.0;
            for (int i = 1; i < pts.size(); ++i) {
                total += distance(pts[i - 1], pts[i]);
            }
            qreal remaining = total / 2.0;
            for (int i = 1; i < pts.size(); ++i) {
                const qreal seg = distance(pts[i - 1], pts[i]);
                if (seg > 0.0 && remaining <= seg) {
                    return pts[i - 1] + (pts[i] - pts[i - 1]) * (remaining / seg);
                }
                remaining -= seg;
            }
            return pts.last();
        }
    }
    return QPointF(element.x + element.width / 2.0, element.y + element.height / 2.0);
}

qreal hitTolerance(const CanvasElement& element, qreal eraserRadius)
{
    return element.effectiveStrokeWidth() / 2.0 + eraserRadius;
}

QVector<QPointF> absolutePath(const CanvasElement& element)
{
    QVector<QPointF> result;
    const auto* ink = element.as<FreehandData>();
    if (!ink) {
        return result;
    }
    const QPointF origin(element.x, element.y);
    result.reserve(ink->path.size());
    for (const QPointF& p : ink->path) {
        result.append(p + origin);
    }
    return result;
}

bool hitTest(const QPointF& point, const CanvasElement& element, qreal eraserRadius)
{
    const qreal tol = hitTolerance(element, eraserRadius);

    switch (element.type()) {
        case ElementType::Freehand: {
            const QVector<QPointF> pts = absolutePath(element);
            if (pts.size() < 2) {
                return false;
            }
            for (int i = 1; i < pts.size(); ++i) {
                if (pointToSegmentDistance(point, pts[i - 1], pts[i]) <= tol) {
                    return true;
                }
            }
            return false;
        }
        case ElementType::Line: {
            const QPointF a(element.x, element.y);
            const QPointF b(element.x + element.width, element.y + element.height);
            return pointToSegmentDistance(point, a, b) <= tol;
        }
        default: {
            const QRectF box = elementBounds(element);
            return point.x() >= box.left() - tol && point.x() <= box.right() + tol
                && point.y() >= box.top() - tol && point.y() <= box.bottom() + tol;
        }
    }
}

bool boxesIntersect(const QRectF& a, const QRectF& b)
{
    const QRectF r1 = a.normalized();
    const QRectF r2 = b.normalized();
    return !(r1.left() > r2.right() || r1.right() < r2.left()
             || r1.top() > r2.bottom() || r1.bottom() < r2.top());
}

QRectF rectFromPoints(const QPointF& a, const QPointF& b)
{
    return QRectF(a, b).normalized();
}

int snapToGrid(qreal value, int gridSize)
{
    if (gridSize <= 0) {
        return qRound(value);
    }
    return static_cast<int>(std::round(value / gridSize)) * gridSize;
}

} // namespace Geometry
