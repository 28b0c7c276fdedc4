#pragma once

// ============================================================================
// Geometry - Hit testing and rectangle math for canvas elements
// ============================================================================
// Pure functions, canvas-space coordinates throughout. The screen <-> canvas
// transform lives in Viewport so there is exactly one conversion path.
// ============================================================================

#include "../elements/CanvasElement.h"

#include <QPointF>
#include <QRectF>
#include <QVector>

namespace Geometry {

/// Eraser radius used when the caller does not configure one.
constexpr qreal DEFAULT_ERASER_RADIUS = 8.0;

/**
 * @brief Distance from p to the segment ab.
 *
 * The projection of p is clamped to the segment. When a == b this is the
 * plain distance from p to a.
 */
qreal pointToSegmentDistance(const QPointF& p, const QPointF& a, const QPointF& b);

/**
 * @brief Euclidean distance between two points.
 */
qreal distance(const QPointF& a, const QPointF& b);

/**
 * @brief Normalized bounding box of an element.
 *
 * Lines store signed deltas, so the box is built from both endpoints.
 */
QRectF elementBounds(const CanvasElement& element);

/**
 * @brief Center of the element's geometry.
 *
 * For lines this is the segment midpoint, for freehand strokes the point
 * halfway along the path, for everything else the center of the bounding box.
 */
QPointF elementCenter(const CanvasElement& element);

/**
 * @brief Hit tolerance for an element: half its stroke width plus the eraser radius.
 */
qreal hitTolerance(const CanvasElement& element, qreal eraserRadius = DEFAULT_ERASER_RADIUS);

/**
 * @brief Absolute (canvas-space) points of a freehand stroke.
 */
QVector<QPointF> absolutePath(const CanvasElement& element);

/**
 * @brief Shape-aware hit test.
 * @param point Point in canvas space.
 * @param element Element to test.
 * @param eraserRadius Extra radius added to half the stroke width.
 *
 * - freehand: distance to any path segment <= tolerance
 * - line: distance to the single segment <= tolerance
 * - everything else: point inside the bounding box grown by tolerance
 */
bool hitTest(const QPointF& point, const CanvasElement& element,
             qreal eraserRadius = DEFAULT_ERASER_RADIUS);

/**
 * @brief Axis-aligned rectangle overlap; touching edges count.
 *
 * Both rectangles are normalized first.
 */
bool boxesIntersect(const QRectF& a, const QRectF& b);

/**
 * @brief Rectangle spanned by two corner points.
 */
QRectF rectFromPoints(const QPointF& a, const QPointF& b);

/**
 * @brief round(value / gridSize) * gridSize; value unchanged when gridSize <= 0.
 */
int snapToGrid(qreal value, int gridSize);

} // namespace Geometry
