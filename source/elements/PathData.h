#pragma once

// ============================================================================
// PathData - Codec for freehand path strings
// ============================================================================
// Freehand strokes travel over the wire as SVG-style path data:
//     "M 4 12 L 5.5 13 L 9 20"
// Points are relative to the element origin.
// ============================================================================

#include <QString>
#include <QVector>
#include <QPointF>

namespace PathData {

/**
 * @brief Encode points as "M x y L x y ...".
 */
QString encode(const QVector<QPointF>& points);

/**
 * @brief Decode a path string into points.
 *
 * Every number in the string is extracted in order and paired up, so both
 * "M 1 2 L 3 4" and "M1,2L3,4" decode the same. A trailing unpaired number is
 * dropped.
 */
QVector<QPointF> decode(const QString& pathData);

} // namespace PathData
