// ============================================================================
// PathData - Implementation
// ============================================================================

#include "PathData.h"

#include <QRegularExpression>
#include <QStringList>

namespace PathData {

QString encode(const QVector<QPointF>& points)
{
    QStringList parts;
    parts.reserve(points.size());
    for (int i = 0; i < points.size(); ++i) {
        const QPointF& p = points[i];
        parts.append(QStringLiteral("%1 %2 %3")
                         .arg(i == 0 ? QStringLiteral("M") : QStringLiteral("L"))
                         .arg(QString::number(p.x(), 'g', 10))
                         .arg(QString::number(p.y(), 'g', 10)));
    }
    return parts.join(QLatin1Char(' '));
}

QVector<QPointF> decode(const QString& pathData)
{
    static const QRegularExpression numberPattern(QStringLiteral("-?\\d*\\.?\\d+"));

    QVector<double> numbers;
    QRegularExpressionMatchIterator it = numberPattern.globalMatch(pathData);
    while (it.hasNext()) {
        bool ok = false;
        double v = it.next().captured(0).toDouble(&ok);
        if (ok) {
            numbers.append(v);
        }
    }

    QVector<QPointF> points;
    points.reserve(numbers.size() / 2);
    for (int i = 0; i + 1 < numbers.size(); i += 2) {
        points.append(QPointF(numbers[i], numbers[i + 1]));
    }
    return points;
}

} // namespace PathData
