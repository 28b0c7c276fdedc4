// ============================================================================
// Viewport - Implementation
// ============================================================================

#include "Viewport.h"

#include <QtMath>

bool Viewport::setScale(qreal scale)
{
    const qreal clamped = qBound(MIN_SCALE, scale, MAX_SCALE);
    if (qFuzzyCompare(clamped, m_scale)) {
        return false;
    }
    m_scale = clamped;
    return true;
}

QPointF Viewport::toCanvas(const QPointF& client) const
{
    return (client - m_surfaceOrigin + m_scrollOffset) / m_scale;
}

QPointF Viewport::toClient(const QPointF& canvas) const
{
    return canvas * m_scale + m_surfaceOrigin - m_scrollOffset;
}

QSize Viewport::logicalSurfaceSize(const QSize& visibleSize, const QSize& contentExtent) const
{
    const int fillW = qCeil(visibleSize.width() / m_scale);
    const int fillH = qCeil(visibleSize.height() / m_scale);

    int w = qMax(fillW, contentExtent.width() + SURFACE_PADDING);
    int h = qMax(fillH, contentExtent.height() + SURFACE_PADDING);

    w = qBound(MIN_SURFACE, w, MAX_SURFACE);
    h = qBound(MIN_SURFACE, h, MAX_SURFACE);
    return QSize(w, h);
}

QSize Viewport::scaledSurfaceSize(const QSize& visibleSize, const QSize& contentExtent) const
{
    const QSize logical = logicalSurfaceSize(visibleSize, contentExtent);
    return QSize(qCeil(logical.width() * m_scale), qCeil(logical.height() * m_scale));
}
