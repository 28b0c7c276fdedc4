#pragma once

// ============================================================================
// Viewport - Zoom scale and the client <-> canvas coordinate transform
// ============================================================================
// Every pointer position goes through toCanvas() before any hit test or
// storage operation. Elements are always stored in unscaled canvas units.
// ============================================================================

#include <QPointF>
#include <QSize>
#include <QSizeF>

/**
 * @brief Zoom state of the editing surface.
 *
 * The surface origin is where the canvas (0,0) sits inside the client area
 * when nothing is scrolled; the scroll offset is in scaled (client) pixels.
 */
class Viewport {
public:
    static constexpr qreal MIN_SCALE = 0.25;
    static constexpr qreal MAX_SCALE = 4.0;
    static constexpr qreal ZOOM_STEP = 1.2;

    static constexpr int SURFACE_PADDING = 120;   ///< Added past the element extent
    static constexpr int MIN_SURFACE = 200;
    static constexpr int MAX_SURFACE = 100000;

    Viewport() = default;

    // ===== Zoom =====

    qreal scale() const { return m_scale; }

    /**
     * @brief Set the scale, clamped to [MIN_SCALE, MAX_SCALE].
     * @return True if the scale changed.
     */
    bool setScale(qreal scale);

    bool zoomIn() { return setScale(m_scale * ZOOM_STEP); }
    bool zoomOut() { return setScale(m_scale / ZOOM_STEP); }

    // ===== Offsets =====

    QPointF surfaceOrigin() const { return m_surfaceOrigin; }
    void setSurfaceOrigin(const QPointF& origin) { m_surfaceOrigin = origin; }

    QPointF scrollOffset() const { return m_scrollOffset; }
    void setScrollOffset(const QPointF& offset) { m_scrollOffset = offset; }

    // ===== Coordinate Transforms =====

    /**
     * @brief (client - surfaceOrigin + scrollOffset) / scale
     */
    QPointF toCanvas(const QPointF& client) const;

    /**
     * @brief Inverse of toCanvas().
     */
    QPointF toClient(const QPointF& canvas) const;

    /**
     * @brief Unscaled size of the editing surface.
     * @param visibleSize Client size of the visible area.
     * @param contentExtent Right/bottom extent of all elements.
     *
     * Large enough to fill the visible area at the current scale and to hold
     * every element plus SURFACE_PADDING, within [MIN_SURFACE, MAX_SURFACE].
     */
    QSize logicalSurfaceSize(const QSize& visibleSize, const QSize& contentExtent) const;

    /**
     * @brief logicalSurfaceSize() multiplied by the scale (scrollable area).
     */
    QSize scaledSurfaceSize(const QSize& visibleSize, const QSize& contentExtent) const;

private:
    qreal m_scale = 1.0;
    QPointF m_surfaceOrigin;
    QPointF m_scrollOffset;
};
