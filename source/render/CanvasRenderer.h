#pragma once

// ============================================================================
// CanvasRenderer - Materializes editor state into a render scene and paints it
// ============================================================================
// buildScene() is a pure function of its inputs: the same store, selection,
// overlay, viewport and theme always produce the same scene. paint() only
// draws; it never touches editor state.
//
// Scene coordinates are unscaled canvas units. The caller sets up the
// painter transform (scale and scroll) before paint().
// ============================================================================

#include "../core/ToolType.h"
#include "../elements/CanvasElement.h"

#include <QColor>
#include <QHash>
#include <QPainterPath>
#include <QPixmap>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QString>
#include <QVector>
#include <optional>

class ElementStore;
class ThemeProvider;
class Viewport;
class QPainter;
struct InteractionOverlay;

/**
 * @brief One element, ready to paint.
 */
struct RenderItem {
    QString id;
    ElementType type = ElementType::Rectangle;
    QRect rect;                 ///< Stored-form geometry (preview/pending override applied)
    QRectF bounds;              ///< Normalized bounding box
    int zIndex = 0;

    QColor stroke;              ///< Resolved stroke color (invalid when the type has none)
    QColor fill;                ///< Resolved fill color (invalid = transparent)
    int strokeWidth = 0;

    qreal lineLength = 0;       ///< Line: hypot(width, height)
    qreal lineAngle = 0;        ///< Line: atan2(height, width) in degrees
    QPainterPath path;          ///< Freehand: absolute path

    QString text;               ///< Text box content
    QString imageUrl;

    bool selected = false;
    bool overridden = false;    ///< Geometry comes from a preview or an unconfirmed commit
    QVector<QRectF> handles;    ///< nw, ne, sw, se; empty when handles are suppressed

    bool operator==(const RenderItem& o) const {
        return id == o.id && type == o.type && rect == o.rect && bounds == o.bounds
            && zIndex == o.zIndex && stroke == o.stroke && fill == o.fill
            && strokeWidth == o.strokeWidth && qFuzzyCompare(lineLength + 1, o.lineLength + 1)
            && qFuzzyCompare(lineAngle + 360, o.lineAngle + 360) && path == o.path
            && text == o.text && imageUrl == o.imageUrl && selected == o.selected
            && overridden == o.overridden && handles == o.handles;
    }
    bool operator!=(const RenderItem& o) const { return !(*this == o); }
};

/**
 * @brief In-progress drawing shown on top of the elements.
 */
struct DrawingPreview {
    ToolType tool = ToolType::None;
    QRectF box;                 ///< Rectangle, circle, text box
    QPointF lineStart;
    qreal lineLength = 0;
    qreal lineAngle = 0;        ///< Degrees
    QPainterPath path;          ///< Freehand
    QColor color;
    int width = 2;
};

struct RenderScene {
    QVector<RenderItem> items;  ///< Ascending z_index, ties in store order
    bool dark = false;
    QColor background;
    bool showGrid = false;
    int gridSize = 20;
    QSize surfaceSize;          ///< Logical (unscaled) surface size

    std::optional<QRectF> marquee;
    std::optional<DrawingPreview> preview;
    std::optional<QPointF> eraserPos;
    qreal eraserRadius = 0;
    qreal scale = 1.0;

    const RenderItem* item(const QString& id) const;
};

/**
 * @brief Everything buildScene() reads.
 */
struct RenderInput {
    const ElementStore* store = nullptr;
    const QVector<QString>* selection = nullptr;
    const InteractionOverlay* overlay = nullptr;
    const Viewport* viewport = nullptr;
    const ThemeProvider* theme = nullptr;
    ToolType tool = ToolType::None;
    bool readonly = false;
    bool showGrid = false;
    int gridSize = 20;
    int handleSize = 10;        ///< Screen pixels
    qreal eraserRadius = 8.0;
    QSize visibleSize;          ///< Client size of the viewport
};

namespace CanvasRenderer {

/**
 * @brief Build the scene for the current state.
 */
RenderScene buildScene(const RenderInput& input);

/**
 * @brief Materialize one element (no selection or handle state).
 */
RenderItem buildItem(const CanvasElement& element, bool dark);

/**
 * @brief Handle squares centered on the four corners of a box.
 * @param size Side length in canvas units.
 */
QVector<QRectF> handleRects(const QRectF& bounds, qreal size);

/**
 * @brief Paint a scene.
 * @param exposed Canvas-space area to paint (for the grid).
 * @param images Loaded images by URL; missing ones get a placeholder.
 * @param paintText Draw text box content (false when live editors cover it).
 */
void paint(QPainter& painter, const RenderScene& scene, const QRectF& exposed,
           const QHash<QString, QPixmap>& images = QHash<QString, QPixmap>(),
           bool paintText = true);

} // namespace CanvasRenderer
