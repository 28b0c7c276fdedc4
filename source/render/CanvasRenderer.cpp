// ============================================================================
// CanvasRenderer - Implementation
// ============================================================================

#include "CanvasRenderer.h"
#include "CanvasColors.h"
#include "ThemeProvider.h"
#include "../core/ElementStore.h"
#include "../core/Viewport.h"
#include "../geometry/Geometry.h"
#include "../input/InteractionController.h"

#include <QPainter>
#include <QtMath>

const RenderItem* RenderScene::item(const QString& id) const
{
    for (const RenderItem& it : items) {
        if (it.id == id) {
            return &it;
        }
    }
    return nullptr;
}

namespace CanvasRenderer {

QVector<QRectF> handleRects(const QRectF& bounds, qreal size)
{
    const qreal half = size / 2.0;
    auto at = [&](const QPointF& c) { return QRectF(c.x() - half, c.y() - half, size, size); };
    return {at(bounds.topLeft()), at(bounds.topRight()),
            at(bounds.bottomLeft()), at(bounds.bottomRight())};
}

RenderItem buildItem(const CanvasElement& element, bool dark)
{
    RenderItem item;
    item.id = element.id;
    item.type = element.type();
    item.rect = element.rect();
    item.bounds = Geometry::elementBounds(element);
    item.zIndex = element.zIndex;

    if (const StrokeStyle* stroke = element.strokeStyle()) {
        item.stroke = CanvasColors::resolve(stroke->color, dark);
        if (!item.stroke.isValid()) {
            item.stroke = CanvasColors::defaultColor(dark);
        }
        item.strokeWidth = stroke->width > 0 ? stroke->width : 2;
    }
    item.fill = CanvasColors::resolve(element.fillColor(), dark);

    switch (item.type) {
        case ElementType::TextBox:
            item.text = element.as<TextBoxData>()->text;
            break;
        case ElementType::Image:
            item.imageUrl = element.as<ImageData>()->imageUrl;
            break;
        case ElementType::Line:
            item.lineLength = qSqrt(qreal(element.width) * element.width
                                    + qreal(element.height) * element.height);
            item.lineAngle = qRadiansToDegrees(qAtan2(element.height, element.width));
            break;
        case ElementType::Freehand: {
            const QVector<QPointF> pts = Geometry::absolutePath(element);
            if (!pts.isEmpty()) {
                item.path.moveTo(pts.first());
                for (int i = 1; i < pts.size(); ++i) {
                    item.path.lineTo(pts[i]);
                }
            }
            break;
        }
        case ElementType::Rectangle:
        case ElementType::Circle:
            break;
    }
    return item;
}

static std::optional<DrawingPreview> buildPreview(const InteractionOverlay& overlay, bool dark)
{
    if (!overlay.drawing) {
        return std::nullopt;
    }

    DrawingPreview preview;
    preview.tool = overlay.drawTool;
    preview.color = CanvasColors::resolve(overlay.drawStroke.color, dark);
    if (!preview.color.isValid()) {
        preview.color = CanvasColors::defaultColor(dark);
    }
    preview.width = overlay.drawStroke.width;

    switch (overlay.drawTool) {
        case ToolType::Line: {
            const QPointF d = overlay.drawEnd - overlay.drawStart;
            preview.lineStart = overlay.drawStart;
            preview.lineLength = qSqrt(d.x() * d.x() + d.y() * d.y());
            preview.lineAngle = qRadiansToDegrees(qAtan2(d.y(), d.x()));
            break;
        }
        case ToolType::Freehand:
            if (!overlay.drawPath.isEmpty()) {
                preview.path.moveTo(overlay.drawPath.first());
                for (int i = 1; i < overlay.drawPath.size(); ++i) {
                    preview.path.lineTo(overlay.drawPath[i]);
                }
            }
            break;
        default:
            preview.box = Geometry::rectFromPoints(overlay.drawStart, overlay.drawEnd);
            break;
    }
    return preview;
}

RenderScene buildScene(const RenderInput& input)
{
    RenderScene scene;
    scene.dark = input.theme ? input.theme->isDarkMode() : false;
    scene.background = CanvasColors::canvasBackground(scene.dark);
    scene.showGrid = input.showGrid;
    scene.gridSize = input.gridSize;
    scene.eraserRadius = input.eraserRadius;
    scene.scale = input.viewport ? input.viewport->scale() : 1.0;

    if (!input.store) {
        return scene;
    }

    if (input.viewport) {
        scene.surfaceSize = input.viewport->logicalSurfaceSize(input.visibleSize,
                                                               input.store->contentExtent());
    }

    // No handles while a tool is armed or the editor is read-only
    const bool handlesVisible = input.tool == ToolType::None && !input.readonly;
    const qreal handleSize = input.handleSize / scene.scale;

    const QVector<CanvasElement> ordered = input.store->paintOrder();
    scene.items.reserve(ordered.size());

    for (CanvasElement el : ordered) {
        bool overridden = false;
        if (input.overlay) {
            const auto it = input.overlay->geometryOverrides.constFind(el.id);
            if (it != input.overlay->geometryOverrides.constEnd()) {
                el.setRect(it.value());
                overridden = true;
            }
        }

        RenderItem item = buildItem(el, scene.dark);
        item.overridden = overridden;
        item.selected = input.selection && input.selection->contains(el.id);
        if (handlesVisible) {
            item.handles = handleRects(item.bounds, handleSize);
        }
        scene.items.append(item);
    }

    if (input.overlay) {
        scene.marquee = input.overlay->marquee;
        scene.preview = buildPreview(*input.overlay, scene.dark);
        if (input.tool == ToolType::Eraser) {
            scene.eraserPos = input.overlay->eraserPos;
        }
    }
    return scene;
}

// ============================================================================
// Painting
// ============================================================================

static void paintGrid(QPainter& painter, const RenderScene& scene, const QRectF& exposed)
{
    if (!scene.showGrid || scene.gridSize <= 0) {
        return;
    }

    QPen pen(CanvasColors::gridLine(scene.dark));
    pen.setCosmetic(true);
    painter.setPen(pen);

    const qreal step = scene.gridSize;
    const qreal startX = qFloor(exposed.left() / step) * step;
    const qreal startY = qFloor(exposed.top() / step) * step;
    for (qreal x = startX; x <= exposed.right(); x += step) {
        painter.drawLine(QPointF(x, exposed.top()), QPointF(x, exposed.bottom()));
    }
    for (qreal y = startY; y <= exposed.bottom(); y += step) {
        painter.drawLine(QPointF(exposed.left(), y), QPointF(exposed.right(), y));
    }
}

static void paintItem(QPainter& painter, const RenderItem& item, const RenderScene& scene,
                      const QHash<QString, QPixmap>& images, bool paintText)
{
    painter.save();

    switch (item.type) {
        case ElementType::TextBox: {
            QPen border(CanvasColors::previewStroke(scene.dark), 1, Qt::DashLine);
            border.setCosmetic(true);
            painter.setPen(border);
            painter.setBrush(Qt::NoBrush);
            painter.drawRect(item.bounds);
            if (paintText && !item.text.isEmpty()) {
                painter.setPen(CanvasColors::defaultColor(scene.dark));
                painter.drawText(item.bounds.adjusted(6, 4, -6, -4),
                                 Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, item.text);
            }
            break;
        }
        case ElementType::Image: {
            const QPixmap pix = images.value(item.imageUrl);
            if (!pix.isNull()) {
                painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
                painter.drawPixmap(item.bounds, pix, QRectF(pix.rect()));
            } else {
                painter.fillRect(item.bounds, CanvasColors::imagePlaceholder(scene.dark));
            }
            break;
        }
        case ElementType::Rectangle:
        case ElementType::Circle: {
            // The border sits inside the box
            const qreal inset = item.strokeWidth / 2.0;
            const QRectF r = item.bounds.adjusted(inset, inset, -inset, -inset);
            painter.setPen(QPen(item.stroke, item.strokeWidth));
            painter.setBrush(item.fill.isValid() ? QBrush(item.fill) : QBrush(Qt::NoBrush));
            if (item.type == ElementType::Circle) {
                painter.drawEllipse(r);
            } else {
                painter.drawRect(r);
            }
            break;
        }
        case ElementType::Line: {
            painter.translate(item.rect.x(), item.rect.y());
            painter.rotate(item.lineAngle);
            painter.fillRect(QRectF(0, -item.strokeWidth / 2.0, item.lineLength, item.strokeWidth),
                             item.stroke);
            break;
        }
        case ElementType::Freehand: {
            QPen pen(item.stroke, item.strokeWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
            painter.setPen(pen);
            painter.setBrush(Qt::NoBrush);
            painter.drawPath(item.path);
            break;
        }
    }

    painter.restore();

    if (item.selected) {
        painter.save();
        QPen outline(CanvasColors::selectionOutline(scene.dark), 2);
        outline.setCosmetic(true);
        painter.setPen(outline);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(item.bounds);

        painter.setBrush(CanvasColors::handleFill(scene.dark));
        for (const QRectF& h : item.handles) {
            painter.drawRect(h);
        }
        painter.restore();
    }
}

static void paintPreview(QPainter& painter, const DrawingPreview& preview, bool dark)
{
    painter.save();
    QPen dashed(CanvasColors::previewStroke(dark), 1, Qt::DashLine);
    dashed.setCosmetic(true);

    switch (preview.tool) {
        case ToolType::Line:
            painter.translate(preview.lineStart);
            painter.rotate(preview.lineAngle);
            painter.fillRect(QRectF(0, -preview.width / 2.0, preview.lineLength, preview.width),
                             preview.color);
            break;
        case ToolType::Freehand:
            painter.setPen(QPen(preview.color, preview.width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
            painter.setBrush(Qt::NoBrush);
            painter.drawPath(preview.path);
            break;
        case ToolType::Circle:
            painter.setPen(dashed);
            painter.setBrush(Qt::NoBrush);
            painter.drawEllipse(preview.box);
            break;
        default:
            painter.setPen(dashed);
            painter.setBrush(Qt::NoBrush);
            painter.drawRect(preview.box);
            break;
    }
    painter.restore();
}

void paint(QPainter& painter, const RenderScene& scene, const QRectF& exposed,
           const QHash<QString, QPixmap>& images, bool paintText)
{
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.fillRect(exposed, scene.background);
    paintGrid(painter, scene, exposed);

    for (const RenderItem& item : scene.items) {
        const qreal reach = item.strokeWidth + 1;
        if (!item.bounds.adjusted(-reach, -reach, reach, reach).intersects(exposed)) {
            continue;
        }
        paintItem(painter, item, scene, images, paintText);
    }

    if (scene.preview) {
        paintPreview(painter, *scene.preview, scene.dark);
    }

    if (scene.marquee) {
        painter.save();
        QPen pen(CanvasColors::defaultColor(scene.dark), 1, Qt::DashLine);
        pen.setCosmetic(true);
        painter.setPen(pen);
        painter.setBrush(CanvasColors::marqueeFill());
        painter.drawRect(*scene.marquee);
        painter.restore();
    }

    if (scene.eraserPos) {
        painter.save();
        QPen pen(CanvasColors::previewStroke(scene.dark), 1);
        pen.setCosmetic(true);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawEllipse(*scene.eraserPos, scene.eraserRadius, scene.eraserRadius);
        painter.restore();
    }
}

} // namespace CanvasRenderer
