// ============================================================================
// CanvasElement - Implementation
// ============================================================================

#include "CanvasElement.h"
#include "PathData.h"

#include <QDebug>
#include <QtMath>

namespace {

int readInt(const QJsonObject& obj, const QString& key, int defaultValue = 0)
{
    const QJsonValue v = obj.value(key);
    if (v.isDouble()) {
        return qRound(v.toDouble());
    }
    if (v.isString()) {
        bool ok = false;
        const double parsed = v.toString().toDouble(&ok);
        return ok ? qRound(parsed) : defaultValue;
    }
    return defaultValue;
}

StrokeStyle readStroke(const QJsonObject& obj)
{
    StrokeStyle stroke;
    const QString color = obj.value(QStringLiteral("stroke_color")).toString();
    if (!color.isEmpty()) {
        stroke.color = color;
    }
    stroke.width = readInt(obj, QStringLiteral("stroke_width"), 2);
    if (stroke.width <= 0) {
        stroke.width = 2;
    }
    return stroke;
}

void writeStroke(QJsonObject& obj, const StrokeStyle& stroke)
{
    obj[QStringLiteral("stroke_color")] = stroke.color;
    obj[QStringLiteral("stroke_width")] = stroke.width;
}

} // namespace

// ===== ElementType helpers =====

QString elementTypeName(ElementType type)
{
    switch (type) {
        case ElementType::TextBox:   return QStringLiteral("textbox");
        case ElementType::Image:     return QStringLiteral("image");
        case ElementType::Rectangle: return QStringLiteral("rectangle");
        case ElementType::Circle:    return QStringLiteral("circle");
        case ElementType::Line:      return QStringLiteral("line");
        case ElementType::Freehand:  return QStringLiteral("freehand");
    }
    return QString();
}

std::optional<ElementType> elementTypeFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("textbox"))   return ElementType::TextBox;
    if (n == QLatin1String("image"))     return ElementType::Image;
    if (n == QLatin1String("rectangle")) return ElementType::Rectangle;
    if (n == QLatin1String("circle"))    return ElementType::Circle;
    if (n == QLatin1String("line"))      return ElementType::Line;
    if (n == QLatin1String("freehand"))  return ElementType::Freehand;
    return std::nullopt;
}

QString elementIdFromJson(const QJsonValue& value)
{
    if (value.isDouble()) {
        return QString::number(static_cast<qint64>(value.toDouble()));
    }
    return value.toString();
}

// ===== Payload accessors =====

const StrokeStyle* CanvasElement::strokeStyle() const
{
    if (const auto* d = as<RectangleData>()) return &d->stroke;
    if (const auto* d = as<CircleData>())    return &d->stroke;
    if (const auto* d = as<LineData>())      return &d->stroke;
    if (const auto* d = as<FreehandData>())  return &d->stroke;
    return nullptr;
}

StrokeStyle* CanvasElement::strokeStyle()
{
    return const_cast<StrokeStyle*>(static_cast<const CanvasElement*>(this)->strokeStyle());
}

int CanvasElement::effectiveStrokeWidth() const
{
    const StrokeStyle* stroke = strokeStyle();
    return (stroke && stroke->width > 0) ? stroke->width : 2;
}

QString CanvasElement::fillColor() const
{
    if (const auto* d = as<RectangleData>()) return d->fillColor;
    if (const auto* d = as<CircleData>())    return d->fillColor;
    return QString();
}

// ===== Serialization =====

QJsonObject CanvasElement::toJson(bool includeId) const
{
    QJsonObject obj;
    if (includeId && !id.isEmpty()) {
        obj[QStringLiteral("id")] = id;
    }
    obj[QStringLiteral("element_type")] = elementTypeName(type());
    obj[QStringLiteral("x")] = x;
    obj[QStringLiteral("y")] = y;
    obj[QStringLiteral("width")] = width;
    obj[QStringLiteral("height")] = height;
    obj[QStringLiteral("z_index")] = zIndex;

    if (const auto* d = as<TextBoxData>()) {
        obj[QStringLiteral("text_content")] = d->text;
    } else if (const auto* d = as<ImageData>()) {
        obj[QStringLiteral("image_url")] = d->imageUrl;
    } else if (const auto* d = as<RectangleData>()) {
        writeStroke(obj, d->stroke);
        obj[QStringLiteral("fill_color")] = d->fillColor;
    } else if (const auto* d = as<CircleData>()) {
        writeStroke(obj, d->stroke);
        obj[QStringLiteral("fill_color")] = d->fillColor;
    } else if (const auto* d = as<LineData>()) {
        writeStroke(obj, d->stroke);
    } else if (const auto* d = as<FreehandData>()) {
        writeStroke(obj, d->stroke);
        obj[QStringLiteral("path_data")] = PathData::encode(d->path);
    }
    return obj;
}

std::optional<CanvasElement> CanvasElement::fromJson(const QJsonObject& obj)
{
    const QString typeName = obj.value(QStringLiteral("element_type")).toString();
    const std::optional<ElementType> type = elementTypeFromName(typeName);
    if (!type) {
        qWarning() << "CanvasElement::fromJson: unknown element_type" << typeName;
        return std::nullopt;
    }

    CanvasElement el;
    el.id = elementIdFromJson(obj.value(QStringLiteral("id")));
    el.x = readInt(obj, QStringLiteral("x"));
    el.y = readInt(obj, QStringLiteral("y"));
    el.width = readInt(obj, QStringLiteral("width"));
    el.height = readInt(obj, QStringLiteral("height"));
    el.zIndex = readInt(obj, QStringLiteral("z_index"));

    switch (*type) {
        case ElementType::TextBox:
            el.payload = TextBoxData{obj.value(QStringLiteral("text_content")).toString()};
            break;
        case ElementType::Image:
            el.payload = ImageData{obj.value(QStringLiteral("image_url")).toString()};
            break;
        case ElementType::Rectangle:
            el.payload = RectangleData{readStroke(obj), obj.value(QStringLiteral("fill_color")).toString()};
            break;
        case ElementType::Circle:
            el.payload = CircleData{readStroke(obj), obj.value(QStringLiteral("fill_color")).toString()};
            break;
        case ElementType::Line:
            el.payload = LineData{readStroke(obj)};
            break;
        case ElementType::Freehand:
            el.payload = FreehandData{readStroke(obj),
                                      PathData::decode(obj.value(QStringLiteral("path_data")).toString())};
            break;
    }
    return el;
}

QVector<CanvasElement> CanvasElement::listFromJson(const QJsonArray& array)
{
    QVector<CanvasElement> result;
    result.reserve(array.size());
    for (const QJsonValue& v : array) {
        if (!v.isObject()) {
            qWarning() << "CanvasElement::listFromJson: skipping non-object entry";
            continue;
        }
        if (auto el = fromJson(v.toObject())) {
            result.append(*el);
        }
    }
    return result;
}

// ===== Factories =====

CanvasElement CanvasElement::makeTextBox(const QRect& r, const QString& text)
{
    CanvasElement el;
    el.setRect(r);
    el.payload = TextBoxData{text};
    return el;
}

CanvasElement CanvasElement::makeImage(const QRect& r, const QString& url)
{
    CanvasElement el;
    el.setRect(r);
    el.payload = ImageData{url};
    return el;
}

CanvasElement CanvasElement::makeRectangle(const QRect& r, const StrokeStyle& stroke)
{
    CanvasElement el;
    el.setRect(r);
    el.payload = RectangleData{stroke, QString()};
    return el;
}

CanvasElement CanvasElement::makeCircle(const QRect& r, const StrokeStyle& stroke)
{
    CanvasElement el;
    el.setRect(r);
    el.payload = CircleData{stroke, QString()};
    return el;
}

CanvasElement CanvasElement::makeLine(const QPoint& start, int dx, int dy, const StrokeStyle& stroke)
{
    CanvasElement el;
    el.x = start.x();
    el.y = start.y();
    el.width = dx;
    el.height = dy;
    el.payload = LineData{stroke};
    return el;
}

CanvasElement CanvasElement::makeFreehand(const QRect& r, const QVector<QPointF>& relativePath,
                                          const StrokeStyle& stroke)
{
    CanvasElement el;
    el.setRect(r);
    el.payload = FreehandData{stroke, relativePath};
    return el;
}
