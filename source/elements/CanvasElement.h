#pragma once

// ============================================================================
// CanvasElement - One positioned, typed object on the whiteboard
// ============================================================================
// Elements are value types. The type-specific data lives in a std::variant so
// each element type carries exactly the fields it needs:
//
//   textbox   -> TextBoxData   (text)
//   image     -> ImageData     (image URL)
//   rectangle -> RectangleData (stroke + fill)
//   circle    -> CircleData    (stroke + fill)
//   line      -> LineData      (stroke; width/height are signed deltas)
//   freehand  -> FreehandData  (stroke + path relative to x,y)
//
// Geometry is integer pixels in unscaled canvas space.
// ============================================================================

#include <QString>
#include <QVector>
#include <QPointF>
#include <QRect>
#include <QJsonObject>
#include <QJsonArray>
#include <optional>
#include <variant>

/**
 * @brief Element types, in wire order.
 */
enum class ElementType {
    TextBox,
    Image,
    Rectangle,
    Circle,
    Line,
    Freehand
};

/**
 * @brief Stroke settings shared by shapes and ink.
 *
 * Colors are abstract names ("default", "red", ...) resolved by the theme at
 * render time. A "#rrggbb" value is also accepted.
 */
struct StrokeStyle {
    QString color = QStringLiteral("default");
    int width = 2;

    bool operator==(const StrokeStyle& other) const {
        return color == other.color && width == other.width;
    }
};

struct TextBoxData {
    QString text;
};

struct ImageData {
    QString imageUrl;
};

struct RectangleData {
    StrokeStyle stroke;
    QString fillColor;   ///< Empty = transparent
};

struct CircleData {
    StrokeStyle stroke;
    QString fillColor;   ///< Empty = transparent
};

struct LineData {
    StrokeStyle stroke;
};

struct FreehandData {
    StrokeStyle stroke;
    QVector<QPointF> path;   ///< Points relative to the element origin
};

using ElementPayload = std::variant<TextBoxData, ImageData, RectangleData,
                                    CircleData, LineData, FreehandData>;

/**
 * @brief A single element of a canvas note.
 *
 * The id is assigned by the server and stays stable until the element is
 * deleted. Elements created locally have an empty id until the create request
 * is confirmed.
 */
struct CanvasElement {
    QString id;              ///< Server-assigned id (decimal string for numeric ids)
    int x = 0;               ///< Left edge in canvas space
    int y = 0;               ///< Top edge in canvas space
    int width = 0;           ///< Width (signed dx for lines)
    int height = 0;          ///< Height (signed dy for lines)
    int zIndex = 0;          ///< Paint order, higher paints later
    ElementPayload payload;  ///< Type-specific data

    // ===== Type =====

    ElementType type() const { return static_cast<ElementType>(payload.index()); }

    /**
     * @brief The stroke style, or nullptr for types without one (textbox, image).
     */
    const StrokeStyle* strokeStyle() const;
    StrokeStyle* strokeStyle();

    /**
     * @brief Stroke width used by hit testing; 2 when the type has no stroke.
     */
    int effectiveStrokeWidth() const;

    /**
     * @brief The fill color name for rectangles and circles, empty otherwise.
     */
    QString fillColor() const;

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    template <typename T>
    T* as() { return std::get_if<T>(&payload); }

    // ===== Geometry =====

    /**
     * @brief The stored rectangle (x, y, width, height) without normalization.
     *
     * For lines the size may be negative; use Geometry::elementBounds() for a
     * normalized box.
     */
    QRect rect() const { return QRect(x, y, width, height); }

    void setRect(const QRect& r) {
        x = r.x();
        y = r.y();
        width = r.width();
        height = r.height();
    }

    // ===== Serialization =====

    /**
     * @brief Serialize to the wire form used by the element service.
     * @param includeId False for create requests, where the server assigns the id.
     */
    QJsonObject toJson(bool includeId = true) const;

    /**
     * @brief Deserialize from the wire form.
     * @return The element, or std::nullopt when element_type is unknown.
     *
     * Missing numeric fields default to 0, missing stroke fields to the
     * StrokeStyle defaults.
     */
    static std::optional<CanvasElement> fromJson(const QJsonObject& obj);

    /**
     * @brief Load an element list, skipping entries with an unknown type.
     */
    static QVector<CanvasElement> listFromJson(const QJsonArray& array);

    // ===== Factories =====

    static CanvasElement makeTextBox(const QRect& r, const QString& text = QString());
    static CanvasElement makeImage(const QRect& r, const QString& url);
    static CanvasElement makeRectangle(const QRect& r, const StrokeStyle& stroke);
    static CanvasElement makeCircle(const QRect& r, const StrokeStyle& stroke);
    static CanvasElement makeLine(const QPoint& start, int dx, int dy, const StrokeStyle& stroke);
    static CanvasElement makeFreehand(const QRect& r, const QVector<QPointF>& relativePath,
                                      const StrokeStyle& stroke);
};

// ===== ElementType helpers =====

/**
 * @brief Wire name for a type ("textbox", "image", ...).
 */
QString elementTypeName(ElementType type);

/**
 * @brief Parse a wire name.
 * @return The type, or std::nullopt for an unknown name.
 */
std::optional<ElementType> elementTypeFromName(const QString& name);

/**
 * @brief Read an id that may arrive as a JSON number or a string.
 */
QString elementIdFromJson(const QJsonValue& value);
