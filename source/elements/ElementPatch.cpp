// ============================================================================
// ElementPatch - Implementation
// ============================================================================

#include "ElementPatch.h"

ElementPatch ElementPatch::position(int newX, int newY)
{
    ElementPatch p;
    p.x = newX;
    p.y = newY;
    return p;
}

ElementPatch ElementPatch::geometry(const QRect& rect)
{
    ElementPatch p;
    p.x = rect.x();
    p.y = rect.y();
    p.width = rect.width();
    p.height = rect.height();
    return p;
}

ElementPatch ElementPatch::textContent(const QString& newText)
{
    ElementPatch p;
    p.text = newText;
    return p;
}

ElementPatch ElementPatch::capture(const CanvasElement& element) const
{
    ElementPatch prev;
    if (x)      prev.x = element.x;
    if (y)      prev.y = element.y;
    if (width)  prev.width = element.width;
    if (height) prev.height = element.height;
    if (text) {
        const auto* tb = element.as<TextBoxData>();
        prev.text = tb ? tb->text : QString();
    }
    return prev;
}

void ElementPatch::applyTo(CanvasElement& element) const
{
    if (x)      element.x = *x;
    if (y)      element.y = *y;
    if (width)  element.width = *width;
    if (height) element.height = *height;
    if (text) {
        if (auto* tb = element.as<TextBoxData>()) {
            tb->text = *text;
        }
    }
}

QJsonObject ElementPatch::toJson() const
{
    QJsonObject obj;
    if (x)      obj[QStringLiteral("x")] = *x;
    if (y)      obj[QStringLiteral("y")] = *y;
    if (width)  obj[QStringLiteral("width")] = *width;
    if (height) obj[QStringLiteral("height")] = *height;
    if (text)   obj[QStringLiteral("text_content")] = *text;
    return obj;
}
