#pragma once

// ============================================================================
// ToolType - Canvas editing tools
// ============================================================================
// With no tool active, pointer input selects, drags and resizes elements.
// Any other tool arms the next pointer-down for drawing or erasing.
// ============================================================================

#include <QString>

/**
 * @brief Available canvas tools.
 */
enum class ToolType {
    None,       ///< Select / drag / resize existing elements
    TextBox,    ///< Draw a text box
    Rectangle,  ///< Draw a rectangle
    Circle,     ///< Draw an ellipse inside the dragged box
    Line,       ///< Draw a straight line (signed deltas keep its direction)
    Freehand,   ///< Free ink stroke
    Eraser      ///< Shape-aware element eraser
};

/**
 * @brief True for the tools that draw a new element.
 */
inline bool isDrawingTool(ToolType tool)
{
    return tool != ToolType::None && tool != ToolType::Eraser;
}

inline QString toolName(ToolType tool)
{
    switch (tool) {
        case ToolType::None:      return QStringLiteral("none");
        case ToolType::TextBox:   return QStringLiteral("textbox");
        case ToolType::Rectangle: return QStringLiteral("rectangle");
        case ToolType::Circle:    return QStringLiteral("circle");
        case ToolType::Line:      return QStringLiteral("line");
        case ToolType::Freehand:  return QStringLiteral("freehand");
        case ToolType::Eraser:    return QStringLiteral("eraser");
    }
    return QString();
}
