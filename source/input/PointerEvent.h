#pragma once

// ============================================================================
// PointerEvent - Unified pointer input
// ============================================================================
// Mouse, tablet and touch events are all converted to this struct by the
// view before they reach the InteractionController, so the state machine
// has one code path.
// ============================================================================

#include <QPointF>
#include <Qt>

struct PointerEvent {
    enum Type { Press, Move, Release };
    enum Source { Mouse, Stylus, Touch, Unknown };

    Type type = Move;
    Source source = Unknown;

    QPointF clientPos;        ///< Position in viewport (client) coordinates

    Qt::MouseButtons buttons = Qt::NoButton;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;

    qint64 timestamp = 0;

    static PointerEvent make(Type t, const QPointF& pos, Source src = Mouse) {
        PointerEvent pe;
        pe.type = t;
        pe.source = src;
        pe.clientPos = pos;
        pe.buttons = t == Release ? Qt::NoButton : Qt::LeftButton;
        return pe;
    }
};
