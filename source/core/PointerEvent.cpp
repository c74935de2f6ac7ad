#include "PointerEvent.h"
#include "../compat/qt_compat.h"

#include <QMouseEvent>
#include <QTabletEvent>

PointerEvent PointerEvent::fromMouseEvent(const QMouseEvent* event, Phase phase)
{
    PointerEvent pe;
    pe.pointerId = 1;
    pe.pointerType = Type::Mouse;
    pe.phase = phase;
    pe.client = IB_MOUSE_POS(event);
    pe.buttons = static_cast<int>(event->buttons());
    // Mice report no pressure: full while a button is held, none otherwise
    pe.pressure = pe.buttons != 0 ? 1.0 : 0.0;
    pe.timestamp = static_cast<qreal>(event->timestamp());
    return pe;
}

PointerEvent PointerEvent::fromTabletEvent(const QTabletEvent* event, Phase phase)
{
    PointerEvent pe;
    pe.pointerId = 2;
    pe.pointerType = Type::Pen;
    pe.phase = phase;
    pe.client = IB_TABLET_POS(event);
    pe.pressure = event->pressure();
    pe.tilt = QPointF(event->xTilt(), event->yTilt());
    pe.buttons = static_cast<int>(event->buttons());
    if (IB_IS_ERASER_TABLET(event)) {
        pe.buttons |= ERASER_BUTTON;
    }
    pe.timestamp = static_cast<qreal>(event->timestamp());
    return pe;
}
