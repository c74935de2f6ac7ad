// ============================================================================
// qt_compat.h - Qt5 / Qt6 compatibility shims for InkBoard
// ============================================================================
// Include this header in files that use the Qt5/Qt6 APIs listed below.
// Simple one-liner differences are handled with inline
// #if QT_VERSION_CHECK guards directly in each source file.
// ============================================================================
#pragma once

#include <QtCore/qglobal.h>

// ============================================================================
// qHash seed / result type
// ============================================================================
// Qt6: size_t qHash(const T&, size_t seed)
// Qt5: uint qHash(const T&, uint seed)
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
   using IB_HashType = size_t;
#else
   using IB_HashType = uint;
#endif

// ============================================================================
// Pointer event position (QPointF)
// ============================================================================
// Qt6 unified all events under QSinglePointEvent::position().
// Qt5: QMouseEvent::localPos(), QTabletEvent::posF()
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define IB_MOUSE_POS(event)    (event)->position()   // QMouseEvent
#  define IB_TABLET_POS(event)   (event)->position()   // QTabletEvent
#else
#  define IB_MOUSE_POS(event)    (event)->localPos()
#  define IB_TABLET_POS(event)   (event)->posF()
#endif

// ============================================================================
// Tablet eraser end
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  include <QPointingDevice>
#  define IB_IS_ERASER_TABLET(event)     ((event)->pointerType() == QPointingDevice::PointerType::Eraser)
#else
#  include <QTabletEvent>
#  define IB_IS_ERASER_TABLET(event)     ((event)->pointerType() == QTabletEvent::Eraser)
#endif
