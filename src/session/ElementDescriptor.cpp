#include "session/ElementDescriptor.h"

#include <QDebugStateSaver>
#include <cstdlib>

namespace SnapOverlay {

namespace {

bool withinTolerance(int a, int b)
{
    return std::abs(a - b) < ElementDescriptor::kBoundsTolerance;
}

} // namespace

bool ElementDescriptor::isSameElement(const ElementDescriptor &other) const
{
    return windowHandle == other.windowHandle &&
           className == other.className &&
           withinTolerance(bounds.x(), other.bounds.x()) &&
           withinTolerance(bounds.y(), other.bounds.y()) &&
           withinTolerance(bounds.width(), other.bounds.width()) &&
           withinTolerance(bounds.height(), other.bounds.height());
}

bool ElementDescriptor::operator==(const ElementDescriptor &other) const
{
    return windowHandle == other.windowHandle &&
           className == other.className &&
           bounds == other.bounds &&
           name == other.name &&
           processName == other.processName &&
           isWindow == other.isWindow;
}

QDebug operator<<(QDebug debug, const ElementDescriptor &element)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "ElementDescriptor(" << element.name
                    << ", class=" << element.className
                    << ", handle=" << Qt::hex << element.windowHandle << Qt::dec
                    << ", bounds=" << element.bounds << ')';
    return debug;
}

} // namespace SnapOverlay
