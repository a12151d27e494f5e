#include "session/SessionTypes.h"

namespace SnapOverlay {

QString selectionModeName(SelectionMode mode)
{
    switch (mode) {
    case SelectionMode::Free:
        return QStringLiteral("Free");
    case SelectionMode::Element:
        return QStringLiteral("Element");
    }
    return QStringLiteral("Free");
}

} // namespace SnapOverlay
