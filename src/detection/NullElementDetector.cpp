#include "detection/NullElementDetector.h"

namespace SnapOverlay {

NullElementDetector::NullElementDetector(QObject *parent)
    : IElementDetector(parent)
{
}

std::optional<ElementDescriptor> NullElementDetector::detectElementAt(const QPoint &screenPos,
                                                                      quintptr ignoreWindow)
{
    Q_UNUSED(screenPos);
    Q_UNUSED(ignoreWindow);
    return std::nullopt;
}

} // namespace SnapOverlay
