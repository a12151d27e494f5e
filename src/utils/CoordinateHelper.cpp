#include "utils/CoordinateHelper.h"

namespace SnapOverlay {

QRect CoordinateHelper::virtualDesktopBounds(const QList<ScreenInfo>& screens)
{
    QRect bounds;
    for (const ScreenInfo& screen : screens) {
        if (screen.geometry.isEmpty()) {
            continue;
        }
        bounds = bounds.united(screen.geometry);
    }

    if (bounds.isEmpty()) {
        return QRect(0, 0, kFallbackDesktopWidth, kFallbackDesktopHeight);
    }
    return bounds;
}

QList<ScreenInfo> CoordinateHelper::screensIntersecting(const QList<ScreenInfo>& screens, const QRect& bounds)
{
    QList<ScreenInfo> result;
    for (const ScreenInfo& screen : screens) {
        if (screen.geometry.intersects(bounds)) {
            result.append(screen);
        }
    }
    return result;
}

} // namespace SnapOverlay
