#ifndef COORDINATEHELPER_H
#define COORDINATEHELPER_H

#include <QList>
#include <QRect>

#include "session/SessionTypes.h"

namespace SnapOverlay {

/**
 * CoordinateHelper - Screen layout utilities for overlay placement
 *
 * All geometry is in logical (Qt) virtual desktop coordinates.
 */
class CoordinateHelper {
public:
    CoordinateHelper() = delete;

    // Used when no screen information is available
    static constexpr int kFallbackDesktopWidth = 1920;
    static constexpr int kFallbackDesktopHeight = 1080;

    // Bounding rectangle of all screens; 1920x1080 at the origin for an empty list
    static QRect virtualDesktopBounds(const QList<ScreenInfo>& screens);

    // Screens whose geometry overlaps the given rectangle, in input order
    static QList<ScreenInfo> screensIntersecting(const QList<ScreenInfo>& screens, const QRect& bounds);
};

} // namespace SnapOverlay

#endif // COORDINATEHELPER_H
