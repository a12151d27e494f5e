#ifndef WINDOWBUILDER_H
#define WINDOWBUILDER_H

#include <QList>
#include <QRect>
#include <Qt>
#include <optional>

#include "session/SessionTypes.h"

namespace SnapOverlay {

class CaptureSession;
class IOverlayWindow;
class IOverlayWindowFactory;

/**
 * @brief Fluent construction of one overlay window bound to a session
 *
 * Obtained from CaptureSession::createWindowBuilder(). build() creates the
 * window through the session's factory, configures it and registers it with
 * the session.
 */
class WindowBuilder
{
public:
    WindowBuilder(CaptureSession *session, IOverlayWindowFactory *factory);

    WindowBuilder &withBounds(const QRect &bounds);
    WindowBuilder &withScreens(const QList<ScreenInfo> &screens);
    WindowBuilder &enableElementDetection(bool enabled = true);

    // Key toggling element-pick mode while held; only used with element detection
    WindowBuilder &withModifierKey(Qt::Key key);

    /**
     * @brief Create, configure and register the window
     * @throws WindowBuilderError if bounds or screens are missing or empty,
     *         or the factory cannot create a window
     * @throws SessionDisposedError if the session was disposed meanwhile
     */
    IOverlayWindow *build();

private:
    CaptureSession *m_session;
    IOverlayWindowFactory *m_factory;

    std::optional<QRect> m_bounds;
    std::optional<QList<ScreenInfo>> m_screens;
    bool m_elementDetection = false;
    Qt::Key m_modifierKey = Qt::Key_Control;
};

} // namespace SnapOverlay

#endif // WINDOWBUILDER_H
