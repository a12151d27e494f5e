#include "session/WindowBuilder.h"
#include "session/CaptureSession.h"
#include "session/IOverlayWindow.h"
#include "session/ModifierKeyFilter.h"
#include "session/SessionErrors.h"

#include <QDebug>

namespace SnapOverlay {

WindowBuilder::WindowBuilder(CaptureSession *session, IOverlayWindowFactory *factory)
    : m_session(session)
    , m_factory(factory)
{
}

WindowBuilder &WindowBuilder::withBounds(const QRect &bounds)
{
    m_bounds = bounds;
    return *this;
}

WindowBuilder &WindowBuilder::withScreens(const QList<ScreenInfo> &screens)
{
    m_screens = screens;
    return *this;
}

WindowBuilder &WindowBuilder::enableElementDetection(bool enabled)
{
    m_elementDetection = enabled;
    return *this;
}

WindowBuilder &WindowBuilder::withModifierKey(Qt::Key key)
{
    m_modifierKey = key;
    return *this;
}

IOverlayWindow *WindowBuilder::build()
{
    if (!m_bounds) {
        throw WindowBuilderError("WindowBuilder: bounds not set");
    }
    if (m_bounds->isEmpty()) {
        throw WindowBuilderError("WindowBuilder: bounds are empty");
    }
    if (!m_screens) {
        throw WindowBuilderError("WindowBuilder: screens not set");
    }
    if (m_screens->isEmpty()) {
        throw WindowBuilderError("WindowBuilder: screen list is empty");
    }
    if (!m_session) {
        throw WindowBuilderError("WindowBuilder: no session");
    }
    if (!m_factory) {
        throw WindowBuilderError("WindowBuilder: no window factory");
    }

    IOverlayWindow *window = m_factory->createWindow();
    if (!window) {
        throw WindowBuilderError("WindowBuilder: window factory returned no window");
    }

    window->setGeometry(*m_bounds);
    window->setScreens(*m_screens);
    window->setElementDetectionEnabled(m_elementDetection);

    m_session->addWindow(window);

    if (m_elementDetection) {
        QObject *target = window->eventTarget();
        if (target) {
            // Parented to the window so it goes away with it
            auto *filter = new ModifierKeyFilter(m_session, m_modifierKey, window);
            target->installEventFilter(filter);
        } else {
            qWarning() << "WindowBuilder: Window has no event target, modifier key disabled";
        }
    }

    qDebug() << "WindowBuilder: Built window at" << *m_bounds << "spanning"
             << m_screens->size() << "screen(s)"
             << (m_elementDetection ? "with element detection" : "");
    return window;
}

} // namespace SnapOverlay
