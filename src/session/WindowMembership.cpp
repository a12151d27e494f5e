#include "session/WindowMembership.h"
#include "session/IOverlayWindow.h"

#include <QDebug>
#include <exception>

namespace SnapOverlay {

void WindowMembership::addWindow(IOverlayWindow *window)
{
    m_windows.append(window);
}

bool WindowMembership::removeWindow(IOverlayWindow *window)
{
    return m_windows.removeOne(window);
}

bool WindowMembership::contains(const IOverlayWindow *window) const
{
    for (const IOverlayWindow *member : m_windows) {
        if (member == window) {
            return true;
        }
    }
    return false;
}

QList<IOverlayWindow *> WindowMembership::takeAll()
{
    QList<IOverlayWindow *> snapshot;
    snapshot.swap(m_windows);
    return snapshot;
}

int WindowMembership::closeAll(const QList<IOverlayWindow *> &windows)
{
    int failures = 0;
    for (IOverlayWindow *window : windows) {
        try {
            window->close();
        } catch (const std::exception &e) {
            ++failures;
            qWarning() << "WindowMembership: Error closing window:" << e.what();
        }
    }
    return failures;
}

int WindowMembership::showAll(const QList<IOverlayWindow *> &windows)
{
    int failures = 0;
    for (IOverlayWindow *window : windows) {
        try {
            window->show();
        } catch (const std::exception &e) {
            ++failures;
            qWarning() << "WindowMembership: Failed to show window:" << e.what();
        }
    }
    return failures;
}

} // namespace SnapOverlay
