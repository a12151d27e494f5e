#ifndef WINDOWMEMBERSHIP_H
#define WINDOWMEMBERSHIP_H

#include <QList>

namespace SnapOverlay {

class IOverlayWindow;

/**
 * @brief Ordered list of the windows taking part in one capture session
 *
 * Not thread-safe on its own; CaptureSession guards it with the session mutex.
 * closeAll()/showAll() work on a snapshot taken by the caller so they can run
 * without the mutex held.
 */
class WindowMembership
{
public:
    void addWindow(IOverlayWindow *window);
    bool removeWindow(IOverlayWindow *window);
    bool contains(const IOverlayWindow *window) const;

    QList<IOverlayWindow *> windows() const { return m_windows; }
    int count() const { return static_cast<int>(m_windows.size()); }
    bool isEmpty() const { return m_windows.isEmpty(); }

    // Snapshot and clear in one step
    QList<IOverlayWindow *> takeAll();

    /**
     * @brief Close every window of a snapshot, best-effort
     *
     * A window throwing from close() is logged and skipped; the remaining
     * windows are still closed.
     * @return Number of windows that failed to close
     */
    static int closeAll(const QList<IOverlayWindow *> &windows);

    // Same best-effort policy for show()
    static int showAll(const QList<IOverlayWindow *> &windows);

private:
    QList<IOverlayWindow *> m_windows;
};

} // namespace SnapOverlay

#endif // WINDOWMEMBERSHIP_H
