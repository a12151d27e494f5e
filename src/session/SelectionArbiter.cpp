#include "session/SelectionArbiter.h"
#include "session/IOverlayWindow.h"

namespace SnapOverlay {

bool SelectionArbiter::canStartSelection(WindowId window) const
{
    return !m_hasSelection || m_activeWindow == window;
}

bool SelectionArbiter::setSelection(WindowId window)
{
    if (!window) {
        return false;
    }
    if (m_hasSelection && m_activeWindow == window) {
        return false;
    }

    m_hasSelection = true;
    m_activeWindow = window;
    return true;
}

bool SelectionArbiter::clearSelection(WindowId window)
{
    if (window && m_activeWindow != window) {
        return false;
    }
    if (!m_hasSelection) {
        return false;
    }

    m_hasSelection = false;
    m_activeWindow = nullptr;
    return true;
}

// ============================================================================
// Locking protocol
// ============================================================================

QList<IOverlayWindow *> SelectionArbiter::engageLock(const IOverlayWindow *source,
                                                     const QList<IOverlayWindow *> &members)
{
    m_lockEngaged = true;

    QList<IOverlayWindow *> newlyLocked;
    for (IOverlayWindow *window : members) {
        if (window == source || m_lockedWindows.contains(window)) {
            continue;
        }
        m_lockedWindows.insert(window);
        newlyLocked.append(window);
    }
    return newlyLocked;
}

bool SelectionArbiter::lockLateMember(IOverlayWindow *window)
{
    if (!m_lockEngaged || m_lockedWindows.contains(window)) {
        return false;
    }
    m_lockedWindows.insert(window);
    return true;
}

void SelectionArbiter::forgetWindow(const IOverlayWindow *window)
{
    m_lockedWindows.remove(window);
}

bool SelectionArbiter::isLocked(const IOverlayWindow *window) const
{
    return m_lockedWindows.contains(window);
}

void SelectionArbiter::reset()
{
    m_hasSelection = false;
    m_activeWindow = nullptr;
    m_lockEngaged = false;
    m_lockedWindows.clear();
}

} // namespace SnapOverlay
