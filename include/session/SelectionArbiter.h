#ifndef SELECTIONARBITER_H
#define SELECTIONARBITER_H

#include <QList>
#include <QSet>

#include "session/SessionTypes.h"

namespace SnapOverlay {

class IOverlayWindow;

/**
 * @brief Single-writer selection state shared by all windows of a session
 *
 * Responsible for:
 * - Which window (if any) holds the active selection
 * - The locking ratchet engaged by an editable selection
 *
 * Invariant: activeWindow() != nullptr exactly when hasSelection().
 * Not thread-safe on its own; CaptureSession calls it under the session mutex.
 */
class SelectionArbiter
{
public:
    // Advisory: true when nobody holds a selection or this window already does
    bool canStartSelection(WindowId window) const;

    // Last writer wins. Returns true if the state changed.
    bool setSelection(WindowId window);

    // With a window, clears only if it is the active one. Returns true if the state changed.
    bool clearSelection(WindowId window = nullptr);

    bool hasSelection() const { return m_hasSelection; }
    WindowId activeWindow() const { return m_activeWindow; }

    /**
     * @brief Engage the lock for every member except the source
     *
     * Once engaged the lock is never released until reset().
     * @return Windows that were not locked before and must now be told so
     */
    QList<IOverlayWindow *> engageLock(const IOverlayWindow *source,
                                       const QList<IOverlayWindow *> &members);

    // A window joining after the lock engaged is locked on arrival
    bool lockLateMember(IOverlayWindow *window);

    void forgetWindow(const IOverlayWindow *window);

    bool isLockEngaged() const { return m_lockEngaged; }
    bool isLocked(const IOverlayWindow *window) const;

    void reset();

private:
    bool m_hasSelection = false;
    WindowId m_activeWindow = nullptr;

    bool m_lockEngaged = false;
    QSet<const IOverlayWindow *> m_lockedWindows;
};

} // namespace SnapOverlay

#endif // SELECTIONARBITER_H
