#ifndef CAPTURESESSION_H
#define CAPTURESESSION_H

#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <optional>

#include "session/ElementDescriptor.h"
#include "session/HighlightArbiter.h"
#include "session/ModeBroadcaster.h"
#include "session/SelectionArbiter.h"
#include "session/SessionTypes.h"
#include "session/WindowBuilder.h"
#include "session/WindowMembership.h"

namespace SnapOverlay {

class IOverlayWindow;
class IOverlayWindowFactory;

/**
 * @brief Coordinator for one region-capture operation across all monitors
 *
 * Owns window membership, selection and highlight arbitration and the
 * session-wide selection mode. All state sits behind one mutex; signals are
 * emitted and window methods are called only after the mutex is released,
 * so any handler may call back into the session, close() and dispose()
 * included.
 *
 * Usage:
 * @code
 * CaptureSession session(&windowFactory);
 * connect(&session, &CaptureSession::regionSelected, this, &Host::onRegionSelected);
 * for (const ScreenInfo &screen : screens) {
 *     session.createWindowBuilder()
 *         .withBounds(screen.geometry)
 *         .withScreens({screen})
 *         .enableElementDetection()
 *         .build();
 * }
 * session.showAll();
 * @endcode
 *
 * Mutating calls after dispose() throw SessionDisposedError. close(),
 * dispose(), clearSelection() and clearHighlightOwner() are no-ops instead.
 */
class CaptureSession : public QObject
{
    Q_OBJECT

public:
    explicit CaptureSession(IOverlayWindowFactory *windowFactory = nullptr,
                            QObject *parent = nullptr);
    ~CaptureSession() override;

    // ========================================================================
    // Window membership
    // ========================================================================

    WindowBuilder createWindowBuilder();

    /**
     * @brief Register a window and route its signals into the session
     *
     * A window already registered, or added after close(), is ignored.
     * If an editable selection already locked the other windows, the new
     * window is locked immediately.
     */
    void addWindow(IOverlayWindow *window);

    // Unregister without closing. Drops any selection or highlight the window held.
    bool removeWindow(IOverlayWindow *window);

    QList<IOverlayWindow *> windows() const;
    int windowCount() const;
    void showAll();

    // ========================================================================
    // Selection arbitration
    // ========================================================================

    // Advisory; setSelection() does not re-check it
    bool canStartSelection(WindowId window) const;
    void setSelection(WindowId window);
    void clearSelection(WindowId window = nullptr);

    bool hasSelection() const;
    WindowId activeSelectionWindow() const;
    bool isSelectionLocked(const IOverlayWindow *window) const;

    /**
     * @brief Entry point for a window's finished selection
     *
     * An editable selection locks every other registered window. The
     * selection is then forwarded through regionSelected().
     */
    void notifyRegionSelected(IOverlayWindow *source, const RegionSelection &selection);

    // ========================================================================
    // Element highlight arbitration
    // ========================================================================

    bool setHighlightedElement(const std::optional<ElementDescriptor> &element, WindowId owner);
    bool isHighlightOwner(WindowId window) const;
    std::optional<ElementDescriptor> currentHighlightedElement() const;
    WindowId highlightOwner() const;
    void clearHighlightOwner(WindowId window);

    // ========================================================================
    // Selection mode
    // ========================================================================

    SelectionMode currentSelectionMode() const;
    void setCurrentSelectionMode(SelectionMode mode);

    // Modifier key edge from any window; press selects Element mode, release returns to Free
    void handleModifierKey(bool pressed);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    void close();
    void dispose();

    bool isClosed() const;
    bool isDisposed() const;

signals:
    void regionSelected(SnapOverlay::IOverlayWindow *source,
                        const SnapOverlay::RegionSelection &selection);
    void cancelled(SnapOverlay::IOverlayWindow *source, const QString &reason);
    void selectionStateChanged(bool hasSelection);
    void selectionModeChanged(SnapOverlay::SelectionMode mode);
    void closed();

private:
    void connectWindow(IOverlayWindow *window);
    void disconnectWindow(IOverlayWindow *window);
    void onWindowCancelled(IOverlayWindow *window, const QString &reason);
    void onWindowDestroyed(IOverlayWindow *window);
    void applyLocks(const QList<IOverlayWindow *> &windows);

    // Caller must hold m_mutex
    void throwIfDisposedLocked(const char *operation) const;
    bool acceptsChangesLocked() const { return !m_closing && !m_closed; }

    IOverlayWindowFactory *m_windowFactory;

    mutable QMutex m_mutex;
    WindowMembership m_membership;
    SelectionArbiter m_selection;
    HighlightArbiter m_highlight;
    ModeBroadcaster m_mode;

    bool m_closing = false;
    bool m_closed = false;
    bool m_disposing = false;
    bool m_disposed = false;
};

} // namespace SnapOverlay

#endif // CAPTURESESSION_H
