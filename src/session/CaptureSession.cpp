#include "session/CaptureSession.h"
#include "session/IOverlayWindow.h"
#include "session/SessionErrors.h"
#include "session/WindowBuilder.h"

#include <QDebug>
#include <QMutexLocker>
#include <exception>

namespace SnapOverlay {

CaptureSession::CaptureSession(IOverlayWindowFactory *windowFactory, QObject *parent)
    : QObject(parent)
    , m_windowFactory(windowFactory)
{
    qRegisterMetaType<SelectionMode>("SnapOverlay::SelectionMode");
    qRegisterMetaType<RegionSelection>("SnapOverlay::RegionSelection");

    qDebug() << "CaptureSession: Created";
}

CaptureSession::~CaptureSession()
{
    dispose();
}

// ============================================================================
// Window membership
// ============================================================================

WindowBuilder CaptureSession::createWindowBuilder()
{
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("createWindowBuilder");
    }
    return WindowBuilder(this, m_windowFactory);
}

void CaptureSession::addWindow(IOverlayWindow *window)
{
    if (!window) {
        qWarning() << "CaptureSession: Ignoring null window";
        return;
    }

    bool lockOnArrival = false;
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("addWindow");

        if (!acceptsChangesLocked()) {
            qWarning() << "CaptureSession: Session is closed, window not added";
            return;
        }
        if (m_membership.contains(window)) {
            qDebug() << "CaptureSession: Window already registered, ignoring";
            return;
        }

        m_membership.addWindow(window);
        lockOnArrival = m_selection.lockLateMember(window);
        count = m_membership.count();
    }

    connectWindow(window);
    if (lockOnArrival) {
        applyLocks({window});
    }

    qDebug() << "CaptureSession: Window added, total:" << count;
}

bool CaptureSession::removeWindow(IOverlayWindow *window)
{
    bool selectionCleared = false;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("removeWindow");

        if (!m_membership.removeWindow(window)) {
            return false;
        }
        selectionCleared = m_selection.clearSelection(window);
        m_selection.forgetWindow(window);
        m_highlight.clearOwner(window);
    }

    disconnectWindow(window);
    qDebug() << "CaptureSession: Window removed";

    if (selectionCleared) {
        emit selectionStateChanged(false);
    }
    return true;
}

QList<IOverlayWindow *> CaptureSession::windows() const
{
    QMutexLocker locker(&m_mutex);
    return m_membership.windows();
}

int CaptureSession::windowCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_membership.count();
}

void CaptureSession::showAll()
{
    QList<IOverlayWindow *> windowsToShow;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("showAll");
        windowsToShow = m_membership.windows();
    }

    const int failures = WindowMembership::showAll(windowsToShow);
    qDebug() << "CaptureSession: Showed" << (windowsToShow.size() - failures) << "of"
             << windowsToShow.size() << "window(s)";
}

// ============================================================================
// Selection arbitration
// ============================================================================

bool CaptureSession::canStartSelection(WindowId window) const
{
    QMutexLocker locker(&m_mutex);
    throwIfDisposedLocked("canStartSelection");
    return m_selection.canStartSelection(window);
}

void CaptureSession::setSelection(WindowId window)
{
    if (!window) {
        qWarning() << "CaptureSession: setSelection called without a window";
        return;
    }

    bool changed = false;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("setSelection");
        if (!acceptsChangesLocked()) {
            return;
        }
        changed = m_selection.setSelection(window);
    }

    if (changed) {
        qDebug() << "CaptureSession: Selection set for window";
        emit selectionStateChanged(true);
    }
}

void CaptureSession::clearSelection(WindowId window)
{
    bool changed = false;
    {
        QMutexLocker locker(&m_mutex);
        if (m_disposed) {
            return;
        }
        changed = m_selection.clearSelection(window);
    }

    if (changed) {
        qDebug() << "CaptureSession: Selection cleared";
        emit selectionStateChanged(false);
    }
}

bool CaptureSession::hasSelection() const
{
    QMutexLocker locker(&m_mutex);
    return m_selection.hasSelection();
}

WindowId CaptureSession::activeSelectionWindow() const
{
    QMutexLocker locker(&m_mutex);
    return m_selection.activeWindow();
}

bool CaptureSession::isSelectionLocked(const IOverlayWindow *window) const
{
    QMutexLocker locker(&m_mutex);
    return m_selection.isLocked(window);
}

void CaptureSession::notifyRegionSelected(IOverlayWindow *source, const RegionSelection &selection)
{
    QList<IOverlayWindow *> windowsToLock;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("notifyRegionSelected");
        if (!acceptsChangesLocked()) {
            qDebug() << "CaptureSession: Ignoring region selected after close";
            return;
        }
        if (selection.isEditable) {
            windowsToLock = m_selection.engageLock(source, m_membership.windows());
        }
    }

    if (!windowsToLock.isEmpty()) {
        qDebug() << "CaptureSession: Editable selection, locking" << windowsToLock.size()
                 << "other window(s)";
        applyLocks(windowsToLock);
    }

    emit regionSelected(source, selection);
}

// ============================================================================
// Element highlight arbitration
// ============================================================================

bool CaptureSession::setHighlightedElement(const std::optional<ElementDescriptor> &element,
                                           WindowId owner)
{
    QMutexLocker locker(&m_mutex);
    throwIfDisposedLocked("setHighlightedElement");
    if (!acceptsChangesLocked()) {
        return false;
    }
    return m_highlight.setHighlightedElement(element, owner);
}

bool CaptureSession::isHighlightOwner(WindowId window) const
{
    QMutexLocker locker(&m_mutex);
    return m_highlight.isOwner(window);
}

std::optional<ElementDescriptor> CaptureSession::currentHighlightedElement() const
{
    QMutexLocker locker(&m_mutex);
    return m_highlight.currentElement();
}

WindowId CaptureSession::highlightOwner() const
{
    QMutexLocker locker(&m_mutex);
    return m_highlight.owner();
}

void CaptureSession::clearHighlightOwner(WindowId window)
{
    QMutexLocker locker(&m_mutex);
    if (m_disposed) {
        return;
    }
    if (m_highlight.clearOwner(window)) {
        qDebug() << "CaptureSession: Cleared highlight owner";
    }
}

// ============================================================================
// Selection mode
// ============================================================================

SelectionMode CaptureSession::currentSelectionMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_mode.mode();
}

void CaptureSession::setCurrentSelectionMode(SelectionMode mode)
{
    bool changed = false;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("setCurrentSelectionMode");
        if (!acceptsChangesLocked()) {
            return;
        }
        changed = m_mode.setMode(mode);
    }

    if (changed) {
        qDebug() << "CaptureSession: Selection mode changed to" << selectionModeName(mode);
        emit selectionModeChanged(mode);
    }
}

void CaptureSession::handleModifierKey(bool pressed)
{
    std::optional<SelectionMode> newMode;
    {
        QMutexLocker locker(&m_mutex);
        throwIfDisposedLocked("handleModifierKey");
        if (!acceptsChangesLocked()) {
            return;
        }
        newMode = pressed ? m_mode.modifierPressed() : m_mode.modifierReleased();
    }

    if (newMode) {
        qDebug() << "CaptureSession: Modifier" << (pressed ? "pressed" : "released")
                 << "- selection mode" << selectionModeName(*newMode);
        emit selectionModeChanged(*newMode);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void CaptureSession::close()
{
    QList<IOverlayWindow *> windowsToClose;
    {
        QMutexLocker locker(&m_mutex);
        if (m_closing || m_closed) {
            return;
        }
        m_closing = true;

        windowsToClose = m_membership.takeAll();
        m_selection.reset();
        m_highlight.reset();
        m_mode.releaseModifier();
    }

    qDebug() << "CaptureSession: Closing session with" << windowsToClose.size() << "window(s)";

    // Windows closing themselves must not re-enter through closing()
    for (IOverlayWindow *window : windowsToClose) {
        disconnectWindow(window);
    }

    const int failures = WindowMembership::closeAll(windowsToClose);
    if (failures > 0) {
        qWarning() << "CaptureSession:" << failures << "window(s) failed to close";
    }

    {
        QMutexLocker locker(&m_mutex);
        m_closing = false;
        m_closed = true;
    }

    qDebug() << "CaptureSession: Session closed, emitting closed";
    emit closed();
}

void CaptureSession::dispose()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_disposed || m_disposing) {
            return;
        }
        m_disposing = true;
    }

    // Drop subscribers before teardown; closed() stays connected for the owner
    QObject::disconnect(this, &CaptureSession::regionSelected, nullptr, nullptr);
    QObject::disconnect(this, &CaptureSession::cancelled, nullptr, nullptr);
    QObject::disconnect(this, &CaptureSession::selectionStateChanged, nullptr, nullptr);
    QObject::disconnect(this, &CaptureSession::selectionModeChanged, nullptr, nullptr);

    close();

    {
        QMutexLocker locker(&m_mutex);
        m_disposed = true;
        m_disposing = false;
        m_selection.reset();
        m_highlight.reset();
        m_mode.reset();
    }

    qDebug() << "CaptureSession: Disposed";
}

bool CaptureSession::isClosed() const
{
    QMutexLocker locker(&m_mutex);
    return m_closed;
}

bool CaptureSession::isDisposed() const
{
    QMutexLocker locker(&m_mutex);
    return m_disposed;
}

// ============================================================================
// Private
// ============================================================================

void CaptureSession::connectWindow(IOverlayWindow *window)
{
    connect(window, &IOverlayWindow::regionSelected, this,
            [this, window](const RegionSelection &selection) {
                notifyRegionSelected(window, selection);
            });
    connect(window, &IOverlayWindow::cancelled, this,
            [this, window](const QString &reason) {
                onWindowCancelled(window, reason);
            });
    connect(window, &IOverlayWindow::closing, this, [this]() {
        qDebug() << "CaptureSession: Window closing detected, closing entire session";
        close();
    });
    connect(window, &QObject::destroyed, this, [this, window]() {
        onWindowDestroyed(window);
    });
}

void CaptureSession::disconnectWindow(IOverlayWindow *window)
{
    QObject::disconnect(window, nullptr, this, nullptr);
}

void CaptureSession::onWindowCancelled(IOverlayWindow *window, const QString &reason)
{
    qDebug() << "CaptureSession: Window cancelled:" << reason;
    emit cancelled(window, reason);
}

void CaptureSession::onWindowDestroyed(IOverlayWindow *window)
{
    // The window object is already gone; only its address is used here
    bool selectionCleared = false;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_membership.removeWindow(window)) {
            return;
        }
        selectionCleared = m_selection.clearSelection(window);
        m_selection.forgetWindow(window);
        m_highlight.clearOwner(window);
    }

    qWarning() << "CaptureSession: Window destroyed while still registered";
    if (selectionCleared) {
        emit selectionStateChanged(false);
    }
}

void CaptureSession::applyLocks(const QList<IOverlayWindow *> &windows)
{
    for (IOverlayWindow *window : windows) {
        try {
            window->setSelectionLocked(true);
        } catch (const std::exception &e) {
            qWarning() << "CaptureSession: Failed to lock window:" << e.what();
        }
    }
}

void CaptureSession::throwIfDisposedLocked(const char *operation) const
{
    if (m_disposed) {
        throw SessionDisposedError(operation);
    }
}

} // namespace SnapOverlay
