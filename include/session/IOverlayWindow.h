#ifndef IOVERLAYWINDOW_H
#define IOVERLAYWINDOW_H

#include <QList>
#include <QObject>
#include <QRect>
#include <QString>

#include "session/SessionTypes.h"

namespace SnapOverlay {

/**
 * @brief Abstract interface for one transparent overlay window of a capture session
 *
 * The session only arbitrates; it never draws. Implementations own their
 * widget (a QWidget cannot also derive from this QObject) and expose it
 * through eventTarget() so key filters can be installed on it.
 *
 * Windows are owned by the host that created them. The session keeps them
 * by pointer and only calls close() on teardown.
 */
class IOverlayWindow : public QObject
{
    Q_OBJECT

public:
    explicit IOverlayWindow(QObject *parent = nullptr) : QObject(parent) {}
    ~IOverlayWindow() override = default;

    virtual void show() = 0;
    virtual void close() = 0;

    /**
     * @brief Enable or disable starting a new selection in this window
     *
     * Called by the session when another window produced an editable selection.
     */
    virtual void setSelectionLocked(bool locked) = 0;
    virtual bool isSelectionLocked() const = 0;

    virtual void setGeometry(const QRect &bounds) = 0;
    virtual void setScreens(const QList<ScreenInfo> &screens) = 0;
    virtual void setElementDetectionEnabled(bool enabled) = 0;

    // Native handle, passed to element detectors so they can skip the overlay itself
    virtual quintptr nativeHandle() const { return 0; }

    // Object receiving keyboard events for this window
    virtual QObject *eventTarget() { return this; }

signals:
    void regionSelected(const SnapOverlay::RegionSelection &selection);
    void cancelled(const QString &reason);

    // Window is being closed by the user or the OS (not by the session)
    void closing();
};

/**
 * @brief Creates overlay windows for WindowBuilder
 *
 * Ownership of the returned window stays with the factory / host application.
 */
class IOverlayWindowFactory
{
public:
    virtual ~IOverlayWindowFactory() = default;

    // Returns nullptr if the window could not be created
    virtual IOverlayWindow *createWindow() = 0;
};

} // namespace SnapOverlay

#endif // IOVERLAYWINDOW_H
