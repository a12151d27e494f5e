#ifndef WINDOWSELECTIONCONTROLLER_H
#define WINDOWSELECTIONCONTROLLER_H

#include <QObject>
#include <QPoint>
#include <QPointer>

#include "session/SessionTypes.h"

namespace SnapOverlay {

class CaptureSession;
class ElementSelectionStrategy;
class FreeSelectionStrategy;
class IElementDetector;
class IOverlayWindow;

/**
 * @brief Routes one window's pointer input to the strategy of the session mode
 *
 * Follows CaptureSession::selectionModeChanged so every window switches
 * between free drag and element pick together. A finished selection is
 * reported through regionFinalized(), which the window forwards as its own
 * regionSelected signal.
 */
class WindowSelectionController : public QObject
{
    Q_OBJECT

public:
    WindowSelectionController(CaptureSession *session, IOverlayWindow *window,
                              IElementDetector *detector, bool elementDetectionEnabled,
                              QObject *parent = nullptr);

    SelectionMode activeMode() const { return m_activeMode; }

    FreeSelectionStrategy *freeStrategy() const { return m_freeStrategy; }
    ElementSelectionStrategy *elementStrategy() const { return m_elementStrategy; }

    bool pointerPressed(const QPoint &screenPos);
    void pointerMoved(const QPoint &screenPos);
    void pointerReleased(const QPoint &screenPos);

signals:
    void regionFinalized(const SnapOverlay::RegionSelection &selection);
    void activeModeChanged(SnapOverlay::SelectionMode mode);

private:
    void onSelectionModeChanged(SelectionMode mode);
    void applyMode(SelectionMode mode);

    QPointer<CaptureSession> m_session;
    IOverlayWindow *m_window;
    bool m_elementDetectionEnabled;

    FreeSelectionStrategy *m_freeStrategy;
    ElementSelectionStrategy *m_elementStrategy;
    SelectionMode m_activeMode = SelectionMode::Free;
};

} // namespace SnapOverlay

#endif // WINDOWSELECTIONCONTROLLER_H
