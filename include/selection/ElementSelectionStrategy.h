#ifndef ELEMENTSELECTIONSTRATEGY_H
#define ELEMENTSELECTIONSTRATEGY_H

#include <QElapsedTimer>
#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QRect>
#include <optional>

#include "session/ElementDescriptor.h"
#include "session/SessionTypes.h"

namespace SnapOverlay {

class CaptureSession;
class IElementDetector;
class IOverlayWindow;

/**
 * @brief Hover-and-click element picking for one overlay window
 *
 * Pointer moves are throttled by time and distance before the detector is
 * queried. The detected element is offered to the session's highlight
 * arbitration; the window only draws a highlight the session granted.
 *
 * highlightChanged() carries the bounds to draw, or a null rect when this
 * window must not draw anything.
 */
class ElementSelectionStrategy : public QObject
{
    Q_OBJECT

public:
    static constexpr int kDefaultIntervalMs = 30;
    static constexpr int kDefaultMinMovement = 8;

    ElementSelectionStrategy(CaptureSession *session, IOverlayWindow *window,
                             IElementDetector *detector, QObject *parent = nullptr);

    void setThrottle(int intervalMs, int minMovement);
    int intervalMs() const { return m_intervalMs; }
    int minMovement() const { return m_minMovement; }

    void activate();
    void deactivate();
    bool isActive() const { return m_active; }

    void handlePointerMoved(const QPoint &screenPos);

    /**
     * @brief Pick the highlighted element
     * @return Editable selection of the element bounds, or std::nullopt if
     *         this window does not own the highlight
     */
    std::optional<RegionSelection> handlePointerPressed();

    std::optional<ElementDescriptor> highlightedElement() const { return m_element; }

signals:
    void highlightChanged(const QRect &bounds);
    void elementPicked(const SnapOverlay::RegionSelection &selection);

private:
    bool shouldDetect(const QPoint &screenPos) const;
    std::optional<ElementDescriptor> detect(const QPoint &screenPos);
    void dropHighlight();
    bool sessionUsable() const;

    QPointer<CaptureSession> m_session;
    IOverlayWindow *m_window;
    IElementDetector *m_detector;

    int m_intervalMs = kDefaultIntervalMs;
    int m_minMovement = kDefaultMinMovement;
    QElapsedTimer m_detectionTimer;
    std::optional<QPoint> m_lastDetectionPos;

    bool m_active = false;
    std::optional<ElementDescriptor> m_element;
};

} // namespace SnapOverlay

#endif // ELEMENTSELECTIONSTRATEGY_H
