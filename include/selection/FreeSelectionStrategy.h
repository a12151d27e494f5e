#ifndef FREESELECTIONSTRATEGY_H
#define FREESELECTIONSTRATEGY_H

#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QRect>
#include <optional>

#include "session/SessionTypes.h"

namespace SnapOverlay {

class CaptureSession;
class IOverlayWindow;

/**
 * @brief Drag-to-select for one overlay window
 *
 * Consults the session before a drag starts so that only one window at a
 * time holds a selection. Positions are in screen coordinates.
 */
class FreeSelectionStrategy : public QObject
{
    Q_OBJECT

public:
    // Drags smaller than this in either direction are treated as clicks
    static constexpr int kMinSelectionSize = 5;

    FreeSelectionStrategy(CaptureSession *session, IOverlayWindow *window,
                          QObject *parent = nullptr);

    void activate();
    void deactivate();
    bool isActive() const { return m_active; }

    /**
     * @brief Start a drag at the given position
     * @return false if the window is locked or another window holds the selection
     */
    bool beginDrag(const QPoint &pos);
    void updateDrag(const QPoint &pos);

    /**
     * @brief Finish the drag
     * @return Editable selection, or std::nullopt if the drag was too small
     */
    std::optional<RegionSelection> finishDrag(const QPoint &pos);
    void cancelDrag();

    bool isDragging() const { return m_dragging; }
    QRect currentRect() const { return m_rect; }

signals:
    void selectionChanged(const QRect &rect);
    void selectionFinished(const SnapOverlay::RegionSelection &selection);

private:
    bool sessionUsable() const;
    void releaseSelection();

    QPointer<CaptureSession> m_session;
    IOverlayWindow *m_window;

    bool m_active = true;
    bool m_dragging = false;
    QPoint m_startPos;
    QRect m_rect;
};

} // namespace SnapOverlay

#endif // FREESELECTIONSTRATEGY_H
