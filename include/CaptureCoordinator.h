#ifndef CAPTURECOORDINATOR_H
#define CAPTURECOORDINATOR_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <optional>

#include "session/SessionTypes.h"

namespace SnapOverlay {

class CaptureSession;
class IOverlayWindow;
class IOverlayWindowFactory;

/**
 * @brief Runs one capture session at a time across the given screens
 *
 * An editable selection moves the capture into the annotation phase and
 * keeps the overlays open until confirmCapture() or cancelCapture(). A
 * non-editable selection completes the capture immediately.
 */
class CaptureCoordinator : public QObject
{
    Q_OBJECT

public:
    explicit CaptureCoordinator(IOverlayWindowFactory *windowFactory, QObject *parent = nullptr);
    ~CaptureCoordinator() override;

    bool isActive() const;
    CaptureSession *session() const { return m_session; }
    std::optional<RegionSelection> pendingSelection() const { return m_pendingSelection; }

public slots:
    bool startCapture(const QList<SnapOverlay::ScreenInfo> &screens);
    bool confirmCapture();
    void cancelCapture();

signals:
    void captureStarted();
    void annotationStarted(const SnapOverlay::RegionSelection &selection);
    void captureCompleted(const SnapOverlay::RegionSelection &selection);
    void captureCancelled();

private slots:
    void onRegionSelected(SnapOverlay::IOverlayWindow *source,
                          const SnapOverlay::RegionSelection &selection);
    void onSelectionCancelled(SnapOverlay::IOverlayWindow *source, const QString &reason);
    void onSessionClosed();

private:
    void buildWindows(const QList<ScreenInfo> &screens);
    void teardownSession();

    IOverlayWindowFactory *m_windowFactory;
    QPointer<CaptureSession> m_session;
    std::optional<RegionSelection> m_pendingSelection;
    bool m_tearingDown = false;
};

} // namespace SnapOverlay

#endif // CAPTURECOORDINATOR_H
