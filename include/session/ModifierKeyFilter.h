#ifndef MODIFIERKEYFILTER_H
#define MODIFIERKEYFILTER_H

#include <QObject>
#include <QPointer>
#include <Qt>

namespace SnapOverlay {

class CaptureSession;

/**
 * @brief Event filter turning a held modifier key into session mode changes
 *
 * Installed on each overlay window's event target. Key press and release of
 * the watched key are forwarded to CaptureSession::handleModifierKey();
 * auto-repeat is ignored. Losing activation while the key is held counts as
 * a release, since the key-up would go to another window.
 *
 * Events are never consumed.
 */
class ModifierKeyFilter : public QObject
{
    Q_OBJECT

public:
    explicit ModifierKeyFilter(CaptureSession *session, Qt::Key key = Qt::Key_Control,
                               QObject *parent = nullptr);

    Qt::Key key() const { return m_key; }
    bool isKeyDown() const { return m_keyDown; }

    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void forward(bool pressed);

    QPointer<CaptureSession> m_session;
    Qt::Key m_key;
    bool m_keyDown = false;
};

} // namespace SnapOverlay

#endif // MODIFIERKEYFILTER_H
