#include "session/ModifierKeyFilter.h"
#include "session/CaptureSession.h"

#include <QDebug>
#include <QEvent>
#include <QKeyEvent>
#include <exception>

namespace SnapOverlay {

ModifierKeyFilter::ModifierKeyFilter(CaptureSession *session, Qt::Key key, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_key(key)
{
}

bool ModifierKeyFilter::eventFilter(QObject *watched, QEvent *event)
{
    switch (event->type()) {
    case QEvent::KeyPress:
    case QEvent::KeyRelease: {
        auto *keyEvent = static_cast<QKeyEvent *>(event);
        if (keyEvent->key() != m_key || keyEvent->isAutoRepeat()) {
            break;
        }
        const bool pressed = event->type() == QEvent::KeyPress;
        if (pressed != m_keyDown) {
            m_keyDown = pressed;
            forward(pressed);
        }
        break;
    }
    case QEvent::WindowDeactivate:
        if (m_keyDown) {
            m_keyDown = false;
            forward(false);
        }
        break;
    default:
        break;
    }

    return QObject::eventFilter(watched, event);
}

void ModifierKeyFilter::forward(bool pressed)
{
    if (!m_session || m_session->isDisposed() || m_session->isClosed()) {
        return;
    }

    try {
        m_session->handleModifierKey(pressed);
    } catch (const std::exception &e) {
        // Session disposed between the check and the call
        qWarning() << "ModifierKeyFilter: Modifier key ignored:" << e.what();
    }
}

} // namespace SnapOverlay
