#include "selection/WindowSelectionController.h"
#include "selection/ElementSelectionStrategy.h"
#include "selection/FreeSelectionStrategy.h"
#include "session/CaptureSession.h"
#include "settings/OverlaySessionSettingsManager.h"

#include <QDebug>

namespace SnapOverlay {

WindowSelectionController::WindowSelectionController(CaptureSession *session,
                                                     IOverlayWindow *window,
                                                     IElementDetector *detector,
                                                     bool elementDetectionEnabled,
                                                     QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_window(window)
    , m_elementDetectionEnabled(elementDetectionEnabled && detector != nullptr)
    , m_freeStrategy(new FreeSelectionStrategy(session, window, this))
    , m_elementStrategy(new ElementSelectionStrategy(session, window, detector, this))
{
    const auto &settings = OverlaySessionSettingsManager::instance();
    m_elementStrategy->setThrottle(settings.loadDetectionIntervalMs(),
                                   settings.loadDetectionMinMovement());


    if (m_session) {
        connect(m_session, &CaptureSession::selectionModeChanged,
                this, &WindowSelectionController::onSelectionModeChanged);
        applyMode(m_session->currentSelectionMode());
    } else {
        applyMode(SelectionMode::Free);
    }
}

bool WindowSelectionController::pointerPressed(const QPoint &screenPos)
{
    if (m_activeMode == SelectionMode::Element) {
        const auto selection = m_elementStrategy->handlePointerPressed();
        if (selection) {
            emit regionFinalized(*selection);
            return true;
        }
        return false;
    }

    return m_freeStrategy->beginDrag(screenPos);
}

void WindowSelectionController::pointerMoved(const QPoint &screenPos)
{
    if (m_activeMode == SelectionMode::Element) {
        m_elementStrategy->handlePointerMoved(screenPos);
    } else {
        m_freeStrategy->updateDrag(screenPos);
    }
}

void WindowSelectionController::pointerReleased(const QPoint &screenPos)
{
    if (m_activeMode != SelectionMode::Free) {
        return;
    }

    const auto selection = m_freeStrategy->finishDrag(screenPos);
    if (selection) {
        emit regionFinalized(*selection);
    }
}

void WindowSelectionController::onSelectionModeChanged(SelectionMode mode)
{
    applyMode(mode);
}

void WindowSelectionController::applyMode(SelectionMode mode)
{
    // Windows without element detection stay in free drag
    if (mode == SelectionMode::Element && !m_elementDetectionEnabled) {
        mode = SelectionMode::Free;
    }
    if (mode == m_activeMode && (mode == SelectionMode::Free ? m_freeStrategy->isActive()
                                                             : m_elementStrategy->isActive())) {
        return;
    }

    if (mode == SelectionMode::Element) {
        m_freeStrategy->deactivate();
        m_elementStrategy->activate();
    } else {
        m_elementStrategy->deactivate();
        m_freeStrategy->activate();
    }

    m_activeMode = mode;
    qDebug() << "WindowSelectionController: Active mode" << selectionModeName(mode);
    emit activeModeChanged(mode);
}

} // namespace SnapOverlay
