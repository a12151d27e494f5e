#include "selection/ElementSelectionStrategy.h"
#include "detection/IElementDetector.h"
#include "session/CaptureSession.h"
#include "session/IOverlayWindow.h"

#include <QDebug>
#include <QtMath>
#include <exception>

namespace SnapOverlay {

ElementSelectionStrategy::ElementSelectionStrategy(CaptureSession *session,
                                                   IOverlayWindow *window,
                                                   IElementDetector *detector,
                                                   QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_window(window)
    , m_detector(detector)
{
}

void ElementSelectionStrategy::setThrottle(int intervalMs, int minMovement)
{
    m_intervalMs = qMax(0, intervalMs);
    m_minMovement = qMax(0, minMovement);
}

void ElementSelectionStrategy::activate()
{
    m_active = true;
    m_detectionTimer.invalidate();
    m_lastDetectionPos.reset();
}

void ElementSelectionStrategy::deactivate()
{
    if (!m_active) {
        return;
    }
    m_active = false;

    if (m_session) {
        m_session->clearHighlightOwner(m_window);
    }
    dropHighlight();
}

void ElementSelectionStrategy::handlePointerMoved(const QPoint &screenPos)
{
    if (!m_active || !sessionUsable() || m_window->isSelectionLocked()) {
        return;
    }
    if (!shouldDetect(screenPos)) {
        return;
    }

    m_detectionTimer.restart();
    m_lastDetectionPos = screenPos;

    const std::optional<ElementDescriptor> element = detect(screenPos);
    const bool granted = m_session->setHighlightedElement(element, m_window);

    if (!element || !granted) {
        dropHighlight();
        return;
    }

    // Tolerant match: jittering bounds of the same element keep the old highlight
    if (m_element && m_element->isSameElement(*element)) {
        return;
    }

    m_element = element;
    emit highlightChanged(element->bounds);
}

std::optional<RegionSelection> ElementSelectionStrategy::handlePointerPressed()
{
    if (!m_active || !sessionUsable() || !m_element) {
        return std::nullopt;
    }
    if (!m_session->isHighlightOwner(m_window)) {
        qDebug() << "ElementSelectionStrategy: Highlight owned by another window, pick ignored";
        dropHighlight();
        return std::nullopt;
    }

    m_session->setSelection(m_window);

    RegionSelection selection;
    selection.rect = m_element->bounds;
    selection.isEditable = true;
    selection.element = m_element;

    qDebug() << "ElementSelectionStrategy: Element picked" << *m_element;
    emit elementPicked(selection);
    return selection;
}

bool ElementSelectionStrategy::shouldDetect(const QPoint &screenPos) const
{
    if (m_detectionTimer.isValid() && m_detectionTimer.elapsed() < m_intervalMs) {
        return false;
    }
    if (!m_lastDetectionPos) {
        return true;
    }

    const QPoint delta = screenPos - *m_lastDetectionPos;
    const qreal distance = qSqrt(qreal(delta.x()) * delta.x() + qreal(delta.y()) * delta.y());
    return distance >= m_minMovement;
}

std::optional<ElementDescriptor> ElementSelectionStrategy::detect(const QPoint &screenPos)
{
    if (!m_detector) {
        return std::nullopt;
    }

    try {
        return m_detector->detectElementAt(screenPos, m_window->nativeHandle());
    } catch (const std::exception &e) {
        qWarning() << "ElementSelectionStrategy: Element detection failed at" << screenPos
                   << ":" << e.what();
        return std::nullopt;
    }
}

void ElementSelectionStrategy::dropHighlight()
{
    if (!m_element) {
        return;
    }
    m_element.reset();
    emit highlightChanged(QRect());
}

bool ElementSelectionStrategy::sessionUsable() const
{
    return m_session && !m_session->isDisposed() && !m_session->isClosed();
}

} // namespace SnapOverlay
