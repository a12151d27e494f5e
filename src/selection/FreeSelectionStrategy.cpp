#include "selection/FreeSelectionStrategy.h"
#include "session/CaptureSession.h"
#include "session/IOverlayWindow.h"

#include <QDebug>

namespace SnapOverlay {

FreeSelectionStrategy::FreeSelectionStrategy(CaptureSession *session, IOverlayWindow *window,
                                             QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_window(window)
{
}

void FreeSelectionStrategy::activate()
{
    m_active = true;
}

void FreeSelectionStrategy::deactivate()
{
    if (m_dragging) {
        cancelDrag();
    }
    m_active = false;
}

bool FreeSelectionStrategy::beginDrag(const QPoint &pos)
{
    if (!m_active || !sessionUsable()) {
        return false;
    }

    if (m_window->isSelectionLocked()) {
        qDebug() << "FreeSelectionStrategy: Window is locked, drag denied";
        return false;
    }
    if (!m_session->canStartSelection(m_window)) {
        qDebug() << "FreeSelectionStrategy: Another window holds the selection, drag denied";
        return false;
    }

    m_session->setSelection(m_window);
    m_dragging = true;
    m_startPos = pos;
    m_rect = QRect(pos, QSize(0, 0));
    return true;
}

void FreeSelectionStrategy::updateDrag(const QPoint &pos)
{
    if (!m_dragging) {
        return;
    }

    m_rect = QRect(m_startPos, pos).normalized();
    emit selectionChanged(m_rect);
}

std::optional<RegionSelection> FreeSelectionStrategy::finishDrag(const QPoint &pos)
{
    if (!m_dragging) {
        return std::nullopt;
    }

    m_rect = QRect(m_startPos, pos).normalized();
    m_dragging = false;

    if (m_rect.width() < kMinSelectionSize || m_rect.height() < kMinSelectionSize) {
        qDebug() << "FreeSelectionStrategy: Selection too small, discarded" << m_rect;
        m_rect = QRect();
        releaseSelection();
        emit selectionChanged(m_rect);
        return std::nullopt;
    }

    RegionSelection selection;
    selection.rect = m_rect;
    selection.isEditable = true;

    qDebug() << "FreeSelectionStrategy: Selection finished" << m_rect;
    emit selectionFinished(selection);
    return selection;
}

void FreeSelectionStrategy::cancelDrag()
{
    const bool hadRect = m_dragging || !m_rect.isNull();
    m_dragging = false;
    m_rect = QRect();
    releaseSelection();

    if (hadRect) {
        emit selectionChanged(m_rect);
    }
}

bool FreeSelectionStrategy::sessionUsable() const
{
    return m_session && !m_session->isDisposed() && !m_session->isClosed();
}

void FreeSelectionStrategy::releaseSelection()
{
    if (m_session) {
        m_session->clearSelection(m_window);
    }
}

} // namespace SnapOverlay
