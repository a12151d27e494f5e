#include "session/HighlightArbiter.h"

#include <QDebug>

namespace SnapOverlay {

bool HighlightArbiter::setHighlightedElement(const std::optional<ElementDescriptor> &element,
                                             WindowId owner)
{
    if (!owner) {
        return false;
    }

    if (!element) {
        return clearOwner(owner);
    }

    if (m_currentElement && m_currentElement->isSameElement(*element)) {
        // Owner keeps tracking; anyone else is blocked from flickering onto it
        return m_owner == owner;
    }

    if (m_owner && m_owner != owner) {
        qDebug() << "HighlightArbiter: New element from another window, taking over highlight";
    }

    m_currentElement = element;
    m_owner = owner;
    return true;
}

bool HighlightArbiter::isOwner(WindowId window) const
{
    return window && m_owner == window;
}

bool HighlightArbiter::clearOwner(WindowId window)
{
    if (!isOwner(window)) {
        return false;
    }

    m_currentElement.reset();
    m_owner = nullptr;
    return true;
}

void HighlightArbiter::reset()
{
    m_currentElement.reset();
    m_owner = nullptr;
}

} // namespace SnapOverlay
