#ifndef HIGHLIGHTARBITER_H
#define HIGHLIGHTARBITER_H

#include <optional>

#include "session/ElementDescriptor.h"
#include "session/SessionTypes.h"

namespace SnapOverlay {

/**
 * @brief Decides which window may render the detected-element highlight
 *
 * Rules for setHighlightedElement(element, owner):
 * - no element: the current owner clears (returns true), anyone else is a no-op (false)
 * - same element, same owner: keep showing (true)
 * - same element, different owner: denied (false)
 * - different element: the caller takes over (true)
 *
 * "Same element" is ElementDescriptor::isSameElement(), so sub-tolerance
 * jitter never moves ownership between windows.
 *
 * Invariant: owner() != nullptr exactly when currentElement() has a value.
 * Not thread-safe on its own; CaptureSession calls it under the session mutex.
 */
class HighlightArbiter
{
public:
    // Returns true if the owner should render (or, for an empty element, clear) its highlight
    bool setHighlightedElement(const std::optional<ElementDescriptor> &element, WindowId owner);

    bool isOwner(WindowId window) const;

    // Returns true if the window was the owner and the state was cleared
    bool clearOwner(WindowId window);

    std::optional<ElementDescriptor> currentElement() const { return m_currentElement; }
    WindowId owner() const { return m_owner; }

    void reset();

private:
    std::optional<ElementDescriptor> m_currentElement;
    WindowId m_owner = nullptr;
};

} // namespace SnapOverlay

#endif // HIGHLIGHTARBITER_H
