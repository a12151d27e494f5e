#ifndef MODEBROADCASTER_H
#define MODEBROADCASTER_H

#include <optional>

#include "session/SessionTypes.h"

namespace SnapOverlay {

/**
 * @brief Session-wide selection mode and modifier key edge tracking
 *
 * The modifier may be pressed on one window and released on another; only
 * the up->down and down->up edges change the mode, so auto-repeated key
 * presses never re-broadcast. CaptureSession emits selectionModeChanged()
 * for every value returned here.
 */
class ModeBroadcaster
{
public:
    SelectionMode mode() const { return m_mode; }

    // Returns true if the mode changed
    bool setMode(SelectionMode mode);

    // Return the new mode when the edge changed it, std::nullopt otherwise
    std::optional<SelectionMode> modifierPressed();
    std::optional<SelectionMode> modifierReleased();

    bool isModifierDown() const { return m_modifierDown; }

    // Forget a held modifier without changing the mode
    void releaseModifier() { m_modifierDown = false; }

    void reset();

private:
    SelectionMode m_mode = SelectionMode::Free;
    bool m_modifierDown = false;
};

} // namespace SnapOverlay

#endif // MODEBROADCASTER_H
