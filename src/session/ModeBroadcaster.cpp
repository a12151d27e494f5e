#include "session/ModeBroadcaster.h"

namespace SnapOverlay {

bool ModeBroadcaster::setMode(SelectionMode mode)
{
    if (m_mode == mode) {
        return false;
    }
    m_mode = mode;
    return true;
}

std::optional<SelectionMode> ModeBroadcaster::modifierPressed()
{
    if (m_modifierDown) {
        return std::nullopt;
    }
    m_modifierDown = true;

    if (!setMode(SelectionMode::Element)) {
        return std::nullopt;
    }
    return m_mode;
}

std::optional<SelectionMode> ModeBroadcaster::modifierReleased()
{
    if (!m_modifierDown) {
        return std::nullopt;
    }
    m_modifierDown = false;

    if (!setMode(SelectionMode::Free)) {
        return std::nullopt;
    }
    return m_mode;
}

void ModeBroadcaster::reset()
{
    m_mode = SelectionMode::Free;
    m_modifierDown = false;
}

} // namespace SnapOverlay
