#pragma once

#include <QSettings>

#ifndef SNAPOVERLAY_APP_NAME
#define SNAPOVERLAY_APP_NAME "SnapOverlay"
#endif

namespace SnapOverlay {

inline constexpr const char* kOrganizationName = "SnapOverlay";
inline constexpr const char* kApplicationName = SNAPOVERLAY_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace SnapOverlay
