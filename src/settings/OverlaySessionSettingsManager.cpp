#include "settings/OverlaySessionSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

namespace SnapOverlay {

namespace {

int clampDetectionIntervalMs(int intervalMs)
{
    return qBound(0, intervalMs, 500);
}

int clampDetectionMinMovement(int pixels)
{
    return qBound(0, pixels, 100);
}

Qt::Key sanitizeModifier(int key)
{
    if (!OverlaySessionSettingsManager::isSupportedModifier(key)) {
        return OverlaySessionSettingsManager::kDefaultElementPickModifier;
    }
    return static_cast<Qt::Key>(key);
}

OverlaySessionSettingsManager::WindowLayout clampWindowLayout(int rawLayout)
{
    const int bounded = qBound(0, rawLayout, 1);
    return static_cast<OverlaySessionSettingsManager::WindowLayout>(bounded);
}

} // namespace

OverlaySessionSettingsManager& OverlaySessionSettingsManager::instance()
{
    static OverlaySessionSettingsManager instance;
    return instance;
}

bool OverlaySessionSettingsManager::isSupportedModifier(int key)
{
    return key == Qt::Key_Control || key == Qt::Key_Shift ||
           key == Qt::Key_Alt || key == Qt::Key_Meta;
}

bool OverlaySessionSettingsManager::isElementDetectionEnabled() const
{
    auto settings = getSettings();
    return settings.value(kSettingsKeyElementDetectionEnabled, kDefaultElementDetectionEnabled).toBool();
}

void OverlaySessionSettingsManager::setElementDetectionEnabled(bool enabled)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyElementDetectionEnabled, enabled);
}

Qt::Key OverlaySessionSettingsManager::loadElementPickModifier() const
{
    auto settings = getSettings();
    const int stored = settings.value(kSettingsKeyElementPickModifier,
                                      static_cast<int>(kDefaultElementPickModifier)).toInt();
    return sanitizeModifier(stored);
}

void OverlaySessionSettingsManager::saveElementPickModifier(Qt::Key key)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyElementPickModifier, static_cast<int>(sanitizeModifier(key)));
}

int OverlaySessionSettingsManager::loadDetectionIntervalMs() const
{
    auto settings = getSettings();
    const int stored = settings.value(kSettingsKeyDetectionIntervalMs, kDefaultDetectionIntervalMs).toInt();
    return clampDetectionIntervalMs(stored);
}

void OverlaySessionSettingsManager::saveDetectionIntervalMs(int intervalMs)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyDetectionIntervalMs, clampDetectionIntervalMs(intervalMs));
}

int OverlaySessionSettingsManager::loadDetectionMinMovement() const
{
    auto settings = getSettings();
    const int stored = settings.value(kSettingsKeyDetectionMinMovement, kDefaultDetectionMinMovement).toInt();
    return clampDetectionMinMovement(stored);
}

void OverlaySessionSettingsManager::saveDetectionMinMovement(int pixels)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyDetectionMinMovement, clampDetectionMinMovement(pixels));
}

OverlaySessionSettingsManager::WindowLayout OverlaySessionSettingsManager::loadWindowLayout() const
{
    auto settings = getSettings();
    const int stored = settings.value(kSettingsKeyWindowLayout, static_cast<int>(kDefaultWindowLayout)).toInt();
    return clampWindowLayout(stored);
}

void OverlaySessionSettingsManager::saveWindowLayout(WindowLayout layout)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyWindowLayout, static_cast<int>(layout));
}

} // namespace SnapOverlay
