#ifndef OVERLAYSESSIONSETTINGSMANAGER_H
#define OVERLAYSESSIONSETTINGSMANAGER_H

#include <Qt>

namespace SnapOverlay {

class OverlaySessionSettingsManager
{
public:
    enum class WindowLayout {
        PerScreen = 0,
        SpanVirtualDesktop = 1
    };

    static OverlaySessionSettingsManager& instance();

    bool isElementDetectionEnabled() const;
    void setElementDetectionEnabled(bool enabled);

    // Only Control, Shift, Alt and Meta are accepted
    Qt::Key loadElementPickModifier() const;
    void saveElementPickModifier(Qt::Key key);

    int loadDetectionIntervalMs() const;
    void saveDetectionIntervalMs(int intervalMs);

    int loadDetectionMinMovement() const;
    void saveDetectionMinMovement(int pixels);

    WindowLayout loadWindowLayout() const;
    void saveWindowLayout(WindowLayout layout);

    static bool isSupportedModifier(int key);

    static constexpr bool kDefaultElementDetectionEnabled = true;
    static constexpr Qt::Key kDefaultElementPickModifier = Qt::Key_Control;
    static constexpr int kDefaultDetectionIntervalMs = 30;
    static constexpr int kDefaultDetectionMinMovement = 8;
    static constexpr WindowLayout kDefaultWindowLayout = WindowLayout::PerScreen;

private:
    OverlaySessionSettingsManager() = default;
    ~OverlaySessionSettingsManager() = default;
    OverlaySessionSettingsManager(const OverlaySessionSettingsManager&) = delete;
    OverlaySessionSettingsManager& operator=(const OverlaySessionSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyElementDetectionEnabled =
        "overlaySession/elementDetectionEnabled";
    static constexpr const char* kSettingsKeyElementPickModifier =
        "overlaySession/elementPickModifier";
    static constexpr const char* kSettingsKeyDetectionIntervalMs =
        "overlaySession/detectionIntervalMs";
    static constexpr const char* kSettingsKeyDetectionMinMovement =
        "overlaySession/detectionMinMovement";
    static constexpr const char* kSettingsKeyWindowLayout =
        "overlaySession/windowLayout";
};

} // namespace SnapOverlay

#endif // OVERLAYSESSIONSETTINGSMANAGER_H
