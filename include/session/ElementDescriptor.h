#ifndef ELEMENTDESCRIPTOR_H
#define ELEMENTDESCRIPTOR_H

#include <QDebug>
#include <QRect>
#include <QString>
#include <QtGlobal>

namespace SnapOverlay {

/**
 * @brief A UI element reported by the platform element detector.
 *
 * Bounds are in screen coordinates (device-independent pixels). Detectors
 * report jittering bounds for the same logical element on repeated polls,
 * so identity is decided with isSameElement() rather than operator==.
 */
struct ElementDescriptor {
    quintptr windowHandle = 0;  // Native handle of the owning window
    QString className;          // Platform class / role name
    QRect bounds;               // Screen coordinates (logical pixels)
    QString name;               // Title or accessible name, for hint display
    QString processName;        // Owning application
    bool isWindow = false;      // Top-level window rather than a child element

    // Maximum per-dimension difference (exclusive) still treated as the same element
    static constexpr int kBoundsTolerance = 5;

    // Same windowHandle and className, and x/y/width/height each within tolerance
    bool isSameElement(const ElementDescriptor &other) const;

    bool operator==(const ElementDescriptor &other) const;
    bool operator!=(const ElementDescriptor &other) const { return !(*this == other); }
};

QDebug operator<<(QDebug debug, const ElementDescriptor &element);

} // namespace SnapOverlay

#endif // ELEMENTDESCRIPTOR_H
