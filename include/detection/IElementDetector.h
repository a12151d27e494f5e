#ifndef IELEMENTDETECTOR_H
#define IELEMENTDETECTOR_H

#include <QObject>
#include <QPoint>
#include <optional>

#include "session/ElementDescriptor.h"

namespace SnapOverlay {

/**
 * @brief Platform service finding the UI element under a screen point
 *
 * Implementations wrap the platform accessibility APIs. The capture session
 * never calls them directly; selection strategies do and hand the result to
 * the session's highlight arbitration.
 */
class IElementDetector : public QObject
{
public:
    explicit IElementDetector(QObject *parent = nullptr) : QObject(parent) {}
    ~IElementDetector() override = default;

    /**
     * @brief Find the element at a screen position
     * @param screenPos Screen coordinates (logical pixels)
     * @param ignoreWindow Native handle to skip, typically the overlay itself
     * @return Detected element, or std::nullopt when nothing is there
     */
    virtual std::optional<ElementDescriptor> detectElementAt(const QPoint &screenPos,
                                                             quintptr ignoreWindow = 0) = 0;

    virtual bool isSupported() const = 0;
    virtual bool hasPermissions() const = 0;
};

} // namespace SnapOverlay

#endif // IELEMENTDETECTOR_H
