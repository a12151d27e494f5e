#ifndef NULLELEMENTDETECTOR_H
#define NULLELEMENTDETECTOR_H

#include "detection/IElementDetector.h"

namespace SnapOverlay {

// Detector for platforms without element detection support
class NullElementDetector : public IElementDetector
{
public:
    explicit NullElementDetector(QObject *parent = nullptr);

    std::optional<ElementDescriptor> detectElementAt(const QPoint &screenPos,
                                                     quintptr ignoreWindow = 0) override;
    bool isSupported() const override { return false; }
    bool hasPermissions() const override { return false; }
};

} // namespace SnapOverlay

#endif // NULLELEMENTDETECTOR_H
