#ifndef SESSIONTYPES_H
#define SESSIONTYPES_H

#include <QList>
#include <QMetaType>
#include <QObject>
#include <QRect>
#include <QString>
#include <optional>

#include "session/ElementDescriptor.h"

namespace SnapOverlay {

// Arbitration key for a participant window. Compared by identity only.
using WindowId = const QObject *;

enum class SelectionMode {
    Free,     // Drag a rectangle
    Element   // Pick the detected UI element under the cursor
};

QString selectionModeName(SelectionMode mode);

// Payload of a finished selection reported by a window
struct RegionSelection {
    QRect rect;
    bool isEditable = false;  // Finalized and entering annotation, as opposed to a final capture
    std::optional<ElementDescriptor> element;
};

// A display as seen by the capture layer
struct ScreenInfo {
    QString name;
    QRect geometry;
    qreal devicePixelRatio = 1.0;
};

} // namespace SnapOverlay

Q_DECLARE_METATYPE(SnapOverlay::SelectionMode)
Q_DECLARE_METATYPE(SnapOverlay::RegionSelection)
Q_DECLARE_METATYPE(SnapOverlay::ScreenInfo)

#endif // SESSIONTYPES_H
