#ifndef MOCKELEMENTDETECTOR_H
#define MOCKELEMENTDETECTOR_H

#include "detection/IElementDetector.h"

#include <functional>

/**
 * @brief Mock implementation of IElementDetector for testing
 */
class MockElementDetector : public SnapOverlay::IElementDetector
{
public:
    using Provider = std::function<std::optional<SnapOverlay::ElementDescriptor>(const QPoint &)>;

    explicit MockElementDetector(QObject *parent = nullptr);

    std::optional<SnapOverlay::ElementDescriptor> detectElementAt(const QPoint &screenPos,
                                                                  quintptr ignoreWindow = 0) override;
    bool isSupported() const override { return true; }
    bool hasPermissions() const override { return true; }

    // ========== Mock Control Methods ==========

    // Element returned for every point
    void setElement(const std::optional<SnapOverlay::ElementDescriptor> &element);

    // Per-point lookup; takes precedence over setElement()
    void setProvider(Provider provider) { m_provider = std::move(provider); }

    void setThrowOnDetect(bool shouldThrow) { m_throwOnDetect = shouldThrow; }

    // ========== Spy Methods ==========

    int detectCallCount() const { return m_detectCalls; }
    QPoint lastPoint() const { return m_lastPoint; }
    quintptr lastIgnoreWindow() const { return m_lastIgnoreWindow; }

private:
    std::optional<SnapOverlay::ElementDescriptor> m_element;
    Provider m_provider;
    bool m_throwOnDetect = false;

    int m_detectCalls = 0;
    QPoint m_lastPoint;
    quintptr m_lastIgnoreWindow = 0;
};

#endif // MOCKELEMENTDETECTOR_H
