#include <QtTest/QtTest>

#include "selection/ElementSelectionStrategy.h"
#include "session/CaptureSession.h"
#include "../mocks/MockElementDetector.h"
#include "../mocks/MockOverlayWindow.h"

using namespace SnapOverlay;

class tst_ElementSelectionStrategy : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testInactiveDoesNotDetect();
    void testHighlightGranted();
    void testHighlightDeniedForSameElementOnOtherWindow();
    void testNewElementTakesOver();
    void testJitterKeepsHighlight();
    void testNoElementDropsHighlight();
    void testDetectorFailureTreatedAsNoElement();
    void testThrottleByInterval();
    void testThrottleByMovement();
    void testIgnoresOwnWindowHandle();
    void testLockedWindowDoesNotDetect();
    void testPointerPressedPicksElement();
    void testPointerPressedWithoutOwnershipIgnored();
    void testDeactivateReleasesOwnership();

private:
    static ElementDescriptor element(const QString &className, const QRect &bounds);

    CaptureSession *m_session = nullptr;
    MockOverlayWindow *m_a = nullptr;
    MockOverlayWindow *m_b = nullptr;
    MockElementDetector *m_detector = nullptr;
    ElementSelectionStrategy *m_strategyA = nullptr;
    ElementSelectionStrategy *m_strategyB = nullptr;
};

ElementDescriptor tst_ElementSelectionStrategy::element(const QString &className, const QRect &bounds)
{
    ElementDescriptor descriptor;
    descriptor.windowHandle = 0x42;
    descriptor.className = className;
    descriptor.bounds = bounds;
    descriptor.name = className;
    return descriptor;
}

void tst_ElementSelectionStrategy::init()
{
    m_session = new CaptureSession();
    m_a = new MockOverlayWindow();
    m_b = new MockOverlayWindow();
    m_a->setNativeHandle(0xA);
    m_b->setNativeHandle(0xB);
    m_session->addWindow(m_a);
    m_session->addWindow(m_b);

    m_detector = new MockElementDetector();
    m_strategyA = new ElementSelectionStrategy(m_session, m_a, m_detector, m_a);
    m_strategyB = new ElementSelectionStrategy(m_session, m_b, m_detector, m_b);
    m_strategyA->setThrottle(0, 0);
    m_strategyB->setThrottle(0, 0);
    m_strategyA->activate();
    m_strategyB->activate();
}

void tst_ElementSelectionStrategy::cleanup()
{
    delete m_session;
    delete m_a;
    delete m_b;
    delete m_detector;
    m_session = nullptr;
    m_a = m_b = nullptr;
    m_detector = nullptr;
    m_strategyA = m_strategyB = nullptr;
}

void tst_ElementSelectionStrategy::testInactiveDoesNotDetect()
{
    m_strategyA->deactivate();
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));

    m_strategyA->handlePointerMoved(QPoint(20, 20));

    QCOMPARE(m_detector->detectCallCount(), 0);
    QVERIFY(!m_session->currentHighlightedElement().has_value());
}

void tst_ElementSelectionStrategy::testHighlightGranted()
{
    QSignalSpy highlightSpy(m_strategyA, &ElementSelectionStrategy::highlightChanged);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));

    m_strategyA->handlePointerMoved(QPoint(20, 20));

    QCOMPARE(highlightSpy.count(), 1);
    QCOMPARE(highlightSpy.at(0).at(0).toRect(), QRect(10, 10, 80, 30));
    QVERIFY(m_session->isHighlightOwner(m_a));
    QVERIFY(m_strategyA->highlightedElement().has_value());
}

void tst_ElementSelectionStrategy::testHighlightDeniedForSameElementOnOtherWindow()
{
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    QSignalSpy highlightSpy(m_strategyB, &ElementSelectionStrategy::highlightChanged);
    m_strategyB->handlePointerMoved(QPoint(25, 25));

    QCOMPARE(highlightSpy.count(), 0);
    QVERIFY(!m_strategyB->highlightedElement().has_value());
    QVERIFY(m_session->isHighlightOwner(m_a));
}

void tst_ElementSelectionStrategy::testNewElementTakesOver()
{
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_detector->setElement(element("Edit", QRect(2000, 10, 300, 24)));
    QSignalSpy highlightSpy(m_strategyB, &ElementSelectionStrategy::highlightChanged);
    m_strategyB->handlePointerMoved(QPoint(2010, 20));

    QCOMPARE(highlightSpy.count(), 1);
    QVERIFY(m_session->isHighlightOwner(m_b));
    QVERIFY(!m_session->isHighlightOwner(m_a));
}

void tst_ElementSelectionStrategy::testJitterKeepsHighlight()
{
    QSignalSpy highlightSpy(m_strategyA, &ElementSelectionStrategy::highlightChanged);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_detector->setElement(element("Button", QRect(12, 11, 82, 31)));
    m_strategyA->handlePointerMoved(QPoint(40, 20));

    QCOMPARE(highlightSpy.count(), 1);
    QVERIFY(m_session->isHighlightOwner(m_a));
}

void tst_ElementSelectionStrategy::testNoElementDropsHighlight()
{
    QSignalSpy highlightSpy(m_strategyA, &ElementSelectionStrategy::highlightChanged);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_detector->setElement(std::nullopt);
    m_strategyA->handlePointerMoved(QPoint(500, 500));

    QCOMPARE(highlightSpy.count(), 2);
    QVERIFY(highlightSpy.at(1).at(0).toRect().isNull());
    QVERIFY(!m_session->currentHighlightedElement().has_value());
    QVERIFY(!m_strategyA->highlightedElement().has_value());
}

void tst_ElementSelectionStrategy::testDetectorFailureTreatedAsNoElement()
{
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_detector->setThrowOnDetect(true);
    m_strategyA->handlePointerMoved(QPoint(300, 300));

    QVERIFY(!m_strategyA->highlightedElement().has_value());
    QVERIFY(!m_session->currentHighlightedElement().has_value());
}

void tst_ElementSelectionStrategy::testThrottleByInterval()
{
    m_strategyA->setThrottle(60000, 0);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));

    m_strategyA->handlePointerMoved(QPoint(20, 20));
    m_strategyA->handlePointerMoved(QPoint(300, 300));
    m_strategyA->handlePointerMoved(QPoint(600, 600));

    QCOMPARE(m_detector->detectCallCount(), 1);
}

void tst_ElementSelectionStrategy::testThrottleByMovement()
{
    m_strategyA->setThrottle(0, 8);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));

    m_strategyA->handlePointerMoved(QPoint(20, 20));
    m_strategyA->handlePointerMoved(QPoint(25, 24));
    QCOMPARE(m_detector->detectCallCount(), 1);

    m_strategyA->handlePointerMoved(QPoint(28, 20));
    QCOMPARE(m_detector->detectCallCount(), 2);
}

void tst_ElementSelectionStrategy::testIgnoresOwnWindowHandle()
{
    m_strategyB->handlePointerMoved(QPoint(20, 20));

    QCOMPARE(m_detector->lastIgnoreWindow(), quintptr(0xB));
    QCOMPARE(m_detector->lastPoint(), QPoint(20, 20));
}

void tst_ElementSelectionStrategy::testLockedWindowDoesNotDetect()
{
    m_a->simulateRegionSelected(QRect(0, 0, 100, 100), true);
    QVERIFY(m_b->isSelectionLocked());

    m_strategyB->handlePointerMoved(QPoint(2000, 20));

    QCOMPARE(m_detector->detectCallCount(), 0);
}

void tst_ElementSelectionStrategy::testPointerPressedPicksElement()
{
    QSignalSpy pickedSpy(m_strategyA, &ElementSelectionStrategy::elementPicked);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    const auto selection = m_strategyA->handlePointerPressed();

    QVERIFY(selection.has_value());
    QVERIFY(selection->isEditable);
    QCOMPARE(selection->rect, QRect(10, 10, 80, 30));
    QVERIFY(selection->element.has_value());
    QCOMPARE(selection->element->className, QStringLiteral("Button"));
    QCOMPARE(pickedSpy.count(), 1);
    QVERIFY(m_session->activeSelectionWindow() == m_a);
}

void tst_ElementSelectionStrategy::testPointerPressedWithoutOwnershipIgnored()
{
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_detector->setElement(element("Edit", QRect(2000, 10, 300, 24)));
    m_strategyB->handlePointerMoved(QPoint(2010, 20));

    // A still remembers its element but lost ownership to B
    QVERIFY(m_strategyA->highlightedElement().has_value());
    QVERIFY(!m_strategyA->handlePointerPressed().has_value());
    QVERIFY(!m_strategyA->highlightedElement().has_value());
    QVERIFY(!m_session->hasSelection());
}

void tst_ElementSelectionStrategy::testDeactivateReleasesOwnership()
{
    QSignalSpy highlightSpy(m_strategyA, &ElementSelectionStrategy::highlightChanged);
    m_detector->setElement(element("Button", QRect(10, 10, 80, 30)));
    m_strategyA->handlePointerMoved(QPoint(20, 20));

    m_strategyA->deactivate();

    QVERIFY(!m_session->isHighlightOwner(m_a));
    QVERIFY(!m_session->currentHighlightedElement().has_value());
    QCOMPARE(highlightSpy.count(), 2);
    QVERIFY(highlightSpy.last().at(0).toRect().isNull());
}

QTEST_MAIN(tst_ElementSelectionStrategy)
#include "tst_ElementSelectionStrategy.moc"
