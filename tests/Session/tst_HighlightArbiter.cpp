#include <QtTest/QtTest>

#include "session/HighlightArbiter.h"
#include "../mocks/MockOverlayWindow.h"

using namespace SnapOverlay;

class tst_HighlightArbiter : public QObject
{
    Q_OBJECT

private slots:
    void testFirstClaimGranted();
    void testSameElementSameOwnerContinues();
    void testSameElementOtherOwnerDenied();
    void testDifferentElementTakesOver();
    void testJitterDoesNotChurnOwnership();
    void testJitterBeyondToleranceIsNewElement();
    void testClearByOwner();
    void testClearByNonOwnerIsNoOp();
    void testClearOwner();
    void testNullOwnerRejected();
    void testOwnershipInvariant();

private:
    static ElementDescriptor element(const QString &className, const QRect &bounds);
};

ElementDescriptor tst_HighlightArbiter::element(const QString &className, const QRect &bounds)
{
    ElementDescriptor descriptor;
    descriptor.windowHandle = 42;
    descriptor.className = className;
    descriptor.bounds = bounds;
    return descriptor;
}

void tst_HighlightArbiter::testFirstClaimGranted()
{
    MockOverlayWindow a;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(arbiter.isOwner(&a));
    QVERIFY(arbiter.currentElement().has_value());
    QCOMPARE(*arbiter.currentElement(), x);
}

void tst_HighlightArbiter::testSameElementSameOwnerContinues()
{
    MockOverlayWindow a;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(arbiter.isOwner(&a));
}

void tst_HighlightArbiter::testSameElementOtherOwnerDenied()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(!arbiter.setHighlightedElement(x, &b));

    QVERIFY(arbiter.isOwner(&a));
    QVERIFY(!arbiter.isOwner(&b));
    QCOMPARE(*arbiter.currentElement(), x);
}

void tst_HighlightArbiter::testDifferentElementTakesOver()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));
    const auto y = element("Edit", QRect(300, 10, 200, 24));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(arbiter.setHighlightedElement(y, &b));

    QVERIFY(!arbiter.isOwner(&a));
    QVERIFY(arbiter.isOwner(&b));
    QCOMPARE(*arbiter.currentElement(), y);
}

void tst_HighlightArbiter::testJitterDoesNotChurnOwnership()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));
    const auto jittered = element("Button", QRect(13, 13, 103, 43));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(!arbiter.setHighlightedElement(jittered, &b));
    QVERIFY(arbiter.setHighlightedElement(jittered, &a));
    QVERIFY(arbiter.isOwner(&a));
}

void tst_HighlightArbiter::testJitterBeyondToleranceIsNewElement()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));
    const auto moved = element("Button", QRect(16, 16, 106, 46));

    QVERIFY(arbiter.setHighlightedElement(x, &a));
    QVERIFY(arbiter.setHighlightedElement(moved, &b));
    QVERIFY(arbiter.isOwner(&b));
}

void tst_HighlightArbiter::testClearByOwner()
{
    MockOverlayWindow a;
    HighlightArbiter arbiter;
    arbiter.setHighlightedElement(element("Button", QRect(10, 10, 100, 40)), &a);

    QVERIFY(arbiter.setHighlightedElement(std::nullopt, &a));
    QVERIFY(!arbiter.currentElement().has_value());
    QVERIFY(arbiter.owner() == nullptr);
}

void tst_HighlightArbiter::testClearByNonOwnerIsNoOp()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    arbiter.setHighlightedElement(element("Button", QRect(10, 10, 100, 40)), &a);

    QVERIFY(!arbiter.setHighlightedElement(std::nullopt, &b));
    QVERIFY(arbiter.isOwner(&a));
    QVERIFY(arbiter.currentElement().has_value());
}

void tst_HighlightArbiter::testClearOwner()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    arbiter.setHighlightedElement(element("Button", QRect(10, 10, 100, 40)), &a);

    QVERIFY(!arbiter.clearOwner(&b));
    QVERIFY(arbiter.isOwner(&a));

    QVERIFY(arbiter.clearOwner(&a));
    QVERIFY(!arbiter.isOwner(&a));
    QVERIFY(!arbiter.currentElement().has_value());
}

void tst_HighlightArbiter::testNullOwnerRejected()
{
    HighlightArbiter arbiter;
    QVERIFY(!arbiter.setHighlightedElement(element("Button", QRect(0, 0, 10, 10)), nullptr));
    QVERIFY(!arbiter.currentElement().has_value());
    QVERIFY(!arbiter.isOwner(nullptr));
}

void tst_HighlightArbiter::testOwnershipInvariant()
{
    MockOverlayWindow a, b;
    HighlightArbiter arbiter;
    const auto x = element("Button", QRect(10, 10, 100, 40));
    const auto y = element("Edit", QRect(300, 10, 200, 24));

    auto checkInvariant = [&arbiter]() {
        return arbiter.currentElement().has_value() == (arbiter.owner() != nullptr);
    };

    QVERIFY(checkInvariant());
    arbiter.setHighlightedElement(x, &a);
    QVERIFY(checkInvariant());
    arbiter.setHighlightedElement(x, &b);
    QVERIFY(checkInvariant());
    arbiter.setHighlightedElement(y, &b);
    QVERIFY(checkInvariant());
    arbiter.setHighlightedElement(std::nullopt, &a);
    QVERIFY(checkInvariant());
    arbiter.setHighlightedElement(std::nullopt, &b);
    QVERIFY(checkInvariant());
    arbiter.reset();
    QVERIFY(checkInvariant());
}

QTEST_MAIN(tst_HighlightArbiter)
#include "tst_HighlightArbiter.moc"
