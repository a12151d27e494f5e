#include <QtTest/QtTest>

#include "session/ModeBroadcaster.h"

using namespace SnapOverlay;

class tst_ModeBroadcaster : public QObject
{
    Q_OBJECT

private slots:
    void testDefaultMode();
    void testSetModeDedupe();
    void testModifierPressSelectsElement();
    void testModifierAutoRepeatIgnored();
    void testModifierReleaseReturnsToFree();
    void testReleaseWithoutPressIgnored();
    void testPressWhileAlreadyElement();
    void testReleaseModifierKeepsMode();
};

void tst_ModeBroadcaster::testDefaultMode()
{
    ModeBroadcaster broadcaster;
    QCOMPARE(broadcaster.mode(), SelectionMode::Free);
    QVERIFY(!broadcaster.isModifierDown());
}

void tst_ModeBroadcaster::testSetModeDedupe()
{
    ModeBroadcaster broadcaster;
    QVERIFY(!broadcaster.setMode(SelectionMode::Free));
    QVERIFY(broadcaster.setMode(SelectionMode::Element));
    QVERIFY(!broadcaster.setMode(SelectionMode::Element));
    QCOMPARE(broadcaster.mode(), SelectionMode::Element);
}

void tst_ModeBroadcaster::testModifierPressSelectsElement()
{
    ModeBroadcaster broadcaster;
    const auto mode = broadcaster.modifierPressed();

    QVERIFY(mode.has_value());
    QCOMPARE(*mode, SelectionMode::Element);
    QVERIFY(broadcaster.isModifierDown());
}

void tst_ModeBroadcaster::testModifierAutoRepeatIgnored()
{
    ModeBroadcaster broadcaster;
    broadcaster.modifierPressed();

    QVERIFY(!broadcaster.modifierPressed().has_value());
    QVERIFY(!broadcaster.modifierPressed().has_value());
    QCOMPARE(broadcaster.mode(), SelectionMode::Element);
}

void tst_ModeBroadcaster::testModifierReleaseReturnsToFree()
{
    ModeBroadcaster broadcaster;
    broadcaster.modifierPressed();
    const auto mode = broadcaster.modifierReleased();

    QVERIFY(mode.has_value());
    QCOMPARE(*mode, SelectionMode::Free);
    QVERIFY(!broadcaster.isModifierDown());
}

void tst_ModeBroadcaster::testReleaseWithoutPressIgnored()
{
    ModeBroadcaster broadcaster;
    broadcaster.setMode(SelectionMode::Element);

    QVERIFY(!broadcaster.modifierReleased().has_value());
    QCOMPARE(broadcaster.mode(), SelectionMode::Element);
}

void tst_ModeBroadcaster::testPressWhileAlreadyElement()
{
    ModeBroadcaster broadcaster;
    broadcaster.setMode(SelectionMode::Element);

    QVERIFY(!broadcaster.modifierPressed().has_value());
    QVERIFY(broadcaster.isModifierDown());
}

void tst_ModeBroadcaster::testReleaseModifierKeepsMode()
{
    ModeBroadcaster broadcaster;
    broadcaster.modifierPressed();
    broadcaster.releaseModifier();

    QVERIFY(!broadcaster.isModifierDown());
    QCOMPARE(broadcaster.mode(), SelectionMode::Element);

    broadcaster.reset();
    QCOMPARE(broadcaster.mode(), SelectionMode::Free);
}

QTEST_MAIN(tst_ModeBroadcaster)
#include "tst_ModeBroadcaster.moc"
