// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QSet>

#include "core/groupstore.h"
#include "core/tabgroup.h"
#include "fakewindowsystem.h"

using namespace PlasmaTabs;

namespace {

constexpr WindowId A = 1;
constexpr WindowId B = 2;
constexpr WindowId C = 3;
constexpr WindowId D = 4;

WindowRecordList records(std::initializer_list<WindowId> ids)
{
    WindowRecordList list;
    for (WindowId id : ids) {
        list.append(makeRecord(id));
    }
    return list;
}

/// Step through one full gesture and return the visited window ids
QList<WindowId> cycleVisits(TabGroup& group, int steps)
{
    QList<WindowId> visited;
    for (int i = 0; i < steps; ++i) {
        const auto index = group.nextInMRUCycle();
        if (!index) {
            break;
        }
        group.switchTo(*index);
        visited.append(group.windows().at(*index).id);
    }
    return visited;
}

} // namespace

/**
 * @brief Unit tests for TabGroup
 *
 * Tests cover:
 * - Tab order, active index and frame
 * - moveTab() removal-then-insertion semantics and active tab tracking
 * - insertWindow() at an index and moveTabs() block moves
 * - removeWindows() through GroupStore::releaseWindows()
 * - MRU focus history: recordFocus(), frozen cycle snapshot, endCycle()
 * - Cycling completeness when windows close mid-gesture, reverse steps
 *   and full screen members left out of the cycle
 * - Signal emissions via QSignalSpy
 */
class TestTabGroup : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Construction and active tab
    // ═══════════════════════════════════════════════════════════════════════════

    void testConstruct_orderAndHistoryFollowInput()
    {
        TabGroup group(records({A, B, C}), QRect(0, 28, 800, 572));
        QVERIFY(!group.id().isNull());
        QCOMPARE(group.windowIds(), QList<WindowId>({A, B, C}));
        QCOMPARE(group.focusHistory(), QList<WindowId>({A, B, C}));
        QCOMPARE(group.activeIndex(), 0);
        QCOMPARE(group.activeWindow()->id, A);
        QCOMPARE(group.frame(), QRect(0, 28, 800, 572));
        QVERIFY(!group.isCycling());
    }

    void testSwitchTo_ignoresOutOfRange()
    {
        TabGroup group(records({A, B}), QRect());
        QSignalSpy spy(&group, &TabGroup::activeIndexChanged);

        group.switchTo(5);
        group.switchTo(-1);
        group.switchTo(0);
        QCOMPARE(spy.count(), 0);

        group.switchTo(B);
        QCOMPARE(group.activeIndex(), 1);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toInt(), 1);
    }

    void testSetFrame_emitsOnChangeOnly()
    {
        TabGroup group(records({A}), QRect(0, 0, 10, 10));
        QSignalSpy spy(&group, &TabGroup::frameChanged);
        group.setFrame(QRect(0, 0, 10, 10));
        QCOMPARE(spy.count(), 0);
        group.setFrame(QRect(5, 5, 10, 10));
        QCOMPARE(spy.count(), 1);
    }

    void testWindowLookup()
    {
        TabGroup group(records({A, B}), QRect());
        QVERIFY(group.contains(B));
        QCOMPARE(group.indexOf(B), 1);
        QCOMPARE(group.indexOf(C), -1);
        QVERIFY(group.window(A).has_value());
        QVERIFY(!group.window(C).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // moveTab
    // ═══════════════════════════════════════════════════════════════════════════

    void testMoveTab_destinationPastSourceLandsOneLower()
    {
        TabGroup group(records({A, B, C, D}), QRect());
        QVERIFY(group.moveTab(0, 2));
        QCOMPARE(group.windowIds(), QList<WindowId>({B, A, C, D}));

        QVERIFY(group.moveTab(1, 4));
        QCOMPARE(group.windowIds(), QList<WindowId>({B, C, D, A}));

        QVERIFY(group.moveTab(3, 0));
        QCOMPARE(group.windowIds(), QList<WindowId>({A, B, C, D}));
    }

    void testMoveTab_roundTripRestoresOrder()
    {
        TabGroup group(records({A, B, C, D}), QRect());
        QVERIFY(group.moveTab(1, 4));
        QCOMPARE(group.windowIds(), QList<WindowId>({A, C, D, B}));
        QVERIFY(group.moveTab(3, 1));
        QCOMPARE(group.windowIds(), QList<WindowId>({A, B, C, D}));
    }

    void testMoveTab_rejectsOutOfRange()
    {
        TabGroup group(records({A, B}), QRect());
        QVERIFY(!group.moveTab(-1, 0));
        QVERIFY(!group.moveTab(2, 0));
        QVERIFY(!group.moveTab(0, 3));
        QVERIFY(group.moveTab(0, 2));
        QCOMPARE(group.windowIds(), QList<WindowId>({B, A}));
    }

    void testMoveTab_activeFollowsWindow()
    {
        TabGroup group(records({A, B, C, D}), QRect());
        group.switchTo(C);

        // Active tab itself moves
        QVERIFY(group.moveTab(2, 0));
        QCOMPARE(group.activeWindow()->id, C);

        // Tab before the active one moves behind it
        group.switchTo(B);
        QCOMPARE(group.windowIds(), QList<WindowId>({C, A, B, D}));
        QVERIFY(group.moveTab(0, 4));
        QCOMPARE(group.windowIds(), QList<WindowId>({A, B, D, C}));
        QCOMPARE(group.activeWindow()->id, B);

        // Tab behind the active one moves in front of it
        QVERIFY(group.moveTab(3, 0));
        QCOMPARE(group.windowIds(), QList<WindowId>({C, A, B, D}));
        QCOMPARE(group.activeWindow()->id, B);
    }

    void testMoveTab_leavesHistoryAlone()
    {
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(C);
        const QList<WindowId> history = group.focusHistory();
        QVERIFY(group.moveTab(0, 3));
        QCOMPARE(group.focusHistory(), history);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Focus history
    // ═══════════════════════════════════════════════════════════════════════════

    void testRecordFocus_movesToFront()
    {
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(C);
        QCOMPARE(group.focusHistory(), QList<WindowId>({C, A, B}));
        group.recordFocus(B);
        QCOMPARE(group.focusHistory(), QList<WindowId>({B, C, A}));
        group.recordFocus(D);
        QCOMPARE(group.focusHistory(), QList<WindowId>({B, C, A}));
    }

    void testRecordFocus_ignoredWhileCycling()
    {
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(A);
        QVERIFY(group.nextInMRUCycle().has_value());
        QVERIFY(group.isCycling());

        const QList<WindowId> before = group.focusHistory();
        group.recordFocus(C);
        QCOMPARE(group.focusHistory(), before);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // MRU cycling
    // ═══════════════════════════════════════════════════════════════════════════

    void testCycle_singleStepTogglesLastTwo()
    {
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(C);
        group.recordFocus(A);
        group.switchTo(A);

        const auto next = group.nextInMRUCycle();
        QVERIFY(next.has_value());
        group.switchTo(*next);
        QCOMPARE(group.activeWindow()->id, C);
        group.endCycle();

        QCOMPARE(group.focusHistory().first(), C);
        QVERIFY(!group.isCycling());
    }

    void testCycle_mruScenario()
    {
        // A, B, C focused in that order: history is C, B, A
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(A);
        group.recordFocus(B);
        group.recordFocus(C);
        group.switchTo(C);
        QCOMPARE(group.focusHistory(), QList<WindowId>({C, B, A}));

        // Two presses in one gesture land on A
        QCOMPARE(cycleVisits(group, 2), QList<WindowId>({B, A}));
        QCOMPARE(group.frozenCycleOrder(), QList<WindowId>({C, B, A}));
        group.endCycle();
        QCOMPARE(group.focusHistory(), QList<WindowId>({A, C, B}));

        // The next single press returns to C
        QCOMPARE(cycleVisits(group, 1), QList<WindowId>({C}));
        group.endCycle();
        QCOMPARE(group.focusHistory().first(), C);
    }

    void testCycle_visitsEveryWindowOnce()
    {
        TabGroup group(records({A, B, C, D}), QRect());
        const QList<WindowId> visits = cycleVisits(group, 3);
        QCOMPARE(visits.size(), 3);
        QSet<WindowId> unique(visits.cbegin(), visits.cend());
        QCOMPARE(unique.size(), 3);
        QVERIFY(!unique.contains(group.frozenCycleOrder().first()));

        // Wraps to the start of the snapshot
        QCOMPARE(cycleVisits(group, 1), QList<WindowId>({group.frozenCycleOrder().first()}));
    }

    void testCycle_initialSnapshotIsTabOrder()
    {
        TabGroup group(records({A, B, C}), QRect());
        QVERIFY(group.nextInMRUCycle().has_value());
        QCOMPARE(group.frozenCycleOrder(), QList<WindowId>({A, B, C}));
    }

    void testCycle_fewerThanTwoWindows()
    {
        TabGroup group(records({A}), QRect());
        QVERIFY(!group.nextInMRUCycle().has_value());
        QVERIFY(!group.isCycling());
    }

    void testCycle_skipsWindowClosedMidCycle()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B, C, D}), QRect());
        QVERIFY(group);
        group->recordFocus(D);
        group->recordFocus(C);
        group->recordFocus(B);
        group->recordFocus(A);

        QCOMPARE(cycleVisits(*group, 1), QList<WindowId>({B}));

        // C closes while the user is still holding the modifier
        QVERIFY(store.releaseWindow(C, group).has_value());
        QCOMPARE(cycleVisits(*group, 2), QList<WindowId>({D, A}));
        QCOMPARE(group->frozenCycleOrder(), QList<WindowId>({A, B, C, D}));
    }

    void testEndCycle_landedWindowGoneFallsBackToActive()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B, C}), QRect());
        group->recordFocus(A);
        group->switchTo(A);

        const auto index = group->nextInMRUCycle();
        QVERIFY(index.has_value());
        group->switchTo(*index);
        QCOMPARE(group->activeWindow()->id, B);
        QVERIFY(store.releaseWindow(B, group).has_value());

        // The tab that slid into B's slot is active now
        QCOMPARE(group->activeWindow()->id, C);
        group->endCycle();
        QCOMPARE(group->focusHistory(), QList<WindowId>({C, A}));
    }

    void testEndCycle_noopWhenIdle()
    {
        TabGroup group(records({A, B}), QRect());
        QSignalSpy spy(&group, &TabGroup::cyclingChanged);
        group.endCycle();
        QCOMPARE(spy.count(), 0);
        QCOMPARE(group.focusHistory(), QList<WindowId>({A, B}));
    }

    void testCyclingChanged_signals()
    {
        TabGroup group(records({A, B}), QRect());
        QSignalSpy spy(&group, &TabGroup::cyclingChanged);
        group.nextInMRUCycle();
        group.nextInMRUCycle();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toBool(), true);
        group.endCycle();
        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(1).at(0).toBool(), false);
        QVERIFY(group.frozenCycleOrder().isEmpty());
    }

    void testCycle_focusThenCycleWraps()
    {
        TabGroup group(records({A, B, C}), QRect());
        group.recordFocus(B);
        group.recordFocus(A);
        QCOMPARE(group.focusHistory(), QList<WindowId>({A, B, C}));

        QCOMPARE(cycleVisits(group, 3), QList<WindowId>({B, C, A}));
        group.endCycle();
        QCOMPARE(group.focusHistory(), QList<WindowId>({A, B, C}));
    }

    void testCycle_reverseStepsBackward()
    {
        TabGroup group(records({A, B, C}), QRect());

        auto index = group.previousInMRUCycle();
        QVERIFY(index.has_value());
        QCOMPARE(group.windows().at(*index).id, C);
        group.switchTo(*index);

        index = group.previousInMRUCycle();
        QCOMPARE(group.windows().at(*index).id, B);
        group.switchTo(*index);

        // Forward again from the same position
        index = group.nextInMRUCycle();
        QCOMPARE(group.windows().at(*index).id, C);
        group.switchTo(*index);

        group.endCycle();
        QCOMPARE(group.focusHistory(), QList<WindowId>({C, A, B}));
    }

    void testCycle_skipsFullScreenMembers()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B, C}), QRect());
        QVERIFY(store.setWindowFullScreen(B, true));
        QCOMPARE(group->count(), 3);
        QCOMPARE(group->visibleCount(), 2);
        QCOMPARE(group->visibleWindows().first().id, A);

        QCOMPARE(cycleVisits(*group, 2), QList<WindowId>({C, A}));
        QVERIFY(!group->frozenCycleOrder().contains(B));
        group->endCycle();

        // One window left outside full screen: nothing to cycle to
        QVERIFY(store.setWindowFullScreen(C, true));
        QVERIFY(!group->nextInMRUCycle());
        QVERIFY(!group->isCycling());

        QVERIFY(store.setWindowFullScreen(C, false));
        QVERIFY(!store.setWindowFullScreen(C, false));
        QVERIFY(group->nextInMRUCycle().has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Insertion, block moves and batch removal
    // ═══════════════════════════════════════════════════════════════════════════

    void testInsertWindow_beforeActiveShiftsIndex()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B}), QRect());
        group->switchTo(B);
        QSignalSpy activeSpy(group.data(), &TabGroup::activeIndexChanged);

        QVERIFY(store.addWindow(makeRecord(C), group, 0));
        QCOMPARE(group->windowIds(), QList<WindowId>({C, A, B}));
        QCOMPARE(group->activeIndex(), 2);
        QCOMPARE(group->activeWindow()->id, B);
        QCOMPARE(activeSpy.count(), 1);

        // After the active tab the index stays put
        QVERIFY(store.addWindow(makeRecord(D), group, 3));
        QCOMPARE(group->windowIds(), QList<WindowId>({C, A, B, D}));
        QCOMPARE(group->activeIndex(), 2);
        QCOMPARE(group->focusHistory().last(), D);
    }

    void testInsertWindow_outOfRangeAppends()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B}), QRect());

        QVERIFY(store.addWindow(makeRecord(C), group, 7));
        QVERIFY(store.addWindow(makeRecord(D), group, -3));
        QCOMPARE(group->windowIds(), QList<WindowId>({A, B, C, D}));
        QCOMPARE(group->activeIndex(), 0);
    }

    void testMoveTabs_blockKeepsRelativeOrder()
    {
        TabGroup group(records({A, B, C, D}), QRect());
        group.switchTo(C);
        QSignalSpy changed(&group, &TabGroup::windowsChanged);

        QVERIFY(group.moveTabs({D, B}, 0));
        QCOMPARE(group.windowIds(), QList<WindowId>({B, D, A, C}));
        QCOMPARE(group.activeWindow()->id, C);
        QCOMPARE(group.activeIndex(), 3);
        QCOMPARE(changed.count(), 1);

        // Destination clamps to the end of the remaining tabs
        QVERIFY(group.moveTabs({B}, 99));
        QCOMPARE(group.windowIds(), QList<WindowId>({D, A, C, B}));
        QCOMPARE(group.activeWindow()->id, C);

        QVERIFY(!group.moveTabs({42}, 0));
        QCOMPARE(changed.count(), 2);
    }

    void testReleaseWindows_activeFollowsSurvivor()
    {
        GroupStore store;
        const TabGroupPtr group = store.createGroup(records({A, B, C, D}), QRect());
        group->switchTo(C);

        const WindowRecordList released = store.releaseWindows({D, A, 42}, group);
        QCOMPARE(released.size(), 2);
        QCOMPARE(released.at(0).id, A);
        QCOMPARE(released.at(1).id, D);
        QCOMPARE(group->windowIds(), QList<WindowId>({B, C}));
        QCOMPARE(group->activeWindow()->id, C);
        QVERIFY(!group->focusHistory().contains(A));

        // The active tab itself goes: the index clamps
        QCOMPARE(store.releaseWindows({C}, group).size(), 1);
        QCOMPARE(group->activeWindow()->id, B);
    }
};

QTEST_MAIN(TestTabGroup)
#include "test_tab_group.moc"
