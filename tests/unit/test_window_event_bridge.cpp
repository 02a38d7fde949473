// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QThread>

#include "core/windoweventbridge.h"
#include "fakewindowsystem.h"

#include <memory>
#include <thread>

using namespace PlasmaTabs;

/**
 * @brief Unit tests for WindowEventBridge
 *
 * Tests cover:
 * - One observer per process, reference counted by observed windows
 * - Subscriptions per window and on the process root
 * - Destroy notifications resolved through the element cache
 * - Delivery from a foreign thread onto the bridge's thread
 * - Focus notifications on the process root and on a window element
 */
class TestWindowEventBridge : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init()
    {
        m_env.reset(new FakeEnvironment);
        m_env->system.addProcess(100, QStringLiteral("org.kde.konsole"), QStringLiteral("Konsole"));
        m_env->system.addProcess(200, QStringLiteral("org.kde.dolphin"), QStringLiteral("Dolphin"));
        m_env->system.addWindow(10, 100, QStringLiteral("Shell 1"));
        m_env->system.addWindow(11, 100, QStringLiteral("Shell 2"));
        m_env->system.addWindow(20, 200, QStringLiteral("Home"));
    }

    void cleanup()
    {
        m_env.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Observer lifecycle
    // ═══════════════════════════════════════════════════════════════════════════

    void testObserve_oneObserverPerProcess()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);

        QVERIFY(bridge.observe(recordFor(system, 10)));
        QVERIFY(bridge.observe(recordFor(system, 11)));
        QVERIFY(bridge.observe(recordFor(system, 20)));

        QCOMPARE(bridge.observerCount(), 2);
        QCOMPARE(system.observerCount(), 2);
        QCOMPARE(bridge.observedWindowCount(100), 2);
        QCOMPARE(bridge.observedWindowCount(200), 1);

        // Four per window plus the focus subscription per process
        QCOMPARE(system.subscriptionCount(system.elementFor(10)), 4);
        QCOMPARE(system.subscriptionCount(system.applicationElementFor(100)), 1);
        QCOMPARE(system.totalSubscriptionCount(), 3 * 4 + 2);
    }

    void testObserve_twiceIsNoop()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        const WindowRecord record = recordFor(system, 10);

        QVERIFY(bridge.observe(record));
        QVERIFY(bridge.observe(record));
        QCOMPARE(bridge.observedWindowCount(100), 1);
        QCOMPARE(system.subscriptionCount(record.element), 4);
    }

    void testObserve_rejectsPlaceholderAndNullElement()
    {
        WindowEventBridge bridge(m_env->context);
        WindowRecord placeholder = recordFor(m_env->system, 10);
        placeholder.isPlaceholder = true;
        placeholder.element = m_env->system.applicationElementFor(100);
        QVERIFY(!bridge.observe(placeholder));

        WindowRecord empty = recordFor(m_env->system, 11);
        empty.element = ElementRef();
        QVERIFY(!bridge.observe(empty));
        QCOMPARE(bridge.observerCount(), 0);
    }

    void testObserve_observerCreationFailure()
    {
        m_env->system.setFailObserverCreation(true);
        WindowEventBridge bridge(m_env->context);
        const WindowRecord record = recordFor(m_env->system, 10);
        QVERIFY(!bridge.observe(record));
        QVERIFY(!bridge.isObserving(record));
        QCOMPARE(bridge.observedWindowCount(100), 0);
    }

    void testStopObserving_lastWindowTearsDownObserver()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        const WindowRecord first = recordFor(system, 10);
        const WindowRecord second = recordFor(system, 11);
        bridge.observe(first);
        bridge.observe(second);

        bridge.stopObserving(first);
        QVERIFY(!bridge.isObserving(first));
        QVERIFY(system.hasObserverFor(100));
        QCOMPARE(system.subscriptionCount(first.element), 0);

        bridge.stopObserving(second);
        QVERIFY(!system.hasObserverFor(100));
        QCOMPARE(bridge.observerCount(), 0);
        QCOMPARE(system.totalSubscriptionCount(), 0);

        // Unobserved window is ignored
        bridge.stopObserving(second);
        QCOMPARE(bridge.observedWindowCount(100), 0);
    }

    void testStopAll()
    {
        auto& system = m_env->system;
        {
            WindowEventBridge bridge(m_env->context);
            bridge.observe(recordFor(system, 10));
            bridge.observe(recordFor(system, 20));
            bridge.stopAll();
            QCOMPARE(bridge.observerCount(), 0);
            QCOMPARE(system.observerCount(), 0);

            bridge.observe(recordFor(system, 11));
        }
        // Destructor releases what is left
        QCOMPARE(system.observerCount(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Notifications
    // ═══════════════════════════════════════════════════════════════════════════

    void testNotification_movedResizedTitle()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        bridge.observe(recordFor(system, 10));
        QSignalSpy moved(&bridge, &WindowEventBridge::windowMoved);
        QSignalSpy resized(&bridge, &WindowEventBridge::windowResized);
        QSignalSpy title(&bridge, &WindowEventBridge::titleChanged);

        const ElementRef element = system.elementFor(10);
        QVERIFY(system.deliver(element, NotificationKind::Moved));
        QVERIFY(system.deliver(element, NotificationKind::Resized));
        QVERIFY(system.deliver(element, NotificationKind::TitleChanged));

        // Queued: nothing arrives before the event loop runs
        QCOMPARE(moved.count(), 0);

        QTRY_COMPARE(moved.count(), 1);
        QTRY_COMPARE(resized.count(), 1);
        QTRY_COMPARE(title.count(), 1);
        QCOMPARE(moved.at(0).at(0).value<WindowId>(), WindowId(10));
    }

    void testNotification_destroyedResolvedFromCache()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        bridge.observe(recordFor(system, 10));
        QSignalSpy destroyed(&bridge, &WindowEventBridge::windowDestroyed);

        // The element is already gone when the notification arrives
        QVERIFY(system.deliverDestroyed(10));
        QTRY_COMPARE(destroyed.count(), 1);
        QCOMPARE(destroyed.at(0).at(0).value<WindowId>(), WindowId(10));
    }

    void testHandleDestroyedWindow_refcount()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        const WindowRecord first = recordFor(system, 10);
        const WindowRecord second = recordFor(system, 11);
        bridge.observe(first);
        bridge.observe(second);

        bridge.handleDestroyedWindow(100, first.element.stableHash());
        QCOMPARE(bridge.observedWindowCount(100), 1);
        QVERIFY(system.hasObserverFor(100));

        // Unknown hash changes nothing
        bridge.handleDestroyedWindow(100, first.element.stableHash());
        QCOMPARE(bridge.observedWindowCount(100), 1);

        bridge.handleDestroyedWindow(100, second.element.stableHash());
        QVERIFY(!system.hasObserverFor(100));
        QCOMPARE(bridge.observerCount(), 0);
    }

    void testNotification_fromForeignThread()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        bridge.observe(recordFor(system, 10));
        bridge.observe(recordFor(system, 20));

        QThread* receiverThread = nullptr;
        connect(&bridge, &WindowEventBridge::windowMoved, this, [&receiverThread]() {
            receiverThread = QThread::currentThread();
        });
        QSignalSpy moved(&bridge, &WindowEventBridge::windowMoved);

        const ElementRef first = system.elementFor(10);
        const ElementRef second = system.elementFor(20);
        std::thread worker([&system, first, second]() {
            for (int i = 0; i < 10; ++i) {
                system.deliver(first, NotificationKind::Moved);
                system.deliver(second, NotificationKind::Moved);
            }
        });
        worker.join();

        QTRY_COMPARE(moved.count(), 20);
        QCOMPARE(receiverThread, QThread::currentThread());
    }

    void testNotification_afterBridgeDestroyedIsDropped()
    {
        auto& system = m_env->system;
        auto bridge = std::make_unique<WindowEventBridge>(m_env->context);
        bridge->observe(recordFor(system, 10));

        // Queued, but the bridge is gone before the event loop runs
        QVERIFY(system.deliver(system.elementFor(10), NotificationKind::Moved));
        bridge.reset();
        QTest::qWait(10);
        QCOMPARE(system.observerCount(), 0);
    }

    void testFocus_processRootResolvesFocusedWindow()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        bridge.observe(recordFor(system, 10));
        system.setFocusedWindow(100, 11);
        QSignalSpy focused(&bridge, &WindowEventBridge::windowFocused);

        QVERIFY(system.deliver(system.applicationElementFor(100), NotificationKind::FocusedWindowChanged));
        QTRY_COMPARE(focused.count(), 1);
        QCOMPARE(focused.at(0).at(0).value<ProcessId>(), ProcessId(100));
        QCOMPARE(focused.at(0).at(1).value<ElementRef>(), system.elementFor(11));
    }

    void testFocus_noFocusedWindowEmitsNothing()
    {
        auto& system = m_env->system;
        WindowEventBridge bridge(m_env->context);
        bridge.observe(recordFor(system, 10));
        QSignalSpy focused(&bridge, &WindowEventBridge::windowFocused);

        QVERIFY(system.deliver(system.applicationElementFor(100), NotificationKind::FocusedWindowChanged));
        QTest::qWait(20);
        QCOMPARE(focused.count(), 0);
    }

private:
    std::unique_ptr<FakeEnvironment> m_env;
};

QTEST_MAIN(TestWindowEventBridge)
#include "test_window_event_bridge.moc"
