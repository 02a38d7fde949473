// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/tabcontroller.h"
#include "core/windowresolver.h"
#include "dbus/tabgroupadaptor.h"
#include "fakewindowsystem.h"

#include <memory>

using namespace PlasmaTabs;

/**
 * @brief Unit tests for TabGroupAdaptor
 *
 * Calls the adaptor slots directly, without a session bus.
 *
 * Tests cover:
 * - groupIds() / activeGroupId()
 * - windowsInGroup() JSON, including unknown and malformed ids
 * - switcherItems() JSON
 * - disbandGroup() / switchToTab() / processTerminated() forwarding
 * - groupsChanged and the forwarded switcher / picker signals
 */
class TestTabGroupAdaptor : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init()
    {
        m_env.reset(new FakeEnvironment);
        auto& system = m_env->system;
        system.addProcess(100, QStringLiteral("org.kde.konsole"), QStringLiteral("Konsole"));
        system.addProcess(200, QStringLiteral("org.kde.dolphin"), QStringLiteral("Dolphin"));
        system.addWindow(10, 100, QStringLiteral("Shell 1"));
        system.addWindow(11, 100, QStringLiteral("Shell 2"));
        system.addWindow(20, 200, QStringLiteral("Home"));

        m_controller.reset(new TabController(m_env->context));
        m_host.reset(new QObject);
        m_adaptor = new TabGroupAdaptor(m_controller.get(), m_host.get());
    }

    void cleanup()
    {
        m_host.reset();
        m_adaptor = nullptr;
        m_controller.reset();
        m_env.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    void testGroupIds()
    {
        QVERIFY(m_adaptor->groupIds().isEmpty());
        QVERIFY(m_adaptor->activeGroupId().isEmpty());

        const TabGroupPtr first = group({10, 11});
        const TabGroupPtr second = group({20});
        QCOMPARE(m_adaptor->groupIds(), QStringList({first->id().toString(), second->id().toString()}));
        QCOMPARE(m_adaptor->activeGroupId(), second->id().toString());
    }

    void testWindowsInGroup_json()
    {
        const TabGroupPtr g = group({10, 20});
        m_controller->switchTab(g, 1);

        const QJsonDocument doc = QJsonDocument::fromJson(m_adaptor->windowsInGroup(g->id().toString()).toUtf8());
        QVERIFY(doc.isArray());
        const QJsonArray windows = doc.array();
        QCOMPARE(windows.size(), 2);

        const QJsonObject first = windows.at(0).toObject();
        QCOMPARE(first.value(QStringLiteral("id")).toInteger(), 10);
        QCOMPARE(first.value(QStringLiteral("pid")).toInteger(), 100);
        QCOMPARE(first.value(QStringLiteral("appId")).toString(), QStringLiteral("org.kde.konsole"));
        QCOMPARE(first.value(QStringLiteral("appName")).toString(), QStringLiteral("Konsole"));
        QCOMPARE(first.value(QStringLiteral("title")).toString(), QStringLiteral("Shell 1"));
        QVERIFY(first.contains(QStringLiteral("iconName")));
        QCOMPARE(first.value(QStringLiteral("active")).toBool(), false);

        const QJsonObject second = windows.at(1).toObject();
        QCOMPARE(second.value(QStringLiteral("title")).toString(), QStringLiteral("Home"));
        QCOMPARE(second.value(QStringLiteral("active")).toBool(), true);
    }

    void testWindowsInGroup_unknownOrMalformedId()
    {
        group({10, 11});
        QCOMPARE(m_adaptor->windowsInGroup(QUuid::createUuid().toString()), QStringLiteral("[]"));
        QCOMPARE(m_adaptor->windowsInGroup(QStringLiteral("not-a-uuid")), QStringLiteral("[]"));
        QCOMPARE(m_adaptor->windowsInGroup(QString()), QStringLiteral("[]"));
    }

    void testSwitcherItems_json()
    {
        const TabGroupPtr g = group({10, 11});
        m_controller->resolver()->refreshAsync(WindowResolver::Scope::AllDesktops);
        QTRY_VERIFY(!m_controller->resolver()->lastResult().isEmpty());

        const QJsonDocument doc = QJsonDocument::fromJson(m_adaptor->switcherItems().toUtf8());
        QVERIFY(doc.isArray());
        const QJsonArray rows = doc.array();
        QCOMPARE(rows.size(), 2);

        const QJsonObject groupRow = rows.at(0).toObject();
        QCOMPARE(groupRow.value(QStringLiteral("groupId")).toString(), g->id().toString());
        QCOMPARE(groupRow.value(QStringLiteral("windowIds")).toArray().size(), 2);

        const QJsonObject windowRow = rows.at(1).toObject();
        QVERIFY(!windowRow.contains(QStringLiteral("groupId")));
        QCOMPARE(windowRow.value(QStringLiteral("windowId")).toInteger(), 20);
        QCOMPARE(windowRow.value(QStringLiteral("title")).toString(), QStringLiteral("Home"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════════════════════

    void testDisbandGroup()
    {
        const TabGroupPtr g = group({10, 11});
        m_adaptor->disbandGroup(QStringLiteral("garbage"));
        QCOMPARE(m_controller->groupStore()->count(), 1);

        m_adaptor->disbandGroup(g->id().toString());
        QCOMPARE(m_controller->groupStore()->count(), 0);
        QVERIFY(m_adaptor->groupIds().isEmpty());
    }

    void testSwitchToTab_forwarded()
    {
        const TabGroupPtr g = group({10, 11, 20});
        m_adaptor->switchToTab(3);
        QCOMPARE(g->activeWindow()->id, WindowId(20));
        m_adaptor->switchToTab(2);
        QCOMPARE(g->activeWindow()->id, WindowId(11));
    }

    void testReleaseTab_forwarded()
    {
        const TabGroupPtr g = group({10, 11, 20});
        m_adaptor->switchToTab(2);
        m_adaptor->releaseTab();
        QCOMPARE(g->windowIds(), QList<WindowId>({10, 20}));
    }

    void testCycle_forwarded()
    {
        const TabGroupPtr g = group({10, 11});
        m_adaptor->cycleStart(false);
        QVERIFY(g->isCycling());
        QCOMPARE(g->activeWindow()->id, WindowId(11));

        m_adaptor->cycleModifierReleased();
        QVERIFY(!g->isCycling());
        QCOMPARE(g->focusHistory().first(), WindowId(11));
    }

    void testCycleReverse_forwarded()
    {
        const TabGroupPtr g = group({10, 11, 20});
        m_adaptor->cycleReverse(false);
        QVERIFY(g->isCycling());
        QCOMPARE(g->activeWindow()->id, WindowId(20));

        m_adaptor->cycleReverse(true);
        QCOMPARE(g->activeWindow()->id, WindowId(20));

        m_adaptor->cycleModifierReleased();
        QCOMPARE(g->focusHistory().first(), WindowId(20));
    }

    void testProcessTerminated_forwarded()
    {
        group({10, 11, 20});
        m_adaptor->processTerminated(100);
        QCOMPARE(m_controller->groupStore()->count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Signals
    // ═══════════════════════════════════════════════════════════════════════════

    void testGroupsChanged()
    {
        QSignalSpy spy(m_adaptor, &TabGroupAdaptor::groupsChanged);
        const TabGroupPtr g = group({10, 11, 20});
        QVERIFY(spy.count() >= 1);

        spy.clear();
        m_controller->releaseTab(g, 2);
        QVERIFY(spy.count() >= 1);

        spy.clear();
        m_adaptor->disbandGroup(g->id().toString());
        QVERIFY(spy.count() >= 1);
    }

    void testWindowPickerRequested_carriesGroupId()
    {
        QSignalSpy spy(m_adaptor, &TabGroupAdaptor::windowPickerRequested);
        const TabGroupPtr g = group({10, 11});

        m_adaptor->newTab();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toString(), g->id().toString());
    }

    void testSwitcherSignals()
    {
        QSignalSpy requested(m_adaptor, &TabGroupAdaptor::switcherRequested);
        QSignalSpy step(m_adaptor, &TabGroupAdaptor::switcherStepRequested);
        QSignalSpy commit(m_adaptor, &TabGroupAdaptor::switcherCommitRequested);
        QSignalSpy dismissed(m_adaptor, &TabGroupAdaptor::switcherDismissed);

        m_adaptor->globalSwitcherOpen();
        QCOMPARE(requested.count(), 1);

        m_adaptor->switcherAdvance();
        m_adaptor->switcherRetreat();
        QCOMPARE(step.count(), 2);
        QCOMPARE(step.at(0).at(0).toInt(), 1);
        QCOMPARE(step.at(1).at(0).toInt(), -1);

        m_adaptor->cycleModifierReleased();
        QCOMPARE(commit.count(), 1);

        m_adaptor->globalSwitcherOpen();
        m_adaptor->escape();
        QCOMPARE(dismissed.count(), 1);
    }

private:
    TabGroupPtr group(std::initializer_list<WindowId> ids)
    {
        WindowRecordList windows;
        for (WindowId id : ids) {
            windows.append(recordFor(m_env->system, id));
        }
        return m_controller->createGroup(windows);
    }

    std::unique_ptr<FakeEnvironment> m_env;
    std::unique_ptr<TabController> m_controller;
    std::unique_ptr<QObject> m_host;
    TabGroupAdaptor* m_adaptor = nullptr;
};

QTEST_MAIN(TestTabGroupAdaptor)
#include "test_tab_group_adaptor.moc"
