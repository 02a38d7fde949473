// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabgroupadaptor.h"
#include "../core/logging.h"
#include "../core/tabcontroller.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

namespace PlasmaTabs {

TabGroupAdaptor::TabGroupAdaptor(TabController* controller, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_controller(controller)
{
    Q_ASSERT(controller);

    GroupStore* store = m_controller->groupStore();
    connect(store, &GroupStore::groupCreated, this, &TabGroupAdaptor::groupsChanged);
    connect(store, &GroupStore::groupChanged, this, &TabGroupAdaptor::groupsChanged);
    connect(store, &GroupStore::groupDissolved, this, &TabGroupAdaptor::groupsChanged);
    connect(store, &GroupStore::allGroupsDissolved, this, &TabGroupAdaptor::groupsChanged);

    connect(m_controller, &TabController::windowPickerRequested, this, [this](const TabGroupPtr& group) {
        Q_EMIT windowPickerRequested(group ? group->id().toString() : QString());
    });
    connect(m_controller, &TabController::switcherRequested, this, &TabGroupAdaptor::switcherRequested);
    connect(m_controller, &TabController::switcherStepRequested, this, &TabGroupAdaptor::switcherStepRequested);
    connect(m_controller, &TabController::switcherCommitRequested, this,
            &TabGroupAdaptor::switcherCommitRequested);
    connect(m_controller, &TabController::switcherDismissed, this, &TabGroupAdaptor::switcherDismissed);
}

TabGroupPtr TabGroupAdaptor::findGroup(const QString& groupId, const char* operation) const
{
    const QUuid uuid = QUuid::fromString(groupId);
    if (uuid.isNull()) {
        qCWarning(lcDbus) << "Invalid group id for" << operation << ":" << groupId;
        return {};
    }
    const TabGroupPtr group = m_controller->groupStore()->groupById(uuid);
    if (!group) {
        qCDebug(lcDbus) << "No group" << groupId << "for" << operation;
    }
    return group;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Hotkey commands
// ═══════════════════════════════════════════════════════════════════════════════

void TabGroupAdaptor::newTab()
{
    m_controller->handleNewTab();
}

void TabGroupAdaptor::releaseTab()
{
    m_controller->handleReleaseTab();
}

void TabGroupAdaptor::cycleStart(bool autoRepeat)
{
    m_controller->handleCycleStart(autoRepeat);
}

void TabGroupAdaptor::cycleReverse(bool autoRepeat)
{
    m_controller->handleCycleReverse(autoRepeat);
}

void TabGroupAdaptor::cycleModifierReleased()
{
    m_controller->handleCycleModifierReleased();
}

void TabGroupAdaptor::switchToTab(int slot)
{
    m_controller->handleSwitchToTab(slot);
}

void TabGroupAdaptor::globalSwitcherOpen()
{
    m_controller->handleGlobalSwitcherOpen();
}

void TabGroupAdaptor::switcherAdvance()
{
    m_controller->handleSwitcherAdvance();
}

void TabGroupAdaptor::switcherRetreat()
{
    m_controller->handleSwitcherRetreat();
}

void TabGroupAdaptor::escape()
{
    m_controller->handleEscape();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

QStringList TabGroupAdaptor::groupIds() const
{
    QStringList ids;
    const QList<TabGroupPtr>& groups = m_controller->groupStore()->groups();
    ids.reserve(groups.size());
    for (const TabGroupPtr& group : groups) {
        ids.append(group->id().toString());
    }
    return ids;
}

QString TabGroupAdaptor::activeGroupId() const
{
    const TabGroupPtr group = m_controller->activeGroup();
    return group ? group->id().toString() : QString();
}

QString TabGroupAdaptor::windowsInGroup(const QString& groupId) const
{
    QJsonArray windows;
    if (const TabGroupPtr group = findGroup(groupId, "windowsInGroup")) {
        const int activeIndex = group->activeIndex();
        const WindowRecordList& members = group->windows();
        for (int i = 0; i < members.size(); ++i) {
            const WindowRecord& window = members.at(i);
            QJsonObject obj;
            obj[QStringLiteral("id")] = static_cast<qint64>(window.id);
            obj[QStringLiteral("pid")] = window.pid;
            obj[QStringLiteral("appId")] = window.appId;
            obj[QStringLiteral("appName")] = window.appName;
            obj[QStringLiteral("title")] = window.title;
            obj[QStringLiteral("iconName")] = window.iconName;
            obj[QStringLiteral("active")] = i == activeIndex;
            obj[QStringLiteral("fullScreen")] = window.isFullScreen;
            windows.append(obj);
        }
    }
    return QString::fromUtf8(QJsonDocument(windows).toJson(QJsonDocument::Compact));
}

QString TabGroupAdaptor::switcherItems() const
{
    QJsonArray rows;
    const QList<SwitcherItem> items = m_controller->switcherItems();
    for (const SwitcherItem& item : items) {
        QJsonObject obj;
        QJsonArray ids;
        const QList<WindowId> windowIds = item.windowIds();
        for (WindowId windowId : windowIds) {
            ids.append(static_cast<qint64>(windowId));
        }
        obj[QStringLiteral("windowIds")] = ids;
        if (item.isGroup()) {
            obj[QStringLiteral("groupId")] = item.group->id().toString();
            if (const auto active = item.group->activeWindow()) {
                obj[QStringLiteral("title")] = active->title;
            }
        } else {
            obj[QStringLiteral("windowId")] = static_cast<qint64>(item.window.id);
            obj[QStringLiteral("title")] = item.window.title;
            obj[QStringLiteral("appName")] = item.window.appName;
        }
        rows.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(rows).toJson(QJsonDocument::Compact));
}

void TabGroupAdaptor::disbandGroup(const QString& groupId)
{
    if (const TabGroupPtr group = findGroup(groupId, "disbandGroup")) {
        m_controller->disbandGroup(group);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Process lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

void TabGroupAdaptor::processActivated(qint64 pid)
{
    m_controller->handleProcessActivated(pid);
}

void TabGroupAdaptor::processTerminated(qint64 pid)
{
    m_controller->handleProcessTerminated(pid);
}

} // namespace PlasmaTabs
