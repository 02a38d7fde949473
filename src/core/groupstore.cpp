// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "groupstore.h"
#include "logging.h"
#include <QSet>

namespace PlasmaTabs {

GroupStore::GroupStore(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<TabGroupPtr>();
}

GroupStore::~GroupStore() = default;

int GroupStore::indexOfGroup(const QUuid& groupId) const
{
    for (int i = 0; i < m_groups.size(); ++i) {
        if (m_groups.at(i)->id() == groupId) {
            return i;
        }
    }
    return -1;
}

bool GroupStore::isTracked(const TabGroupPtr& group) const
{
    if (!group) {
        return false;
    }
    const int index = indexOfGroup(group->id());
    return index >= 0 && m_groups.at(index) == group;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

TabGroupPtr GroupStore::createGroup(const WindowRecordList& windows, const QRect& frame)
{
    if (windows.isEmpty()) {
        qCDebug(lcGroups) << "Refusing to create an empty group";
        return {};
    }

    QSet<WindowId> seen;
    for (const WindowRecord& window : windows) {
        if (seen.contains(window.id)) {
            qCWarning(lcGroups) << "Refusing group with duplicate window" << window.id;
            return {};
        }
        if (m_membership.contains(window.id)) {
            qCWarning(lcGroups) << "Refusing group: window" << window.id << "already in group"
                                << m_membership.value(window.id);
            return {};
        }
        seen.insert(window.id);
    }

    auto group = TabGroupPtr::create(windows, frame);
    m_groups.append(group);
    for (const WindowRecord& window : windows) {
        m_membership.insert(window.id, group->id());
    }

    qCInfo(lcGroups) << "Created group" << group->id() << "with" << windows.size() << "windows";
    Q_EMIT groupCreated(group);
    return group;
}

bool GroupStore::addWindow(const WindowRecord& window, const TabGroupPtr& group, int index)
{
    if (!isTracked(group)) {
        qCDebug(lcGroups) << "addWindow: group not tracked";
        return false;
    }
    if (m_membership.contains(window.id)) {
        qCDebug(lcGroups) << "addWindow: window" << window.id << "already grouped";
        return false;
    }
    if (!group->insertWindow(window, index)) {
        return false;
    }

    m_membership.insert(window.id, group->id());
    qCDebug(lcGroups) << "Added window" << window.id << "to group" << group->id();
    Q_EMIT groupChanged(group);
    return true;
}

std::optional<WindowRecord> GroupStore::releaseWindow(WindowId windowId, const TabGroupPtr& group)
{
    if (!isTracked(group)) {
        qCDebug(lcGroups) << "releaseWindow: group not tracked";
        return std::nullopt;
    }
    if (m_membership.value(windowId) != group->id()) {
        qCDebug(lcGroups) << "releaseWindow: window" << windowId << "not in group" << group->id();
        return std::nullopt;
    }

    const std::optional<WindowRecord> removed = group->removeWindow(windowId);
    if (!removed) {
        qCWarning(lcGroups) << "Membership lookup out of sync for window" << windowId;
        m_membership.remove(windowId);
        return std::nullopt;
    }
    m_membership.remove(windowId);
    qCDebug(lcGroups) << "Released window" << windowId << "from group" << group->id();

    if (group->isEmpty()) {
        dissolveGroup(group);
    } else {
        Q_EMIT groupChanged(group);
    }
    return removed;
}

WindowRecordList GroupStore::releaseWindows(const QList<WindowId>& windowIds, const TabGroupPtr& group)
{
    if (!isTracked(group)) {
        qCDebug(lcGroups) << "releaseWindows: group not tracked";
        return {};
    }

    QList<WindowId> members;
    for (WindowId windowId : windowIds) {
        if (m_membership.value(windowId) == group->id() && !members.contains(windowId)) {
            members.append(windowId);
        }
    }
    if (members.isEmpty()) {
        return {};
    }

    const WindowRecordList removed = group->removeWindows(members);
    for (const WindowRecord& window : removed) {
        m_membership.remove(window.id);
    }
    qCDebug(lcGroups) << "Released" << removed.size() << "windows from group" << group->id();

    if (group->isEmpty()) {
        dissolveGroup(group);
    } else {
        Q_EMIT groupChanged(group);
    }
    return removed;
}

void GroupStore::dissolveGroup(const TabGroupPtr& group)
{
    if (!group) {
        return;
    }
    const int index = indexOfGroup(group->id());
    if (index < 0) {
        return;
    }

    // Keep the group alive through the signal even if the caller's pointer was the tracked one
    const TabGroupPtr dissolved = m_groups.takeAt(index);
    for (auto it = m_membership.begin(); it != m_membership.end();) {
        if (it.value() == dissolved->id()) {
            it = m_membership.erase(it);
        } else {
            ++it;
        }
    }

    qCInfo(lcGroups) << "Dissolved group" << dissolved->id() << "remaining members" << dissolved->count();
    Q_EMIT groupDissolved(dissolved);
}

void GroupStore::dissolveAll()
{
    if (m_groups.isEmpty()) {
        return;
    }
    qCInfo(lcGroups) << "Dissolving all" << m_groups.size() << "groups";
    m_groups.clear();
    m_membership.clear();
    Q_EMIT allGroupsDissolved();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

TabGroupPtr GroupStore::groupForWindow(WindowId windowId) const
{
    const auto it = m_membership.constFind(windowId);
    if (it == m_membership.constEnd()) {
        return {};
    }
    return groupById(it.value());
}

bool GroupStore::isWindowGrouped(WindowId windowId) const
{
    return m_membership.contains(windowId);
}

TabGroupPtr GroupStore::groupById(const QUuid& groupId) const
{
    const int index = indexOfGroup(groupId);
    return index >= 0 ? m_groups.at(index) : TabGroupPtr();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Member record updates
// ═══════════════════════════════════════════════════════════════════════════════

bool GroupStore::updateWindowTitle(WindowId windowId, const QString& title)
{
    const TabGroupPtr group = groupForWindow(windowId);
    if (!group || !group->setWindowTitle(windowId, title)) {
        return false;
    }
    Q_EMIT groupChanged(group);
    return true;
}

bool GroupStore::updateWindowElement(WindowId windowId, const ElementRef& element, bool isPlaceholder)
{
    const TabGroupPtr group = groupForWindow(windowId);
    if (!group) {
        return false;
    }
    return group->setWindowElement(windowId, element, isPlaceholder);
}

bool GroupStore::setWindowFullScreen(WindowId windowId, bool fullScreen)
{
    const TabGroupPtr group = groupForWindow(windowId);
    if (!group || !group->setWindowFullScreen(windowId, fullScreen)) {
        return false;
    }
    Q_EMIT groupChanged(group);
    return true;
}

} // namespace PlasmaTabs
