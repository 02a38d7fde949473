// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mrutracker.h"
#include "constants.h"
#include "logging.h"
#include <QHash>
#include <QSet>
#include <cstdlib>

namespace PlasmaTabs {

namespace {

bool sitsOnFrame(const QRect& bounds, const QRect& frame)
{
    const int slack = Defaults::SwitcherGroupFrameSlack;
    return std::abs(bounds.x() - frame.x()) < slack && std::abs(bounds.y() - frame.y()) < slack
        && std::abs(bounds.width() - frame.width()) < slack && std::abs(bounds.height() - frame.height()) < slack;
}

} // namespace

void MruTracker::recordActivation(const MruEntry& entry)
{
    remove(entry);
    m_entries.prepend(entry);
    prune();
}

void MruTracker::appendIfMissing(const MruEntry& entry)
{
    if (m_entries.contains(entry)) {
        return;
    }
    m_entries.append(entry);
    prune();
}

void MruTracker::remove(const MruEntry& entry)
{
    m_entries.removeAll(entry);
}

void MruTracker::removeWindow(WindowId windowId)
{
    m_entries.removeIf([windowId](const MruEntry& entry) {
        return entry.windowId == windowId;
    });
}

void MruTracker::removeGroup(const QUuid& groupId)
{
    if (groupId.isNull()) {
        return;
    }
    const qsizetype removed = m_entries.removeIf([&groupId](const MruEntry& entry) {
        return entry.groupId == groupId;
    });
    if (removed > 0) {
        qCDebug(lcCore) << "Dropped" << removed << "history entries of group" << groupId;
    }
}

void MruTracker::clear()
{
    m_entries.clear();
}

void MruTracker::prune()
{
    if (m_entries.size() > Defaults::MruMaxEntries) {
        qCDebug(lcCore) << "Activation history full, dropping" << m_entries.size() - Defaults::MruMaxEntries
                        << "oldest entries";
        m_entries.resize(Defaults::MruMaxEntries);
    }
}

QList<QUuid> MruTracker::mruGroupOrder() const
{
    QList<QUuid> ordered;
    QSet<QUuid> seen;
    for (const MruEntry& entry : m_entries) {
        if (entry.isStandalone() || seen.contains(entry.groupId)) {
            continue;
        }
        seen.insert(entry.groupId);
        ordered.append(entry.groupId);
    }
    return ordered;
}

QList<SwitcherItem> MruTracker::buildSwitcherItems(const QList<TabGroupPtr>& groups,
                                                   const WindowRecordList& zOrderedWindows) const
{
    QHash<QUuid, TabGroupPtr> groupsById;
    QHash<WindowId, QUuid> groupOfWindow;
    for (const TabGroupPtr& group : groups) {
        groupsById.insert(group->id(), group);
        for (const WindowRecord& window : group->windows()) {
            groupOfWindow.insert(window.id, group->id());
        }
    }

    QHash<WindowId, WindowRecord> windowsById;
    for (const WindowRecord& window : zOrderedWindows) {
        if (!windowsById.contains(window.id)) {
            windowsById.insert(window.id, window);
        }
    }

    QList<SwitcherItem> items;
    QSet<QUuid> seenGroups;
    QSet<WindowId> seenWindows;

    auto appendGroup = [&](const QUuid& groupId) {
        const TabGroupPtr group = groupsById.value(groupId);
        if (!group || group->isEmpty() || seenGroups.contains(groupId)) {
            return;
        }
        seenGroups.insert(groupId);
        const QList<WindowId> memberIds = group->windowIds();
        for (WindowId windowId : memberIds) {
            seenWindows.insert(windowId);
        }
        items.append(SwitcherItem{group, WindowRecord()});
    };

    // History first
    for (const MruEntry& entry : m_entries) {
        if (!entry.isStandalone()) {
            appendGroup(entry.groupId);
            continue;
        }
        const auto it = windowsById.constFind(entry.windowId);
        if (it == windowsById.constEnd() || seenWindows.contains(entry.windowId)
            || groupOfWindow.contains(entry.windowId)) {
            continue;
        }
        items.append(SwitcherItem{TabGroupPtr(), *it});
        seenWindows.insert(entry.windowId);
    }

    // Then the rest in stacking order
    for (const WindowRecord& window : zOrderedWindows) {
        if (seenWindows.contains(window.id)) {
            continue;
        }
        const auto groupIt = groupOfWindow.constFind(window.id);
        if (groupIt != groupOfWindow.constEnd()) {
            appendGroup(*groupIt);
            continue;
        }

        bool onGroupFrame = false;
        if (window.cachedBounds) {
            for (const TabGroupPtr& group : groups) {
                if (sitsOnFrame(*window.cachedBounds, group->frame())) {
                    onGroupFrame = true;
                    break;
                }
            }
        }
        if (onGroupFrame) {
            continue;
        }
        items.append(SwitcherItem{TabGroupPtr(), window});
        seenWindows.insert(window.id);
    }

    // Groups with no listed member, e.g. all on another desktop
    for (const TabGroupPtr& group : groups) {
        appendGroup(group->id());
    }
    return items;
}

} // namespace PlasmaTabs
