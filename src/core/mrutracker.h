// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "groupstore.h"
#include "windowrecord.h"
#include <QList>
#include <QUuid>

namespace PlasmaTabs {

/**
 * @brief One activation in the global most-recently-used list
 *
 * A whole-group entry has a group id and no window, a grouped-window entry
 * has both, a standalone-window entry has a window and a null group id.
 */
struct PLASMATABS_EXPORT MruEntry
{
    QUuid groupId;
    WindowId windowId = 0;

    static MruEntry group(const QUuid& groupId)
    {
        return MruEntry{groupId, 0};
    }
    static MruEntry groupWindow(const QUuid& groupId, WindowId windowId)
    {
        return MruEntry{groupId, windowId};
    }
    static MruEntry window(WindowId windowId)
    {
        return MruEntry{QUuid(), windowId};
    }

    bool isStandalone() const
    {
        return groupId.isNull();
    }

    bool operator==(const MruEntry& other) const
    {
        return groupId == other.groupId && windowId == other.windowId;
    }
};

/**
 * @brief One row of the global switcher: a whole group or a standalone window
 */
struct PLASMATABS_EXPORT SwitcherItem
{
    TabGroupPtr group;
    WindowRecord window; ///< Only meaningful when group is null

    bool isGroup() const
    {
        return !group.isNull();
    }
    QList<WindowId> windowIds() const
    {
        return group ? group->windowIds() : QList<WindowId>{window.id};
    }
};

/**
 * @brief Cross-group activation history that orders the global switcher
 *
 * Newest first, capped at Defaults::MruMaxEntries. Entries are not validated
 * against the store; buildSwitcherItems() skips anything that no longer exists.
 */
class PLASMATABS_EXPORT MruTracker
{
public:
    const QList<MruEntry>& entries() const
    {
        return m_entries;
    }
    int count() const
    {
        return m_entries.size();
    }

    /**
     * @brief Move @p entry to the front, inserting it if new
     */
    void recordActivation(const MruEntry& entry);

    /**
     * @brief Add @p entry at the back unless already present
     */
    void appendIfMissing(const MruEntry& entry);

    void remove(const MruEntry& entry);

    /// Drop standalone and grouped entries for the window
    void removeWindow(WindowId windowId);

    /// Drop whole-group and grouped-window entries of the group
    void removeGroup(const QUuid& groupId);

    void clear();

    /**
     * @brief Distinct group ids in the order their newest entry appears
     */
    QList<QUuid> mruGroupOrder() const;

    /**
     * @brief Order the switcher rows
     *
     * Groups and standalone windows follow the history first. Windows the
     * history does not mention follow in @p zOrderedWindows order, where a
     * grouped window stands for its group. A standalone window whose bounds
     * sit on a group frame is skipped. Groups still unseen come last.
     */
    QList<SwitcherItem> buildSwitcherItems(const QList<TabGroupPtr>& groups,
                                           const WindowRecordList& zOrderedWindows) const;

private:
    void prune();

    QList<MruEntry> m_entries;
};

} // namespace PlasmaTabs
