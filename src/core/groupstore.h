// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "tabgroup.h"
#include <QHash>
#include <QList>
#include <QObject>
#include <QSharedPointer>
#include <QUuid>
#include <optional>

namespace PlasmaTabs {

using TabGroupPtr = QSharedPointer<TabGroup>;

/**
 * @brief Collection of tracked tab groups
 *
 * Owns the one-group-per-window invariant: a window id belongs to at most
 * one tracked group. Membership is kept as an id relation in a side lookup
 * (window id -> group id) that is checked before every mutation.
 *
 * Groups are handed out as shared pointers. A dissolved group is no longer
 * tracked but keeps its member list for as long as someone holds it, so
 * dissolution never invalidates a caller's view of the members.
 *
 * All mutation happens on the UI thread.
 */
class PLASMATABS_EXPORT GroupStore : public QObject
{
    Q_OBJECT

public:
    explicit GroupStore(QObject* parent = nullptr);
    ~GroupStore() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Create and track a group
     * @param windows Members in tab order, also the initial focus history
     * @param frame Shared frame of the group
     * @return The group, or null if @p windows is empty, contains a
     *         duplicate id, or contains an id that is already grouped
     */
    TabGroupPtr createGroup(const WindowRecordList& windows, const QRect& frame);

    /**
     * @brief Add a window to a tracked group
     * @param index Tab position to insert at; out of range (the default) appends
     * @return false if the group is untracked or the window is already grouped
     */
    bool addWindow(const WindowRecord& window, const TabGroupPtr& group, int index = -1);

    /**
     * @brief Remove a window from a tracked group
     *
     * The group is dissolved when its last member is released.
     * @return The removed record, nullopt if the group is untracked or the
     *         window is not a member
     */
    std::optional<WindowRecord> releaseWindow(WindowId windowId, const TabGroupPtr& group);

    /**
     * @brief Remove several windows from a tracked group in one change
     *
     * Ids that are not members are skipped. Dissolves the group if it ends up empty.
     * @return The removed records in their former tab order
     */
    WindowRecordList releaseWindows(const QList<WindowId>& windowIds, const TabGroupPtr& group);

    /**
     * @brief Stop tracking a group; its members stay on the object
     */
    void dissolveGroup(const TabGroupPtr& group);

    void dissolveAll();

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    TabGroupPtr groupForWindow(WindowId windowId) const;
    bool isWindowGrouped(WindowId windowId) const;
    TabGroupPtr groupById(const QUuid& groupId) const;
    bool isTracked(const TabGroupPtr& group) const;

    const QList<TabGroupPtr>& groups() const
    {
        return m_groups;
    }
    int count() const
    {
        return m_groups.size();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Member record updates
    // ═══════════════════════════════════════════════════════════════════════════

    bool updateWindowTitle(WindowId windowId, const QString& title);
    bool updateWindowElement(WindowId windowId, const ElementRef& element, bool isPlaceholder = false);
    bool setWindowFullScreen(WindowId windowId, bool fullScreen);

Q_SIGNALS:
    void groupCreated(const PlasmaTabs::TabGroupPtr& group);
    void groupChanged(const PlasmaTabs::TabGroupPtr& group);
    void groupDissolved(const PlasmaTabs::TabGroupPtr& group);
    void allGroupsDissolved();

private:
    int indexOfGroup(const QUuid& groupId) const;

    QList<TabGroupPtr> m_groups;
    QHash<WindowId, QUuid> m_membership;
};

} // namespace PlasmaTabs

Q_DECLARE_METATYPE(PlasmaTabs::TabGroupPtr)
