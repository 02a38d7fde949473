// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "windowrecord.h"
#include <QList>
#include <QObject>
#include <QRect>
#include <QUuid>
#include <optional>

namespace PlasmaTabs {

class GroupStore;

/**
 * @brief One tab group: member windows sharing a frame, plus MRU cycling state
 *
 * Tab order (the order of windows()) is insertion order and is what the tab
 * bar shows. Focus history is a separate most-recent-first list of window ids
 * used by hotkey cycling.
 *
 * Cycling state machine:
 *   Idle --nextInMRUCycle()--> Cycling --endCycle()--> Idle
 *
 * On entering Cycling the focus history is frozen into a snapshot. Focus
 * events that arrive while cycling do not touch the live history, so one
 * gesture can neither visit a window twice nor skip one.
 *
 * Membership changes go through GroupStore, which owns the cross-group
 * one-group-per-window invariant.
 */
class PLASMATABS_EXPORT TabGroup : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QUuid id READ id CONSTANT)
    Q_PROPERTY(int count READ count NOTIFY windowsChanged)
    Q_PROPERTY(int activeIndex READ activeIndex NOTIFY activeIndexChanged)
    Q_PROPERTY(QRect frame READ frame WRITE setFrame NOTIFY frameChanged)
    Q_PROPERTY(bool cycling READ isCycling NOTIFY cyclingChanged)

public:
    /**
     * @brief Create a group; tab order and focus history follow @p windows
     */
    explicit TabGroup(const WindowRecordList& windows, const QRect& frame, QObject* parent = nullptr);
    ~TabGroup() override = default;

    // Prevent copying (QObject rule)
    TabGroup(const TabGroup&) = delete;
    TabGroup& operator=(const TabGroup&) = delete;

    QUuid id() const
    {
        return m_id;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Members
    // ═══════════════════════════════════════════════════════════════════════

    const WindowRecordList& windows() const
    {
        return m_windows;
    }
    int count() const
    {
        return m_windows.size();
    }
    bool isEmpty() const
    {
        return m_windows.isEmpty();
    }
    bool contains(WindowId windowId) const;

    /**
     * @brief Tab index of a window, -1 if not a member
     */
    int indexOf(WindowId windowId) const;

    std::optional<WindowRecord> window(WindowId windowId) const;
    QList<WindowId> windowIds() const;

    /**
     * @brief Members that are not full screen, in tab order
     *
     * These are the windows that share the group frame.
     */
    WindowRecordList visibleWindows() const;
    int visibleCount() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Active tab and frame
    // ═══════════════════════════════════════════════════════════════════════

    int activeIndex() const
    {
        return m_activeIndex;
    }

    /**
     * @brief Active window, nullopt when the group is empty
     */
    std::optional<WindowRecord> activeWindow() const;

    /**
     * @brief Make the tab at @p index active (out-of-range is ignored)
     */
    void switchTo(int index);
    void switchTo(WindowId windowId);

    QRect frame() const
    {
        return m_frame;
    }
    void setFrame(const QRect& frame);

    /**
     * @brief Reorder a tab
     *
     * @p destination uses list-removal-then-insertion semantics: it is an
     * index into the list before removal, so a destination past the source
     * lands one slot lower. Valid range is [0, count()]. The active index
     * keeps pointing at the same window. Focus history and cycle state are
     * not touched.
     * @return false if either index is out of range
     */
    bool moveTab(int source, int destination);

    /**
     * @brief Move several tabs so they form one block starting at @p destination
     *
     * The moved tabs keep their relative order. @p destination is an index
     * into the list after the moved tabs were taken out and is clamped to
     * that list. Ids that are not members are ignored.
     * @return false if none of @p ids is a member
     */
    bool moveTabs(const QList<WindowId>& ids, int destination);

    // ═══════════════════════════════════════════════════════════════════════
    // MRU focus history and cycling
    // ═══════════════════════════════════════════════════════════════════════

    const QList<WindowId>& focusHistory() const
    {
        return m_focusHistory;
    }

    /**
     * @brief Move a window to the front of the focus history
     *
     * Ignored while cycling, and for ids that are not members.
     */
    void recordFocus(WindowId windowId);

    bool isCycling() const
    {
        return m_cycle.has_value();
    }

    /**
     * @brief Tab index of the next window in MRU order
     *
     * The first call while idle starts a cycle and freezes the order. Windows
     * closed or gone full screen since are skipped.
     * @return nullopt if fewer than two windows that are not full screen remain
     */
    std::optional<int> nextInMRUCycle();

    /**
     * @brief Same as nextInMRUCycle(), stepping backwards through the snapshot
     */
    std::optional<int> previousInMRUCycle();

    /**
     * @brief Finish the cycling gesture and commit the landed window to the history front
     *
     * Falls back to the active window if the landed window is gone. No-op
     * when not cycling.
     */
    void endCycle();

    /**
     * @brief Snapshot taken at cycle start, empty when idle
     */
    QList<WindowId> frozenCycleOrder() const;

Q_SIGNALS:
    void windowsChanged();
    void activeIndexChanged(int index);
    void frameChanged(const QRect& frame);
    void cyclingChanged(bool cycling);
    void windowTitleChanged(PlasmaTabs::WindowId windowId, const QString& title);

private:
    friend class GroupStore;

    // Membership mutators, reachable only through GroupStore
    bool insertWindow(const WindowRecord& window, int index);
    std::optional<WindowRecord> removeWindow(WindowId windowId);
    WindowRecordList removeWindows(const QList<WindowId>& ids);
    bool setWindowTitle(WindowId windowId, const QString& title);
    bool setWindowElement(WindowId windowId, const ElementRef& element, bool isPlaceholder);
    bool setWindowFullScreen(WindowId windowId, bool fullScreen);

    bool isCycleCandidate(WindowId windowId) const;
    std::optional<int> stepCycle(int delta);

    struct CycleState
    {
        QList<WindowId> frozenOrder;
        int position = 0;
    };

    QUuid m_id;
    WindowRecordList m_windows;
    int m_activeIndex = 0;
    QRect m_frame;
    QList<WindowId> m_focusHistory;
    std::optional<CycleState> m_cycle;
};

} // namespace PlasmaTabs
