// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "context.h"
#include "expectedframetracker.h"
#include "groupstore.h"
#include "mrutracker.h"
#include <QElapsedTimer>
#include <QHash>
#include <QObject>
#include <QUuid>

class QTimer;

namespace PlasmaTabs {

class WindowEventBridge;
class WindowResolver;

/**
 * @brief UI-thread coordinator for tab groups
 *
 * Owns the group store, the event bridge and the resolver, and applies
 * the reactions that keep groups consistent with the desktop:
 *
 * - Hotkey commands (new tab, release, MRU cycling, direct tab slots,
 *   global switcher) arrive through the handle*() entry points.
 * - Event bridge notifications arrive through the private slots. Moves and
 *   resizes of the active window are propagated to the other members; echoes
 *   of our own frame writes are filtered by ExpectedFrameTracker.
 * - Frame writes and raises that fail are checked against the window-server
 *   list; a window that is gone takes the same path as a destroy notification.
 *
 * Grouped windows give up TabBarHeight pixels at the top of their frame to
 * the tab bar. Windows leaving through dissolution get that space back.
 */
class PLASMATABS_EXPORT TabController : public QObject
{
    Q_OBJECT

public:
    explicit TabController(const TabbingContext& context, QObject* parent = nullptr);
    ~TabController() override;

    /**
     * @brief Check accessibility permission
     *
     * Emits accessibilityPermissionRequired() the first time permission is
     * found missing. Not retried automatically.
     * @return true if the accessibility API is usable
     */
    bool start();

    /**
     * @brief Give every grouped window its tab bar space back and drop all groups
     */
    void shutdown();

    GroupStore* groupStore() const
    {
        return m_store;
    }
    WindowEventBridge* eventBridge() const
    {
        return m_bridge;
    }
    WindowResolver* resolver() const
    {
        return m_resolver;
    }
    const MruTracker& mruTracker() const
    {
        return m_mru;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Group operations (tab bar and picker actions)
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Group windows under the first window's frame, shrunk for the tab bar
     * @return The group, null if a window is already grouped or listed twice,
     *         or the first window's frame could not be read
     */
    TabGroupPtr createGroup(const WindowRecordList& windows);

    /**
     * @brief Add a window as the new active tab
     * @param index Tab position; out of range (the default) appends
     */
    bool addWindow(const WindowRecord& window, const TabGroupPtr& group, int index = -1);

    void switchTab(const TabGroupPtr& group, int index);
    void releaseTab(const TabGroupPtr& group, int index);

    /**
     * @brief Release several tabs at once; non-members are ignored
     */
    void releaseTabs(const TabGroupPtr& group, const QList<WindowId>& windowIds);

    /**
     * @brief Move tabs as a block to @p destination (tab bar drag of a selection)
     */
    bool moveTabs(const TabGroupPtr& group, const QList<WindowId>& windowIds, int destination);

    /**
     * @brief Move the whole group, e.g. after the tab bar was dragged
     */
    void moveGroup(const TabGroupPtr& group, const QRect& frame);

    /**
     * @brief Dissolve a group and restore every member's full frame
     */
    void disbandGroup(const TabGroupPtr& group);

    /**
     * @brief Rows of the global switcher, most recently used first
     *
     * Built from the activation history and the last discovery result.
     */
    QList<SwitcherItem> switcherItems() const;

    /**
     * @brief Group the user is interacting with
     *
     * The last group that had focus if still tracked, otherwise the group of
     * the frontmost process's focused window.
     */
    TabGroupPtr activeGroup() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Hotkey commands
    // ═══════════════════════════════════════════════════════════════════════════

    void handleNewTab();
    void handleReleaseTab();

    /**
     * @brief Step to the next window in MRU order; starts a cycle if idle
     * @param autoRepeat Key-repeat duplicates are ignored
     */
    void handleCycleStart(bool autoRepeat = false);

    /**
     * @brief Like handleCycleStart(), stepping back through the MRU order
     */
    void handleCycleReverse(bool autoRepeat = false);

    /**
     * @brief End the cycling gesture and commit the landed window
     */
    void handleCycleModifierReleased();

    /**
     * @brief Activate tab slot @p slot (1-based, 1..9)
     */
    void handleSwitchToTab(int slot);

    void handleGlobalSwitcherOpen();
    void handleSwitcherAdvance();
    void handleSwitcherRetreat();
    void handleEscape();

    bool isSwitcherOpen() const
    {
        return m_switcherOpen;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Process lifecycle
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief A process came to the foreground without changing its focused window
     */
    void handleProcessActivated(ProcessId pid);

    /**
     * @brief Release every grouped window of a process that exited
     */
    void handleProcessTerminated(ProcessId pid);

Q_SIGNALS:
    void accessibilityPermissionRequired();

    /**
     * @brief Ask the presentation layer to show the window picker for @p group
     */
    void windowPickerRequested(const PlasmaTabs::TabGroupPtr& group);

    void switcherRequested();
    void switcherStepRequested(int delta);

    /**
     * @brief Modifier released while the switcher was open: activate its selection
     */
    void switcherCommitRequested();
    void switcherDismissed();

private Q_SLOTS:
    void onWindowMoved(PlasmaTabs::WindowId windowId);
    void onWindowResized(PlasmaTabs::WindowId windowId);
    void onWindowDestroyed(PlasmaTabs::WindowId windowId);
    void onTitleChanged(PlasmaTabs::WindowId windowId);
    void onWindowFocused(PlasmaTabs::ProcessId pid, const PlasmaTabs::ElementRef& element);
    void onGroupDissolved(const PlasmaTabs::TabGroupPtr& group);

private:
    int tabBarHeight() const;

    /// Resolve a placeholder member to its concrete element and start observing it
    WindowRecord ensureConcreteElement(const WindowRecord& window);

    bool applyFrame(const WindowRecord& window, const QRect& frame);
    void raiseWindow(const WindowRecord& window);
    void activateWindow(const TabGroupPtr& group, const WindowRecord& window);
    void restoreFullFrame(const WindowRecord& window);
    void syncGroupFrame(const TabGroupPtr& group, WindowId sourceId, const QRect& frame);
    void scheduleResync(const TabGroupPtr& group);
    void resync(const QUuid& groupId);
    void finishRelease(const TabGroupPtr& group);
    void cycle(int delta, bool autoRepeat);
    void recordActivation(const TabGroupPtr& group, WindowId windowId);
    void checkStaleWindow(WindowId windowId);
    bool inCycleCooldown() const;

    const TabbingContext& m_context;
    GroupStore* m_store = nullptr;
    WindowEventBridge* m_bridge = nullptr;
    WindowResolver* m_resolver = nullptr;
    ExpectedFrameTracker m_frames;
    MruTracker m_mru;

    QUuid m_lastActiveGroupId;
    TabGroupPtr m_cyclingGroup;
    QElapsedTimer m_cycleEnded;
    QHash<QUuid, QTimer*> m_resyncTimers;
    bool m_switcherOpen = false;
    bool m_permissionRequested = false;
};

} // namespace PlasmaTabs
