// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabcontroller.h"
#include "constants.h"
#include "logging.h"
#include "settings_interfaces.h"
#include "windoweventbridge.h"
#include "windowresolver.h"
#include "windowsource.h"
#include <QSet>
#include <QTimer>

namespace PlasmaTabs {

TabController::TabController(const TabbingContext& context, QObject* parent)
    : QObject(parent)
    , m_context(context)
    , m_store(new GroupStore(this))
    , m_bridge(new WindowEventBridge(context, this))
    , m_resolver(new WindowResolver(context, this))
    , m_frames(*context.settings)
{
    Q_ASSERT(context.isValid());

    connect(m_bridge, &WindowEventBridge::windowMoved, this, &TabController::onWindowMoved);
    connect(m_bridge, &WindowEventBridge::windowResized, this, &TabController::onWindowResized);
    connect(m_bridge, &WindowEventBridge::windowDestroyed, this, &TabController::onWindowDestroyed);
    connect(m_bridge, &WindowEventBridge::titleChanged, this, &TabController::onTitleChanged);
    connect(m_bridge, &WindowEventBridge::windowFocused, this, &TabController::onWindowFocused);
    connect(m_store, &GroupStore::groupDissolved, this, &TabController::onGroupDissolved);
}

TabController::~TabController() = default;

bool TabController::start()
{
    if (!m_context.accessibility->isTrusted()) {
        if (!m_permissionRequested) {
            m_permissionRequested = true;
            qCWarning(lcController) << "Accessibility access not granted; window discovery is disabled";
            Q_EMIT accessibilityPermissionRequired();
        }
        return false;
    }
    qCInfo(lcController) << "Tab controller started";
    return true;
}

void TabController::shutdown()
{
    m_bridge->stopAll();

    const QList<TabGroupPtr> groups = m_store->groups();
    for (const TabGroupPtr& group : groups) {
        const WindowRecordList members = group->windows();
        for (const WindowRecord& window : members) {
            restoreFullFrame(window);
        }
    }

    qDeleteAll(m_resyncTimers);
    m_resyncTimers.clear();
    m_cyclingGroup.reset();
    m_lastActiveGroupId = QUuid();
    m_frames.clearAll();
    m_mru.clear();
    m_store->dissolveAll();
    qCInfo(lcController) << "Tab controller shut down," << groups.size() << "groups released";
}

int TabController::tabBarHeight() const
{
    return m_context.settings->tabBarHeight();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window helpers
// ═══════════════════════════════════════════════════════════════════════════════

WindowRecord TabController::ensureConcreteElement(const WindowRecord& window)
{
    if (!window.isPlaceholder) {
        return window;
    }

    const ElementRef element = m_resolver->resolveElement(window);
    if (element.isNull()) {
        qCDebug(lcController) << "Window" << window.id << "still has no concrete element";
        return window;
    }

    WindowRecord resolved = window;
    resolved.element = element;
    resolved.isPlaceholder = false;
    if (m_store->updateWindowElement(window.id, element, false)) {
        m_bridge->observe(resolved);
    }
    return resolved;
}

bool TabController::applyFrame(const WindowRecord& window, const QRect& frame)
{
    if (window.element.isNull() || window.isPlaceholder) {
        qCDebug(lcController) << "Cannot place window" << window.id << "without a concrete element";
        return false;
    }

    IAccessibilityBackend* accessibility = m_context.accessibility;
    const bool moved = accessibility->setPosition(window.element, frame.topLeft());
    const bool resized = accessibility->setSize(window.element, frame.size());
    if (!moved || !resized) {
        qCDebug(lcController) << "Frame write failed for window" << window.id;
        checkStaleWindow(window.id);
        return false;
    }
    return true;
}

void TabController::raiseWindow(const WindowRecord& window)
{
    if (window.element.isNull() || window.isPlaceholder) {
        return;
    }
    if (!m_context.accessibility->raise(window.element)) {
        qCDebug(lcController) << "Raise failed for window" << window.id;
        checkStaleWindow(window.id);
    }
}

void TabController::activateWindow(const TabGroupPtr& group, const WindowRecord& window)
{
    if (!m_context.windowServer->activateProcess(window.pid)) {
        qCDebug(lcController) << "Could not activate process" << window.pid;
    }

    const WindowRecord concrete = ensureConcreteElement(window);

    // Re-apply the canonical frame in case an earlier sync only partially landed
    if (!concrete.isFullScreen) {
        m_frames.setExpectedFrame(group->frame(), {concrete.id});
        applyFrame(concrete, group->frame());
    }
    raiseWindow(concrete);
}

void TabController::restoreFullFrame(const WindowRecord& window)
{
    // A full screen window never gave up space to the tab bar
    if (window.element.isNull() || window.isPlaceholder || window.isFullScreen) {
        return;
    }

    IAccessibilityBackend* accessibility = m_context.accessibility;
    const std::optional<QRect> frame = accessibility->frame(window.element);
    if (!frame) {
        return;
    }

    const int bar = tabBarHeight();
    const QRect expanded(frame->x(), frame->y() - bar, frame->width(), frame->height() + bar);
    if (!accessibility->setPosition(window.element, expanded.topLeft())
        || !accessibility->setSize(window.element, expanded.size())) {
        qCDebug(lcController) << "Could not restore full frame of window" << window.id;
    }
}

void TabController::checkStaleWindow(WindowId windowId)
{
    if (m_context.windowServer->windowExists(windowId)) {
        return;
    }
    qCInfo(lcController) << "Window" << windowId << "is gone, treating as destroyed";
    // Deferred: callers may be iterating the group's members
    QMetaObject::invokeMethod(
        this,
        [this, windowId]() {
            onWindowDestroyed(windowId);
        },
        Qt::QueuedConnection);
}

bool TabController::inCycleCooldown() const
{
    return m_cycleEnded.isValid() && m_cycleEnded.elapsed() < Defaults::CycleCooldownMs;
}

void TabController::recordActivation(const TabGroupPtr& group, WindowId windowId)
{
    group->recordFocus(windowId);
    m_mru.recordActivation(MruEntry::groupWindow(group->id(), windowId));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Group operations
// ═══════════════════════════════════════════════════════════════════════════════

TabGroupPtr TabController::createGroup(const WindowRecordList& windows)
{
    if (windows.isEmpty()) {
        return {};
    }

    // Reject before touching any element or observer
    QSet<WindowId> seen;
    for (const WindowRecord& window : windows) {
        if (m_store->isWindowGrouped(window.id)) {
            qCWarning(lcController) << "Cannot create group: window" << window.id << "is already grouped";
            return {};
        }
        if (seen.contains(window.id)) {
            qCWarning(lcController) << "Cannot create group: window" << window.id << "listed twice";
            return {};
        }
        seen.insert(window.id);
    }

    WindowRecordList members;
    members.reserve(windows.size());
    for (const WindowRecord& window : windows) {
        members.append(ensureConcreteElement(window));
    }

    const WindowRecord& first = members.constFirst();
    std::optional<QRect> firstFrame;
    if (!first.isPlaceholder) {
        firstFrame = m_context.accessibility->frame(first.element);
    }
    if (!firstFrame) {
        firstFrame = first.cachedBounds;
    }
    if (!firstFrame) {
        qCWarning(lcController) << "Cannot create group: no frame for window" << first.id;
        return {};
    }

    // The tab bar takes the top of the first window's frame
    const int bar = tabBarHeight();
    const QRect frame(firstFrame->x(), firstFrame->y() + bar, firstFrame->width(),
                      qMax(firstFrame->height() - bar, bar));

    const TabGroupPtr group = m_store->createGroup(members, frame);
    if (!group) {
        return {};
    }

    m_frames.setExpectedFrame(frame, group->windowIds());
    const WindowRecordList grouped = group->windows();
    for (const WindowRecord& window : grouped) {
        applyFrame(window, frame);
    }
    for (const WindowRecord& window : grouped) {
        m_bridge->observe(window);
    }

    m_lastActiveGroupId = group->id();
    for (const WindowRecord& window : grouped) {
        m_mru.removeWindow(window.id);
    }
    if (const auto active = group->activeWindow()) {
        m_mru.recordActivation(MruEntry::groupWindow(group->id(), active->id));
        // Raised last so it ends up above the other members
        raiseWindow(*active);
    }
    return group;
}

bool TabController::addWindow(const WindowRecord& window, const TabGroupPtr& group, int index)
{
    if (!m_store->isTracked(group) || m_store->isWindowGrouped(window.id)) {
        return false;
    }

    const WindowRecord concrete = ensureConcreteElement(window);
    if (!m_store->addWindow(concrete, group, index)) {
        return false;
    }

    m_frames.setExpectedFrame(group->frame(), {concrete.id});
    applyFrame(concrete, group->frame());
    m_bridge->observe(concrete);

    group->switchTo(group->indexOf(concrete.id));
    m_lastActiveGroupId = group->id();
    m_mru.removeWindow(concrete.id);
    m_mru.recordActivation(MruEntry::groupWindow(group->id(), concrete.id));
    raiseWindow(concrete);
    return true;
}

void TabController::switchTab(const TabGroupPtr& group, int index)
{
    if (!m_store->isTracked(group)) {
        return;
    }

    group->switchTo(index);
    const auto active = group->activeWindow();
    if (!active) {
        return;
    }

    m_lastActiveGroupId = group->id();
    // Cycling commits to the history when the gesture ends
    if (!group->isCycling()) {
        recordActivation(group, active->id);
    }
    activateWindow(group, *active);
}

void TabController::releaseTab(const TabGroupPtr& group, int index)
{
    if (!m_store->isTracked(group) || index < 0 || index >= group->count()) {
        return;
    }

    const WindowRecord window = group->windows().at(index);
    m_bridge->stopObserving(window);
    m_frames.clear(window.id);
    if (!m_store->releaseWindow(window.id, group)) {
        return;
    }

    restoreFullFrame(window);
    m_mru.removeWindow(window.id);
    m_mru.appendIfMissing(MruEntry::window(window.id));
    finishRelease(group);
}

void TabController::releaseTabs(const TabGroupPtr& group, const QList<WindowId>& windowIds)
{
    if (!m_store->isTracked(group)) {
        return;
    }

    const WindowRecordList members = group->windows();
    for (const WindowRecord& window : members) {
        if (windowIds.contains(window.id)) {
            m_bridge->stopObserving(window);
            m_frames.clear(window.id);
        }
    }

    const WindowRecordList released = m_store->releaseWindows(windowIds, group);
    for (const WindowRecord& window : released) {
        restoreFullFrame(window);
        m_mru.removeWindow(window.id);
        m_mru.appendIfMissing(MruEntry::window(window.id));
    }
    if (!released.isEmpty()) {
        qCDebug(lcController) << "Released" << released.size() << "tabs from group" << group->id();
        finishRelease(group);
    }
}

bool TabController::moveTabs(const TabGroupPtr& group, const QList<WindowId>& windowIds, int destination)
{
    if (!m_store->isTracked(group)) {
        return false;
    }
    return group->moveTabs(windowIds, destination);
}

void TabController::moveGroup(const TabGroupPtr& group, const QRect& frame)
{
    if (!m_store->isTracked(group)) {
        return;
    }

    group->setFrame(frame);
    const WindowRecordList members = group->visibleWindows();
    QList<WindowId> memberIds;
    for (const WindowRecord& window : members) {
        memberIds.append(window.id);
    }
    m_frames.setExpectedFrame(frame, memberIds);
    for (const WindowRecord& window : members) {
        applyFrame(window, frame);
    }
    if (const auto active = group->activeWindow()) {
        raiseWindow(*active);
    }
}

void TabController::disbandGroup(const TabGroupPtr& group)
{
    if (!m_store->isTracked(group)) {
        return;
    }
    qCInfo(lcController) << "Disbanding group" << group->id();
    m_store->dissolveGroup(group);
}

void TabController::finishRelease(const TabGroupPtr& group)
{
    if (!m_store->isTracked(group)) {
        return;
    }

    // A single remaining tab is no longer a group
    if (group->count() == 1) {
        m_store->dissolveGroup(group);
        return;
    }

    if (const auto active = group->activeWindow()) {
        raiseWindow(ensureConcreteElement(*active));
    }
}

void TabController::onGroupDissolved(const TabGroupPtr& group)
{
    if (m_lastActiveGroupId == group->id()) {
        m_lastActiveGroupId = QUuid();
    }
    if (m_cyclingGroup == group) {
        m_cyclingGroup.reset();
    }
    if (QTimer* timer = m_resyncTimers.take(group->id())) {
        timer->stop();
        timer->deleteLater();
    }

    m_mru.removeGroup(group->id());

    // Survivors get their tab bar space back
    const WindowRecordList survivors = group->windows();
    for (const WindowRecord& window : survivors) {
        m_bridge->stopObserving(window);
        m_frames.clear(window.id);
        restoreFullFrame(window);
        m_mru.appendIfMissing(MruEntry::window(window.id));
    }
}

QList<SwitcherItem> TabController::switcherItems() const
{
    return m_mru.buildSwitcherItems(m_store->groups(), m_resolver->lastResult());
}

TabGroupPtr TabController::activeGroup() const
{
    if (!m_lastActiveGroupId.isNull()) {
        if (const TabGroupPtr group = m_store->groupById(m_lastActiveGroupId)) {
            return group;
        }
    }

    const ProcessId frontmost = m_context.windowServer->frontmostProcess();
    if (frontmost == 0) {
        return {};
    }
    IAccessibilityBackend* accessibility = m_context.accessibility;
    const auto focused = accessibility->focusedWindow(accessibility->applicationElement(frontmost));
    if (!focused) {
        return {};
    }
    const auto windowId = accessibility->windowId(*focused);
    if (!windowId) {
        return {};
    }
    return m_store->groupForWindow(*windowId);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Hotkey commands
// ═══════════════════════════════════════════════════════════════════════════════

void TabController::handleNewTab()
{
    const TabGroupPtr group = activeGroup();
    if (!group) {
        qCDebug(lcController) << "New tab: no active group";
        return;
    }
    m_resolver->refreshAsync(WindowResolver::Scope::AllDesktops);
    Q_EMIT windowPickerRequested(group);
}

void TabController::handleReleaseTab()
{
    const TabGroupPtr group = activeGroup();
    if (!group) {
        qCDebug(lcController) << "Release tab: no active group";
        return;
    }
    releaseTab(group, group->activeIndex());
}

void TabController::handleCycleStart(bool autoRepeat)
{
    cycle(1, autoRepeat);
}

void TabController::handleCycleReverse(bool autoRepeat)
{
    cycle(-1, autoRepeat);
}

void TabController::cycle(int delta, bool autoRepeat)
{
    if (autoRepeat) {
        return;
    }
    if (m_switcherOpen) {
        Q_EMIT switcherStepRequested(delta);
        return;
    }

    TabGroupPtr group = m_cyclingGroup;
    if (!group || !m_store->isTracked(group)) {
        group = activeGroup();
    }
    if (!group) {
        qCDebug(lcController) << "Cycle: no active group";
        return;
    }

    const std::optional<int> next = delta < 0 ? group->previousInMRUCycle() : group->nextInMRUCycle();
    if (!next) {
        return;
    }
    m_cyclingGroup = group;
    switchTab(group, *next);
}

void TabController::handleCycleModifierReleased()
{
    if (m_cyclingGroup) {
        m_cyclingGroup->endCycle();
        if (const auto landed = m_cyclingGroup->activeWindow()) {
            m_mru.recordActivation(MruEntry::groupWindow(m_cyclingGroup->id(), landed->id));
        }
        m_cyclingGroup.reset();
        m_cycleEnded.start();
    }
    if (m_switcherOpen) {
        m_switcherOpen = false;
        Q_EMIT switcherCommitRequested();
    }
}

void TabController::handleSwitchToTab(int slot)
{
    if (slot < HotkeyLimits::FirstTabSlot || slot > HotkeyLimits::LastTabSlot) {
        qCWarning(lcController) << "Tab slot out of range:" << slot;
        return;
    }

    const TabGroupPtr group = activeGroup();
    if (!group) {
        return;
    }
    const int index = slot - HotkeyLimits::FirstTabSlot;
    if (index >= group->count()) {
        return;
    }
    switchTab(group, index);
}

void TabController::handleGlobalSwitcherOpen()
{
    if (m_switcherOpen) {
        Q_EMIT switcherStepRequested(1);
        return;
    }
    m_switcherOpen = true;
    m_resolver->refreshAsync(WindowResolver::Scope::AllDesktops);
    Q_EMIT switcherRequested();
}

void TabController::handleSwitcherAdvance()
{
    if (m_switcherOpen) {
        Q_EMIT switcherStepRequested(1);
    }
}

void TabController::handleSwitcherRetreat()
{
    if (m_switcherOpen) {
        Q_EMIT switcherStepRequested(-1);
    }
}

void TabController::handleEscape()
{
    if (m_cyclingGroup) {
        m_cyclingGroup->endCycle();
        m_cyclingGroup.reset();
        m_cycleEnded.start();
    }
    if (m_switcherOpen) {
        m_switcherOpen = false;
        Q_EMIT switcherDismissed();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Process lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

void TabController::handleProcessActivated(ProcessId pid)
{
    IAccessibilityBackend* accessibility = m_context.accessibility;
    if (const auto focused = accessibility->focusedWindow(accessibility->applicationElement(pid))) {
        onWindowFocused(pid, *focused);
    }
}

void TabController::handleProcessTerminated(ProcessId pid)
{
    const QList<TabGroupPtr> groups = m_store->groups();
    for (const TabGroupPtr& group : groups) {
        WindowRecordList affected;
        for (const WindowRecord& window : group->windows()) {
            if (window.pid == pid) {
                affected.append(window);
            }
        }
        if (affected.isEmpty()) {
            continue;
        }

        qCInfo(lcController) << "Process" << pid << "exited, releasing" << affected.size() << "windows from group"
                             << group->id();
        QList<WindowId> affectedIds;
        for (const WindowRecord& window : std::as_const(affected)) {
            m_bridge->handleDestroyedWindow(pid, window.element.stableHash());
            m_frames.clear(window.id);
            m_mru.removeWindow(window.id);
            affectedIds.append(window.id);
        }
        m_store->releaseWindows(affectedIds, group);
        finishRelease(group);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Event bridge reactions
// ═══════════════════════════════════════════════════════════════════════════════

void TabController::syncGroupFrame(const TabGroupPtr& group, WindowId sourceId, const QRect& frame)
{
    group->setFrame(frame);

    const WindowRecordList members = group->visibleWindows();
    QList<WindowId> others;
    for (const WindowRecord& window : members) {
        if (window.id != sourceId) {
            others.append(window.id);
        }
    }
    m_frames.setExpectedFrame(frame, others);

    for (const WindowRecord& window : members) {
        if (window.id != sourceId) {
            applyFrame(window, frame);
        }
    }
}

void TabController::onWindowMoved(WindowId windowId)
{
    const TabGroupPtr group = m_store->groupForWindow(windowId);
    if (!group) {
        return;
    }
    const auto active = group->activeWindow();
    if (!active || active->id != windowId || active->isFullScreen) {
        return;
    }

    const std::optional<QRect> frame = m_context.accessibility->frame(active->element);
    if (!frame) {
        checkStaleWindow(windowId);
        return;
    }
    if (m_frames.shouldSuppress(windowId, *frame) || *frame == group->frame()) {
        return;
    }

    qCDebug(lcController) << "Window" << windowId << "moved to" << *frame;
    syncGroupFrame(group, windowId, *frame);
}

void TabController::onWindowResized(WindowId windowId)
{
    const TabGroupPtr group = m_store->groupForWindow(windowId);
    if (!group) {
        return;
    }
    IAccessibilityBackend* accessibility = m_context.accessibility;

    // Leaving full screen may happen while another tab is active
    const std::optional<WindowRecord> record = group->window(windowId);
    if (record && record->isFullScreen) {
        const std::optional<WindowAttributes> attributes = accessibility->attributes(record->element);
        if (!attributes) {
            checkStaleWindow(windowId);
            return;
        }
        if (attributes->fullScreen) {
            return;
        }
        qCInfo(lcController) << "Window" << windowId << "left full screen, restoring group frame";
        m_store->setWindowFullScreen(windowId, false);
        m_frames.setExpectedFrame(group->frame(), {windowId});
        applyFrame(*record, group->frame());
        return;
    }

    const auto active = group->activeWindow();
    if (!active || active->id != windowId) {
        return;
    }

    const std::optional<QRect> frame = accessibility->frame(active->element);
    if (!frame) {
        checkStaleWindow(windowId);
        return;
    }
    if (m_frames.shouldSuppress(windowId, *frame)) {
        return;
    }

    // Full screen keeps membership but stops frame sync; plain maximise is an ordinary resize
    const std::optional<WindowAttributes> attributes = accessibility->attributes(active->element);
    if (attributes && attributes->fullScreen) {
        qCInfo(lcController) << "Window" << windowId << "went full screen, pausing frame sync for it";
        m_frames.clear(windowId);
        m_store->setWindowFullScreen(windowId, true);
        return;
    }

    if (*frame != group->frame()) {
        qCDebug(lcController) << "Window" << windowId << "resized to" << *frame;
        syncGroupFrame(group, windowId, *frame);
    }

    // Animated resizes report before they settle
    scheduleResync(group);
}

void TabController::scheduleResync(const TabGroupPtr& group)
{
    QTimer*& timer = m_resyncTimers[group->id()];
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        const QUuid groupId = group->id();
        connect(timer, &QTimer::timeout, this, [this, groupId]() {
            resync(groupId);
        });
    }
    timer->start(m_context.settings->resyncDelayMs());
}

void TabController::resync(const QUuid& groupId)
{
    const TabGroupPtr group = m_store->groupById(groupId);
    if (!group) {
        return;
    }
    const auto active = group->activeWindow();
    if (!active || active->isFullScreen) {
        return;
    }
    const std::optional<QRect> frame = m_context.accessibility->frame(active->element);
    if (!frame || *frame == group->frame()) {
        return;
    }

    qCDebug(lcController) << "Resync of group" << groupId << "to" << *frame;
    syncGroupFrame(group, active->id, *frame);
}

void TabController::onWindowDestroyed(WindowId windowId)
{
    const TabGroupPtr group = m_store->groupForWindow(windowId);
    if (!group) {
        return;
    }
    const std::optional<WindowRecord> record = group->window(windowId);
    if (!record) {
        return;
    }

    // The element is dead either way
    m_bridge->handleDestroyedWindow(record->pid, record->element.stableHash());

    if (m_context.windowServer->windowExists(windowId)) {
        // Some applications replace the element without closing the window
        WindowRecord lookup = *record;
        lookup.isPlaceholder = true;
        const ElementRef fresh = m_resolver->resolveElement(lookup);
        if (!fresh.isNull()) {
            WindowRecord updated = *record;
            updated.element = fresh;
            updated.isPlaceholder = false;
            m_store->updateWindowElement(windowId, fresh, false);
            m_bridge->observe(updated);
            qCDebug(lcController) << "Re-acquired element of window" << windowId;
            return;
        }
        // Nothing left to drive the tab with
        qCDebug(lcController) << "Window" << windowId << "still listed but no element found, releasing it";
    } else {
        qCDebug(lcController) << "Window" << windowId << "destroyed";
    }

    m_frames.clear(windowId);
    m_mru.removeWindow(windowId);
    if (m_store->releaseWindow(windowId, group)) {
        finishRelease(group);
    }
}

void TabController::onTitleChanged(WindowId windowId)
{
    const TabGroupPtr group = m_store->groupForWindow(windowId);
    if (!group) {
        return;
    }
    const std::optional<WindowRecord> record = group->window(windowId);
    if (!record) {
        return;
    }
    if (const auto title = m_context.accessibility->title(record->element)) {
        m_store->updateWindowTitle(windowId, *title);
    }
}

void TabController::onWindowFocused(ProcessId pid, const ElementRef& element)
{
    const auto windowId = m_context.accessibility->windowId(element);
    if (!windowId) {
        return;
    }
    const TabGroupPtr group = m_store->groupForWindow(*windowId);
    if (!group) {
        m_mru.recordActivation(MruEntry::window(*windowId));
        return;
    }

    // Focus hands us the concrete element of a window grouped from another desktop
    const std::optional<WindowRecord> record = group->window(*windowId);
    if (record && record->isPlaceholder) {
        WindowRecord resolved = *record;
        resolved.element = element;
        resolved.isPlaceholder = false;
        m_store->updateWindowElement(*windowId, element, false);
        m_bridge->observe(resolved);
    }

    if (record && record->isFullScreen) {
        qCDebug(lcController) << "Full screen window" << *windowId << "focused, group left as is";
        return;
    }

    qCDebug(lcController) << "Window" << *windowId << "of process" << pid << "focused";
    group->switchTo(*windowId);
    m_lastActiveGroupId = group->id();
    if (!group->isCycling() && !inCycleCooldown()) {
        recordActivation(group, *windowId);
    }
}

} // namespace PlasmaTabs
