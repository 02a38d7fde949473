// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabgroup.h"
#include "logging.h"

namespace PlasmaTabs {

TabGroup::TabGroup(const WindowRecordList& windows, const QRect& frame, QObject* parent)
    : QObject(parent)
    , m_id(QUuid::createUuid())
    , m_windows(windows)
    , m_frame(frame)
{
    m_focusHistory.reserve(windows.size());
    for (const WindowRecord& window : windows) {
        m_focusHistory.append(window.id);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Members
// ═══════════════════════════════════════════════════════════════════════════════

bool TabGroup::contains(WindowId windowId) const
{
    return indexOf(windowId) >= 0;
}

int TabGroup::indexOf(WindowId windowId) const
{
    for (int i = 0; i < m_windows.size(); ++i) {
        if (m_windows.at(i).id == windowId) {
            return i;
        }
    }
    return -1;
}

std::optional<WindowRecord> TabGroup::window(WindowId windowId) const
{
    const int index = indexOf(windowId);
    if (index < 0) {
        return std::nullopt;
    }
    return m_windows.at(index);
}

QList<WindowId> TabGroup::windowIds() const
{
    QList<WindowId> ids;
    ids.reserve(m_windows.size());
    for (const WindowRecord& window : m_windows) {
        ids.append(window.id);
    }
    return ids;
}

WindowRecordList TabGroup::visibleWindows() const
{
    WindowRecordList visible;
    for (const WindowRecord& window : m_windows) {
        if (!window.isFullScreen) {
            visible.append(window);
        }
    }
    return visible;
}

int TabGroup::visibleCount() const
{
    int count = 0;
    for (const WindowRecord& window : m_windows) {
        if (!window.isFullScreen) {
            ++count;
        }
    }
    return count;
}

bool TabGroup::insertWindow(const WindowRecord& window, int index)
{
    if (contains(window.id)) {
        return false;
    }

    const int previousActive = m_activeIndex;
    if (index >= 0 && index <= m_windows.size()) {
        // The active tab keeps pointing at the same window
        if (!m_windows.isEmpty() && index <= m_activeIndex) {
            ++m_activeIndex;
        }
        m_windows.insert(index, window);
    } else {
        m_windows.append(window);
    }
    m_focusHistory.append(window.id);

    Q_EMIT windowsChanged();
    if (m_activeIndex != previousActive) {
        Q_EMIT activeIndexChanged(m_activeIndex);
    }
    return true;
}

std::optional<WindowRecord> TabGroup::removeWindow(WindowId windowId)
{
    const int index = indexOf(windowId);
    if (index < 0) {
        return std::nullopt;
    }

    const WindowRecord removed = m_windows.takeAt(index);
    m_focusHistory.removeAll(windowId);

    const int previousActive = m_activeIndex;
    if (m_activeIndex >= m_windows.size()) {
        m_activeIndex = qMax(0, m_windows.size() - 1);
    } else if (index < m_activeIndex) {
        --m_activeIndex;
    }

    Q_EMIT windowsChanged();
    if (m_activeIndex != previousActive) {
        Q_EMIT activeIndexChanged(m_activeIndex);
    }
    return removed;
}

WindowRecordList TabGroup::removeWindows(const QList<WindowId>& ids)
{
    const std::optional<WindowRecord> active = activeWindow();
    const int previousActive = m_activeIndex;

    WindowRecordList removed;
    for (int i = m_windows.size() - 1; i >= 0; --i) {
        const WindowId id = m_windows.at(i).id;
        if (ids.contains(id)) {
            removed.prepend(m_windows.takeAt(i));
            m_focusHistory.removeAll(id);
        }
    }
    if (removed.isEmpty()) {
        return removed;
    }

    const int activeAfter = active ? indexOf(active->id) : -1;
    if (m_windows.isEmpty()) {
        m_activeIndex = 0;
    } else if (activeAfter >= 0) {
        m_activeIndex = activeAfter;
    } else {
        m_activeIndex = qBound(0, m_activeIndex, m_windows.size() - 1);
    }

    Q_EMIT windowsChanged();
    if (m_activeIndex != previousActive) {
        Q_EMIT activeIndexChanged(m_activeIndex);
    }
    return removed;
}

bool TabGroup::setWindowTitle(WindowId windowId, const QString& title)
{
    const int index = indexOf(windowId);
    if (index < 0 || m_windows.at(index).title == title) {
        return false;
    }
    m_windows[index].title = title;
    Q_EMIT windowTitleChanged(windowId, title);
    return true;
}

bool TabGroup::setWindowElement(WindowId windowId, const ElementRef& element, bool isPlaceholder)
{
    const int index = indexOf(windowId);
    if (index < 0) {
        return false;
    }
    m_windows[index].element = element;
    m_windows[index].isPlaceholder = isPlaceholder;
    return true;
}

bool TabGroup::setWindowFullScreen(WindowId windowId, bool fullScreen)
{
    const int index = indexOf(windowId);
    if (index < 0 || m_windows.at(index).isFullScreen == fullScreen) {
        return false;
    }
    m_windows[index].isFullScreen = fullScreen;
    Q_EMIT windowsChanged();
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Active tab and frame
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<WindowRecord> TabGroup::activeWindow() const
{
    if (m_activeIndex < 0 || m_activeIndex >= m_windows.size()) {
        return std::nullopt;
    }
    return m_windows.at(m_activeIndex);
}

void TabGroup::switchTo(int index)
{
    if (index < 0 || index >= m_windows.size() || index == m_activeIndex) {
        return;
    }
    m_activeIndex = index;
    Q_EMIT activeIndexChanged(m_activeIndex);
}

void TabGroup::switchTo(WindowId windowId)
{
    const int index = indexOf(windowId);
    if (index >= 0) {
        switchTo(index);
    }
}

void TabGroup::setFrame(const QRect& frame)
{
    if (m_frame == frame) {
        return;
    }
    m_frame = frame;
    Q_EMIT frameChanged(m_frame);
}

bool TabGroup::moveTab(int source, int destination)
{
    if (source < 0 || source >= m_windows.size() || destination < 0 || destination > m_windows.size()) {
        return false;
    }

    const bool wasActive = source == m_activeIndex;
    const int previousActive = m_activeIndex;
    const WindowRecord moved = m_windows.takeAt(source);

    // Indices above the source shifted down by one
    const int adjusted = destination > source ? destination - 1 : destination;
    m_windows.insert(adjusted, moved);

    if (wasActive) {
        m_activeIndex = adjusted;
    } else if (source < m_activeIndex && adjusted >= m_activeIndex) {
        --m_activeIndex;
    } else if (source > m_activeIndex && adjusted <= m_activeIndex) {
        ++m_activeIndex;
    }

    if (adjusted != source) {
        Q_EMIT windowsChanged();
    }
    if (m_activeIndex != previousActive) {
        Q_EMIT activeIndexChanged(m_activeIndex);
    }
    return true;
}

bool TabGroup::moveTabs(const QList<WindowId>& ids, int destination)
{
    WindowRecordList moved;
    WindowRecordList remaining;
    for (const WindowRecord& window : std::as_const(m_windows)) {
        if (ids.contains(window.id)) {
            moved.append(window);
        } else {
            remaining.append(window);
        }
    }
    if (moved.isEmpty()) {
        return false;
    }

    const std::optional<WindowRecord> active = activeWindow();
    const int previousActive = m_activeIndex;
    const QList<WindowId> before = windowIds();

    const int insertAt = qBound(0, destination, remaining.size());
    for (int i = 0; i < moved.size(); ++i) {
        remaining.insert(insertAt + i, moved.at(i));
    }
    m_windows = remaining;

    if (active) {
        m_activeIndex = indexOf(active->id);
    }
    if (windowIds() != before) {
        Q_EMIT windowsChanged();
    }
    if (m_activeIndex != previousActive) {
        Q_EMIT activeIndexChanged(m_activeIndex);
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// MRU focus history and cycling
// ═══════════════════════════════════════════════════════════════════════════════

void TabGroup::recordFocus(WindowId windowId)
{
    if (m_cycle) {
        qCDebug(lcGroups) << "Ignoring focus of" << windowId << "during cycle in group" << m_id;
        return;
    }
    if (!contains(windowId)) {
        return;
    }
    m_focusHistory.removeAll(windowId);
    m_focusHistory.prepend(windowId);
}

bool TabGroup::isCycleCandidate(WindowId windowId) const
{
    const int index = indexOf(windowId);
    return index >= 0 && !m_windows.at(index).isFullScreen;
}

std::optional<int> TabGroup::nextInMRUCycle()
{
    return stepCycle(1);
}

std::optional<int> TabGroup::previousInMRUCycle()
{
    return stepCycle(-1);
}

std::optional<int> TabGroup::stepCycle(int delta)
{
    if (visibleCount() < 2) {
        return std::nullopt;
    }

    if (!m_cycle) {
        CycleState state;
        for (WindowId id : std::as_const(m_focusHistory)) {
            if (isCycleCandidate(id) && !state.frozenOrder.contains(id)) {
                state.frozenOrder.append(id);
            }
        }
        // Members absent from the history follow in tab order (all of them if the history is empty)
        for (const WindowRecord& window : std::as_const(m_windows)) {
            if (!window.isFullScreen && !state.frozenOrder.contains(window.id)) {
                state.frozenOrder.append(window.id);
            }
        }
        // A full screen active tab is not in the snapshot: the first step lands on either end
        const auto active = activeWindow();
        if (active && active->isFullScreen) {
            state.position = delta > 0 ? -1 : 0;
        }
        m_cycle = state;
        qCDebug(lcGroups) << "Cycle started in group" << m_id << "order" << state.frozenOrder;
        Q_EMIT cyclingChanged(true);
    }

    const int length = m_cycle->frozenOrder.size();
    for (int step = 0; step < length; ++step) {
        m_cycle->position = ((m_cycle->position + delta) % length + length) % length;
        const WindowId id = m_cycle->frozenOrder.at(m_cycle->position);
        if (isCycleCandidate(id)) {
            return indexOf(id);
        }
    }
    return std::nullopt;
}

void TabGroup::endCycle()
{
    if (!m_cycle) {
        return;
    }

    const CycleState state = *m_cycle;
    m_cycle.reset();

    std::optional<WindowId> landed;
    if (state.position >= 0 && state.position < state.frozenOrder.size()
        && contains(state.frozenOrder.at(state.position))) {
        landed = state.frozenOrder.at(state.position);
    } else if (const auto active = activeWindow()) {
        landed = active->id;
    }

    if (landed) {
        recordFocus(*landed);
    }
    qCDebug(lcGroups) << "Cycle ended in group" << m_id << "landed on" << landed.value_or(0);
    Q_EMIT cyclingChanged(false);
}

QList<WindowId> TabGroup::frozenCycleOrder() const
{
    return m_cycle ? m_cycle->frozenOrder : QList<WindowId>();
}

} // namespace PlasmaTabs
