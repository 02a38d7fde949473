// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "context.h"
#include "windowrecord.h"
#include "windowsource.h"
#include <QHash>
#include <QObject>

namespace PlasmaTabs {

/**
 * @brief Fans out accessibility notifications for grouped windows
 *
 * Per owning process with at least one observed window there is one
 * observer, one focus subscription on the process root and four
 * subscriptions per window (moved, resized, destroyed, title changed).
 * Observers are reference counted by window and torn down with the last one.
 *
 * Destroy notifications arrive with an element that may already be invalid,
 * so the element -> window id mapping is cached when a window is observed.
 *
 * Backend callbacks can arrive on any thread. They are queued onto this
 * object's thread before any state is read, and every signal is emitted
 * there.
 */
class PLASMATABS_EXPORT WindowEventBridge : public QObject
{
    Q_OBJECT

public:
    explicit WindowEventBridge(const TabbingContext& context, QObject* parent = nullptr);
    ~WindowEventBridge() override;

    /**
     * @brief Subscribe to a window's notifications
     *
     * Observing an already observed element is a no-op.
     * @return false if the record has no concrete element or the observer
     *         could not be created
     */
    bool observe(const WindowRecord& window);

    /**
     * @brief Remove a window's subscriptions; the observer goes with the last window
     */
    void stopObserving(const WindowRecord& window);

    /**
     * @brief Bookkeeping for a window whose element is already gone
     *
     * Does not unsubscribe from the dead element. The process observer is
     * still torn down when this was its last window.
     */
    void handleDestroyedWindow(ProcessId pid, size_t elementHash);

    /**
     * @brief Drop every observer and all bookkeeping
     */
    void stopAll();

    bool isObserving(const WindowRecord& window) const;
    int observedWindowCount(ProcessId pid) const
    {
        return m_windowCountPerProcess.value(pid);
    }
    int observerCount() const
    {
        return m_observers.size();
    }

Q_SIGNALS:
    void windowMoved(PlasmaTabs::WindowId windowId);
    void windowResized(PlasmaTabs::WindowId windowId);
    void windowDestroyed(PlasmaTabs::WindowId windowId);
    void titleChanged(PlasmaTabs::WindowId windowId);
    void windowFocused(PlasmaTabs::ProcessId pid, const PlasmaTabs::ElementRef& element);

private:
    void handleNotification(const ElementRef& element, NotificationKind kind);
    void teardownProcess(ProcessId pid);

    const TabbingContext& m_context;
    QHash<ProcessId, IAccessibilityBackend::ObserverHandle> m_observers;
    QHash<ProcessId, int> m_windowCountPerProcess;
    QHash<size_t, WindowId> m_elementToWindow;
};

} // namespace PlasmaTabs
