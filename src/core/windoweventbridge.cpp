// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windoweventbridge.h"
#include "logging.h"
#include <QPointer>
#include <array>

namespace PlasmaTabs {

namespace {
constexpr std::array<NotificationKind, 4> WindowNotifications = {
    NotificationKind::Moved,
    NotificationKind::Resized,
    NotificationKind::Destroyed,
    NotificationKind::TitleChanged,
};
} // namespace

WindowEventBridge::WindowEventBridge(const TabbingContext& context, QObject* parent)
    : QObject(parent)
    , m_context(context)
{
    Q_ASSERT(context.isValid());
    qRegisterMetaType<ElementRef>();
}

WindowEventBridge::~WindowEventBridge()
{
    stopAll();
}

bool WindowEventBridge::isObserving(const WindowRecord& window) const
{
    return m_elementToWindow.contains(window.element.stableHash());
}

bool WindowEventBridge::observe(const WindowRecord& window)
{
    if (window.element.isNull() || window.isPlaceholder) {
        qCDebug(lcEvents) << "No concrete element to observe for window" << window.id;
        return false;
    }
    if (isObserving(window)) {
        return true;
    }

    const ProcessId pid = window.pid;
    IAccessibilityBackend* accessibility = m_context.accessibility;

    auto observerIt = m_observers.constFind(pid);
    if (observerIt == m_observers.constEnd()) {
        QPointer<WindowEventBridge> self(this);
        const auto callback = [self](const ElementRef& element, NotificationKind kind) {
            // Any thread; hop to ours before touching state
            QMetaObject::invokeMethod(
                self.data(),
                [self, element, kind]() {
                    if (self) {
                        self->handleNotification(element, kind);
                    }
                },
                Qt::QueuedConnection);
        };

        const IAccessibilityBackend::ObserverHandle observer = accessibility->createObserver(pid, callback);
        if (observer == 0) {
            qCWarning(lcEvents) << "Failed to create observer for process" << pid;
            return false;
        }
        if (!accessibility->addNotification(observer, accessibility->applicationElement(pid),
                                            NotificationKind::FocusedWindowChanged)) {
            qCDebug(lcEvents) << "Focus subscription failed for process" << pid;
        }
        observerIt = m_observers.insert(pid, observer);
        qCDebug(lcEvents) << "Created observer for process" << pid;
    }

    for (NotificationKind kind : WindowNotifications) {
        if (!accessibility->addNotification(observerIt.value(), window.element, kind)) {
            qCDebug(lcEvents) << "Subscription" << static_cast<int>(kind) << "failed for window" << window.id;
        }
    }

    m_elementToWindow.insert(window.element.stableHash(), window.id);
    ++m_windowCountPerProcess[pid];
    return true;
}

void WindowEventBridge::stopObserving(const WindowRecord& window)
{
    const auto observerIt = m_observers.constFind(window.pid);
    if (observerIt == m_observers.constEnd()) {
        return;
    }
    if (!m_elementToWindow.remove(window.element.stableHash())) {
        return;
    }

    for (NotificationKind kind : WindowNotifications) {
        m_context.accessibility->removeNotification(observerIt.value(), window.element, kind);
    }

    if (--m_windowCountPerProcess[window.pid] <= 0) {
        teardownProcess(window.pid);
    }
}

void WindowEventBridge::handleDestroyedWindow(ProcessId pid, size_t elementHash)
{
    if (!m_elementToWindow.remove(elementHash)) {
        return;
    }
    if (--m_windowCountPerProcess[pid] <= 0) {
        teardownProcess(pid);
    }
}

void WindowEventBridge::teardownProcess(ProcessId pid)
{
    m_windowCountPerProcess.remove(pid);
    const IAccessibilityBackend::ObserverHandle observer = m_observers.take(pid);
    if (observer == 0) {
        return;
    }
    IAccessibilityBackend* accessibility = m_context.accessibility;
    accessibility->removeNotification(observer, accessibility->applicationElement(pid),
                                      NotificationKind::FocusedWindowChanged);
    accessibility->removeObserver(observer);
    qCDebug(lcEvents) << "Removed observer for process" << pid;
}

void WindowEventBridge::stopAll()
{
    for (auto it = m_observers.constBegin(); it != m_observers.constEnd(); ++it) {
        m_context.accessibility->removeObserver(it.value());
    }
    if (!m_observers.isEmpty()) {
        qCDebug(lcEvents) << "Stopped" << m_observers.size() << "observers";
    }
    m_observers.clear();
    m_windowCountPerProcess.clear();
    m_elementToWindow.clear();
}

void WindowEventBridge::handleNotification(const ElementRef& element, NotificationKind kind)
{
    IAccessibilityBackend* accessibility = m_context.accessibility;

    if (kind == NotificationKind::FocusedWindowChanged) {
        // Either the focused window itself or the process root
        if (accessibility->windowId(element)) {
            Q_EMIT windowFocused(element.pid, element);
        } else if (const auto focused = accessibility->focusedWindow(element)) {
            Q_EMIT windowFocused(element.pid, *focused);
        }
        return;
    }

    // A destroyed element can no longer be queried, so the cache comes first
    WindowId windowId = 0;
    const auto cached = m_elementToWindow.constFind(element.stableHash());
    if (cached != m_elementToWindow.constEnd()) {
        windowId = cached.value();
    } else if (const auto live = accessibility->windowId(element)) {
        windowId = *live;
    } else {
        return;
    }

    switch (kind) {
    case NotificationKind::Moved:
        Q_EMIT windowMoved(windowId);
        break;
    case NotificationKind::Resized:
        Q_EMIT windowResized(windowId);
        break;
    case NotificationKind::Destroyed:
        Q_EMIT windowDestroyed(windowId);
        break;
    case NotificationKind::TitleChanged:
        Q_EMIT titleChanged(windowId);
        break;
    case NotificationKind::FocusedWindowChanged:
        break;
    }
}

} // namespace PlasmaTabs
