// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "types.h"
#include <QHash>
#include <QList>
#include <QPoint>
#include <QRect>
#include <QSet>
#include <QSize>
#include <functional>
#include <optional>

namespace PlasmaTabs {

/**
 * @brief Scope of a window-server list query
 */
enum class ServerListScope {
    OnScreenOnly = 0, ///< Windows visible on the current virtual desktop
    All = 1 ///< Every window, including other virtual desktops
};

/**
 * @brief Window-server view of the desktop
 *
 * Flat, ordered enumeration of surfaces with numeric identifiers and z-order
 * but no semantic attributes. Implementations wrap the compositor.
 *
 * Query methods must be safe to call from the resolver's worker threads.
 */
class PLASMATABS_EXPORT IWindowServer
{
public:
    virtual ~IWindowServer();

    /**
     * @brief Current window list, front-most first
     *
     * The returned order is the z-order ground truth.
     */
    virtual QList<ServerWindowInfo> windowList(ServerListScope scope) const = 0;

    virtual QList<ProcessInfo> runningProcesses() const = 0;
    virtual std::optional<ProcessInfo> processInfo(ProcessId pid) const = 0;

    /**
     * @brief Stacking level of a window, 0 = normal application level
     * @return nullopt when the level could not be read
     */
    virtual std::optional<int> windowLevel(WindowId id) const = 0;

    /**
     * @brief Whether the window server still lists the window
     */
    virtual bool windowExists(WindowId id) const = 0;

    /**
     * @brief Process owning the currently active window, 0 if none
     */
    virtual ProcessId frontmostProcess() const = 0;

    /**
     * @brief Bring the process to the foreground (best-effort)
     */
    virtual bool activateProcess(ProcessId pid) = 0;
};

/**
 * @brief Accessibility-tree view of application windows
 *
 * Offers per-process window elements with semantic attributes, but misses
 * windows on other virtual desktops and may be slow for busy processes.
 * Every call can fail; failures are reported as empty results or false and
 * never throw.
 *
 * Query methods must be safe to call concurrently for different processes.
 * Notification callbacks may be invoked on any thread.
 */
class PLASMATABS_EXPORT IAccessibilityBackend
{
public:
    using ObserverHandle = quint64;
    using NotificationCallback = std::function<void(const ElementRef& element, NotificationKind kind)>;

    virtual ~IAccessibilityBackend();

    /**
     * @brief Whether this process is allowed to use the accessibility API
     */
    virtual bool isTrusted() const = 0;

    /**
     * @brief Root element of a process
     */
    virtual ElementRef applicationElement(ProcessId pid) const = 0;

    /**
     * @brief Cap the time a call against the element's process may block
     */
    virtual void setMessagingTimeout(const ElementRef& element, int timeoutMs) const = 0;

    /**
     * @brief Window elements of a process root (current virtual desktop only)
     * @return nullopt if the process could not be queried
     */
    virtual std::optional<QList<ElementRef>> windows(const ElementRef& application) const = 0;

    /**
     * @brief Window-server id behind a window element
     * @return nullopt if the element is not a window or is stale
     */
    virtual std::optional<WindowId> windowId(const ElementRef& element) const = 0;

    virtual std::optional<WindowAttributes> attributes(const ElementRef& element) const = 0;
    virtual std::optional<QString> title(const ElementRef& element) const = 0;
    virtual std::optional<QRect> frame(const ElementRef& element) const = 0;

    /**
     * @brief Search the process's element space for specific window ids
     *
     * Recovers windows on other virtual desktops that windows() does not return.
     * @return Found elements keyed by window id (may be partial)
     */
    virtual QHash<WindowId, ElementRef> probeWindows(ProcessId pid, const QSet<WindowId>& targets,
                                                     int timeoutMs) const = 0;

    /**
     * @brief Focused window element of a process root
     */
    virtual std::optional<ElementRef> focusedWindow(const ElementRef& application) const = 0;

    // Mutating calls, all best-effort
    virtual bool setPosition(const ElementRef& element, const QPoint& position) = 0;
    virtual bool setSize(const ElementRef& element, const QSize& size) = 0;
    virtual bool raise(const ElementRef& element) = 0;

    /**
     * @brief Create a notification observer for a process
     * @return Handle, 0 on failure
     */
    virtual ObserverHandle createObserver(ProcessId pid, NotificationCallback callback) = 0;
    virtual bool addNotification(ObserverHandle observer, const ElementRef& element, NotificationKind kind) = 0;
    virtual void removeNotification(ObserverHandle observer, const ElementRef& element, NotificationKind kind) = 0;
    virtual void removeObserver(ObserverHandle observer) = 0;
};

} // namespace PlasmaTabs
