// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include <QHashFunctions>
#include <QMetaType>
#include <QRect>
#include <QSizeF>
#include <QString>
#include <optional>

namespace PlasmaTabs {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - identifiers and snapshots exchanged with the window sources
// ═══════════════════════════════════════════════════════════════════════════════

/// Window-server identifier. Process-unique while the window lives; may be reused after close.
using WindowId = quint32;

/// Owning process identifier
using ProcessId = qint64;

/**
 * @brief Opaque, non-owning reference to an accessibility element
 *
 * The token is assigned by the accessibility backend and only means something
 * to it. The element behind a reference can disappear at any time; every
 * consumer treats a failed call through a stale reference as "window gone".
 */
struct PLASMATABS_EXPORT ElementRef
{
    ProcessId pid = 0;  ///< Process that owns the element
    quint64 token = 0;  ///< Backend-assigned token, 0 = no element

    bool isNull() const
    {
        return token == 0;
    }

    /**
     * @brief Hash that stays valid after the element itself is destroyed
     *
     * Used as the key of the event bridge's element -> window cache.
     */
    size_t stableHash() const
    {
        return qHashMulti(0, pid, token);
    }

    bool operator==(const ElementRef& other) const = default;
};

inline size_t qHash(const ElementRef& element, size_t seed = 0) noexcept
{
    return qHashMulti(seed, element.pid, element.token);
}

/**
 * @brief Accessibility role of an element
 */
enum class WindowRole {
    Window = 0, ///< A top-level window element
    Other = 1 ///< Any non-window element (application root, button, ...)
};

/**
 * @brief Accessibility role subtype of a window element
 */
enum class WindowSubrole {
    Unknown = 0, ///< Backend could not classify the window
    Standard = 1, ///< Regular application window
    Dialog = 2, ///< Modal or modeless dialog
    Document = 3, ///< Document window of a multi-document app
    FloatingWindow = 4, ///< Tool palette floating above its parent
    SystemDialog = 5, ///< System-owned dialog chrome
    Sheet = 6, ///< Sheet attached to a parent window
    Popover = 7 ///< Transient popover / menu surface
};

/**
 * @brief Presentation policy of a running process
 */
enum class PresentationPolicy {
    Regular = 0, ///< Normal application with taskbar presence
    Accessory = 1, ///< Tray/utility application that can still own windows
    Prohibited = 2 ///< Background process, never owns user windows
};

/**
 * @brief Kinds of per-element notifications the event bridge subscribes to
 */
enum class NotificationKind {
    Moved = 0,
    Resized = 1,
    Destroyed = 2,
    TitleChanged = 3,
    FocusedWindowChanged = 4 ///< Subscribed on the process root element
};

/**
 * @brief One row of the window-server list
 */
struct PLASMATABS_EXPORT ServerWindowInfo
{
    WindowId id = 0;
    ProcessId pid = 0;
    int layer = 0;              ///< 0 = normal application layer
    QRect bounds;
    QString name;               ///< Title as reported by the window server (may be empty)
    qreal alpha = 1.0;
    bool onScreen = false;      ///< false for windows on other virtual desktops
};

/**
 * @brief Snapshot of a running process
 */
struct PLASMATABS_EXPORT ProcessInfo
{
    ProcessId pid = 0;
    QString appId;              ///< Desktop-file / app identity string (may be empty)
    QString displayName;
    QString executablePath;
    QString iconName;
    PresentationPolicy policy = PresentationPolicy::Regular;
    bool hidden = false;
};

/**
 * @brief Attributes read from a window element
 *
 * Each field is empty when the backend could not read it.
 */
struct PLASMATABS_EXPORT WindowAttributes
{
    std::optional<WindowRole> role;
    std::optional<WindowSubrole> subrole;
    std::optional<QString> title;
    std::optional<QSizeF> size;
    bool minimized = false;
    bool fullScreen = false;
};

} // namespace PlasmaTabs

Q_DECLARE_METATYPE(PlasmaTabs::ElementRef)
