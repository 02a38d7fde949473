// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QtGlobal>

namespace PlasmaTabs {

/**
 * @brief Structural constants of the window discovery and grouping core
 *
 * User-configurable values live in plasmatabs.kcfg (see ConfigDefaults).
 * These are the thresholds that are not exposed as settings.
 */
namespace Defaults {
// Untitled surfaces smaller than this in either dimension are rendering helpers
constexpr qreal MinimumWindowDimension = 50.0;

// A titled window at least this large is a real top-level surface whatever its subrole
constexpr qreal GenuineSurfaceMinWidth = 500.0;
constexpr qreal GenuineSurfaceMinHeight = 300.0;

// Window-server pre-filter before brute-force probing
constexpr int PlausibleOffscreenMinWidth = 240;
constexpr int PlausibleOffscreenMinHeight = 140;

// Stacking level of ordinary application windows
constexpr int NormalWindowLevel = 0;

// Window-server layer of ordinary application windows
constexpr int NormalWindowLayer = 0;

// Slow-process threshold for per-process discovery diagnostics
constexpr qint64 SlowProcessScanMs = 50;

// Focus notifications this soon after a cycle ends are late echoes of the cycle
constexpr int CycleCooldownMs = 150;

// Global switcher history length; older entries are dropped
constexpr int MruMaxEntries = 1024;

// A window whose bounds match a group frame this closely is that group's tab content
constexpr int SwitcherGroupFrameSlack = 2;
}

/**
 * @brief Hotkey command constants
 */
namespace HotkeyLimits {
// switchToTab(n) accepts n in [FirstTabSlot, LastTabSlot]
constexpr int FirstTabSlot = 1;
constexpr int LastTabSlot = 9;
}

/**
 * @brief D-Bus service identifiers
 */
namespace DBus {
inline constexpr const char ServiceName[] = "org.plasmatabs.daemon";
inline constexpr const char TabGroupsPath[] = "/TabGroups";
inline constexpr const char TabGroupsInterface[] = "org.plasmatabs.TabGroups";
}

} // namespace PlasmaTabs
