// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs.h" // Generated from plasmatabs.kcfg via KConfigXT

#include <QStringList>

namespace PlasmaTabs {

/**
 * @brief Static access to the default configuration values
 *
 * Wraps the KConfigXT-generated PlasmaTabsConfig class. plasmatabs.kcfg is
 * the only place defaults and valid ranges are written down; this class
 * exposes what was generated from it.
 *
 * Usage:
 *   int height = ConfigDefaults::tabBarHeight();  // 28 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Discovery
    // ═══════════════════════════════════════════════════════════════════════════

    static int messagingTimeoutMs() { return instance().defaultMessagingTimeoutMsValue(); }
    static int bruteForceTimeoutMs() { return instance().defaultBruteForceTimeoutMsValue(); }
    static int maxResolverThreads() { return instance().defaultMaxResolverThreadsValue(); }
    static bool includeAccessoryApps() { return instance().defaultIncludeAccessoryAppsValue(); }
    static QStringList levelWhitelist() { return instance().defaultLevelWhitelistValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Groups
    // ═══════════════════════════════════════════════════════════════════════════

    static int tabBarHeight() { return instance().defaultTabBarHeightValue(); }
    static int frameTolerance() { return instance().defaultFrameToleranceValue(); }
    static int suppressionDeadlineMs() { return instance().defaultSuppressionDeadlineMsValue(); }
    static int resyncDelayMs() { return instance().defaultResyncDelayMsValue(); }

private:
    // Lazily-initialized singleton instance
    static PlasmaTabsConfig& instance()
    {
        static PlasmaTabsConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace PlasmaTabs
