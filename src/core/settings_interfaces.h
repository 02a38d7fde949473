// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include <QStringList>

namespace PlasmaTabs {

// ═══════════════════════════════════════════════════════════════════════════════
// Settings Interfaces
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Settings used by window discovery
 *
 * Used by: WindowResolver, WindowDiscriminator
 */
class PLASMATABS_EXPORT IDiscoverySettings
{
public:
    virtual ~IDiscoverySettings() = default;

    virtual int messagingTimeoutMs() const = 0;
    virtual int bruteForceTimeoutMs() const = 0;
    virtual int maxResolverThreads() const = 0;
    virtual bool includeAccessoryApps() const = 0;
    /// App ids whose windows may sit outside the normal stacking level
    virtual QStringList levelWhitelist() const = 0;
};

/**
 * @brief Settings used by group frame synchronisation
 *
 * Used by: TabController, ExpectedFrameTracker
 */
class PLASMATABS_EXPORT IGroupBehaviorSettings
{
public:
    virtual ~IGroupBehaviorSettings() = default;

    virtual int tabBarHeight() const = 0;
    virtual int frameTolerance() const = 0;
    virtual int suppressionDeadlineMs() const = 0;
    virtual int resyncDelayMs() const = 0;
};

/**
 * @brief Aggregate settings interface
 *
 * Components depend on the narrow interface they need; the context hands
 * out this aggregate.
 */
class PLASMATABS_EXPORT ITabSettings : public IDiscoverySettings, public IGroupBehaviorSettings
{
public:
    ~ITabSettings() override;
};

} // namespace PlasmaTabs
