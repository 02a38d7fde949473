// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>

namespace PlasmaTabs {

namespace Range {
constexpr int MessagingTimeoutMin = 10;
constexpr int MessagingTimeoutMax = 5000;
constexpr int BruteForceTimeoutMin = 0;
constexpr int BruteForceTimeoutMax = 5000;
constexpr int ResolverThreadsMin = 1;
constexpr int ResolverThreadsMax = 64;
constexpr int TabBarHeightMin = 0;
constexpr int TabBarHeightMax = 200;
constexpr int FrameToleranceMin = 0;
constexpr int FrameToleranceMax = 20;
constexpr int SuppressionDeadlineMin = 0;
constexpr int SuppressionDeadlineMax = 5000;
constexpr int ResyncDelayMin = 0;
constexpr int ResyncDelayMax = 2000;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(const QString& configName, QObject* parent)
    : QObject(parent)
    , m_configName(configName)
    , m_messagingTimeoutMs(ConfigDefaults::messagingTimeoutMs())
    , m_bruteForceTimeoutMs(ConfigDefaults::bruteForceTimeoutMs())
    , m_maxResolverThreads(ConfigDefaults::maxResolverThreads())
    , m_includeAccessoryApps(ConfigDefaults::includeAccessoryApps())
    , m_levelWhitelist(ConfigDefaults::levelWhitelist())
    , m_tabBarHeight(ConfigDefaults::tabBarHeight())
    , m_frameTolerance(ConfigDefaults::frameTolerance())
    , m_suppressionDeadlineMs(ConfigDefaults::suppressionDeadlineMs())
    , m_resyncDelayMs(ConfigDefaults::resyncDelayMs())
{
    load();
}

int Settings::readClampedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                             const char* settingName)
{
    const int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        const int clamped = qBound(min, value, max);
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "clamping to" << clamped
                            << "(must be" << min << "-" << max << ")";
        return clamped;
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER_CLAMPED(MessagingTimeoutMs, m_messagingTimeoutMs, messagingTimeoutMsChanged,
                        Range::MessagingTimeoutMin, Range::MessagingTimeoutMax)
SETTINGS_SETTER_CLAMPED(BruteForceTimeoutMs, m_bruteForceTimeoutMs, bruteForceTimeoutMsChanged,
                        Range::BruteForceTimeoutMin, Range::BruteForceTimeoutMax)
SETTINGS_SETTER_CLAMPED(MaxResolverThreads, m_maxResolverThreads, maxResolverThreadsChanged,
                        Range::ResolverThreadsMin, Range::ResolverThreadsMax)
SETTINGS_SETTER(bool, IncludeAccessoryApps, m_includeAccessoryApps, includeAccessoryAppsChanged)
SETTINGS_SETTER(const QStringList&, LevelWhitelist, m_levelWhitelist, levelWhitelistChanged)

SETTINGS_SETTER_CLAMPED(TabBarHeight, m_tabBarHeight, tabBarHeightChanged, Range::TabBarHeightMin,
                        Range::TabBarHeightMax)
SETTINGS_SETTER_CLAMPED(FrameTolerance, m_frameTolerance, frameToleranceChanged, Range::FrameToleranceMin,
                        Range::FrameToleranceMax)
SETTINGS_SETTER_CLAMPED(SuppressionDeadlineMs, m_suppressionDeadlineMs, suppressionDeadlineMsChanged,
                        Range::SuppressionDeadlineMin, Range::SuppressionDeadlineMax)
SETTINGS_SETTER_CLAMPED(ResyncDelayMs, m_resyncDelayMs, resyncDelayMsChanged, Range::ResyncDelayMin,
                        Range::ResyncDelayMax)

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(m_configName);

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    const KConfigGroup discovery = config->group(QStringLiteral("Discovery"));
    const KConfigGroup groups = config->group(QStringLiteral("Groups"));

    m_messagingTimeoutMs = readClampedInt(discovery, "MessagingTimeoutMs", ConfigDefaults::messagingTimeoutMs(),
                                          Range::MessagingTimeoutMin, Range::MessagingTimeoutMax, "messaging timeout");
    m_bruteForceTimeoutMs =
        readClampedInt(discovery, "BruteForceTimeoutMs", ConfigDefaults::bruteForceTimeoutMs(),
                       Range::BruteForceTimeoutMin, Range::BruteForceTimeoutMax, "brute-force timeout");
    m_maxResolverThreads = readClampedInt(discovery, "MaxResolverThreads", ConfigDefaults::maxResolverThreads(),
                                          Range::ResolverThreadsMin, Range::ResolverThreadsMax, "resolver threads");
    m_includeAccessoryApps =
        discovery.readEntry(QLatin1String("IncludeAccessoryApps"), ConfigDefaults::includeAccessoryApps());
    m_levelWhitelist = discovery.readEntry(QLatin1String("LevelWhitelist"), ConfigDefaults::levelWhitelist());

    m_tabBarHeight = readClampedInt(groups, "TabBarHeight", ConfigDefaults::tabBarHeight(), Range::TabBarHeightMin,
                                    Range::TabBarHeightMax, "tab bar height");
    m_frameTolerance = readClampedInt(groups, "FrameTolerance", ConfigDefaults::frameTolerance(),
                                      Range::FrameToleranceMin, Range::FrameToleranceMax, "frame tolerance");
    m_suppressionDeadlineMs =
        readClampedInt(groups, "SuppressionDeadlineMs", ConfigDefaults::suppressionDeadlineMs(),
                       Range::SuppressionDeadlineMin, Range::SuppressionDeadlineMax, "suppression deadline");
    m_resyncDelayMs = readClampedInt(groups, "ResyncDelayMs", ConfigDefaults::resyncDelayMs(), Range::ResyncDelayMin,
                                     Range::ResyncDelayMax, "resync delay");

    qCDebug(lcConfig) << "Loaded settings from" << m_configName;
    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(m_configName);
    KConfigGroup discovery = config->group(QStringLiteral("Discovery"));
    KConfigGroup groups = config->group(QStringLiteral("Groups"));

    discovery.writeEntry(QLatin1String("MessagingTimeoutMs"), m_messagingTimeoutMs);
    discovery.writeEntry(QLatin1String("BruteForceTimeoutMs"), m_bruteForceTimeoutMs);
    discovery.writeEntry(QLatin1String("MaxResolverThreads"), m_maxResolverThreads);
    discovery.writeEntry(QLatin1String("IncludeAccessoryApps"), m_includeAccessoryApps);
    discovery.writeEntry(QLatin1String("LevelWhitelist"), m_levelWhitelist);

    groups.writeEntry(QLatin1String("TabBarHeight"), m_tabBarHeight);
    groups.writeEntry(QLatin1String("FrameTolerance"), m_frameTolerance);
    groups.writeEntry(QLatin1String("SuppressionDeadlineMs"), m_suppressionDeadlineMs);
    groups.writeEntry(QLatin1String("ResyncDelayMs"), m_resyncDelayMs);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << m_configName;
    }
}

void Settings::reset()
{
    auto config = KSharedConfig::openConfig(m_configName);

    // load() falls back to ConfigDefaults for every missing key
    config->deleteGroup(QStringLiteral("Discovery"));
    config->deleteGroup(QStringLiteral("Groups"));
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << m_configName;
    }

    load();
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace PlasmaTabs
