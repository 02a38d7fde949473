// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/settings_interfaces.h"
#include "plasmatabs_export.h"
#include <QObject>
#include <QString>
#include <QStringList>

class KConfigGroup;

namespace PlasmaTabs {

/**
 * @brief Daemon settings backed by KConfig
 *
 * Implements ITabSettings on top of plasmatabsrc. Defaults come from
 * plasmatabs.kcfg through ConfigDefaults; values outside the range declared
 * there are clamped on load and in the setters.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass them in through TabbingContext.
 */
class PLASMATABS_EXPORT Settings : public QObject, public ITabSettings
{
    Q_OBJECT

    // Discovery
    Q_PROPERTY(int messagingTimeoutMs READ messagingTimeoutMs WRITE setMessagingTimeoutMs NOTIFY
                   messagingTimeoutMsChanged)
    Q_PROPERTY(int bruteForceTimeoutMs READ bruteForceTimeoutMs WRITE setBruteForceTimeoutMs NOTIFY
                   bruteForceTimeoutMsChanged)
    Q_PROPERTY(int maxResolverThreads READ maxResolverThreads WRITE setMaxResolverThreads NOTIFY
                   maxResolverThreadsChanged)
    Q_PROPERTY(bool includeAccessoryApps READ includeAccessoryApps WRITE setIncludeAccessoryApps NOTIFY
                   includeAccessoryAppsChanged)
    Q_PROPERTY(QStringList levelWhitelist READ levelWhitelist WRITE setLevelWhitelist NOTIFY levelWhitelistChanged)

    // Groups
    Q_PROPERTY(int tabBarHeight READ tabBarHeight WRITE setTabBarHeight NOTIFY tabBarHeightChanged)
    Q_PROPERTY(int frameTolerance READ frameTolerance WRITE setFrameTolerance NOTIFY frameToleranceChanged)
    Q_PROPERTY(int suppressionDeadlineMs READ suppressionDeadlineMs WRITE setSuppressionDeadlineMs NOTIFY
                   suppressionDeadlineMsChanged)
    Q_PROPERTY(int resyncDelayMs READ resyncDelayMs WRITE setResyncDelayMs NOTIFY resyncDelayMsChanged)

public:
    /**
     * @param configName KConfig file name, relative to the config location
     */
    explicit Settings(const QString& configName = QStringLiteral("plasmatabsrc"), QObject* parent = nullptr);
    ~Settings() override = default;

    // IDiscoverySettings
    int messagingTimeoutMs() const override
    {
        return m_messagingTimeoutMs;
    }
    int bruteForceTimeoutMs() const override
    {
        return m_bruteForceTimeoutMs;
    }
    int maxResolverThreads() const override
    {
        return m_maxResolverThreads;
    }
    bool includeAccessoryApps() const override
    {
        return m_includeAccessoryApps;
    }
    QStringList levelWhitelist() const override
    {
        return m_levelWhitelist;
    }

    void setMessagingTimeoutMs(int value);
    void setBruteForceTimeoutMs(int value);
    void setMaxResolverThreads(int value);
    void setIncludeAccessoryApps(bool value);
    void setLevelWhitelist(const QStringList& value);

    // IGroupBehaviorSettings
    int tabBarHeight() const override
    {
        return m_tabBarHeight;
    }
    int frameTolerance() const override
    {
        return m_frameTolerance;
    }
    int suppressionDeadlineMs() const override
    {
        return m_suppressionDeadlineMs;
    }
    int resyncDelayMs() const override
    {
        return m_resyncDelayMs;
    }

    void setTabBarHeight(int value);
    void setFrameTolerance(int value);
    void setSuppressionDeadlineMs(int value);
    void setResyncDelayMs(int value);

    // Persistence
    void load();
    void save();
    void reset();

    QString configName() const
    {
        return m_configName;
    }

Q_SIGNALS:
    void settingsChanged();
    void messagingTimeoutMsChanged();
    void bruteForceTimeoutMsChanged();
    void maxResolverThreadsChanged();
    void includeAccessoryAppsChanged();
    void levelWhitelistChanged();
    void tabBarHeightChanged();
    void frameToleranceChanged();
    void suppressionDeadlineMsChanged();
    void resyncDelayMsChanged();

private:
    static int readClampedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                              const char* settingName);

    QString m_configName;

    int m_messagingTimeoutMs;
    int m_bruteForceTimeoutMs;
    int m_maxResolverThreads;
    bool m_includeAccessoryApps;
    QStringList m_levelWhitelist;

    int m_tabBarHeight;
    int m_frameTolerance;
    int m_suppressionDeadlineMs;
    int m_resyncDelayMs;
};

} // namespace PlasmaTabs
