// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "../core/groupstore.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>

namespace PlasmaTabs {

class TabController;

/**
 * @brief D-Bus adaptor for tab groups
 *
 * Provides D-Bus interface: org.plasmatabs.TabGroups
 *  Hotkey commands from the shortcut bridge, group queries for the
 *  presentation layer, and process lifecycle notifications.
 *
 * Thin facade: every call is forwarded to TabController.
 */
class PLASMATABS_EXPORT TabGroupAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.plasmatabs.TabGroups")

public:
    explicit TabGroupAdaptor(TabController* controller, QObject* parent);
    ~TabGroupAdaptor() override = default;

public Q_SLOTS:
    // Hotkey commands
    void newTab();
    void releaseTab();
    void cycleStart(bool autoRepeat);
    void cycleReverse(bool autoRepeat);
    void cycleModifierReleased();
    void switchToTab(int slot);
    void globalSwitcherOpen();
    void switcherAdvance();
    void switcherRetreat();
    void escape();

    // Queries
    QStringList groupIds() const;
    QString activeGroupId() const;

    /**
     * @brief Members of a group in tab order
     * @param groupId Group UUID string
     * @return JSON array of window objects, "[]" for an unknown group
     */
    QString windowsInGroup(const QString& groupId) const;

    /**
     * @brief Global switcher rows, most recently used first
     * @return JSON array; group rows carry "groupId", window rows carry "windowId",
     *         both carry "windowIds"
     */
    QString switcherItems() const;

    void disbandGroup(const QString& groupId);

    // Process lifecycle (from the window manager integration)
    void processActivated(qint64 pid);
    void processTerminated(qint64 pid);

Q_SIGNALS:
    void groupsChanged();
    void windowPickerRequested(const QString& groupId);
    void switcherRequested();
    void switcherStepRequested(int delta);
    void switcherCommitRequested();
    void switcherDismissed();

private:
    TabGroupPtr findGroup(const QString& groupId, const char* operation) const;

    TabController* m_controller;
};

} // namespace PlasmaTabs
