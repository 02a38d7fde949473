// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "types.h"
#include <QList>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <optional>

namespace PlasmaTabs {

/**
 * @brief Canonical record of one user-facing window
 *
 * Identity is the window id alone. Everything else is display metadata that
 * may change while the record is held (title edits, element re-acquisition).
 */
struct PLASMATABS_EXPORT WindowRecord
{
    WindowId id = 0;
    ProcessId pid = 0;
    QString appId;                      ///< App identity string, empty for unidentified processes
    QString title;
    QString appName;                    ///< Display name of the owning application
    QString iconName;                   ///< Freedesktop icon name, empty if none
    ElementRef element;                 ///< Non-owning, re-resolve when stale
    std::optional<QRect> cachedBounds;  ///< Bounds from the window server at discovery time
    bool isPlaceholder = false;         ///< element is the process root standing in for an off-desktop window
    bool isFullScreen = false;          ///< Still a member, but left out of frame sync and cycling

    bool operator==(const WindowRecord& other) const
    {
        return id == other.id;
    }
};

using WindowRecordList = QList<WindowRecord>;

} // namespace PlasmaTabs

Q_DECLARE_METATYPE(PlasmaTabs::WindowRecord)
