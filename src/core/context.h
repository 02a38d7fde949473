// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "types.h"

namespace PlasmaTabs {

class IWindowServer;
class IAccessibilityBackend;
class ITabSettings;

/**
 * @brief Process-wide collaborators, constructed once at startup
 *
 * Passed by reference to every component instead of reaching for globals.
 * None of the pointers are owned. All group state that hangs off this
 * context belongs to the thread that constructed it.
 */
struct PLASMATABS_EXPORT TabbingContext
{
    IWindowServer* windowServer = nullptr;
    IAccessibilityBackend* accessibility = nullptr;
    const ITabSettings* settings = nullptr;
    ProcessId selfPid = 0;     ///< Our own process, excluded from discovery

    bool isValid() const
    {
        return windowServer && accessibility && settings;
    }
};

} // namespace PlasmaTabs
