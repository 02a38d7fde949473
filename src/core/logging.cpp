// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace PlasmaTabs {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "plasmatabs.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcResolver, "plasmatabs.core.resolver", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGroups, "plasmatabs.core.groups", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEvents, "plasmatabs.core.events", QtInfoMsg)

// Controller categories
Q_LOGGING_CATEGORY(lcController, "plasmatabs.controller", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "plasmatabs.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "plasmatabs.config", QtInfoMsg)

} // namespace PlasmaTabs
