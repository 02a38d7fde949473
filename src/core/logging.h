// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for PlasmaTabs
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcResolver) << "Debug message";
 *   qCWarning(lcGroups) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="plasmatabs.*=true"                     # Enable all
 *   QT_LOGGING_RULES="plasmatabs.*.debug=false"              # Disable debug only
 *   QT_LOGGING_RULES="plasmatabs.core.resolver.debug=true"   # Discovery timings
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, per-event detail
 *   qCInfo     - Lifecycle events (startup, group created/dissolved)
 *   qCWarning  - Recoverable errors, rejected requests, invalid config
 *   qCCritical - Not used by the core; nothing here may stop the daemon
 */

namespace PlasmaTabs {

// Core module - discovery, groups, event bridge
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcResolver)
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcGroups)
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcEvents)

// Controller - hotkey commands and external event reactions
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcController)

// D-Bus module
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
PLASMATABS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace PlasmaTabs
