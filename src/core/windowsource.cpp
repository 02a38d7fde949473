// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowsource.h"

namespace PlasmaTabs {

// Key functions for interface classes to anchor vtables to this translation unit

IWindowServer::~IWindowServer() = default;

IAccessibilityBackend::~IAccessibilityBackend() = default;

} // namespace PlasmaTabs
