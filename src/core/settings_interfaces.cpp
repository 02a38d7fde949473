// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings_interfaces.h"

namespace PlasmaTabs {

ITabSettings::~ITabSettings() = default;

} // namespace PlasmaTabs
