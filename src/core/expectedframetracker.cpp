// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "expectedframetracker.h"
#include "logging.h"
#include "settings_interfaces.h"

namespace PlasmaTabs {

ExpectedFrameTracker::ExpectedFrameTracker(const IGroupBehaviorSettings& settings)
    : m_settings(settings)
{
}

void ExpectedFrameTracker::setExpectedFrame(const QRect& frame, const QList<WindowId>& windowIds)
{
    const QDeadlineTimer deadline(m_settings.suppressionDeadlineMs());
    for (WindowId windowId : windowIds) {
        m_expected.insert(windowId, Expectation{frame, deadline});
    }
}

bool ExpectedFrameTracker::shouldSuppress(WindowId windowId, const QRect& currentFrame)
{
    const auto it = m_expected.constFind(windowId);
    if (it == m_expected.constEnd()) {
        return false;
    }
    if (framesMatch(currentFrame, it->frame) || !it->deadline.hasExpired()) {
        return true;
    }

    qCDebug(lcController) << "Expected frame for window" << windowId << "expired, current" << currentFrame;
    m_expected.erase(it);
    return false;
}

bool ExpectedFrameTracker::framesMatch(const QRect& a, const QRect& b) const
{
    const int tolerance = m_settings.frameTolerance();
    return qAbs(a.x() - b.x()) <= tolerance && qAbs(a.y() - b.y()) <= tolerance
        && qAbs(a.width() - b.width()) <= tolerance && qAbs(a.height() - b.height()) <= tolerance;
}

void ExpectedFrameTracker::clear(WindowId windowId)
{
    m_expected.remove(windowId);
}

void ExpectedFrameTracker::clearAll()
{
    m_expected.clear();
}

} // namespace PlasmaTabs
