// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "types.h"
#include <QDeadlineTimer>
#include <QHash>
#include <QList>
#include <QRect>

namespace PlasmaTabs {

class IGroupBehaviorSettings;

/**
 * @brief Suppresses move/resize echoes of our own frame writes
 *
 * Before writing a frame to a window the controller records it as expected.
 * A later move or resize notification for that window is suppressed while
 * the window's current frame matches the expectation within the tolerance,
 * or while the suppression deadline has not passed. The first mismatch after
 * the deadline drops the expectation and lets the notification through.
 */
class PLASMATABS_EXPORT ExpectedFrameTracker
{
public:
    explicit ExpectedFrameTracker(const IGroupBehaviorSettings& settings);

    void setExpectedFrame(const QRect& frame, const QList<WindowId>& windowIds);

    /**
     * @brief Whether a notification reporting @p currentFrame is our own echo
     */
    bool shouldSuppress(WindowId windowId, const QRect& currentFrame);

    bool framesMatch(const QRect& a, const QRect& b) const;

    bool hasExpectation(WindowId windowId) const
    {
        return m_expected.contains(windowId);
    }
    void clear(WindowId windowId);
    void clearAll();

private:
    struct Expectation
    {
        QRect frame;
        QDeadlineTimer deadline;
    };

    const IGroupBehaviorSettings& m_settings;
    QHash<WindowId, Expectation> m_expected;
};

} // namespace PlasmaTabs
