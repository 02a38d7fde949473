// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "types.h"
#include <QLatin1String>
#include <QSet>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <optional>

namespace PlasmaTabs {

/**
 * @brief Everything the discriminator looks at for one candidate window
 *
 * Attribute fields are empty when the accessibility backend could not read them.
 */
struct PLASMATABS_EXPORT WindowCandidate
{
    WindowId id = 0;
    std::optional<WindowSubrole> subrole;
    std::optional<WindowRole> role;
    std::optional<QString> title;
    std::optional<QSizeF> size;
    std::optional<int> level;
    QString appId;
    QString appName;
    QString executablePath;
};

/**
 * @brief Decides whether a candidate is a real, user-facing top-level window
 *
 * Evaluates an ordered rule table. Each rule accepts, rejects or abstains;
 * the first rule that does not abstain decides, and a candidate no rule
 * rejects is accepted:
 *
 *   1. valid-id            - window id 0 is never a window
 *   2. non-standard-kind   - sheets, popovers, system dialogs, floating palettes
 *                            and non-window elements, unless titled and large
 *   3. auxiliary-surface   - untitled and below 50 units in either dimension
 *   4. level-band          - outside the normal stacking level, unless whitelisted
 *   5. app-override        - known applications with misleading attributes
 *
 * Pure: no backend access, no state besides the immutable whitelist.
 */
class PLASMATABS_EXPORT WindowDiscriminator
{
public:
    enum class Verdict {
        Accept,
        Reject,
        Abstain
    };

    struct Decision
    {
        bool accepted = true;
        QLatin1String rule; ///< Name of the deciding rule, "default" if none decided
    };

    explicit WindowDiscriminator(const QStringList& levelWhitelist = {});

    bool isActualWindow(const WindowCandidate& candidate) const;

    bool isActualWindow(WindowId id, std::optional<WindowSubrole> subrole, std::optional<WindowRole> role,
                        const std::optional<QString>& title, std::optional<QSizeF> size, std::optional<int> level,
                        const QString& appId, const QString& appName, const QString& executablePath) const;

    /**
     * @brief Same as isActualWindow() but reports which rule decided
     */
    Decision decide(const WindowCandidate& candidate) const;

    bool isLevelWhitelisted(const QString& appId) const;

    /**
     * @brief Window-server level pre-filter
     *
     * A server entry is worth probing for (or synthesising a placeholder from)
     * only if it is visible (alpha > 0), non-degenerate (at least 1x1) and
     * either titled, at least 50x50 and on-screen, or at least 240x140.
     * Off-desktop windows commonly report off-screen and untitled, hence the
     * larger geometry bar for them.
     */
    static bool isPlausibleServerWindow(const ServerWindowInfo& info);

private:
    QSet<QString> m_levelWhitelist;
};

} // namespace PlasmaTabs
