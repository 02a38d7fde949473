// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowdiscriminator.h"
#include "constants.h"
#include <array>

namespace PlasmaTabs {

namespace {

using Verdict = WindowDiscriminator::Verdict;

// Apps that report unknown or utility subroles for their main windows
const QSet<QString>& subroleAgnosticApps()
{
    static const QSet<QString> apps{
        QStringLiteral("org.videolan.vlc"),
        QStringLiteral("ch.openboard.OpenBoard"),
    };
    return apps;
}

bool hasTitle(const WindowCandidate& c)
{
    return c.title.has_value() && !c.title->isEmpty();
}

bool isNonStandardSubrole(WindowSubrole subrole)
{
    switch (subrole) {
    case WindowSubrole::Sheet:
    case WindowSubrole::Popover:
    case WindowSubrole::SystemDialog:
    case WindowSubrole::FloatingWindow:
        return true;
    case WindowSubrole::Unknown:
    case WindowSubrole::Standard:
    case WindowSubrole::Dialog:
    case WindowSubrole::Document:
        return false;
    }
    return false;
}

bool looksLikeGenuineSurface(const WindowCandidate& c)
{
    if (!hasTitle(c) || !c.size) {
        return false;
    }
    return c.size->width() >= Defaults::GenuineSurfaceMinWidth
        && c.size->height() >= Defaults::GenuineSurfaceMinHeight;
}

Verdict ruleValidId(const WindowCandidate& c, const WindowDiscriminator&)
{
    return c.id == 0 ? Verdict::Reject : Verdict::Abstain;
}

Verdict ruleNonStandardKind(const WindowCandidate& c, const WindowDiscriminator&)
{
    if (c.role == WindowRole::Other) {
        return Verdict::Reject;
    }
    if (!c.subrole || !isNonStandardSubrole(*c.subrole)) {
        return Verdict::Abstain;
    }
    if (subroleAgnosticApps().contains(c.appId) || looksLikeGenuineSurface(c)) {
        return Verdict::Abstain;
    }
    return Verdict::Reject;
}

Verdict ruleAuxiliarySurface(const WindowCandidate& c, const WindowDiscriminator&)
{
    if (!c.size || hasTitle(c)) {
        return Verdict::Abstain;
    }
    // Strict: an untitled 50x50 window is still a window
    if (c.size->width() < Defaults::MinimumWindowDimension || c.size->height() < Defaults::MinimumWindowDimension) {
        return Verdict::Reject;
    }
    return Verdict::Abstain;
}

Verdict ruleLevelBand(const WindowCandidate& c, const WindowDiscriminator& discriminator)
{
    if (!c.level || *c.level == Defaults::NormalWindowLevel) {
        return Verdict::Abstain;
    }
    return discriminator.isLevelWhitelisted(c.appId) ? Verdict::Abstain : Verdict::Reject;
}

Verdict ruleAppOverride(const WindowCandidate& c, const WindowDiscriminator&)
{
    const QString& appId = c.appId;

    if (!appId.isEmpty()) {
        // Steam: every window has an unknown subrole; dropdowns are untitled
        if (appId == QLatin1String("steam") || appId == QLatin1String("com.valvesoftware.Steam")) {
            return (hasTitle(c) && c.role.has_value()) ? Verdict::Accept : Verdict::Reject;
        }

        // Firefox: fullscreen video and tooltips share the unknown subrole, tooltips are short
        if (appId == QLatin1String("firefox") || appId.startsWith(QLatin1String("org.mozilla.firefox"))) {
            if (c.role != WindowRole::Window) {
                return Verdict::Reject;
            }
            return (c.size && c.size->height() > 400) ? Verdict::Accept : Verdict::Reject;
        }

        // JetBrains IDEs: splash screens and tool windows are untitled or tiny
        if (appId.startsWith(QLatin1String("com.jetbrains.")) || appId.startsWith(QLatin1String("jetbrains-"))) {
            if (c.subrole == WindowSubrole::Standard || c.subrole == WindowSubrole::Dialog) {
                return Verdict::Accept;
            }
            if (!hasTitle(c)) {
                return Verdict::Reject;
            }
            if (c.size && (c.size->width() < 100 || c.size->height() < 100)) {
                return Verdict::Reject;
            }
            return Verdict::Accept;
        }

        return Verdict::Abstain;
    }

    // Processes without an app identity
    if (c.appName == QLatin1String("wine64-preloader") || c.executablePath.contains(QLatin1String("/winetemp-"))) {
        const bool ok = c.role == WindowRole::Window && c.subrole == WindowSubrole::Unknown
            && c.level == Defaults::NormalWindowLevel;
        return ok ? Verdict::Accept : Verdict::Reject;
    }

    if (c.executablePath.contains(QLatin1String("qemu-system"))) {
        return hasTitle(c) ? Verdict::Accept : Verdict::Reject;
    }

    return Verdict::Abstain;
}

struct Rule
{
    QLatin1String name;
    Verdict (*evaluate)(const WindowCandidate&, const WindowDiscriminator&);
};

const std::array<Rule, 5> kRules{{
    {QLatin1String("valid-id"), &ruleValidId},
    {QLatin1String("non-standard-kind"), &ruleNonStandardKind},
    {QLatin1String("auxiliary-surface"), &ruleAuxiliarySurface},
    {QLatin1String("level-band"), &ruleLevelBand},
    {QLatin1String("app-override"), &ruleAppOverride},
}};

} // namespace

WindowDiscriminator::WindowDiscriminator(const QStringList& levelWhitelist)
    : m_levelWhitelist(levelWhitelist.cbegin(), levelWhitelist.cend())
{
}

WindowDiscriminator::Decision WindowDiscriminator::decide(const WindowCandidate& candidate) const
{
    for (const Rule& rule : kRules) {
        const Verdict verdict = rule.evaluate(candidate, *this);
        if (verdict != Verdict::Abstain) {
            return Decision{verdict == Verdict::Accept, rule.name};
        }
    }
    return Decision{true, QLatin1String("default")};
}

bool WindowDiscriminator::isActualWindow(const WindowCandidate& candidate) const
{
    return decide(candidate).accepted;
}

bool WindowDiscriminator::isActualWindow(WindowId id, std::optional<WindowSubrole> subrole,
                                         std::optional<WindowRole> role, const std::optional<QString>& title,
                                         std::optional<QSizeF> size, std::optional<int> level,
                                         const QString& appId, const QString& appName,
                                         const QString& executablePath) const
{
    WindowCandidate candidate;
    candidate.id = id;
    candidate.subrole = subrole;
    candidate.role = role;
    candidate.title = title;
    candidate.size = size;
    candidate.level = level;
    candidate.appId = appId;
    candidate.appName = appName;
    candidate.executablePath = executablePath;
    return isActualWindow(candidate);
}

bool WindowDiscriminator::isLevelWhitelisted(const QString& appId) const
{
    return !appId.isEmpty() && m_levelWhitelist.contains(appId);
}

bool WindowDiscriminator::isPlausibleServerWindow(const ServerWindowInfo& info)
{
    if (info.alpha <= 0.0) {
        return false;
    }
    if (info.bounds.width() < 1 || info.bounds.height() < 1) {
        return false;
    }
    if (!info.name.isEmpty()) {
        return true;
    }
    const int minDim = static_cast<int>(Defaults::MinimumWindowDimension);
    if (info.bounds.width() >= minDim && info.bounds.height() >= minDim && info.onScreen) {
        return true;
    }
    return info.bounds.width() >= Defaults::PlausibleOffscreenMinWidth
        && info.bounds.height() >= Defaults::PlausibleOffscreenMinHeight;
}

} // namespace PlasmaTabs
