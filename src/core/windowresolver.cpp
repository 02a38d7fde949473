// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowresolver.h"
#include "constants.h"
#include "logging.h"
#include "settings_interfaces.h"
#include "windowdiscriminator.h"
#include "windowsource.h"
#include <QElapsedTimer>
#include <QFutureWatcher>
#include <QStringList>
#include <QtConcurrent>
#include <algorithm>
#include <limits>

namespace PlasmaTabs {

WindowResolver::ScanOptions WindowResolver::ScanOptions::fromSettings(const IDiscoverySettings& settings)
{
    ScanOptions options;
    options.messagingTimeoutMs = settings.messagingTimeoutMs();
    options.bruteForceTimeoutMs = settings.bruteForceTimeoutMs();
    options.maxThreads = settings.maxResolverThreads();
    options.includeAccessoryApps = settings.includeAccessoryApps();
    options.levelWhitelist = settings.levelWhitelist();
    return options;
}

WindowResolver::WindowResolver(const TabbingContext& context, QObject* parent)
    : QObject(parent)
    , m_context(context)
{
    Q_ASSERT(context.isValid());
}

WindowResolver::~WindowResolver()
{
    // In-flight scans read m_context and m_pool
    m_scanRunner.waitForDone();
}

bool WindowResolver::isEligible(const ProcessInfo& process, const ScanOptions& options) const
{
    if (process.pid == m_context.selfPid || process.hidden) {
        return false;
    }
    switch (process.policy) {
    case PresentationPolicy::Regular:
        return true;
    case PresentationPolicy::Accessory:
        return options.includeAccessoryApps;
    case PresentationPolicy::Prohibited:
        return false;
    }
    return false;
}

WindowRecordList WindowResolver::resolve(Scope scope)
{
    return resolve(scope, ScanOptions::fromSettings(*m_context.settings));
}

WindowRecordList WindowResolver::resolve(Scope scope, const ScanOptions& options)
{
    if (!m_context.accessibility->isTrusted()) {
        qCDebug(lcResolver) << "Accessibility not permitted, returning no windows";
        return {};
    }

    QElapsedTimer totalTimer;
    totalTimer.start();

    // ═══════════════════════════════════════════════════════════════════════════
    // Step 1: window-server list (z-order ground truth) and eligible processes
    // ═══════════════════════════════════════════════════════════════════════════

    QHash<ProcessId, ProcessInfo> eligible;
    const QList<ProcessInfo> processes = m_context.windowServer->runningProcesses();
    for (const ProcessInfo& process : processes) {
        if (isEligible(process, options)) {
            eligible.insert(process.pid, process);
        }
    }

    const ServerListScope listScope =
        scope == Scope::CurrentDesktop ? ServerListScope::OnScreenOnly : ServerListScope::All;
    const QList<ServerWindowInfo> serverList = m_context.windowServer->windowList(listScope);

    QHash<WindowId, ServerEntry> serverLookup;
    QHash<ProcessId, QSet<WindowId>> serverIdsByPid;
    QHash<ProcessId, QSet<WindowId>> offLayerIdsByPid;
    for (int i = 0; i < serverList.size(); ++i) {
        const ServerWindowInfo& info = serverList.at(i);
        if (info.id == 0 || !eligible.contains(info.pid)) {
            continue;
        }
        if (info.layer != Defaults::NormalWindowLayer) {
            offLayerIdsByPid[info.pid].insert(info.id);
            continue;
        }
        serverLookup.insert(info.id, ServerEntry{info, i});
        serverIdsByPid[info.pid].insert(info.id);
    }
    const qint64 serverElapsed = totalTimer.elapsed();

    // ═══════════════════════════════════════════════════════════════════════════
    // Step 2-5: per-process accessibility scan, one slot per process
    // ═══════════════════════════════════════════════════════════════════════════

    QList<ProcessScan> scans;
    scans.reserve(eligible.size());
    for (auto it = eligible.cbegin(); it != eligible.cend(); ++it) {
        if (scope == Scope::CurrentDesktop && !serverIdsByPid.contains(it.key())) {
            continue;
        }
        ProcessScan scan;
        scan.process = it.value();
        scan.serverIds = serverIdsByPid.value(it.key());
        scan.offLayerIds = offLayerIdsByPid.value(it.key());
        scans.append(scan);
    }

    const WindowDiscriminator discriminator(options.levelWhitelist);
    m_pool.setMaxThreadCount(qMax(1, options.maxThreads));
    QtConcurrent::blockingMap(&m_pool, scans, [&](ProcessScan& scan) {
        scanProcess(scan, serverLookup, scope, options, discriminator);
    });

    WindowRecordList results;
    for (const ProcessScan& scan : std::as_const(scans)) {
        logScan(scan);
        results.append(scan.records);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Step 6: z-order, front-most first; unlisted records keep their relative order at the end
    // ═══════════════════════════════════════════════════════════════════════════

    const auto zOrderOf = [&serverLookup](const WindowRecord& record) {
        auto it = serverLookup.constFind(record.id);
        return it == serverLookup.constEnd() ? std::numeric_limits<int>::max() : it->zOrder;
    };
    std::stable_sort(results.begin(), results.end(), [&zOrderOf](const WindowRecord& a, const WindowRecord& b) {
        return zOrderOf(a) < zOrderOf(b);
    });

    qCDebug(lcResolver) << "Scan done: scope=" << scope << "processes=" << scans.size()
                        << "windows=" << results.size() << "serverList=" << serverElapsed << "ms"
                        << "total=" << totalTimer.elapsed() << "ms";
    return results;
}

void WindowResolver::scanProcess(ProcessScan& scan, const QHash<WindowId, ServerEntry>& serverLookup, Scope scope,
                                 const ScanOptions& options, const WindowDiscriminator& discriminator) const
{
    QElapsedTimer timer;
    timer.start();

    IAccessibilityBackend* ax = m_context.accessibility;
    const ProcessId pid = scan.process.pid;

    const ElementRef application = ax->applicationElement(pid);
    if (application.isNull()) {
        scan.elapsedMs = timer.elapsed();
        return;
    }
    ax->setMessagingTimeout(application, options.messagingTimeoutMs);

    // Hung, timed out or gone: the process contributes nothing, not even placeholders
    const auto windows = ax->windows(application);
    if (!windows) {
        scan.treeQueryFailed = true;
        scan.elapsedMs = timer.elapsed();
        return;
    }

    QHash<WindowId, ElementRef> elementsById;
    for (const ElementRef& element : *windows) {
        const auto id = ax->windowId(element);
        // Panels, docks and overlays the tree reports like any other window
        if (id && *id != 0 && !scan.offLayerIds.contains(*id)) {
            elementsById.insert(*id, element);
        }
    }
    scan.treeWindowCount = elementsById.size();

    // Server ids the tree did not return: other desktops or companion surfaces
    QSet<WindowId> placeholders;
    if (scope == Scope::AllDesktops) {
        QSet<WindowId> plausibleMissing;
        for (WindowId id : std::as_const(scan.serverIds)) {
            if (elementsById.contains(id)) {
                continue;
            }
            ++scan.missingCount;
            if (WindowDiscriminator::isPlausibleServerWindow(serverLookup.value(id).info)) {
                plausibleMissing.insert(id);
            }
        }
        scan.plausibleMissingCount = plausibleMissing.size();

        if (!plausibleMissing.isEmpty()) {
            const QHash<WindowId, ElementRef> probed =
                ax->probeWindows(pid, plausibleMissing, options.bruteForceTimeoutMs);
            for (auto it = probed.cbegin(); it != probed.cend(); ++it) {
                if (!it.value().isNull() && !elementsById.contains(it.key())) {
                    elementsById.insert(it.key(), it.value());
                    ++scan.probedCount;
                }
            }
        }

        for (WindowId id : std::as_const(plausibleMissing)) {
            if (elementsById.contains(id)) {
                continue;
            }
            if (serverLookup.value(id).info.onScreen) {
                ++scan.companionCount;
            } else {
                placeholders.insert(id);
            }
        }
    }

    // Discriminator pass over tree-backed windows
    for (auto it = elementsById.cbegin(); it != elementsById.cend(); ++it) {
        const WindowId id = it.key();
        const ElementRef& element = it.value();

        ax->setMessagingTimeout(element, options.messagingTimeoutMs);
        const auto attributes = ax->attributes(element);
        if (!attributes || attributes->minimized) {
            continue;
        }

        // Current-desktop scans only keep what the server lists on-screen
        const auto serverIt = serverLookup.constFind(id);
        if (scope == Scope::CurrentDesktop && serverIt == serverLookup.constEnd()) {
            continue;
        }

        WindowCandidate candidate;
        candidate.id = id;
        candidate.subrole = attributes->subrole;
        candidate.role = attributes->role;
        candidate.title = attributes->title;
        candidate.size = attributes->size;
        candidate.level = m_context.windowServer->windowLevel(id);
        candidate.appId = scan.process.appId;
        candidate.appName = scan.process.displayName;
        candidate.executablePath = scan.process.executablePath;
        if (!discriminator.isActualWindow(candidate)) {
            continue;
        }

        WindowRecord record;
        record.id = id;
        record.pid = pid;
        record.appId = scan.process.appId;
        record.title = attributes->title.value_or(serverIt != serverLookup.constEnd() ? serverIt->info.name : QString());
        record.appName = scan.process.displayName.isEmpty() ? QStringLiteral("Unknown") : scan.process.displayName;
        record.iconName = scan.process.iconName;
        record.element = element;
        if (serverIt != serverLookup.constEnd()) {
            record.cachedBounds = serverIt->info.bounds;
        }
        scan.records.append(record);
    }

    // Off-desktop windows the tree could not produce: process root stands in until focus time
    for (WindowId id : std::as_const(placeholders)) {
        const ServerWindowInfo& info = serverLookup.value(id).info;

        WindowCandidate candidate;
        candidate.id = id;
        candidate.title = info.name;
        candidate.size = QSizeF(info.bounds.size());
        candidate.level = m_context.windowServer->windowLevel(id);
        candidate.appId = scan.process.appId;
        candidate.appName = scan.process.displayName;
        candidate.executablePath = scan.process.executablePath;
        if (!discriminator.isActualWindow(candidate)) {
            continue;
        }

        WindowRecord record;
        record.id = id;
        record.pid = pid;
        record.appId = scan.process.appId;
        record.title = info.name;
        record.appName = scan.process.displayName.isEmpty() ? QStringLiteral("Unknown") : scan.process.displayName;
        record.iconName = scan.process.iconName;
        record.element = application;
        record.cachedBounds = info.bounds;
        record.isPlaceholder = true;
        scan.records.append(record);
        ++scan.placeholderCount;
    }

    scan.elapsedMs = timer.elapsed();
}

void WindowResolver::logScan(const ProcessScan& scan)
{
    if (scan.treeQueryFailed) {
        qCDebug(lcResolver) << "Process scan: pid=" << scan.process.pid << "app=" << scan.process.displayName
                            << "window list unavailable after" << scan.elapsedMs << "ms";
        return;
    }
    if (scan.elapsedMs <= Defaults::SlowProcessScanMs && scan.missingCount == 0) {
        return;
    }
    QStringList parts{
        QStringLiteral("pid=%1").arg(scan.process.pid),
        QStringLiteral("app=%1").arg(scan.process.displayName),
        QStringLiteral("total=%1ms").arg(scan.elapsedMs),
        QStringLiteral("tree=%1").arg(scan.treeWindowCount),
    };
    if (scan.missingCount > 0) {
        parts << QStringLiteral("missing=%1").arg(scan.missingCount)
              << QStringLiteral("plausible=%1").arg(scan.plausibleMissingCount)
              << QStringLiteral("probed=%1").arg(scan.probedCount)
              << QStringLiteral("placeholders=%1").arg(scan.placeholderCount)
              << QStringLiteral("companions=%1").arg(scan.companionCount);
    }
    parts << QStringLiteral("result=%1").arg(scan.records.size());
    qCDebug(lcResolver).noquote() << "Process scan:" << parts.join(QLatin1Char(' '));
}

void WindowResolver::refreshAsync(Scope scope)
{
    const quint64 generation = ++m_requestedGeneration;
    const ScanOptions options = ScanOptions::fromSettings(*m_context.settings);

    auto* watcher = new QFutureWatcher<WindowRecordList>(this);
    connect(watcher, &QFutureWatcher<WindowRecordList>::finished, this, [this, watcher, generation]() {
        watcher->deleteLater();
        if (generation < m_deliveredGeneration) {
            qCDebug(lcResolver) << "Dropping scan" << generation << "superseded by" << m_deliveredGeneration;
            return;
        }
        m_deliveredGeneration = generation;
        m_lastResult = watcher->result();
        Q_EMIT windowsResolved(m_lastResult);
    });
    watcher->setFuture(QtConcurrent::run(&m_scanRunner, [this, scope, options]() {
        return resolve(scope, options);
    }));
}

std::optional<WindowRecord> WindowResolver::buildWindowRecord(const ElementRef& element, ProcessId pid) const
{
    IAccessibilityBackend* ax = m_context.accessibility;
    const auto id = ax->windowId(element);
    if (!id || *id == 0) {
        return std::nullopt;
    }

    const QList<ServerWindowInfo> serverList = m_context.windowServer->windowList(ServerListScope::All);
    const auto serverIt = std::find_if(serverList.cbegin(), serverList.cend(), [&](const ServerWindowInfo& info) {
        return info.id == *id && info.pid == pid && info.layer == Defaults::NormalWindowLayer;
    });
    if (serverIt == serverList.cend()) {
        qCDebug(lcResolver) << "Window" << *id << "not on the normal layer of pid" << pid;
        return std::nullopt;
    }

    const auto process = m_context.windowServer->processInfo(pid);
    if (!process || !isEligible(*process, ScanOptions::fromSettings(*m_context.settings))) {
        return std::nullopt;
    }

    const auto attributes = ax->attributes(element);
    if (!attributes) {
        return std::nullopt;
    }

    WindowCandidate candidate;
    candidate.id = *id;
    candidate.subrole = attributes->subrole;
    candidate.role = attributes->role;
    candidate.title = attributes->title;
    candidate.size = attributes->size;
    candidate.level = m_context.windowServer->windowLevel(*id);
    candidate.appId = process->appId;
    candidate.appName = process->displayName;
    candidate.executablePath = process->executablePath;

    const WindowDiscriminator discriminator(m_context.settings->levelWhitelist());
    const WindowDiscriminator::Decision decision = discriminator.decide(candidate);
    if (!decision.accepted) {
        qCDebug(lcResolver) << "Window" << *id << "rejected by rule" << decision.rule;
        return std::nullopt;
    }

    WindowRecord record;
    record.id = *id;
    record.pid = pid;
    record.appId = process->appId;
    record.title = attributes->title.value_or(serverIt->name);
    record.appName = process->displayName.isEmpty() ? QStringLiteral("Unknown") : process->displayName;
    record.iconName = process->iconName;
    record.element = element;
    record.cachedBounds = serverIt->bounds;
    return record;
}

ElementRef WindowResolver::resolveElement(const WindowRecord& record) const
{
    if (!record.isPlaceholder) {
        return record.element;
    }

    IAccessibilityBackend* ax = m_context.accessibility;
    const ElementRef application = ax->applicationElement(record.pid);
    if (application.isNull()) {
        return {};
    }
    ax->setMessagingTimeout(application, m_context.settings->messagingTimeoutMs());

    if (const auto windows = ax->windows(application)) {
        for (const ElementRef& element : *windows) {
            if (ax->windowId(element) == record.id) {
                return element;
            }
        }
    }

    const QHash<WindowId, ElementRef> probed =
        ax->probeWindows(record.pid, QSet<WindowId>{record.id}, m_context.settings->bruteForceTimeoutMs());
    const ElementRef found = probed.value(record.id);
    if (found.isNull()) {
        qCDebug(lcResolver) << "Placeholder window" << record.id << "could not be resolved";
    }
    return found;
}

} // namespace PlasmaTabs
