// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmatabs_export.h"
#include "context.h"
#include "windowrecord.h"
#include <QHash>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QThreadPool>
#include <optional>

namespace PlasmaTabs {

class IDiscoverySettings;
class WindowDiscriminator;

/**
 * @brief Reconciles the window-server list and the accessibility tree
 *
 * Produces one deduplicated list of WindowRecord ordered by the window
 * server's z-order (front-most first):
 *
 * 1. One window-server query, filtered to layer 0 windows of eligible
 *    processes (not ourselves, regular presentation policy, not hidden).
 * 2. One accessibility query per process, run in parallel on a bounded
 *    pool. Each task writes only into its own pre-allocated slot and uses
 *    a messaging timeout so a hung process cannot stall the scan.
 * 3. Server ids the tree did not return are probed for (windows on other
 *    virtual desktops), limited to plausible server entries.
 * 4. Still-missing ids: on-screen ones are companion surfaces and dropped,
 *    off-screen ones become placeholder records backed by the process root.
 * 5. Discriminator rejects and minimized windows are dropped.
 * 6. Stable sort by z-order; records the server did not list go last.
 *
 * A process that cannot be queried contributes nothing; it is never an
 * error for the whole scan.
 */
class PLASMATABS_EXPORT WindowResolver : public QObject
{
    Q_OBJECT

public:
    enum class Scope {
        CurrentDesktop, ///< On-screen windows only, no probing, no placeholders
        AllDesktops ///< Every virtual desktop
    };
    Q_ENUM(Scope)

    /**
     * @brief Settings snapshot taken on the calling thread before a scan
     */
    struct ScanOptions
    {
        int messagingTimeoutMs = 100;
        int bruteForceTimeoutMs = 200;
        int maxThreads = 8;
        bool includeAccessoryApps = false;
        QStringList levelWhitelist;

        static ScanOptions fromSettings(const IDiscoverySettings& settings);
    };

    explicit WindowResolver(const TabbingContext& context, QObject* parent = nullptr);
    ~WindowResolver() override;

    /**
     * @brief Run a full scan synchronously
     * @return Canonical window list, empty if accessibility is not permitted
     */
    WindowRecordList resolve(Scope scope = Scope::AllDesktops);
    WindowRecordList resolve(Scope scope, const ScanOptions& options);

    /**
     * @brief Run a scan on a worker thread and emit windowsResolved() when done
     *
     * Scans are never cancelled. A result older than one already delivered
     * is discarded.
     */
    void refreshAsync(Scope scope = Scope::AllDesktops);

    /**
     * @brief Most recent list delivered by refreshAsync()
     */
    WindowRecordList lastResult() const
    {
        return m_lastResult;
    }

    /**
     * @brief Validate a single element as a real window
     *
     * Used when a window is picked directly or when an element is re-acquired
     * after a destroy notification.
     * @return Record, or nullopt if the element is stale, not on the window
     *         server's normal layer, or rejected by the discriminator
     */
    std::optional<WindowRecord> buildWindowRecord(const ElementRef& element, ProcessId pid) const;

    /**
     * @brief Concrete element for a record
     *
     * Placeholder records carry their process root; this looks up the real
     * window element, first in the default window list and then by probing.
     * @return Null ElementRef if the window can no longer be found
     */
    ElementRef resolveElement(const WindowRecord& record) const;

Q_SIGNALS:
    void windowsResolved(const PlasmaTabs::WindowRecordList& windows);

private:
    struct ServerEntry
    {
        ServerWindowInfo info;
        int zOrder = 0;
    };

    struct ProcessScan
    {
        ProcessInfo process;
        QSet<WindowId> serverIds;
        QSet<WindowId> offLayerIds;
        // Output, written only by the task that owns this slot
        WindowRecordList records;
        int treeWindowCount = 0;
        int missingCount = 0;
        int plausibleMissingCount = 0;
        int probedCount = 0;
        int placeholderCount = 0;
        int companionCount = 0;
        bool treeQueryFailed = false;
        qint64 elapsedMs = 0;
    };

    bool isEligible(const ProcessInfo& process, const ScanOptions& options) const;
    void scanProcess(ProcessScan& scan, const QHash<WindowId, ServerEntry>& serverLookup, Scope scope,
                     const ScanOptions& options, const WindowDiscriminator& discriminator) const;
    static void logScan(const ProcessScan& scan);

    const TabbingContext& m_context;
    QThreadPool m_pool;        // per-process fan-out
    QThreadPool m_scanRunner;  // whole scans started by refreshAsync()
    quint64 m_requestedGeneration = 0;
    quint64 m_deliveredGeneration = 0;
    WindowRecordList m_lastResult;
};

} // namespace PlasmaTabs
