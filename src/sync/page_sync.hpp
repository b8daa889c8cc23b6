#pragma once

#include "core/annotation.hpp"
#include "core/context.hpp"
#include "core/result.hpp"
#include "sync/sync_settings.hpp"

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace trellis::sync {

/**
 * CancellationToken - shared flag checked by deferred work before it runs.
 * Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<bool>(false)) {}

    void cancel() { *cancelled_ = true; }
    [[nodiscard]] bool is_cancelled() const { return *cancelled_; }

private:
    std::shared_ptr<bool> cancelled_;
};

/**
 * PendingTask - the one debounced local encode a page may have waiting.
 */
struct PendingTask {
    CancellationToken token;
    QPointer<QTimer> timer;

    void cancel() {
        token.cancel();
        if (timer) {
            timer->stop();
            timer->deleteLater();
        }
    }
};

/**
 * PageSyncScheduler - Drives encode/reconcile cycles for shared pages.
 *
 * Everything runs on the thread owning the scheduler. Per page:
 * - local edits are debounced; a newer edit replaces the pending encode
 * - a remote document cancels the pending local encode and is reconciled
 *   right away, or parked (latest wins) while a cycle is already running
 * - at most one cycle is in flight; a running op sequence is never cut short
 *
 * Encoded documents go out through `localStateReady` as JSON; remote
 * documents come in through `applyRemoteState`.
 */
class PageSyncScheduler : public QObject {
    Q_OBJECT

public:
    /// Upper bound on reconcile passes per remote document.
    static constexpr int kMaxReconcilePasses = 4;

    PageSyncScheduler(SyncContext& ctx, SyncSettings settings, QObject* parent = nullptr);
    ~PageSyncScheduler() override;

    /**
     * Start syncing a page: encode it, store the state and publish it.
     */
    [[nodiscard]] Result<void> sharePage(const PageId& page_id);

    /**
     * Stop syncing a page. Pending work is dropped and its stored state
     * removed; a running cycle finishes first.
     */
    [[nodiscard]] Result<void> disconnectPage(const PageId& page_id);

    [[nodiscard]] bool isShared(const PageId& page_id) const;
    [[nodiscard]] std::vector<PageId> sharedPages() const;

    /**
     * A local edit happened on the page; (re)start the debounce window.
     * Edits on pages that are not shared are ignored.
     */
    void noteLocalEdit(const PageId& page_id);

    /**
     * Converge the local tree to a remote document.
     */
    [[nodiscard]] Result<void> applyRemoteState(const PageId& page_id, doc::FlatDocument document);

    /**
     * applyRemoteState for a JSON payload.
     */
    [[nodiscard]] Result<void> applyRemoteJson(const PageId& page_id, const QByteArray& json);

    /**
     * Encode and publish now, skipping the debounce window.
     */
    [[nodiscard]] Result<void> forcePushPage(const PageId& page_id);

    /**
     * Last stored document of a page.
     */
    [[nodiscard]] Result<std::optional<doc::FlatDocument>> localState(const PageId& page_id);

    [[nodiscard]] bool hasPendingEdit(const PageId& page_id) const;
    [[nodiscard]] bool isInFlight(const PageId& page_id) const;
    [[nodiscard]] int debounceMs() const { return settings_.debounce_ms; }

signals:
    void localStateReady(const QString& pageId, const QByteArray& documentJson);
    void reconciled(const QString& pageId, int appliedOps);
    // Failures of deferred work (debounced encodes, parked remote documents).
    // Direct calls return their error instead.
    void syncFailed(const QString& pageId, const QString& message);
    void sharedPagesChanged();

private:
    struct PageSlot {
        bool in_flight = false;
        bool push_requested = false;
        bool disconnect_requested = false;
        std::optional<PendingTask> pending;
        std::optional<doc::FlatDocument> parked_remote;
    };

    SyncContext& ctx_;
    SyncSettings settings_;
    std::map<PageId, PageSlot> pages_;

    [[nodiscard]] PageSlot* slot(const PageId& page_id);
    [[nodiscard]] const PageSlot* slot(const PageId& page_id) const;

    void cancelPending(const PageId& page_id);
    [[nodiscard]] Result<void> runLocalCycle(const PageId& page_id);
    [[nodiscard]] Result<void> runRemoteCycle(const PageId& page_id, const doc::FlatDocument& document);
    [[nodiscard]] Result<void> publish(const PageId& page_id, const doc::FlatDocument& document);
    void finishCycle(const PageId& page_id);
    void report(const PageId& page_id, const Error& error);
};

} // namespace trellis::sync
