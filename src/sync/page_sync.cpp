#include "sync/page_sync.hpp"

#include "core/document_encoder.hpp"
#include "core/tree_reconciler.hpp"
#include "sync/document_json.hpp"
#include "sync/logging.hpp"

#include <QDebug>

namespace trellis::sync {

namespace {

QString qpage(const PageId& page_id) {
    return QString::fromStdString(page_id);
}

Error not_shared(const PageId& page_id) {
    return Error{"Page " + page_id + " is not shared", ErrorCode::MissingPage};
}

} // namespace

PageSyncScheduler::PageSyncScheduler(SyncContext& ctx, SyncSettings settings, QObject* parent)
    : QObject(parent), ctx_(ctx), settings_(std::move(settings)) {}

PageSyncScheduler::~PageSyncScheduler() {
    for (auto& [page_id, s] : pages_) {
        if (s.pending) {
            s.pending->cancel();
        }
    }
}

PageSyncScheduler::PageSlot* PageSyncScheduler::slot(const PageId& page_id) {
    auto it = pages_.find(page_id);
    return it == pages_.end() ? nullptr : &it->second;
}

const PageSyncScheduler::PageSlot* PageSyncScheduler::slot(const PageId& page_id) const {
    auto it = pages_.find(page_id);
    return it == pages_.end() ? nullptr : &it->second;
}

bool PageSyncScheduler::isShared(const PageId& page_id) const {
    const auto* s = slot(page_id);
    return s && !s->disconnect_requested;
}

std::vector<PageId> PageSyncScheduler::sharedPages() const {
    std::vector<PageId> out;
    for (const auto& [page_id, s] : pages_) {
        if (!s.disconnect_requested) {
            out.push_back(page_id);
        }
    }
    return out;
}

bool PageSyncScheduler::hasPendingEdit(const PageId& page_id) const {
    const auto* s = slot(page_id);
    return s && s->pending.has_value();
}

bool PageSyncScheduler::isInFlight(const PageId& page_id) const {
    const auto* s = slot(page_id);
    return s && s->in_flight;
}

Result<void> PageSyncScheduler::sharePage(const PageId& page_id) {
    auto open = ctx_.require_open("sharePage");
    if (open.is_err()) {
        return open;
    }
    if (isShared(page_id)) {
        return Result<void>::ok();
    }
    if (auto* s = slot(page_id)) {
        // A disconnect waiting on the running cycle is withdrawn; the page
        // is pushed again once that cycle finishes.
        s->disconnect_requested = false;
        s->push_requested = true;
        qInfo() << "SYNC: shared page" << qpage(page_id) << "again before disconnect";
        emit sharedPagesChanged();
        return Result<void>::ok();
    }

    pages_.emplace(page_id, PageSlot{});
    auto pushed = runLocalCycle(page_id);
    if (pushed.is_err()) {
        if (auto* s = slot(page_id); s && !s->in_flight) {
            pages_.erase(page_id);
        }
        return Result<void>::err(pushed.unwrap_err().with_context("Sharing " + page_id));
    }

    qInfo() << "SYNC: shared page" << qpage(page_id);
    emit sharedPagesChanged();
    return Result<void>::ok();
}

Result<void> PageSyncScheduler::disconnectPage(const PageId& page_id) {
    auto* s = slot(page_id);
    if (!s) {
        return Result<void>::ok();
    }

    cancelPending(page_id);
    s->parked_remote.reset();
    s->push_requested = false;
    if (s->in_flight) {
        s->disconnect_requested = true;
        return Result<void>::ok();
    }

    pages_.erase(page_id);
    qInfo() << "SYNC: disconnected page" << qpage(page_id);
    emit sharedPagesChanged();
    return ctx_.states().remove(page_id);
}

void PageSyncScheduler::cancelPending(const PageId& page_id) {
    auto* s = slot(page_id);
    if (!s || !s->pending) {
        return;
    }
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: cancel pending encode page=" << qpage(page_id);
    }
    s->pending->cancel();
    s->pending.reset();
}

void PageSyncScheduler::noteLocalEdit(const PageId& page_id) {
    if (!isShared(page_id)) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: ignore edit on unshared page" << qpage(page_id);
        }
        return;
    }

    cancelPending(page_id);

    PendingTask task;
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(settings_.debounce_ms);
    const auto token = task.token;
    connect(timer, &QTimer::timeout, this, [this, page_id, token, timer]() {
        timer->deleteLater();
        if (token.is_cancelled()) {
            return;
        }
        if (auto* s = slot(page_id)) {
            s->pending.reset();
        }
        auto pushed = runLocalCycle(page_id);
        if (pushed.is_err()) {
            report(page_id, pushed.unwrap_err());
        }
    });
    task.timer = timer;

    slot(page_id)->pending = std::move(task);
    timer->start();
}

Result<void> PageSyncScheduler::forcePushPage(const PageId& page_id) {
    if (!isShared(page_id)) {
        return Result<void>::err(not_shared(page_id));
    }
    cancelPending(page_id);
    return runLocalCycle(page_id);
}

Result<void> PageSyncScheduler::applyRemoteState(const PageId& page_id, doc::FlatDocument document) {
    auto open = ctx_.require_open("applyRemoteState");
    if (open.is_err()) {
        return open;
    }
    if (!isShared(page_id)) {
        return Result<void>::err(not_shared(page_id));
    }
    auto valid = doc::validate(document);
    if (valid.is_err()) {
        qCritical() << "SYNC: rejected remote document page=" << qpage(page_id)
                    << QString::fromStdString(valid.unwrap_err().message);
        return valid;
    }

    cancelPending(page_id);

    auto* s = slot(page_id);
    if (s->in_flight) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: park remote document page=" << qpage(page_id);
        }
        s->parked_remote = std::move(document);
        return Result<void>::ok();
    }
    return runRemoteCycle(page_id, document);
}

Result<void> PageSyncScheduler::applyRemoteJson(const PageId& page_id, const QByteArray& json) {
    auto parsed = from_json(json);
    if (parsed.is_err()) {
        qWarning() << "SYNC: undecodable remote document page=" << qpage(page_id)
                   << QString::fromStdString(parsed.unwrap_err().message);
        return Result<void>::err(parsed.unwrap_err());
    }
    return applyRemoteState(page_id, std::move(parsed).unwrap());
}

Result<std::optional<doc::FlatDocument>> PageSyncScheduler::localState(const PageId& page_id) {
    auto open = ctx_.require_open("localState");
    if (open.is_err()) {
        return Result<std::optional<doc::FlatDocument>>::err(open.unwrap_err());
    }
    return ctx_.states().load(page_id);
}

Result<void> PageSyncScheduler::runLocalCycle(const PageId& page_id) {
    auto* s = slot(page_id);
    if (!s) {
        return Result<void>::err(not_shared(page_id));
    }
    if (s->in_flight) {
        s->push_requested = true;
        return Result<void>::ok();
    }

    s->in_flight = true;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: encode page=" << qpage(page_id);
    }

    Result<void> out = Result<void>::ok();
    auto encoded = doc::encode(ctx_, page_id);
    if (encoded.is_err()) {
        out = Result<void>::err(encoded.unwrap_err());
    } else {
        out = publish(page_id, encoded.unwrap());
    }

    finishCycle(page_id);
    return out;
}

Result<void> PageSyncScheduler::publish(const PageId& page_id, const doc::FlatDocument& document) {
    auto previous = ctx_.states().load(page_id);
    if (previous.is_err()) {
        return Result<void>::err(previous.unwrap_err());
    }
    if (previous.unwrap().has_value() && *previous.unwrap() == document) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: page unchanged, nothing to publish page=" << qpage(page_id);
        }
        return Result<void>::ok();
    }

    auto saved = ctx_.states().save(page_id, document);
    if (saved.is_err()) {
        return saved;
    }
    emit localStateReady(qpage(page_id), to_json(document));
    return Result<void>::ok();
}

Result<void> PageSyncScheduler::runRemoteCycle(const PageId& page_id,
                                               const doc::FlatDocument& document) {
    auto* s = slot(page_id);
    if (!s) {
        return Result<void>::err(not_shared(page_id));
    }
    s->in_flight = true;

    // A move only repositions a block; its content lands on the next pass.
    Result<void> out = Result<void>::ok();
    std::size_t total = 0;
    for (int pass = 0; pass < kMaxReconcilePasses; ++pass) {
        auto applied = tree::reconcile(ctx_, page_id, document);
        if (applied.is_err()) {
            out = Result<void>::err(applied.unwrap_err());
            break;
        }
        total += applied.unwrap();
        if (applied.unwrap() == 0) {
            break;
        }
    }

    if (out.is_ok()) {
        out = ctx_.states().save(page_id, document);
    }

    if (out.is_ok()) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: reconciled page=" << qpage(page_id) << "ops=" << total;
        }
        emit reconciled(qpage(page_id), static_cast<int>(total));
    }

    finishCycle(page_id);
    return out;
}

void PageSyncScheduler::finishCycle(const PageId& page_id) {
    auto* s = slot(page_id);
    if (!s) {
        return;
    }
    s->in_flight = false;

    if (s->disconnect_requested) {
        auto removed = disconnectPage(page_id);
        if (removed.is_err()) {
            report(page_id, removed.unwrap_err());
        }
        return;
    }

    if (s->parked_remote) {
        auto document = std::move(*s->parked_remote);
        s->parked_remote.reset();
        s->push_requested = false;
        auto applied = runRemoteCycle(page_id, document);
        if (applied.is_err()) {
            report(page_id, applied.unwrap_err());
        }
        return;
    }

    if (s->push_requested) {
        s->push_requested = false;
        auto pushed = runLocalCycle(page_id);
        if (pushed.is_err()) {
            report(page_id, pushed.unwrap_err());
        }
    }
}

void PageSyncScheduler::report(const PageId& page_id, const Error& error) {
    const auto message = QString::fromStdString(error.message);
    if (error.code == ErrorCode::MalformedDocument) {
        qCritical() << "SYNC: malformed document page=" << qpage(page_id) << message;
    } else {
        qWarning() << "SYNC: cycle failed page=" << qpage(page_id)
                   << "code=" << error_code_name(error.code).data() << message;
    }
    emit syncFailed(qpage(page_id), message);
}

} // namespace trellis::sync
