//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/portal.cpp
// Purpose: Portal negotiation, call multiplexing and shutdown.
//
// Key invariants:
//   - readerActive_ is true exactly while one task owns the inbound stream.
//   - shutdown() resolves every pending call and wakes every waiter.
//
// Ownership/Lifetime: Waiters are shared between their task, the pending
//                     tables and cancellation callbacks; whichever drops
//                     last frees them.
// Links: src/portal/portal.hpp
//
//===----------------------------------------------------------------------===//

#include "portal/portal.hpp"

#include "support/log.hpp"

#include <algorithm>
#include <coroutine>
#include <optional>
#include <utility>

namespace quasar::portal
{

using support::Err;
using support::Ok;

std::string_view portalStateName(PortalState state)
{
    switch (state)
    {
        case PortalState::Unbound:
            return "Unbound";
        case PortalState::Negotiated:
            return "Negotiated";
        case PortalState::Closed:
            return "Closed";
    }
    return "Unknown";
}

/// @brief A task parked until the reader hands it something.
///
/// @details
/// Single-threaded: only touched on the executor. A signal that arrives
/// while the task is running is remembered, so the next wait returns at once.
/// Tasks suspend through wait(); the Waiter itself is never copied.
struct Portal::Waiter
{
    /// Awaitable view of a Waiter; copies all refer to the same Waiter.
    struct Wait
    {
        Waiter *waiter;

        bool await_ready() const noexcept
        {
            return waiter->signalled;
        }

        void await_suspend(std::coroutine_handle<> awaiting) const noexcept
        {
            waiter->handle = awaiting;
        }

        void await_resume() const noexcept
        {
            waiter->signalled = false;
        }
    };

    explicit Waiter(sched::Executor &executor) : executor(executor) {}

    Waiter(const Waiter &) = delete;
    Waiter &operator=(const Waiter &) = delete;

    Wait wait()
    {
        return Wait{this};
    }

    void signal()
    {
        signalled = true;
        if (handle)
        {
            auto h = std::exchange(handle, nullptr);
            executor.post(h);
        }
    }

    sched::Executor &executor;
    std::coroutine_handle<> handle;
    bool signalled = false;
    bool cancelled = false;
    std::string route;                   ///< route of the call; empty for serve waiters
    std::optional<Result<Value>> result; ///< set for calls only
};

Result<std::unique_ptr<Portal>> Portal::connect(ipc::Kernel &kernel,
                                                ipc::ProcessId pid,
                                                ipc::Handle outbound,
                                                ipc::Handle inbound,
                                                Schema schema,
                                                sched::Executor &executor,
                                                support::Config config)
{
    // Zero-length transfers check ownership and direction without moving data.
    auto checkOut = kernel.write(pid, outbound, {}, ipc::SyncMode::attempt());
    if (checkOut.is_err())
        return Err(checkOut.error());
    auto checkIn = kernel.read(pid, inbound, {}, ipc::SyncMode::attempt());
    if (checkIn.is_err())
        return Err(checkIn.error());

    auto lifecycle = state::AtomicState<Error>::builder(STATE_WIDTH)
                         .guard(SCHEMA_SENT, {}, {CLOSED}, Error::PortalClosed)
                         .guard(SCHEMA_RECEIVED, {}, {CLOSED}, Error::PortalClosed)
                         .guard(NEGOTIATED, {SCHEMA_SENT, SCHEMA_RECEIVED}, {CLOSED}, Error::NotNegotiated)
                         .casRetryLimit(config.casRetryLimit)
                         .build();
    if (lifecycle.is_err())
        return Err(lifecycle.error());

    auto portal = std::make_unique<Portal>(
        ConnectKey{}, kernel, pid, outbound, inbound, std::move(schema), executor, config, lifecycle.take());
    return Result<std::unique_ptr<Portal>>::Ok(std::move(portal));
}

Portal::Portal(ConnectKey,
               ipc::Kernel &kernel,
               ipc::ProcessId pid,
               ipc::Handle outbound,
               ipc::Handle inbound,
               Schema schema,
               sched::Executor &executor,
               support::Config config,
               state::AtomicState<Error> lifecycle)
    : kernel_(kernel),
      pid_(pid),
      outbound_(outbound),
      inbound_(inbound),
      local_(std::move(schema)),
      executor_(executor),
      config_(config),
      bridge_(kernel, pid, executor),
      state_(std::move(lifecycle)),
      inbox_(config.maxFrameBytes),
      readBuf_(std::max<std::size_t>(config.readChunkBytes, 1))
{
}

Portal::~Portal()
{
    if (isClosed())
        return;
    auto closed = close();
    if (closed.is_err())
        log::debug("portal", "pid ", pid_, " close on destruction failed: ", closed.error());
}

PortalState Portal::state() const
{
    if (state_.test(CLOSED))
        return PortalState::Closed;
    if (state_.test(NEGOTIATED))
        return PortalState::Negotiated;
    return PortalState::Unbound;
}

const Route *Portal::remoteRoute(std::string_view name) const
{
    return peer_.find(name);
}

Result<void> Portal::enter(unsigned bit)
{
    auto r = state_.intoState(bit, true);
    if (r.is_ok())
        return Ok();
    const auto &failure = r.error();
    return Err(failure.isGuard() ? failure.guardError() : failure.usageError());
}

Error Portal::closedError() const
{
    return closeReason_ == Error::None ? Error::PortalClosed : closeReason_;
}

Result<void> Portal::writeFrame(wire::FrameKind kind, std::span<const std::uint8_t> payload)
{
    if (payload.size() + 1 > config_.maxFrameBytes)
        return Err(Error::InvalidArg);

    wire::Bytes frame = wire::envelope(kind, payload);
#if QUASAR_DEBUG_PORTAL
    log::debug("portal", "pid ", pid_, " write kind=", static_cast<int>(kind), " bytes=", frame.size());
#endif
    auto r = bridge_.write(outbound_, frame, ipc::SyncMode::attempt());
    if (r.is_err())
        return Err(r.error());
    return Ok();
}

Result<void> Portal::reply(std::uint64_t seq, wire::Bytes payload)
{
    if (isClosed())
        return Err(closedError());
    auto written = writeFrame(wire::FrameKind::Response, payload);
    if (written.is_err())
    {
        if (written.error() == Error::PeerClosed)
            shutdown(Error::PeerClosed);
        log::debug("portal", "pid ", pid_, " response seq=", seq, " not sent: ", written.error());
    }
    return written;
}

void Portal::wakeWaiters()
{
    for (auto &entry : pending_)
        entry.second->signal();
    for (auto &w : serveWaiters_)
        w->signal();
}

void Portal::shutdown(Error reason)
{
    if (!state_.test(CLOSED))
    {
        closeReason_ = reason;
        auto entered = enter(CLOSED);
        if (entered.is_err())
            log::warn("portal", "pid ", pid_, " could not mark closed: ", entered.error());

        if (reason == Error::ProtocolViolation)
            log::error("portal", "pid ", pid_, " protocol violation, closing");
        else
            log::info("portal", "pid ", pid_, " closed: ", reason);

        for (ipc::Handle h : {outbound_, inbound_})
        {
            auto released = kernel_.close(pid_, h);
            if (released.is_err())
                log::debug("portal", "pid ", pid_, " handle ", h, " already gone: ", released.error());
        }
    }

    for (auto &entry : pending_)
    {
        if (!entry.second->result)
            entry.second->result.emplace(Err(closedError()));
    }
    wakeWaiters();
}

sched::CancelToken::Callback Portal::cancelCallback(std::shared_ptr<Waiter> waiter)
{
    sched::Executor *executor = &executor_;
    return [executor, waiter]
    {
        // Cancellation may fire on any thread; the waiter lives on the executor.
        executor->post(
            [waiter]
            {
                waiter->cancelled = true;
                waiter->signal();
            });
    };
}

sched::Task<Result<void>> Portal::readMore(sched::CancelToken token)
{
    auto r = co_await bridge_.readAsync(inbound_, readBuf_, token);
    if (r.is_err())
        co_return Err(r.error());
    inbox_.feed(std::span<const std::uint8_t>(readBuf_.data(), r.value().bytes));
    co_return Ok();
}

sched::Task<Result<void>> Portal::receiveHandshake(sched::CancelToken token)
{
    for (;;)
    {
        auto next = inbox_.next();
        if (next.is_err())
            co_return Err(next.error());
        if (!next.value())
        {
            auto more = co_await readMore(token);
            if (more.is_err())
                co_return more;
            continue;
        }

        wire::Frame frame = std::move(*next.value());
        switch (frame.kind)
        {
            case wire::FrameKind::Route:
            {
                std::string_view text(reinterpret_cast<const char *>(frame.payload.data()), frame.payload.size());
                auto route = wire::decodeRoute(text);
                if (route.is_err())
                {
                    log::error("portal", "pid ", pid_, " malformed route frame");
                    co_return Err(Error::ProtocolViolation);
                }
                const Route *mine = local_.find(route.value().name);
                if (mine && *mine != route.value())
                {
                    log::error("portal", "pid ", pid_, " route ", route.value().name, " differs from the local one");
                    co_return Err(Error::ProtocolViolation);
                }
                received_.push_back(route.take());
                break;
            }
            case wire::FrameKind::HandshakeEnd:
            {
                wire::ByteReader r(frame.payload);
                auto count = r.u32();
                if (count.is_err() || r.remaining() != 0 || count.value() != received_.size())
                {
                    log::error("portal", "pid ", pid_, " handshake end does not match ", received_.size(), " routes");
                    co_return Err(Error::ProtocolViolation);
                }
                auto builder = Schema::builder();
                for (Route &route : received_)
                    builder.route(std::move(route));
                received_.clear();
                auto peer = builder.build();
                if (peer.is_err())
                {
                    log::error("portal", "pid ", pid_, " peer schema rejected: ", peer.error());
                    co_return Err(Error::ProtocolViolation);
                }
                peer_ = peer.take();
                co_return Ok();
            }
            case wire::FrameKind::Close:
                co_return Err(Error::PeerClosed);
            default:
                log::error("portal", "pid ", pid_, " unexpected frame during handshake");
                co_return Err(Error::ProtocolViolation);
        }
    }
}

sched::Task<Result<void>> Portal::negotiate(sched::CancelToken token)
{
    if (isClosed())
        co_return Err(closedError());
    if (isNegotiated())
        co_return Ok();
    if (token.isCancelled())
        co_return Err(Error::Cancelled);
    if (readerActive_)
        co_return Err(Error::Busy);

    if (!state_.test(SCHEMA_SENT))
    {
        for (const Route &route : local_.routes())
        {
            std::string text = wire::encodeRoute(route);
            auto written = writeFrame(
                wire::FrameKind::Route,
                std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
            if (written.is_err())
            {
                if (written.error() == Error::PeerClosed)
                    shutdown(Error::PeerClosed);
                co_return written;
            }
        }
        wire::ByteWriter end;
        end.u32(static_cast<std::uint32_t>(local_.size()));
        auto written = writeFrame(wire::FrameKind::HandshakeEnd, end.data());
        if (written.is_err())
        {
            if (written.error() == Error::PeerClosed)
                shutdown(Error::PeerClosed);
            co_return written;
        }
        auto sent = enter(SCHEMA_SENT);
        if (sent.is_err())
            co_return sent;
    }

    readerActive_ = true;
    auto received = co_await receiveHandshake(token);
    readerActive_ = false;
    if (received.is_err())
    {
        if (received.error() != Error::Cancelled)
            shutdown(received.error());
        co_return received;
    }

    auto marked = enter(SCHEMA_RECEIVED);
    if (marked.is_err())
        co_return marked;
    auto negotiated = enter(NEGOTIATED);
    if (negotiated.is_err())
        co_return negotiated;

    log::info("portal",
              "pid ",
              pid_,
              " negotiated: ",
              local_.size(),
              " local routes, ",
              peer_.size(),
              " peer routes");
    wakeWaiters();
    co_return Ok();
}

Result<void> Portal::dispatch(wire::Frame frame)
{
#if QUASAR_DEBUG_PORTAL
    log::debug("portal", "pid ", pid_, " read kind=", static_cast<int>(frame.kind), " bytes=", frame.payload.size());
#endif
    switch (frame.kind)
    {
        case wire::FrameKind::Call:
        {
            auto call = wire::decodeCall(frame.payload, local_);
            if (call.is_err())
            {
                log::error("portal", "pid ", pid_, " malformed call frame");
                return Err(Error::ProtocolViolation);
            }
            calls_.push_back(call.take());
            for (auto &w : serveWaiters_)
                w->signal();
            return Ok();
        }
        case wire::FrameKind::Response:
        {
            auto response = wire::decodeResponse(frame.payload, peer_);
            if (response.is_err())
            {
                log::error("portal", "pid ", pid_, " malformed response frame");
                return Err(Error::ProtocolViolation);
            }
            wire::ResponseFrame &r = response.value();
            auto it = pending_.find(r.seq);
            if (it == pending_.end() || it->second->result || it->second->cancelled)
            {
                log::warn("portal", "pid ", pid_, " dropping unmatched response seq=", r.seq, " route=", r.route);
                return Ok();
            }
            auto &waiter = it->second;
            if (waiter->route != r.route)
            {
                log::warn("portal",
                          "pid ",
                          pid_,
                          " dropping response seq=",
                          r.seq,
                          " for route ",
                          r.route,
                          ", call was ",
                          waiter->route);
                return Ok();
            }
            if (r.status == wire::STATUS_OK)
                waiter->result.emplace(Result<Value>::Ok(std::move(*r.value)));
            else
                waiter->result.emplace(Err(support::errorFromCode(r.errorCode)));
            waiter->signal();
            return Ok();
        }
        case wire::FrameKind::Close:
            log::info("portal", "pid ", pid_, " peer sent close");
            return Err(Error::PeerClosed);
        case wire::FrameKind::Route:
        case wire::FrameKind::HandshakeEnd:
            log::error("portal", "pid ", pid_, " handshake frame after negotiation");
            return Err(Error::ProtocolViolation);
    }
    return Err(Error::ProtocolViolation);
}

sched::Task<Result<void>> Portal::pumpOne(sched::CancelToken token)
{
    for (;;)
    {
        auto next = inbox_.next();
        if (next.is_err())
            co_return Err(next.error());
        if (next.value())
            co_return dispatch(std::move(*next.value()));
        auto more = co_await readMore(token);
        if (more.is_err())
            co_return more;
    }
}

sched::Task<void> Portal::drive(Waiter &waiter, const std::function<bool()> &satisfied, sched::CancelToken token)
{
    while (!satisfied() && !waiter.cancelled && !isClosed())
    {
        if (readerActive_)
        {
            co_await waiter.wait();
            continue;
        }

        readerActive_ = true;
        auto pumped = co_await pumpOne(token);
        readerActive_ = false;
        if (pumped.is_err())
        {
            if (pumped.error() == Error::Cancelled)
                waiter.cancelled = true;
            else
                shutdown(pumped.error());
        }
        // Hand the reader role to whoever still waits.
        wakeWaiters();
    }
}

sched::Task<Result<Value>> Portal::send(RouteCall call, sched::CancelToken token)
{
    if (isClosed())
        co_return Err(closedError());
    if (!isNegotiated())
        co_return Err(Error::NotNegotiated);
    if (token.isCancelled())
        co_return Err(Error::Cancelled);

    const Route *remote = peer_.find(call.name());
    if (!remote || *remote != call.route())
        co_return Err(Error::UnknownRoute);
    if (pending_.size() >= config_.maxOutstandingCalls)
        co_return Err(Error::Busy);

    const std::uint64_t seq = nextSeq_++;
    auto written = writeFrame(wire::FrameKind::Call, wire::encodeCall(seq, call));
    if (written.is_err())
    {
        if (written.error() == Error::PeerClosed)
            shutdown(Error::PeerClosed);
        co_return Err(written.error());
    }

    auto waiter = std::make_shared<Waiter>(executor_);
    waiter->route = call.name();
    pending_.emplace(seq, waiter);
    auto cancelId = token.onCancel(cancelCallback(waiter));

    Waiter *self = waiter.get();
    const std::function<bool()> answered = [self] { return self->result.has_value(); };
    co_await drive(*waiter, answered, token);

    token.removeCallback(cancelId);
    pending_.erase(seq);

    if (waiter->result)
        co_return std::move(*waiter->result);
    if (waiter->cancelled)
    {
        log::debug("portal", "pid ", pid_, " call ", call.name(), " seq=", seq, " cancelled");
        co_return Err(Error::Cancelled);
    }
    co_return Err(closedError());
}

sched::Task<Result<Incoming>> Portal::next(sched::CancelToken token)
{
    if (isClosed())
        co_return Err(closedError());
    if (!isNegotiated())
        co_return Err(Error::NotNegotiated);
    if (token.isCancelled())
        co_return Err(Error::Cancelled);

    if (calls_.empty())
    {
        auto waiter = std::make_shared<Waiter>(executor_);
        serveWaiters_.push_back(waiter);
        auto cancelId = token.onCancel(cancelCallback(waiter));

        const std::function<bool()> queued = [this] { return !calls_.empty(); };
        co_await drive(*waiter, queued, token);

        token.removeCallback(cancelId);
        serveWaiters_.erase(std::remove(serveWaiters_.begin(), serveWaiters_.end(), waiter), serveWaiters_.end());
    }

    if (isClosed())
        co_return Err(closedError());
    if (calls_.empty())
        co_return Err(Error::Cancelled);

    wire::CallFrame frame = std::move(calls_.front());
    calls_.pop_front();
    Route route = frame.call.route();
    co_return Result<Incoming>::Ok(Incoming{std::move(frame.call), Responder(this, frame.seq, std::move(route))});
}

sched::Task<Result<void>> Portal::serve(Handler handler, sched::CancelToken token)
{
    for (;;)
    {
        auto incoming = co_await next(token);
        if (incoming.is_err())
        {
            Error e = incoming.error();
            if (e == Error::PortalClosed || e == Error::PeerClosed)
                co_return Ok();
            co_return Err(e);
        }

        Incoming in = incoming.take();
        auto outcome = handler(in.call);
        auto answered = outcome.is_ok() ? in.responder.respond(outcome.value()) : in.responder.fail(outcome.error());
        if (answered.is_err())
            log::warn("portal", "pid ", pid_, " could not answer ", in.call.name(), ": ", answered.error());
    }
}

Result<void> Portal::close()
{
    if (isClosed())
        return Err(Error::PortalClosed);

    auto written = writeFrame(wire::FrameKind::Close, {});
    if (written.is_err())
        log::debug("portal", "pid ", pid_, " close frame not sent: ", written.error());
    shutdown(Error::PortalClosed);
    return Ok();
}

Result<void> Responder::respond(const Value &value)
{
    if (answered_)
        return Err(Error::InvalidArg);
    if (!value.conforms(route_.returns))
        return Err(Error::SchemaMismatch);
    auto sent = portal_->reply(seq_, wire::encodeResponse(seq_, route_.name, value));
    if (sent.is_ok())
        answered_ = true;
    return sent;
}

Result<void> Responder::fail(Error code)
{
    if (answered_)
        return Err(Error::InvalidArg);
    auto sent = portal_->reply(seq_, wire::encodeErrorResponse(seq_, route_.name, static_cast<std::int32_t>(code)));
    if (sent.is_ok())
        answered_ = true;
    return sent;
}

} // namespace quasar::portal
