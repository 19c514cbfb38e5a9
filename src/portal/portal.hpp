//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/portal.hpp
// Purpose: Typed remote calls over a pair of byte streams.
//
// Lifecycle:
//   Unbound --negotiate--> Negotiated --close/peer gone/violation--> Closed
//
// Key invariants:
//   - Lifecycle bits live in an AtomicState; NEGOTIATED can only be set
//     once both schema bits are set and CLOSED is clear.
//   - At most one task reads the inbound stream at a time (the reader). It
//     dispatches every frame it decodes, including responses owed to other
//     callers, and hands the role on when it is done.
//   - Every waiter is resolved exactly once: with its response, Cancelled,
//     or the reason the portal closed.
//
// Ownership/Lifetime:
//   - A Portal borrows the kernel and executor and owns its two handles.
//   - The portal must outlive every task started through it; all of its
//     operations run on its executor.
//
// Links: src/portal/wire.hpp, src/ipc/sync_bridge.hpp, src/state/atomic_state.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/kernel.hpp"
#include "ipc/sync_bridge.hpp"
#include "portal/schema.hpp"
#include "portal/value.hpp"
#include "portal/wire.hpp"
#include "sched/cancel.hpp"
#include "sched/executor.hpp"
#include "sched/task.hpp"
#include "state/atomic_state.hpp"
#include "support/config.hpp"
#include "support/error.hpp"
#include "support/result.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <span>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quasar::portal
{

using support::Error;
using support::Result;

class Portal;

enum class PortalState
{
    Unbound,
    Negotiated,
    Closed,
};

std::string_view portalStateName(PortalState state);

/**
 * @brief Answers one inbound call.
 *
 * @details
 * Exactly one of respond() or fail() should be called; a second answer
 * fails InvalidArg.
 */
class Responder
{
  public:
    /// @brief Send @p value; SchemaMismatch if it does not match the return type.
    Result<void> respond(const Value &value);

    /// @brief Send an error response carrying @p code.
    Result<void> fail(Error code);

    [[nodiscard]] bool answered() const
    {
        return answered_;
    }

    [[nodiscard]] std::uint64_t seq() const
    {
        return seq_;
    }

  private:
    friend class Portal;

    Responder(Portal *portal, std::uint64_t seq, Route route)
        : portal_(portal), seq_(seq), route_(std::move(route))
    {
    }

    Portal *portal_;
    std::uint64_t seq_;
    Route route_;
    bool answered_ = false;
};

/// @brief One inbound call and the means to answer it.
struct Incoming
{
    RouteCall call;
    Responder responder;
};

/**
 * @brief One end of a typed call channel.
 *
 * @details
 * Both ends send their schema during negotiate(); afterwards either end may
 * send() calls the other end declared and serve calls from its own schema.
 * Responses may arrive in any order; each is matched to its call by sequence
 * number and route name.
 */
class Portal
{
  public:
    // AtomicState bits
    static constexpr unsigned SCHEMA_SENT = 0;
    static constexpr unsigned SCHEMA_RECEIVED = 1;
    static constexpr unsigned NEGOTIATED = 2;
    static constexpr unsigned CLOSED = 3;
    static constexpr unsigned STATE_WIDTH = 4;

    using Handler = std::function<Result<Value>(const RouteCall &)>;

    /**
     * @brief Create an Unbound portal for process @p pid.
     *
     * @param outbound Producer handle toward the peer.
     * @param inbound Consumer handle from the peer.
     * @return The portal, or the error from validating the handles.
     */
    static Result<std::unique_ptr<Portal>> connect(ipc::Kernel &kernel,
                                                   ipc::ProcessId pid,
                                                   ipc::Handle outbound,
                                                   ipc::Handle inbound,
                                                   Schema schema,
                                                   sched::Executor &executor,
                                                   support::Config config = {});

    ~Portal();

    Portal(const Portal &) = delete;
    Portal &operator=(const Portal &) = delete;

    /**
     * @brief Exchange schemas with the peer.
     *
     * @details
     * Writes one route frame per local route and a handshake end frame, then
     * reads the peer's. A peer route whose name matches a local route with a
     * different signature closes the portal with ProtocolViolation. A
     * cancelled negotiation may be resumed by calling negotiate() again.
     */
    sched::Task<Result<void>> negotiate(sched::CancelToken token);

    /**
     * @brief Send @p call and wait for its response.
     *
     * @details
     * Fails before writing with NotNegotiated, PortalClosed, UnknownRoute
     * (the peer did not declare the route) or Busy (too many calls in
     * flight). Once the frame is written the call resolves with the peer's
     * value, the peer's error code, Cancelled, or the reason the portal
     * closed. A cancelled call's frame is not retracted; its late response
     * is dropped.
     */
    sched::Task<Result<Value>> send(RouteCall call, sched::CancelToken token);

    /// @brief Wait for the next inbound call.
    sched::Task<Result<Incoming>> next(sched::CancelToken token);

    /**
     * @brief Answer inbound calls with @p handler until the portal closes.
     * @return Ok when the portal or its peer closed; otherwise the error.
     */
    sched::Task<Result<void>> serve(Handler handler, sched::CancelToken token);

    /**
     * @brief Send a close frame, release both handles and fail every waiter
     *        with PortalClosed.
     */
    Result<void> close();

    [[nodiscard]] PortalState state() const;

    [[nodiscard]] bool isNegotiated() const
    {
        return state_.test(NEGOTIATED);
    }

    [[nodiscard]] bool isClosed() const
    {
        return state_.test(CLOSED);
    }

    /// Calls written and not yet resolved.
    [[nodiscard]] std::size_t outstanding() const
    {
        return pending_.size();
    }

    /// Why the portal closed; Error::None while open.
    [[nodiscard]] Error closeReason() const
    {
        return closeReason_;
    }

    [[nodiscard]] const Schema &schema() const
    {
        return local_;
    }

    /// Routes the peer declared; empty until negotiated.
    [[nodiscard]] const Schema &peerSchema() const
    {
        return peer_;
    }

    /// @brief Route declared by the peer; nullptr when unknown.
    [[nodiscard]] const Route *remoteRoute(std::string_view name) const;

  private:
    struct ConnectKey
    {
        explicit ConnectKey() = default;
    };

  public:
    /// Use connect(); the key keeps construction inside the class.
    Portal(ConnectKey,
           ipc::Kernel &kernel,
           ipc::ProcessId pid,
           ipc::Handle outbound,
           ipc::Handle inbound,
           Schema schema,
           sched::Executor &executor,
           support::Config config,
           state::AtomicState<Error> lifecycle);

  private:
    friend class Responder;

    struct Waiter;

    Result<void> enter(unsigned bit);
    Result<void> writeFrame(wire::FrameKind kind, std::span<const std::uint8_t> payload);
    Result<void> reply(std::uint64_t seq, wire::Bytes payload);
    Error closedError() const;
    void shutdown(Error reason);
    void wakeWaiters();
    sched::CancelToken::Callback cancelCallback(std::shared_ptr<Waiter> waiter);

    sched::Task<Result<void>> readMore(sched::CancelToken token);
    sched::Task<Result<void>> receiveHandshake(sched::CancelToken token);
    sched::Task<Result<void>> pumpOne(sched::CancelToken token);
    sched::Task<void> drive(Waiter &waiter, const std::function<bool()> &satisfied, sched::CancelToken token);
    Result<void> dispatch(wire::Frame frame);

    ipc::Kernel &kernel_;
    ipc::ProcessId pid_;
    ipc::Handle outbound_;
    ipc::Handle inbound_;
    Schema local_;
    std::vector<Route> received_;
    Schema peer_;
    sched::Executor &executor_;
    support::Config config_;
    ipc::SyncBridge bridge_;
    state::AtomicState<Error> state_;

    wire::FrameReader inbox_;
    std::vector<std::uint8_t> readBuf_;
    bool readerActive_ = false;

    std::uint64_t nextSeq_ = 1;
    std::map<std::uint64_t, std::shared_ptr<Waiter>> pending_;
    std::vector<std::shared_ptr<Waiter>> serveWaiters_;
    std::deque<wire::CallFrame> calls_;
    Error closeReason_ = Error::None;
};

} // namespace quasar::portal
