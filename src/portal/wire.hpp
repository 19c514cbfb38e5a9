//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/wire.hpp
// Purpose: Byte-exact encodings of portal frames.
//
// Envelope (every frame on the stream):
//   u32 length | u8 kind | payload        length = 1 + payload size
//
// Handshake payload:
//   'R' name '!' ('A' name ':' type)* 'O' type '!'
//
// Call payload:
//   u64 seq | u16 nameLen | name | value(arg0) ... value(argN-1)
//
// Response payload:
//   u64 seq | u16 nameLen | name | u8 status | value  (status 0)
//                                            | i32    (status 1)
//
// Values:
//   Str = u32 length | bytes        Array = u32 count | elements
//   Result = u8 tag (0 ok, 1 err) | payload
//   Struct = fields in declaration order
//
// All integers are little endian. Values carry no type tags.
//
// Key invariants: Decoders consume exactly the payload; trailing bytes,
//                 truncation and malformed values are ProtocolViolation.
// Ownership/Lifetime: Encoders return owned buffers; decoders copy out.
// Links: src/portal/portal.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "portal/schema.hpp"
#include "portal/type.hpp"
#include "portal/value.hpp"
#include "support/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quasar::portal::wire
{

using Bytes = std::vector<std::uint8_t>;

enum class FrameKind : std::uint8_t
{
    Route = 1,
    HandshakeEnd = 2,
    Call = 3,
    Response = 4,
    Close = 5,
};

/// Envelope header size (length prefix plus kind byte).
constexpr std::size_t ENVELOPE_HEADER = 5;

constexpr std::uint8_t STATUS_OK = 0;
constexpr std::uint8_t STATUS_ERROR = 1;

/// Leading tag of a Result value.
constexpr std::uint8_t RESULT_OK = 0;
constexpr std::uint8_t RESULT_ERR = 1;

/// @brief Little-endian append-only encoder.
class ByteWriter
{
  public:
    void u8(std::uint8_t v);
    void u16(std::uint16_t v);
    void u32(std::uint32_t v);
    void u64(std::uint64_t v);
    void bytes(std::span<const std::uint8_t> data);
    void text(std::string_view s);

    [[nodiscard]] const Bytes &data() const
    {
        return out_;
    }

    Bytes take()
    {
        return std::move(out_);
    }

  private:
    Bytes out_;
};

/// @brief Bounds-checked little-endian decoder over a borrowed buffer.
class ByteReader
{
  public:
    explicit ByteReader(std::span<const std::uint8_t> in) : in_(in) {}

    support::Result<std::uint8_t> u8();
    support::Result<std::uint16_t> u16();
    support::Result<std::uint32_t> u32();
    support::Result<std::uint64_t> u64();
    support::Result<std::string> text(std::size_t n);

    [[nodiscard]] std::size_t remaining() const
    {
        return in_.size() - pos_;
    }

  private:
    support::Result<std::uint64_t> fixed(std::size_t n);

    std::span<const std::uint8_t> in_;
    std::size_t pos_ = 0;
};

// Handshake -----------------------------------------------------------------

/// @brief Handshake text of @p route, e.g. `Rhello!Ahi_amount:u64OArrayu32!`.
std::string encodeRoute(const Route &route);

/// @brief Parse one handshake frame; ProtocolViolation on any deviation.
support::Result<Route> decodeRoute(std::string_view text);

// Values ----------------------------------------------------------------------

/// @brief Append @p value; the caller guarantees it conforms to its type.
void encodeValue(ByteWriter &w, const Value &value);

/// @brief Decode one value of type @p type.
support::Result<Value> decodeValue(ByteReader &r, const Type &type);

// Calls and responses -----------------------------------------------------------

struct CallFrame
{
    std::uint64_t seq = 0;
    RouteCall call;
};

Bytes encodeCall(std::uint64_t seq, const RouteCall &call);

/// @brief Decode a call against the routes the local side serves.
support::Result<CallFrame> decodeCall(std::span<const std::uint8_t> payload, const Schema &local);

struct ResponseFrame
{
    std::uint64_t seq = 0;
    std::string route;
    std::uint8_t status = STATUS_OK;
    std::optional<Value> value;  ///< status 0
    std::int32_t errorCode = 0;  ///< status 1
};

Bytes encodeResponse(std::uint64_t seq, std::string_view route, const Value &value);
Bytes encodeErrorResponse(std::uint64_t seq, std::string_view route, std::int32_t code);

/// @brief Decode a response; the return type comes from @p local.
support::Result<ResponseFrame> decodeResponse(std::span<const std::uint8_t> payload, const Schema &local);

// Envelope ------------------------------------------------------------------------

/// @brief Wrap @p payload in a length-prefixed envelope of @p kind.
Bytes envelope(FrameKind kind, std::span<const std::uint8_t> payload);

struct Frame
{
    FrameKind kind = FrameKind::Close;
    Bytes payload;
};

/**
 * @brief Reassembles envelopes from arbitrarily split stream reads.
 *
 * @details
 * Bytes fed but not yet forming a complete frame are kept across calls, so
 * an interrupted read never loses data.
 */
class FrameReader
{
  public:
    explicit FrameReader(std::uint32_t maxFrameBytes) : maxFrameBytes_(maxFrameBytes) {}

    void feed(std::span<const std::uint8_t> bytes);

    /**
     * @brief Next complete frame, nullopt when more bytes are needed.
     *
     * @details
     * ProtocolViolation for a zero length, a length above the limit or an
     * unknown kind.
     */
    support::Result<std::optional<Frame>> next();

    [[nodiscard]] std::size_t buffered() const
    {
        return buf_.size() - head_;
    }

  private:
    std::uint32_t maxFrameBytes_;
    Bytes buf_;
    std::size_t head_ = 0;
};

} // namespace quasar::portal::wire
