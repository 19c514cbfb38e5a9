//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/wire.cpp
// Purpose: Encoders and decoders for handshake, call, response and envelope
//          framing.
// Key invariants: See wire.hpp.
// Ownership/Lifetime: Stateless apart from FrameReader's buffer.
// Links: src/portal/wire.hpp
//
//===----------------------------------------------------------------------===//

#include "portal/wire.hpp"

namespace quasar::portal::wire
{

using support::Err;
using support::Error;
using support::Result;

namespace
{

/// Element count accepted for arrays whose elements encode to zero bytes.
constexpr std::uint32_t kMaxZeroSizedElements = 1u << 16;

support::Failure<Error> violation()
{
    return Err(Error::ProtocolViolation);
}

void putHeader(ByteWriter &w, std::uint64_t seq, std::string_view route)
{
    w.u64(seq);
    w.u16(static_cast<std::uint16_t>(route.size()));
    w.text(route);
}

struct Header
{
    std::uint64_t seq;
    std::string route;
};

Result<Header> getHeader(ByteReader &r)
{
    auto seq = r.u64();
    if (seq.is_err())
        return violation();
    auto len = r.u16();
    if (len.is_err())
        return violation();
    auto name = r.text(len.value());
    if (name.is_err())
        return violation();
    return Result<Header>::Ok(Header{seq.value(), name.take()});
}

} // namespace

// ByteWriter --------------------------------------------------------------------

void ByteWriter::u8(std::uint8_t v)
{
    out_.push_back(v);
}

void ByteWriter::u16(std::uint16_t v)
{
    out_.push_back(static_cast<std::uint8_t>(v));
    out_.push_back(static_cast<std::uint8_t>(v >> 8));
}

void ByteWriter::u32(std::uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::u64(std::uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::bytes(std::span<const std::uint8_t> data)
{
    out_.insert(out_.end(), data.begin(), data.end());
}

void ByteWriter::text(std::string_view s)
{
    out_.insert(out_.end(), s.begin(), s.end());
}

// ByteReader --------------------------------------------------------------------

Result<std::uint64_t> ByteReader::fixed(std::size_t n)
{
    if (remaining() < n)
        return violation();
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i)
        v |= static_cast<std::uint64_t>(in_[pos_ + i]) << (8 * i);
    pos_ += n;
    return Result<std::uint64_t>::Ok(v);
}

Result<std::uint8_t> ByteReader::u8()
{
    auto v = fixed(1);
    if (v.is_err())
        return Err(v.error());
    return Result<std::uint8_t>::Ok(static_cast<std::uint8_t>(v.value()));
}

Result<std::uint16_t> ByteReader::u16()
{
    auto v = fixed(2);
    if (v.is_err())
        return Err(v.error());
    return Result<std::uint16_t>::Ok(static_cast<std::uint16_t>(v.value()));
}

Result<std::uint32_t> ByteReader::u32()
{
    auto v = fixed(4);
    if (v.is_err())
        return Err(v.error());
    return Result<std::uint32_t>::Ok(static_cast<std::uint32_t>(v.value()));
}

Result<std::uint64_t> ByteReader::u64()
{
    return fixed(8);
}

Result<std::string> ByteReader::text(std::size_t n)
{
    if (remaining() < n)
        return violation();
    std::string s(reinterpret_cast<const char *>(in_.data() + pos_), n);
    pos_ += n;
    return Result<std::string>::Ok(std::move(s));
}

// Handshake -----------------------------------------------------------------------

std::string encodeRoute(const Route &route)
{
    std::string out;
    out += 'R';
    out += route.name;
    out += '!';
    for (const Arg &arg : route.args)
    {
        out += 'A';
        out += arg.name;
        out += ':';
        out += arg.type.wireName();
    }
    out += 'O';
    out += route.returns.wireName();
    out += '!';
    return out;
}

Result<Route> decodeRoute(std::string_view text)
{
    if (text.empty() || text.front() != 'R')
        return violation();
    text.remove_prefix(1);

    const std::size_t bang = text.find('!');
    if (bang == std::string_view::npos)
        return violation();

    Route route;
    route.name = std::string(text.substr(0, bang));
    if (!isValidName(route.name))
        return violation();
    text.remove_prefix(bang + 1);

    while (!text.empty() && text.front() == 'A')
    {
        text.remove_prefix(1);
        const std::size_t colon = text.find(':');
        if (colon == std::string_view::npos)
            return violation();

        Arg arg;
        arg.name = std::string(text.substr(0, colon));
        if (!isValidName(arg.name))
            return violation();
        text.remove_prefix(colon + 1);

        auto type = Type::parsePrefix(text);
        if (type.is_err())
            return violation();
        arg.type = type.take();
        route.args.push_back(std::move(arg));
    }

    if (text.empty() || text.front() != 'O')
        return violation();
    text.remove_prefix(1);

    auto ret = Type::parsePrefix(text);
    if (ret.is_err())
        return violation();
    route.returns = ret.take();

    if (text != "!")
        return violation();
    return Result<Route>::Ok(std::move(route));
}

// Values ------------------------------------------------------------------------------

void encodeValue(ByteWriter &w, const Value &value)
{
    const Type &t = value.type();
    switch (t.kind())
    {
        case Kind::Unit:
            return;
        case Kind::Bool:
            w.u8(value.asBool() ? 1 : 0);
            return;
        case Kind::U8:
            w.u8(static_cast<std::uint8_t>(value.asUnsigned()));
            return;
        case Kind::I8:
            w.u8(static_cast<std::uint8_t>(value.asSigned()));
            return;
        case Kind::U16:
            w.u16(static_cast<std::uint16_t>(value.asUnsigned()));
            return;
        case Kind::I16:
            w.u16(static_cast<std::uint16_t>(value.asSigned()));
            return;
        case Kind::U32:
            w.u32(static_cast<std::uint32_t>(value.asUnsigned()));
            return;
        case Kind::I32:
            w.u32(static_cast<std::uint32_t>(value.asSigned()));
            return;
        case Kind::U64:
        case Kind::Usize:
            w.u64(value.asUnsigned());
            return;
        case Kind::I64:
            w.u64(static_cast<std::uint64_t>(value.asSigned()));
            return;
        case Kind::Str:
            w.u32(static_cast<std::uint32_t>(value.asStr().size()));
            w.text(value.asStr());
            return;
        case Kind::Array:
            w.u32(static_cast<std::uint32_t>(value.items().size()));
            for (const Value &item : value.items())
                encodeValue(w, item);
            return;
        case Kind::Result:
            w.u8(value.isOk() ? RESULT_OK : RESULT_ERR);
            encodeValue(w, value.inner());
            return;
        case Kind::Struct:
            for (const Value &field : value.items())
                encodeValue(w, field);
            return;
    }
}

Result<Value> decodeValue(ByteReader &r, const Type &type)
{
    switch (type.kind())
    {
        case Kind::Unit:
            return Result<Value>::Ok(Value::unit());
        case Kind::Bool:
        {
            auto b = r.u8();
            if (b.is_err() || b.value() > 1)
                return violation();
            return Result<Value>::Ok(Value::boolean(b.value() == 1));
        }
        case Kind::U8:
        case Kind::I8:
        {
            auto v = r.u8();
            if (v.is_err())
                return violation();
            return Result<Value>::Ok(type.kind() == Kind::U8 ? Value::u8(v.value())
                                                             : Value::i8(static_cast<std::int8_t>(v.value())));
        }
        case Kind::U16:
        case Kind::I16:
        {
            auto v = r.u16();
            if (v.is_err())
                return violation();
            return Result<Value>::Ok(type.kind() == Kind::U16 ? Value::u16(v.value())
                                                              : Value::i16(static_cast<std::int16_t>(v.value())));
        }
        case Kind::U32:
        case Kind::I32:
        {
            auto v = r.u32();
            if (v.is_err())
                return violation();
            return Result<Value>::Ok(type.kind() == Kind::U32 ? Value::u32(v.value())
                                                              : Value::i32(static_cast<std::int32_t>(v.value())));
        }
        case Kind::U64:
        case Kind::Usize:
        case Kind::I64:
        {
            auto v = r.u64();
            if (v.is_err())
                return violation();
            if (type.kind() == Kind::U64)
                return Result<Value>::Ok(Value::u64(v.value()));
            if (type.kind() == Kind::Usize)
                return Result<Value>::Ok(Value::usize(v.value()));
            return Result<Value>::Ok(Value::i64(static_cast<std::int64_t>(v.value())));
        }
        case Kind::Str:
        {
            auto len = r.u32();
            if (len.is_err())
                return violation();
            auto s = r.text(len.value());
            if (s.is_err())
                return violation();
            return Result<Value>::Ok(Value::str(s.take()));
        }
        case Kind::Array:
        {
            auto count = r.u32();
            if (count.is_err())
                return violation();

            const Type &elem = type.element();
            const std::size_t minSize = elem.minWireSize();
            if (minSize > 0 && count.value() > r.remaining() / minSize)
                return violation();
            if (minSize == 0 && count.value() > kMaxZeroSizedElements)
                return violation();

            std::vector<Value> items;
            items.reserve(count.value());
            for (std::uint32_t i = 0; i < count.value(); ++i)
            {
                auto item = decodeValue(r, elem);
                if (item.is_err())
                    return item;
                items.push_back(item.take());
            }
            return Result<Value>::Ok(Value::array(elem, std::move(items)));
        }
        case Kind::Result:
        {
            auto tag = r.u8();
            if (tag.is_err() || tag.value() > RESULT_ERR)
                return violation();
            const bool ok = tag.value() == RESULT_OK;
            auto inner = decodeValue(r, ok ? type.okType() : type.errType());
            if (inner.is_err())
                return inner;
            return Result<Value>::Ok(ok ? Value::ok(type, inner.take()) : Value::err(type, inner.take()));
        }
        case Kind::Struct:
        {
            std::vector<Value> fields;
            fields.reserve(type.fields().size());
            for (const Field &f : type.fields())
            {
                auto v = decodeValue(r, f.type);
                if (v.is_err())
                    return v;
                fields.push_back(v.take());
            }
            return Result<Value>::Ok(Value::structure(type, std::move(fields)));
        }
    }
    return violation();
}

// Calls and responses --------------------------------------------------------------------

Bytes encodeCall(std::uint64_t seq, const RouteCall &call)
{
    ByteWriter w;
    putHeader(w, seq, call.name());
    for (const Value &arg : call.args())
        encodeValue(w, arg);
    return w.take();
}

Result<CallFrame> decodeCall(std::span<const std::uint8_t> payload, const Schema &local)
{
    ByteReader r(payload);
    auto header = getHeader(r);
    if (header.is_err())
        return violation();

    const Route *route = local.find(header.value().route);
    if (!route)
        return violation();

    std::vector<Value> args;
    args.reserve(route->args.size());
    for (const Arg &arg : route->args)
    {
        auto v = decodeValue(r, arg.type);
        if (v.is_err())
            return violation();
        args.push_back(v.take());
    }
    if (r.remaining() != 0)
        return violation();

    auto call = local.callPositional(route->name, std::move(args));
    if (call.is_err())
        return violation();
    return Result<CallFrame>::Ok(CallFrame{header.value().seq, call.take()});
}

Bytes encodeResponse(std::uint64_t seq, std::string_view route, const Value &value)
{
    ByteWriter w;
    putHeader(w, seq, route);
    w.u8(STATUS_OK);
    encodeValue(w, value);
    return w.take();
}

Bytes encodeErrorResponse(std::uint64_t seq, std::string_view route, std::int32_t code)
{
    ByteWriter w;
    putHeader(w, seq, route);
    w.u8(STATUS_ERROR);
    w.u32(static_cast<std::uint32_t>(code));
    return w.take();
}

Result<ResponseFrame> decodeResponse(std::span<const std::uint8_t> payload, const Schema &local)
{
    ByteReader r(payload);
    auto header = getHeader(r);
    if (header.is_err())
        return violation();

    const Route *route = local.find(header.value().route);
    if (!route)
        return violation();

    ResponseFrame frame;
    frame.seq = header.value().seq;
    frame.route = header.value().route;

    auto status = r.u8();
    if (status.is_err())
        return violation();
    frame.status = status.value();

    if (frame.status == STATUS_OK)
    {
        auto v = decodeValue(r, route->returns);
        if (v.is_err())
            return violation();
        frame.value.emplace(v.take());
    }
    else if (frame.status == STATUS_ERROR)
    {
        auto code = r.u32();
        if (code.is_err())
            return violation();
        frame.errorCode = static_cast<std::int32_t>(code.value());
    }
    else
    {
        return violation();
    }

    if (r.remaining() != 0)
        return violation();
    return Result<ResponseFrame>::Ok(std::move(frame));
}

// Envelope ----------------------------------------------------------------------------------

Bytes envelope(FrameKind kind, std::span<const std::uint8_t> payload)
{
    ByteWriter w;
    w.u32(static_cast<std::uint32_t>(payload.size() + 1));
    w.u8(static_cast<std::uint8_t>(kind));
    w.bytes(payload);
    return w.take();
}

void FrameReader::feed(std::span<const std::uint8_t> bytes)
{
    if (head_ > 0 && head_ * 2 >= buf_.size())
    {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

Result<std::optional<Frame>> FrameReader::next()
{
    using Out = Result<std::optional<Frame>>;

    if (buffered() < 4)
        return Out::Ok(std::nullopt);

    std::uint32_t len = 0;
    for (int i = 0; i < 4; ++i)
        len |= static_cast<std::uint32_t>(buf_[head_ + i]) << (8 * i);

    if (len == 0 || len > maxFrameBytes_)
        return violation();
    if (buffered() < 4 + static_cast<std::size_t>(len))
        return Out::Ok(std::nullopt);

    const std::uint8_t kind = buf_[head_ + 4];
    if (kind < static_cast<std::uint8_t>(FrameKind::Route) || kind > static_cast<std::uint8_t>(FrameKind::Close))
        return violation();

    Frame frame;
    frame.kind = static_cast<FrameKind>(kind);
    const auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(head_ + ENVELOPE_HEADER);
    frame.payload.assign(begin, begin + static_cast<std::ptrdiff_t>(len - 1));
    head_ += 4 + static_cast<std::size_t>(len);
    return Out::Ok(std::move(frame));
}

} // namespace quasar::portal::wire
