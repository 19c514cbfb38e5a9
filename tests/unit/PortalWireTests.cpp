//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/PortalWireTests.cpp
// Purpose: Pin the portal's type grammar, schema validation and byte-exact
//          frame encodings.
// Key invariants: Malformed input is always ProtocolViolation, never a crash
//                 or a partially decoded value.
// Ownership/Lifetime: Buffers are owned by each test.
// Links: src/portal/type.hpp, src/portal/schema.hpp, src/portal/wire.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "portal/schema.hpp"
#include "portal/type.hpp"
#include "portal/value.hpp"
#include "portal/wire.hpp"

#include <string>
#include <vector>

using namespace quasar;
using namespace quasar::portal;
using support::Error;

namespace
{

Schema paySchema()
{
    auto built = Schema::builder()
                     .route("hello", {{"hi_amount", "u64"}}, "Array<u32>")
                     .route("add", {{"a", "u8"}}, "u8")
                     .route("greet", {{"who", "str"}, {"loud", "bool"}}, "str")
                     .build();
    EXPECT_TRUE(built.is_ok());
    return built.take();
}

wire::Bytes payloadOf(const std::string &text)
{
    return wire::Bytes(text.begin(), text.end());
}

} // namespace

TEST(TypeTest, ParsesApiAndWireSpellings)
{
    auto api = Type::parse("Array<Array<i16>>");
    ASSERT_TRUE(api.is_ok());
    EXPECT_EQ(api.value().wireName(), "ArrayArrayi16");
    EXPECT_EQ(api.value().apiName(), "Array<Array<i16>>");

    auto wire = Type::parse("ArrayArrayi16");
    ASSERT_TRUE(wire.is_ok());
    EXPECT_EQ(wire.value(), api.value());

    EXPECT_TRUE(Type::parse("usize").is_ok());
    EXPECT_TRUE(Type::parse("u128").is_err());
    EXPECT_TRUE(Type::parse("Array<u8").is_err());
    EXPECT_TRUE(Type::parse("").is_err());
}

TEST(TypeTest, PrefixParsingStopsAfterOneType)
{
    std::string_view text = "u32Atail";
    auto t = Type::parsePrefix(text);
    ASSERT_TRUE(t.is_ok());
    EXPECT_EQ(t.value(), Type::primitive(Kind::U32));
    EXPECT_EQ(text, "Atail");
}

TEST(TypeTest, ResultAndStructSpellings)
{
    auto result = Type::parse("Result<u64,str>");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().isResult());
    EXPECT_EQ(result.value().okType(), Type::primitive(Kind::U64));
    EXPECT_EQ(result.value().errType(), Type::primitive(Kind::Str));
    EXPECT_EQ(result.value().wireName(), "Resultu64str");
    EXPECT_EQ(Type::parse("Resultu64str").value(), result.value());

    auto point = Type::parse("{x:u32,tags:Array<str>}");
    ASSERT_TRUE(point.is_ok());
    ASSERT_TRUE(point.value().isStruct());
    ASSERT_EQ(point.value().fields().size(), 2u);
    EXPECT_EQ(point.value().fields()[1].name, "tags");
    EXPECT_EQ(point.value().fields()[1].type, Type::array(Type::primitive(Kind::Str)));
    EXPECT_EQ(point.value().wireName(), "{x:u32,tags:Arraystr}");
    EXPECT_EQ(Type::parse("{x:u32,tags:Arraystr}").value(), point.value());
    EXPECT_EQ(point.value().minWireSize(), 8u);

    for (const char *bad : {"{}", "{a:u8,a:u8}", "{a:u8", "{1a:u8}", "Result<u8,str", "Result<u8>"})
        EXPECT_TRUE(Type::parse(bad).is_err()) << bad;

    auto empty = Type::structure({});
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error(), Error::InvalidArg);
}

TEST(ValueTest, ConformanceFollowsTheType)
{
    const Type u32s = Type::array(Type::primitive(Kind::U32));
    EXPECT_TRUE(Value::array(Type::primitive(Kind::U32), {Value::u32(1), Value::u32(2)}).conforms(u32s));
    EXPECT_FALSE(Value::u64(1).conforms(Type::primitive(Kind::U32)));
    EXPECT_FALSE(Value::usize(1).conforms(Type::primitive(Kind::U64)));
    EXPECT_TRUE(Value::str("x").conforms(Type::primitive(Kind::Str)));
    EXPECT_EQ(Value::i8(-3).asSigned(), -3);
}

TEST(ValueTest, ResultAndStructConformance)
{
    const Type outcome = Type::result(Type::primitive(Kind::U32), Type::primitive(Kind::Str));
    const Value good = Value::ok(outcome, Value::u32(4));
    const Value bad = Value::err(outcome, Value::str("no"));
    EXPECT_TRUE(good.conforms(outcome));
    EXPECT_TRUE(bad.conforms(outcome));
    EXPECT_TRUE(good.isOk());
    EXPECT_FALSE(bad.isOk());
    EXPECT_EQ(bad.inner(), Value::str("no"));
    EXPECT_FALSE(Value::ok(outcome, Value::str("no")).conforms(outcome));

    const Type point = Type::parse("{x:i32,y:i32}").take();
    const Value p = Value::structure(point, {Value::i32(-1), Value::i32(2)});
    EXPECT_TRUE(p.conforms(point));
    ASSERT_NE(p.field("y"), nullptr);
    EXPECT_EQ(*p.field("y"), Value::i32(2));
    EXPECT_EQ(p.field("z"), nullptr);
    EXPECT_FALSE(Value::structure(point, {Value::i32(1)}).conforms(point));
    EXPECT_FALSE(Value::structure(point, {Value::i32(1), Value::u32(2)}).conforms(point));
}

TEST(SchemaTest, BuilderReportsTheFirstError)
{
    auto dup = Schema::builder().route("a1", {}, "unit").route("a1", {}, "u8").build();
    ASSERT_TRUE(dup.is_err());
    EXPECT_EQ(dup.error(), Error::DuplicateRoute);

    auto badType = Schema::builder().route("f", {{"x", "float"}}, "unit").build();
    ASSERT_TRUE(badType.is_err());
    EXPECT_EQ(badType.error(), Error::SchemaMismatch);

    auto badName = Schema::builder().route("Oops", {}, "unit").build();
    ASSERT_TRUE(badName.is_err());
    EXPECT_EQ(badName.error(), Error::InvalidArg);

    auto dupArg = Schema::builder().route("f", {{"x", "u8"}, {"x", "u8"}}, "unit").build();
    ASSERT_TRUE(dupArg.is_err());
    EXPECT_EQ(dupArg.error(), Error::InvalidArg);
}

TEST(SchemaTest, CallsAreValidatedBeforeEncoding)
{
    Schema s = paySchema();

    auto ok = s.call("greet", {{"loud", Value::boolean(true)}, {"who", Value::str("bob")}});
    ASSERT_TRUE(ok.is_ok());
    ASSERT_EQ(ok.value().args().size(), 2u);
    EXPECT_EQ(ok.value().args()[0], Value::str("bob"));
    EXPECT_EQ(ok.value().arg("loud")->asBool(), true);

    auto unknownArg = s.call("add", {{"b", Value::u8(1)}});
    ASSERT_TRUE(unknownArg.is_err());
    EXPECT_EQ(unknownArg.error(), Error::SchemaMismatch);

    auto mistyped = s.call("add", {{"a", Value::u16(1)}});
    ASSERT_TRUE(mistyped.is_err());
    EXPECT_EQ(mistyped.error(), Error::SchemaMismatch);

    auto missing = s.call("nope", {});
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error(), Error::UnknownRoute);
}

TEST(WireTest, RouteHandshakeTextIsExact)
{
    Schema s = paySchema();
    EXPECT_EQ(wire::encodeRoute(*s.find("hello")), "Rhello!Ahi_amount:u64OArrayu32!");
    EXPECT_EQ(wire::encodeRoute(*s.find("greet")), "Rgreet!Awho:strAloud:boolOstr!");

    auto decoded = wire::decodeRoute("Rhello!Ahi_amount:u64OArrayu32!");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), *s.find("hello"));
}

TEST(WireTest, MalformedHandshakeIsAViolation)
{
    for (const char *text : {"hello!Ou8!", "Rhello!Ou8", "Rhello!Ax:u8Ou8!junk", "Rhello!Ax:u9Ou8!", "R!Ou8!",
                             "Rhello!Ax:u8Ay:u8", "Rhello!Ax_u8Ou8!"})
    {
        auto r = wire::decodeRoute(text);
        ASSERT_TRUE(r.is_err()) << text;
        EXPECT_EQ(r.error(), Error::ProtocolViolation) << text;
    }
}

TEST(WireTest, CallFrameBytesAreExact)
{
    Schema s = paySchema();
    auto call = s.call("add", {{"a", Value::u8(7)}});
    ASSERT_TRUE(call.is_ok());

    const wire::Bytes payload = wire::encodeCall(1, call.value());
    const wire::Bytes expected = {1, 0, 0, 0, 0, 0, 0, 0, 3, 0, 'a', 'd', 'd', 7};
    EXPECT_EQ(payload, expected);

    const wire::Bytes framed = wire::envelope(wire::FrameKind::Call, payload);
    ASSERT_EQ(framed.size(), wire::ENVELOPE_HEADER + payload.size());
    EXPECT_EQ(framed[0], 15u);
    EXPECT_EQ(framed[4], static_cast<std::uint8_t>(wire::FrameKind::Call));

    auto back = wire::decodeCall(payload, s);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().seq, 1u);
    EXPECT_EQ(back.value().call.name(), "add");
    EXPECT_EQ(back.value().call.args()[0], Value::u8(7));
}

TEST(WireTest, ArrayAndStringValuesCarryLengthPrefixes)
{
    wire::ByteWriter w;
    wire::encodeValue(w, Value::array(Type::primitive(Kind::U16), {Value::u16(0x0102), Value::u16(3)}));
    wire::encodeValue(w, Value::str("hi"));
    const wire::Bytes expected = {2, 0, 0, 0, 0x02, 0x01, 3, 0, 2, 0, 0, 0, 'h', 'i'};
    EXPECT_EQ(w.data(), expected);
}

TEST(WireTest, CallDecodingRejectsBadPayloads)
{
    Schema s = paySchema();
    auto call = s.call("add", {{"a", Value::u8(7)}});
    ASSERT_TRUE(call.is_ok());
    wire::Bytes payload = wire::encodeCall(9, call.value());

    wire::Bytes trailing = payload;
    trailing.push_back(0);
    EXPECT_EQ(wire::decodeCall(trailing, s).error(), Error::ProtocolViolation);

    wire::Bytes truncated(payload.begin(), payload.end() - 1);
    EXPECT_EQ(wire::decodeCall(truncated, s).error(), Error::ProtocolViolation);

    auto other = Schema::builder().route("sub", {{"a", "u8"}}, "u8").build();
    ASSERT_TRUE(other.is_ok());
    EXPECT_EQ(wire::decodeCall(payload, other.value()).error(), Error::ProtocolViolation);

    wire::ByteWriter badBool;
    badBool.u64(1);
    badBool.u16(5);
    badBool.text("greet");
    badBool.u32(0);
    badBool.u8(2);
    EXPECT_EQ(wire::decodeCall(badBool.data(), s).error(), Error::ProtocolViolation);
}

TEST(WireTest, ResultValuesLeadWithATag)
{
    const Type outcome = Type::result(Type::primitive(Kind::U16), Type::primitive(Kind::Str));
    wire::ByteWriter w;
    wire::encodeValue(w, Value::ok(outcome, Value::u16(0x0102)));
    wire::encodeValue(w, Value::err(outcome, Value::str("no")));
    const wire::Bytes expected = {0, 0x02, 0x01, 1, 2, 0, 0, 0, 'n', 'o'};
    EXPECT_EQ(w.data(), expected);

    wire::ByteReader r(w.data());
    auto first = wire::decodeValue(r, outcome);
    auto second = wire::decodeValue(r, outcome);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), Value::ok(outcome, Value::u16(0x0102)));
    EXPECT_EQ(second.value(), Value::err(outcome, Value::str("no")));

    wire::ByteWriter badTag;
    badTag.u8(2);
    badTag.u16(0);
    wire::ByteReader br(badTag.data());
    auto v = wire::decodeValue(br, outcome);
    ASSERT_TRUE(v.is_err());
    EXPECT_EQ(v.error(), Error::ProtocolViolation);
}

TEST(WireTest, StructFieldsEncodeInDeclarationOrder)
{
    const Type tagged = Type::parse("{x:u32,tags:Array<str>}").take();
    const Value v = Value::structure(
        tagged, {Value::u32(5), Value::array(Type::primitive(Kind::Str), {Value::str("a")})});

    wire::ByteWriter w;
    wire::encodeValue(w, v);
    const wire::Bytes expected = {5, 0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 'a'};
    EXPECT_EQ(w.data(), expected);

    wire::ByteReader r(w.data());
    auto back = wire::decodeValue(r, tagged);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), v);

    wire::Bytes truncated(expected.begin(), expected.end() - 1);
    wire::ByteReader tr(truncated);
    EXPECT_EQ(wire::decodeValue(tr, tagged).error(), Error::ProtocolViolation);
}

TEST(WireTest, HandshakeCarriesStructAndResultTypes)
{
    auto built = Schema::builder().route("plot", {{"at", "{x:i32,y:i32}"}}, "Result<u32,str>").build();
    ASSERT_TRUE(built.is_ok());
    const Route &route = *built.value().find("plot");

    const std::string text = wire::encodeRoute(route);
    EXPECT_EQ(text, "Rplot!Aat:{x:i32,y:i32}OResultu32str!");

    auto decoded = wire::decodeRoute(text);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), route);
}

TEST(WireTest, HugeArrayCountIsRejectedBeforeAllocating)
{
    wire::ByteWriter w;
    w.u32(0xFFFFFFFFu);
    w.u32(1);
    wire::ByteReader r(w.data());
    auto v = wire::decodeValue(r, Type::array(Type::primitive(Kind::U32)));
    ASSERT_TRUE(v.is_err());
    EXPECT_EQ(v.error(), Error::ProtocolViolation);
}

TEST(WireTest, ResponsesCarryValuesOrErrorCodes)
{
    Schema s = paySchema();
    const Value reply = Value::array(Type::primitive(Kind::U32), {Value::u32(5)});

    auto ok = wire::decodeResponse(wire::encodeResponse(4, "hello", reply), s);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().seq, 4u);
    EXPECT_EQ(ok.value().status, wire::STATUS_OK);
    ASSERT_TRUE(ok.value().value.has_value());
    EXPECT_EQ(*ok.value().value, reply);

    auto failed = wire::decodeResponse(wire::encodeErrorResponse(5, "add", static_cast<std::int32_t>(Error::Busy)), s);
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().status, wire::STATUS_ERROR);
    EXPECT_EQ(failed.value().errorCode, static_cast<std::int32_t>(Error::Busy));

    wire::Bytes badStatus = wire::encodeResponse(6, "add", Value::u8(1));
    badStatus[8 + 2 + 3] = 9;
    EXPECT_EQ(wire::decodeResponse(badStatus, s).error(), Error::ProtocolViolation);
}

TEST(FrameReaderTest, ReassemblesFramesAcrossArbitrarySplits)
{
    wire::Bytes stream = wire::envelope(wire::FrameKind::Route, payloadOf("Rx!Ou8!"));
    const wire::Bytes second = wire::envelope(wire::FrameKind::Close, {});
    stream.insert(stream.end(), second.begin(), second.end());

    wire::FrameReader reader(1024);
    std::vector<wire::Frame> frames;
    for (std::uint8_t byte : stream)
    {
        reader.feed(std::span<const std::uint8_t>(&byte, 1));
        auto next = reader.next();
        ASSERT_TRUE(next.is_ok());
        if (next.value())
            frames.push_back(std::move(*next.value()));
    }

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].kind, wire::FrameKind::Route);
    EXPECT_EQ(frames[0].payload, payloadOf("Rx!Ou8!"));
    EXPECT_EQ(frames[1].kind, wire::FrameKind::Close);
    EXPECT_TRUE(frames[1].payload.empty());
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameReaderTest, RejectsOversizedZeroLengthAndUnknownFrames)
{
    {
        wire::FrameReader reader(8);
        const wire::Bytes big = wire::envelope(wire::FrameKind::Call, wire::Bytes(16, 0));
        reader.feed(big);
        EXPECT_EQ(reader.next().error(), Error::ProtocolViolation);
    }
    {
        wire::FrameReader reader(8);
        const wire::Bytes zero = {0, 0, 0, 0};
        reader.feed(zero);
        EXPECT_EQ(reader.next().error(), Error::ProtocolViolation);
    }
    {
        wire::FrameReader reader(8);
        const wire::Bytes unknown = {1, 0, 0, 0, 99};
        reader.feed(unknown);
        EXPECT_EQ(reader.next().error(), Error::ProtocolViolation);
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
