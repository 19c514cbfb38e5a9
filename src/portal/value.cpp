//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/value.cpp
// Purpose: Value constructors, accessors and structural comparison.
// Key invariants: Accessors return a neutral value for the wrong kind rather
//                 than reading the wrong variant member.
// Ownership/Lifetime: See value.hpp.
// Links: src/portal/value.hpp
//
//===----------------------------------------------------------------------===//

#include "portal/value.hpp"

namespace quasar::portal
{

Value Value::unit()
{
    return Value();
}

Value Value::boolean(bool v)
{
    return Value(Type::primitive(Kind::Bool), v);
}

Value Value::u8(std::uint8_t v)
{
    return Value(Type::primitive(Kind::U8), std::uint64_t{v});
}

Value Value::u16(std::uint16_t v)
{
    return Value(Type::primitive(Kind::U16), std::uint64_t{v});
}

Value Value::u32(std::uint32_t v)
{
    return Value(Type::primitive(Kind::U32), std::uint64_t{v});
}

Value Value::u64(std::uint64_t v)
{
    return Value(Type::primitive(Kind::U64), v);
}

Value Value::usize(std::uint64_t v)
{
    return Value(Type::primitive(Kind::Usize), v);
}

Value Value::i8(std::int8_t v)
{
    return Value(Type::primitive(Kind::I8), std::int64_t{v});
}

Value Value::i16(std::int16_t v)
{
    return Value(Type::primitive(Kind::I16), std::int64_t{v});
}

Value Value::i32(std::int32_t v)
{
    return Value(Type::primitive(Kind::I32), std::int64_t{v});
}

Value Value::i64(std::int64_t v)
{
    return Value(Type::primitive(Kind::I64), v);
}

Value Value::str(std::string v)
{
    return Value(Type::primitive(Kind::Str), std::move(v));
}

Value Value::array(Type element, std::vector<Value> items)
{
    return Value(Type::array(std::move(element)), std::move(items));
}

Value Value::ok(Type resultType, Value v)
{
    std::vector<Value> inner;
    inner.push_back(std::move(v));
    return Value(std::move(resultType), Outcome{true, std::move(inner)});
}

Value Value::err(Type resultType, Value v)
{
    std::vector<Value> inner;
    inner.push_back(std::move(v));
    return Value(std::move(resultType), Outcome{false, std::move(inner)});
}

Value Value::structure(Type structType, std::vector<Value> fields)
{
    return Value(std::move(structType), std::move(fields));
}

bool Value::asBool() const
{
    const bool *v = std::get_if<bool>(&data_);
    return v && *v;
}

std::uint64_t Value::asUnsigned() const
{
    if (const auto *v = std::get_if<std::uint64_t>(&data_))
        return *v;
    return 0;
}

std::int64_t Value::asSigned() const
{
    if (const auto *v = std::get_if<std::int64_t>(&data_))
        return *v;
    return 0;
}

const std::string &Value::asStr() const
{
    static const std::string kEmpty;
    const auto *v = std::get_if<std::string>(&data_);
    return v ? *v : kEmpty;
}

const std::vector<Value> &Value::items() const
{
    static const std::vector<Value> kEmpty;
    const auto *v = std::get_if<std::vector<Value>>(&data_);
    return v ? *v : kEmpty;
}

bool Value::isOk() const
{
    const auto *v = std::get_if<Outcome>(&data_);
    return v && v->first;
}

const Value &Value::inner() const
{
    static const Value kUnit;
    const auto *v = std::get_if<Outcome>(&data_);
    return v && !v->second.empty() ? v->second.front() : kUnit;
}

const Value *Value::field(std::string_view name) const
{
    const auto &fields = type_.fields();
    const auto &values = items();
    for (std::size_t i = 0; i < fields.size() && i < values.size(); ++i)
    {
        if (fields[i].name == name)
            return &values[i];
    }
    return nullptr;
}

bool Value::conforms(const Type &t) const
{
    if (type_ != t)
        return false;
    switch (t.kind())
    {
        case Kind::Array:
            for (const Value &item : items())
            {
                if (!item.conforms(t.element()))
                    return false;
            }
            return true;
        case Kind::Result:
        {
            const auto *v = std::get_if<Outcome>(&data_);
            if (!v || v->second.size() != 1)
                return false;
            return v->second.front().conforms(v->first ? t.okType() : t.errType());
        }
        case Kind::Struct:
        {
            const auto &fields = t.fields();
            const auto &values = items();
            if (values.size() != fields.size())
                return false;
            for (std::size_t i = 0; i < fields.size(); ++i)
            {
                if (!values[i].conforms(fields[i].type))
                    return false;
            }
            return true;
        }
        default:
            return true;
    }
}

bool operator==(const Value &a, const Value &b)
{
    return a.type_ == b.type_ && a.data_ == b.data_;
}

std::ostream &operator<<(std::ostream &os, const Value &value)
{
    const Type &t = value.type();
    switch (t.kind())
    {
        case Kind::Unit:
            return os << "()";
        case Kind::Bool:
            return os << (value.asBool() ? "true" : "false");
        case Kind::U8:
        case Kind::U16:
        case Kind::U32:
        case Kind::U64:
        case Kind::Usize:
            return os << value.asUnsigned() << kindName(t.kind());
        case Kind::I8:
        case Kind::I16:
        case Kind::I32:
        case Kind::I64:
            return os << value.asSigned() << kindName(t.kind());
        case Kind::Str:
            return os << '"' << value.asStr() << '"';
        case Kind::Array:
        {
            os << '[';
            bool first = true;
            for (const Value &item : value.items())
            {
                if (!first)
                    os << ", ";
                os << item;
                first = false;
            }
            return os << ']';
        }
        case Kind::Result:
            return os << (value.isOk() ? "Ok(" : "Err(") << value.inner() << ')';
        case Kind::Struct:
        {
            os << '{';
            const auto &fields = t.fields();
            const auto &values = value.items();
            for (std::size_t i = 0; i < fields.size() && i < values.size(); ++i)
            {
                if (i > 0)
                    os << ", ";
                os << fields[i].name << ": " << values[i];
            }
            return os << '}';
        }
    }
    return os;
}

} // namespace quasar::portal
