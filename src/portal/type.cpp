//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/type.cpp
// Purpose: Type name parsing and printing.
// Key invariants: Primitive matching is longest-match so "u16" never parses
//                 as a shorter name. Struct field names are identifiers and
//                 never start a type, so fields need no extra quoting.
// Ownership/Lifetime: Stateless.
// Links: src/portal/type.hpp
//
//===----------------------------------------------------------------------===//

#include "portal/type.hpp"

#include <array>
#include <utility>

namespace quasar::portal
{

using support::Err;
using support::Error;
using support::Result;

namespace
{

constexpr std::array<std::pair<std::string_view, Kind>, 12> kPrimitives = {{
    {"unit", Kind::Unit},
    {"bool", Kind::Bool},
    {"u8", Kind::U8},
    {"u16", Kind::U16},
    {"u32", Kind::U32},
    {"u64", Kind::U64},
    {"usize", Kind::Usize},
    {"i8", Kind::I8},
    {"i16", Kind::I16},
    {"i32", Kind::I32},
    {"i64", Kind::I64},
    {"str", Kind::Str},
}};

constexpr std::string_view kArray = "Array";
constexpr std::string_view kResult = "Result";
constexpr std::string_view kStruct = "struct";

/// Nesting limit for composite types.
constexpr int kMaxDepth = 32;

bool consume(std::string_view &text, char c)
{
    if (text.empty() || text.front() != c)
        return false;
    text.remove_prefix(1);
    return true;
}

bool isIdentStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

Result<Type> parseAt(std::string_view &text, int depth);

Result<Type> parseResult(std::string_view &text, int depth)
{
    const bool apiForm = consume(text, '<');

    auto ok = parseAt(text, depth + 1);
    if (ok.is_err())
        return ok;
    if (apiForm && !consume(text, ','))
        return Err(Error::SchemaMismatch);

    auto err = parseAt(text, depth + 1);
    if (err.is_err())
        return err;
    if (apiForm && !consume(text, '>'))
        return Err(Error::SchemaMismatch);

    return Result<Type>::Ok(Type::result(ok.take(), err.take()));
}

// `{name:type,name:type}`; the caller consumed the opening brace.
Result<Type> parseStruct(std::string_view &text, int depth)
{
    std::vector<Field> fields;
    do
    {
        std::size_t n = 0;
        while (n < text.size() && isIdentChar(text[n]))
            ++n;
        Field field;
        field.name = std::string(text.substr(0, n));
        if (!isFieldName(field.name))
            return Err(Error::SchemaMismatch);
        text.remove_prefix(n);
        if (!consume(text, ':'))
            return Err(Error::SchemaMismatch);

        auto type = parseAt(text, depth + 1);
        if (type.is_err())
            return type;
        field.type = type.take();
        fields.push_back(std::move(field));
    } while (consume(text, ','));

    if (!consume(text, '}'))
        return Err(Error::SchemaMismatch);
    auto t = Type::structure(std::move(fields));
    if (t.is_err())
        return Err(Error::SchemaMismatch);
    return t;
}

Result<Type> parseAt(std::string_view &text, int depth)
{
    if (depth > kMaxDepth)
        return Err(Error::SchemaMismatch);

    if (consume(text, '{'))
        return parseStruct(text, depth);

    if (text.substr(0, kResult.size()) == kResult)
    {
        text.remove_prefix(kResult.size());
        return parseResult(text, depth);
    }

    if (text.substr(0, kArray.size()) == kArray)
    {
        text.remove_prefix(kArray.size());
        const bool apiForm = !text.empty() && text.front() == '<';
        if (apiForm)
            text.remove_prefix(1);

        auto element = parseAt(text, depth + 1);
        if (element.is_err())
            return element;

        if (apiForm)
        {
            if (text.empty() || text.front() != '>')
                return Err(Error::SchemaMismatch);
            text.remove_prefix(1);
        }
        return Result<Type>::Ok(Type::array(element.take()));
    }

    const std::pair<std::string_view, Kind> *best = nullptr;
    for (const auto &entry : kPrimitives)
    {
        if (text.substr(0, entry.first.size()) == entry.first &&
            (!best || entry.first.size() > best->first.size()))
            best = &entry;
    }
    if (!best)
        return Err(Error::SchemaMismatch);

    text.remove_prefix(best->first.size());
    return Result<Type>::Ok(Type::primitive(best->second));
}

} // namespace

bool isFieldName(std::string_view name)
{
    if (name.empty() || !isIdentStart(name.front()))
        return false;
    for (char c : name)
    {
        if (!isIdentChar(c))
            return false;
    }
    return true;
}

std::string_view kindName(Kind kind)
{
    if (kind == Kind::Array)
        return kArray;
    if (kind == Kind::Result)
        return kResult;
    if (kind == Kind::Struct)
        return kStruct;
    for (const auto &entry : kPrimitives)
    {
        if (entry.second == kind)
            return entry.first;
    }
    return "?";
}

Type Type::primitive(Kind kind)
{
    Type t;
    t.kind_ = kind;
    return t;
}

Type Type::array(Type element)
{
    Type t;
    t.kind_ = Kind::Array;
    t.element_ = std::make_shared<const Type>(std::move(element));
    return t;
}

Type Type::result(Type ok, Type err)
{
    Type t;
    t.kind_ = Kind::Result;
    t.element_ = std::make_shared<const Type>(std::move(ok));
    t.error_ = std::make_shared<const Type>(std::move(err));
    return t;
}

Result<Type> Type::structure(std::vector<Field> fields)
{
    if (fields.empty())
        return Err(Error::InvalidArg);
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (!isFieldName(fields[i].name))
            return Err(Error::InvalidArg);
        for (std::size_t j = 0; j < i; ++j)
        {
            if (fields[j].name == fields[i].name)
                return Err(Error::InvalidArg);
        }
    }

    Type t;
    t.kind_ = Kind::Struct;
    t.fields_ = std::make_shared<const std::vector<Field>>(std::move(fields));
    return Result<Type>::Ok(std::move(t));
}

const std::vector<Field> &Type::fields() const
{
    static const std::vector<Field> kNone;
    return fields_ ? *fields_ : kNone;
}

Result<Type> Type::parse(std::string_view text)
{
    std::string_view rest = text;
    auto t = parseAt(rest, 0);
    if (t.is_err())
        return t;
    if (!rest.empty())
        return Err(Error::SchemaMismatch);
    return t;
}

Result<Type> Type::parsePrefix(std::string_view &text)
{
    std::string_view rest = text;
    auto t = parseAt(rest, 0);
    if (t.is_ok())
        text = rest;
    return t;
}

std::string Type::wireName() const
{
    switch (kind_)
    {
        case Kind::Array:
            return std::string(kArray) + element_->wireName();
        case Kind::Result:
            return std::string(kResult) + element_->wireName() + error_->wireName();
        case Kind::Struct:
        {
            std::string out = "{";
            for (const Field &f : fields())
            {
                if (out.size() > 1)
                    out += ',';
                out += f.name + ":" + f.type.wireName();
            }
            return out + "}";
        }
        default:
            return std::string(kindName(kind_));
    }
}

std::string Type::apiName() const
{
    switch (kind_)
    {
        case Kind::Array:
            return std::string(kArray) + "<" + element_->apiName() + ">";
        case Kind::Result:
            return std::string(kResult) + "<" + element_->apiName() + "," + error_->apiName() + ">";
        case Kind::Struct:
        {
            std::string out = "{";
            for (const Field &f : fields())
            {
                if (out.size() > 1)
                    out += ',';
                out += f.name + ":" + f.type.apiName();
            }
            return out + "}";
        }
        default:
            return std::string(kindName(kind_));
    }
}

std::size_t Type::minWireSize() const
{
    switch (kind_)
    {
        case Kind::Unit:
            return 0;
        case Kind::Bool:
        case Kind::U8:
        case Kind::I8:
        case Kind::Result:
            return 1;
        case Kind::U16:
        case Kind::I16:
            return 2;
        case Kind::U32:
        case Kind::I32:
        case Kind::Str:
        case Kind::Array:
            return 4;
        case Kind::U64:
        case Kind::Usize:
        case Kind::I64:
            return 8;
        case Kind::Struct:
        {
            std::size_t total = 0;
            for (const Field &f : fields())
                total += f.type.minWireSize();
            return total;
        }
    }
    return 0;
}

bool operator==(const Type &a, const Type &b)
{
    if (a.kind_ != b.kind_)
        return false;
    switch (a.kind_)
    {
        case Kind::Array:
            return *a.element_ == *b.element_;
        case Kind::Result:
            return *a.element_ == *b.element_ && *a.error_ == *b.error_;
        case Kind::Struct:
            return a.fields() == b.fields();
        default:
            return true;
    }
}

bool operator==(const Field &a, const Field &b)
{
    return a.name == b.name && a.type == b.type;
}

std::ostream &operator<<(std::ostream &os, const Type &type)
{
    return os << type.apiName();
}

} // namespace quasar::portal
