//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/type.hpp
// Purpose: Portal type descriptors and their API/wire spellings.
// Key invariants: A Type is immutable; Array always has an element type,
//                 Result both of its types, and a struct at least one field
//                 with names unique within it.
// Ownership/Lifetime: Nested types are shared between copies.
// Links: src/portal/value.hpp, src/portal/wire.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace quasar::portal
{

/// @brief Primitive kinds plus the composite kinds.
enum class Kind : std::uint8_t
{
    Unit,
    Bool,
    U8,
    U16,
    U32,
    U64,
    Usize,
    I8,
    I16,
    I32,
    I64,
    Str,
    Array,
    Result,
    Struct,
};

/// @brief Spelling of a primitive kind ("u32"); the keyword for composites.
std::string_view kindName(Kind kind);

struct Field;

/**
 * @brief Type of a route argument or return value.
 *
 * @details
 * Two spellings are understood:
 * - API form, used when declaring routes: `Array<u32>`, `Result<u64,str>`;
 * - wire form, used in handshake frames: `Arrayu32`, `Resultu64str`.
 *
 * Structs are structural: `{x:u32,tags:Array<str>}` names its fields in
 * order and is spelled the same way in both forms, with each field type in
 * the surrounding form.
 */
class Type
{
  public:
    /// Defaults to unit.
    Type() = default;

    static Type primitive(Kind kind);
    static Type array(Type element);
    static Type result(Type ok, Type err);

    /// @brief Struct of @p fields; InvalidArg if empty or a name repeats.
    static support::Result<Type> structure(std::vector<Field> fields);

    /// @brief Parse a complete API-form or wire-form type name.
    static support::Result<Type> parse(std::string_view text);

    /**
     * @brief Parse the longest type name at the start of @p text.
     *
     * @details
     * Used by the handshake decoder where a type is followed directly by the
     * next token. On success @p text is advanced past the type.
     */
    static support::Result<Type> parsePrefix(std::string_view &text);

    [[nodiscard]] Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] bool isArray() const
    {
        return kind_ == Kind::Array;
    }

    /// Element type. @pre isArray().
    [[nodiscard]] const Type &element() const
    {
        return *element_;
    }

    [[nodiscard]] bool isResult() const
    {
        return kind_ == Kind::Result;
    }

    /// @pre isResult().
    [[nodiscard]] const Type &okType() const
    {
        return *element_;
    }

    /// @pre isResult().
    [[nodiscard]] const Type &errType() const
    {
        return *error_;
    }

    [[nodiscard]] bool isStruct() const
    {
        return kind_ == Kind::Struct;
    }

    /// Fields in declaration order; empty unless isStruct().
    [[nodiscard]] const std::vector<Field> &fields() const;

    [[nodiscard]] std::string wireName() const;
    [[nodiscard]] std::string apiName() const;

    /// @brief Smallest encoded size of a value of this type.
    [[nodiscard]] std::size_t minWireSize() const;

    friend bool operator==(const Type &a, const Type &b);
    friend bool operator!=(const Type &a, const Type &b)
    {
        return !(a == b);
    }

  private:
    Kind kind_ = Kind::Unit;
    std::shared_ptr<const Type> element_; ///< Array element or Result ok type
    std::shared_ptr<const Type> error_;
    std::shared_ptr<const std::vector<Field>> fields_;
};

/// @brief One named member of a struct type.
struct Field
{
    std::string name;
    Type type;
};

bool operator==(const Field &a, const Field &b);

/// @brief True for `[A-Za-z_][A-Za-z0-9_]*`, the spelling of struct fields.
bool isFieldName(std::string_view name);

std::ostream &operator<<(std::ostream &os, const Type &type);

} // namespace quasar::portal
