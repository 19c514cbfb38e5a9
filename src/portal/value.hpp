//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/value.hpp
// Purpose: Typed runtime values carried by portal calls and responses.
// Key invariants: The stored payload always matches the value's Type kind.
// Ownership/Lifetime: Values own their strings, array elements, struct fields
//                     and Result payloads.
// Links: src/portal/type.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "portal/type.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace quasar::portal
{

/**
 * @brief A value of one portal Type.
 *
 * @details
 * Unsigned kinds are stored widened to 64 bits, signed kinds sign-extended
 * to 64 bits. Arrays record their element type so empty arrays still carry
 * a complete Type. Struct fields are stored in declaration order; a Result
 * holds its one payload together with the ok/err flag.
 */
class Value
{
  public:
    /// Unit value.
    Value() = default;

    static Value unit();
    static Value boolean(bool v);
    static Value u8(std::uint8_t v);
    static Value u16(std::uint16_t v);
    static Value u32(std::uint32_t v);
    static Value u64(std::uint64_t v);
    static Value usize(std::uint64_t v);
    static Value i8(std::int8_t v);
    static Value i16(std::int16_t v);
    static Value i32(std::int32_t v);
    static Value i64(std::int64_t v);
    static Value str(std::string v);

    /// @brief Array of @p element; items are checked by conforms().
    static Value array(Type element, std::vector<Value> items);

    /// @brief Success side of @p resultType (a Result type) holding @p v.
    static Value ok(Type resultType, Value v);

    /// @brief Error side of @p resultType holding @p v.
    static Value err(Type resultType, Value v);

    /// @brief Struct of @p structType with @p fields in declaration order.
    static Value structure(Type structType, std::vector<Value> fields);

    [[nodiscard]] const Type &type() const
    {
        return type_;
    }

    [[nodiscard]] bool asBool() const;
    [[nodiscard]] std::uint64_t asUnsigned() const;
    [[nodiscard]] std::int64_t asSigned() const;
    [[nodiscard]] const std::string &asStr() const;
    [[nodiscard]] const std::vector<Value> &items() const;

    /// True for the success side of a Result.
    [[nodiscard]] bool isOk() const;

    /// Payload of a Result. @pre type().isResult().
    [[nodiscard]] const Value &inner() const;

    /// @brief Struct field named @p name; nullptr when there is none.
    [[nodiscard]] const Value *field(std::string_view name) const;

    /// @brief True when this value, and every nested element, has type @p t.
    [[nodiscard]] bool conforms(const Type &t) const;

    friend bool operator==(const Value &a, const Value &b);
    friend bool operator!=(const Value &a, const Value &b)
    {
        return !(a == b);
    }

  private:
    /// Result payload: ok flag plus exactly one value.
    using Outcome = std::pair<bool, std::vector<Value>>;
    using Payload =
        std::variant<std::monostate, bool, std::uint64_t, std::int64_t, std::string, std::vector<Value>, Outcome>;

    Value(Type type, Payload payload) : type_(std::move(type)), data_(std::move(payload)) {}

    Type type_;
    Payload data_;
};

std::ostream &operator<<(std::ostream &os, const Value &value);

} // namespace quasar::portal
