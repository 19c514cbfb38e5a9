//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/schema.hpp
// Purpose: Immutable route tables and validated route calls.
// Key invariants:
//   - Route names are unique within a Schema and never change after build().
//   - A RouteCall's arguments are in declared order and match their types.
// Ownership/Lifetime: Schemas share their route table; copies are cheap.
// Links: src/portal/type.hpp, src/portal/value.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "portal/type.hpp"
#include "portal/value.hpp"
#include "support/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quasar::portal
{

/// @brief One named, typed route argument.
struct Arg
{
    std::string name;
    Type type;

    friend bool operator==(const Arg &a, const Arg &b)
    {
        return a.name == b.name && a.type == b.type;
    }
};

/// @brief A callable route: unique name, ordered arguments, one return type.
struct Route
{
    std::string name;
    std::vector<Arg> args;
    Type returns;

    friend bool operator==(const Route &a, const Route &b)
    {
        return a.name == b.name && a.args == b.args && a.returns == b.returns;
    }
    friend bool operator!=(const Route &a, const Route &b)
    {
        return !(a == b);
    }
};

/// @brief True for `[A-Za-z_][A-Za-z0-9_]*` names not starting with 'A' or 'O'.
bool isValidName(std::string_view name);

/// @brief A call whose arguments were checked against its Route.
class RouteCall
{
  public:
    [[nodiscard]] const std::string &name() const
    {
        return route_.name;
    }

    [[nodiscard]] const Route &route() const
    {
        return route_;
    }

    [[nodiscard]] const std::vector<Value> &args() const
    {
        return args_;
    }

    /// @brief Argument by declared name; nullptr when absent.
    [[nodiscard]] const Value *arg(std::string_view name) const;

  private:
    friend class Schema;

    RouteCall(Route route, std::vector<Value> args) : route_(std::move(route)), args_(std::move(args)) {}

    Route route_;
    std::vector<Value> args_;
};

/**
 * @brief Closed set of routes.
 *
 * @details
 * Built once through Schema::builder(); the builder remembers the first
 * error and build() reports it:
 * - DuplicateRoute for a route name declared twice;
 * - InvalidArg for malformed route or argument names and duplicate argument
 *   names;
 * - SchemaMismatch for unknown type names.
 */
class Schema
{
  public:
    /// Type names may use API form (`Array<u32>`) or wire form (`Arrayu32`).
    using ArgSpec = std::pair<std::string, std::string>;

    class Builder
    {
      public:
        Builder &route(std::string name, std::vector<ArgSpec> args, std::string returns);

        /// Add an already typed route (used for routes decoded from a peer).
        Builder &route(Route route);

        support::Result<Schema> build() const;

      private:
        std::vector<Route> routes_;
        support::Error firstError_ = support::Error::None;
    };

    /// Empty schema.
    Schema();

    static Builder builder()
    {
        return Builder();
    }

    /// @brief Route by name; nullptr when absent.
    [[nodiscard]] const Route *find(std::string_view name) const;

    [[nodiscard]] const std::vector<Route> &routes() const
    {
        return *routes_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return routes_->size();
    }

    /**
     * @brief Validate a call before any byte is produced.
     *
     * @details
     * Arguments are given by name in any order and returned in declared
     * order. Fails UnknownRoute for a missing route and SchemaMismatch for
     * unknown, duplicate, missing or mistyped arguments.
     */
    support::Result<RouteCall> call(std::string_view name, std::vector<std::pair<std::string, Value>> args) const;

    /// @brief Build a call from positional values already in declared order.
    support::Result<RouteCall> callPositional(std::string_view name, std::vector<Value> args) const;

  private:
    explicit Schema(std::vector<Route> routes);

    std::shared_ptr<const std::vector<Route>> routes_;
    std::shared_ptr<const std::map<std::string, std::size_t, std::less<>>> index_;
};

} // namespace quasar::portal
