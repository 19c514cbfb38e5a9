//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/portal/schema.cpp
// Purpose: Schema construction and call validation.
// Key invariants: Validation never produces a RouteCall with a type error.
// Ownership/Lifetime: See schema.hpp.
// Links: src/portal/schema.hpp
//
//===----------------------------------------------------------------------===//

#include "portal/schema.hpp"

#include <set>

namespace quasar::portal
{

using support::Err;
using support::Error;
using support::Result;

namespace
{

/// Names travel with a u16 length prefix.
constexpr std::size_t kMaxNameBytes = 0xFFFF;

bool isIdentStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

} // namespace

bool isValidName(std::string_view name)
{
    if (name.empty() || name.size() > kMaxNameBytes || !isIdentStart(name.front()))
        return false;
    // 'A' and 'O' introduce arguments and the output type in handshake frames.
    if (name.front() == 'A' || name.front() == 'O')
        return false;
    for (char c : name)
    {
        if (!isIdentChar(c))
            return false;
    }
    return true;
}

const Value *RouteCall::arg(std::string_view name) const
{
    for (std::size_t i = 0; i < route_.args.size(); ++i)
    {
        if (route_.args[i].name == name)
            return &args_[i];
    }
    return nullptr;
}

Schema::Builder &Schema::Builder::route(std::string name, std::vector<ArgSpec> args, std::string returns)
{
    if (firstError_ != Error::None)
        return *this;

    Route r;
    r.name = std::move(name);

    for (auto &spec : args)
    {
        auto type = Type::parse(spec.second);
        if (type.is_err())
        {
            firstError_ = Error::SchemaMismatch;
            return *this;
        }
        r.args.push_back(Arg{std::move(spec.first), type.take()});
    }

    auto ret = Type::parse(returns);
    if (ret.is_err())
    {
        firstError_ = Error::SchemaMismatch;
        return *this;
    }
    r.returns = ret.take();
    return route(std::move(r));
}

Schema::Builder &Schema::Builder::route(Route r)
{
    if (firstError_ != Error::None)
        return *this;

    if (!isValidName(r.name))
    {
        firstError_ = Error::InvalidArg;
        return *this;
    }

    std::set<std::string_view> seen;
    for (const Arg &a : r.args)
    {
        if (!isValidName(a.name) || !seen.insert(a.name).second)
        {
            firstError_ = Error::InvalidArg;
            return *this;
        }
    }

    for (const Route &existing : routes_)
    {
        if (existing.name == r.name)
        {
            firstError_ = Error::DuplicateRoute;
            return *this;
        }
    }

    routes_.push_back(std::move(r));
    return *this;
}

Result<Schema> Schema::Builder::build() const
{
    if (firstError_ != Error::None)
        return Err(firstError_);
    return Result<Schema>::Ok(Schema(routes_));
}

Schema::Schema() : Schema(std::vector<Route>{}) {}

Schema::Schema(std::vector<Route> routes)
{
    auto index = std::make_shared<std::map<std::string, std::size_t, std::less<>>>();
    for (std::size_t i = 0; i < routes.size(); ++i)
        index->emplace(routes[i].name, i);
    routes_ = std::make_shared<const std::vector<Route>>(std::move(routes));
    index_ = std::move(index);
}

const Route *Schema::find(std::string_view name) const
{
    auto it = index_->find(name);
    return it == index_->end() ? nullptr : &(*routes_)[it->second];
}

Result<RouteCall> Schema::call(std::string_view name, std::vector<std::pair<std::string, Value>> args) const
{
    const Route *route = find(name);
    if (!route)
        return Err(Error::UnknownRoute);
    if (args.size() != route->args.size())
        return Err(Error::SchemaMismatch);

    std::vector<Value> ordered;
    ordered.reserve(route->args.size());
    for (const Arg &declared : route->args)
    {
        const Value *found = nullptr;
        for (const auto &given : args)
        {
            if (given.first != declared.name)
                continue;
            if (found)
                return Err(Error::SchemaMismatch);
            found = &given.second;
        }
        if (!found || !found->conforms(declared.type))
            return Err(Error::SchemaMismatch);
        ordered.push_back(*found);
    }

    return Result<RouteCall>::Ok(RouteCall(*route, std::move(ordered)));
}

Result<RouteCall> Schema::callPositional(std::string_view name, std::vector<Value> args) const
{
    const Route *route = find(name);
    if (!route)
        return Err(Error::UnknownRoute);
    if (args.size() != route->args.size())
        return Err(Error::SchemaMismatch);
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (!args[i].conforms(route->args[i].type))
            return Err(Error::SchemaMismatch);
    }
    return Result<RouteCall>::Ok(RouteCall(*route, std::move(args)));
}

} // namespace quasar::portal
