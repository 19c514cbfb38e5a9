//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/state/state_table.cpp
// Purpose: Line-oriented parser for the state-table text format.
// Key invariants: Parsing stops at the first malformed line.
// Ownership/Lifetime: Produces values; keeps no reference to the input.
// Links: src/state/state_table.hpp
//
//===----------------------------------------------------------------------===//

#include "state/state_table.hpp"

#include <charconv>
#include <optional>

namespace quasar::state
{

namespace
{

std::vector<std::string_view> tokenize(std::string_view line)
{
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r'))
            ++i;
        std::size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r')
            ++i;
        if (i > start)
            out.push_back(line.substr(start, i - start));
    }
    return out;
}

std::optional<std::uint64_t> parseNumber(std::string_view tok)
{
    int base = 10;
    if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X'))
    {
        base = 16;
        tok.remove_prefix(2);
    }
    else if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'b' || tok[1] == 'B'))
    {
        base = 2;
        tok.remove_prefix(2);
    }

    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), value, base);
    if (ec != std::errc() || end != tok.data() + tok.size())
        return std::nullopt;
    return value;
}

support::Failure<LoadError> fail(std::size_t line, std::string message, Error code = Error::InvalidArg)
{
    return support::Err(LoadError{code, line, std::move(message)});
}

} // namespace

std::ostream &operator<<(std::ostream &os, const LoadError &err)
{
    if (err.line != 0)
        os << "line " << err.line << ": ";
    return os << err.message << " (" << err.code << ")";
}

Result<StateTable, LoadError> loadStateTable(std::string_view text)
{
    StateTable table;
    bool haveWidth = false;
    std::size_t lineNo = 0;

    while (!text.empty())
    {
        ++lineNo;
        std::size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        if (std::size_t hash = line.find('#'); hash != std::string_view::npos)
            line = line.substr(0, hash);

        auto toks = tokenize(line);
        if (toks.empty())
            continue;

        const std::string_view directive = toks[0];
        if (directive == "width")
        {
            if (haveWidth)
                return fail(lineNo, "width declared twice");
            if (toks.size() != 2)
                return fail(lineNo, "expected 'width N'");
            auto n = parseNumber(toks[1]);
            if (!n || *n == 0 || *n > AtomicState<Error>::MAX_WIDTH)
                return fail(lineNo, "width must be 1..64");
            table.width = static_cast<unsigned>(*n);
            haveWidth = true;
        }
        else if (directive == "initial")
        {
            if (!haveWidth)
                return fail(lineNo, "initial before width");
            std::uint64_t mask = 0;
            if (toks.size() == 2 && toks[1].size() > 2 && toks[1][0] == '0' &&
                (toks[1][1] == 'b' || toks[1][1] == 'x' || toks[1][1] == 'B' || toks[1][1] == 'X'))
            {
                auto n = parseNumber(toks[1]);
                if (!n)
                    return fail(lineNo, "bad initial mask");
                mask = *n;
            }
            else
            {
                for (std::size_t i = 1; i < toks.size(); ++i)
                {
                    auto n = parseNumber(toks[i]);
                    if (!n)
                        return fail(lineNo, "bad bit index '" + std::string(toks[i]) + "'");
                    if (*n >= table.width)
                        return fail(lineNo, "initial bit out of range", Error::BitOutOfRange);
                    mask |= std::uint64_t(1) << *n;
                }
            }
            table.initial = mask;
        }
        else if (directive == "bit")
        {
            if (!haveWidth)
                return fail(lineNo, "bit before width");
            if (toks.size() < 2)
                return fail(lineNo, "expected 'bit B ...'");

            GuardLine g;
            g.line = lineNo;
            auto b = parseNumber(toks[1]);
            if (!b)
                return fail(lineNo, "bad bit index '" + std::string(toks[1]) + "'");
            if (*b >= table.width)
                return fail(lineNo, "bit out of range", Error::BitOutOfRange);
            g.bit = static_cast<unsigned>(*b);

            std::vector<unsigned> *target = nullptr;
            bool haveError = false;
            for (std::size_t i = 2; i < toks.size(); ++i)
            {
                if (toks[i] == "set")
                {
                    target = &g.requireSet;
                    continue;
                }
                if (toks[i] == "clear")
                {
                    target = &g.requireClear;
                    continue;
                }
                if (toks[i] == "error")
                {
                    if (i + 1 >= toks.size())
                        return fail(lineNo, "missing error id");
                    auto id = parseNumber(toks[i + 1]);
                    if (!id || *id > UINT32_MAX)
                        return fail(lineNo, "bad error id '" + std::string(toks[i + 1]) + "'");
                    g.errorId = static_cast<std::uint32_t>(*id);
                    haveError = true;
                    target = nullptr;
                    ++i;
                    continue;
                }

                if (!target)
                    return fail(lineNo, "unexpected token '" + std::string(toks[i]) + "'");
                auto ref = parseNumber(toks[i]);
                if (!ref)
                    return fail(lineNo, "bad bit index '" + std::string(toks[i]) + "'");
                if (*ref >= table.width)
                    return fail(lineNo, "guard references bit out of range", Error::BitOutOfRange);
                target->push_back(static_cast<unsigned>(*ref));
            }

            if (!haveError)
                return fail(lineNo, "guard without error id");
            table.guards.push_back(std::move(g));
        }
        else
        {
            return fail(lineNo, "unknown directive '" + std::string(directive) + "'");
        }
    }

    if (!haveWidth)
        return fail(0, "missing width");
    return Result<StateTable, LoadError>::Ok(std::move(table));
}

} // namespace quasar::state
