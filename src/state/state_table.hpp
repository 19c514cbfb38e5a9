//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/state/state_table.hpp
// Purpose: Text form of an AtomicState guard table and its loader.
// Key invariants: A loaded table is syntactically valid; structural checks
//                 (duplicate bits, conflicts) still happen in build().
// Ownership/Lifetime: StateTable is a plain value independent of the text.
// Links: src/state/atomic_state.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "state/atomic_state.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace quasar::state
{

/// @brief One `bit` line of a state table.
struct GuardLine
{
    unsigned bit = 0;
    std::vector<unsigned> requireSet;
    std::vector<unsigned> requireClear;
    std::uint32_t errorId = 0; ///< Mapped to the domain error by build()
    std::size_t line = 0;      ///< 1-based source line
};

/// @brief Loader failure with the offending line (0 when not line specific).
struct LoadError
{
    support::Error code = support::Error::InvalidArg;
    std::size_t line = 0;
    std::string message;
};

std::ostream &operator<<(std::ostream &os, const LoadError &err);

/**
 * @brief Declarative description of an AtomicState.
 *
 * @details
 * Format, one directive per line, `#` starts a comment:
 * @code
 * width 4
 * initial 0b0001        # or a bit list: initial 0 2
 * bit 1 set 0 clear 2 error 7
 * @endcode
 * Numbers accept decimal, `0x` and `0b` prefixes.
 */
struct StateTable
{
    unsigned width = 0;
    std::uint64_t initial = 0;
    std::vector<GuardLine> guards;

    /**
     * @brief Build an AtomicState from the table.
     *
     * @param mapError Callable turning a numeric error id into an @p E.
     * @param casRetryLimit Forwarded to the builder.
     */
    template <typename E, typename MapFn>
    Result<AtomicState<E>, Error> build(MapFn mapError, std::uint32_t casRetryLimit = 0) const
    {
        auto builder = AtomicState<E>::builder(width);
        builder.initial(initial).casRetryLimit(casRetryLimit);
        for (const GuardLine &g : guards)
            builder.guard(g.bit, g.requireSet, g.requireClear, mapError(g.errorId));
        return builder.build();
    }
};

/// @brief Parse @p text into a StateTable; errors carry the line number.
Result<StateTable, LoadError> loadStateTable(std::string_view text);

} // namespace quasar::state
