//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/handle_table.hpp
// Purpose: Per-process table mapping handles to stream endpoints.
// Key invariants:
//   - Slot reuse bumps the generation so stale handles never resolve.
//   - Free slots are chained through a free list.
// Ownership/Lifetime: Each live entry holds one reference on its stream.
// Links: src/ipc/types.hpp, src/ipc/kernel.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/types.hpp"
#include "support/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace quasar::ipc
{

class Stream;

/**
 * @brief One slot of a handle table.
 *
 * @details
 * When @ref used is false the slot is free and @ref nextFree links it into
 * the free list.
 */
struct HandleEntry
{
    std::shared_ptr<Stream> stream;
    Rights rights = RIGHT_NONE;
    Side side = Side::Producer;
    std::uint8_t generation = 0;
    bool used = false;
    std::uint32_t nextFree = 0;
};

/**
 * @brief Fixed-capacity handle table with generation checked lookups.
 *
 * @details
 * Allocation strategy:
 * - construction sizes the entry array and builds the free list;
 * - insert() pops a free slot and fills it;
 * - remove() clears the slot, bumps the generation and pushes it back.
 *
 * The table is not synchronized; the kernel serializes access.
 */
class HandleTable
{
  public:
    static constexpr std::size_t DEFAULT_CAPACITY = 256;

    explicit HandleTable(std::size_t capacity = DEFAULT_CAPACITY);

    /// @brief Allocate a handle for @p stream; NoResource when the table is full.
    support::Result<Handle> insert(std::shared_ptr<Stream> stream, Side side, Rights rights);

    /// @brief Resolve @p h; nullptr for invalid, out-of-range, free or stale handles.
    HandleEntry *get(Handle h);
    const HandleEntry *get(Handle h) const;

    /**
     * @brief Resolve @p h and check its rights.
     * @return The entry, InvalidHandle when it does not resolve, or Denied when
     *         a right in @p required is missing.
     */
    support::Result<HandleEntry *> getWithRights(Handle h, Rights required);

    /// @brief Release @p h and return the entry it held; InvalidHandle if stale.
    support::Result<HandleEntry> remove(Handle h);

    /// @brief Release every live handle, returning them in slot order.
    std::vector<std::pair<Handle, HandleEntry>> drain();

    [[nodiscard]] std::size_t count() const
    {
        return count_;
    }

    [[nodiscard]] std::size_t capacity() const
    {
        return entries_.size();
    }

  private:
    static constexpr std::uint32_t NO_FREE = 0xFFFFFFFFu;

    std::vector<HandleEntry> entries_;
    std::size_t count_ = 0;
    std::uint32_t freeHead_ = NO_FREE;
};

} // namespace quasar::ipc
