//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/handle_table.cpp
// Purpose: Free-list allocation and generation checks for HandleTable.
// Key invariants: count_ equals the number of used slots.
// Ownership/Lifetime: Removing an entry hands its stream reference to the caller.
// Links: src/ipc/handle_table.hpp
//
//===----------------------------------------------------------------------===//

#include "ipc/handle_table.hpp"

#include "ipc/stream.hpp"

#include <algorithm>

namespace quasar::ipc
{

using support::Err;
using support::Error;
using support::Result;

HandleTable::HandleTable(std::size_t capacity)
{
    capacity = std::clamp<std::size_t>(capacity, 1, MAX_HANDLE_SLOTS);
    entries_.resize(capacity);
    for (std::size_t i = 0; i < capacity; ++i)
        entries_[i].nextFree = (i + 1 < capacity) ? static_cast<std::uint32_t>(i + 1) : NO_FREE;
    freeHead_ = 0;
}

Result<Handle> HandleTable::insert(std::shared_ptr<Stream> stream, Side side, Rights rights)
{
    if (freeHead_ == NO_FREE)
        return Err(Error::NoResource);

    const std::uint32_t index = freeHead_;
    HandleEntry &e = entries_[index];
    freeHead_ = e.nextFree;

    e.stream = std::move(stream);
    e.side = side;
    e.rights = rights;
    e.used = true;
    e.nextFree = NO_FREE;
    ++count_;

    return Result<Handle>::Ok(make_handle(index, e.generation));
}

const HandleEntry *HandleTable::get(Handle h) const
{
    if (h == HANDLE_INVALID)
        return nullptr;

    const std::uint32_t index = handle_index(h);
    if (index >= entries_.size())
        return nullptr;

    const HandleEntry &e = entries_[index];
    if (!e.used || e.generation != handle_gen(h))
        return nullptr;
    return &e;
}

HandleEntry *HandleTable::get(Handle h)
{
    return const_cast<HandleEntry *>(static_cast<const HandleTable &>(*this).get(h));
}

Result<HandleEntry *> HandleTable::getWithRights(Handle h, Rights required)
{
    HandleEntry *e = get(h);
    if (!e)
        return Err(Error::InvalidHandle);
    if ((e->rights & required) != required)
        return Err(Error::Denied);
    return Result<HandleEntry *>::Ok(e);
}

Result<HandleEntry> HandleTable::remove(Handle h)
{
    HandleEntry *e = get(h);
    if (!e)
        return Err(Error::InvalidHandle);

    HandleEntry out = std::move(*e);
    const std::uint32_t index = handle_index(h);

    e->stream.reset();
    e->rights = RIGHT_NONE;
    e->used = false;
    e->generation = static_cast<std::uint8_t>(e->generation + 1);
    e->nextFree = freeHead_;
    freeHead_ = index;
    --count_;

    out.used = false;
    return Result<HandleEntry>::Ok(std::move(out));
}

std::vector<std::pair<Handle, HandleEntry>> HandleTable::drain()
{
    std::vector<std::pair<Handle, HandleEntry>> out;
    for (std::uint32_t i = 0; i < entries_.size(); ++i)
    {
        if (!entries_[i].used)
            continue;
        const Handle h = make_handle(i, entries_[i].generation);
        auto removed = remove(h);
        if (removed.is_ok())
            out.emplace_back(h, removed.take());
    }
    return out;
}

} // namespace quasar::ipc
