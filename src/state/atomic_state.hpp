//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/state/atomic_state.hpp
// Purpose: Lock-free guarded bitset used to keep multi-bit invariants race free.
// Key invariants:
//   - The guard table is fixed at build(); only the bit vector changes.
//   - A successful intoState() changes exactly one bit; a failed one changes
//     nothing.
//   - Concurrent callers race on compare-and-swap, never on a lock.
// Ownership/Lifetime: The state word is owned by the instance; the guard table
//                     is immutable and shared.
// Links: src/state/state_table.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/error.hpp"
#include "support/result.hpp"

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace quasar::state
{

using support::Error;
using support::Result;

/**
 * @brief Why a transition was refused.
 *
 * @details
 * Either a usage error (bad bit index, CAS retry limit reached) or the error
 * declared with the guard of the target bit.
 */
template <typename E> class TransitionError
{
  public:
    static TransitionError usage(Error error)
    {
        TransitionError t;
        t.usage_ = error;
        return t;
    }

    static TransitionError guard(E error)
    {
        TransitionError t;
        t.guard_.emplace(std::move(error));
        return t;
    }

    /// True when the guard of the target bit rejected the transition.
    bool isGuard() const
    {
        return guard_.has_value();
    }

    /// Usage error code; Error::None for guard failures.
    Error usageError() const
    {
        return usage_;
    }

    /// Declared guard error. @pre isGuard().
    const E &guardError() const
    {
        return *guard_;
    }

  private:
    TransitionError() = default;

    Error usage_ = Error::None;
    std::optional<E> guard_;
};

/**
 * @brief Fixed-width bitset whose per-bit transitions are guarded and atomic.
 *
 * @details
 * Each bit may carry a guard: a set of bits that must be set and a set of
 * bits that must be clear in the state that would result from flipping it.
 * Guards are evaluated against the post-transition value, so "the door may
 * open only if not locked" is written as a require-clear on the lock bit of
 * the open bit.
 *
 * Bits without a declared guard are unguarded. Multi-bit updates are a
 * sequence of intoState() calls and are not atomic as a group.
 *
 * @tparam E Domain error reported when a guard rejects a transition.
 */
template <typename E> class AtomicState
{
  public:
    using Word = std::uint64_t;
    static constexpr unsigned MAX_WIDTH = 64;

    /**
     * @brief Staged configuration producing an immutable guard table.
     *
     * @details
     * All structural checks run in build(): duplicate guarded bits, bits or
     * guard references outside the width, initial bits outside the width and
     * guards that require a bit both set and clear.
     */
    class Builder
    {
      public:
        explicit Builder(unsigned width) : width_(width) {}

        Builder &guard(unsigned bit,
                       std::initializer_list<unsigned> requireSet,
                       std::initializer_list<unsigned> requireClear,
                       E error)
        {
            return guard(bit,
                         std::vector<unsigned>(requireSet),
                         std::vector<unsigned>(requireClear),
                         std::move(error));
        }

        Builder &guard(unsigned bit,
                       std::vector<unsigned> requireSet,
                       std::vector<unsigned> requireClear,
                       E error)
        {
            entries_.push_back(Entry{bit, std::move(requireSet), std::move(requireClear), std::move(error)});
            return *this;
        }

        /// Initial bit vector as a mask.
        Builder &initial(Word bits)
        {
            initial_ = bits;
            return *this;
        }

        /// Bound the CAS retries per transition (0 = retry until success).
        Builder &casRetryLimit(std::uint32_t limit)
        {
            retryLimit_ = limit;
            return *this;
        }

        Result<AtomicState, Error> build() const
        {
            if (width_ == 0 || width_ > MAX_WIDTH)
                return support::Err(Error::InvalidArg);
            if ((initial_ & ~widthMask(width_)) != 0)
                return support::Err(Error::BitOutOfRange);

            auto table = std::make_shared<Table>();
            table->width = width_;
            table->retryLimit = retryLimit_;
            table->slots.resize(width_);

            for (const Entry &entry : entries_)
            {
                if (entry.bit >= width_)
                    return support::Err(Error::BitOutOfRange);

                Slot &slot = table->slots[entry.bit];
                if (slot.error.has_value())
                    return support::Err(Error::DuplicateBit);

                Word set = 0;
                for (unsigned ref : entry.requireSet)
                {
                    if (ref >= width_)
                        return support::Err(Error::BitOutOfRange);
                    set |= Word(1) << ref;
                }
                Word clear = 0;
                for (unsigned ref : entry.requireClear)
                {
                    if (ref >= width_)
                        return support::Err(Error::BitOutOfRange);
                    clear |= Word(1) << ref;
                }

                const Word self = Word(1) << entry.bit;
                if ((set & clear) != 0 || ((set | clear) & self) != 0)
                    return support::Err(Error::GuardConflict);

                slot.requireSet = set;
                slot.requireClear = clear;
                slot.error.emplace(entry.error);
            }

            return Result<AtomicState, Error>::Ok(AtomicState(std::move(table), initial_));
        }

      private:
        struct Entry
        {
            unsigned bit;
            std::vector<unsigned> requireSet;
            std::vector<unsigned> requireClear;
            E error;
        };

        unsigned width_;
        Word initial_ = 0;
        std::uint32_t retryLimit_ = 0;
        std::vector<Entry> entries_;
    };

    static Builder builder(unsigned width)
    {
        return Builder(width);
    }

    /// Moving is only meaningful before the instance is shared between threads.
    AtomicState(AtomicState &&other) noexcept
        : table_(std::move(other.table_)), word_(other.word_.load(std::memory_order_relaxed))
    {
    }

    AtomicState(const AtomicState &) = delete;
    AtomicState &operator=(const AtomicState &) = delete;
    AtomicState &operator=(AtomicState &&) = delete;

    /**
     * @brief Set or clear exactly one bit if its guard allows the result.
     *
     * @details
     * Reads the current word, computes the candidate with @p bit forced to
     * @p value, checks the guard of @p bit against the candidate and then
     * attempts a compare-and-swap. A lost race restarts from the fresh value.
     *
     * @return Ok on success; the guard's error (state untouched) when the
     *         guard fails; BitOutOfRange or Contended as usage errors.
     */
    Result<void, TransitionError<E>> intoState(unsigned bit, bool value)
    {
        using Outcome = Result<void, TransitionError<E>>;

        if (bit >= table_->width)
            return Outcome::Err(TransitionError<E>::usage(Error::BitOutOfRange));

        const Slot &slot = table_->slots[bit];
        const Word mask = Word(1) << bit;
        const std::uint32_t limit = table_->retryLimit;

        Word current = word_.load(std::memory_order_acquire);
        for (std::uint32_t attempt = 1;; ++attempt)
        {
            const Word next = value ? (current | mask) : (current & ~mask);

            if (slot.error.has_value() && !slot.holds(next))
                return Outcome::Err(TransitionError<E>::guard(*slot.error));

            if (word_.compare_exchange_weak(
                    current, next, std::memory_order_acq_rel, std::memory_order_acquire))
                return Outcome::Ok();

            if (limit != 0 && attempt >= limit)
                return Outcome::Err(TransitionError<E>::usage(Error::Contended));
        }
    }

    /// Snapshot of the whole bit vector.
    Word bits() const
    {
        return word_.load(std::memory_order_acquire);
    }

    /// Snapshot of one bit; false for bits outside the width.
    bool test(unsigned bit) const
    {
        return bit < table_->width && (bits() & (Word(1) << bit)) != 0;
    }

    unsigned width() const
    {
        return table_->width;
    }

  private:
    struct Slot
    {
        Word requireSet = 0;
        Word requireClear = 0;
        std::optional<E> error; // engaged when the bit is guarded

        bool holds(Word candidate) const
        {
            return (candidate & requireSet) == requireSet && (candidate & requireClear) == 0;
        }
    };

    struct Table
    {
        unsigned width = 0;
        std::uint32_t retryLimit = 0;
        std::vector<Slot> slots;
    };

    static constexpr Word widthMask(unsigned width)
    {
        return width >= MAX_WIDTH ? ~Word(0) : ((Word(1) << width) - 1);
    }

    AtomicState(std::shared_ptr<const Table> table, Word initial)
        : table_(std::move(table)), word_(initial)
    {
    }

    std::shared_ptr<const Table> table_;
    std::atomic<Word> word_;
};

} // namespace quasar::state
