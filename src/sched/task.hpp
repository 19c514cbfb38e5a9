//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/task.hpp
// Purpose: Lazy coroutine task type used for cooperative IPC operations.
// Key invariants:
//   - A Task does not start until it is awaited or detached.
//   - Completion resumes the awaiting coroutine by symmetric transfer.
// Ownership/Lifetime: Task owns its coroutine frame and destroys it on
//                     destruction; a Detached frame destroys itself.
// Links: src/sched/executor.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace quasar::sched
{

template <typename T> class Task;

namespace detail
{

struct PromiseBase
{
    std::coroutine_handle<> continuation;
    std::exception_ptr exception;

    std::suspend_always initial_suspend() noexcept
    {
        return {};
    }

    struct FinalAwaiter
    {
        bool await_ready() noexcept
        {
            return false;
        }

        template <typename P> std::coroutine_handle<> await_suspend(std::coroutine_handle<P> self) noexcept
        {
            if (auto next = self.promise().continuation)
                return next;
            return std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    FinalAwaiter final_suspend() noexcept
    {
        return {};
    }

    void unhandled_exception() noexcept
    {
        exception = std::current_exception();
    }
};

template <typename T> struct Promise : PromiseBase
{
    std::optional<T> value;

    Task<T> get_return_object() noexcept;

    template <typename U> void return_value(U &&v)
    {
        value.emplace(std::forward<U>(v));
    }

    T take()
    {
        if (exception)
            std::rethrow_exception(exception);
        return std::move(*value);
    }
};

template <> struct Promise<void> : PromiseBase
{
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void take()
    {
        if (exception)
            std::rethrow_exception(exception);
    }
};

} // namespace detail

/**
 * @brief Awaitable unit of cooperative work producing a @p T.
 *
 * @details
 * Tasks are lazy: the body runs when a coroutine awaits the task (or when it
 * is handed to Executor::spawn). Awaiting a task transfers control into it
 * and the awaiting coroutine is resumed when the task finishes.
 */
template <typename T = void> class [[nodiscard]] Task
{
  public:
    using promise_type = detail::Promise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    Task() = default;

    explicit Task(Handle h) noexcept : handle_(h) {}

    Task(Task &&other) noexcept : handle_(std::exchange(other.handle_, {})) {}

    Task &operator=(Task &&other) noexcept
    {
        if (this != &other)
        {
            if (handle_)
                handle_.destroy();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    ~Task()
    {
        if (handle_)
            handle_.destroy();
    }

    /// True once the body has run to completion.
    [[nodiscard]] bool done() const
    {
        return !handle_ || handle_.done();
    }

    struct Awaiter
    {
        Handle handle;

        bool await_ready() const noexcept
        {
            return !handle || handle.done();
        }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept
        {
            handle.promise().continuation = awaiting;
            return handle;
        }

        T await_resume()
        {
            return handle.promise().take();
        }
    };

    Awaiter operator co_await() && noexcept
    {
        return Awaiter{handle_};
    }

  private:
    Handle handle_;
};

namespace detail
{

template <typename T> Task<T> Promise<T>::get_return_object() noexcept
{
    return Task<T>(std::coroutine_handle<Promise<T>>::from_promise(*this));
}

inline Task<void> Promise<void>::get_return_object() noexcept
{
    return Task<void>(std::coroutine_handle<Promise<void>>::from_promise(*this));
}

} // namespace detail

/**
 * @brief Fire-and-forget coroutine that owns and drives a Task.
 *
 * @details
 * Starts suspended so the executor decides when it first runs; the frame
 * frees itself when the body finishes. Exceptions escape to whoever resumed
 * the frame (normally Executor::run).
 */
struct Detached
{
    struct promise_type
    {
        Detached get_return_object() noexcept
        {
            return Detached{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept
        {
            return {};
        }

        std::suspend_never final_suspend() noexcept
        {
            return {};
        }

        void return_void() noexcept {}

        void unhandled_exception()
        {
            throw;
        }
    };

    std::coroutine_handle<promise_type> handle;
};

} // namespace quasar::sched
