/* Copyright 2017 https://github.com/mandreyel
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this
 * software and associated documentation files (the "Software"), to deal in the Software
 * without restriction, including without limitation the rights to use, copy, modify,
 * merge, publish, distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be included in all copies
 * or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 * INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A
 * PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
 * CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
 * OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef RANDIO_IO_STATE_HEADER
#define RANDIO_IO_STATE_HEADER

// -----------------------------------------------------------------------------
// io_state.hpp - State shared by every handle of one rand file
// -----------------------------------------------------------------------------
//
// io_state owns the backend and the lease stack, both guarded by one mutex.
//
// Lease stack:
//   stack_[g] = (outstanding handles bound to generation g, release callback)
//   current_  = stack_.size() - 1, the only generation allowed to use the
//               backend.
//
// Generation 0 always exists and never pops. lock() pushes a generation on
// top of whatever is current. When the last handle of a generation goes away
// the stack unwinds iteratively: every top entry with no outstanding handle is
// popped and its callback collected. Callbacks run after the mutex is
// released, innermost first, so a callback may use the rand file again (e.g.
// to rewrite a directory block).
//
// Poisoning:
//   std::mutex has no notion of a holder that failed. The accessor below marks
//   the state poisoned when a critical section is left through an exception
//   (a throwing backend, std::bad_alloc while growing a buffer, ...) and every
//   later access reports errc::lock_failure. Reference counting keeps working
//   on a poisoned state so that leases still release and callbacks still fire.
//
// -----------------------------------------------------------------------------

#include "randio/error.hpp"
#include "randio/log.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace randio {
namespace detail {

template<typename Backend>
class io_state
{
public:
    using callback_type = std::function<void()>;

private:
    struct lease
    {
        std::size_t outstanding;
        callback_type on_release;
    };

    std::mutex mutex_;
    Backend backend_;
    std::size_t current_ = 0;
    std::vector<lease> stack_;
    bool poisoned_ = false;

public:
    /**
     * Scoped critical section over the state.
     *
     * Converts to false when the mutex could not be taken or the state is
     * poisoned; the error is then set to errc::lock_failure and nothing may be
     * accessed.
     */
    class accessor
    {
        io_state* state_ = nullptr;
        int uncaught_ = 0;

    public:
        accessor(io_state& state, std::error_code& error)
        {
            error.clear();
#ifdef __cpp_exceptions
            try
            {
                state.mutex_.lock();
            }
            catch(const std::system_error& e)
            {
                log::error("rand file mutex unavailable: ", e.what());
                error = errc::lock_failure;
                return;
            }
#else
            state.mutex_.lock();
#endif
            if(state.poisoned_)
            {
                state.mutex_.unlock();
                error = errc::lock_failure;
                return;
            }
            state_ = &state;
            uncaught_ = std::uncaught_exceptions();
        }

        accessor(const accessor&) = delete;
        accessor& operator=(const accessor&) = delete;

        ~accessor()
        {
            if(!state_) { return; }
            if(std::uncaught_exceptions() > uncaught_)
            {
                state_->poisoned_ = true;
                log::error("rand file poisoned: exception thrown while holding its lock");
            }
            state_->mutex_.unlock();
        }

        explicit operator bool() const noexcept { return state_ != nullptr; }

        /**
         * Returns the backend if `generation` is the current generation,
         * nullptr with errc::generation_mismatch otherwise.
         */
        Backend* try_use(const std::size_t generation, std::error_code& error) noexcept
        {
            error.clear();
            if(generation != state_->current_)
            {
                log::debug("generation ", generation, " rejected, current is ",
                        state_->current_);
                error = errc::generation_mismatch;
                return nullptr;
            }
            return &state_->backend_;
        }

        /** The backend regardless of generation. Used for mappings only. */
        Backend& backend() noexcept { return state_->backend_; }

        /** Pushes a new generation on top of the current one and returns it. */
        std::size_t acquire_lease(callback_type on_release)
        {
            state_->stack_.push_back(lease{1, std::move(on_release)});
            state_->current_ = state_->stack_.size() - 1;
            log::debug("lease acquired, generation ", state_->current_);
            return state_->current_;
        }

        std::size_t current_generation() const noexcept { return state_->current_; }
    };

    explicit io_state(Backend backend)
        : backend_(std::move(backend))
    {
        stack_.push_back(lease{1, callback_type{}});
    }

    io_state(const io_state&) = delete;
    io_state& operator=(const io_state&) = delete;

    /** Counts one more handle bound to `generation`. */
    void retain(const std::size_t generation)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stack_[generation].outstanding;
    }

    /**
     * Counts one handle of `generation` less and unwinds the stack if that was
     * the last one.
     *
     * All collected callbacks run, innermost generation first, even if one of
     * them throws. The first exception thrown is rethrown once they are done.
     */
    void release(const std::size_t generation)
    {
        std::vector<callback_type> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& entry = stack_[generation];
            if(entry.outstanding > 0) { --entry.outstanding; }
            if(entry.outstanding > 0) { return; }

            while(current_ > 0 && stack_[current_].outstanding == 0)
            {
                log::debug("generation ", current_, " released");
                callbacks.push_back(std::move(stack_[current_].on_release));
                stack_.pop_back();
                --current_;
            }
        }

        std::exception_ptr failure;
        for(auto& callback : callbacks)
        {
            if(!callback) { continue; }
#ifdef __cpp_exceptions
            try
            {
                callback();
            }
            catch(...)
            {
                log::error("lease release callback threw");
                if(!failure) { failure = std::current_exception(); }
            }
#else
            callback();
#endif
        }
        if(failure) { std::rethrow_exception(failure); }
    }

    /** The generation currently allowed to use the backend. */
    std::size_t current_generation()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    bool is_poisoned()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return poisoned_;
    }
};

} // namespace detail
} // namespace randio

#endif // RANDIO_IO_STATE_HEADER
