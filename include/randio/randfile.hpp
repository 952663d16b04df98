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

#ifndef RANDIO_RANDFILE_HEADER
#define RANDIO_RANDFILE_HEADER

// -----------------------------------------------------------------------------
// randfile.hpp - Synchronized random-access block file
// -----------------------------------------------------------------------------
//
// basic_randfile is the offset-addressed I/O primitive of the data-file
// format. All reads and writes name their address explicitly; the rand file
// does not track block boundaries, that is left to the layers above.
//
// Handles are cheap to copy. Copies share one backend and one mutex, so any
// number of threads can issue block operations through their own copies; each
// operation holds the mutex only for its own seek and read/write.
//
// Leases:
//   lock() returns a handle bound to a new generation stacked on top of the
//   current one. While any copy of that handle is alive, handles of older
//   generations get errc::generation_mismatch from every block operation. When
//   the last copy is destroyed, the callback given to lock() runs and the
//   older generation becomes usable again. Leases nest to any depth and always
//   unwind innermost first.
//
// Capabilities:
//   The Mode parameter (read_only / read_write) together with the backend
//   type decides which operations exist, see access.hpp. Calling a write
//   operation on a read_only handle does not compile.
//
// Usage:
//   auto file = randio::make_read_write(randio::memory_buffer());
//   std::error_code ec;
//   const auto directory = file.reserve_block(64, ec);
//   {
//       auto writer = file.lock([&] { write_directory(file, directory); }, ec);
//       writer.append_block(payload, ec);
//   } // callback runs here
//
// Error handling:
//   Every operation has an overload taking std::error_code& and, when
//   exceptions are enabled, one that throws std::system_error instead.
//
// -----------------------------------------------------------------------------

#include "randio/access.hpp"
#include "randio/detail/io_state.hpp"
#include "randio/error.hpp"
#include "randio/mapping.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace randio {

/**
 * A copyable handle onto a shared, synchronized backend.
 *
 * @tparam Mode    read_only or read_write.
 * @tparam Backend Any seekable backend (file_sink, file_source, memory_buffer,
 *                 or a user type providing the members listed in access.hpp).
 *
 * Ownership semantics:
 * - Copying binds the copy to the same generation and counts it as one more
 *   outstanding handle of that generation.
 * - Moving transfers the binding; the moved-from handle is empty and reports
 *   std::errc::bad_file_descriptor from every operation.
 * - Destroying (or reset()) the last handle of a generation releases it.
 */
template<typename Mode, typename Backend>
class basic_randfile
{
    static_assert(std::is_same_v<Mode, read_only> || std::is_same_v<Mode, read_write>,
            "Mode must be randio::read_only or randio::read_write");

    using state_type = detail::io_state<Backend>;

    std::shared_ptr<state_type> state_;
    std::size_t generation_ = 0;

public:
    using mode_type = Mode;
    using backend_type = Backend;
    using size_type = std::uint64_t;
    using release_callback = std::function<void()>;

    /** An empty handle. */
    basic_randfile() = default;

    /**
     * Takes ownership of `backend` and creates generation 0 with this handle
     * as its only member.
     */
    explicit basic_randfile(Backend backend)
        : state_(std::make_shared<state_type>(std::move(backend)))
    {
        static_assert(can_read_v<Mode, Backend>,
                "rand files need a seekable, readable backend");
        static_assert(!std::is_same_v<Mode, read_write> || can_write_v<Mode, Backend>,
                "read_write rand files need a writable backend");
    }

    basic_randfile(const basic_randfile& other)
        : state_(other.state_)
        , generation_(other.generation_)
    {
        if(state_) { state_->retain(generation_); }
    }

    basic_randfile(basic_randfile&& other) noexcept
        : state_(std::move(other.state_))
        , generation_(std::exchange(other.generation_, 0))
    {}

    basic_randfile& operator=(const basic_randfile& other)
    {
        basic_randfile copy(other);
        swap(copy);
        return *this;
    }

    basic_randfile& operator=(basic_randfile&& other) noexcept
    {
        if(this != &other)
        {
            basic_randfile released(std::move(*this));
            swap(other);
        }
        return *this;
    }

    /**
     * Releases this handle's share of its generation.
     *
     * A release callback that throws from here terminates the process; use
     * reset() to observe such exceptions.
     */
    ~basic_randfile()
    {
        if(state_) { state_->release(generation_); }
    }

    /**
     * Releases this handle now and leaves it empty.
     *
     * If this was the last handle of its generation, the release callbacks of
     * every generation unwound by it run before reset() returns. The first
     * exception thrown by a callback is rethrown, after all of them ran.
     */
    void reset()
    {
        auto state = std::move(state_);
        const auto generation = std::exchange(generation_, 0);
        if(state) { state->release(generation); }
    }

    void swap(basic_randfile& other) noexcept
    {
        using std::swap;
        swap(state_, other.state_);
        swap(generation_, other.generation_);
    }

    // -------------------------------------------------------------------------
    // State queries
    // -------------------------------------------------------------------------

    /** False for default-constructed and moved-from handles. */
    [[nodiscard]] bool is_open() const noexcept { return state_ != nullptr; }

    /** The generation this handle is bound to. */
    [[nodiscard]] std::size_t generation() const noexcept { return generation_; }

    /** The generation currently allowed to use the backend (0 if empty). */
    [[nodiscard]] std::size_t current_generation() const
    {
        return state_ ? state_->current_generation() : 0;
    }

    /** True if block operations through this handle would pass the generation check. */
    [[nodiscard]] bool is_current() const
    {
        return state_ && state_->current_generation() == generation_;
    }

    // -------------------------------------------------------------------------
    // Read operations
    // -------------------------------------------------------------------------

    /** Current length of the backend in bytes. */
    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>, int> = 0>
    size_type size(std::error_code& error)
    {
        return size_impl(error);
    }

    /**
     * Reads up to `length` bytes starting at `address` into `buffer`.
     *
     * Reading stops when the buffer is full or the backend reports end of
     * stream. The number of bytes actually read is returned; a short count is
     * not an error.
     */
    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>, int> = 0>
    std::size_t read_block(const size_type address, char* buffer, const std::size_t length,
            std::error_code& error)
    {
        return read_block_impl(address, buffer, length, error);
    }

    /**
     * Maps `size` bytes at `offset` read-only.
     *
     * The generation check does not apply: a handle whose generation has been
     * superseded can still map, and the view outlives any later lock().
     */
    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>
        && is_mappable_backend_v<Backend>, int> = 0>
    mapped_view map_read_only(const size_type offset, const std::size_t size,
            std::error_code& error) const
    {
        return mapped_view(map_impl<access_mode::read>(offset, size, error));
    }

    // -------------------------------------------------------------------------
    // Write operations
    // -------------------------------------------------------------------------

    /**
     * Writes `data` at the end of the backend.
     *
     * @return The address the block starts at.
     */
    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type append_block(const char* data, const std::size_t length, std::error_code& error)
    {
        return append_block_impl(data, length, error);
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type append_block(const std::string_view data, std::error_code& error)
    {
        return append_block_impl(data.data(), data.size(), error);
    }

    /**
     * Overwrites the bytes at `offset` with `data`.
     *
     * The range is not checked: it is up to the caller to target a block it
     * appended or reserved before.
     */
    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    void update_block(const size_type offset, const char* data, const std::size_t length,
            std::error_code& error)
    {
        update_block_impl(offset, data, length, error);
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    void update_block(const size_type offset, const std::string_view data, std::error_code& error)
    {
        update_block_impl(offset, data.data(), data.size(), error);
    }

    /**
     * Extends the backend by `size` bytes without writing meaningful content,
     * so that the block can be filled in later with update_block().
     *
     * @return The address of the reserved block. A zero size reserves nothing
     *         and returns the current end.
     */
    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type reserve_block(const std::size_t size, std::error_code& error)
    {
        return reserve_block_impl(size, error);
    }

    /**
     * Maps `size` bytes at `offset` read-write.
     *
     * The view is flushed to the file when it is destroyed. As with
     * map_read_only(), leases do not apply.
     */
    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>
        && is_mappable_backend_v<Backend>, int> = 0>
    mutable_mapped_view map_mutable(const size_type offset, const std::size_t size,
            std::error_code& error)
    {
        return mutable_mapped_view(map_impl<access_mode::write>(offset, size, error));
    }

    // -------------------------------------------------------------------------
    // Leases
    // -------------------------------------------------------------------------

    /**
     * Starts a new generation on top of the current one.
     *
     * The new generation stacks on the rand file's current generation, not on
     * this handle's, so locking through a stale handle still nests correctly.
     * `on_release` runs once, after the mutex is released, when the last
     * handle of the new generation goes away and every generation above it has
     * been released.
     *
     * @return A handle bound to the new generation, or an empty handle on
     *         error.
     */
    basic_randfile lock(release_callback on_release, std::error_code& error);

#ifdef __cpp_exceptions
    // -------------------------------------------------------------------------
    // Throwing overloads
    // -------------------------------------------------------------------------

    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>, int> = 0>
    size_type size()
    {
        std::error_code error;
        const auto result = size_impl(error);
        if(error) { throw std::system_error(error); }
        return result;
    }

    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>, int> = 0>
    std::size_t read_block(const size_type address, char* buffer, const std::size_t length)
    {
        std::error_code error;
        const auto result = read_block_impl(address, buffer, length, error);
        if(error) { throw std::system_error(error); }
        return result;
    }

    template<typename M = Mode, std::enable_if_t<can_read_v<M, Backend>
        && is_mappable_backend_v<Backend>, int> = 0>
    mapped_view map_read_only(const size_type offset, const std::size_t size) const
    {
        std::error_code error;
        auto mapping = map_impl<access_mode::read>(offset, size, error);
        if(error) { throw std::system_error(error); }
        return mapped_view(std::move(mapping));
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type append_block(const char* data, const std::size_t length)
    {
        std::error_code error;
        const auto result = append_block_impl(data, length, error);
        if(error) { throw std::system_error(error); }
        return result;
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type append_block(const std::string_view data)
    {
        return append_block(data.data(), data.size());
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    void update_block(const size_type offset, const char* data, const std::size_t length)
    {
        std::error_code error;
        update_block_impl(offset, data, length, error);
        if(error) { throw std::system_error(error); }
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    void update_block(const size_type offset, const std::string_view data)
    {
        update_block(offset, data.data(), data.size());
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>, int> = 0>
    size_type reserve_block(const std::size_t size)
    {
        std::error_code error;
        const auto result = reserve_block_impl(size, error);
        if(error) { throw std::system_error(error); }
        return result;
    }

    template<typename M = Mode, std::enable_if_t<can_write_v<M, Backend>
        && is_mappable_backend_v<Backend>, int> = 0>
    mutable_mapped_view map_mutable(const size_type offset, const std::size_t size)
    {
        std::error_code error;
        auto mapping = map_impl<access_mode::write>(offset, size, error);
        if(error) { throw std::system_error(error); }
        return mutable_mapped_view(std::move(mapping));
    }

    basic_randfile lock(release_callback on_release)
    {
        std::error_code error;
        auto locked = lock(std::move(on_release), error);
        if(error) { throw std::system_error(error); }
        return locked;
    }
#endif // __cpp_exceptions

private:
    basic_randfile(std::shared_ptr<state_type> state, const std::size_t generation) noexcept
        : state_(std::move(state))
        , generation_(generation)
    {}

    size_type size_impl(std::error_code& error);
    std::size_t read_block_impl(size_type address, char* buffer, std::size_t length,
            std::error_code& error);
    size_type append_block_impl(const char* data, std::size_t length, std::error_code& error);
    void update_block_impl(size_type offset, const char* data, std::size_t length,
            std::error_code& error);
    size_type reserve_block_impl(std::size_t size, std::error_code& error);

    template<access_mode AccessMode>
    detail::file_mapping<AccessMode> map_impl(size_type offset, std::size_t size,
            std::error_code& error) const;
};

template<typename Mode, typename Backend>
void swap(basic_randfile<Mode, Backend>& a, basic_randfile<Mode, Backend>& b) noexcept
{
    a.swap(b);
}

// -----------------------------------------------------------------------------
// Type aliases and factory functions
// -----------------------------------------------------------------------------

template<typename Backend>
using read_only_randfile = basic_randfile<read_only, Backend>;

template<typename Backend>
using read_write_randfile = basic_randfile<read_write, Backend>;

/** Wraps a readable backend in a read-only rand file. */
template<typename Backend>
read_only_randfile<Backend> make_read_only(Backend backend)
{
    return read_only_randfile<Backend>(std::move(backend));
}

/** Wraps a readable and writable backend in a read-write rand file. */
template<typename Backend>
read_write_randfile<Backend> make_read_write(Backend backend)
{
    return read_write_randfile<Backend>(std::move(backend));
}

} // namespace randio

#include "randio/detail/randfile.ipp"

#endif // RANDIO_RANDFILE_HEADER
