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

#ifndef RANDIO_ACCESS_HEADER
#define RANDIO_ACCESS_HEADER

// -----------------------------------------------------------------------------
// access.hpp - Capability typing for rand files and their backends
// -----------------------------------------------------------------------------
//
// A rand file handle is parameterized by an access tag (read_only or
// read_write) and by the backend it wraps. Which block operations a handle
// offers is decided at compile time from the pair:
//
//   can_read<Mode, Backend>   read_only and read_write, readable backends
//   can_write<Mode, Backend>  read_write only, writable backends
//
// There is no runtime capability check: an operation the pair does not
// support is simply not declared for that handle type.
//
// Backends are duck-typed. A backend is any type providing
//
//   std::uint64_t seek(std::int64_t offset, seek_origin origin, std::error_code&);
//   std::size_t   read(char* buffer, std::size_t size, std::error_code&);        // readable
//   std::size_t   write(const char* data, std::size_t size, std::error_code&);   // writable
//   file_handle_type native_handle() const;                                     // mappable
//
// read() returns 0 at end of stream. write() may accept fewer bytes than
// requested; the caller loops.
//
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <type_traits>
#include <utility>

#ifdef _WIN32
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif // WIN32_LEAN_AND_MEAN
# include <windows.h>
#endif

namespace randio {

/**
 * Protection requested from the operating system for a file or mapping.
 *
 * There is no write-only mode: writable mappings must also be readable on
 * every supported platform, and rand files always need to read back.
 */
enum class access_mode
{
    read,
    write
};

/** Reference point for backend seeks, as in lseek's SEEK_SET/CUR/END. */
enum class seek_origin
{
    begin,
    current,
    end
};

#ifdef _WIN32
using file_handle_type = HANDLE;
inline const file_handle_type invalid_handle = INVALID_HANDLE_VALUE;
#else
using file_handle_type = int;
inline constexpr file_handle_type invalid_handle = -1;
#endif

// -----------------------------------------------------------------------------
// Access tags
// -----------------------------------------------------------------------------

/// Tag for handles that may only read. Carries no state.
struct read_only
{
    static constexpr access_mode mode = access_mode::read;
};

/// Tag for handles that may read and write. Carries no state.
struct read_write
{
    static constexpr access_mode mode = access_mode::write;
};

// -----------------------------------------------------------------------------
// Backend detection
// -----------------------------------------------------------------------------

namespace detail {

template<typename Backend>
using seek_result_t = decltype(std::declval<Backend&>().seek(
        std::declval<std::int64_t>(), std::declval<seek_origin>(),
        std::declval<std::error_code&>()));

template<typename Backend>
using read_result_t = decltype(std::declval<Backend&>().read(
        std::declval<char*>(), std::declval<std::size_t>(),
        std::declval<std::error_code&>()));

template<typename Backend>
using write_result_t = decltype(std::declval<Backend&>().write(
        std::declval<const char*>(), std::declval<std::size_t>(),
        std::declval<std::error_code&>()));

template<typename Backend>
using native_handle_result_t = decltype(std::declval<const Backend&>().native_handle());

template<typename Backend, template<typename> class Op, typename Result, typename = void>
struct detect_result : std::false_type {};

template<typename Backend, template<typename> class Op, typename Result>
struct detect_result<Backend, Op, Result, std::void_t<Op<Backend>>>
    : std::is_convertible<Op<Backend>, Result> {};

} // namespace detail

/// True if `Backend` can reposition its cursor.
template<typename Backend>
struct is_seekable_backend
    : detail::detect_result<Backend, detail::seek_result_t, std::uint64_t> {};

/// True if `Backend` is seekable and can read at its cursor.
template<typename Backend>
struct is_readable_backend
    : std::conjunction<is_seekable_backend<Backend>,
        detail::detect_result<Backend, detail::read_result_t, std::size_t>> {};

/// True if `Backend` is seekable and can write at its cursor.
template<typename Backend>
struct is_writable_backend
    : std::conjunction<is_seekable_backend<Backend>,
        detail::detect_result<Backend, detail::write_result_t, std::size_t>> {};

/// True if `Backend` is backed by an operating system file that can be mapped.
template<typename Backend>
struct is_mappable_backend
    : detail::detect_result<Backend, detail::native_handle_result_t, file_handle_type> {};

template<typename Backend>
inline constexpr bool is_readable_backend_v = is_readable_backend<Backend>::value;

template<typename Backend>
inline constexpr bool is_writable_backend_v = is_writable_backend<Backend>::value;

template<typename Backend>
inline constexpr bool is_mappable_backend_v = is_mappable_backend<Backend>::value;

// -----------------------------------------------------------------------------
// Capability predicates
// -----------------------------------------------------------------------------

template<typename Mode, typename Backend>
struct can_read : std::false_type {};

template<typename Backend>
struct can_read<read_only, Backend> : is_readable_backend<Backend> {};

template<typename Backend>
struct can_read<read_write, Backend> : is_readable_backend<Backend> {};

template<typename Mode, typename Backend>
struct can_write : std::false_type {};

template<typename Backend>
struct can_write<read_write, Backend> : is_writable_backend<Backend> {};

template<typename Mode, typename Backend>
inline constexpr bool can_read_v = can_read<Mode, Backend>::value;

template<typename Mode, typename Backend>
inline constexpr bool can_write_v = can_write<Mode, Backend>::value;

} // namespace randio

#endif // RANDIO_ACCESS_HEADER
