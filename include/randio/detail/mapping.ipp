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

#ifndef RANDIO_MAPPING_IMPL
#define RANDIO_MAPPING_IMPL

// -----------------------------------------------------------------------------
// mapping.ipp - Platform code behind file_mapping and the mapped views
// -----------------------------------------------------------------------------
//
// - Windows: CreateFileMapping / MapViewOfFile / FlushViewOfFile / UnmapViewOfFile
// - POSIX: mmap / msync / munmap, always MAP_SHARED so that writes reach the
//   file and are visible to read_block through the same descriptor.
//
// -----------------------------------------------------------------------------

#include "randio/mapping.hpp"
#include "randio/file.hpp"
#include "randio/log.hpp"
#include "randio/page.hpp"

#include <cstdlib>
#include <limits>

#ifndef _WIN32
# include <sys/mman.h>
#endif

namespace randio {
namespace detail {

#ifdef _WIN32
namespace win {

inline DWORD int64_high(int64_t n) noexcept
{
    return static_cast<DWORD>(static_cast<uint64_t>(n) >> 32);
}

inline DWORD int64_low(int64_t n) noexcept
{
    return n & 0xffffffff;
}

} // namespace win
#endif // _WIN32

struct mmap_context
{
    char* data = nullptr;    ///< Requested offset, not the mapping start
    std::size_t length = 0;
    std::size_t mapped_length = 0;
#ifdef _WIN32
    file_handle_type file_mapping_handle = invalid_handle;
#endif
};

/**
 * Maps `[offset, offset + length)` of `file_handle`.
 *
 * The OS mapping starts at the page boundary at or below `offset`; the padding
 * is included in mapped_length and skipped in the returned data pointer.
 */
inline mmap_context memory_map(const file_handle_type file_handle, const std::uint64_t offset,
        const std::size_t length, const access_mode mode, std::error_code& error)
{
    const std::uint64_t aligned_offset = make_offset_page_aligned(static_cast<std::size_t>(offset));
    const std::size_t length_to_map = static_cast<std::size_t>(offset - aligned_offset) + length;

#ifdef _WIN32
    const int64_t max_file_size = static_cast<int64_t>(offset + length);

    const auto file_mapping_handle = ::CreateFileMapping(
            file_handle,
            0,
            mode == access_mode::read ? PAGE_READONLY : PAGE_READWRITE,
            win::int64_high(max_file_size),
            win::int64_low(max_file_size),
            0);

    if(file_mapping_handle == 0)
    {
        error = detail::last_error();
        return {};
    }

    char* mapping_start = static_cast<char*>(::MapViewOfFile(
            file_mapping_handle,
            mode == access_mode::read ? FILE_MAP_READ : FILE_MAP_WRITE,
            win::int64_high(static_cast<int64_t>(aligned_offset)),
            win::int64_low(static_cast<int64_t>(aligned_offset)),
            static_cast<SIZE_T>(length_to_map)));

    if(mapping_start == nullptr)
    {
        error = detail::last_error();
        ::CloseHandle(file_mapping_handle);
        return {};
    }
#else // POSIX
    char* mapping_start = static_cast<char*>(::mmap(
            0,
            length_to_map,
            mode == access_mode::read ? PROT_READ : PROT_READ | PROT_WRITE,
            MAP_SHARED,
            file_handle,
            static_cast<off_t>(aligned_offset)));

    if(mapping_start == MAP_FAILED)
    {
        error = detail::last_error();
        return {};
    }
#endif

    mmap_context ctx;
    ctx.data = mapping_start + (offset - aligned_offset);
    ctx.length = length;
    ctx.mapped_length = length_to_map;
#ifdef _WIN32
    ctx.file_mapping_handle = file_mapping_handle;
#endif
    return ctx;
}

// -----------------------------------------------------------------------------
// file_mapping
// -----------------------------------------------------------------------------

template<access_mode AccessMode>
file_mapping<AccessMode>::file_mapping(file_mapping&& other) noexcept
    : data_(std::exchange(other.data_, nullptr))
    , length_(std::exchange(other.length_, 0))
    , mapped_length_(std::exchange(other.mapped_length_, 0))
    , file_handle_(std::exchange(other.file_handle_, invalid_handle))
#ifdef _WIN32
    , file_mapping_handle_(std::exchange(other.file_mapping_handle_, invalid_handle))
#endif
{}

template<access_mode AccessMode>
file_mapping<AccessMode>& file_mapping<AccessMode>::operator=(file_mapping&& other) noexcept
{
    if(this != &other)
    {
        unmap();
        data_ = std::exchange(other.data_, nullptr);
        length_ = std::exchange(other.length_, 0);
        mapped_length_ = std::exchange(other.mapped_length_, 0);
        file_handle_ = std::exchange(other.file_handle_, invalid_handle);
#ifdef _WIN32
        file_mapping_handle_ = std::exchange(other.file_mapping_handle_, invalid_handle);
#endif
    }
    return *this;
}

template<access_mode AccessMode>
void file_mapping<AccessMode>::map(const file_handle_type handle, const std::uint64_t offset,
        const size_type length, std::error_code& error)
{
    error.clear();

    if(handle == invalid_handle)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    if(length == 0)
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    const auto file_size = detail::query_file_size(handle, error);
    if(error) { return; }

    if(offset > file_size || length > file_size - offset
            || offset > std::numeric_limits<size_type>::max())
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    const auto ctx = detail::memory_map(handle, offset, length, AccessMode, error);
    if(error) { return; }

    // Only drop the previous mapping once the new one exists.
    unmap();

    file_handle_ = handle;
    data_ = ctx.data;
    length_ = ctx.length;
    mapped_length_ = ctx.mapped_length;
#ifdef _WIN32
    file_mapping_handle_ = ctx.file_mapping_handle;
#endif
}

template<access_mode AccessMode>
void file_mapping<AccessMode>::unmap() noexcept
{
    if(!is_mapped()) { return; }

#ifdef _WIN32
    ::UnmapViewOfFile(get_mapping_start());
    ::CloseHandle(file_mapping_handle_);
    file_mapping_handle_ = invalid_handle;
#else
    ::munmap(get_mapping_start(), mapped_length_);
#endif

    data_ = nullptr;
    length_ = mapped_length_ = 0;
    file_handle_ = invalid_handle;
}

template<access_mode AccessMode>
void file_mapping<AccessMode>::sync(std::error_code& error)
{
    static_assert(AccessMode == access_mode::write, "sync() requires write access");

    error.clear();

    if(!is_mapped())
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

#ifdef _WIN32
    if(::FlushViewOfFile(get_mapping_start(), mapped_length_) == 0
       || ::FlushFileBuffers(file_handle_) == 0)
#else
    if(::msync(get_mapping_start(), mapped_length_, MS_SYNC) != 0)
#endif
    {
        error = detail::last_error();
    }
}

} // namespace detail

// -----------------------------------------------------------------------------
// mutable_mapped_view
// -----------------------------------------------------------------------------

inline mutable_mapped_view& mutable_mapped_view::operator=(mutable_mapped_view&& other) noexcept
{
    if(this != &other)
    {
        release();
        mapping_ = std::move(other.mapping_);
    }
    return *this;
}

inline void mutable_mapped_view::release() noexcept
{
    if(!mapping_.is_mapped()) { return; }

    std::error_code error;
    mapping_.sync(error);
    if(error)
    {
        log::error("flush of a ", mapping_.length(), " byte mapping failed: ",
                error.message(), "; writes through the view may be lost");
        std::abort();
    }
    mapping_.unmap();
}

} // namespace randio

#endif // RANDIO_MAPPING_IMPL
