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

#ifndef RANDIO_PAGE_HEADER
#define RANDIO_PAGE_HEADER

// -----------------------------------------------------------------------------
// page.hpp - Page granularity helpers for file mappings
// -----------------------------------------------------------------------------
//
// Mapping offsets handed to the operating system must sit on a page (POSIX)
// or allocation-granularity (Windows) boundary. Block addresses produced by
// randfile::append_block are arbitrary byte offsets, so the mapping layer
// rounds them down with make_offset_page_aligned() and hides the padding from
// the caller.
//
// -----------------------------------------------------------------------------

#include <cstddef>

#ifdef _WIN32
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif // WIN32_LEAN_AND_MEAN
# include <windows.h>
#else
# include <unistd.h>
#endif

namespace randio {

/**
 * Returns the granularity, in bytes, at which file mappings may start.
 *
 * - Windows: dwAllocationGranularity (typically 64KiB), not the 4KiB page
 *   size, since MapViewOfFile offsets must be aligned to the former.
 * - POSIX: sysconf(_SC_PAGE_SIZE).
 *
 * The value is queried once and cached.
 */
[[nodiscard]] inline std::size_t page_size()
{
    static const std::size_t page_size = []
    {
#ifdef _WIN32
        SYSTEM_INFO SystemInfo;
        GetSystemInfo(&SystemInfo);
        return static_cast<std::size_t>(SystemInfo.dwAllocationGranularity);
#else
        return static_cast<std::size_t>(sysconf(_SC_PAGE_SIZE));
#endif
    }();
    return page_size;
}

/**
 * Rounds `offset` down to the closest mapping boundary.
 *
 * Example (4KiB pages): 0 -> 0, 100 -> 0, 4096 -> 4096, 5000 -> 4096.
 */
[[nodiscard]] inline std::size_t make_offset_page_aligned(std::size_t offset) noexcept
{
    const std::size_t page_size_ = page_size();
    return offset / page_size_ * page_size_;
}

} // namespace randio

#endif // RANDIO_PAGE_HEADER
