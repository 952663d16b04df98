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

#ifndef RANDIO_MAPPING_HEADER
#define RANDIO_MAPPING_HEADER

// -----------------------------------------------------------------------------
// mapping.hpp - Zero-copy views over regions of a rand file
// -----------------------------------------------------------------------------
//
// Views are created through basic_randfile::map_read_only() and
// basic_randfile::map_mutable(); this header only defines the view types and
// the single-owner mapping they are built from.
//
//   mapped_view          read-only, copyable; copies share one mapping which
//                        is unmapped when the last copy goes away.
//   mutable_mapped_view  read-write, move-only; the mapping is flushed to the
//                        file exactly once, when the owning view is destroyed.
//
// Once created, views are independent of the rand file's lease stack: they
// hold no generation and are unaffected by lock()/unlock cycles. They do
// depend on the file itself: truncating or closing the backing file while a
// view is alive invalidates the memory behind it.
//
// Mutable views are deliberately not copyable. Two copies would hand out
// overlapping writable memory with nothing to order the writes; callers that
// need to share one must provide that ordering themselves around a single
// owner.
//
// Thread safety:
//   Views are not synchronized. Concurrent reads of a mapped_view are safe;
//   writes through a mutable_mapped_view need external synchronization, and
//   so does mixing them with update_block/append_block writes to the same
//   range.
//
// -----------------------------------------------------------------------------

#include "randio/access.hpp"
#include "randio/page.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <system_error>
#include <utility>

#if __cplusplus >= 202002L
#include <span>
#endif

namespace randio {
namespace detail {

/**
 * A single-owner mapping of `[offset, offset + length)` of an open file.
 *
 * The file handle is borrowed: it belongs to the backend and must stay open
 * for as long as the mapping exists. The start of the OS mapping is rounded
 * down to a page boundary; data() points at the requested offset.
 *
 * Nothing is flushed implicitly. Owners decide when to call sync().
 */
template<access_mode AccessMode>
class file_mapping
{
public:
    using size_type = std::size_t;
    using pointer = char*;
    using const_pointer = const char*;

private:
    // First requested byte, offset from the page-aligned mapping start.
    pointer data_ = nullptr;
    size_type length_ = 0;
    // length_ plus the alignment padding in front of data_.
    size_type mapped_length_ = 0;
    file_handle_type file_handle_ = invalid_handle;
#ifdef _WIN32
    file_handle_type file_mapping_handle_ = invalid_handle;
#endif

public:
    file_mapping() = default;
    file_mapping(const file_mapping&) = delete;
    file_mapping& operator=(const file_mapping&) = delete;
    file_mapping(file_mapping&& other) noexcept;
    file_mapping& operator=(file_mapping&& other) noexcept;
    ~file_mapping() { unmap(); }

    [[nodiscard]] bool is_mapped() const noexcept { return data_ != nullptr; }
    [[nodiscard]] size_type length() const noexcept { return length_; }
    [[nodiscard]] size_type mapped_length() const noexcept { return mapped_length_; }
    [[nodiscard]] size_type mapping_offset() const noexcept { return mapped_length_ - length_; }

    [[nodiscard]] pointer data() noexcept
    {
        static_assert(AccessMode == access_mode::write, "non-const data() requires write access");
        return data_;
    }

    [[nodiscard]] const_pointer data() const noexcept { return data_; }

    /**
     * Maps `length` bytes of `handle` starting at `offset`.
     *
     * Error conditions:
     * - std::errc::bad_file_descriptor: invalid handle
     * - std::errc::invalid_argument: zero length, or the range extends past
     *   the current end of the file
     * - any error reported by fstat/mmap (or their Windows equivalents)
     *
     * On failure the object keeps whatever mapping it held before.
     */
    void map(file_handle_type handle, std::uint64_t offset, size_type length,
            std::error_code& error);

    /** Releases the mapping. No-op when nothing is mapped. */
    void unmap() noexcept;

    /**
     * Synchronously writes modified pages back to the file.
     *
     * POSIX: msync(MS_SYNC). Windows: FlushViewOfFile + FlushFileBuffers.
     */
    void sync(std::error_code& error);

private:
    [[nodiscard]] pointer get_mapping_start() const noexcept
    {
        return !data_ ? nullptr : data_ - mapping_offset();
    }
};

} // namespace detail

// -----------------------------------------------------------------------------
// mapped_view - shared read-only view
// -----------------------------------------------------------------------------

class mapped_view
{
    using mapping_type = detail::file_mapping<access_mode::read>;
    std::shared_ptr<const mapping_type> mapping_;

public:
    using value_type = char;
    using size_type = std::size_t;
    using const_reference = const char&;
    using const_pointer = const char*;
    using const_iterator = const_pointer;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    /** An empty view. */
    mapped_view() = default;

    explicit mapped_view(mapping_type&& mapping)
        : mapping_(std::make_shared<mapping_type>(std::move(mapping)))
    {}

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] size_type size() const noexcept { return mapping_ ? mapping_->length() : 0; }

    [[nodiscard]] const_pointer data() const noexcept
    {
        return mapping_ ? mapping_->data() : nullptr;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + size(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return begin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return end(); }
    [[nodiscard]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    [[nodiscard]] const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    /** No bounds checking. */
    [[nodiscard]] const_reference operator[](const size_type i) const noexcept { return data()[i]; }

    /** Number of views sharing this mapping (0 for an empty view). */
    [[nodiscard]] long use_count() const noexcept { return mapping_.use_count(); }

#if __cplusplus >= 202002L
    [[nodiscard]] std::span<const char> as_span() const noexcept { return {data(), size()}; }
#endif
};

// -----------------------------------------------------------------------------
// mutable_mapped_view - single-owner writable view
// -----------------------------------------------------------------------------

class mutable_mapped_view
{
    using mapping_type = detail::file_mapping<access_mode::write>;
    mapping_type mapping_;

public:
    using value_type = char;
    using size_type = std::size_t;
    using reference = char&;
    using const_reference = const char&;
    using pointer = char*;
    using const_pointer = const char*;
    using iterator = pointer;
    using const_iterator = const_pointer;

    mutable_mapped_view() = default;

    explicit mutable_mapped_view(mapping_type&& mapping) noexcept
        : mapping_(std::move(mapping))
    {}

    mutable_mapped_view(const mutable_mapped_view&) = delete;
    mutable_mapped_view& operator=(const mutable_mapped_view&) = delete;

    mutable_mapped_view(mutable_mapped_view&& other) noexcept = default;

    /** Flushes the mapping currently owned (see the destructor) before taking over `other`'s. */
    mutable_mapped_view& operator=(mutable_mapped_view&& other) noexcept;

    /**
     * Flushes the mapped pages back to the file, then unmaps them.
     *
     * A failed flush means writes made through the view may be torn or lost,
     * and there is no caller left to tell: it is logged and the process is
     * aborted.
     */
    ~mutable_mapped_view() { release(); }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] size_type size() const noexcept { return mapping_.length(); }

    [[nodiscard]] pointer data() noexcept { return mapping_.data(); }
    [[nodiscard]] const_pointer data() const noexcept { return mapping_.data(); }

    [[nodiscard]] iterator begin() noexcept { return data(); }
    [[nodiscard]] iterator end() noexcept { return data() + size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + size(); }

    /** No bounds checking. */
    [[nodiscard]] reference operator[](const size_type i) noexcept { return data()[i]; }
    [[nodiscard]] const_reference operator[](const size_type i) const noexcept { return data()[i]; }

#if __cplusplus >= 202002L
    [[nodiscard]] std::span<char> as_span() noexcept { return {data(), size()}; }
    [[nodiscard]] std::span<const char> as_span() const noexcept { return {data(), size()}; }
#endif

    /**
     * Flushes modified pages now, reporting failures to the caller.
     *
     * The destructor still flushes once more on release.
     */
    void sync(std::error_code& error) { mapping_.sync(error); }

private:
    void release() noexcept;
};

} // namespace randio

#include "randio/detail/mapping.ipp"

#endif // RANDIO_MAPPING_HEADER
