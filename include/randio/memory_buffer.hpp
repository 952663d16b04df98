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

#ifndef RANDIO_MEMORY_BUFFER_HEADER
#define RANDIO_MEMORY_BUFFER_HEADER

// -----------------------------------------------------------------------------
// memory_buffer.hpp - In-memory backend
// -----------------------------------------------------------------------------
//
// A growable byte vector with a cursor. It satisfies the readable and writable
// backend requirements, but has no OS handle and therefore cannot be mapped.
// Seeking past the end is allowed; writing there zero-fills the gap, so
// reserve_block behaves as it does on a sparse file.
//
// -----------------------------------------------------------------------------

#include "randio/access.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace randio {

class memory_buffer
{
    std::vector<char> data_;
    std::uint64_t position_ = 0;

public:
    memory_buffer() = default;

    explicit memory_buffer(std::vector<char> data) : data_(std::move(data)) {}

    explicit memory_buffer(std::string_view data) : data_(data.begin(), data.end()) {}

    [[nodiscard]] const std::vector<char>& data() const noexcept { return data_; }

    [[nodiscard]] std::uint64_t size() const noexcept { return data_.size(); }

    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }

    std::uint64_t seek(const std::int64_t offset, const seek_origin origin,
            std::error_code& error)
    {
        error.clear();
        std::uint64_t base = 0;
        if(origin == seek_origin::current) { base = position_; }
        else if(origin == seek_origin::end) { base = data_.size(); }

        if(offset < 0)
        {
            // Magnitude computed in unsigned arithmetic; -INT64_MIN overflows.
            const auto magnitude = static_cast<std::uint64_t>(-(offset + 1)) + 1;
            if(magnitude > base)
            {
                error = std::make_error_code(std::errc::invalid_argument);
                return 0;
            }
            position_ = base - magnitude;
        }
        else
        {
            position_ = base + static_cast<std::uint64_t>(offset);
        }
        return position_;
    }

    std::size_t read(char* buffer, const std::size_t size, std::error_code& error)
    {
        error.clear();
        if(position_ >= data_.size()) { return 0; }
        const auto available = static_cast<std::size_t>(data_.size() - position_);
        const auto count = std::min(size, available);
        std::memcpy(buffer, data_.data() + position_, count);
        position_ += count;
        return count;
    }

    /**
     * Writes all of `data` at the cursor, growing the buffer as needed.
     *
     * Growing the buffer may throw std::bad_alloc.
     */
    std::size_t write(const char* data, const std::size_t size, std::error_code& error)
    {
        error.clear();
        if(size == 0) { return 0; }
        if(position_ > std::numeric_limits<std::size_t>::max() - size)
        {
            error = std::make_error_code(std::errc::file_too_large);
            return 0;
        }
        const auto end = static_cast<std::size_t>(position_) + size;
        if(end > data_.size()) { data_.resize(end); }
        std::memcpy(data_.data() + position_, data, size);
        position_ = end;
        return size;
    }
};

} // namespace randio

#endif // RANDIO_MEMORY_BUFFER_HEADER
