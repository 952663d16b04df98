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

#ifndef RANDIO_RANDFILE_IMPL
#define RANDIO_RANDFILE_IMPL

// -----------------------------------------------------------------------------
// randfile.ipp - Block operations and lease acquisition of basic_randfile
// -----------------------------------------------------------------------------
//
// Every block operation follows the same shape:
//   1. take the state's accessor (mutex + poison check),
//   2. try_use() the handle's generation,
//   3. perform exactly the seeks and reads/writes it needs,
//   4. drop the accessor before returning.
//
// -----------------------------------------------------------------------------

#include "randio/randfile.hpp"

#include <limits>

namespace randio {
namespace detail {

/** Converts an absolute address into a seek offset, rejecting values seek() cannot express. */
inline std::int64_t to_seek_offset(const std::uint64_t address, std::error_code& error) noexcept
{
    if(address > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return 0;
    }
    return static_cast<std::int64_t>(address);
}

/** Writes all of `data`, looping over partial writes. */
template<typename Backend>
void write_all(Backend& backend, const char* data, std::size_t length, std::error_code& error)
{
    error.clear();
    while(length > 0)
    {
        const auto written = backend.write(data, length, error);
        if(error) { return; }
        if(written == 0)
        {
            error = errc::short_write;
            return;
        }
        data += written;
        length -= written;
    }
}

} // namespace detail

template<typename Mode, typename Backend>
typename basic_randfile<Mode, Backend>::size_type
basic_randfile<Mode, Backend>::size_impl(std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return 0; }
    auto* backend = access.try_use(generation_, error);
    if(!backend) { return 0; }

    return backend->seek(0, seek_origin::end, error);
}

template<typename Mode, typename Backend>
std::size_t basic_randfile<Mode, Backend>::read_block_impl(const size_type address,
        char* buffer, const std::size_t length, std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return 0; }
    auto* backend = access.try_use(generation_, error);
    if(!backend) { return 0; }

    const auto offset = detail::to_seek_offset(address, error);
    if(error) { return 0; }
    backend->seek(offset, seek_origin::begin, error);
    if(error) { return 0; }

    std::size_t total = 0;
    while(total < length)
    {
        const auto bytes_read = backend->read(buffer + total, length - total, error);
        if(error) { return 0; }
        if(bytes_read == 0) { break; }
        total += bytes_read;
    }
    return total;
}

template<typename Mode, typename Backend>
typename basic_randfile<Mode, Backend>::size_type
basic_randfile<Mode, Backend>::append_block_impl(const char* data, const std::size_t length,
        std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return 0; }
    auto* backend = access.try_use(generation_, error);
    if(!backend) { return 0; }

    const auto address = backend->seek(0, seek_origin::end, error);
    if(error) { return 0; }
    detail::write_all(*backend, data, length, error);
    if(error) { return 0; }
    return address;
}

template<typename Mode, typename Backend>
void basic_randfile<Mode, Backend>::update_block_impl(const size_type offset,
        const char* data, const std::size_t length, std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return; }
    auto* backend = access.try_use(generation_, error);
    if(!backend) { return; }

    const auto position = detail::to_seek_offset(offset, error);
    if(error) { return; }
    backend->seek(position, seek_origin::begin, error);
    if(error) { return; }
    detail::write_all(*backend, data, length, error);
}

template<typename Mode, typename Backend>
typename basic_randfile<Mode, Backend>::size_type
basic_randfile<Mode, Backend>::reserve_block_impl(const std::size_t size, std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return 0; }
    auto* backend = access.try_use(generation_, error);
    if(!backend) { return 0; }

    const auto address = backend->seek(0, seek_origin::end, error);
    if(error || size == 0) { return address; }

    // Place the cursor on the last reserved byte and write it, so the
    // backend grows by exactly `size` bytes.
    const auto max_offset = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if(address > max_offset || size - 1 > max_offset - address)
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return 0;
    }
    backend->seek(static_cast<std::int64_t>(address + (size - 1)), seek_origin::begin, error);
    if(error) { return 0; }
    const char zero = 0;
    detail::write_all(*backend, &zero, 1, error);
    if(error) { return 0; }
    return address;
}

template<typename Mode, typename Backend>
template<access_mode AccessMode>
detail::file_mapping<AccessMode> basic_randfile<Mode, Backend>::map_impl(const size_type offset,
        const std::size_t size, std::error_code& error) const
{
    detail::file_mapping<AccessMode> mapping;
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return mapping;
    }
    // The lock only covers creating the mapping; the view then lives on its
    // own and is not subject to the generation check.
    typename state_type::accessor access(*state_, error);
    if(!access) { return mapping; }
    mapping.map(access.backend().native_handle(), offset, size, error);
    return mapping;
}

template<typename Mode, typename Backend>
basic_randfile<Mode, Backend> basic_randfile<Mode, Backend>::lock(release_callback on_release,
        std::error_code& error)
{
    if(!state_)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return {};
    }
    typename state_type::accessor access(*state_, error);
    if(!access) { return {}; }
    const auto generation = access.acquire_lease(std::move(on_release));
    return basic_randfile(state_, generation);
}

} // namespace randio

#endif // RANDIO_RANDFILE_IMPL
