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

#ifndef RANDIO_ERROR_HEADER
#define RANDIO_ERROR_HEADER

// -----------------------------------------------------------------------------
// error.hpp - Error codes reported by randio
// -----------------------------------------------------------------------------
//
// randio reports failures through std::error_code, the same way the mapping
// functions do. Conditions that originate in randio itself are enumerated in
// randio::errc and live in their own category ("randio"). Everything else is
// passed through untouched:
//
// - backend I/O failures (seek/read/write) carry the backend's own code,
//   usually std::system_category() for file backends;
// - mapping failures carry the platform's mmap/MapViewOfFile error, or
//   std::errc::invalid_argument for a range the file cannot satisfy;
// - operations on a moved-from handle report std::errc::bad_file_descriptor.
//
// Usage:
//   std::error_code ec;
//   file.append_block(data, size, ec);
//   if (ec == randio::errc::generation_mismatch) { retry_later(); }
//
// -----------------------------------------------------------------------------

#include <string>
#include <system_error>
#include <type_traits>

namespace randio {

enum class errc
{
    /// The handle is bound to a generation that is not the current one.
    generation_mismatch = 1,
    /// The state's mutex is unusable (a holder failed while holding it).
    lock_failure,
    /// The backend accepted zero bytes of a non-empty write.
    short_write,
};

namespace detail {

class error_category_impl : public std::error_category
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "randio"; }

    [[nodiscard]] std::string message(int value) const override
    {
        switch(static_cast<errc>(value))
        {
        case errc::generation_mismatch:
            return "rand file locked by another generation";
        case errc::lock_failure:
            return "rand file state lock failure";
        case errc::short_write:
            return "backend failed to write the whole block";
        }
        return "unknown randio error";
    }
};

} // namespace detail

/** Returns the singleton category for randio::errc values. */
[[nodiscard]] inline const std::error_category& error_category() noexcept
{
    static const detail::error_category_impl category;
    return category;
}

[[nodiscard]] inline std::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), error_category()};
}

} // namespace randio

namespace std {

template<>
struct is_error_code_enum<randio::errc> : true_type {};

} // namespace std

#endif // RANDIO_ERROR_HEADER
