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

#ifndef RANDIO_FILE_HEADER
#define RANDIO_FILE_HEADER

// -----------------------------------------------------------------------------
// file.hpp - Operating system file backend
// -----------------------------------------------------------------------------
//
// basic_file owns one OS file handle (a file descriptor on POSIX, a HANDLE on
// Windows) and exposes the seek/read/write/native_handle surface that
// basic_randfile expects from a backend. Because it carries a real handle it
// is also mappable, so rand files built on it can hand out mapped views.
//
//   file_source  opened read-only; readable backend
//   file_sink    opened read-write; readable and writable backend
//
// Usage:
//   std::error_code ec;
//   randio::file_sink sink;
//   sink.open("data.d4", randio::open_options{true, true}, ec);
//   if (ec) { handle_error(ec); }
//   auto file = randio::make_read_write(std::move(sink));
//
// Thread safety:
//   A basic_file is not synchronized. Once wrapped in a rand file, every call
//   is made with the rand file's mutex held.
//
// -----------------------------------------------------------------------------

#include "randio/access.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <type_traits>
#include <utility>

#ifndef _WIN32
# include <cerrno>
# include <fcntl.h>
# include <sys/stat.h>
# include <sys/types.h>
# include <unistd.h>
#endif

namespace randio {

/** How basic_file::open() treats the path. */
struct open_options
{
    /// Create the file if it does not exist (write mode only).
    bool create = false;
    /// Discard existing contents (write mode only).
    bool truncate = false;
    /// Permission bits for newly created files (POSIX only).
    unsigned int permissions = 0644;
};

namespace detail {

/**
 * Returns the last system error as a std::error_code.
 *
 * Must be called right after the failing system call, before anything else
 * can overwrite errno / GetLastError().
 */
inline std::error_code last_error() noexcept
{
    std::error_code error;
#ifdef _WIN32
    error.assign(static_cast<int>(GetLastError()), std::system_category());
#else
    error.assign(errno, std::system_category());
#endif
    return error;
}

inline file_handle_type open_file(const std::filesystem::path& path,
        const access_mode mode, const open_options& options, std::error_code& error)
{
    error.clear();

    if(path.empty())
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return invalid_handle;
    }

#ifdef _WIN32
    DWORD disposition = OPEN_EXISTING;
    if(mode == access_mode::write)
    {
        if(options.create && options.truncate) { disposition = CREATE_ALWAYS; }
        else if(options.create) { disposition = OPEN_ALWAYS; }
        else if(options.truncate) { disposition = TRUNCATE_EXISTING; }
    }
    const auto handle = ::CreateFileW(
            path.c_str(),
            mode == access_mode::read ? GENERIC_READ : GENERIC_READ | GENERIC_WRITE,
            FILE_SHARE_READ | FILE_SHARE_WRITE,
            0,
            disposition,
            FILE_ATTRIBUTE_NORMAL,
            0);
#else // POSIX
    int flags = O_RDONLY;
    if(mode == access_mode::write)
    {
        // Mappings of the file need read access as well.
        flags = O_RDWR;
        if(options.create) { flags |= O_CREAT; }
        if(options.truncate) { flags |= O_TRUNC; }
    }
    int handle;
    do {
        handle = ::open(path.c_str(), flags | O_CLOEXEC,
                static_cast<mode_t>(options.permissions));
    } while(handle == invalid_handle && errno == EINTR);
#endif

    if(handle == invalid_handle)
    {
        error = detail::last_error();
    }
    return handle;
}

inline void close_file(const file_handle_type handle) noexcept
{
    if(handle == invalid_handle) { return; }
#ifdef _WIN32
    ::CloseHandle(handle);
#else
    ::close(handle);
#endif
}

inline std::uint64_t query_file_size(const file_handle_type handle, std::error_code& error)
{
    error.clear();

#ifdef _WIN32
    LARGE_INTEGER file_size;
    if(::GetFileSizeEx(handle, &file_size) == 0)
    {
        error = detail::last_error();
        return 0;
    }
    return static_cast<std::uint64_t>(file_size.QuadPart);
#else // POSIX
    struct stat sbuf;
    if(::fstat(handle, &sbuf) == -1)
    {
        error = detail::last_error();
        return 0;
    }
    return static_cast<std::uint64_t>(sbuf.st_size);
#endif
}

} // namespace detail

/**
 * RAII owner of an operating system file handle.
 *
 * @tparam AccessMode `access_mode::read` opens read-only and omits write();
 *                    `access_mode::write` opens read-write.
 *
 * Move-only. The handle is closed on destruction.
 */
template<access_mode AccessMode>
class basic_file
{
    file_handle_type handle_ = invalid_handle;

public:
    basic_file() = default;

#ifdef __cpp_exceptions
    /**
     * Opens `path`. Throws std::system_error on failure.
     */
    explicit basic_file(const std::filesystem::path& path, const open_options& options = {})
    {
        std::error_code error;
        open(path, options, error);
        if(error) { throw std::system_error(error); }
    }
#endif // __cpp_exceptions

    /** Adopts an already opened handle. The handle is closed by this object. */
    explicit basic_file(const file_handle_type handle) noexcept : handle_(handle) {}

    basic_file(const basic_file&) = delete;
    basic_file& operator=(const basic_file&) = delete;

    basic_file(basic_file&& other) noexcept
        : handle_(std::exchange(other.handle_, invalid_handle))
    {}

    basic_file& operator=(basic_file&& other) noexcept
    {
        if(this != &other)
        {
            close();
            handle_ = std::exchange(other.handle_, invalid_handle);
        }
        return *this;
    }

    ~basic_file() { close(); }

    /**
     * Opens `path`, closing any file held before, but only once the new
     * file was opened successfully.
     */
    void open(const std::filesystem::path& path, const open_options& options,
            std::error_code& error)
    {
        const auto handle = detail::open_file(path, AccessMode, options, error);
        if(error) { return; }
        close();
        handle_ = handle;
    }

    void open(const std::filesystem::path& path, std::error_code& error)
    {
        open(path, open_options{}, error);
    }

    /** Closes the handle. Errors from the close call are not reported. */
    void close() noexcept
    {
        detail::close_file(handle_);
        handle_ = invalid_handle;
    }

    [[nodiscard]] bool is_open() const noexcept { return handle_ != invalid_handle; }

    [[nodiscard]] file_handle_type native_handle() const noexcept { return handle_; }

    /** Current length of the file in bytes. */
    [[nodiscard]] std::uint64_t file_size(std::error_code& error) const
    {
        return detail::query_file_size(handle_, error);
    }

    /**
     * Moves the file cursor and returns its new absolute position.
     *
     * Seeking past the end is allowed; a later write extends the file.
     */
    std::uint64_t seek(const std::int64_t offset, const seek_origin origin,
            std::error_code& error)
    {
        error.clear();
        if(!is_open())
        {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            return 0;
        }
#ifdef _WIN32
        DWORD method = FILE_BEGIN;
        if(origin == seek_origin::current) { method = FILE_CURRENT; }
        else if(origin == seek_origin::end) { method = FILE_END; }
        LARGE_INTEGER distance;
        distance.QuadPart = offset;
        LARGE_INTEGER position;
        if(::SetFilePointerEx(handle_, distance, &position, method) == 0)
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::uint64_t>(position.QuadPart);
#else
        int whence = SEEK_SET;
        if(origin == seek_origin::current) { whence = SEEK_CUR; }
        else if(origin == seek_origin::end) { whence = SEEK_END; }
        const off_t position = ::lseek(handle_, static_cast<off_t>(offset), whence);
        if(position == static_cast<off_t>(-1))
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::uint64_t>(position);
#endif
    }

    /**
     * Reads at most `size` bytes at the cursor. Returns 0 at end of file.
     */
    std::size_t read(char* buffer, const std::size_t size, std::error_code& error)
    {
        error.clear();
        if(!is_open())
        {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            return 0;
        }
#ifdef _WIN32
        const DWORD chunk = size > MAXDWORD ? MAXDWORD : static_cast<DWORD>(size);
        DWORD bytes_read = 0;
        if(::ReadFile(handle_, buffer, chunk, &bytes_read, 0) == 0)
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::size_t>(bytes_read);
#else
        ssize_t bytes_read;
        do {
            bytes_read = ::read(handle_, buffer, size);
        } while(bytes_read == -1 && errno == EINTR);
        if(bytes_read == -1)
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::size_t>(bytes_read);
#endif
    }

    /**
     * Writes at most `size` bytes at the cursor and returns how many were
     * accepted. Only available for write access.
     */
    template<access_mode A = AccessMode,
        std::enable_if_t<A == access_mode::write, int> = 0>
    std::size_t write(const char* data, const std::size_t size, std::error_code& error)
    {
        error.clear();
        if(!is_open())
        {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            return 0;
        }
#ifdef _WIN32
        const DWORD chunk = size > MAXDWORD ? MAXDWORD : static_cast<DWORD>(size);
        DWORD bytes_written = 0;
        if(::WriteFile(handle_, data, chunk, &bytes_written, 0) == 0)
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::size_t>(bytes_written);
#else
        ssize_t bytes_written;
        do {
            bytes_written = ::write(handle_, data, size);
        } while(bytes_written == -1 && errno == EINTR);
        if(bytes_written == -1)
        {
            error = detail::last_error();
            return 0;
        }
        return static_cast<std::size_t>(bytes_written);
#endif
    }
};

/// Read-only file backend.
using file_source = basic_file<access_mode::read>;

/// Read-write file backend.
using file_sink = basic_file<access_mode::write>;

} // namespace randio

#endif // RANDIO_FILE_HEADER
