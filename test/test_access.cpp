#include <randio/randio.hpp>

#include <cassert>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

// Detection of member operations, used to prove which operations a handle
// type offers without trying to compile the missing ones.
template<typename T, typename = void>
struct has_append_block : std::false_type {};

template<typename T>
struct has_append_block<T, std::void_t<decltype(std::declval<T&>().append_block(
        std::declval<std::string_view>(), std::declval<std::error_code&>()))>>
    : std::true_type {};

template<typename T, typename = void>
struct has_reserve_block : std::false_type {};

template<typename T>
struct has_reserve_block<T, std::void_t<decltype(std::declval<T&>().reserve_block(
        std::size_t{}, std::declval<std::error_code&>()))>>
    : std::true_type {};

template<typename T, typename = void>
struct has_read_block : std::false_type {};

template<typename T>
struct has_read_block<T, std::void_t<decltype(std::declval<T&>().read_block(
        std::uint64_t{}, std::declval<char*>(), std::size_t{},
        std::declval<std::error_code&>()))>>
    : std::true_type {};

template<typename T, typename = void>
struct has_map_read_only : std::false_type {};

template<typename T>
struct has_map_read_only<T, std::void_t<decltype(std::declval<const T&>().map_read_only(
        std::uint64_t{}, std::size_t{}, std::declval<std::error_code&>()))>>
    : std::true_type {};

template<typename T, typename = void>
struct has_map_mutable : std::false_type {};

template<typename T>
struct has_map_mutable<T, std::void_t<decltype(std::declval<T&>().map_mutable(
        std::uint64_t{}, std::size_t{}, std::declval<std::error_code&>()))>>
    : std::true_type {};

// A backend that can only be read from.
struct read_only_backend
{
    std::uint64_t seek(std::int64_t, randio::seek_origin, std::error_code& error)
    {
        error.clear();
        return 0;
    }

    std::size_t read(char*, std::size_t, std::error_code& error)
    {
        error.clear();
        return 0;
    }
};

// Not a backend at all: cannot seek.
struct stream_only
{
    std::size_t read(char*, std::size_t, std::error_code&) { return 0; }
};

using randio::read_only;
using randio::read_write;
using randio::memory_buffer;
using randio::file_source;
using randio::file_sink;

// Backend detection.
static_assert(randio::is_readable_backend_v<memory_buffer>);
static_assert(randio::is_writable_backend_v<memory_buffer>);
static_assert(!randio::is_mappable_backend_v<memory_buffer>);
static_assert(randio::is_readable_backend_v<file_source>);
static_assert(!randio::is_writable_backend_v<file_source>);
static_assert(randio::is_mappable_backend_v<file_source>);
static_assert(randio::is_writable_backend_v<file_sink>);
static_assert(randio::is_mappable_backend_v<file_sink>);
static_assert(randio::is_readable_backend_v<read_only_backend>);
static_assert(!randio::is_writable_backend_v<read_only_backend>);
static_assert(!randio::is_readable_backend_v<stream_only>);

// Capability predicates.
static_assert(randio::can_read_v<read_only, memory_buffer>);
static_assert(randio::can_read_v<read_write, memory_buffer>);
static_assert(!randio::can_write_v<read_only, memory_buffer>);
static_assert(randio::can_write_v<read_write, memory_buffer>);
static_assert(!randio::can_write_v<read_write, file_source>);
static_assert(!randio::can_write_v<read_write, read_only_backend>);
static_assert(!randio::can_read_v<read_only, stream_only>);

// Tags are pure markers.
static_assert(std::is_empty_v<read_only>);
static_assert(std::is_empty_v<read_write>);

// Operation sets per handle type.
using ro_memory = randio::read_only_randfile<memory_buffer>;
using rw_memory = randio::read_write_randfile<memory_buffer>;
using ro_file = randio::read_only_randfile<file_source>;
using rw_file = randio::read_write_randfile<file_sink>;
using ro_custom = randio::read_only_randfile<read_only_backend>;

static_assert(has_read_block<ro_memory>::value);
static_assert(!has_append_block<ro_memory>::value);
static_assert(!has_reserve_block<ro_memory>::value);
static_assert(has_append_block<rw_memory>::value);
static_assert(has_reserve_block<rw_memory>::value);
static_assert(has_read_block<rw_memory>::value);
static_assert(!has_map_read_only<rw_memory>::value);
static_assert(!has_map_mutable<rw_memory>::value);

static_assert(has_map_read_only<ro_file>::value);
static_assert(!has_map_mutable<ro_file>::value);
static_assert(!has_append_block<ro_file>::value);
static_assert(has_map_read_only<rw_file>::value);
static_assert(has_map_mutable<rw_file>::value);
static_assert(has_append_block<rw_file>::value);

static_assert(has_read_block<ro_custom>::value);
static_assert(!has_append_block<ro_custom>::value);

// Handles are copyable, views follow their ownership model.
static_assert(std::is_copy_constructible_v<rw_memory>);
static_assert(std::is_nothrow_move_constructible_v<rw_memory>);
static_assert(std::is_copy_constructible_v<randio::mapped_view>);
static_assert(!std::is_copy_constructible_v<randio::mutable_mapped_view>);
static_assert(std::is_nothrow_move_constructible_v<randio::mutable_mapped_view>);

int main()
{
    std::error_code error;

    // A read-only handle over a prefilled buffer can read but never write.
    {
        auto file = randio::make_read_only(memory_buffer(std::string_view("hello")));
        assert(file.size(error) == 5);
        assert(!error);

        char buffer[5] = {};
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 5);
        assert(!error);
        assert(std::string_view(buffer, 5) == "hello");
    }

    // A user-defined backend works through the same interface.
    {
        auto file = randio::make_read_only(read_only_backend());
        char buffer[4];
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 0);
        assert(!error);
    }

    // Empty handles report a closed descriptor.
    {
        rw_memory file;
        assert(!file.is_open());
        file.append_block("x", error);
        assert(error == std::errc::bad_file_descriptor);
    }

    std::printf("access tests passed!\n");
    return 0;
}
