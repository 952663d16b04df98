#include <randio/randio.hpp>

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using rw_file = randio::read_write_randfile<randio::file_sink>;

// Printable ASCII pattern, as used to check page-alignment handling.
std::string make_pattern(const size_t size)
{
    std::string buffer(size, 0);
    char v = 33;
    for(auto& b : buffer)
    {
        b = v;
        ++v;
        v %= 126;
        if(v == 0) { v = 33; }
    }
    return buffer;
}

template<class View>
void check_view(const View& view, const std::string& buffer, const size_t offset)
{
    assert(view.size() == buffer.size() - offset);
    for(size_t i = 0; i < view.size(); ++i)
    {
        if(view[i] != buffer[offset + i])
        {
            std::printf("%zuth byte mismatch: expected(%d) <> actual(%d)\n",
                    offset + i, buffer[offset + i], view[i]);
            assert(0);
        }
    }
}

rw_file open_fresh(const std::filesystem::path& path)
{
    std::error_code error;
    randio::file_sink sink;
    sink.open(path, randio::open_options{true, true}, error);
    assert(!error);
    return randio::make_read_write(std::move(sink));
}

int main()
{
    std::error_code error;
    const std::filesystem::path path = "randio-mapping-test-file";

    const auto page_size = randio::page_size();
    const auto buffer = make_pattern(4 * page_size - 250);

    // Read-only views at aligned and unaligned offsets.
    {
        auto file = open_fresh(path);
        assert(file.append_block(buffer, error) == 0);
        assert(!error);

        for(const size_t offset : {size_t{0}, page_size - 3, page_size + 3, 2 * page_size + 3})
        {
            auto view = file.map_read_only(offset, buffer.size() - offset, error);
            assert(!error);
            assert(!view.empty());
            check_view(view, buffer, offset);
        }
    }

    // Copies of a read-only view share one mapping that outlives the handle.
    {
        randio::mapped_view copy;
        {
            auto file = randio::make_read_only(randio::file_source(path));
            auto view = file.map_read_only(0, buffer.size(), error);
            assert(!error);
            assert(view.use_count() == 1);
            copy = view;
            assert(view.use_count() == 2);
            assert(copy.data() == view.data());
        }
        assert(copy.use_count() == 1);
        check_view(copy, buffer, 0);
        assert(std::equal(copy.begin(), copy.end(), buffer.begin()));
    }

    // Mapping ignores leases: a superseded handle can still map, and a view
    // does not stop new leases or writes.
    {
        auto file = open_fresh(path);
        file.append_block("0123456789", error);
        bool released = false;
        {
            auto locked = file.lock([&released] { released = true; }, error);
            auto view = file.map_read_only(2, 4, error);
            assert(!error);
            assert(std::string_view(view.data(), view.size()) == "2345");

            auto nested = locked.lock(nullptr, error);
            assert(!error);
            nested.append_block("abc", error);
            assert(!error);
        }
        assert(released);
    }

    // Writes through a mutable view reach the file when the view goes away.
    {
        auto file = open_fresh(path);
        file.append_block("header", error);
        const auto address = file.reserve_block(page_size + 10, error);
        assert(!error);
        {
            auto view = file.map_mutable(address, page_size + 10, error);
            assert(!error);
            assert(view.size() == page_size + 10);
            std::fill(view.begin(), view.end(), 'm');
            view[0] = '[';
            view[view.size() - 1] = ']';
        }
        std::string readback(page_size + 10, '\0');
        assert(file.read_block(address, readback.data(), readback.size(), error) == readback.size());
        assert(!error);
        assert(readback.front() == '[');
        assert(readback.back() == ']');
        assert(std::count(readback.begin(), readback.end(), 'm')
                == static_cast<std::ptrdiff_t>(page_size + 8));

        // The bytes before the block are untouched.
        char head[6];
        assert(file.read_block(0, head, sizeof(head), error) == 6);
        assert(std::string_view(head, 6) == "header");
    }

    // Explicit sync, and flushing of the mapping a view gives up on move-assign.
    {
        auto file = open_fresh(path);
        file.append_block("aaaabbbb", error);
        auto first = file.map_mutable(0, 4, error);
        assert(!error);
        first[0] = 'A';
        first.sync(error);
        assert(!error);

        first = file.map_mutable(4, 4, error);
        assert(!error);
        first[0] = 'B';

        char buffer[8];
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 8);
        assert(buffer[0] == 'A');

        first = randio::mutable_mapped_view();
        assert(first.empty());
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 8);
        assert(std::string_view(buffer, 8) == "AaaaBbbb");
    }

    // Ranges the file cannot satisfy are rejected.
    {
        auto file = open_fresh(path);
        file.append_block("short", error);

        auto empty = file.map_read_only(0, 0, error);
        assert(error == std::errc::invalid_argument);
        assert(empty.empty());

        auto past_end = file.map_read_only(3, 10, error);
        assert(error == std::errc::invalid_argument);
        assert(past_end.empty());

        auto far_away = file.map_mutable(100 * page_size, 1, error);
        assert(error == std::errc::invalid_argument);
        assert(far_away.empty());

        rw_file closed;
        auto none = closed.map_read_only(0, 1, error);
        assert(error == std::errc::bad_file_descriptor);
        assert(none.empty());
    }

#ifdef __cpp_exceptions
    {
        auto file = open_fresh(path);
        file.append_block("throwing");
        auto view = file.map_read_only(0, 8);
        assert(std::string_view(view.data(), view.size()) == "throwing");

        bool thrown = false;
        try
        {
            auto bad = file.map_mutable(4, 100);
            (void)bad;
        }
        catch(const std::system_error& e)
        {
            thrown = e.code() == std::errc::invalid_argument;
        }
        assert(thrown);
    }
#endif

    std::filesystem::remove(path);

    std::printf("mapping tests passed!\n");
    return 0;
}
