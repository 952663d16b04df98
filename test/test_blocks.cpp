#include <randio/randio.hpp>

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

// Appends a sequence of blocks and checks that each lands right after the
// previous one and reads back unchanged.
template<class RandFile>
void test_append_sequence(RandFile& file, std::uint64_t base)
{
    std::error_code error;
    const std::vector<std::string> blocks = {
        "This is a test block", "", "x", std::string(5000, 'q'), "tail"
    };

    std::vector<std::uint64_t> addresses;
    std::uint64_t expected = base;
    for(const auto& block : blocks)
    {
        const auto address = file.append_block(block, error);
        assert(!error);
        assert(address == expected);
        addresses.push_back(address);
        expected += block.size();
    }
    assert(file.size(error) == expected);

    for(size_t i = 0; i < blocks.size(); ++i)
    {
        std::string buffer(blocks[i].size(), '\0');
        const auto n = file.read_block(addresses[i], buffer.data(), buffer.size(), error);
        assert(!error);
        assert(n == blocks[i].size());
        assert(buffer == blocks[i]);
    }
}

// Short reads return what is there: min(L, N - address).
template<class RandFile>
void test_short_reads(RandFile& file)
{
    std::error_code error;
    const auto length = file.size(error);
    assert(!error);

    char buffer[64];
    for(std::uint64_t address : {std::uint64_t{0}, length / 2, length - 1, length, length + 10})
    {
        const auto n = file.read_block(address, buffer, sizeof(buffer), error);
        assert(!error);
        const auto remaining = address >= length ? 0 : length - address;
        assert(n == std::min<std::uint64_t>(sizeof(buffer), remaining));
    }
}

int main()
{
    std::error_code error;

    // Appending "abc" then "de" and reading five bytes back.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        assert(file.append_block("abc", error) == 0);
        assert(!error);
        assert(file.append_block("de", error) == 3);
        assert(!error);

        char buffer[5];
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 5);
        assert(!error);
        assert(std::string_view(buffer, 5) == "abcde");
    }

    // Reserving a block and filling it in later.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        file.append_block("head", error);
        const auto address = file.reserve_block(4, error);
        assert(!error);
        assert(address == 4);
        assert(file.size(error) == 8);

        // Later appends go after the reserved space.
        assert(file.append_block("more", error) == 8);

        file.update_block(address, "WXYZ", error);
        assert(!error);

        char buffer[4];
        assert(file.read_block(address, buffer, sizeof(buffer), error) == 4);
        assert(std::string_view(buffer, 4) == "WXYZ");
    }

    // Reserved space reads back as zeros until it is updated.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        const auto address = file.reserve_block(16, error);
        assert(!error);
        assert(address == 0);
        char buffer[16];
        assert(file.read_block(0, buffer, sizeof(buffer), error) == 16);
        assert(std::all_of(buffer, buffer + 16, [](char c) { return c == 0; }));

        // A zero-sized reservation changes nothing.
        assert(file.reserve_block(0, error) == 16);
        assert(!error);
        assert(file.size(error) == 16);
    }

    // Addresses accumulate across appends and reservations.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        test_append_sequence(file, 0);
        const auto size = file.size(error);
        const auto reserved = file.reserve_block(100, error);
        assert(reserved == size);
        test_append_sequence(file, size + 100);
        test_short_reads(file);
    }

    // Copies share the backend; the original may go away first.
    {
        auto original = randio::make_read_write(randio::memory_buffer());
        original.append_block("shared", error);
        auto copy = original;
        original = decltype(original)();
        assert(!original.is_open());

        assert(copy.append_block("!", error) == 6);
        assert(!error);
        char buffer[7];
        assert(copy.read_block(0, buffer, sizeof(buffer), error) == 7);
        assert(std::string_view(buffer, 7) == "shared!");
    }

    // The same operations on a real file.
    {
        const std::filesystem::path path = "randio-blocks-test-file";
        {
            randio::file_sink sink;
            sink.open(path, randio::open_options{true, true}, error);
            assert(!error);
            auto file = randio::make_read_write(std::move(sink));

            test_append_sequence(file, 0);
            const auto directory = file.reserve_block(8, error);
            assert(!error);
            file.update_block(directory, "DIRBLOCK", error);
            assert(!error);
            test_short_reads(file);
        }

        // Reopen read-only and check the content survived.
        {
            auto file = randio::make_read_only(randio::file_source(path));
            const auto size = file.size(error);
            assert(!error);
            char buffer[8];
            assert(file.read_block(size - 8, buffer, sizeof(buffer), error) == 8);
            assert(std::string_view(buffer, 8) == "DIRBLOCK");
        }
        std::filesystem::remove(path);
    }

    // Concurrent appends through copies of one handle never overlap.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        constexpr int threads = 4;
        constexpr int per_thread = 250;

        std::vector<std::thread> workers;
        std::vector<std::vector<std::uint64_t>> addresses(threads);
        for(int t = 0; t < threads; ++t)
        {
            workers.emplace_back([file, t, &addresses]() mutable {
                const std::string block(8, static_cast<char>('a' + t));
                std::error_code ec;
                for(int i = 0; i < per_thread; ++i)
                {
                    addresses[t].push_back(file.append_block(block, ec));
                    assert(!ec);
                }
            });
        }
        for(auto& worker : workers) { worker.join(); }

        assert(file.size(error) == threads * per_thread * 8);
        for(int t = 0; t < threads; ++t)
        {
            for(const auto address : addresses[t])
            {
                assert(address % 8 == 0);
                char buffer[8];
                assert(file.read_block(address, buffer, sizeof(buffer), error) == 8);
                assert(std::all_of(buffer, buffer + 8,
                        [t](char c) { return c == static_cast<char>('a' + t); }));
            }
        }
    }

#ifdef __cpp_exceptions
    // Throwing overloads.
    {
        auto file = randio::make_read_write(randio::memory_buffer());
        assert(file.append_block("abc") == 0);
        assert(file.reserve_block(2) == 3);
        file.update_block(3, "de");
        char buffer[5];
        assert(file.read_block(0, buffer, sizeof(buffer)) == 5);
        assert(std::string_view(buffer, 5) == "abcde");
        assert(file.size() == 5);
    }
#endif

    std::printf("block tests passed!\n");
    return 0;
}
