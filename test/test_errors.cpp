#include <randio/randio.hpp>

#include <cassert>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Switches that make faulty_backend misbehave on demand, shared with the test
// after the backend has been moved into a rand file.
struct fault_plan
{
    bool throw_on_read = false;
    bool accept_nothing = false;
    std::error_code write_error;
};

// memory_buffer with injectable failures.
struct faulty_backend
{
    randio::memory_buffer inner;
    std::shared_ptr<fault_plan> plan;

    std::uint64_t seek(std::int64_t offset, randio::seek_origin origin, std::error_code& error)
    {
        return inner.seek(offset, origin, error);
    }

    std::size_t read(char* buffer, std::size_t size, std::error_code& error)
    {
        if(plan->throw_on_read) { throw std::runtime_error("device gone"); }
        return inner.read(buffer, size, error);
    }

    std::size_t write(const char* data, std::size_t size, std::error_code& error)
    {
        if(plan->write_error)
        {
            error = plan->write_error;
            return 0;
        }
        if(plan->accept_nothing)
        {
            error.clear();
            return 0;
        }
        return inner.write(data, size, error);
    }
};

struct captured_line
{
    randio::log::level level;
    std::string message;
};

bool contains(const std::vector<captured_line>& lines, randio::log::level level,
        std::string_view needle)
{
    for(const auto& line : lines)
    {
        if(line.level == level && line.message.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

int main()
{
    std::error_code error;

    std::vector<captured_line> lines;
    randio::log::set_sink([&lines](randio::log::level level, std::string_view message) {
        lines.push_back({level, std::string(message)});
    });

    // Backend errors are passed through untouched.
    {
        auto plan = std::make_shared<fault_plan>();
        auto file = randio::make_read_write(faulty_backend{randio::memory_buffer(), plan});
        assert(file.append_block("fine", error) == 0);
        assert(!error);

        plan->write_error = std::make_error_code(std::errc::no_space_on_device);
        file.append_block("full", error);
        assert(error == std::errc::no_space_on_device);
        file.update_block(0, "FINE", error);
        assert(error == std::errc::no_space_on_device);

        // A backend that accepts nothing cannot make progress.
        plan->write_error.clear();
        plan->accept_nothing = true;
        file.append_block("stuck", error);
        assert(error == randio::errc::short_write);
        file.reserve_block(8, error);
        assert(error == randio::errc::short_write);

        // An empty block needs no write at all.
        assert(file.append_block("", error) == 4);
        assert(!error);

        // The state is still healthy: these were reported failures, not
        // failures while holding the lock.
        plan->accept_nothing = false;
        assert(file.append_block("more", error) == 4);
        assert(!error);
    }

#ifdef __cpp_exceptions
    // A backend throwing while the lock is held poisons the rand file for
    // good, but leases taken before still release and fire their callbacks.
    {
        auto plan = std::make_shared<fault_plan>();
        auto file = randio::make_read_write(faulty_backend{randio::memory_buffer(), plan});
        file.append_block("data", error);

        int released = 0;
        auto lease = file.lock([&released] { ++released; }, error);
        assert(!error);

        plan->throw_on_read = true;
        bool thrown = false;
        try
        {
            char buffer[4];
            lease.read_block(0, buffer, sizeof(buffer), error);
        }
        catch(const std::runtime_error&)
        {
            thrown = true;
        }
        assert(thrown);
        assert(contains(lines, randio::log::level::error, "poisoned"));

        plan->throw_on_read = false;
        lease.append_block("x", error);
        assert(error == randio::errc::lock_failure);
        file.size(error);
        assert(error == randio::errc::lock_failure);

        auto refused = file.lock(nullptr, error);
        assert(error == randio::errc::lock_failure);
        assert(!refused.is_open());

        auto copy = lease;
        copy.reset();
        assert(released == 0);
        lease.reset();
        assert(released == 1);

        file.append_block("x", error);
        assert(error == randio::errc::lock_failure);

        bool system_error_thrown = false;
        try
        {
            file.append_block("x");
        }
        catch(const std::system_error& e)
        {
            system_error_thrown = e.code() == randio::errc::lock_failure;
        }
        assert(system_error_thrown);
    }
#endif

    // Opening files that cannot be opened.
    {
        randio::file_source source;
        source.open("garbage-that-hopefully-doesnt-exist", error);
        assert(error == std::errc::no_such_file_or_directory);
        assert(!source.is_open());

        source.open("", error);
        assert(error == std::errc::invalid_argument);
        assert(!source.is_open());

        char buffer[1];
        source.read(buffer, 1, error);
        assert(error == std::errc::bad_file_descriptor);
    }

    // Seeking before the start of an in-memory buffer.
    {
        randio::memory_buffer buffer(std::string_view("abc"));
        buffer.seek(-4, randio::seek_origin::end, error);
        assert(error == std::errc::invalid_argument);
        assert(buffer.seek(-3, randio::seek_origin::end, error) == 0);
        assert(!error);
        assert(buffer.seek(10, randio::seek_origin::current, error) == 10);
        char out[1];
        assert(buffer.read(out, 1, error) == 0);
        assert(!error);
    }

    // Debug logging traces the lease stack.
    {
        lines.clear();
        randio::log::set_level(randio::log::level::debug);
        {
            auto file = randio::make_read_write(randio::memory_buffer());
            auto locked = file.lock(nullptr, error);
            file.append_block("x", error);
            assert(error == randio::errc::generation_mismatch);
        }
        randio::log::set_level(randio::log::level::warn);
#ifndef RANDIO_DISABLE_DEBUG_LOG
        assert(contains(lines, randio::log::level::debug, "lease acquired, generation 1"));
        assert(contains(lines, randio::log::level::debug, "generation 0 rejected"));
        assert(contains(lines, randio::log::level::debug, "generation 1 released"));
#endif

        lines.clear();
        randio::log::debug("hidden");
        randio::log::warn("shown ", 42);
        assert(lines.size() == 1);
        assert(lines[0].level == randio::log::level::warn);
        assert(lines[0].message == "shown 42");
    }

    randio::log::set_sink(nullptr);

    std::printf("error tests passed!\n");
    return 0;
}
