#pragma once

#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <exception>
#include <filesystem>
#include <future>
#include <random>
#include <string>
#include <utility>

namespace rangefs::test {

// Helper to create a temp directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("rangefs_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

namespace detail {

template<typename T>
elio::coro::task<void> complete(elio::coro::task<T> task, std::promise<T>& done) {
    try {
        done.set_value(co_await std::move(task));
    } catch (...) {
        done.set_exception(std::current_exception());
    }
}

inline elio::coro::task<void> complete(elio::coro::task<void> task, std::promise<void>& done) {
    try {
        co_await std::move(task);
        done.set_value();
    } catch (...) {
        done.set_exception(std::current_exception());
    }
}

}  // namespace detail

// Runs a coroutine to completion on a one-thread scheduler and returns its
// result. Exceptions thrown inside the coroutine are rethrown here.
template<typename T>
T run_task(elio::coro::task<T> task, elio::io::io_context* io_ctx = nullptr) {
    elio::runtime::scheduler sched(1);
    if (io_ctx) {
        sched.set_io_context(io_ctx);
    }
    sched.start();

    std::promise<T> done;
    auto finished = done.get_future();
    auto wrapper = detail::complete(std::move(task), done);
    sched.spawn(wrapper.release());

    finished.wait();
    sched.shutdown();
    return finished.get();
}

// Runs a coroutine on a scheduler that is already started and blocks until
// it finishes. For tests that keep a server running beside the client.
template<typename T>
T run_on(elio::runtime::scheduler& sched, elio::coro::task<T> task) {
    std::promise<T> done;
    auto finished = done.get_future();
    auto wrapper = detail::complete(std::move(task), done);
    sched.spawn(wrapper.release());
    return finished.get();
}

}  // namespace rangefs::test
