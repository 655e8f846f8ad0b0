#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace core {

// Fixed-size pool for blocking upstream fetches. Tasks report through
// std::future so exceptions cross back to the submitting thread.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads) : threads_(threads == 0 ? 1 : threads), pool_(threads_) {}

    ~WorkerPool() { pool_.join(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        return future;
    }

    std::size_t size() const noexcept { return threads_; }

private:
    std::size_t threads_;
    boost::asio::thread_pool pool_;
};

}  // namespace core
