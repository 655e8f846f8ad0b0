#pragma once

#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace core {

// Coalesces concurrent calls that share a key: the first caller runs the
// work, later callers block on its result (or rethrow its exception). The
// entry is dropped as soon as the leader finishes, so subsequent calls start
// a new flight.
template <typename Value>
class SingleFlight {
public:
    template <typename Fn>
    Value run(const std::string& key, Fn&& work, bool* shared = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (auto it = inFlight_.find(key); it != inFlight_.end()) {
            auto future = it->second;
            lock.unlock();
            if (shared != nullptr) {
                *shared = true;
            }
            return future.get();
        }

        std::promise<Value> promise;
        inFlight_.emplace(key, promise.get_future().share());
        lock.unlock();
        if (shared != nullptr) {
            *shared = false;
        }

        try {
            Value value = std::forward<Fn>(work)();
            promise.set_value(value);
            finish(key);
            return value;
        } catch (...) {
            promise.set_exception(std::current_exception());
            finish(key);
            throw;
        }
    }

private:
    void finish(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(key);
    }

    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Value>> inFlight_;
};

}  // namespace core
