#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace refnum {

/**
 * @brief Fixed-size worker pool for independent documents
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency())
        : stop_(false) {
        if (numThreads == 0) numThreads = 4;

        workers_.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        condition_.wait(lock, [this] {
                            return stop_ || !tasks_.empty();
                        });

                        if (stop_ && tasks_.empty()) {
                            return;
                        }

                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            });
        }
    }

    // Drains the queue before joining
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable
     * @return Future holding the result or the exception it threw
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {

        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    /**
     * @brief Apply f to every item concurrently; results keep input order
     *
     * Rethrows the first exception raised by f, after all items have finished.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F f)
        -> std::vector<typename std::invoke_result<F, const T&>::type> {

        using result_type = typename std::invoke_result<F, const T&>::type;

        std::vector<std::future<result_type>> futures;
        futures.reserve(items.size());
        for (const auto& item : items) {
            futures.push_back(enqueue([&f, &item]() { return f(item); }));
        }

        for (auto& future : futures) {
            future.wait();
        }

        std::vector<result_type> results;
        results.reserve(items.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace refnum
