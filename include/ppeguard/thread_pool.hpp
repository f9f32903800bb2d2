#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace ppeguard {

// Fixed worker pool over a bounded FIFO queue. Submission never blocks: a full
// queue rejects the task. With a single worker, tasks run in submission order.
class ThreadPool {
public:
    ThreadPool(std::size_t n, std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
        if (n == 0) n = 1;
        workers_.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    Task task;
                    {
                        std::unique_lock<std::mutex> lk(m_);
                        cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
                        if (stop_ && q_.empty()) return;
                        task = std::move(q_.front());
                        q_.pop();
                        ++active_;
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lk(m_);
                        --active_;
                    }
                    idle_cv_.notify_all();
                }
            });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() { shutdown(); }

    // Returns std::nullopt when the queue is full or the pool is shutting down.
    template<class F, class... Args>
    auto trySubmit(F&& f, Args&&... args)
        -> std::optional<std::future<std::invoke_result_t<F, Args...>>> {
        using R = std::invoke_result_t<F, Args...>;
        auto p = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_ || q_.size() >= capacity_) {
                ++rejected_;
                return std::nullopt;
            }
            q_.emplace([p]{ (*p)(); });
        }
        cv_.notify_one();
        return p->get_future();
    }

    // Blocks until every queued and running task has finished.
    void waitIdle() {
        std::unique_lock<std::mutex> lk(m_);
        idle_cv_.wait(lk, [this] { return q_.empty() && active_ == 0; });
    }

    // Runs the remaining queue to completion, then joins the workers.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
        }
        cv_.notify_all();
        for (auto &t : workers_) if (t.joinable()) t.join();
        workers_.clear();
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    std::size_t rejected() const {
        std::lock_guard<std::mutex> lk(m_);
        return rejected_;
    }

    std::size_t capacity() const { return capacity_; }

private:
    using Task = std::function<void()>;
    std::vector<std::thread> workers_;
    std::queue<Task> q_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::size_t capacity_;
    std::size_t active_{0};
    std::size_t rejected_{0};
    bool stop_{false};
};

} // namespace ppeguard
