#pragma once

// ============================================================
// thread_pool.hpp -- Bounded worker pool for transfer batches
// ============================================================

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO of void tasks. wait() blocks until
// every submitted task has run and rethrows the first exception a task let
// escape; later ones are dropped.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { run(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stop_ = true;
        }
        work_cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (stop_) throw std::logic_error("submit on a stopped ThreadPool");
            tasks_.push_back(std::move(task));
            ++pending_;
        }
        work_cv_.notify_one();
    }

    void wait() {
        std::exception_ptr err;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            idle_cv_.wait(lk, [this] { return pending_ == 0; });
            err = first_error_;
            first_error_ = nullptr;
        }
        if (err) std::rethrow_exception(err);
    }

    size_t size() const { return workers_.size(); }

private:
    void run() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mutex_);
                work_cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                if (tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            std::exception_ptr err;
            try {
                task();
            } catch (...) {
                err = std::current_exception();
            }

            std::lock_guard<std::mutex> lk(mutex_);
            if (err && !first_error_) first_error_ = err;
            if (--pending_ == 0) idle_cv_.notify_all();
        }
    }

    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex                        mutex_;
    std::condition_variable           work_cv_;
    std::condition_variable           idle_cv_;
    size_t                            pending_{0};
    std::exception_ptr                first_error_;
    bool                              stop_{false};
};
