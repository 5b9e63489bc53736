#pragma once

// ============================================================
// cancel.hpp -- Cooperative cancellation shared across workers
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>

// Firing the token shuts down every registered socket so blocked reads and
// writes return immediately. Sleeps taken through wait_for() wake early.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        std::lock_guard<std::mutex> lk(mutex_);
        if (cancelled_.exchange(true)) return;
        for (auto& kv : fds_) {
            ::shutdown(kv.second, SHUT_RDWR);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(); }

    void throw_if_cancelled() const {
        if (cancelled()) {
            throw ConnectionError(ConnectionErrc::CANCELLED, "operation cancelled");
        }
    }

    // Returns false if the token fired before the delay elapsed
    bool wait_for(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lk(mutex_);
        return !cv_.wait_for(lk, delay, [this] { return cancelled_.load(); });
    }

    // Scoped registration of one socket. Must be destroyed before the
    // socket is closed so a late cancel never touches a reused descriptor.
    class Registration {
    public:
        Registration() = default;
        Registration(CancelToken* token, socket_t fd) : token_(token) {
            if (token_) id_ = token_->add(fd);
        }
        ~Registration() { reset(); }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        Registration(Registration&& o) noexcept : token_(o.token_), id_(o.id_) {
            o.token_ = nullptr;
        }
        Registration& operator=(Registration&& o) noexcept {
            if (this != &o) {
                reset();
                token_ = o.token_;
                id_ = o.id_;
                o.token_ = nullptr;
            }
            return *this;
        }

        void reset() {
            if (token_) {
                token_->remove(id_);
                token_ = nullptr;
            }
        }

    private:
        CancelToken* token_{nullptr};
        u64 id_{0};
    };

private:
    u64 add(socket_t fd) {
        std::lock_guard<std::mutex> lk(mutex_);
        u64 id = next_id_++;
        fds_[id] = fd;
        if (cancelled_.load()) ::shutdown(fd, SHUT_RDWR);
        return id;
    }

    void remove(u64 id) {
        std::lock_guard<std::mutex> lk(mutex_);
        fds_.erase(id);
    }

    std::atomic<bool>       cancelled_{false};
    std::mutex              mutex_;
    std::condition_variable cv_;
    std::map<u64, socket_t> fds_;
    u64                     next_id_{1};
};
