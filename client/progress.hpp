#pragma once

// ============================================================
// progress.hpp -- Per-file transfer progress events
// ============================================================

#include "../common/platform.hpp"
#include <functional>
#include <string>

// Events name the file they belong to. With several workers the calls for
// different files interleave and arrive on different threads.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void start(const std::string& file, u64 total) = 0;
    virtual void update(const std::string& file, u64 current) = 0;
    virtual void finish(const std::string& file) = 0;
};

class NoopProgress : public ProgressSink {
public:
    void start(const std::string&, u64) override {}
    void update(const std::string&, u64) override {}
    void finish(const std::string&) override {}
};

class CallbackProgress : public ProgressSink {
public:
    using StartFn  = std::function<void(const std::string&, u64)>;
    using UpdateFn = std::function<void(const std::string&, u64)>;
    using FinishFn = std::function<void(const std::string&)>;

    CallbackProgress(StartFn on_start, UpdateFn on_update, FinishFn on_finish = nullptr)
        : on_start_(std::move(on_start))
        , on_update_(std::move(on_update))
        , on_finish_(std::move(on_finish)) {}

    void start(const std::string& file, u64 total) override {
        if (on_start_) on_start_(file, total);
    }
    void update(const std::string& file, u64 current) override {
        if (on_update_) on_update_(file, current);
    }
    void finish(const std::string& file) override {
        if (on_finish_) on_finish_(file);
    }

private:
    StartFn  on_start_;
    UpdateFn on_update_;
    FinishFn on_finish_;
};
