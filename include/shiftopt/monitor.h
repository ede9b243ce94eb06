#pragma once
/*
===============================================================================
MONITOR — Cooperative cancellation and progress tracking of one solve
===============================================================================

OVERVIEW
--------
CancellationToken is a cheap shared handle on an atomic flag. The caller
keeps one copy, the solver callback polls another; cancel() may be called
from any thread.

SolveMonitor is the callback a SchedulerSession installs on its model. At
every callback point it polls the token and aborts the search once it is
set, so Gurobi returns with status INTERRUPTED and keeps the best schedule
found so far. It also records the latest progress and forwards each solver
log line to an optional sink.

USAGE EXAMPLES
--------------
    CancellationToken token;
    SolveOptions opts;
    opts.cancel = token;

    std::thread ui([token]() mutable { waitForStopButton(); token.cancel(); });
    SolveResult r = solve(input, demand, 30s, opts);

===============================================================================
*/

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "callbacks.h"

namespace shiftopt {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }

    bool cancelled() const noexcept { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// @brief Receives every line of the solver log
using LogSink = std::function<void(const std::string&)>;

class SolveMonitor : public MIPCallback {
public:
    SolveMonitor(CancellationToken token, LogSink sink)
        : token_(std::move(token)), sink_(std::move(sink)) {}

    /// @brief True once the monitor has aborted the search
    bool aborted() const noexcept { return aborted_.load(); }

    /// @brief Number of incumbents reported during the last search
    int incumbents() const noexcept { return incumbents_.load(); }

    Progress lastProgress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

protected:
    void onPolling() override {
        if (!aborted_ && token_.cancelled()) {
            aborted_ = true;
            abort();
        }
    }

    void onProgress(const Progress& p) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = p;
    }

    void onIncumbent(const Progress& p) override {
        ++incumbents_;
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = p;
    }

    void onMessage(const std::string& msg) override {
        if (sink_) {
            sink_(msg);
            // the sink may have cancelled
            onPolling();
        }
    }

private:
    CancellationToken token_;
    LogSink sink_;

    std::atomic<bool> aborted_{ false };
    std::atomic<int> incumbents_{ 0 };

    mutable std::mutex mutex_;
    Progress last_;
};

} // namespace shiftopt
