#include "tabula/collab/maintenance_loop.hpp"

#include <algorithm>
#include <utility>

namespace tabula::collab {

namespace {

// Longer waits overflow the steady clock deadline.
constexpr std::chrono::milliseconds kLongestInterval = std::chrono::hours{24 * 365};

}  // namespace

MaintenanceLoop::MaintenanceLoop(SweepHook sweep)
    : MaintenanceLoop(std::move(sweep), Config{})
{
}

MaintenanceLoop::MaintenanceLoop(SweepHook sweep, Config config)
    : config_{config}
    , sweep_{std::move(sweep)}
{
}

MaintenanceLoop::~MaintenanceLoop()
{
    stop();
}

void MaintenanceLoop::start()
{
    std::lock_guard lock(mutex_);
    if (running_ || !sweep_) {
        return;
    }

    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread([this]() { run_loop(); });
}

void MaintenanceLoop::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard lock(mutex_);
    running_ = false;
    stop_requested_ = false;
}

bool MaintenanceLoop::running() const noexcept
{
    std::lock_guard lock(mutex_);
    return running_;
}

std::optional<std::error_code> MaintenanceLoop::last_error() const
{
    std::lock_guard lock(mutex_);
    return last_error_;
}

std::uint64_t MaintenanceLoop::run_count() const
{
    std::lock_guard lock(mutex_);
    return run_count_;
}

std::chrono::milliseconds MaintenanceLoop::interval() const noexcept
{
    return config_.interval;
}

void MaintenanceLoop::run_loop()
{
    const auto stopping = [this]() { return stop_requested_; };
    const auto interval = std::min(config_.interval, kLongestInterval);
    std::unique_lock lock(mutex_);

    if (interval.count() <= 0) {
        cv_.wait(lock, stopping);
        return;
    }

    while (!cv_.wait_for(lock, interval, stopping)) {
        lock.unlock();
        const auto ec = sweep_(Clock::now());
        lock.lock();
        ++run_count_;
        if (ec) {
            last_error_ = ec;
        } else {
            last_error_.reset();
        }
    }
}

}  // namespace tabula::collab
