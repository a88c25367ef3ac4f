#pragma once

#include "tabula/collab/resource_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace tabula::collab {

// Calls a sweep hook every interval on a background thread until stopped.
class MaintenanceLoop final {
public:
    struct Config final {
        // Non-positive intervals never sweep; intervals above one year are capped.
        std::chrono::milliseconds interval{std::chrono::minutes{1}};
    };

    using SweepHook = std::function<std::error_code(Timestamp now)>;

    explicit MaintenanceLoop(SweepHook sweep);
    MaintenanceLoop(SweepHook sweep, Config config);
    ~MaintenanceLoop();

    MaintenanceLoop(const MaintenanceLoop&) = delete;
    MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;
    MaintenanceLoop(MaintenanceLoop&&) = delete;
    MaintenanceLoop& operator=(MaintenanceLoop&&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::optional<std::error_code> last_error() const;
    [[nodiscard]] std::uint64_t run_count() const;
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept;

private:
    void run_loop();

    Config config_{};
    SweepHook sweep_{};
    std::thread thread_{};
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    bool running_ = false;
    bool stop_requested_ = false;
    std::optional<std::error_code> last_error_{};
    std::uint64_t run_count_ = 0U;
};

}  // namespace tabula::collab
