#include "tabula/collab/collab_errors.hpp"
#include "tabula/collab/concurrency_control.hpp"
#include "tabula/collab/concurrency_introspection.hpp"
#include "tabula/collab/conflict_detector.hpp"
#include "tabula/tools/event_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using tabula::collab::CollabErrc;
using tabula::collab::ConcurrencyControl;
using tabula::collab::ConcurrencyStats;
using tabula::collab::Operation;
using tabula::collab::OperationType;

namespace {

struct SimulationOptions final {
    std::uint32_t writers = 4U;
    std::uint32_t iterations = 25U;
    std::string resource_type = "record";
    std::string resource_id = "rec1";
    std::uint32_t hold_ms = 2U;
    std::uint32_t lock_timeout_ms = 30'000U;
    std::uint32_t conflict_window_ms = 5'000U;
    std::string log_json_path{};
    std::string format = "json";
    std::string output_path{};
};

struct SimulationTally final {
    std::atomic<std::uint64_t> succeeded{0U};
    std::atomic<std::uint64_t> lock_denied{0U};
    std::atomic<std::uint64_t> rejected{0U};
    std::atomic<std::uint64_t> failed{0U};
};

struct DetectOptions final {
    std::string first_type = "update";
    std::string second_type = "update";
    std::vector<std::string> first_fields{"status"};
    std::vector<std::string> second_fields{"status"};
    std::int64_t first_version = 1;
    std::int64_t second_version = 2;
    std::int64_t gap_ms = 0;
    std::uint32_t conflict_window_ms = 5'000U;
    bool same_actor = false;
};

class EventSink final {
public:
    explicit EventSink(const std::string& path)
    {
        if (path.empty()) {
            return;
        }
        if (path == "-") {
            target_ = &std::cout;
            return;
        }
        file_.open(std::filesystem::path(path), std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("failed to open event log file: " + path);
        }
        target_ = &file_;
    }

    [[nodiscard]] tabula::collab::ConcurrencyEventLogger logger()
    {
        if (target_ == nullptr) {
            return {};
        }
        return [this](const tabula::collab::ConcurrencyEvent& event) {
            const auto line = tabula::tools::format_concurrency_event_log_json(event);
            std::lock_guard lock(mutex_);
            *target_ << line << '\n';
        };
    }

private:
    std::ofstream file_{};
    std::ostream* target_ = nullptr;
    std::mutex mutex_{};
};

OperationType parse_type_or_throw(const std::string& text)
{
    const auto type = tabula::collab::parse_operation_type(text);
    if (!type) {
        throw std::runtime_error("unsupported operation type: " + text);
    }
    return *type;
}

void print_text_summary(const ConcurrencyStats& stats, const SimulationTally& tally, std::ostream& out)
{
    const auto& telemetry = stats.telemetry;
    out << "Executions:" << '\n';
    out << "  submitted             : " << telemetry.executions << '\n';
    out << "  succeeded             : " << tally.succeeded.load() << '\n';
    out << "  lock denied           : " << tally.lock_denied.load() << '\n';
    out << "  conflict rejected     : " << tally.rejected.load() << '\n';
    out << "  other failures        : " << tally.failed.load() << '\n';
    out << "Conflicts:" << '\n';
    out << "  detected              : " << telemetry.conflicts_detected << '\n';
    out << "  merged                : " << telemetry.merges_applied << '\n';
    out << "Locks:" << '\n';
    out << "  active                : " << stats.active_locks << '\n';
    out << "  logged operations     : " << stats.logged_operations << '\n';
    out << std::flush;
}

void write_output(const std::string& output_path, const std::string& payload)
{
    if (output_path.empty()) {
        std::cout << payload << '\n';
        return;
    }
    std::ofstream file{std::filesystem::path(output_path), std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open output file: " + output_path);
    }
    file << payload << '\n';
}

void run_simulation(const SimulationOptions& options)
{
    EventSink sink{options.log_json_path};

    ConcurrencyControl::Config config{};
    config.lock_timeout = std::chrono::milliseconds{options.lock_timeout_ms};
    config.conflict_window = std::chrono::milliseconds{options.conflict_window_ms};
    config.event_logger = sink.logger();
    ConcurrencyControl control{std::move(config)};

    SimulationTally tally{};
    std::atomic<std::int64_t> version{0};
    const auto hold = std::chrono::milliseconds{options.hold_ms};

    std::vector<std::thread> writers;
    writers.reserve(options.writers);
    for (std::uint32_t writer = 0U; writer < options.writers; ++writer) {
        writers.emplace_back([&, writer]() {
            const auto user = "user" + std::to_string(writer + 1U);
            for (std::uint32_t iteration = 0U; iteration < options.iterations; ++iteration) {
                Operation op{};
                op.id = user + "-op" + std::to_string(iteration);
                op.type = OperationType::Update;
                op.resource_type = options.resource_type;
                op.resource_id = options.resource_id;
                op.user_id = user;
                op.session_id = user + "-session";
                op.data.emplace("status", user + "@" + std::to_string(iteration));
                op.data.emplace("editor", user);
                op.timestamp = tabula::collab::Clock::now();
                op.version = version.fetch_add(1) + 1;

                const auto ec = control.execute(op, [hold](const Operation&) -> std::error_code {
                    if (hold.count() > 0) {
                        std::this_thread::sleep_for(hold);
                    }
                    return {};
                });

                if (!ec) {
                    tally.succeeded.fetch_add(1U);
                } else if (ec == CollabErrc::LockUnavailable) {
                    tally.lock_denied.fetch_add(1U);
                } else if (tabula::collab::is_conflict_rejection(ec)) {
                    tally.rejected.fetch_add(1U);
                } else {
                    tally.failed.fetch_add(1U);
                }
            }
        });
    }
    for (auto& thread : writers) {
        thread.join();
    }

    control.run_sweep();
    const auto stats = control.concurrency_stats();

    if (options.format == "json") {
        write_output(options.output_path, tabula::collab::concurrency_stats_to_json(stats));
    } else {
        std::ostringstream stream;
        print_text_summary(stats, tally, stream);
        write_output(options.output_path, stream.str());
    }
}

Operation make_detect_operation(const std::string& id,
                                OperationType type,
                                const std::vector<std::string>& fields,
                                std::int64_t version,
                                tabula::collab::Timestamp timestamp,
                                const std::string& user)
{
    Operation op{};
    op.id = id;
    op.type = type;
    op.resource_type = "record";
    op.resource_id = "probe";
    op.user_id = user;
    op.session_id = user + "-session";
    for (const auto& field : fields) {
        op.data.emplace(field, id);
    }
    op.timestamp = timestamp;
    op.version = version;
    return op;
}

void run_detect(const DetectOptions& options)
{
    const auto first_type = parse_type_or_throw(options.first_type);
    const auto second_type = parse_type_or_throw(options.second_type);

    const auto base = tabula::collab::Clock::now();
    const auto existing = make_detect_operation("existing", first_type, options.first_fields, options.first_version, base, "user1");
    const auto incoming = make_detect_operation("incoming",
                                                second_type,
                                                options.second_fields,
                                                options.second_version,
                                                tabula::collab::saturating_add(base, std::chrono::milliseconds{options.gap_ms}),
                                                options.same_actor ? "user1" : "user2");

    tabula::collab::ConflictDetector detector{
        tabula::collab::ConflictDetector::Config{std::chrono::milliseconds{options.conflict_window_ms}}};
    const std::vector<Operation> log{existing};
    const auto result = detector.detect(incoming, log);
    std::cout << tabula::collab::conflict_result_to_json(result) << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Operational tooling for tabula concurrency control"};
    app.require_subcommand(1);

    SimulationOptions simulation{};
    auto* simulate = app.add_subcommand("simulate", "Run concurrent writers against one resource and report stats");
    simulate->add_option("-w,--writers", simulation.writers, "Number of writer threads")
        ->check(CLI::PositiveNumber);
    simulate->add_option("-n,--iterations", simulation.iterations, "Operations submitted per writer")
        ->check(CLI::PositiveNumber);
    simulate->add_option("--resource-type", simulation.resource_type, "Resource type to contend on");
    simulate->add_option("--resource-id", simulation.resource_id, "Resource id to contend on");
    simulate->add_option("--hold-ms", simulation.hold_ms, "Time each apply step holds the lock")
        ->check(CLI::NonNegativeNumber);
    simulate->add_option("--lock-timeout-ms", simulation.lock_timeout_ms, "Write lock timeout")
        ->check(CLI::PositiveNumber);
    simulate->add_option("--conflict-window-ms", simulation.conflict_window_ms, "Conflict detection window")
        ->check(CLI::NonNegativeNumber);
    simulate->add_option("--log-json", simulation.log_json_path, "Write concurrency events as JSON Lines (use '-' for stdout)");
    simulate->add_option("-f,--format", simulation.format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    simulate->add_option("-o,--output", simulation.output_path, "Write output to a file instead of stdout");
    simulate->callback([&]() {
        run_simulation(simulation);
    });

    DetectOptions detect_options{};
    auto* detect = app.add_subcommand("detect", "Evaluate the conflict detector on two synthetic operations");
    detect->add_option("--existing-type", detect_options.first_type, "Type of the logged operation (create, update, delete)");
    detect->add_option("--incoming-type", detect_options.second_type, "Type of the incoming operation");
    detect->add_option("--existing-fields", detect_options.first_fields, "Fields touched by the logged operation");
    detect->add_option("--incoming-fields", detect_options.second_fields, "Fields touched by the incoming operation");
    detect->add_option("--existing-version", detect_options.first_version, "Version of the logged operation");
    detect->add_option("--incoming-version", detect_options.second_version, "Version of the incoming operation");
    detect->add_option("--gap-ms", detect_options.gap_ms, "Incoming timestamp minus logged timestamp");
    detect->add_option("--conflict-window-ms", detect_options.conflict_window_ms, "Conflict detection window")
        ->check(CLI::NonNegativeNumber);
    detect->add_flag("--same-actor", detect_options.same_actor, "Submit both operations from the same user and session");
    detect->callback([&]() {
        run_detect(detect_options);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
