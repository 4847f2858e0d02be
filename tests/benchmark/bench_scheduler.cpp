/**
 * @file bench_scheduler.cpp
 * @brief Performance benchmarks for graph building, scheduling passes and core operations.
 * @author Dimitris Kafetzis
 *
 * Measures builder validation cost, per-run scheduling overhead with an
 * instant delegate, and the executor and logging primitives underneath.
 *
 * Usage: ./bench_scheduler [--csv]
 */

#include "core/logger.hpp"
#include "executor/thread_pool.hpp"
#include "graph/graph_builder.hpp"
#include "scheduler/delegate.hpp"
#include "scheduler/scheduler_loop.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/templates.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace crew_orchestrator;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// `n` tasks, each depending on up to `fan_in` earlier tasks, plus
/// `back_edges` dependencies on later tasks that the builder must cut.
std::vector<RawTask> random_tasks(size_t n, size_t fan_in, size_t back_edges, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<RawTask> tasks;
    tasks.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        RawTask task{.id = "t" + std::to_string(i), .owner = "Crew"};
        if (i > 0) {
            std::uniform_int_distribution<size_t> pick(0, i - 1);
            for (size_t k = 0; k < fan_in; ++k) {
                task.dependencies.push_back("t" + std::to_string(pick(rng)));
            }
        }
        tasks.push_back(std::move(task));
    }

    std::uniform_int_distribution<size_t> any(0, n - 1);
    for (size_t k = 0; k < back_edges; ++k) {
        auto from = any(rng);
        auto to = any(rng);
        if (from < to) tasks[from].dependencies.push_back("t" + std::to_string(to));
    }
    return tasks;
}

TaskGraph build_graph(std::vector<RawTask> tasks) {
    auto built = GraphBuilder::build(std::move(tasks));
    if (!built) return {};
    return std::move(built->graph);
}

auto instant_delegate() {
    return make_delegate([](const Task&, std::stop_token) -> Result<std::string> {
        return std::string{"ok"};
    });
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_build() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (auto name : ProjectTemplates::names()) {
        auto tasks = *ProjectTemplates::make(name);
        R.push_back(run_bench("build(" + std::string{name} + ")", "Graph Build", N,
            [&]{ auto b = GraphBuilder::build(tasks); (void)b; },
            std::to_string(tasks.size()) + " tasks"));
    }

    for (size_t n : {50, 200, 1000}) {
        auto acyclic = random_tasks(n, 3, 0, 7);
        R.push_back(run_bench("build_dag(" + std::to_string(n) + ")", "Graph Build", 100,
            [&]{ auto b = GraphBuilder::build(acyclic); (void)b; },
            std::to_string(n) + " tasks, fan-in 3"));

        auto cyclic = random_tasks(n, 3, n / 10, 7);
        R.push_back(run_bench("build_cyclic(" + std::to_string(n) + ")", "Graph Build", 100,
            [&]{ auto b = GraphBuilder::build(cyclic); (void)b; },
            std::to_string(n / 10) + " back edges"));
    }

    return R;
}

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    auto g200 = build_graph(random_tasks(200, 3, 0, 11));
    R.push_back(run_bench("topo_order(200)", "Graph Analysis", N,
        [&]{ auto o = g200.topological_order(); (void)o; }, "200 tasks"));
    R.push_back(run_bench("has_cycle(200)", "Graph Analysis", N,
        [&]{ auto c = g200.has_cycle(); (void)c; }, "200 tasks"));
    R.push_back(run_bench("snapshot(200)", "Graph Analysis", N,
        [&]{ auto s = g200.snapshot(); (void)s; }, "200 tasks"));
    R.push_back(run_bench("phase_progress(200)", "Graph Analysis", N,
        [&]{ auto p = g200.phase_progress(); (void)p; }, "200 tasks"));

    return R;
}

std::vector<BenchResult> bench_scheduling() {
    std::vector<BenchResult> R;
    Logger logger(std::make_unique<NullSink>(), LogLevel::Error);
    auto delegate = instant_delegate();

    SchedulerConfig config;
    config.thread_count = 4;
    config.max_total_iterations = 10000;
    SchedulerLoop loop(config, logger);

    for (auto name : ProjectTemplates::names()) {
        auto tasks = *ProjectTemplates::make(name);
        R.push_back(run_bench("run(" + std::string{name} + ")", "Scheduling", 200,
            [&]{ auto g = build_graph(tasks); auto r = loop.run(g, delegate); (void)r; },
            std::to_string(tasks.size()) + " tasks, build+run"));
    }

    for (size_t n : {50, 200, 500}) {
        auto tasks = random_tasks(n, 2, 0, 3);
        R.push_back(run_bench("run_random(" + std::to_string(n) + ")", "Scheduling", 20,
            [&]{ auto g = build_graph(tasks); auto r = loop.run(g, delegate); (void)r; },
            std::to_string(n) + " tasks, build+run"));
    }

    SchedulerConfig serial = config;
    serial.max_parallel = 1;
    SchedulerLoop serial_loop(serial, logger);
    auto wide = random_tasks(100, 0, 0, 5);
    R.push_back(run_bench("run_serial(100)", "Scheduling", 20,
        [&]{ auto g = build_graph(wide); auto r = serial_loop.run(g, delegate); (void)r; },
        "100 independent, max_parallel=1"));

    return R;
}

std::vector<BenchResult> bench_executor() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Executor", N, [&]{
        std::promise<void> p; auto f = p.get_future();
        tpool.submit([&p]{ p.set_value(); }); f.wait();
    }));

    std::stop_source ss;
    R.push_back(run_bench("threadpool_submit_cancellable", "Executor", N, [&]{
        auto f = tpool.submit_cancellable(ss.get_token(),
                                          [](std::stop_token stop) { return stop.stop_requested(); });
        f.wait();
    }));

    return R;
}

std::vector<BenchResult> bench_logging() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;

    Logger logger(std::make_unique<NullSink>(), LogLevel::Info);
    R.push_back(run_bench("log_info", "Logging", N,
        [&]{ logger.info("Task 42 completed"); }));
    R.push_back(run_bench("log_filtered_debug", "Logging", N,
        [&]{ logger.debug("Pass 3 summary"); }));
    R.push_back(run_bench("json_escape(64B)", "Logging", N,
        [&]{ auto s = json_escape("Install \"sink\"\tand\nfixtures for the kitchen remodel"); (void)s; }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  CrewOrchestrator Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_build());
    append(bench_graph());
    append(bench_scheduling());
    append(bench_executor());
    append(bench_logging());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
