// Throughput benchmark for the single-file store.
//
// Opens a fresh logkv::Store in a temporary directory, then runs N sequential
// SET, GET and REMOVE operations, first with fdatasync on every write and then
// with sync_writes off.  A final pass measures compaction of the resulting
// file.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "storage/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

constexpr std::size_t kValueSize = 100;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    std::size_t failures{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, std::size_t failures) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    r.failures  = failures;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const std::string& label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu (%zu failed)\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label.c_str(), r.total_ops, r.failures, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// Times `op(i)` for i in [0, n).  `op` returns true on success.
template <typename Op>
BenchResult time_ops(std::size_t n, Op op) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);
    std::size_t failures = 0;

    for (std::size_t i = 0; i < n; ++i) {
        auto t0 = clock::now();
        const bool ok = op(i);
        auto t1 = clock::now();
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        if (!ok) ++failures;
    }
    return compute_stats(latencies, failures);
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

void bench_store(const std::filesystem::path& path, bool sync_writes, std::size_t num_ops) {
    const std::string mode = sync_writes ? "fdatasync" : "no sync";

    logkv::StoreOptions options;
    options.sync_writes = sync_writes;
    // Keep the removal phase from compacting underneath the timings.
    options.compaction.min_garbage_bytes = UINT64_MAX;

    logkv::Store store(path, options);
    if (auto ec = store.open()) {
        spdlog::error("logkv-bench: cannot open {}: {}", path.string(), ec.message());
        return;
    }

    const std::string value(kValueSize, 'v');
    auto key_of = [](std::size_t i) { return "key" + std::to_string(i); };

    auto set_result = time_ops(num_ops, [&](std::size_t i) {
        return !store.set(key_of(i), value);
    });
    auto get_result = time_ops(num_ops, [&](std::size_t i) {
        return store.get(key_of(i)).has_value();
    });
    auto rm_result = time_ops(num_ops, [&](std::size_t i) {
        return !store.remove(key_of(i));
    });

    print_result("SET (" + mode + ")", set_result);
    print_result("GET (" + mode + ")", get_result);
    print_result("REMOVE (" + mode + ")", rm_result);

    const auto before = store.stats().file_size;
    auto t0 = clock::now();
    auto ec = store.compact();
    auto t1 = clock::now();
    if (ec) {
        spdlog::error("logkv-bench: compaction failed: {}", ec.message());
    } else {
        fprintf(stdout,
            "\n── COMPACT (%s) ──\n"
            "  %llu -> %llu bytes in %.3f ms\n",
            mode.c_str(),
            static_cast<unsigned long long>(before),
            static_cast<unsigned long long>(store.stats().file_size),
            static_cast<double>(std::chrono::duration_cast<ns>(t1 - t0).count()) / 1e6);
    }

    if (auto close_ec = store.close()) {
        spdlog::error("logkv-bench: close failed: {}", close_ec.message());
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress store logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 10'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 10'000;
    }

    const auto dir = std::filesystem::temp_directory_path() /
                     ("logkv_bench_" + std::to_string(::getpid()));
    std::error_code fs_ec;
    std::filesystem::remove_all(dir, fs_ec);
    std::filesystem::create_directories(dir, fs_ec);
    if (fs_ec) {
        spdlog::error("logkv-bench: cannot create {}: {}", dir.string(), fs_ec.message());
        return 1;
    }

    fprintf(stdout,
        "logkv Store Benchmark\n"
        "=====================\n"
        "Ops per phase: %zu (value size %zu bytes)\n"
        "Directory:     %s\n",
        num_ops, kValueSize, dir.c_str());

    bench_store(dir / "sync.lkv", true, num_ops);
    bench_store(dir / "nosync.lkv", false, num_ops);

    fprintf(stdout, "\n");

    std::filesystem::remove_all(dir, fs_ec);
    return 0;
}
