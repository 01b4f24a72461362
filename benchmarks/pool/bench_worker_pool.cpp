/**
 * @file bench_worker_pool.cpp
 * @brief Benchmarks for worker pool batch submission
 *
 * Measures scheduling overhead for small CPU tasks and the throughput of
 * parallel chunk hashing as the worker count grows.
 */

#include <benchmark/benchmark.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/worker_pool.h>
#include <arbor/transfer/upload/chunk_writer.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>
#include <vector>

namespace arbor::transfer::benchmark {

namespace {

auto make_pool(std::size_t workers) -> result<worker_pool> {
    get_logger().set_level(log_level::error);
    return worker_pool::builder()
        .with_max_workers(workers)
        .with_retry_attempts(1)
        .with_queue_capacity(100000)
        .build();
}

}  // namespace

/**
 * @brief Batch of small CPU tasks; reports tasks per second
 */
static void BM_WorkerPool_BatchOverhead(::benchmark::State& state) {
    const auto batch_size = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    auto pool = make_pool(workers);
    if (!pool) {
        state.SkipWithError("Failed to create worker pool");
        return;
    }

    for (auto _ : state) {
        std::vector<task> tasks;
        tasks.reserve(batch_size);
        for (std::size_t i = 0; i < batch_size; ++i) {
            tasks.push_back(task{"spin_" + std::to_string(i),
                                 std::make_shared<spin_operation>(1000)});
        }

        auto results = pool.value().submit_batch(std::move(tasks));
        ::benchmark::DoNotOptimize(results);
    }

    state.SetItemsProcessed(static_cast<int64_t>(batch_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(workers);
}

/**
 * @brief Read and hash every chunk of a file through the pool
 */
static void BM_WorkerPool_HashChunks(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("hash_source.bin", file_size, 42);

    auto pool = make_pool(workers);
    if (!pool) {
        state.SkipWithError("Failed to create worker pool");
        return;
    }
    chunk_writer writer(pool.value(), chunk_config(sizes::default_chunk));

    for (auto _ : state) {
        auto results = writer.hash_chunks(source);
        if (!results) {
            state.SkipWithError("Failed to hash chunks");
            return;
        }
        ::benchmark::DoNotOptimize(results.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(workers);
}

BENCHMARK(BM_WorkerPool_BatchOverhead)
    ->Args({100, 4})
    ->Args({1000, 4})
    ->Args({1000, 16})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_WorkerPool_HashChunks)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 4})
    ->Args({static_cast<int64_t>(sizes::large_file), 4})
    ->Args({static_cast<int64_t>(sizes::large_file), 16})
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(5);

}  // namespace arbor::transfer::benchmark
