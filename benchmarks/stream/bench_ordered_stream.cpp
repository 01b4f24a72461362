/**
 * @file bench_ordered_stream.cpp
 * @brief Benchmarks for ordered parallel streaming
 *
 * Compares look-ahead windows and chunk sizes for reading a whole file in
 * index order.
 */

#include <benchmark/benchmark.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/worker_pool.h>
#include <arbor/transfer/stream/ordered_parallel_streamer.h>

#include "utils/benchmark_helpers.h"

namespace arbor::transfer::benchmark {

/**
 * @brief Stream a file with a given look-ahead window
 */
static void BM_OrderedStream_LookAhead(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto look_ahead = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("stream_source.bin", file_size, 7);

    get_logger().set_level(log_level::error);
    auto pool = worker_pool::builder().with_max_workers(16).with_retry_attempts(1).build();
    if (!pool) {
        state.SkipWithError("Failed to create worker pool");
        return;
    }

    ordered_parallel_streamer::options opts;
    opts.look_ahead = look_ahead;

    for (auto _ : state) {
        auto stream = ordered_parallel_streamer::open(pool.value(), source, opts);
        if (!stream) {
            state.SkipWithError("Failed to open stream");
            return;
        }
        auto delivered = stream.value().drain([](const file_chunk& chunk) -> result<void> {
            ::benchmark::DoNotOptimize(chunk.data.data());
            return {};
        });
        if (!delivered) {
            state.SkipWithError("Stream failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["look_ahead"] = static_cast<double>(look_ahead);
}

/**
 * @brief Stream a file with a given chunk size and the default window
 */
static void BM_OrderedStream_ChunkSize(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("chunk_source.bin", sizes::medium_file, 11);

    get_logger().set_level(log_level::error);
    auto pool = worker_pool::builder().with_max_workers(8).with_retry_attempts(1).build();
    if (!pool) {
        state.SkipWithError("Failed to create worker pool");
        return;
    }

    ordered_parallel_streamer::options opts;
    opts.chunk_size = chunk_size;

    for (auto _ : state) {
        auto stream = ordered_parallel_streamer::open(pool.value(), source, opts);
        if (!stream) {
            state.SkipWithError("Failed to open stream");
            return;
        }
        while (stream.value().has_next()) {
            auto chunk = stream.value().next();
            if (!chunk) {
                state.SkipWithError("Stream failed");
                return;
            }
            ::benchmark::DoNotOptimize(chunk.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunk_size_KB"] = static_cast<double>(chunk_size / sizes::KB);
}

BENCHMARK(BM_OrderedStream_LookAhead)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 4})
    ->Args({static_cast<int64_t>(sizes::medium_file), 8})
    ->Args({static_cast<int64_t>(sizes::large_file), 4})
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(5);

BENCHMARK(BM_OrderedStream_ChunkSize)
    ->Arg(static_cast<int64_t>(sizes::small_chunk))
    ->Arg(static_cast<int64_t>(256 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Arg(static_cast<int64_t>(4 * sizes::MB))
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(10);

}  // namespace arbor::transfer::benchmark
