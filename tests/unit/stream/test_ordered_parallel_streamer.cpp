/**
 * @file test_ordered_parallel_streamer.cpp
 * @brief Unit tests for ordered parallel streaming
 */

#include <gtest/gtest.h>

#include <arbor/transfer/core/checksum.h>
#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/worker_pool.h>
#include <arbor/transfer/stream/ordered_parallel_streamer.h>

#include "../pool/test_operations.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace arbor::transfer::test {

using namespace std::chrono_literals;

class OrderedStreamerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::fatal);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("arbor_test_stream_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);

        auto pool = worker_pool::builder()
            .with_max_workers(8)
            .with_retry_attempts(2)
            .with_retry_backoff(1ms)
            .build();
        ASSERT_TRUE(pool.has_value());
        pool_ = std::make_unique<worker_pool>(std::move(pool.value()));
    }

    void TearDown() override {
        pool_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_level(log_level::info);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::pair<std::filesystem::path, std::vector<std::byte>> {
        std::vector<std::byte> data(size);
        std::mt19937 gen(static_cast<uint32_t>(size) + 17);
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }

        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        return {path, data};
    }

    std::filesystem::path test_dir_;
    std::unique_ptr<worker_pool> pool_;
};

TEST_F(OrderedStreamerTest, OpenMissingFile) {
    auto stream = ordered_parallel_streamer::open(*pool_, test_dir_ / "missing.bin");
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::file_not_found);
}

TEST_F(OrderedStreamerTest, OpenDirectoryIsRejected) {
    auto stream = ordered_parallel_streamer::open(*pool_, test_dir_);
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::invalid_file_path);
}

TEST_F(OrderedStreamerTest, OpenRejectsBadOptions) {
    auto [path, data] = create_test_file("opts.bin", 100);

    ordered_parallel_streamer::options zero_window;
    zero_window.look_ahead = 0;
    auto a = ordered_parallel_streamer::open(*pool_, path, zero_window);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, error_code::invalid_configuration);

    ordered_parallel_streamer::options zero_chunk;
    zero_chunk.chunk_size = 0;
    auto b = ordered_parallel_streamer::open(*pool_, path, zero_chunk);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, error_code::invalid_chunk_size);
}

TEST_F(OrderedStreamerTest, EmptyFileYieldsNoChunks) {
    auto [path, data] = create_test_file("empty.bin", 0);

    auto stream = ordered_parallel_streamer::open(*pool_, path);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream.value().total_chunks(), 0u);
    EXPECT_FALSE(stream.value().has_next());

    auto next = stream.value().next();
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(next.error().code, error_code::invalid_chunk_index);
}

TEST_F(OrderedStreamerTest, ConcatenationReproducesFile) {
    auto [path, data] = create_test_file("round_trip.bin", 10 * 1024 + 123);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 1024;
    opts.look_ahead = 3;
    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream.value().file_size(), data.size());
    EXPECT_EQ(stream.value().total_chunks(), 11u);

    std::vector<std::byte> copy;
    uint64_t expected_index = 0;
    while (stream.value().has_next()) {
        auto chunk = stream.value().next();
        ASSERT_TRUE(chunk.has_value()) << chunk.error().message;
        EXPECT_EQ(chunk.value().index, expected_index);
        EXPECT_EQ(chunk.value().offset, expected_index * 1024);
        copy.insert(copy.end(), chunk.value().data.begin(), chunk.value().data.end());
        ++expected_index;
    }

    EXPECT_EQ(expected_index, 11u);
    EXPECT_EQ(copy, data);
    EXPECT_EQ(checksum::sha256(copy), checksum::sha256(data));
}

TEST_F(OrderedStreamerTest, OutOfOrderCompletionIsDeliveredInOrder) {
    auto [path, data] = create_test_file("jitter.bin", 10 * 512);
    auto probe = std::make_shared<concurrency_probe>();

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 512;
    opts.look_ahead = 4;
    opts.make_operation = [probe](const read_range_args& args) -> std::shared_ptr<operation> {
        return std::make_shared<jittered_read_operation>(args, probe);
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    std::vector<uint64_t> order;
    std::vector<std::byte> copy;
    while (stream.value().has_next()) {
        auto chunk = stream.value().next();
        ASSERT_TRUE(chunk.has_value()) << chunk.error().message;
        order.push_back(chunk.value().index);
        copy.insert(copy.end(), chunk.value().data.begin(), chunk.value().data.end());
        EXPECT_LE(stream.value().in_flight(), 4u);
    }

    std::vector<uint64_t> expected{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(order, expected);
    EXPECT_EQ(copy, data);
    EXPECT_LE(stream.value().peak_in_flight(), 4u);
    EXPECT_LE(probe->peak.load(), 4);
}

TEST_F(OrderedStreamerTest, WindowOfOneReadsSequentially) {
    auto [path, data] = create_test_file("window1.bin", 4 * 256);
    auto probe = std::make_shared<concurrency_probe>();

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 256;
    opts.look_ahead = 1;
    opts.make_operation = [probe](const read_range_args& args) -> std::shared_ptr<operation> {
        return std::make_shared<jittered_read_operation>(args, probe);
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    auto delivered = stream.value().drain(nullptr);
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(delivered.value(), data.size());
    EXPECT_EQ(stream.value().peak_in_flight(), 1u);
    EXPECT_EQ(probe->peak.load(), 1);
}

TEST_F(OrderedStreamerTest, DeliveredBytesAreCounted) {
    auto [path, data] = create_test_file("bytes.bin", 5000);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 1000;
    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());
    ASSERT_TRUE(stream.value().drain(nullptr).has_value());

    auto m = pool_->get_metrics();
    EXPECT_EQ(m.total_bytes_processed, 5000u);
    EXPECT_EQ(m.completed_tasks, 5u);
}

TEST_F(OrderedStreamerTest, FailedChunkTerminatesStream) {
    auto [path, data] = create_test_file("broken.bin", 8 * 100);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 100;
    opts.look_ahead = 2;
    opts.make_operation = [](const read_range_args& args) -> std::shared_ptr<operation> {
        return std::make_shared<failing_read_operation>(args, 3);
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    for (uint64_t i = 0; i < 3; ++i) {
        auto chunk = stream.value().next();
        ASSERT_TRUE(chunk.has_value());
        EXPECT_EQ(chunk.value().index, i);
    }

    auto failed = stream.value().next();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::stream_failure);
    EXPECT_NE(failed.error().message.find("failed to read chunk 3"), std::string::npos);
    EXPECT_NE(failed.error().message.find("bad sector"), std::string::npos);

    EXPECT_TRUE(stream.value().is_failed());
    EXPECT_FALSE(stream.value().has_next());
    EXPECT_EQ(stream.value().in_flight(), 0u);

    auto after = stream.value().next();
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, error_code::stream_failure);
}

TEST_F(OrderedStreamerTest, DrainStopsOnFailure) {
    auto [path, data] = create_test_file("drain_fail.bin", 6 * 64);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 64;
    opts.make_operation = [](const read_range_args& args) -> std::shared_ptr<operation> {
        return std::make_shared<failing_read_operation>(args, 4);
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    std::vector<uint64_t> received;
    auto delivered = stream.value().drain([&received](const file_chunk& c) -> result<void> {
        received.push_back(c.index);
        return {};
    });

    ASSERT_FALSE(delivered.has_value());
    EXPECT_EQ(delivered.error().code, error_code::stream_failure);
    EXPECT_EQ(received, (std::vector<uint64_t>{0, 1, 2, 3}));
}

TEST_F(OrderedStreamerTest, SinkErrorStopsStream) {
    auto [path, data] = create_test_file("sink_fail.bin", 5 * 64);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 64;
    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    int calls = 0;
    auto delivered = stream.value().drain([&calls](const file_chunk&) -> result<void> {
        if (++calls == 2) {
            return unexpected(error{error_code::file_write_error, "client went away"});
        }
        return {};
    });

    ASSERT_FALSE(delivered.has_value());
    EXPECT_EQ(delivered.error().code, error_code::stream_failure);
    EXPECT_NE(delivered.error().message.find("client went away"), std::string::npos);
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(stream.value().is_failed());
}

TEST_F(OrderedStreamerTest, AbandonedStreamReleasesPool) {
    auto [path, data] = create_test_file("abandoned.bin", 20 * 128);

    {
        ordered_parallel_streamer::options opts;
        opts.chunk_size = 128;
        auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
        ASSERT_TRUE(stream.has_value());
        ASSERT_TRUE(stream.value().next().has_value());
    }

    auto m = pool_->get_metrics();
    EXPECT_EQ(m.active_tasks, 0u);
    EXPECT_EQ(m.completed_tasks + m.failed_tasks, m.total_tasks);
}

TEST_F(OrderedStreamerTest, LongStreamReleasesDeliveredReads) {
    auto [path, data] = create_test_file("long.bin", 400 * 16);

    std::vector<std::weak_ptr<operation>> reads;
    ordered_parallel_streamer::options opts;
    opts.chunk_size = 16;
    opts.look_ahead = 4;
    opts.make_operation = [&reads](const read_range_args& args) -> std::shared_ptr<operation> {
        auto op = std::make_shared<read_range_operation>(args);
        reads.push_back(op);
        return op;
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());

    auto alive = [&reads] {
        return std::count_if(reads.begin(), reads.end(),
                             [](const std::weak_ptr<operation>& w) { return !w.expired(); });
    };

    std::size_t delivered = 0;
    std::ptrdiff_t peak_alive = 0;
    while (stream.value().has_next()) {
        ASSERT_TRUE(stream.value().next().has_value());
        ++delivered;
        peak_alive = std::max(peak_alive, alive());
    }
    EXPECT_EQ(delivered, 400u);
    EXPECT_LE(peak_alive, 8);

    auto deadline = std::chrono::steady_clock::now() + 1s;
    while (alive() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(alive(), 0);
}

TEST_F(OrderedStreamerTest, PausedConsumerDoesNotBlockShutdown) {
    auto [path, data] = create_test_file("paused.bin", 16 * 128);

    ordered_parallel_streamer::options opts;
    opts.chunk_size = 128;
    opts.look_ahead = 4;
    opts.make_operation = [](const read_range_args& args) -> std::shared_ptr<operation> {
        return std::make_shared<jittered_read_operation>(args, nullptr);
    };

    auto stream = ordered_parallel_streamer::open(*pool_, path, opts);
    ASSERT_TRUE(stream.has_value());
    ASSERT_TRUE(stream.value().next().has_value());

    // The consumer stalls until every launched read has completed
    std::this_thread::sleep_for(150ms);

    auto stopping = std::async(std::launch::async, [this] { pool_->shutdown(true); });
    ASSERT_EQ(stopping.wait_for(3s), std::future_status::ready);

    // Reads finished before shutdown are still delivered
    auto second = stream.value().next();
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_EQ(second.value().index, 1u);
    EXPECT_TRUE(std::equal(second.value().data.begin(), second.value().data.end(),
                           data.begin() + 128));

    // Chunks that were never launched cannot be read any more
    auto rest = stream.value().drain(nullptr);
    EXPECT_FALSE(rest.has_value());

    auto m = pool_->get_metrics();
    EXPECT_EQ(m.active_tasks, 0u);
    EXPECT_EQ(m.completed_tasks + m.failed_tasks, m.total_tasks);
}

}  // namespace arbor::transfer::test
