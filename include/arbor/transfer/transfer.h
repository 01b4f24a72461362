/**
 * @file transfer.h
 * @brief Main header for the arbor_transfer library
 * @version 0.1.0
 *
 * Include this header to access the worker pool, the ordered streamer and
 * the upload pipeline.
 *
 * @code
 * #include <arbor/transfer/transfer.h>
 *
 * using namespace arbor::transfer;
 *
 * auto pool = worker_pool::builder()
 *     .with_max_workers(8)
 *     .build();
 *
 * auto stream = ordered_parallel_streamer::open(pool.value(), "/data/image.iso");
 * @endcode
 */

#ifndef ARBOR_TRANSFER_TRANSFER_H
#define ARBOR_TRANSFER_TRANSFER_H

#include <string>

// Core
#include "arbor/transfer/core/checksum.h"
#include "arbor/transfer/core/chunk_config.h"
#include "arbor/transfer/core/logging.h"
#include "arbor/transfer/core/types.h"

// Worker pool
#include "arbor/transfer/pool/operations.h"
#include "arbor/transfer/pool/task.h"
#include "arbor/transfer/pool/task_group.h"
#include "arbor/transfer/pool/task_metrics.h"
#include "arbor/transfer/pool/worker_pool.h"
#include "arbor/transfer/pool/worker_pool_config.h"

// Streaming
#include "arbor/transfer/stream/ordered_parallel_streamer.h"

// Upload
#include "arbor/transfer/upload/chunk_writer.h"
#include "arbor/transfer/upload/upload_policy.h"
#include "arbor/transfer/upload/upload_receiver.h"
#include "arbor/transfer/upload/upload_session.h"
#include "arbor/transfer/upload/upload_types.h"

namespace arbor::transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_TRANSFER_H
