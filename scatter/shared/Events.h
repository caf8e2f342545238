/**
 * @file scatter/shared/Events.h
 * @brief `qb::Event` types exchanged between requesters, the manager and workers.
 *
 * @details
 * Flow of one computation:
 * - `ComputeRequest`: requester -> `ManagerActor`. Carries the data (shared,
 *   immutable), the aggregation function and the reply address.
 * - `ChunkTask`: `ManagerActor` -> `WorkerActor`, one per chunk. Refers to a
 *   [begin, end) window of the request's data buffer, tagged with the job id
 *   and chunk index.
 * - `PartialResult`: `WorkerActor` -> `ManagerActor`, the fold of one chunk.
 * - `ComputeResult`: `ManagerActor` -> requester, exactly once per successful job.
 * - `ComputeFailed`: `ManagerActor` -> requester when a job cannot complete
 *   (timeout, no workers, missing combine function, shutdown). Never sent
 *   for a job that also produced a `ComputeResult`.
 *
 * The data buffer is held through `std::shared_ptr<const std::vector<uint64_t>>`
 * so that every chunk of a request points at the same storage.
 */

#pragma once

#include <qb/actor.h>
#include <qb/event.h>
#include <qb/string.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "Aggregation.h"

namespace scatter {

using JobId = uint64_t;
using ChunkIndex = uint32_t;
using DataPtr = std::shared_ptr<const std::vector<Value>>;

enum class FailureReason : uint8_t {
    Timeout,
    WorkerUnavailable,
    InvalidRequest,
    Shutdown
};

inline const char* toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::Timeout: return "timeout";
        case FailureReason::WorkerUnavailable: return "worker_unavailable";
        case FailureReason::InvalidRequest: return "invalid_request";
        case FailureReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

/**
 * @brief Aggregation request sent to the manager
 *
 * A default `reply_to` means "reply to the sender". A zero timeout means the
 * manager's configured job timeout applies.
 */
struct ComputeRequest : public qb::Event {
    DataPtr data;
    AggregationFunction op;
    qb::ActorId reply_to;
    uint64_t request_tag;
    std::chrono::milliseconds timeout;

    ComputeRequest(DataPtr values, AggregationFunction function, qb::ActorId requester = {},
                   uint64_t tag = 0, std::chrono::milliseconds deadline = std::chrono::milliseconds{0})
        : data(std::move(values)), op(function), reply_to(requester), request_tag(tag), timeout(deadline) {}
};

/**
 * @brief One chunk of a job, folded by a worker
 */
struct ChunkTask : public qb::Event {
    JobId job_id;
    ChunkIndex chunk_index;
    DataPtr data;
    std::size_t begin;
    std::size_t end;
    AggregationFunction op;

    ChunkTask(JobId job, ChunkIndex index, DataPtr values, std::size_t first, std::size_t last,
              AggregationFunction function)
        : job_id(job), chunk_index(index), data(std::move(values)), begin(first), end(last), op(function) {}
};

struct PartialResult : public qb::Event {
    JobId job_id;
    ChunkIndex chunk_index;
    Value value;

    PartialResult(JobId job, ChunkIndex index, Value result)
        : job_id(job), chunk_index(index), value(result) {}
};

struct ComputeResult : public qb::Event {
    JobId job_id;
    uint64_t request_tag;
    Value result;

    ComputeResult(JobId job, uint64_t tag, Value value)
        : job_id(job), request_tag(tag), result(value) {}
};

struct ComputeFailed : public qb::Event {
    JobId job_id;               // 0 when the request never became a job
    uint64_t request_tag;
    FailureReason reason;
    qb::string<128> error_msg;

    ComputeFailed(JobId job, uint64_t tag, FailureReason why, const char* message)
        : job_id(job), request_tag(tag), reason(why), error_msg(message) {}
};

} // namespace scatter
