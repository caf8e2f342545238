/**
 * @file scatter/manager/Job.h
 * @brief Manager-side record of one in-flight request.
 *
 * @details
 * A job is created when a non-empty request is accepted and lives in the
 * manager's `JobTracker` until it reaches a terminal state:
 *
 *   Created -> AwaitingPartials -> Complete
 *                               -> Failed
 *
 * Partial results are recorded per chunk index. The received set only grows
 * and a chunk index is accepted at most once; every accepted partial is folded
 * into the accumulator right away, so the result is available as soon as the
 * last chunk arrives, whatever the arrival order.
 */

#pragma once

#include <qb/actor.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include "../shared/Events.h"

namespace scatter {

enum class JobState {
    Created,
    AwaitingPartials,
    Complete,
    Failed
};

const char* toString(JobState state);

enum class RecordOutcome {
    Accepted,
    Duplicate,
    OutOfRange
};

class Job {
public:
    using Clock = std::chrono::steady_clock;

    Job(JobId id, AggregationFunction op, std::size_t expected_chunks, qb::ActorId reply_to,
        uint64_t request_tag, std::optional<Clock::time_point> deadline = std::nullopt);

    /**
     * @brief Remembers which pool worker received chunk `chunk`
     */
    void assign(ChunkIndex chunk, std::size_t worker_index);

    /**
     * @brief Records the partial of one chunk
     *
     * Only `Accepted` modifies the job. A job that already left
     * `AwaitingPartials` accepts nothing and reports `Duplicate`.
     */
    RecordOutcome record(ChunkIndex chunk, Value value);

    void markDispatched();
    void markComplete();
    void markFailed();

    bool complete() const { return _received_count == _expected; }
    bool isRecorded(ChunkIndex chunk) const;

    /**
     * @brief Pool indexes of the workers whose chunk has not been received
     */
    std::vector<std::size_t> pendingWorkers() const;

    std::optional<std::size_t> workerOf(ChunkIndex chunk) const;

    JobId id() const { return _id; }
    JobState state() const { return _state; }
    const AggregationFunction& op() const { return _op; }
    Value result() const { return _accumulator; }
    std::size_t expectedChunks() const { return _expected; }
    std::size_t receivedChunks() const { return _received_count; }
    const qb::ActorId& replyTo() const { return _reply_to; }
    uint64_t requestTag() const { return _request_tag; }
    const std::optional<Clock::time_point>& deadline() const { return _deadline; }

private:
    JobId _id;
    AggregationFunction _op;
    std::size_t _expected;
    qb::ActorId _reply_to;
    uint64_t _request_tag;
    std::optional<Clock::time_point> _deadline;

    JobState _state{JobState::Created};
    std::vector<std::optional<Value>> _received;   // indexed by chunk
    std::vector<std::size_t> _assigned_worker;     // indexed by chunk
    std::size_t _received_count{0};
    Value _accumulator;
};

} // namespace scatter
