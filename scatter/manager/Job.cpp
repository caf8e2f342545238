/**
 * @file scatter/manager/Job.cpp
 * @brief Per-job chunk bookkeeping and partial folding.
 */

#include "Job.h"

#include <limits>

namespace scatter {

namespace {
constexpr std::size_t kUnassigned = std::numeric_limits<std::size_t>::max();
}

const char* toString(JobState state) {
    switch (state) {
        case JobState::Created: return "created";
        case JobState::AwaitingPartials: return "awaiting_partials";
        case JobState::Complete: return "complete";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

Job::Job(JobId id, AggregationFunction op, std::size_t expected_chunks, qb::ActorId reply_to,
         uint64_t request_tag, std::optional<Clock::time_point> deadline)
    : _id(id)
    , _op(op)
    , _expected(expected_chunks)
    , _reply_to(reply_to)
    , _request_tag(request_tag)
    , _deadline(deadline)
    , _received(expected_chunks)
    , _assigned_worker(expected_chunks, kUnassigned)
    , _accumulator(op.identity) {}

void Job::assign(ChunkIndex chunk, std::size_t worker_index) {
    if (chunk < _assigned_worker.size()) {
        _assigned_worker[chunk] = worker_index;
    }
}

RecordOutcome Job::record(ChunkIndex chunk, Value value) {
    if (chunk >= _expected) {
        return RecordOutcome::OutOfRange;
    }
    if (_state != JobState::AwaitingPartials || _received[chunk]) {
        return RecordOutcome::Duplicate;
    }
    _received[chunk] = value;
    ++_received_count;
    _accumulator = _op.combine(_accumulator, value);
    return RecordOutcome::Accepted;
}

void Job::markDispatched() {
    if (_state == JobState::Created) {
        _state = JobState::AwaitingPartials;
    }
}

void Job::markComplete() { _state = JobState::Complete; }
void Job::markFailed() { _state = JobState::Failed; }

bool Job::isRecorded(ChunkIndex chunk) const {
    return chunk < _received.size() && _received[chunk].has_value();
}

std::vector<std::size_t> Job::pendingWorkers() const {
    std::vector<std::size_t> pending;
    for (std::size_t chunk = 0; chunk < _expected; ++chunk) {
        if (!_received[chunk] && _assigned_worker[chunk] != kUnassigned) {
            pending.push_back(_assigned_worker[chunk]);
        }
    }
    return pending;
}

std::optional<std::size_t> Job::workerOf(ChunkIndex chunk) const {
    if (chunk >= _assigned_worker.size() || _assigned_worker[chunk] == kUnassigned) {
        return std::nullopt;
    }
    return _assigned_worker[chunk];
}

} // namespace scatter
