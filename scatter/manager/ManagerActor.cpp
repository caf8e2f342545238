/**
 * @file scatter/manager/ManagerActor.cpp
 * @brief Implements the `ManagerActor` scatter-gather coordinator.
 */

#include "ManagerActor.h"

#include <qb/io.h>
#include <qb/io/async.h>

#include <algorithm>
#include <iostream>

#include "../shared/Partition.h"

namespace scatter {

ManagerActor::ManagerActor(qb::ActorIdList workers, ManagerConfig config)
    : _pool(std::move(workers), config.policy)
    , _config(config) {
    registerEvent<ComputeRequest>(*this);
    registerEvent<PartialResult>(*this);
    registerEvent<qb::KillEvent>(*this);
}

ManagerActor::~ManagerActor() {
    *_alive = false;
}

bool ManagerActor::onInit() {
    qb::io::cout() << "ManagerActor " << id() << " initialized with " << _pool.size()
                   << " workers, policy " << toString(_pool.policy())
                   << ", job timeout " << _config.job_timeout.count() << "ms" << std::endl;
    return true;
}

void ManagerActor::on(ComputeRequest& request) {
    ++_stats.requests;

    // Reply to the sender when no explicit address was given
    if (request.reply_to == qb::ActorId{}) {
        request.reply_to = request.getSource();
    }

    if (request.op.combine == nullptr) {
        qb::io::cerr() << "ManagerActor " << id() << " rejects request " << request.request_tag
                       << ": no combine function" << std::endl;
        ++_stats.failed;
        push<ComputeFailed>(request.reply_to, 0, request.request_tag, FailureReason::InvalidRequest,
                            "aggregation function has no combine operation");
        return;
    }

    const std::size_t length = request.data ? request.data->size() : 0;
    if (length == 0) {
        const JobId job_id = _jobs.nextId();
        qb::io::cout() << "ManagerActor " << id() << " job " << job_id
                       << " has no data, replying with " << request.op.name << " identity" << std::endl;
        ++_stats.completed;
        push<ComputeResult>(request.reply_to, job_id, request.request_tag, request.op.identity);
        return;
    }

    if (_pool.empty()) {
        qb::io::cerr() << "ManagerActor " << id() << " rejects request " << request.request_tag
                       << ": no workers available" << std::endl;
        ++_stats.failed;
        push<ComputeFailed>(request.reply_to, 0, request.request_tag, FailureReason::WorkerUnavailable,
                            "worker pool is empty");
        return;
    }

    const JobId job_id = _jobs.nextId();
    const auto chunk_count = std::min(_pool.size(), length);
    const auto timeout = effectiveTimeout(request);

    std::optional<Job::Clock::time_point> deadline;
    if (timeout.count() > 0) {
        deadline = Job::Clock::now() + timeout;
    }

    Job& job = _jobs.open(Job(job_id, request.op, chunk_count, request.reply_to,
                              request.request_tag, deadline));
    dispatch(job, request);

    qb::io::cout() << "ManagerActor " << id() << " job " << job_id << " (" << request.op.name
                   << " over " << length << " values) split into " << chunk_count << " chunks" << std::endl;

    if (deadline) {
        armDeadline(job_id, timeout);
    }
}

void ManagerActor::dispatch(Job& job, const ComputeRequest& request) {
    const auto chunks = partition(request.data->size(), job.expectedChunks());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto chunk = static_cast<ChunkIndex>(i);
        const std::size_t worker_index = _pool.select();
        job.assign(chunk, worker_index);

        if (_config.verbose) {
            qb::io::cout() << "ManagerActor " << id() << " job " << job.id() << " chunk " << chunk
                           << " [" << chunks[i].begin << ", " << chunks[i].end << ") -> worker #"
                           << worker_index << std::endl;
        }

        push<ChunkTask>(_pool.worker(worker_index), job.id(), chunk, request.data,
                        chunks[i].begin, chunks[i].end, request.op);
        ++_stats.dispatched_chunks;
    }
    job.markDispatched();
}

void ManagerActor::on(PartialResult& partial) {
    Job* job = _jobs.find(partial.job_id);
    if (!job) {
        // Finished, failed or never existed
        ++_stats.stale;
        qb::io::cerr() << "ManagerActor " << id() << " ignores partial for unknown job "
                       << partial.job_id << " (chunk " << partial.chunk_index << ")" << std::endl;
        return;
    }

    const auto assigned = job->workerOf(partial.chunk_index);
    if (assigned && _pool.worker(*assigned) != partial.getSource()) {
        ++_stats.stale;
        qb::io::cerr() << "ManagerActor " << id() << " ignores chunk " << partial.chunk_index
                       << " of job " << partial.job_id << " from " << partial.getSource()
                       << ": assigned to " << _pool.worker(*assigned) << std::endl;
        return;
    }

    switch (job->record(partial.chunk_index, partial.value)) {
        case RecordOutcome::Accepted:
            break;
        case RecordOutcome::Duplicate:
            ++_stats.duplicates;
            qb::io::cerr() << "ManagerActor " << id() << " ignores duplicate chunk "
                           << partial.chunk_index << " of job " << partial.job_id << std::endl;
            return;
        case RecordOutcome::OutOfRange:
            ++_stats.stale;
            qb::io::cerr() << "ManagerActor " << id() << " ignores chunk " << partial.chunk_index
                           << " of job " << partial.job_id << ": only " << job->expectedChunks()
                           << " chunks were dispatched" << std::endl;
            return;
    }

    if (assigned) {
        _pool.release(*assigned);
    }

    if (job->complete()) {
        complete(partial.job_id);
    }
}

void ManagerActor::complete(JobId id) {
    auto job = _jobs.close(id);
    if (!job) {
        return;
    }
    job->markComplete();
    ++_stats.completed;

    qb::io::cout() << "ManagerActor " << this->id() << " job " << id << " complete: "
                   << job->op().name << " = " << job->result() << std::endl;
    push<ComputeResult>(job->replyTo(), id, job->requestTag(), job->result());
}

void ManagerActor::onTimeout(JobId id) {
    auto job = _jobs.close(id);
    if (!job || job->state() != JobState::AwaitingPartials) {
        return;
    }
    qb::io::cerr() << "ManagerActor " << this->id() << " job " << id << " timed out with "
                   << job->receivedChunks() << "/" << job->expectedChunks() << " chunks" << std::endl;
    fail(*job, FailureReason::Timeout, "job deadline expired before all chunks were received");
}

void ManagerActor::fail(Job& job, FailureReason reason, const char* message) {
    for (std::size_t worker_index : job.pendingWorkers()) {
        _pool.release(worker_index);
    }
    job.markFailed();
    ++_stats.failed;
    push<ComputeFailed>(job.replyTo(), job.id(), job.requestTag(), reason, message);
}

void ManagerActor::on(qb::KillEvent&) {
    *_alive = false;

    auto jobs = _jobs.drain();
    if (!jobs.empty()) {
        qb::io::cerr() << "ManagerActor " << id() << " shutting down with " << jobs.size()
                       << " jobs in flight" << std::endl;
    }
    for (auto& job : jobs) {
        fail(job, FailureReason::Shutdown, "manager is shutting down");
    }

    logSummary();
    kill();
}

std::chrono::milliseconds ManagerActor::effectiveTimeout(const ComputeRequest& request) const {
    return request.timeout.count() > 0 ? request.timeout : _config.job_timeout;
}

void ManagerActor::armDeadline(JobId id, std::chrono::milliseconds timeout) {
    qb::io::async::callback([this, id, alive = _alive]() {
        if (*alive) {
            onTimeout(id);
        }
    }, timeout.count() / 1000.0);
}

void ManagerActor::logSummary() {
    qb::io::cout() << "ManagerActor " << id() << " summary: requests=" << _stats.requests
                   << " completed=" << _stats.completed << " failed=" << _stats.failed
                   << " stale=" << _stats.stale << " duplicates=" << _stats.duplicates
                   << " chunks=" << _stats.dispatched_chunks << std::endl;
}

} // namespace scatter
