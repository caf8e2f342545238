/**
 * @file scatter/manager/ManagerActor.h
 * @brief Defines the `ManagerActor`, the scatter-gather coordinator.
 *
 * @details
 * The `ManagerActor` receives `ComputeRequest`s from any actor and answers
 * each of them exactly once:
 * - **Intake**: assigns a job id, splits the data into `min(pool size, length)`
 *   contiguous balanced chunks and registers the job in its `JobTracker`.
 *   Empty data is answered at once with the identity element; an empty pool
 *   is answered at once with `ComputeFailed{WorkerUnavailable}`.
 * - **Scatter**: pushes one `ChunkTask` per chunk to a worker picked by the
 *   `WorkerPool` dispatch policy.
 * - **Gather**: folds each accepted `PartialResult` into the job. Results for
 *   unknown or finished jobs, repeated chunks, out-of-range chunk indexes and
 *   results sent by any actor other than the chunk's assigned worker are
 *   logged and dropped.
 * - **Reply**: on the last chunk sends `ComputeResult` to the requester and
 *   forgets the job.
 * - **Deadlines**: a job with a deadline arms a one-shot
 *   `qb::io::async::callback`. When it fires and the job is still live, the job
 *   fails with `ComputeFailed{Timeout}`; a job that already finished is not
 *   affected.
 * - **Shutdown**: on `qb::KillEvent` every live job is failed with
 *   `ComputeFailed{Shutdown}` before the actor stops.
 *
 * Many jobs are in flight at once; their partial results interleave freely.
 * All job state is owned by this actor and only mutated by its handlers.
 */

#pragma once

#include <qb/actor.h>

#include <chrono>
#include <cstdint>
#include <memory>

#include "../shared/Events.h"
#include "JobTracker.h"
#include "WorkerPool.h"

namespace scatter {

struct ManagerConfig {
    DispatchPolicy policy = DispatchPolicy::RoundRobin;
    std::chrono::milliseconds job_timeout{0};   // 0 disables the default deadline
    bool verbose = false;
};

class ManagerActor : public qb::Actor {
public:
    struct Stats {
        uint64_t requests = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t stale = 0;
        uint64_t duplicates = 0;
        uint64_t dispatched_chunks = 0;
    };

    /**
     * @brief Constructor
     * @param workers Worker actors created at startup; the pool never changes
     * @param config Dispatch policy, default job timeout and log verbosity
     */
    explicit ManagerActor(qb::ActorIdList workers, ManagerConfig config = {});
    ~ManagerActor();

    bool onInit() override;

    /**
     * @brief Starts a job for the request, or answers it right away
     */
    void on(ComputeRequest& request);

    /**
     * @brief Collects the fold of one chunk
     */
    void on(PartialResult& partial);

    /**
     * @brief Fails all live jobs and stops the actor
     */
    void on(qb::KillEvent&);

    const Stats& stats() const { return _stats; }
    std::size_t liveJobs() const { return _jobs.size(); }

private:
    std::chrono::milliseconds effectiveTimeout(const ComputeRequest& request) const;
    void dispatch(Job& job, const ComputeRequest& request);
    void complete(JobId id);
    void onTimeout(JobId id);
    void fail(Job& job, FailureReason reason, const char* message);
    void armDeadline(JobId id, std::chrono::milliseconds timeout);
    void logSummary();

    WorkerPool _pool;
    const ManagerConfig _config;
    JobTracker _jobs;
    Stats _stats;
    // shared with pending deadline timers, cleared once the actor stops
    std::shared_ptr<bool> _alive{std::make_shared<bool>(true)};
};

} // namespace scatter
