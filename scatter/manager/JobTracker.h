/**
 * @file scatter/manager/JobTracker.h
 * @brief Live-job table of the manager, keyed by job id.
 *
 * @details
 * Job ids come from a monotonically increasing counter starting at 1 and are
 * never handed out twice. A closed id never becomes live again, so a deadline
 * timer that fires for a closed job finds nothing and does nothing.
 *
 * Owned by `ManagerActor` and only touched from its handlers.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Job.h"

namespace scatter {

class JobTracker {
public:
    JobId nextId() { return _next_id++; }

    /**
     * @brief Registers a job
     * @return the stored job
     */
    Job& open(Job job);

    Job* find(JobId id);
    const Job* find(JobId id) const;

    /**
     * @brief Removes a job from the live table
     * @return the removed job, or nothing when the id is not live
     */
    std::optional<Job> close(JobId id);

    /**
     * @brief Removes and returns every live job, by ascending id
     */
    std::vector<Job> drain();

    std::size_t size() const { return _jobs.size(); }
    bool empty() const { return _jobs.empty(); }

private:
    JobId _next_id{1};
    std::unordered_map<JobId, Job> _jobs;
};

} // namespace scatter
