/**
 * @file scatter/manager/JobTracker.cpp
 * @brief Implements the manager's live-job table.
 */

#include "JobTracker.h"

#include <algorithm>

namespace scatter {

Job& JobTracker::open(Job job) {
    const JobId id = job.id();
    auto [it, inserted] = _jobs.insert_or_assign(id, std::move(job));
    return it->second;
}

Job* JobTracker::find(JobId id) {
    auto it = _jobs.find(id);
    return it == _jobs.end() ? nullptr : &it->second;
}

const Job* JobTracker::find(JobId id) const {
    auto it = _jobs.find(id);
    return it == _jobs.end() ? nullptr : &it->second;
}

std::optional<Job> JobTracker::close(JobId id) {
    auto it = _jobs.find(id);
    if (it == _jobs.end()) {
        return std::nullopt;
    }
    std::optional<Job> job{std::move(it->second)};
    _jobs.erase(it);
    return job;
}

std::vector<Job> JobTracker::drain() {
    std::vector<JobId> ids;
    ids.reserve(_jobs.size());
    for (const auto& [id, job] : _jobs) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());

    std::vector<Job> jobs;
    jobs.reserve(ids.size());
    for (JobId id : ids) {
        jobs.push_back(std::move(_jobs.at(id)));
    }
    _jobs.clear();
    return jobs;
}

} // namespace scatter
