/**
 * @file scatter/manager/WorkerPool.h
 * @brief Fixed set of worker actors plus the policy choosing one per chunk.
 *
 * @details
 * The pool is built once from the worker ids created at startup and never
 * changes size. It keeps one outstanding-task counter per worker: `select()`
 * books a slot on the chosen worker and the manager gives it back with
 * `release()` when that worker's partial result is accepted, or when the job
 * owning the chunk fails.
 *
 * Policies:
 * - `RoundRobin`: cursor over the workers, wraps around.
 * - `LeastLoaded`: lowest outstanding count, ties broken by lowest index.
 *
 * Used only from the manager's own handlers, so no locking.
 */

#pragma once

#include <qb/actor.h>

#include <cstddef>
#include <string>
#include <vector>

namespace scatter {

enum class DispatchPolicy {
    RoundRobin,
    LeastLoaded
};

const char* toString(DispatchPolicy policy);

/**
 * @brief Parses "round_robin" or "least_loaded"
 * @throws std::invalid_argument on any other name
 */
DispatchPolicy parsePolicy(const std::string& name);

class WorkerPool {
public:
    WorkerPool(qb::ActorIdList workers, DispatchPolicy policy);

    /**
     * @brief Picks the worker for the next chunk and books one task on it
     * @return index into the pool; the pool must not be empty
     */
    std::size_t select();

    /**
     * @brief Returns one booked task of worker `index`
     *
     * No-op when nothing is outstanding on that worker.
     */
    void release(std::size_t index);

    const qb::ActorId& worker(std::size_t index) const { return _workers[index]; }

    std::size_t outstanding(std::size_t index) const { return _outstanding[index]; }
    std::size_t size() const { return _workers.size(); }
    bool empty() const { return _workers.empty(); }
    DispatchPolicy policy() const { return _policy; }
    const qb::ActorIdList& workers() const { return _workers; }

private:
    std::size_t nextRoundRobin();
    std::size_t leastLoaded() const;

    const qb::ActorIdList _workers;
    const DispatchPolicy _policy;
    std::vector<std::size_t> _outstanding;
    std::size_t _cursor{0};
};

} // namespace scatter
