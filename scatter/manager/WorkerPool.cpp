/**
 * @file scatter/manager/WorkerPool.cpp
 * @brief Worker selection for round-robin and least-loaded dispatch.
 */

#include "WorkerPool.h"

#include <stdexcept>

namespace scatter {

const char* toString(DispatchPolicy policy) {
    switch (policy) {
        case DispatchPolicy::RoundRobin: return "round_robin";
        case DispatchPolicy::LeastLoaded: return "least_loaded";
    }
    return "unknown";
}

DispatchPolicy parsePolicy(const std::string& name) {
    if (name == "round_robin") return DispatchPolicy::RoundRobin;
    if (name == "least_loaded") return DispatchPolicy::LeastLoaded;
    throw std::invalid_argument("unknown dispatch policy: " + name);
}

WorkerPool::WorkerPool(qb::ActorIdList workers, DispatchPolicy policy)
    : _workers(std::move(workers))
    , _policy(policy)
    , _outstanding(_workers.size(), 0) {}

std::size_t WorkerPool::select() {
    const std::size_t index =
        _policy == DispatchPolicy::LeastLoaded ? leastLoaded() : nextRoundRobin();
    ++_outstanding[index];
    return index;
}

void WorkerPool::release(std::size_t index) {
    if (index < _outstanding.size() && _outstanding[index] > 0) {
        --_outstanding[index];
    }
}

std::size_t WorkerPool::nextRoundRobin() {
    return _cursor++ % _workers.size();
}

std::size_t WorkerPool::leastLoaded() const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < _outstanding.size(); ++i) {
        // strict comparison keeps the lowest index on ties
        if (_outstanding[i] < _outstanding[best]) {
            best = i;
        }
    }
    return best;
}

} // namespace scatter
