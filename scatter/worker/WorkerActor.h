/**
 * @file scatter/worker/WorkerActor.h
 * @brief Actor that folds one chunk of a job and reports the partial result.
 *
 * @details
 * A `WorkerActor` holds no job state. For every `ChunkTask` it folds the
 * [begin, end) window of the shared data buffer with the task's aggregation
 * function and pushes a `PartialResult` tagged with the same job id and chunk
 * index back to the task's sender, its owning `ManagerActor`.
 *
 * Any number of workers run side by side, on the same core or spread over
 * several; each one handles its tasks in arrival order.
 */

#pragma once

#include <qb/actor.h>

#include <cstdint>

#include "../shared/Events.h"

namespace scatter {

class WorkerActor : public qb::Actor {
public:
    /**
     * @brief Constructor
     * @param verbose Log every processed chunk
     */
    explicit WorkerActor(bool verbose = false);

    bool onInit() override;

    /**
     * @brief Folds the chunk and replies to the sender
     *
     * A window reaching past the data buffer is clamped to it; a missing
     * buffer folds as an empty chunk.
     */
    void on(ChunkTask& task);

    void on(qb::KillEvent&);

    uint64_t processed() const { return _processed; }

private:
    const bool _verbose;
    uint64_t _processed{0};
};

/**
 * @brief Folds the values a task refers to
 */
Value foldChunk(const ChunkTask& task);

} // namespace scatter
