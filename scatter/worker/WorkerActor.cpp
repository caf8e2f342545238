/**
 * @file scatter/worker/WorkerActor.cpp
 * @brief Implements the `WorkerActor` and the chunk fold it runs.
 */

#include "WorkerActor.h"

#include <qb/io.h>

#include <algorithm>
#include <iostream>

namespace scatter {

Value foldChunk(const ChunkTask& task) {
    if (!task.data || task.op.combine == nullptr) {
        return task.op.identity;
    }
    const auto& values = *task.data;
    const std::size_t end = std::min(task.end, values.size());
    const std::size_t begin = std::min(task.begin, end);
    return fold(task.op, values.begin() + begin, values.begin() + end);
}

WorkerActor::WorkerActor(bool verbose)
    : _verbose(verbose) {
    registerEvent<ChunkTask>(*this);
    registerEvent<qb::KillEvent>(*this);
}

bool WorkerActor::onInit() {
    qb::io::cout() << "WorkerActor " << id() << " initialized on core " << id().index() << std::endl;
    return true;
}

void WorkerActor::on(ChunkTask& task) {
    const Value value = foldChunk(task);
    ++_processed;

    if (_verbose) {
        qb::io::cout() << "WorkerActor " << id() << " job " << task.job_id << " chunk "
                       << task.chunk_index << " [" << task.begin << ", " << task.end << ") "
                       << task.op.name << " = " << value << std::endl;
    }

    push<PartialResult>(task.getSource(), task.job_id, task.chunk_index, value);
}

void WorkerActor::on(qb::KillEvent&) {
    qb::io::cout() << "WorkerActor " << id() << " shutting down after " << _processed
                   << " chunks" << std::endl;
    kill();
}

} // namespace scatter
