/**
 * @file scatter/app/RequesterActor.h
 * @brief Actor that submits one aggregation request and waits for its answer.
 *
 * @details
 * On init the `RequesterActor` pushes a `ComputeRequest` to the manager with
 * itself as reply address. When the `ComputeResult` or `ComputeFailed` comes
 * back it records the answer in the `RequestOutcome` given at construction
 * and broadcasts `qb::KillEvent` so the whole engine winds down.
 *
 * The outcome is written from the actor's core and must only be read once
 * `qb::Main::join()` has returned.
 */

#pragma once

#include <qb/actor.h>

#include <chrono>
#include <optional>
#include <string>

#include "../shared/Events.h"

namespace scatter {

struct RequestOutcome {
    JobId job_id = 0;
    std::optional<Value> result;
    std::optional<FailureReason> failure;
    std::string error;
};

class RequesterActor : public qb::Actor {
public:
    RequesterActor(qb::ActorId manager_id, DataPtr data, AggregationFunction op,
                   std::chrono::milliseconds timeout, RequestOutcome* outcome);

    bool onInit() override;

    void on(ComputeResult& reply);
    void on(ComputeFailed& failure);
    void on(qb::KillEvent&);

private:
    void shutdown();

    const qb::ActorId _manager_id;
    DataPtr _data;
    const AggregationFunction _op;
    const std::chrono::milliseconds _timeout;
    RequestOutcome* _outcome;
    bool _answered{false};
};

} // namespace scatter
