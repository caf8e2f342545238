/**
 * @file scatter/app/RequesterActor.cpp
 * @brief Implements the `RequesterActor` used by `scatter-demo`.
 */

#include "RequesterActor.h"

#include <qb/io.h>

#include <iostream>

namespace scatter {

namespace {
constexpr uint64_t kRequestTag = 1;
}

RequesterActor::RequesterActor(qb::ActorId manager_id, DataPtr data, AggregationFunction op,
                               std::chrono::milliseconds timeout, RequestOutcome* outcome)
    : _manager_id(manager_id)
    , _data(std::move(data))
    , _op(op)
    , _timeout(timeout)
    , _outcome(outcome) {
    registerEvent<ComputeResult>(*this);
    registerEvent<ComputeFailed>(*this);
    registerEvent<qb::KillEvent>(*this);
}

bool RequesterActor::onInit() {
    qb::io::cout() << "RequesterActor " << id() << " sending " << _op.name << " request over "
                   << _data->size() << " values to " << _manager_id << std::endl;
    push<ComputeRequest>(_manager_id, _data, _op, id(), kRequestTag, _timeout);
    return true;
}

void RequesterActor::on(ComputeResult& reply) {
    if (_answered) {
        qb::io::cerr() << "RequesterActor " << id() << " got a second answer for job "
                       << reply.job_id << std::endl;
        return;
    }
    _answered = true;
    _outcome->job_id = reply.job_id;
    _outcome->result = reply.result;

    qb::io::cout() << "*******\nGot result: " << reply.result << "\n*******" << std::endl;
    shutdown();
}

void RequesterActor::on(ComputeFailed& failure) {
    if (_answered) {
        qb::io::cerr() << "RequesterActor " << id() << " got a second answer for job "
                       << failure.job_id << std::endl;
        return;
    }
    _answered = true;
    _outcome->job_id = failure.job_id;
    _outcome->failure = failure.reason;
    _outcome->error = failure.error_msg.c_str();

    qb::io::cerr() << "RequesterActor " << id() << " request failed (" << toString(failure.reason)
                   << "): " << failure.error_msg.c_str() << std::endl;
    shutdown();
}

void RequesterActor::on(qb::KillEvent&) {
    kill();
}

void RequesterActor::shutdown() {
    broadcast<qb::KillEvent>();
}

} // namespace scatter
