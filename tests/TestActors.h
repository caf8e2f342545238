/**
 * @file tests/TestActors.h
 * @brief Actors used by the engine-level scatter-gather tests.
 *
 * @details
 * They write what they observe into plain structs owned by the test body,
 * which reads them once `qb::Main::join()` has returned.
 *
 * - `ProbeActor`: submits a batch of requests and records every answer.
 * - `RecordingWorker`: a well-behaved worker that logs the chunks it folds.
 * - `SilentWorker`: never answers.
 * - `DelayedWorker`: answers after a fixed delay.
 * - `DuplicatingWorker`: answers twice and adds partials the manager must drop.
 * - `ImpostorActor`: outside the pool, sends a forged partial after a delay.
 */

#pragma once

#include <qb/actor.h>
#include <qb/icallback.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "shared/Events.h"
#include "worker/WorkerActor.h"

namespace scatter::test {

using Clock = std::chrono::steady_clock;

struct ProbeRequest {
    DataPtr data;
    AggregationFunction op;
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Everything a `ProbeActor` received, keyed by request tag
 */
struct ProbeLog {
    std::map<uint64_t, std::vector<Value>> results;
    std::map<uint64_t, std::vector<FailureReason>> failures;
    std::map<uint64_t, JobId> job_ids;
    bool gave_up = false;

    std::size_t answers() const {
        std::size_t count = 0;
        for (const auto& [tag, values] : results) count += values.size();
        for (const auto& [tag, reasons] : failures) count += reasons.size();
        return count;
    }
};

/**
 * @brief Sends requests tagged 1..n to the manager and records the answers
 *
 * Once every request has been answered the probe waits `linger` more, so that
 * late messages still reach the manager, then broadcasts `qb::KillEvent`.
 * Gives up after five seconds whatever happened.
 */
class ProbeActor : public qb::Actor, public qb::ICallback {
public:
    ProbeActor(qb::ActorId manager_id, std::vector<ProbeRequest> requests, ProbeLog* log,
               std::chrono::milliseconds linger = std::chrono::milliseconds{0},
               bool kill_manager_first = false)
        : _manager_id(manager_id)
        , _requests(std::move(requests))
        , _log(log)
        , _linger(linger)
        , _kill_manager_first(kill_manager_first) {
        registerEvent<ComputeResult>(*this);
        registerEvent<ComputeFailed>(*this);
        registerEvent<qb::KillEvent>(*this);
    }

    bool onInit() override {
        uint64_t tag = 0;
        for (const auto& request : _requests) {
            push<ComputeRequest>(_manager_id, request.data, request.op, qb::ActorId{}, ++tag, request.timeout);
        }
        if (_kill_manager_first) {
            push<qb::KillEvent>(_manager_id);
        }
        _give_up_at = Clock::now() + std::chrono::seconds(5);
        registerCallback(*this);
        return true;
    }

    void on(ComputeResult& reply) {
        _log->results[reply.request_tag].push_back(reply.result);
        _log->job_ids[reply.request_tag] = reply.job_id;
        answered();
    }

    void on(ComputeFailed& failure) {
        _log->failures[failure.request_tag].push_back(failure.reason);
        _log->job_ids[failure.request_tag] = failure.job_id;
        answered();
    }

    void on(qb::KillEvent&) {
        stopTicking();
        kill();
    }

    void onCallback() override {
        const auto now = Clock::now();
        if (_done_at && now >= *_done_at + _linger) {
            finish();
        } else if (now >= _give_up_at) {
            _log->gave_up = true;
            finish();
        }
    }

private:
    void answered() {
        if (!_done_at && _log->answers() >= _requests.size()) {
            _done_at = Clock::now();
        }
    }

    void finish() {
        stopTicking();
        broadcast<qb::KillEvent>();
    }

    void stopTicking() {
        if (_ticking) {
            unregisterCallback(*this);
            _ticking = false;
        }
    }

    const qb::ActorId _manager_id;
    std::vector<ProbeRequest> _requests;
    ProbeLog* _log;
    const std::chrono::milliseconds _linger;
    const bool _kill_manager_first;
    std::optional<Clock::time_point> _done_at;
    Clock::time_point _give_up_at;
    bool _ticking{true};
};

struct ChunkRecord {
    int worker;
    JobId job_id;
    ChunkIndex chunk_index;
    std::size_t begin;
    std::size_t end;
    Value value;
};

class RecordingWorker : public qb::Actor {
public:
    RecordingWorker(int tag, std::vector<ChunkRecord>* records)
        : _tag(tag)
        , _records(records) {
        registerEvent<ChunkTask>(*this);
        registerEvent<qb::KillEvent>(*this);
    }

    void on(ChunkTask& task) {
        const Value value = foldChunk(task);
        _records->push_back({_tag, task.job_id, task.chunk_index, task.begin, task.end, value});
        push<PartialResult>(task.getSource(), task.job_id, task.chunk_index, value);
    }

    void on(qb::KillEvent&) { kill(); }

private:
    const int _tag;
    std::vector<ChunkRecord>* _records;
};

class SilentWorker : public qb::Actor {
public:
    SilentWorker() {
        registerEvent<ChunkTask>(*this);
        registerEvent<qb::KillEvent>(*this);
    }

    void on(ChunkTask&) {}
    void on(qb::KillEvent&) { kill(); }
};

class DelayedWorker : public qb::Actor, public qb::ICallback {
public:
    explicit DelayedWorker(std::chrono::milliseconds delay)
        : _delay(delay) {
        registerEvent<ChunkTask>(*this);
        registerEvent<qb::KillEvent>(*this);
    }

    void on(ChunkTask& task) {
        _pending.push_back({Clock::now() + _delay, task.getSource(), task.job_id, task.chunk_index,
                            foldChunk(task)});
        if (!_ticking) {
            registerCallback(*this);
            _ticking = true;
        }
    }

    void onCallback() override {
        const auto now = Clock::now();
        while (!_pending.empty() && _pending.front().due <= now) {
            const auto& reply = _pending.front();
            push<PartialResult>(reply.to, reply.job_id, reply.chunk_index, reply.value);
            _pending.pop_front();
        }
        if (_pending.empty()) {
            stopTicking();
        }
    }

    void on(qb::KillEvent&) {
        stopTicking();
        kill();
    }

private:
    struct Reply {
        Clock::time_point due;
        qb::ActorId to;
        JobId job_id;
        ChunkIndex chunk_index;
        Value value;
    };

    void stopTicking() {
        if (_ticking) {
            unregisterCallback(*this);
            _ticking = false;
        }
    }

    const std::chrono::milliseconds _delay;
    std::deque<Reply> _pending;
    bool _ticking{false};
};

class DuplicatingWorker : public qb::Actor {
public:
    DuplicatingWorker() {
        registerEvent<ChunkTask>(*this);
        registerEvent<qb::KillEvent>(*this);
    }

    void on(ChunkTask& task) {
        const Value value = foldChunk(task);
        push<PartialResult>(task.getSource(), task.job_id, task.chunk_index, value);
        push<PartialResult>(task.getSource(), task.job_id, task.chunk_index, value + 1000);
        push<PartialResult>(task.getSource(), task.job_id, ChunkIndex{99}, Value{1000});
        push<PartialResult>(task.getSource(), task.job_id + 1000, task.chunk_index, Value{1000});
    }

    void on(qb::KillEvent&) { kill(); }
};

class ImpostorActor : public qb::Actor, public qb::ICallback {
public:
    ImpostorActor(qb::ActorId manager_id, JobId job_id, ChunkIndex chunk_index, Value value,
                  std::chrono::milliseconds after)
        : _manager_id(manager_id)
        , _job_id(job_id)
        , _chunk_index(chunk_index)
        , _value(value)
        , _after(after) {
        registerEvent<qb::KillEvent>(*this);
    }

    bool onInit() override {
        _fire_at = Clock::now() + _after;
        registerCallback(*this);
        return true;
    }

    void onCallback() override {
        if (Clock::now() >= _fire_at) {
            push<PartialResult>(_manager_id, _job_id, _chunk_index, _value);
            stopTicking();
        }
    }

    void on(qb::KillEvent&) {
        stopTicking();
        kill();
    }

private:
    void stopTicking() {
        if (_ticking) {
            unregisterCallback(*this);
            _ticking = false;
        }
    }

    const qb::ActorId _manager_id;
    const JobId _job_id;
    const ChunkIndex _chunk_index;
    const Value _value;
    const std::chrono::milliseconds _after;
    Clock::time_point _fire_at;
    bool _ticking{true};
};

inline DataPtr sequence(Value first, Value last) {
    auto values = std::make_shared<std::vector<Value>>();
    for (Value v = first; v <= last; ++v) {
        values->push_back(v);
    }
    return values;
}

} // namespace scatter::test
