/**
 * @file scatter/app/main.cpp
 * @brief Entry point of `scatter-demo`.
 *
 * @details
 * 1. Parses the command line into a `DemoConfig`.
 * 2. Creates the `WorkerActor`s, spread over the configured cores
 *    (`core = i % cores`), and keeps their ids.
 * 3. Creates the `ManagerActor` on core 0 with that fixed worker list.
 * 4. Creates a `RequesterActor` asking for the aggregate of 1..data_size.
 * 5. Runs the engine until the requester broadcasts `qb::KillEvent`.
 * 6. Checks the answer against a sequential fold (and, for "sum", against
 *    the triangular number n(n+1)/2) and exits non-zero on any mismatch or
 *    failure reply.
 */

#include <qb/main.h>
#include <qb/io.h>

#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include "../manager/ManagerActor.h"
#include "../worker/WorkerActor.h"
#include "DemoConfig.h"
#include "RequesterActor.h"

using namespace scatter;

namespace {

// n(n+1)/2 in wrapping arithmetic; halve the even factor first
Value triangularNumber(Value n) {
    return n % 2 == 0 ? (n / 2) * (n + 1) : n * ((n + 1) / 2);
}

} // namespace

int main(int argc, char** argv) {
    DemoConfig config;
    try {
        config = DemoConfig::fromArgs(argc, argv);
    } catch (const std::exception& e) {
        qb::io::cerr() << "Error: " << e.what() << "\n" << DemoConfig::usage(argv[0]) << std::endl;
        return 1;
    }

    DataPtr data;
    RequestOutcome outcome;

    try {
        auto values = std::make_shared<std::vector<Value>>(config.data_size);
        std::iota(values->begin(), values->end(), Value{1});
        data = values;

        qb::Main engine;

        qb::ActorIdList worker_ids;
        for (std::size_t i = 0; i < config.workers; ++i) {
            const int core_id = static_cast<int>(i % config.cores);
            worker_ids.push_back(engine.addActor<WorkerActor>(core_id, config.verbose));
        }

        auto manager_id = engine.addActor<ManagerActor>(0, worker_ids, config.managerConfig());
        engine.addActor<RequesterActor>(0, manager_id, data, config.op, config.timeout, &outcome);

        qb::io::cout() << "Sending request: " << config.op.name << " over " << config.data_size
                       << " values, " << config.workers << " workers, policy "
                       << toString(config.policy) << std::endl;

        engine.start();
        engine.join();

        if (engine.hasError()) {
            qb::io::cerr() << "Engine stopped due to an error." << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (outcome.failure) {
        qb::io::cerr() << "Request failed: " << toString(*outcome.failure) << " - " << outcome.error
                       << std::endl;
        return 1;
    }
    if (!outcome.result) {
        qb::io::cerr() << "No answer received" << std::endl;
        return 1;
    }

    const Value expected = fold(config.op, *data);
    if (*outcome.result != expected) {
        qb::io::cerr() << "Mismatch: got " << *outcome.result << ", expected " << expected << std::endl;
        return 1;
    }
    if (std::string(config.op.name) == "sum" &&
        *outcome.result != triangularNumber(static_cast<Value>(config.data_size))) {
        qb::io::cerr() << "Sum does not match the triangular number of " << config.data_size << std::endl;
        return 1;
    }

    qb::io::cout() << "Result verified" << std::endl;
    return 0;
}
