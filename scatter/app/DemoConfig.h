/**
 * @file scatter/app/DemoConfig.h
 * @brief Command line settings of the `scatter-demo` program.
 *
 * @details
 * Positional arguments, all optional:
 *
 *   scatter-demo [workers] [data_size] [op] [timeout_ms] [policy] [cores]
 *
 * Defaults: 3 workers, 1000 values, "sum", no deadline, "round_robin", 1 core.
 * The data size is capped at `kMaxDataSize` values.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "../manager/ManagerActor.h"
#include "../shared/Aggregation.h"

namespace scatter {

struct DemoConfig {
    static constexpr std::size_t kMaxDataSize = 100000000;

    std::size_t workers = 3;
    std::size_t data_size = 1000;
    AggregationFunction op = AggregationFunction::sum();
    std::chrono::milliseconds timeout{0};
    DispatchPolicy policy = DispatchPolicy::RoundRobin;
    std::size_t cores = 1;
    bool verbose = false;

    /**
     * @brief Builds a configuration from argv
     * @throws std::invalid_argument on a malformed number or an unknown name
     */
    static DemoConfig fromArgs(int argc, char** argv);

    ManagerConfig managerConfig() const;

    static std::string usage(const char* program);
};

} // namespace scatter
