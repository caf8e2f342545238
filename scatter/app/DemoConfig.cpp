/**
 * @file scatter/app/DemoConfig.cpp
 * @brief Parses the `scatter-demo` command line.
 */

#include "DemoConfig.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace scatter {

namespace {

std::size_t parseCount(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + text + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " out of range: '" + text + "'");
    }
}

} // namespace

DemoConfig DemoConfig::fromArgs(int argc, char** argv) {
    DemoConfig config;
    if (argc > 7) {
        throw std::invalid_argument("too many arguments");
    }
    if (argc > 1) config.workers = parseCount(argv[1], "worker count");
    if (argc > 2) {
        config.data_size = parseCount(argv[2], "data size");
        if (config.data_size > kMaxDataSize) {
            throw std::invalid_argument("data size must not exceed " + std::to_string(kMaxDataSize));
        }
    }
    if (argc > 3) {
        auto op = AggregationFunction::byName(argv[3]);
        if (!op) {
            throw std::invalid_argument(std::string("unknown aggregation function: ") + argv[3]);
        }
        config.op = *op;
    }
    if (argc > 4) config.timeout = std::chrono::milliseconds(parseCount(argv[4], "timeout"));
    if (argc > 5) config.policy = parsePolicy(argv[5]);
    if (argc > 6) {
        config.cores = parseCount(argv[6], "core count");
        if (config.cores == 0) {
            throw std::invalid_argument("core count must be at least 1");
        }
    }
    if (const char* verbose = std::getenv("SCATTER_VERBOSE")) {
        config.verbose = std::string(verbose) == "1";
    }
    return config;
}

ManagerConfig DemoConfig::managerConfig() const {
    ManagerConfig config;
    config.policy = policy;
    config.job_timeout = timeout;
    config.verbose = verbose;
    return config;
}

std::string DemoConfig::usage(const char* program) {
    std::ostringstream out;
    out << "usage: " << program << " [workers] [data_size] [op] [timeout_ms] [policy] [cores]\n"
        << "  op:     ";
    for (const auto& name : AggregationFunction::builtinNames()) {
        out << name << ' ';
    }
    out << "\n  policy: round_robin least_loaded\n"
        << "  SCATTER_VERBOSE=1 logs every chunk";
    return out.str();
}

} // namespace scatter
