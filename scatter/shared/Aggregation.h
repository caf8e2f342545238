/**
 * @file scatter/shared/Aggregation.h
 * @brief Aggregation functions folded by workers and combined by the manager.
 *
 * @details
 * An `AggregationFunction` is a plain value (name, combine function pointer and
 * identity element) so it can travel inside any `qb::Event` without allocation.
 * The combine operation must be associative and commutative: chunk order and
 * arrival order of partial results are not preserved. This is a caller contract
 * and is not checked at runtime.
 *
 * Arithmetic built-ins wrap on overflow.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scatter {

using Value = uint64_t;
using CombineFn = Value (*)(Value, Value);

struct AggregationFunction {
    const char* name = "sum";
    CombineFn combine = nullptr;
    Value identity = 0;

    Value operator()(Value lhs, Value rhs) const { return combine(lhs, rhs); }

    static AggregationFunction sum();
    static AggregationFunction product();
    static AggregationFunction min();
    static AggregationFunction max();
    static AggregationFunction bitAnd();
    static AggregationFunction bitOr();
    static AggregationFunction bitXor();

    /**
     * @brief Wraps a caller supplied operation
     * @param name Static string used in logs
     * @param fn Associative and commutative combine function
     * @param identity Neutral element of fn
     */
    static AggregationFunction custom(const char* name, CombineFn fn, Value identity);

    /**
     * @brief Looks up a built-in by name ("sum", "product", "min", "max",
     *        "bit_and", "bit_or", "bit_xor")
     */
    static std::optional<AggregationFunction> byName(const std::string& name);

    static std::vector<std::string> builtinNames();
};

/**
 * @brief Folds [first, last) with op, seeded with op.identity
 *
 * An empty range yields the identity element.
 */
template <typename It>
Value fold(const AggregationFunction& op, It first, It last) {
    Value acc = op.identity;
    for (; first != last; ++first) {
        acc = op.combine(acc, *first);
    }
    return acc;
}

inline Value fold(const AggregationFunction& op, const std::vector<Value>& values) {
    return fold(op, values.begin(), values.end());
}

} // namespace scatter
