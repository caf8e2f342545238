/**
 * @file scatter/shared/Aggregation.cpp
 * @brief Built-in aggregation functions and name lookup.
 */

#include "Aggregation.h"

#include <limits>

namespace scatter {

namespace {

Value wrappingAdd(Value lhs, Value rhs) { return lhs + rhs; }
Value wrappingMul(Value lhs, Value rhs) { return lhs * rhs; }
Value minOf(Value lhs, Value rhs) { return rhs < lhs ? rhs : lhs; }
Value maxOf(Value lhs, Value rhs) { return lhs < rhs ? rhs : lhs; }
Value andOf(Value lhs, Value rhs) { return lhs & rhs; }
Value orOf(Value lhs, Value rhs) { return lhs | rhs; }
Value xorOf(Value lhs, Value rhs) { return lhs ^ rhs; }

constexpr Value kAllOnes = std::numeric_limits<Value>::max();

} // namespace

AggregationFunction AggregationFunction::sum() { return {"sum", &wrappingAdd, 0}; }
AggregationFunction AggregationFunction::product() { return {"product", &wrappingMul, 1}; }
AggregationFunction AggregationFunction::min() { return {"min", &minOf, kAllOnes}; }
AggregationFunction AggregationFunction::max() { return {"max", &maxOf, 0}; }
AggregationFunction AggregationFunction::bitAnd() { return {"bit_and", &andOf, kAllOnes}; }
AggregationFunction AggregationFunction::bitOr() { return {"bit_or", &orOf, 0}; }
AggregationFunction AggregationFunction::bitXor() { return {"bit_xor", &xorOf, 0}; }

AggregationFunction AggregationFunction::custom(const char* name, CombineFn fn, Value identity) {
    return {name, fn, identity};
}

std::optional<AggregationFunction> AggregationFunction::byName(const std::string& name) {
    if (name == "sum") return sum();
    if (name == "product") return product();
    if (name == "min") return min();
    if (name == "max") return max();
    if (name == "bit_and") return bitAnd();
    if (name == "bit_or") return bitOr();
    if (name == "bit_xor") return bitXor();
    return std::nullopt;
}

std::vector<std::string> AggregationFunction::builtinNames() {
    return {"sum", "product", "min", "max", "bit_and", "bit_or", "bit_xor"};
}

} // namespace scatter
