#pragma once
#include "common.h"
#include "runtime_value.h"
#include <cmath>
#include <limits>
#include <string>

namespace metric {

inline bool is_int_value(const RuntimeValue& value) {
    return std::holds_alternative<int64_t>(value);
}

inline bool is_numeric_value(const RuntimeValue& value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
}

inline void expect_number(const RuntimeValue& value, const SourceLocation& loc) {
    if (!is_numeric_value(value)) {
        throw EvaluationError("Expected number, got " + runtime_value_kind(value), loc);
    }
}

inline const RuntimeList& expect_list(const RuntimeValue& value, const SourceLocation& loc) {
    if (!is_list_value(value) || !std::get<std::shared_ptr<RuntimeList>>(value)) {
        throw EvaluationError("Expected list, got " + runtime_value_kind(value), loc);
    }
    return *std::get<std::shared_ptr<RuntimeList>>(value);
}

inline double to_float(const RuntimeValue& value) {
    if (std::holds_alternative<int64_t>(value)) return static_cast<double>(std::get<int64_t>(value));
    return std::get<double>(value);
}

// 64-bit integer arithmetic. Results that do not fit raise instead of wrapping.

inline int64_t checked_add(int64_t a, int64_t b, const SourceLocation& loc) {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        throw EvaluationError("Integer overflow", loc);
    }
    return a + b;
}

inline int64_t checked_sub(int64_t a, int64_t b, const SourceLocation& loc) {
    if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) ||
        (b > 0 && a < std::numeric_limits<int64_t>::min() + b)) {
        throw EvaluationError("Integer overflow", loc);
    }
    return a - b;
}

inline int64_t checked_mul(int64_t a, int64_t b, const SourceLocation& loc) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    bool overflow;
    if (a > 0) {
        overflow = b > 0 ? a > max / b : b < min / a;
    } else {
        overflow = b > 0 ? a < min / b : (a != 0 && b < max / a);
    }
    if (overflow) {
        throw EvaluationError("Integer overflow", loc);
    }
    return a * b;
}

// Quotient rounded toward negative infinity. b must be non-zero.
inline int64_t floor_div(int64_t a, int64_t b, const SourceLocation& loc) {
    if (a == std::numeric_limits<int64_t>::min() && b == -1) {
        throw EvaluationError("Integer overflow", loc);
    }
    int64_t q = a / b;
    if (a % b != 0 && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

// Remainder with the sign of the divisor. b must be non-zero.
inline int64_t floor_mod(int64_t a, int64_t b) {
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

inline double floor_mod(double a, double b) {
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0))) {
        r += b;
    }
    return r;
}

} // namespace metric
