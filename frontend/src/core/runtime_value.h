#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace metric {

struct RuntimeList;

// Value produced by the evaluator. Lists hold scalars only.
using RuntimeValue = std::variant<int64_t,
                                  double,
                                  bool,
                                  std::shared_ptr<RuntimeList>>;

struct RuntimeList {
    std::vector<RuntimeValue> elements;
};

RuntimeValue make_list_value(std::vector<RuntimeValue> elements);

inline bool is_list_value(const RuntimeValue& value) {
    return std::holds_alternative<std::shared_ptr<RuntimeList>>(value);
}

inline bool is_scalar_value(const RuntimeValue& value) {
    return !is_list_value(value);
}

// Short kind name used in runtime diagnostics: int, float, bool or list.
std::string runtime_value_kind(const RuntimeValue& value);

// Textual form written by print: lowercase booleans, floats always with a
// decimal point or exponent, lists as "[a, b, c]".
std::string format_runtime_value(const RuntimeValue& value);
std::string format_float(double value);

// Three-way comparison of numeric scalars, booleans counting as 0 and 1.
// Integers are compared against floats exactly, without rounding either side.
// Returns -1, 0 or 1, or NUMERIC_UNORDERED when a NaN is involved.
constexpr int NUMERIC_UNORDERED = 2;
int compare_numeric_values(const RuntimeValue& left, const RuntimeValue& right);

// Structural equality. Lists compare element-wise; numeric scalars compare
// by value.
bool runtime_values_equal(const RuntimeValue& left, const RuntimeValue& right);

// Truthiness for logical operators applied to non-boolean values.
bool runtime_value_truthy(const RuntimeValue& value);

} // namespace metric
