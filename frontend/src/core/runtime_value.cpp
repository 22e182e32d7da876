#include "runtime_value.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace metric {

namespace {

const int DECIMAL_EXPONENT_MIN = -4;
const int DECIMAL_EXPONENT_MAX = 16;

// 2^63, the first double above every int64_t
const double INT64_BOUND = 9223372036854775808.0;

int64_t scalar_as_int(const RuntimeValue& value) {
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? 1 : 0;
    return std::get<int64_t>(value);
}

int compare_int_float(int64_t i, double d) {
    if (std::isnan(d)) return NUMERIC_UNORDERED;
    if (d >= INT64_BOUND) return -1;
    if (d < -INT64_BOUND) return 1;
    double whole = std::floor(d);
    int64_t w = static_cast<int64_t>(whole);
    if (i < w) return -1;
    if (i > w) return 1;
    return d > whole ? -1 : 0;
}

} // namespace

RuntimeValue make_list_value(std::vector<RuntimeValue> elements) {
    auto list = std::make_shared<RuntimeList>();
    list->elements = std::move(elements);
    return list;
}

std::string runtime_value_kind(const RuntimeValue& value) {
    if (std::holds_alternative<int64_t>(value)) return "int";
    if (std::holds_alternative<double>(value)) return "float";
    if (std::holds_alternative<bool>(value)) return "bool";
    return "list";
}

std::string format_float(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    // Shortest scientific rendering that reads back to the same double
    char buf[64];
    for (int precision = 1; precision <= 17; precision++) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
        if (std::strtod(buf, nullptr) == value) break;
    }

    std::string sci(buf);
    bool negative = !sci.empty() && sci[0] == '-';
    if (negative) sci.erase(0, 1);

    size_t e_pos = sci.find('e');
    std::string mantissa = sci.substr(0, e_pos);
    int exponent = std::atoi(sci.c_str() + e_pos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits += c;
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    std::string result;
    if (exponent < DECIMAL_EXPONENT_MIN || exponent >= DECIMAL_EXPONENT_MAX) {
        result = digits.substr(0, 1);
        if (digits.size() > 1) {
            result += "." + digits.substr(1);
        }
        char exp_buf[16];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
        result += exp_buf;
    } else if (exponent < 0) {
        result = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
    } else {
        size_t int_digits = static_cast<size_t>(exponent) + 1;
        if (digits.size() <= int_digits) {
            result = digits + std::string(int_digits - digits.size(), '0') + ".0";
        } else {
            result = digits.substr(0, int_digits) + "." + digits.substr(int_digits);
        }
    }
    return negative ? "-" + result : result;
}

std::string format_runtime_value(const RuntimeValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return format_float(std::get<double>(value));
    }
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }

    const auto& list = std::get<std::shared_ptr<RuntimeList>>(value);
    std::string out = "[";
    if (list) {
        for (size_t i = 0; i < list->elements.size(); i++) {
            if (i > 0) out += ", ";
            out += format_runtime_value(list->elements[i]);
        }
    }
    out += "]";
    return out;
}

bool runtime_values_equal(const RuntimeValue& left, const RuntimeValue& right) {
    if (is_list_value(left) || is_list_value(right)) {
        if (!is_list_value(left) || !is_list_value(right)) return false;
        const auto& l = std::get<std::shared_ptr<RuntimeList>>(left);
        const auto& r = std::get<std::shared_ptr<RuntimeList>>(right);
        if (l == r) return true;
        if (!l || !r || l->elements.size() != r->elements.size()) return false;
        for (size_t i = 0; i < l->elements.size(); i++) {
            if (!runtime_values_equal(l->elements[i], r->elements[i])) return false;
        }
        return true;
    }

    if (std::holds_alternative<int64_t>(left) && std::holds_alternative<int64_t>(right)) {
        return std::get<int64_t>(left) == std::get<int64_t>(right);
    }
    if (std::holds_alternative<bool>(left) && std::holds_alternative<bool>(right)) {
        return std::get<bool>(left) == std::get<bool>(right);
    }
    return compare_numeric_values(left, right) == 0;
}

int compare_numeric_values(const RuntimeValue& left, const RuntimeValue& right) {
    bool left_float = std::holds_alternative<double>(left);
    bool right_float = std::holds_alternative<double>(right);
    if (left_float && right_float) {
        double l = std::get<double>(left);
        double r = std::get<double>(right);
        if (std::isnan(l) || std::isnan(r)) return NUMERIC_UNORDERED;
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    if (left_float) {
        int order = compare_int_float(scalar_as_int(right), std::get<double>(left));
        return order == NUMERIC_UNORDERED ? order : -order;
    }
    if (right_float) {
        return compare_int_float(scalar_as_int(left), std::get<double>(right));
    }
    int64_t l = scalar_as_int(left);
    int64_t r = scalar_as_int(right);
    return l < r ? -1 : (l > r ? 1 : 0);
}

bool runtime_value_truthy(const RuntimeValue& value) {
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value);
    if (std::holds_alternative<int64_t>(value)) return std::get<int64_t>(value) != 0;
    if (std::holds_alternative<double>(value)) return std::get<double>(value) != 0.0;
    const auto& list = std::get<std::shared_ptr<RuntimeList>>(value);
    return list && !list->elements.empty();
}

} // namespace metric
