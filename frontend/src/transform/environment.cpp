#include "environment.h"

namespace metric {

Environment::Environment()
    : cost_cell(std::make_shared<int64_t>(0)) {}

Environment Environment::empty() {
    return Environment();
}

Environment Environment::add(const std::string& name, const RuntimeValue& value) const {
    Environment next = *this;
    next.bindings[name] = value;
    return next;
}

Environment Environment::set(const std::string& name, const RuntimeValue& value) const {
    if (!mem(name)) {
        throw EvaluationError("Cannot set undefined variable: " + name);
    }
    Environment next = *this;
    next.bindings[name] = value;
    return next;
}

Environment Environment::set_list_element(const std::string& name, int64_t index,
                                          const RuntimeValue& value) const {
    auto it = bindings.find(name);
    if (it == bindings.end()) {
        throw EvaluationError("Cannot set undefined variable: " + name);
    }
    if (!is_list_value(it->second)) {
        throw EvaluationError("Variable '" + name + "' is not a list");
    }
    const auto& current = std::get<std::shared_ptr<RuntimeList>>(it->second);
    int64_t length = current ? static_cast<int64_t>(current->elements.size()) : 0;
    if (index < 0 || index >= length) {
        throw EvaluationError("List index " + std::to_string(index) + " out of bounds (list length: " +
                              std::to_string(length) + ")");
    }
    if (!is_scalar_value(value)) {
        throw EvaluationError("Cannot assign list to list element");
    }

    // Copy on write: other environments may still hold the old list
    std::vector<RuntimeValue> elements = current->elements;
    elements[static_cast<size_t>(index)] = value;

    Environment next = *this;
    next.bindings[name] = make_list_value(std::move(elements));
    return next;
}

Environment Environment::add_function(const std::string& name, StmtPtr declaration) const {
    Environment next = *this;
    next.functions[name] = std::move(declaration);
    return next;
}

Environment Environment::child() const {
    Environment next;
    next.functions = functions;
    next.cost_cell = cost_cell;
    return next;
}

std::optional<RuntimeValue> Environment::find(const std::string& name) const {
    auto it = bindings.find(name);
    if (it == bindings.end()) return std::nullopt;
    return it->second;
}

bool Environment::mem(const std::string& name) const {
    return bindings.count(name) != 0;
}

StmtPtr Environment::get_function(const std::string& name) const {
    auto it = functions.find(name);
    if (it == functions.end()) return nullptr;
    return it->second;
}

bool Environment::has_function(const std::string& name) const {
    return functions.count(name) != 0;
}

}
