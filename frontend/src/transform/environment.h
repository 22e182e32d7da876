#pragma once
#include "ast.h"
#include "runtime_value.h"
#include <optional>
#include <unordered_map>

namespace metric {

// Persistent variable/function context. Every mutating operation returns a
// new Environment with copied maps; all environments derived from the same
// root share one operation counter.
class Environment {
    std::unordered_map<std::string, RuntimeValue> bindings;
    std::unordered_map<std::string, StmtPtr> functions;
    std::shared_ptr<int64_t> cost_cell;

public:
    Environment();
    static Environment empty();

    Environment add(const std::string& name, const RuntimeValue& value) const;
    Environment set(const std::string& name, const RuntimeValue& value) const;
    Environment set_list_element(const std::string& name, int64_t index, const RuntimeValue& value) const;
    Environment add_function(const std::string& name, StmtPtr declaration) const;

    // Fresh bindings sharing this environment's functions and counter.
    Environment child() const;

    std::optional<RuntimeValue> find(const std::string& name) const;
    bool mem(const std::string& name) const;
    StmtPtr get_function(const std::string& name) const;
    bool has_function(const std::string& name) const;

    void increment_cost(int64_t amount = 1) const { *cost_cell += amount; }
    int64_t cost() const { return *cost_cell; }
    bool shares_cost_with(const Environment& other) const { return cost_cell == other.cost_cell; }
};

}
