#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gates/gate.hpp"
#include "sampler.hpp"

namespace dmsim {

// Loosely typed constructor arguments for creating a gate by name.
struct GateArguments {
    std::vector<std::string> qubits;
    double time = 0.0;

    // Numeric parameters such as "angle", "duration", "t1", "p".
    std::map<std::string, double> params;

    // Measurement only.
    std::shared_ptr<Sampler> sampler;
    std::optional<std::string> output_bit;

    // When set, the created gate only runs while this bit reads 1.
    std::optional<std::string> conditional_bit;

    // Throws std::invalid_argument when `key` is missing.
    double param(const std::string& key) const;
    double param_or(const std::string& key, double fallback) const;
};

class GateRegistry final {
  public:
    using Factory = std::function<GatePtr(const GateArguments& args)>;

    // `arity` is the number of qubit/bit names the gate takes.
    void register_gate(const std::string& name, int arity, Factory factory);
    void register_alias(const std::string& alias, const std::string& target);

    bool contains(const std::string& name) const;

    // Throws UnknownGateError for unregistered names and
    // std::invalid_argument when the qubit count does not match.
    GatePtr create(const std::string& name, const GateArguments& args) const;

    // Registered names and aliases in registration order.
    std::vector<std::string> names() const;

  private:
    struct Entry {
        int arity = 0;
        Factory factory;
    };

    std::map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

GateRegistry make_default_gate_registry();

// Process-wide registry holding every built-in gate, built on first use.
const GateRegistry& default_gate_registry();

}  // namespace dmsim
