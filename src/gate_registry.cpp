#include "gate_registry.hpp"

#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "gates/classical_gates.hpp"
#include "gates/measurement.hpp"
#include "gates/noise_gates.hpp"
#include "gates/single_qubit_gates.hpp"
#include "gates/two_qubit_gates.hpp"
#include "qubit.hpp"

namespace dmsim {

double GateArguments::param(const std::string& key) const {
    const auto it = params.find(key);
    if (it == params.end()) {
        throw std::invalid_argument("Missing gate parameter: " + key);
    }
    return it->second;
}

double GateArguments::param_or(const std::string& key, double fallback) const {
    const auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

void GateRegistry::register_gate(const std::string& name, int arity, Factory factory) {
    if (name.empty() || !factory) {
        throw std::invalid_argument("Gate registration needs a name and a factory");
    }
    if (arity < 1) {
        throw std::invalid_argument("Gate " + name + " must act on at least one target");
    }
    if (entries_.count(name) > 0) {
        throw DuplicateEntityError("Gate already registered: " + name);
    }
    entries_.emplace(name, Entry{arity, std::move(factory)});
    order_.push_back(name);
}

void GateRegistry::register_alias(const std::string& alias, const std::string& target) {
    const auto it = entries_.find(target);
    if (it == entries_.end()) {
        throw UnknownGateError("Cannot alias unknown gate: " + target);
    }
    register_gate(alias, it->second.arity, it->second.factory);
}

bool GateRegistry::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

GatePtr GateRegistry::create(const std::string& name, const GateArguments& args) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw UnknownGateError("Unknown gate: " + name);
    }
    if (static_cast<int>(args.qubits.size()) != it->second.arity) {
        throw std::invalid_argument(
            "Gate " + name + " expects " + std::to_string(it->second.arity) +
            " target(s), got " + std::to_string(args.qubits.size()));
    }
    GatePtr gate = it->second.factory(args);
    if (args.conditional_bit) {
        return std::make_shared<ConditionalGate>(
            *args.conditional_bit, args.time, std::vector<GatePtr>{}, std::vector<GatePtr>{gate});
    }
    return gate;
}

std::vector<std::string> GateRegistry::names() const {
    return order_;
}

GateRegistry make_default_gate_registry() {
    GateRegistry registry;
    registry.register_gate("hadamard", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<Hadamard>(a.qubits[0], a.time);
    });
    registry.register_gate("rotate_x", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<RotateX>(
            a.qubits[0], a.time, a.param("angle"), a.param_or("dephasing_angle", 0.0));
    });
    registry.register_gate("rotate_y", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<RotateY>(
            a.qubits[0], a.time, a.param("angle"), a.param_or("dephasing_angle", 0.0));
    });
    registry.register_gate("rotate_z", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<RotateZ>(
            a.qubits[0], a.time, a.param("angle"), a.param_or("dephasing_angle", 0.0));
    });
    registry.register_gate("rotate_euler", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<RotateEuler>(
            a.qubits[0], a.time, a.param("theta"), a.param("phi"), a.param("lamda"));
    });
    registry.register_gate("cphase", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<CPhase>(a.qubits[0], a.qubits[1], a.time);
    });
    registry.register_gate("cnot", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<CNOT>(a.qubits[0], a.qubits[1], a.time);
    });
    registry.register_gate("iswap", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<ISwap>(a.qubits[0], a.qubits[1], a.time);
    });
    registry.register_gate("swap", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<Swap>(a.qubits[0], a.qubits[1], a.time);
    });
    registry.register_gate("cphase_rotation", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<CPhaseRotation>(
            a.qubits[0], a.qubits[1], a.param("angle"), a.time);
    });
    registry.register_gate("iswap_rotation", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<ISwapRotation>(
            a.qubits[0], a.qubits[1], a.param("angle"), a.time);
    });
    registry.register_gate("amp_ph_damping", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<AmpPhDamp>(
            a.qubits[0],
            a.time,
            a.param("duration"),
            a.param_or("t1", kInfiniteTime),
            a.param_or("t2", kInfiniteTime));
    });
    registry.register_gate("depolarizing_noise", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<DepolarizingNoise>(a.qubits[0], a.time, a.param("p"));
    });
    registry.register_gate("bitflip_noise", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<BitflipNoise>(a.qubits[0], a.time, a.param("p"));
    });
    registry.register_gate("measurement", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<Measurement>(a.qubits[0], a.time, a.sampler, a.output_bit);
    });
    registry.register_gate("reset", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<ResetGate>(
            a.qubits[0], a.time, static_cast<int>(a.param_or("state", 0.0)));
    });
    registry.register_gate("classical_not", 1, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<ClassicalNOT>(a.qubits[0], a.time);
    });
    registry.register_gate("classical_cnot", 2, [](const GateArguments& a) -> GatePtr {
        return std::make_shared<ClassicalCNOT>(a.qubits[0], a.qubits[1], a.time);
    });

    registry.register_alias("H", "hadamard");
    registry.register_alias("Had", "hadamard");
    registry.register_alias("RX", "rotate_x");
    registry.register_alias("Rx", "rotate_x");
    registry.register_alias("RY", "rotate_y");
    registry.register_alias("Ry", "rotate_y");
    registry.register_alias("RZ", "rotate_z");
    registry.register_alias("Rz", "rotate_z");
    registry.register_alias("CZ", "cphase");
    registry.register_alias("CNOT", "cnot");
    registry.register_alias("ISwap", "iswap");
    registry.register_alias("Reset", "reset");
    registry.register_alias("Measure", "measurement");
    return registry;
}

const GateRegistry& default_gate_registry() {
    static const GateRegistry registry = make_default_gate_registry();
    return registry;
}

}  // namespace dmsim
