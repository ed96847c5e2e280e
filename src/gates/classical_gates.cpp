#include "gates/classical_gates.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dmsim {

namespace {

void append_unique(std::vector<std::string>& names, const std::vector<std::string>& extra) {
    for (const auto& name : extra) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
}

std::vector<GatePtr> remap_all(
    const std::vector<GatePtr>& gates,
    const NameMap& name_map,
    double time_offset
) {
    std::vector<GatePtr> out;
    out.reserve(gates.size());
    for (const auto& gate : gates) {
        out.push_back(gate->remapped(name_map, time_offset));
    }
    return out;
}

}  // namespace

ClassicalNOT::ClassicalNOT(std::string bit, double time)
    : Gate(time, 0.0), bit_(std::move(bit)) {
    if (bit_.empty()) {
        throw std::invalid_argument("Classical bit must be named");
    }
}

std::vector<std::string> ClassicalNOT::classical_bits() const {
    return {bit_};
}

void ClassicalNOT::apply_to(StateBackend& state) {
    state.set_classical_bit(bit_, 1 - state.classical_bit(bit_));
}

std::shared_ptr<Gate> ClassicalNOT::clone() const {
    return std::make_shared<ClassicalNOT>(*this);
}

void ClassicalNOT::remap(const NameMap& name_map, double /*time_offset*/) {
    bit_ = remap_name(name_map, bit_);
}

ClassicalCNOT::ClassicalCNOT(std::string control, std::string target, double time)
    : Gate(time, 0.0), control_(std::move(control)), target_(std::move(target)) {
    if (control_.empty() || target_.empty()) {
        throw std::invalid_argument("Classical bits must be named");
    }
    if (control_ == target_) {
        throw std::invalid_argument("Classical CNOT needs distinct bits");
    }
}

std::vector<std::string> ClassicalCNOT::classical_bits() const {
    return {control_, target_};
}

void ClassicalCNOT::apply_to(StateBackend& state) {
    const int control = state.classical_bit(control_);
    const int target = state.classical_bit(target_);
    state.set_classical_bit(target_, target ^ control);
}

std::shared_ptr<Gate> ClassicalCNOT::clone() const {
    return std::make_shared<ClassicalCNOT>(*this);
}

void ClassicalCNOT::remap(const NameMap& name_map, double /*time_offset*/) {
    control_ = remap_name(name_map, control_);
    target_ = remap_name(name_map, target_);
}

ConditionalGate::ConditionalGate(
    std::string control_bit,
    double time,
    std::vector<GatePtr> zero_gates,
    std::vector<GatePtr> one_gates
)
    : Gate(time, 0.0)
    , control_bit_(std::move(control_bit))
    , zero_gates_(std::move(zero_gates))
    , one_gates_(std::move(one_gates)) {
    if (control_bit_.empty()) {
        throw std::invalid_argument("Conditional gate control bit must be named");
    }
    for (const auto* branch : {&zero_gates_, &one_gates_}) {
        for (const auto& gate : *branch) {
            if (!gate) {
                throw std::invalid_argument("Conditional gate branch holds a null gate");
            }
        }
    }
}

std::vector<std::string> ConditionalGate::involved_qubits() const {
    std::vector<std::string> names;
    for (const auto* branch : {&zero_gates_, &one_gates_}) {
        for (const auto& gate : *branch) {
            append_unique(names, gate->involved_qubits());
        }
    }
    return names;
}

std::vector<std::string> ConditionalGate::classical_bits() const {
    std::vector<std::string> names{control_bit_};
    for (const auto* branch : {&zero_gates_, &one_gates_}) {
        for (const auto& gate : *branch) {
            append_unique(names, gate->classical_bits());
        }
    }
    return names;
}

void ConditionalGate::apply_to(StateBackend& state) {
    const auto& branch = state.classical_bit(control_bit_) == 0 ? zero_gates_ : one_gates_;
    for (const auto& gate : branch) {
        gate->apply_to(state);
    }
}

std::string ConditionalGate::details() const {
    std::ostringstream oss;
    oss << "zero=" << zero_gates_.size() << " one=" << one_gates_.size();
    return oss.str();
}

std::shared_ptr<Gate> ConditionalGate::clone() const {
    return std::make_shared<ConditionalGate>(*this);
}

void ConditionalGate::remap(const NameMap& name_map, double time_offset) {
    control_bit_ = remap_name(name_map, control_bit_);
    zero_gates_ = remap_all(zero_gates_, name_map, time_offset);
    one_gates_ = remap_all(one_gates_, name_map, time_offset);
}

}  // namespace dmsim
