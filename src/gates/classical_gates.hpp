#pragma once

#include <string>
#include <vector>

#include "gates/gate.hpp"

namespace dmsim {

class ClassicalNOT : public Gate {
  public:
    ClassicalNOT(std::string bit, double time);

    const std::string& bit() const { return bit_; }

    std::vector<std::string> involved_qubits() const override { return {}; }
    std::vector<std::string> classical_bits() const override;
    bool is_classical() const override { return true; }

    void apply_to(StateBackend& state) override;

    std::string kind() const override { return "classical_not"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string bit_;
};

// target ^= control.
class ClassicalCNOT : public Gate {
  public:
    ClassicalCNOT(std::string control, std::string target, double time);

    const std::string& control() const { return control_; }
    const std::string& target() const { return target_; }

    std::vector<std::string> involved_qubits() const override { return {}; }
    std::vector<std::string> classical_bits() const override;
    bool is_classical() const override { return true; }

    void apply_to(StateBackend& state) override;

    std::string kind() const override { return "classical_cnot"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string control_;
    std::string target_;
};

// Reads `control_bit` when applied and runs either `zero_gates` or
// `one_gates` in their stored order. The sub-gates keep their own times but
// only the conditional gate itself takes part in circuit ordering.
class ConditionalGate : public Gate {
  public:
    ConditionalGate(
        std::string control_bit,
        double time,
        std::vector<GatePtr> zero_gates,
        std::vector<GatePtr> one_gates
    );

    const std::string& control_bit() const { return control_bit_; }
    const std::vector<GatePtr>& zero_gates() const { return zero_gates_; }
    const std::vector<GatePtr>& one_gates() const { return one_gates_; }

    // Union of the sub-gates' quantum targets.
    std::vector<std::string> involved_qubits() const override;
    // The control bit followed by the sub-gates' registers.
    std::vector<std::string> classical_bits() const override;

    void apply_to(StateBackend& state) override;

    std::string kind() const override { return "conditional"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string control_bit_;
    std::vector<GatePtr> zero_gates_;
    std::vector<GatePtr> one_gates_;
};

}  // namespace dmsim
