#pragma once

#include <map>
#include <string>
#include <utility>

#include "ptm.hpp"

namespace dmsim {

// Capability interface a circuit replay drives. Qubits and classical
// registers are addressed by name.
class StateBackend {
  public:
    virtual ~StateBackend() = default;

    virtual void apply_single_qubit_ptm(
        const std::string& qubit,
        const SingleQubitPtm& ptm
    ) = 0;

    virtual void apply_two_qubit_ptm(
        const std::string& qubit0,
        const std::string& qubit1,
        const TwoQubitPtm& ptm
    ) = 0;

    // Non-destructive, unnormalized weights of the two projective outcomes.
    virtual std::pair<double, double> peek_measurement(const std::string& qubit) const = 0;

    // Collapses onto `outcome` without renormalizing.
    virtual void project_measurement(const std::string& qubit, int outcome) = 0;

    virtual void set_classical_bit(const std::string& name, int value) = 0;
    virtual int classical_bit(const std::string& name) const = 0;
    virtual std::map<std::string, int> classical_registers() const = 0;

    // Folds a sampler path weight into the trial's classical probability.
    virtual void scale_classical_probability(double factor) = 0;

    virtual double trace() const = 0;
    virtual void renormalize() = 0;
};

}  // namespace dmsim
