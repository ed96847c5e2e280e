#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "ptm.hpp"

namespace dmsim {

// Dense density matrix over n qubits, stored as 4^n real coefficients in the
// normalized Pauli basis. Qubit k is base-4 digit k of the coefficient index.
class DensityMatrix {
  public:
    // Zero-qubit matrix with unit trace.
    DensityMatrix();
    // n qubits in |0...0>.
    explicit DensityMatrix(int n_qubits);

    int num_qubits() const { return n_qubits_; }
    const std::vector<double>& data() const { return coefficients_; }

    void apply_single_qubit_ptm(int q, const SingleQubitPtm& ptm);
    void apply_two_qubit_ptm(int q0, int q1, const TwoQubitPtm& ptm);

    // Tensors a qubit in the computational state `value` onto the matrix and
    // returns its index (always the new highest index).
    int add_qubit(int value);

    // Projects qubit q onto `outcome` without renormalizing and removes it.
    // Higher qubit indices shift down by one.
    void project_and_remove(int q, int outcome);

    // Partial trace over qubit q. Higher qubit indices shift down by one.
    void trace_out(int q);

    // Unnormalized weights of outcomes 0 and 1 for qubit q.
    std::pair<double, double> peek(int q) const;

    double trace() const;
    double purity() const;

    // Populations of the 2^n computational basis states; bit k of the index
    // is the value of qubit k.
    std::vector<double> diagonal() const;

    void scale(double factor);

  private:
    void check_qubit(int q) const;
    std::size_t stride(int q) const;

    int n_qubits_ = 0;
    std::vector<double> coefficients_;
};

}  // namespace dmsim
