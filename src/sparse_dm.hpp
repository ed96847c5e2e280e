#pragma once

#include <map>
#include <string>
#include <vector>

#include "density_matrix.hpp"
#include "state_backend.hpp"

namespace dmsim {

// CPU state backend that keeps qubits in a classical product state until a
// gate touches them. Touched qubits move into a dense DensityMatrix; a
// projective measurement moves them back out with the projected value.
class SparseDensityMatrix : public StateBackend {
  public:
    explicit SparseDensityMatrix(const std::vector<std::string>& names);

    void apply_single_qubit_ptm(
        const std::string& qubit,
        const SingleQubitPtm& ptm
    ) override;

    void apply_two_qubit_ptm(
        const std::string& qubit0,
        const std::string& qubit1,
        const TwoQubitPtm& ptm
    ) override;

    std::pair<double, double> peek_measurement(const std::string& qubit) const override;
    void project_measurement(const std::string& qubit, int outcome) override;

    // Setting a dense qubit traces it out first, which amounts to a reset.
    // Unknown names register a new classical register.
    void set_classical_bit(const std::string& name, int value) override;
    int classical_bit(const std::string& name) const override;
    std::map<std::string, int> classical_registers() const override;

    void scale_classical_probability(double factor) override;

    double trace() const override;
    void renormalize() override;

    void ensure_dense(const std::string& qubit);
    bool is_dense(const std::string& qubit) const;
    bool has_qubit(const std::string& qubit) const;

    const std::map<std::string, int>& classical() const { return classical_; }
    double classical_probability() const { return classical_probability_; }
    const DensityMatrix& full_dm() const { return dm_; }

    // Names of the dense qubits, indexed like full_dm().
    const std::vector<std::string>& dense_qubits() const { return dense_qubits_; }

  private:
    int dense_index(const std::string& qubit) const;
    void check_known(const std::string& qubit) const;
    static void check_value(int value);

    DensityMatrix dm_;
    std::vector<std::string> dense_qubits_;
    std::map<std::string, int> classical_;
    double classical_probability_ = 1.0;
};

}  // namespace dmsim
