#include "sparse_dm.hpp"

#include <algorithm>
#include <stdexcept>

#include "errors.hpp"

namespace dmsim {

SparseDensityMatrix::SparseDensityMatrix(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (!classical_.emplace(name, 0).second) {
            throw DuplicateEntityError("Duplicate qubit name in state: " + name);
        }
    }
}

void SparseDensityMatrix::check_value(int value) {
    if (value != 0 && value != 1) {
        throw std::invalid_argument("Classical value must be 0 or 1");
    }
}

int SparseDensityMatrix::dense_index(const std::string& qubit) const {
    const auto it = std::find(dense_qubits_.begin(), dense_qubits_.end(), qubit);
    if (it == dense_qubits_.end()) {
        return -1;
    }
    return static_cast<int>(it - dense_qubits_.begin());
}

bool SparseDensityMatrix::is_dense(const std::string& qubit) const {
    return dense_index(qubit) >= 0;
}

bool SparseDensityMatrix::has_qubit(const std::string& qubit) const {
    return is_dense(qubit) || classical_.count(qubit) > 0;
}

void SparseDensityMatrix::check_known(const std::string& qubit) const {
    if (!has_qubit(qubit)) {
        throw UnknownQubitError("Unknown qubit in state: " + qubit);
    }
}

void SparseDensityMatrix::ensure_dense(const std::string& qubit) {
    if (is_dense(qubit)) {
        return;
    }
    const auto it = classical_.find(qubit);
    if (it == classical_.end()) {
        throw UnknownQubitError("Unknown qubit in state: " + qubit);
    }
    dm_.add_qubit(it->second);
    dense_qubits_.push_back(qubit);
    classical_.erase(it);
}

void SparseDensityMatrix::apply_single_qubit_ptm(
    const std::string& qubit,
    const SingleQubitPtm& ptm
) {
    ensure_dense(qubit);
    dm_.apply_single_qubit_ptm(dense_index(qubit), ptm);
}

void SparseDensityMatrix::apply_two_qubit_ptm(
    const std::string& qubit0,
    const std::string& qubit1,
    const TwoQubitPtm& ptm
) {
    if (qubit0 == qubit1) {
        throw std::invalid_argument("Two-qubit PTM requires distinct targets");
    }
    ensure_dense(qubit0);
    ensure_dense(qubit1);
    dm_.apply_two_qubit_ptm(dense_index(qubit0), dense_index(qubit1), ptm);
}

std::pair<double, double> SparseDensityMatrix::peek_measurement(const std::string& qubit) const {
    const int index = dense_index(qubit);
    if (index >= 0) {
        return dm_.peek(index);
    }
    const auto it = classical_.find(qubit);
    if (it == classical_.end()) {
        throw UnknownQubitError("Unknown qubit in state: " + qubit);
    }
    const double total = dm_.trace();
    if (it->second == 0) {
        return {total, 0.0};
    }
    return {0.0, total};
}

void SparseDensityMatrix::project_measurement(const std::string& qubit, int outcome) {
    check_value(outcome);
    const int index = dense_index(qubit);
    if (index >= 0) {
        dm_.project_and_remove(index, outcome);
        dense_qubits_.erase(dense_qubits_.begin() + index);
        classical_[qubit] = outcome;
        return;
    }
    const auto it = classical_.find(qubit);
    if (it == classical_.end()) {
        throw UnknownQubitError("Unknown qubit in state: " + qubit);
    }
    if (it->second != outcome) {
        dm_.scale(0.0);
        it->second = outcome;
    }
}

void SparseDensityMatrix::set_classical_bit(const std::string& name, int value) {
    check_value(value);
    const int index = dense_index(name);
    if (index >= 0) {
        dm_.trace_out(index);
        dense_qubits_.erase(dense_qubits_.begin() + index);
    }
    classical_[name] = value;
}

int SparseDensityMatrix::classical_bit(const std::string& name) const {
    const auto it = classical_.find(name);
    if (it != classical_.end()) {
        return it->second;
    }
    if (is_dense(name)) {
        throw std::runtime_error("Qubit " + name + " is not in a classical state");
    }
    throw UnknownQubitError("Unknown classical bit in state: " + name);
}

std::map<std::string, int> SparseDensityMatrix::classical_registers() const {
    return classical_;
}

void SparseDensityMatrix::scale_classical_probability(double factor) {
    classical_probability_ *= factor;
}

double SparseDensityMatrix::trace() const {
    return classical_probability_ * dm_.trace();
}

void SparseDensityMatrix::renormalize() {
    const double dense_trace = dm_.trace();
    if (dense_trace > 0.0) {
        dm_.scale(1.0 / dense_trace);
    }
    classical_probability_ = 1.0;
}

}  // namespace dmsim
