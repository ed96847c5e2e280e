#include "density_matrix.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

namespace dmsim {

namespace {

constexpr std::size_t kPauliZ = 3;

const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

std::size_t pow4(int n) {
    return static_cast<std::size_t>(1) << (2 * n);
}

// Index in an (n+1)-qubit vector of digit `digit` inserted at position q of
// the n-qubit index `reduced`.
std::size_t expand_index(std::size_t reduced, std::size_t q_stride, std::size_t digit) {
    const std::size_t low = reduced % q_stride;
    const std::size_t high = reduced / q_stride;
    return high * q_stride * 4 + digit * q_stride + low;
}

}  // namespace

DensityMatrix::DensityMatrix() : coefficients_(1, 1.0) {}

DensityMatrix::DensityMatrix(int n_qubits) : DensityMatrix() {
    if (n_qubits < 0) {
        throw std::invalid_argument("DensityMatrix requires a non-negative number of qubits");
    }
    for (int q = 0; q < n_qubits; ++q) {
        add_qubit(0);
    }
}

void DensityMatrix::check_qubit(int q) const {
    if (q < 0 || q >= n_qubits_) {
        throw std::out_of_range("Invalid qubit index");
    }
}

std::size_t DensityMatrix::stride(int q) const {
    return pow4(q);
}

void DensityMatrix::apply_single_qubit_ptm(int q, const SingleQubitPtm& ptm) {
    check_qubit(q);
    const std::size_t s = stride(q);
    const std::size_t dim = coefficients_.size();
    std::array<double, 4> in{};
    for (std::size_t idx = 0; idx < dim; ++idx) {
        if ((idx / s) % 4 != 0) {
            continue;
        }
        for (std::size_t p = 0; p < 4; ++p) {
            in[p] = coefficients_[idx + p * s];
        }
        for (std::size_t row = 0; row < 4; ++row) {
            double acc = 0.0;
            for (std::size_t col = 0; col < 4; ++col) {
                acc += ptm[4 * row + col] * in[col];
            }
            coefficients_[idx + row * s] = acc;
        }
    }
}

void DensityMatrix::apply_two_qubit_ptm(int q0, int q1, const TwoQubitPtm& ptm) {
    check_qubit(q0);
    check_qubit(q1);
    if (q0 == q1) {
        throw std::invalid_argument("Two-qubit PTM requires distinct targets");
    }
    const std::size_t s0 = stride(q0);
    const std::size_t s1 = stride(q1);
    const std::size_t dim = coefficients_.size();
    std::array<double, 16> in{};
    for (std::size_t idx = 0; idx < dim; ++idx) {
        if ((idx / s0) % 4 != 0 || (idx / s1) % 4 != 0) {
            continue;
        }
        for (std::size_t p0 = 0; p0 < 4; ++p0) {
            for (std::size_t p1 = 0; p1 < 4; ++p1) {
                in[4 * p0 + p1] = coefficients_[idx + p0 * s0 + p1 * s1];
            }
        }
        for (std::size_t row = 0; row < 16; ++row) {
            double acc = 0.0;
            for (std::size_t col = 0; col < 16; ++col) {
                acc += ptm[16 * row + col] * in[col];
            }
            coefficients_[idx + (row / 4) * s0 + (row % 4) * s1] = acc;
        }
    }
}

int DensityMatrix::add_qubit(int value) {
    if (value != 0 && value != 1) {
        throw std::invalid_argument("Classical qubit value must be 0 or 1");
    }
    const double sign = value == 0 ? 1.0 : -1.0;
    const std::size_t dim = coefficients_.size();
    std::vector<double> expanded(dim * 4, 0.0);
    for (std::size_t idx = 0; idx < dim; ++idx) {
        expanded[idx] = coefficients_[idx] * kInvSqrt2;
        expanded[idx + kPauliZ * dim] = sign * coefficients_[idx] * kInvSqrt2;
    }
    coefficients_ = std::move(expanded);
    return n_qubits_++;
}

void DensityMatrix::project_and_remove(int q, int outcome) {
    check_qubit(q);
    if (outcome != 0 && outcome != 1) {
        throw std::invalid_argument("Measurement outcome must be 0 or 1");
    }
    const double sign = outcome == 0 ? 1.0 : -1.0;
    const std::size_t s = stride(q);
    std::vector<double> reduced(coefficients_.size() / 4, 0.0);
    for (std::size_t idx = 0; idx < reduced.size(); ++idx) {
        const double c_i = coefficients_[expand_index(idx, s, 0)];
        const double c_z = coefficients_[expand_index(idx, s, kPauliZ)];
        reduced[idx] = (c_i + sign * c_z) * kInvSqrt2;
    }
    coefficients_ = std::move(reduced);
    --n_qubits_;
}

void DensityMatrix::trace_out(int q) {
    check_qubit(q);
    const std::size_t s = stride(q);
    const double sqrt2 = std::sqrt(2.0);
    std::vector<double> reduced(coefficients_.size() / 4, 0.0);
    for (std::size_t idx = 0; idx < reduced.size(); ++idx) {
        reduced[idx] = coefficients_[expand_index(idx, s, 0)] * sqrt2;
    }
    coefficients_ = std::move(reduced);
    --n_qubits_;
}

std::pair<double, double> DensityMatrix::peek(int q) const {
    check_qubit(q);
    const double norm = std::pow(2.0, 0.5 * n_qubits_);
    const double total = coefficients_[0] * norm;
    const double z = coefficients_[kPauliZ * stride(q)] * norm;
    return {0.5 * (total + z), 0.5 * (total - z)};
}

double DensityMatrix::trace() const {
    return coefficients_[0] * std::pow(2.0, 0.5 * n_qubits_);
}

double DensityMatrix::purity() const {
    double acc = 0.0;
    for (double c : coefficients_) {
        acc += c * c;
    }
    return acc;
}

std::vector<double> DensityMatrix::diagonal() const {
    const std::size_t n_states = static_cast<std::size_t>(1) << n_qubits_;
    const double norm = std::pow(2.0, -0.5 * n_qubits_);
    std::vector<double> diag(n_states, 0.0);
    // Only coefficients built from I and Z contribute to populations.
    for (std::size_t z_mask = 0; z_mask < n_states; ++z_mask) {
        std::size_t idx = 0;
        for (int q = 0; q < n_qubits_; ++q) {
            if ((z_mask >> q) & 1U) {
                idx += kPauliZ * stride(q);
            }
        }
        const double c = coefficients_[idx] * norm;
        if (c == 0.0) {
            continue;
        }
        for (std::size_t state = 0; state < n_states; ++state) {
            std::size_t overlap = z_mask & state;
            int parity = 0;
            while (overlap) {
                parity ^= 1;
                overlap &= overlap - 1;
            }
            diag[state] += parity ? -c : c;
        }
    }
    return diag;
}

void DensityMatrix::scale(double factor) {
    for (double& c : coefficients_) {
        c *= factor;
    }
}

}  // namespace dmsim
