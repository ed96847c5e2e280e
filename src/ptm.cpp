#include "ptm.hpp"

#include <cmath>

namespace dmsim {

namespace {

using Matrix2 = std::array<std::complex<double>, 4>;
using Matrix4 = std::array<std::complex<double>, 16>;

constexpr std::complex<double> kI{0.0, 1.0};

const std::array<Matrix2, 4>& pauli_matrices() {
    static const std::array<Matrix2, 4> paulis{{
        {{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {1.0, 0.0}}},
        {{{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}},
        {{{0.0, 0.0}, {0.0, -1.0}, {0.0, 1.0}, {0.0, 0.0}}},
        {{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {-1.0, 0.0}}},
    }};
    return paulis;
}

template <std::size_t D, std::size_t N>
std::array<std::complex<double>, N> multiply(
    const std::array<std::complex<double>, N>& a,
    const std::array<std::complex<double>, N>& b
) {
    std::array<std::complex<double>, N> out{};
    for (std::size_t row = 0; row < D; ++row) {
        for (std::size_t col = 0; col < D; ++col) {
            std::complex<double> acc{0.0, 0.0};
            for (std::size_t k = 0; k < D; ++k) {
                acc += a[D * row + k] * b[D * k + col];
            }
            out[D * row + col] = acc;
        }
    }
    return out;
}

template <std::size_t D, std::size_t N>
std::array<std::complex<double>, N> adjoint(const std::array<std::complex<double>, N>& a) {
    std::array<std::complex<double>, N> out{};
    for (std::size_t row = 0; row < D; ++row) {
        for (std::size_t col = 0; col < D; ++col) {
            out[D * col + row] = std::conj(a[D * row + col]);
        }
    }
    return out;
}

template <std::size_t D, std::size_t N>
double real_trace_of_product(
    const std::array<std::complex<double>, N>& a,
    const std::array<std::complex<double>, N>& b
) {
    std::complex<double> acc{0.0, 0.0};
    for (std::size_t row = 0; row < D; ++row) {
        for (std::size_t k = 0; k < D; ++k) {
            acc += a[D * row + k] * b[D * k + row];
        }
    }
    return acc.real();
}

Matrix4 kron(const Matrix2& a, const Matrix2& b) {
    Matrix4 out{};
    for (std::size_t r0 = 0; r0 < 2; ++r0) {
        for (std::size_t c0 = 0; c0 < 2; ++c0) {
            for (std::size_t r1 = 0; r1 < 2; ++r1) {
                for (std::size_t c1 = 0; c1 < 2; ++c1) {
                    out[4 * (2 * r0 + r1) + (2 * c0 + c1)] = a[2 * r0 + c0] * b[2 * r1 + c1];
                }
            }
        }
    }
    return out;
}

}  // namespace

SingleQubitPtm identity_ptm() {
    SingleQubitPtm ptm{};
    for (std::size_t i = 0; i < 4; ++i) {
        ptm[5 * i] = 1.0;
    }
    return ptm;
}

TwoQubitPtm identity_two_qubit_ptm() {
    TwoQubitPtm ptm{};
    for (std::size_t i = 0; i < 16; ++i) {
        ptm[17 * i] = 1.0;
    }
    return ptm;
}

SingleQubitPtm single_qubit_ptm(const SingleQubitUnitary& u) {
    const auto& paulis = pauli_matrices();
    const Matrix2 u_dag = adjoint<2>(u);
    SingleQubitPtm ptm{};
    for (std::size_t j = 0; j < 4; ++j) {
        const Matrix2 image = multiply<2>(multiply<2>(u, paulis[j]), u_dag);
        for (std::size_t i = 0; i < 4; ++i) {
            ptm[4 * i + j] = 0.5 * real_trace_of_product<2>(paulis[i], image);
        }
    }
    return ptm;
}

TwoQubitPtm two_qubit_ptm(const TwoQubitUnitary& u) {
    const auto& paulis = pauli_matrices();
    std::array<Matrix4, 16> basis{};
    for (std::size_t p0 = 0; p0 < 4; ++p0) {
        for (std::size_t p1 = 0; p1 < 4; ++p1) {
            basis[4 * p0 + p1] = kron(paulis[p0], paulis[p1]);
        }
    }
    const Matrix4 u_dag = adjoint<4>(u);
    TwoQubitPtm ptm{};
    for (std::size_t j = 0; j < 16; ++j) {
        const Matrix4 image = multiply<4>(multiply<4>(u, basis[j]), u_dag);
        for (std::size_t i = 0; i < 16; ++i) {
            ptm[16 * i + j] = 0.25 * real_trace_of_product<4>(basis[i], image);
        }
    }
    return ptm;
}

SingleQubitPtm compose(const SingleQubitPtm& first, const SingleQubitPtm& second) {
    SingleQubitPtm out{};
    for (std::size_t row = 0; row < 4; ++row) {
        for (std::size_t col = 0; col < 4; ++col) {
            double acc = 0.0;
            for (std::size_t k = 0; k < 4; ++k) {
                acc += second[4 * row + k] * first[4 * k + col];
            }
            out[4 * row + col] = acc;
        }
    }
    return out;
}

SingleQubitUnitary hadamard_unitary() {
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    return {{{inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {-inv_sqrt2, 0.0}}};
}

SingleQubitUnitary rotate_x_unitary(double angle) {
    const double c = std::cos(0.5 * angle);
    const double s = std::sin(0.5 * angle);
    return {{{c, 0.0}, {0.0, -s}, {0.0, -s}, {c, 0.0}}};
}

SingleQubitUnitary rotate_y_unitary(double angle) {
    const double c = std::cos(0.5 * angle);
    const double s = std::sin(0.5 * angle);
    return {{{c, 0.0}, {-s, 0.0}, {s, 0.0}, {c, 0.0}}};
}

SingleQubitUnitary rotate_z_unitary(double angle) {
    return {{std::exp(-0.5 * angle * kI), {0.0, 0.0}, {0.0, 0.0}, std::exp(0.5 * angle * kI)}};
}

SingleQubitUnitary euler_unitary(double theta, double lamda, double phi) {
    const double c = std::cos(0.5 * theta);
    const double s = std::sin(0.5 * theta);
    return {{
        {c, 0.0},
        -std::exp(lamda * kI) * s,
        std::exp(phi * kI) * s,
        std::exp((phi + lamda) * kI) * c,
    }};
}

TwoQubitUnitary cphase_unitary(double angle) {
    TwoQubitUnitary u{};
    u[0] = {1.0, 0.0};
    u[5] = {1.0, 0.0};
    u[10] = {1.0, 0.0};
    u[15] = std::exp(angle * kI);
    return u;
}

TwoQubitUnitary cnot_unitary() {
    TwoQubitUnitary u{};
    u[0] = {1.0, 0.0};
    u[5] = {1.0, 0.0};
    u[11] = {1.0, 0.0};
    u[14] = {1.0, 0.0};
    return u;
}

TwoQubitUnitary iswap_unitary(double angle) {
    TwoQubitUnitary u{};
    u[0] = {1.0, 0.0};
    u[5] = {std::cos(angle), 0.0};
    u[6] = {0.0, std::sin(angle)};
    u[9] = {0.0, std::sin(angle)};
    u[10] = {std::cos(angle), 0.0};
    u[15] = {1.0, 0.0};
    return u;
}

TwoQubitUnitary swap_unitary() {
    TwoQubitUnitary u{};
    u[0] = {1.0, 0.0};
    u[6] = {1.0, 0.0};
    u[9] = {1.0, 0.0};
    u[15] = {1.0, 0.0};
    return u;
}

SingleQubitPtm pauli_channel_ptm(double px, double py, double pz) {
    SingleQubitPtm ptm{};
    ptm[0] = 1.0;
    ptm[5] = 1.0 - 2.0 * (py + pz);
    ptm[10] = 1.0 - 2.0 * (px + pz);
    ptm[15] = 1.0 - 2.0 * (px + py);
    return ptm;
}

SingleQubitPtm rotation_jitter_ptm(int axis, double sigma) {
    SingleQubitPtm ptm = identity_ptm();
    const double damping = std::exp(-0.5 * sigma * sigma);
    for (int p = 1; p < 4; ++p) {
        if (p != axis) {
            ptm[5 * p] = damping;
        }
    }
    return ptm;
}

SingleQubitPtm amp_ph_damping_ptm(double duration, double t1, double t2) {
    if (duration <= 0.0) {
        return identity_ptm();
    }
    const double relaxation = std::exp(-duration / t1);
    const double coherence = std::exp(-duration / t2);
    SingleQubitPtm ptm{};
    ptm[0] = 1.0;
    ptm[5] = coherence;
    ptm[10] = coherence;
    ptm[12] = 1.0 - relaxation;
    ptm[15] = relaxation;
    return ptm;
}

}  // namespace dmsim
