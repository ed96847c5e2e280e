#pragma once

#include <array>
#include <complex>

// Pauli-transfer-matrix helpers. PTMs act on coefficient vectors in the
// normalized Pauli basis {I, X, Y, Z} / sqrt(2); entries are
// R_ij = Tr(P_i E(P_j)) / d. Two-qubit PTMs are indexed 4 * p0 + p1 and
// two-qubit unitaries 2 * b0 + b1, with the first qubit most significant.

namespace dmsim {

constexpr double kPi = 3.14159265358979323846;

using SingleQubitPtm = std::array<double, 16>;
using TwoQubitPtm = std::array<double, 256>;
using SingleQubitUnitary = std::array<std::complex<double>, 4>;
using TwoQubitUnitary = std::array<std::complex<double>, 16>;

SingleQubitPtm identity_ptm();
TwoQubitPtm identity_two_qubit_ptm();

SingleQubitPtm single_qubit_ptm(const SingleQubitUnitary& u);
TwoQubitPtm two_qubit_ptm(const TwoQubitUnitary& u);

// Returns the PTM of applying `second` after `first`.
SingleQubitPtm compose(const SingleQubitPtm& first, const SingleQubitPtm& second);

SingleQubitUnitary hadamard_unitary();
SingleQubitUnitary rotate_x_unitary(double angle);
SingleQubitUnitary rotate_y_unitary(double angle);
SingleQubitUnitary rotate_z_unitary(double angle);
SingleQubitUnitary euler_unitary(double theta, double lamda, double phi);

TwoQubitUnitary cphase_unitary(double angle);
TwoQubitUnitary cnot_unitary();
TwoQubitUnitary iswap_unitary(double angle);
TwoQubitUnitary swap_unitary();

// Stochastic Pauli channel applying X, Y, Z with the given probabilities.
SingleQubitPtm pauli_channel_ptm(double px, double py, double pz);

// Gaussian jitter with standard deviation `sigma` of a rotation about
// Pauli axis `axis` (1 = X, 2 = Y, 3 = Z).
SingleQubitPtm rotation_jitter_ptm(int axis, double sigma);

// Amplitude and phase damping accumulated over `duration` for a qubit with
// relaxation time t1 and dephasing time t2. Either constant may be infinite.
SingleQubitPtm amp_ph_damping_ptm(double duration, double t1, double t2);

}  // namespace dmsim
