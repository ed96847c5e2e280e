#include "density_matrix.hpp"
#include "ptm.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace dmsim {
namespace {

constexpr double kTol = 1e-12;

void expect_diagonal(const DensityMatrix& dm, const std::vector<double>& expected) {
    const auto diag = dm.diagonal();
    ASSERT_EQ(diag.size(), expected.size());
    for (std::size_t i = 0; i < diag.size(); ++i) {
        EXPECT_NEAR(diag[i], expected[i], 1e-9) << "state " << i;
    }
}

TEST(PtmTests, UnitariesPreserveTrace) {
    const auto h = single_qubit_ptm(hadamard_unitary());
    EXPECT_NEAR(h[0], 1.0, kTol);
    for (int col = 1; col < 4; ++col) {
        EXPECT_NEAR(h[col], 0.0, kTol);
        EXPECT_NEAR(h[4 * col], 0.0, kTol);
    }
    // H swaps X and Z and negates Y.
    EXPECT_NEAR(h[4 * 1 + 3], 1.0, kTol);
    EXPECT_NEAR(h[4 * 3 + 1], 1.0, kTol);
    EXPECT_NEAR(h[4 * 2 + 2], -1.0, kTol);
}

TEST(PtmTests, ComposeAppliesSecondAfterFirst) {
    const auto half = single_qubit_ptm(rotate_x_unitary(kPi / 2));
    const auto full = single_qubit_ptm(rotate_x_unitary(kPi));
    const auto composed = compose(half, half);
    for (std::size_t i = 0; i < composed.size(); ++i) {
        EXPECT_NEAR(composed[i], full[i], 1e-12);
    }

    const auto x = single_qubit_ptm(rotate_x_unitary(kPi / 2));
    const auto z = single_qubit_ptm(rotate_z_unitary(kPi / 2));
    DensityMatrix a(1);
    a.apply_single_qubit_ptm(0, compose(x, z));
    DensityMatrix b(1);
    b.apply_single_qubit_ptm(0, x);
    b.apply_single_qubit_ptm(0, z);
    for (std::size_t i = 0; i < a.data().size(); ++i) {
        EXPECT_NEAR(a.data()[i], b.data()[i], 1e-12);
    }
}

TEST(PtmTests, PauliChannelIsDiagonal) {
    const auto ptm = pauli_channel_ptm(0.1, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(ptm[0], 1.0);
    EXPECT_DOUBLE_EQ(ptm[5], 1.0);
    EXPECT_NEAR(ptm[10], 0.8, kTol);
    EXPECT_NEAR(ptm[15], 0.8, kTol);
}

TEST(PtmTests, DampingWithZeroDurationIsIdentity) {
    EXPECT_EQ(amp_ph_damping_ptm(0.0, 10.0, 5.0), identity_ptm());
}

TEST(PtmTests, DampingMatchesDecayConstants) {
    const auto ptm = amp_ph_damping_ptm(1.0, 10.0, 5.0);
    EXPECT_NEAR(ptm[5], std::exp(-1.0 / 5.0), kTol);
    EXPECT_NEAR(ptm[10], std::exp(-1.0 / 5.0), kTol);
    EXPECT_NEAR(ptm[15], std::exp(-1.0 / 10.0), kTol);
    EXPECT_NEAR(ptm[12], 1.0 - std::exp(-1.0 / 10.0), kTol);
    EXPECT_DOUBLE_EQ(ptm[0], 1.0);
}

TEST(DensityMatrixTests, StartsInGroundState) {
    DensityMatrix dm(2);
    EXPECT_EQ(dm.num_qubits(), 2);
    EXPECT_EQ(dm.data().size(), 16u);
    EXPECT_NEAR(dm.trace(), 1.0, kTol);
    EXPECT_NEAR(dm.purity(), 1.0, kTol);
    expect_diagonal(dm, {1.0, 0.0, 0.0, 0.0});
}

TEST(DensityMatrixTests, ZeroQubitMatrixHasUnitTrace) {
    DensityMatrix dm;
    EXPECT_EQ(dm.num_qubits(), 0);
    EXPECT_DOUBLE_EQ(dm.trace(), 1.0);
    expect_diagonal(dm, {1.0});
}

TEST(DensityMatrixTests, HadamardGivesEqualWeights) {
    DensityMatrix dm(1);
    dm.apply_single_qubit_ptm(0, single_qubit_ptm(hadamard_unitary()));
    const auto weights = dm.peek(0);
    EXPECT_NEAR(weights.first, 0.5, kTol);
    EXPECT_NEAR(weights.second, 0.5, kTol);
    EXPECT_NEAR(dm.purity(), 1.0, kTol);
}

TEST(DensityMatrixTests, AddQubitUsesLittleEndianDiagonal) {
    DensityMatrix dm;
    EXPECT_EQ(dm.add_qubit(1), 0);
    EXPECT_EQ(dm.add_qubit(0), 1);
    expect_diagonal(dm, {0.0, 1.0, 0.0, 0.0});
    EXPECT_THROW(dm.add_qubit(2), std::invalid_argument);
}

TEST(DensityMatrixTests, CnotEntanglesBellPair) {
    DensityMatrix dm(2);
    dm.apply_single_qubit_ptm(0, single_qubit_ptm(hadamard_unitary()));
    dm.apply_two_qubit_ptm(0, 1, two_qubit_ptm(cnot_unitary()));
    expect_diagonal(dm, {0.5, 0.0, 0.0, 0.5});
    EXPECT_NEAR(dm.purity(), 1.0, 1e-9);
}

TEST(DensityMatrixTests, TwoQubitArgumentOrderSelectsControl) {
    DensityMatrix dm;
    dm.add_qubit(0);
    dm.add_qubit(1);
    // Qubit 1 controls, qubit 0 is flipped.
    dm.apply_two_qubit_ptm(1, 0, two_qubit_ptm(cnot_unitary()));
    expect_diagonal(dm, {0.0, 0.0, 0.0, 1.0});
}

TEST(DensityMatrixTests, ProjectAndRemoveKeepsBranchWeight) {
    DensityMatrix dm(2);
    dm.apply_single_qubit_ptm(0, single_qubit_ptm(rotate_y_unitary(kPi / 2)));
    dm.apply_single_qubit_ptm(1, single_qubit_ptm(rotate_x_unitary(kPi)));

    dm.project_and_remove(0, 1);
    EXPECT_EQ(dm.num_qubits(), 1);
    EXPECT_NEAR(dm.trace(), 0.5, kTol);
    expect_diagonal(dm, {0.0, 0.5});
}

TEST(DensityMatrixTests, TraceOutKeepsTrace) {
    DensityMatrix dm(2);
    dm.apply_single_qubit_ptm(0, single_qubit_ptm(hadamard_unitary()));
    dm.apply_two_qubit_ptm(0, 1, two_qubit_ptm(cnot_unitary()));
    dm.trace_out(0);
    EXPECT_EQ(dm.num_qubits(), 1);
    EXPECT_NEAR(dm.trace(), 1.0, kTol);
    EXPECT_NEAR(dm.purity(), 0.5, 1e-9);
}

TEST(DensityMatrixTests, FullRelaxationReturnsToGround) {
    DensityMatrix dm;
    dm.add_qubit(1);
    dm.apply_single_qubit_ptm(0, amp_ph_damping_ptm(1000.0, 1.0, 1.0));
    expect_diagonal(dm, {1.0, 0.0});
}

TEST(DensityMatrixTests, ScaleMultipliesTrace) {
    DensityMatrix dm(1);
    dm.scale(0.25);
    EXPECT_NEAR(dm.trace(), 0.25, kTol);
}

TEST(DensityMatrixTests, RejectsBadIndices) {
    DensityMatrix dm(2);
    EXPECT_THROW(dm.apply_single_qubit_ptm(2, identity_ptm()), std::out_of_range);
    EXPECT_THROW(dm.apply_two_qubit_ptm(0, 0, identity_two_qubit_ptm()), std::invalid_argument);
    EXPECT_THROW(dm.peek(-1), std::out_of_range);
    EXPECT_THROW(dm.project_and_remove(0, 2), std::invalid_argument);
    EXPECT_THROW(DensityMatrix(-1), std::invalid_argument);
}

}  // namespace
}  // namespace dmsim
