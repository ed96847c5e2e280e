#include "circuit.hpp"
#include "diagnostics.hpp"
#include "gates/classical_gates.hpp"
#include "gates/single_qubit_gates.hpp"
#include "gates/two_qubit_gates.hpp"
#include "sampler/selection_sampler.hpp"
#include "sampler/uniform_noisy_sampler.hpp"
#include "sparse_dm.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dmsim {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

GateArguments rotation(const std::string& qubit, double time, double angle) {
    GateArguments args;
    args.qubits = {qubit};
    args.time = time;
    args.params["angle"] = angle;
    return args;
}

SparseDensityMatrix make_state(const Circuit& circuit) {
    return SparseDensityMatrix(circuit.qubit_names());
}

TEST(IntegrationTests, ThreeQubitClean) {
    Circuit c;
    const std::vector<std::string> names = {"D1", "A1", "D2", "A2", "D3"};
    // Almost infinite t2 so waiting gates are added but have no visible effect.
    for (const auto& name : names) {
        c.add_qubit(name, kInf, 1e10);
    }

    c.add_gate<Hadamard>("A1", 0.0);
    c.add_gate<Hadamard>("A2", 0.0);
    c.add_gate<CPhase>("A1", "D1", 200.0);
    c.add_gate<CPhase>("A2", "D2", 200.0);
    c.add_gate<CPhase>("A1", "D2", 100.0);
    c.add_gate<CPhase>("A2", "D3", 100.0);
    c.add_gate<Hadamard>("A1", 300.0);
    c.add_gate<Hadamard>("A2", 300.0);

    std::shared_ptr<Measurement> m1;
    std::shared_ptr<Measurement> m2;
    {
        ScopedDiagnosticCapture capture;
        m1 = c.add_measurement("A1", 350.0, nullptr);
        m2 = c.add_measurement("A2", 350.0, nullptr);
        EXPECT_EQ(capture.count("MissingSampler"), 2u);
    }

    c.add_waiting_gates(std::nullopt, 0.0, 1500.0);
    c.order();
    ASSERT_EQ(c.gates().size(), 27u);

    SparseDensityMatrix sdm(names);
    for (const auto& name : names) {
        sdm.set_classical_bit(name, 1);
    }
    sdm.set_classical_bit("D3", 0);
    EXPECT_EQ(sdm.classical(),
              (std::map<std::string, int>{{"A1", 1}, {"A2", 1}, {"D1", 1}, {"D2", 1}, {"D3", 0}}));

    for (int i = 0; i < 100; ++i) {
        c.apply_to(sdm);
    }

    const auto outcomes1 = m1->measurements();
    const auto outcomes2 = m2->measurements();
    ASSERT_EQ(outcomes1.size(), 100u);
    ASSERT_EQ(outcomes2.size(), 100u);
    EXPECT_TRUE(sdm.classical().empty());
    // A clean run has a single possible path.
    EXPECT_NEAR(sdm.trace(), 1.0, 1e-5);

    EXPECT_EQ(outcomes1, std::vector<int>(100, 1));
    for (std::size_t i = 0; i < outcomes2.size(); ++i) {
        EXPECT_EQ(outcomes2[i], static_cast<int>(i % 2)) << "replay " << i;
    }
}

TEST(IntegrationTests, NoisyMeasurementWeightsThePath) {
    Circuit c;
    c.add_qubit("A", 0.0, 0.0);
    c.add_gate<Hadamard>("A", 1.0);
    auto sampler = std::make_shared<UniformNoisySampler>(0.1, std::uint64_t{42});
    auto m1 = c.add_measurement("A", 2.0, sampler);

    auto sdm = make_state(c);
    std::vector<int> true_state;
    for (int i = 0; i < 20; ++i) {
        c.apply_to(sdm);
        true_state.push_back(sdm.classical().at("A"));
    }

    const auto declared = m1->measurements();
    ASSERT_EQ(declared.size(), 20u);
    int agreements = 0;
    for (std::size_t i = 0; i < declared.size(); ++i) {
        if (declared[i] == true_state[i]) {
            ++agreements;
        }
    }
    const double path_probability =
        std::pow(0.9, agreements) * std::pow(0.1, 20 - agreements);
    EXPECT_NEAR(sdm.classical_probability() / path_probability, 1.0, 1e-9);
    // Every projection picks a branch of weight 1/2.
    EXPECT_NEAR(sdm.trace() / (path_probability * std::pow(0.5, 20)), 1.0, 1e-9);
}

TEST(IntegrationTests, MeasurementWithOutputBit) {
    Circuit c;
    c.add_qubit("A");
    c.add_qubit("O");
    c.add_qubit("O2");

    c.add_gate("rotate_y", rotation("A", 0.0, kPi / 2));
    c.add_measurement("A", 1.0, std::make_shared<SelectionSampler>(1), std::string("O"));
    c.add_gate("rotate_y", rotation("A", 3.5, kPi / 2));
    c.add_measurement("A", 4.0, std::make_shared<SelectionSampler>(1), std::string("O2"));
    c.add_gate("rotate_y", rotation("A", 5.0, kPi / 2));
    c.order();

    auto sdm = make_state(c);
    EXPECT_EQ(sdm.classical_bit("O"), 0);
    EXPECT_EQ(sdm.classical_bit("O2"), 0);

    c.apply_to(sdm);

    EXPECT_NEAR(sdm.trace(), 0.25, 1e-12);
    EXPECT_EQ(sdm.classical(), (std::map<std::string, int>{{"O", 1}, {"O2", 1}}));
}

TEST(IntegrationTests, OutputBitMayNameTheMeasuredQubit) {
    Circuit c;
    c.add_qubit("A");
    c.add_gate<Hadamard>("A", 0.0);
    // A readout error of 1 flips every declared outcome.
    auto sampler = std::make_shared<UniformNoisySampler>(1.0, std::uint64_t{3});
    auto m = c.add_measurement("A", 1.0, sampler, std::string("A"));

    auto sdm = make_state(c);
    c.apply_to(sdm);

    ASSERT_EQ(m->measurements().size(), 1u);
    EXPECT_EQ(sdm.classical().at("A"), m->measurements()[0]);
    EXPECT_NEAR(sdm.trace(), 0.5, 1e-12);
}

TEST(IntegrationTests, FreeDecay) {
    const std::vector<std::pair<double, double>> lifetimes = {
        {kInf, kInf}, {1000.0, 2000.0}, {kInf, 1000.0}, {1000.0, 1000.0}};
    for (const auto& lifetime : lifetimes) {
        Circuit c("Free decay");
        c.add_qubit("Q", lifetime.first, lifetime.second);
        c.add_gate("rotate_y", rotation("Q", 0.0, kPi));
        c.add_gate("rotate_y", rotation("Q", 1000.0, -kPi));
        c.add_waiting_gates();
        c.order();

        auto sdm = make_state(c);
        c.apply_to(sdm);
        sdm.project_measurement("Q", 0);

        EXPECT_NEAR(sdm.trace(), std::exp(-1000.0 / lifetime.first), 1e-9)
            << "t1 = " << lifetime.first << ", t2 = " << lifetime.second;
    }
}

TEST(IntegrationTests, Ramsey) {
    const std::vector<std::pair<double, double>> lifetimes = {
        {kInf, kInf}, {1000.0, 2000.0}, {kInf, 1000.0}, {1000.0, 1000.0}};
    for (const auto& lifetime : lifetimes) {
        Circuit c("Ramsey");
        c.add_qubit("Q", lifetime.first, lifetime.second);
        c.add_gate("rotate_y", rotation("Q", 0.0, kPi / 2));
        c.add_gate("rotate_y", rotation("Q", 1000.0, -kPi / 2));
        c.add_waiting_gates();
        c.order();

        auto sdm = make_state(c);
        c.apply_to(sdm);
        sdm.project_measurement("Q", 0);

        EXPECT_NEAR(sdm.trace(), 0.5 * (1.0 + std::exp(-1000.0 / lifetime.second)), 1e-9)
            << "t1 = " << lifetime.first << ", t2 = " << lifetime.second;
    }
}

TEST(IntegrationTests, TwoQubitEvolutionIsTracePreserving) {
    Circuit c("test");
    c.add_qubit("A", 30000.0, 30000.0);
    c.add_qubit("B", 30000.0, 30000.0);

    c.add_gate("rotate_y", rotation("A", 0.0, 1.2));
    c.add_gate("rotate_y", rotation("B", 0.0, 0.2));
    c.add_gate("rotate_z", rotation("A", 1.0, 0.1));
    c.add_gate("rotate_x", rotation("B", 1.0, 0.3));
    c.add_gate("cphase", GateArguments{{"A", "B"}, 2.0});

    auto sdm = make_state(c);
    for (int i = 0; i < 100; ++i) {
        c.apply_to(sdm);
        const auto diagonal = sdm.full_dm().diagonal();
        double total = 0.0;
        for (double p : diagonal) {
            EXPECT_GT(p, 0.0);
            total += p;
        }
        EXPECT_NEAR(total, 1.0, 1e-9);
    }
    // No waiting gates were added, so the state stays pure.
    EXPECT_NEAR(sdm.full_dm().purity(), 1.0, 1e-9);
}

TEST(IntegrationTests, CPhaseRotationsCompose) {
    Circuit c("test");
    c.add_qubit("A");
    c.add_qubit("B");

    c.add_gate("rotate_y", rotation("A", 0.0, 1.2));
    c.add_gate("rotate_y", rotation("B", 0.0, 1.2));
    for (int t = 1; t <= 5; ++t) {
        c.add_gate<CPhaseRotation>("A", "B", 2 * kPi / 5, static_cast<double>(t));
    }
    c.add_gate("rotate_y", rotation("A", 6.0, -1.2));
    c.add_gate("rotate_y", rotation("B", 6.0, -1.2));
    c.order();

    auto sdm = make_state(c);
    c.apply_to(sdm);

    const auto diagonal = sdm.full_dm().diagonal();
    ASSERT_EQ(diagonal.size(), 4u);
    EXPECT_NEAR(diagonal[0], 1.0, 1e-9);
    EXPECT_NEAR(diagonal[1], 0.0, 1e-9);
    EXPECT_NEAR(diagonal[2], 0.0, 1e-9);
    EXPECT_NEAR(diagonal[3], 0.0, 1e-9);
}

TEST(IntegrationTests, EulerRotationIsUndoneByItsConjugate) {
    Circuit c("test");
    c.add_qubit("A");

    const double theta = 0.3;
    const double lamda = 0.7;
    const double phi = 4.2;
    c.add_gate<RotateEuler>("A", 0.0, theta, phi, lamda);
    c.add_gate<RotateEuler>("A", 10.0, -theta, -lamda, -phi);
    c.order();

    auto sdm = make_state(c);
    c.apply_to(sdm);

    const auto diagonal = sdm.full_dm().diagonal();
    ASSERT_EQ(diagonal.size(), 2u);
    EXPECT_NEAR(diagonal[0], 1.0, 1e-9);
    EXPECT_NEAR(diagonal[1], 0.0, 1e-9);
}

TEST(IntegrationTests, ClassicalNot) {
    SparseDensityMatrix sdm(std::vector<std::string>{"A"});
    Circuit c;
    c.add_qubit(std::make_shared<ClassicalBit>("A"));
    c.add_gate<ClassicalNOT>("A", 0.0);
    c.order();

    EXPECT_EQ(sdm.classical().at("A"), 0);
    c.apply_to(sdm);
    EXPECT_EQ(sdm.classical().at("A"), 1);
}

}  // namespace
}  // namespace dmsim
