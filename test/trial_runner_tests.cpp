#include "trial_runner.hpp"

#include "gates/single_qubit_gates.hpp"
#include "sampler/uniform_sampler.hpp"
#include "sparse_dm.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dmsim {
namespace {

class RecordingProgressReporter : public ProgressReporter {
  public:
    void set_total_trials(std::size_t total_trials) override { total_trials_ = total_trials; }
    void increment_completed_trials(std::size_t delta) override { completed_trials_ += delta; }
    void record_log(const ExecutionLog& log) override { logs_.push_back(log); }

    std::size_t total_trials() const { return total_trials_; }
    std::size_t completed_trials() const { return completed_trials_; }
    const std::vector<ExecutionLog>& logs() const { return logs_; }

  private:
    std::size_t total_trials_ = 0;
    std::size_t completed_trials_ = 0;
    std::vector<ExecutionLog> logs_;
};

struct MeasuredCircuit {
    std::shared_ptr<Circuit> circuit;
    std::shared_ptr<Measurement> measurement;
};

MeasuredCircuit make_hadamard_measurement(std::uint64_t seed) {
    MeasuredCircuit result;
    result.circuit = std::make_shared<Circuit>("coin");
    result.circuit->add_qubit("A");
    result.circuit->add_gate<Hadamard>("A", 0.0);
    result.measurement = result.circuit->add_measurement(
        "A", 1.0, std::make_shared<UniformSampler>(seed));
    return result;
}

TEST(TrialRunnerTests, SequentialRunsAreReproducible) {
    auto first = make_hadamard_measurement(7);
    auto second = make_hadamard_measurement(7);

    TrialRunner runner_a(first.circuit, make_sparse_backend_factory(*first.circuit));
    TrialRunner runner_b(second.circuit, make_sparse_backend_factory(*second.circuit));

    const auto records_a = runner_a.run(20);
    const auto records_b = runner_b.run(20);

    ASSERT_EQ(records_a.size(), 20u);
    ASSERT_EQ(records_b.size(), 20u);
    for (std::size_t i = 0; i < records_a.size(); ++i) {
        EXPECT_EQ(records_a[i].trial, static_cast<int>(i));
        EXPECT_EQ(records_a[i].classical, records_b[i].classical);
        EXPECT_NEAR(records_a[i].trace, 0.5, 1e-12);
        EXPECT_EQ(records_a[i].classical.at("A"), first.measurement->measurements()[i]);
    }
    EXPECT_EQ(first.measurement->measurements(), second.measurement->measurements());
}

TEST(TrialRunnerTests, RecordsOneLogPerGate) {
    auto setup = make_hadamard_measurement(3);
    TrialRunner runner(setup.circuit, make_sparse_backend_factory(*setup.circuit));

    const auto silent = runner.run(1);
    EXPECT_TRUE(silent[0].logs.empty());

    runner.set_record_logs(true);
    const auto records = runner.run(2);
    ASSERT_EQ(records.size(), 2u);
    for (const auto& record : records) {
        ASSERT_EQ(record.logs.size(), 2u);
        EXPECT_EQ(record.logs[0].trial, record.trial);
        EXPECT_EQ(record.logs[0].category, "hadamard");
        EXPECT_DOUBLE_EQ(record.logs[0].time, 0.0);
        EXPECT_EQ(record.logs[0].message, "hadamard(A) @ 0");
        EXPECT_EQ(record.logs[1].category, "measurement");
        EXPECT_DOUBLE_EQ(record.logs[1].time, 1.0);
    }
}

TEST(TrialRunnerTests, ParallelRunCoversEveryTrial) {
    auto setup = make_hadamard_measurement(11);
    TrialRunner runner(setup.circuit, make_sparse_backend_factory(*setup.circuit));

    const auto records = runner.run(64, 4);

    ASSERT_EQ(records.size(), 64u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].trial, static_cast<int>(i));
        EXPECT_NEAR(records[i].trace, 0.5, 1e-12);
        const int outcome = records[i].classical.at("A");
        EXPECT_TRUE(outcome == 0 || outcome == 1);
    }
    EXPECT_EQ(setup.measurement->measurements().size(), 64u);
}

TEST(TrialRunnerTests, HardwareConcurrencyWhenThreadsIsZero) {
    auto setup = make_hadamard_measurement(5);
    TrialRunner runner(setup.circuit, make_sparse_backend_factory(*setup.circuit));
    EXPECT_EQ(runner.run(9, 0).size(), 9u);
}

TEST(TrialRunnerTests, WorkerFailureIsRethrown) {
    auto setup = make_hadamard_measurement(1);
    const auto names = setup.circuit->qubit_names();
    BackendFactory failing = [names](int trial) -> std::unique_ptr<StateBackend> {
        if (trial == 3) {
            throw std::runtime_error("backend unavailable");
        }
        return std::make_unique<SparseDensityMatrix>(names);
    };
    TrialRunner runner(setup.circuit, failing);

    EXPECT_THROW(runner.run(8, 2), std::runtime_error);
    EXPECT_THROW(runner.run(8, 1), std::runtime_error);
}

TEST(TrialRunnerTests, MissingBackendIsAnError) {
    auto setup = make_hadamard_measurement(1);
    TrialRunner runner(setup.circuit, [](int) { return std::unique_ptr<StateBackend>(); });
    EXPECT_THROW(runner.run(1), std::runtime_error);
}

TEST(TrialRunnerTests, ReportsProgress) {
    auto setup = make_hadamard_measurement(9);
    TrialRunner runner(setup.circuit, make_sparse_backend_factory(*setup.circuit));
    RecordingProgressReporter reporter;
    runner.set_progress_reporter(&reporter);

    runner.run(5, 2);

    EXPECT_EQ(reporter.total_trials(), 5u);
    EXPECT_EQ(reporter.completed_trials(), 5u);
    EXPECT_EQ(reporter.logs().size(), 10u);
}

TEST(TrialRunnerTests, RejectsInvalidArguments) {
    auto setup = make_hadamard_measurement(1);
    EXPECT_THROW(
        TrialRunner(nullptr, make_sparse_backend_factory(*setup.circuit)), std::invalid_argument);
    EXPECT_THROW(TrialRunner(setup.circuit, BackendFactory()), std::invalid_argument);

    TrialRunner runner(setup.circuit, make_sparse_backend_factory(*setup.circuit));
    EXPECT_THROW(runner.run(-1), std::invalid_argument);
    EXPECT_TRUE(runner.run(0).empty());
}

}  // namespace
}  // namespace dmsim
