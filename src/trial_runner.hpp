#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "diagnostics.hpp"
#include "state_backend.hpp"

namespace dmsim {

// Receives trial progress from TrialRunner. Calls are serialized by the
// runner, so implementations need no locking of their own.
class ProgressReporter {
  public:
    virtual ~ProgressReporter() = default;

    virtual void set_total_trials(std::size_t total_trials) = 0;
    virtual void increment_completed_trials(std::size_t delta = 1) = 0;
    virtual void record_log(const ExecutionLog& log) = 0;
};

struct TrialRecord {
    int trial = 0;
    // Backend trace after the replay, including the classical path weight.
    double trace = 0.0;
    std::map<std::string, int> classical;
    // One entry per applied gate when log recording is enabled.
    std::vector<ExecutionLog> logs;
};

// Fresh state for one trial; the argument is the trial index.
using BackendFactory = std::function<std::unique_ptr<StateBackend>(int trial)>;

// Factory building a SparseDensityMatrix over the circuit's qubit names, all
// starting in 0.
BackendFactory make_sparse_backend_factory(const Circuit& circuit);

// Monte Carlo driver replaying one circuit against independent states.
// Trials may run on several worker threads; they then share the circuit's
// Measurement logs and samplers, whose draws are serialized internally, so
// only the interleaving across trials becomes unspecified. One thread keeps
// seeded runs reproducible.
class TrialRunner {
  public:
    TrialRunner(std::shared_ptr<const Circuit> circuit, BackendFactory backend_factory);

    void set_record_logs(bool record_logs) { record_logs_ = record_logs; }
    void set_progress_reporter(ProgressReporter* reporter) { progress_reporter_ = reporter; }

    const Circuit& circuit() const { return *circuit_; }

    // max_threads == 0 uses the hardware concurrency. The first failure of
    // any trial is rethrown after all workers stop.
    std::vector<TrialRecord> run(int trials, std::size_t max_threads = 1) const;

  private:
    TrialRecord run_trial(int trial) const;
    void report_log(const ExecutionLog& log) const;
    void report_completed() const;

    std::shared_ptr<const Circuit> circuit_;
    BackendFactory backend_factory_;
    bool record_logs_ = false;
    ProgressReporter* progress_reporter_ = nullptr;
    mutable std::mutex reporter_mutex_;
};

}  // namespace dmsim
