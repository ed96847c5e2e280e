#include "trial_runner.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "sparse_dm.hpp"

namespace dmsim {

BackendFactory make_sparse_backend_factory(const Circuit& circuit) {
    const std::vector<std::string> names = circuit.qubit_names();
    return [names](int /*trial*/) -> std::unique_ptr<StateBackend> {
        return std::make_unique<SparseDensityMatrix>(names);
    };
}

TrialRunner::TrialRunner(std::shared_ptr<const Circuit> circuit, BackendFactory backend_factory)
    : circuit_(std::move(circuit)), backend_factory_(std::move(backend_factory)) {
    if (!circuit_) {
        throw std::invalid_argument("Trial runner requires a circuit");
    }
    if (!backend_factory_) {
        throw std::invalid_argument("Trial runner requires a backend factory");
    }
}

void TrialRunner::report_log(const ExecutionLog& log) const {
    if (!progress_reporter_) {
        return;
    }
    std::lock_guard<std::mutex> lock(reporter_mutex_);
    progress_reporter_->record_log(log);
}

void TrialRunner::report_completed() const {
    if (!progress_reporter_) {
        return;
    }
    std::lock_guard<std::mutex> lock(reporter_mutex_);
    progress_reporter_->increment_completed_trials();
}

TrialRecord TrialRunner::run_trial(int trial) const {
    std::unique_ptr<StateBackend> state = backend_factory_(trial);
    if (!state) {
        throw std::runtime_error("Backend factory returned no state for trial " +
                                 std::to_string(trial));
    }

    TrialRecord record;
    record.trial = trial;
    GateObserver observer;
    if (record_logs_ || progress_reporter_) {
        observer = [this, trial, &record](const Gate& gate) {
            ExecutionLog log{trial, gate.time(), gate.kind(), gate.describe()};
            report_log(log);
            if (record_logs_) {
                record.logs.push_back(std::move(log));
            }
        };
    }
    circuit_->apply_to(*state, observer);
    record.trace = state->trace();
    record.classical = state->classical_registers();
    report_completed();
    return record;
}

std::vector<TrialRecord> TrialRunner::run(int trials, std::size_t max_threads) const {
    if (trials < 0) {
        throw std::invalid_argument("Trial count must be non-negative");
    }
    std::vector<TrialRecord> records(static_cast<std::size_t>(trials));
    if (trials == 0) {
        return records;
    }
    if (progress_reporter_) {
        std::lock_guard<std::mutex> lock(reporter_mutex_);
        progress_reporter_->set_total_trials(records.size());
    }

    const std::size_t hardware_threads = std::thread::hardware_concurrency();
    const std::size_t default_threads = hardware_threads > 0 ? hardware_threads : 1;
    const std::size_t worker_limit = max_threads > 0 ? max_threads : default_threads;
    const std::size_t worker_count = std::min(records.size(), worker_limit);

    if (worker_count == 1) {
        for (int trial = 0; trial < trials; ++trial) {
            records[static_cast<std::size_t>(trial)] = run_trial(trial);
        }
        return records;
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    std::mutex failure_mutex;
    std::exception_ptr failure;

    const std::size_t base_trials = records.size() / worker_count;
    const std::size_t remainder = records.size() % worker_count;
    std::size_t trial_offset = 0;

    for (std::size_t worker_idx = 0; worker_idx < worker_count; ++worker_idx) {
        const std::size_t trials_for_worker = base_trials + (worker_idx < remainder ? 1 : 0);
        const std::size_t start = trial_offset;
        const std::size_t end = start + trials_for_worker;
        workers.emplace_back([this, &records, start, end, &failure_mutex, &failure]() {
            for (std::size_t trial = start; trial < end; ++trial) {
                try {
                    records[trial] = run_trial(static_cast<int>(trial));
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    return;
                }
            }
        });
        trial_offset = end;
    }

    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return records;
}

}  // namespace dmsim
