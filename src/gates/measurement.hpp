#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gates/gate.hpp"
#include "sampler.hpp"

namespace dmsim {

// Projective single-qubit measurement resolved by a (possibly shared)
// sampler. Every declared outcome is appended to an outcome log that lives
// as long as the gate, so repeated replays accumulate statistics.
class Measurement : public Gate {
  public:
    // A null sampler falls back to noiseless uniform sampling and emits a
    // MissingSampler diagnostic.
    Measurement(
        std::string qubit,
        double time,
        std::shared_ptr<Sampler> sampler,
        std::optional<std::string> output_bit = std::nullopt
    );

    // Copies share the sampler but start with an empty log.
    Measurement(const Measurement& other);
    Measurement& operator=(const Measurement&) = delete;

    const std::string& qubit() const { return qubit_; }
    const std::optional<std::string>& output_bit() const { return output_bit_; }
    const std::shared_ptr<Sampler>& sampler() const { return sampler_; }

    // Snapshot of the declared outcomes so far.
    std::vector<int> measurements() const;

    std::vector<std::string> involved_qubits() const override;
    std::vector<std::string> classical_bits() const override;
    bool is_measurement() const override { return true; }

    void apply_to(StateBackend& state) override;

    std::string kind() const override { return "measurement"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string qubit_;
    std::shared_ptr<Sampler> sampler_;
    std::optional<std::string> output_bit_;

    mutable std::mutex log_mutex_;
    std::vector<int> measurements_;
};

// Discards the qubit's quantum state and prepares it in `state`.
class ResetGate : public Gate {
  public:
    ResetGate(std::string qubit, double time, int state = 0);

    const std::string& qubit() const { return qubit_; }
    int state() const { return state_; }

    std::vector<std::string> involved_qubits() const override;
    void apply_to(StateBackend& state) override;

    std::string kind() const override { return "reset"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string qubit_;
    int state_;
};

}  // namespace dmsim
