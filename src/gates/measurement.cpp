#include "gates/measurement.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "diagnostics.hpp"
#include "sampler/uniform_sampler.hpp"

namespace dmsim {

Measurement::Measurement(
    std::string qubit,
    double time,
    std::shared_ptr<Sampler> sampler,
    std::optional<std::string> output_bit
)
    : Gate(time, 0.0)
    , qubit_(std::move(qubit))
    , sampler_(std::move(sampler))
    , output_bit_(std::move(output_bit)) {
    if (qubit_.empty()) {
        throw std::invalid_argument("Measured qubit must be named");
    }
    if (output_bit_ && output_bit_->empty()) {
        throw std::invalid_argument("Output bit name must not be empty");
    }
    if (!sampler_) {
        std::ostringstream oss;
        oss << "Measurement of " << qubit_ << " at t=" << time
            << " has no sampler; using noiseless uniform sampling";
        warn("MissingSampler", oss.str());
        sampler_ = std::make_shared<UniformSampler>();
    }
}

Measurement::Measurement(const Measurement& other)
    : Gate(other)
    , qubit_(other.qubit_)
    , sampler_(other.sampler_)
    , output_bit_(other.output_bit_) {}

std::vector<int> Measurement::measurements() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return measurements_;
}

std::vector<std::string> Measurement::involved_qubits() const {
    return {qubit_};
}

std::vector<std::string> Measurement::classical_bits() const {
    if (output_bit_) {
        return {*output_bit_};
    }
    return {};
}

void Measurement::apply_to(StateBackend& state) {
    const auto weights = state.peek_measurement(qubit_);
    const SampleResult result = sampler_->sample(weights.first, weights.second);
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        measurements_.push_back(result.declared);
    }
    // Project before writing the output bit, which may name the measured
    // qubit itself.
    state.project_measurement(qubit_, result.projected);
    if (output_bit_) {
        state.set_classical_bit(*output_bit_, result.declared);
    }
    state.scale_classical_probability(result.probability);
}

std::string Measurement::details() const {
    std::ostringstream oss;
    oss << "sampler=" << sampler_->name();
    if (output_bit_) {
        oss << " output_bit=" << *output_bit_;
    }
    return oss.str();
}

std::shared_ptr<Gate> Measurement::clone() const {
    return std::make_shared<Measurement>(*this);
}

void Measurement::remap(const NameMap& name_map, double /*time_offset*/) {
    qubit_ = remap_name(name_map, qubit_);
    if (output_bit_) {
        output_bit_ = remap_name(name_map, *output_bit_);
    }
}

ResetGate::ResetGate(std::string qubit, double time, int state)
    : Gate(time, 0.0), qubit_(std::move(qubit)), state_(state) {
    if (qubit_.empty()) {
        throw std::invalid_argument("Reset qubit must be named");
    }
    if (state_ != 0 && state_ != 1) {
        throw std::invalid_argument("Reset state must be 0 or 1");
    }
}

std::vector<std::string> ResetGate::involved_qubits() const {
    return {qubit_};
}

void ResetGate::apply_to(StateBackend& state) {
    state.set_classical_bit(qubit_, state_);
}

std::string ResetGate::details() const {
    return "state=" + std::to_string(state_);
}

std::shared_ptr<Gate> ResetGate::clone() const {
    return std::make_shared<ResetGate>(*this);
}

void ResetGate::remap(const NameMap& name_map, double /*time_offset*/) {
    qubit_ = remap_name(name_map, qubit_);
}

}  // namespace dmsim
