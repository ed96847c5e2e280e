#include "qubit.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace dmsim {

namespace {

void validate_windows(const std::vector<DecoherenceWindow>& windows) {
    for (const auto& window : windows) {
        if (!(window.end >= window.start)) {
            throw std::invalid_argument("Decoherence window ends before it starts");
        }
        if (!(window.value > 0.0)) {
            throw std::invalid_argument("Decoherence window time constant must be positive");
        }
    }
}

double rate_of(double time_constant) {
    if (std::isinf(time_constant)) {
        return 0.0;
    }
    return 1.0 / time_constant;
}

}  // namespace

double average_time_constant(
    double base,
    const std::vector<DecoherenceWindow>& windows,
    double start,
    double end
) {
    const double duration = end - start;
    if (!(duration > 0.0)) {
        return base;
    }
    double decay = rate_of(base) * duration;
    for (const auto& window : windows) {
        const double overlap =
            std::min(end, window.end) - std::max(start, window.start);
        if (overlap > 0.0) {
            decay += overlap * rate_of(window.value);
        }
    }
    if (decay <= 0.0) {
        return kInfiniteTime;
    }
    return duration / decay;
}

Qubit::Qubit(std::string name, double t1, double t2)
    : name_(std::move(name)), t1_(t1), t2_(t2) {
    if (name_.empty()) {
        throw std::invalid_argument("Qubit name must not be empty");
    }
    if (std::isnan(t1_) || std::isnan(t2_) || t1_ < 0.0 || t2_ < 0.0) {
        throw std::invalid_argument("Qubit " + name_ + " has invalid decoherence times");
    }
}

double Qubit::effective_t1(double /*start*/, double /*end*/) const {
    return t1_;
}

double Qubit::effective_t2(double /*start*/, double /*end*/) const {
    return t2_;
}

bool Qubit::has_decoherence() const {
    return !(std::isinf(t1_) && std::isinf(t2_));
}

VariableDecoherenceQubit::VariableDecoherenceQubit(
    std::string name,
    double base_t1,
    double base_t2,
    std::vector<DecoherenceWindow> t1s,
    std::vector<DecoherenceWindow> t2s
)
    : Qubit(std::move(name), base_t1, base_t2)
    , t1s_(std::move(t1s))
    , t2s_(std::move(t2s)) {
    validate_windows(t1s_);
    validate_windows(t2s_);
}

double VariableDecoherenceQubit::effective_t1(double start, double end) const {
    return average_time_constant(t1(), t1s_, start, end);
}

double VariableDecoherenceQubit::effective_t2(double start, double end) const {
    return average_time_constant(t2(), t2s_, start, end);
}

bool VariableDecoherenceQubit::has_decoherence() const {
    return Qubit::has_decoherence() || !t1s_.empty() || !t2s_.empty();
}

ClassicalBit::ClassicalBit(std::string name) : Qubit(std::move(name)) {}

}  // namespace dmsim
