#include "gates/noise_gates.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace dmsim {

namespace {

double checked_probability(double probability) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw std::invalid_argument("Noise probability must be in [0, 1]");
    }
    return probability;
}

SingleQubitPtm checked_damping_ptm(double duration, double t1, double t2) {
    if (!(t1 >= 0.0) || !(t2 >= 0.0)) {
        throw std::invalid_argument("Damping time constants must be non-negative");
    }
    return amp_ph_damping_ptm(duration, t1, t2);
}

}  // namespace

AmpPhDamp::AmpPhDamp(std::string qubit, double time, double duration, double t1, double t2)
    : SingleQubitGate(std::move(qubit), time, duration, checked_damping_ptm(duration, t1, t2))
    , t1_(t1)
    , t2_(t2) {}

std::string AmpPhDamp::details() const {
    std::ostringstream oss;
    oss << "t1=" << t1_ << " t2=" << t2_;
    return oss.str();
}

std::shared_ptr<Gate> AmpPhDamp::clone() const {
    return std::make_shared<AmpPhDamp>(*this);
}

DepolarizingNoise::DepolarizingNoise(std::string qubit, double time, double probability)
    : SingleQubitGate(
          std::move(qubit),
          time,
          0.0,
          pauli_channel_ptm(
              checked_probability(probability) / 3.0, probability / 3.0, probability / 3.0))
    , probability_(probability) {}

std::string DepolarizingNoise::details() const {
    std::ostringstream oss;
    oss << "p=" << probability_;
    return oss.str();
}

std::shared_ptr<Gate> DepolarizingNoise::clone() const {
    return std::make_shared<DepolarizingNoise>(*this);
}

BitflipNoise::BitflipNoise(std::string qubit, double time, double probability)
    : SingleQubitGate(
          std::move(qubit), time, 0.0, pauli_channel_ptm(checked_probability(probability), 0.0, 0.0))
    , probability_(probability) {}

std::string BitflipNoise::details() const {
    std::ostringstream oss;
    oss << "p=" << probability_;
    return oss.str();
}

std::shared_ptr<Gate> BitflipNoise::clone() const {
    return std::make_shared<BitflipNoise>(*this);
}

}  // namespace dmsim
