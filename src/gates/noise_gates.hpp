#pragma once

#include <string>

#include "gates/single_qubit_gates.hpp"

namespace dmsim {

// Amplitude and phase damping accumulated while a qubit idles for
// `duration`. This is the gate add_waiting_gates synthesizes.
class AmpPhDamp : public SingleQubitGate {
  public:
    AmpPhDamp(std::string qubit, double time, double duration, double t1, double t2);

    double t1() const { return t1_; }
    double t2() const { return t2_; }

    std::string kind() const override { return "amp_ph_damping"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double t1_;
    double t2_;
};

// Symmetric depolarizing channel: X, Y and Z each with probability p / 3.
class DepolarizingNoise : public SingleQubitGate {
  public:
    DepolarizingNoise(std::string qubit, double time, double probability);

    double probability() const { return probability_; }

    std::string kind() const override { return "depolarizing_noise"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double probability_;
};

class BitflipNoise : public SingleQubitGate {
  public:
    BitflipNoise(std::string qubit, double time, double probability);

    double probability() const { return probability_; }

    std::string kind() const override { return "bitflip_noise"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double probability_;
};

}  // namespace dmsim
