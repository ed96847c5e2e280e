#pragma once

#include <string>

#include "gates/gate.hpp"
#include "ptm.hpp"

namespace dmsim {

class TwoQubitGate : public Gate {
  public:
    TwoQubitGate(
        std::string qubit0,
        std::string qubit1,
        double time,
        double duration,
        const TwoQubitPtm& ptm
    );

    const std::string& qubit0() const { return qubit0_; }
    const std::string& qubit1() const { return qubit1_; }
    const TwoQubitPtm& ptm() const { return ptm_; }

    std::vector<std::string> involved_qubits() const override;
    void apply_to(StateBackend& state) override;

  protected:
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string qubit0_;
    std::string qubit1_;
    TwoQubitPtm ptm_;
};

// Controlled-Z.
class CPhase : public TwoQubitGate {
  public:
    CPhase(std::string qubit0, std::string qubit1, double time);

    std::string kind() const override { return "cphase"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

class CNOT : public TwoQubitGate {
  public:
    CNOT(std::string control, std::string target, double time);

    std::string kind() const override { return "cnot"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

class ISwap : public TwoQubitGate {
  public:
    ISwap(std::string qubit0, std::string qubit1, double time);

    std::string kind() const override { return "iswap"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

class Swap : public TwoQubitGate {
  public:
    Swap(std::string qubit0, std::string qubit1, double time);

    std::string kind() const override { return "swap"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

// diag(1, 1, 1, e^{i angle}); angle = pi is CPhase.
class CPhaseRotation : public TwoQubitGate {
  public:
    CPhaseRotation(std::string qubit0, std::string qubit1, double angle, double time);

    double angle() const { return angle_; }

    std::string kind() const override { return "cphase_rotation"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double angle_;
};

// Partial iSWAP; angle = pi / 2 is ISwap.
class ISwapRotation : public TwoQubitGate {
  public:
    ISwapRotation(std::string qubit0, std::string qubit1, double angle, double time);

    double angle() const { return angle_; }

    std::string kind() const override { return "iswap_rotation"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double angle_;
};

}  // namespace dmsim
