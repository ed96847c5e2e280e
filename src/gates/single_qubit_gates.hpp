#pragma once

#include <string>

#include "gates/gate.hpp"
#include "ptm.hpp"

namespace dmsim {

// Any operation expressible as one PTM on one qubit.
class SingleQubitGate : public Gate {
  public:
    SingleQubitGate(std::string qubit, double time, double duration, const SingleQubitPtm& ptm);

    const std::string& qubit() const { return qubit_; }
    const SingleQubitPtm& ptm() const { return ptm_; }

    std::vector<std::string> involved_qubits() const override;
    void apply_to(StateBackend& state) override;

  protected:
    void remap(const NameMap& name_map, double time_offset) override;

  private:
    std::string qubit_;
    SingleQubitPtm ptm_;
};

class Hadamard : public SingleQubitGate {
  public:
    Hadamard(std::string qubit, double time);

    std::string kind() const override { return "hadamard"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

// Rotation by `angle` about a Pauli axis, optionally followed by Gaussian
// jitter of the angle with standard deviation `dephasing_angle`.
class Rotation : public SingleQubitGate {
  public:
    double angle() const { return angle_; }
    double dephasing_angle() const { return dephasing_angle_; }

    std::string details() const override;

  protected:
    Rotation(
        std::string qubit,
        double time,
        double angle,
        double dephasing_angle,
        int axis
    );

  private:
    double angle_;
    double dephasing_angle_;
};

class RotateX : public Rotation {
  public:
    RotateX(std::string qubit, double time, double angle, double dephasing_angle = 0.0);

    std::string kind() const override { return "rotate_x"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

class RotateY : public Rotation {
  public:
    RotateY(std::string qubit, double time, double angle, double dephasing_angle = 0.0);

    std::string kind() const override { return "rotate_y"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

class RotateZ : public Rotation {
  public:
    RotateZ(std::string qubit, double time, double angle, double dephasing_angle = 0.0);

    std::string kind() const override { return "rotate_z"; }

  protected:
    std::shared_ptr<Gate> clone() const override;
};

// U3-style rotation: RotateEuler(theta, phi, lamda) is undone by
// RotateEuler(-theta, -lamda, -phi).
class RotateEuler : public SingleQubitGate {
  public:
    RotateEuler(std::string qubit, double time, double theta, double phi, double lamda);

    double theta() const { return theta_; }
    double phi() const { return phi_; }
    double lamda() const { return lamda_; }

    std::string kind() const override { return "rotate_euler"; }
    std::string details() const override;

  protected:
    std::shared_ptr<Gate> clone() const override;

  private:
    double theta_;
    double phi_;
    double lamda_;
};

}  // namespace dmsim
