#include "gates/single_qubit_gates.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace dmsim {

namespace {

SingleQubitPtm rotation_ptm(int axis, double angle, double dephasing_angle) {
    SingleQubitUnitary u;
    switch (axis) {
        case 1:
            u = rotate_x_unitary(angle);
            break;
        case 2:
            u = rotate_y_unitary(angle);
            break;
        case 3:
            u = rotate_z_unitary(angle);
            break;
        default:
            throw std::invalid_argument("Rotation axis must be 1, 2 or 3");
    }
    const auto rotation = single_qubit_ptm(u);
    if (dephasing_angle == 0.0) {
        return rotation;
    }
    return compose(rotation, rotation_jitter_ptm(axis, dephasing_angle));
}

}  // namespace

SingleQubitGate::SingleQubitGate(
    std::string qubit,
    double time,
    double duration,
    const SingleQubitPtm& ptm
)
    : Gate(time, duration), qubit_(std::move(qubit)), ptm_(ptm) {
    if (qubit_.empty()) {
        throw std::invalid_argument("Gate target qubit must be named");
    }
}

std::vector<std::string> SingleQubitGate::involved_qubits() const {
    return {qubit_};
}

void SingleQubitGate::apply_to(StateBackend& state) {
    state.apply_single_qubit_ptm(qubit_, ptm_);
}

void SingleQubitGate::remap(const NameMap& name_map, double /*time_offset*/) {
    qubit_ = remap_name(name_map, qubit_);
}

Hadamard::Hadamard(std::string qubit, double time)
    : SingleQubitGate(std::move(qubit), time, 0.0, single_qubit_ptm(hadamard_unitary())) {}

std::shared_ptr<Gate> Hadamard::clone() const {
    return std::make_shared<Hadamard>(*this);
}

Rotation::Rotation(
    std::string qubit,
    double time,
    double angle,
    double dephasing_angle,
    int axis
)
    : SingleQubitGate(std::move(qubit), time, 0.0, rotation_ptm(axis, angle, dephasing_angle))
    , angle_(angle)
    , dephasing_angle_(dephasing_angle) {}

std::string Rotation::details() const {
    std::ostringstream oss;
    oss << "angle=" << angle_;
    if (dephasing_angle_ != 0.0) {
        oss << " dephasing_angle=" << dephasing_angle_;
    }
    return oss.str();
}

RotateX::RotateX(std::string qubit, double time, double angle, double dephasing_angle)
    : Rotation(std::move(qubit), time, angle, dephasing_angle, 1) {}

std::shared_ptr<Gate> RotateX::clone() const {
    return std::make_shared<RotateX>(*this);
}

RotateY::RotateY(std::string qubit, double time, double angle, double dephasing_angle)
    : Rotation(std::move(qubit), time, angle, dephasing_angle, 2) {}

std::shared_ptr<Gate> RotateY::clone() const {
    return std::make_shared<RotateY>(*this);
}

RotateZ::RotateZ(std::string qubit, double time, double angle, double dephasing_angle)
    : Rotation(std::move(qubit), time, angle, dephasing_angle, 3) {}

std::shared_ptr<Gate> RotateZ::clone() const {
    return std::make_shared<RotateZ>(*this);
}

RotateEuler::RotateEuler(
    std::string qubit,
    double time,
    double theta,
    double phi,
    double lamda
)
    : SingleQubitGate(
          std::move(qubit), time, 0.0, single_qubit_ptm(euler_unitary(theta, lamda, phi)))
    , theta_(theta)
    , phi_(phi)
    , lamda_(lamda) {}

std::string RotateEuler::details() const {
    std::ostringstream oss;
    oss << "theta=" << theta_ << " phi=" << phi_ << " lamda=" << lamda_;
    return oss.str();
}

std::shared_ptr<Gate> RotateEuler::clone() const {
    return std::make_shared<RotateEuler>(*this);
}

}  // namespace dmsim
