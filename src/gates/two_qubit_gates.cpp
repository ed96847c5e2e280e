#include "gates/two_qubit_gates.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace dmsim {

TwoQubitGate::TwoQubitGate(
    std::string qubit0,
    std::string qubit1,
    double time,
    double duration,
    const TwoQubitPtm& ptm
)
    : Gate(time, duration)
    , qubit0_(std::move(qubit0))
    , qubit1_(std::move(qubit1))
    , ptm_(ptm) {
    if (qubit0_.empty() || qubit1_.empty()) {
        throw std::invalid_argument("Gate target qubits must be named");
    }
    if (qubit0_ == qubit1_) {
        throw std::invalid_argument("Two-qubit gate on " + qubit0_ + " needs distinct targets");
    }
}

std::vector<std::string> TwoQubitGate::involved_qubits() const {
    return {qubit0_, qubit1_};
}

void TwoQubitGate::apply_to(StateBackend& state) {
    state.apply_two_qubit_ptm(qubit0_, qubit1_, ptm_);
}

void TwoQubitGate::remap(const NameMap& name_map, double /*time_offset*/) {
    qubit0_ = remap_name(name_map, qubit0_);
    qubit1_ = remap_name(name_map, qubit1_);
}

CPhase::CPhase(std::string qubit0, std::string qubit1, double time)
    : TwoQubitGate(
          std::move(qubit0), std::move(qubit1), time, 0.0, two_qubit_ptm(cphase_unitary(kPi))) {}

std::shared_ptr<Gate> CPhase::clone() const {
    return std::make_shared<CPhase>(*this);
}

CNOT::CNOT(std::string control, std::string target, double time)
    : TwoQubitGate(
          std::move(control), std::move(target), time, 0.0, two_qubit_ptm(cnot_unitary())) {}

std::shared_ptr<Gate> CNOT::clone() const {
    return std::make_shared<CNOT>(*this);
}

ISwap::ISwap(std::string qubit0, std::string qubit1, double time)
    : TwoQubitGate(
          std::move(qubit0),
          std::move(qubit1),
          time,
          0.0,
          two_qubit_ptm(iswap_unitary(kPi / 2))) {}

std::shared_ptr<Gate> ISwap::clone() const {
    return std::make_shared<ISwap>(*this);
}

Swap::Swap(std::string qubit0, std::string qubit1, double time)
    : TwoQubitGate(
          std::move(qubit0), std::move(qubit1), time, 0.0, two_qubit_ptm(swap_unitary())) {}

std::shared_ptr<Gate> Swap::clone() const {
    return std::make_shared<Swap>(*this);
}

CPhaseRotation::CPhaseRotation(
    std::string qubit0,
    std::string qubit1,
    double angle,
    double time
)
    : TwoQubitGate(
          std::move(qubit0), std::move(qubit1), time, 0.0, two_qubit_ptm(cphase_unitary(angle)))
    , angle_(angle) {}

std::string CPhaseRotation::details() const {
    std::ostringstream oss;
    oss << "angle=" << angle_;
    return oss.str();
}

std::shared_ptr<Gate> CPhaseRotation::clone() const {
    return std::make_shared<CPhaseRotation>(*this);
}

ISwapRotation::ISwapRotation(
    std::string qubit0,
    std::string qubit1,
    double angle,
    double time
)
    : TwoQubitGate(
          std::move(qubit0), std::move(qubit1), time, 0.0, two_qubit_ptm(iswap_unitary(angle)))
    , angle_(angle) {}

std::string ISwapRotation::details() const {
    std::ostringstream oss;
    oss << "angle=" << angle_;
    return oss.str();
}

std::shared_ptr<Gate> ISwapRotation::clone() const {
    return std::make_shared<ISwapRotation>(*this);
}

}  // namespace dmsim
