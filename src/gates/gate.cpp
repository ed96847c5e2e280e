#include "gates/gate.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace dmsim {

std::string remap_name(const NameMap& name_map, const std::string& name) {
    const auto it = name_map.find(name);
    return it == name_map.end() ? name : it->second;
}

Gate::Gate(double time, double duration) : time_(time), duration_(duration) {
    if (!std::isfinite(time_)) {
        throw std::invalid_argument("Gate time must be finite");
    }
    if (!(duration_ >= 0.0) || !std::isfinite(duration_)) {
        throw std::invalid_argument("Gate duration must be finite and non-negative");
    }
}

bool Gate::involves_qubit(const std::string& name) const {
    const auto qubits = involved_qubits();
    if (std::find(qubits.begin(), qubits.end(), name) != qubits.end()) {
        return true;
    }
    const auto bits = classical_bits();
    return std::find(bits.begin(), bits.end(), name) != bits.end();
}

std::string Gate::describe() const {
    std::ostringstream oss;
    oss << kind() << "(";
    const auto qubits = involved_qubits();
    const auto bits = classical_bits();
    bool first = true;
    for (const auto& name : qubits) {
        oss << (first ? "" : ", ") << name;
        first = false;
    }
    for (const auto& name : bits) {
        oss << (first ? "" : ", ") << name;
        first = false;
    }
    oss << ") @ " << time_;
    if (duration_ > 0.0) {
        oss << " for " << duration_;
    }
    const auto extra = details();
    if (!extra.empty()) {
        oss << " [" << extra << "]";
    }
    return oss.str();
}

std::shared_ptr<Gate> Gate::remapped(const NameMap& name_map, double time_offset) const {
    auto copy = clone();
    copy->time_ += time_offset;
    copy->remap(name_map, time_offset);
    return copy;
}

}  // namespace dmsim
