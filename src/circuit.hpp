#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gate_registry.hpp"
#include "gates/gate.hpp"
#include "gates/measurement.hpp"
#include "qubit.hpp"
#include "sampler.hpp"
#include "state_backend.hpp"

namespace dmsim {

// One scheduled operation as reported by Circuit::timeline().
struct TimelineEntry {
    double start_time = 0.0;
    double duration = 0.0;
    std::string op;
    std::string detail;
};

inline bool operator==(const TimelineEntry& lhs, const TimelineEntry& rhs) {
    return lhs.start_time == rhs.start_time &&
           lhs.duration == rhs.duration &&
           lhs.op == rhs.op &&
           lhs.detail == rhs.detail;
}

// Called after each gate of a replay has been applied.
using GateObserver = std::function<void(const Gate& gate)>;

// Idle gaps shorter than this are not filled with waiting gates.
constexpr double kMinimumIdleDuration = 1e-9;

// Named set of qubits plus a sequence of time-stamped gates. Gates are added
// in any order; order() sorts them by time, keeping insertion order for
// equal times, and apply_to() replays them against a state backend.
class Circuit {
  public:
    explicit Circuit(std::string name = "circuit");

    const std::string& name() const { return name_; }

    // Throws DuplicateEntityError when the name is already taken.
    const Qubit& add_qubit(std::shared_ptr<Qubit> qubit);
    const Qubit& add_qubit(
        const std::string& name,
        double t1 = kInfiniteTime,
        double t2 = kInfiniteTime
    );

    const std::vector<std::shared_ptr<Qubit>>& qubits() const { return qubits_; }
    std::vector<std::string> qubit_names() const;
    bool has_qubit(const std::string& name) const;
    const Qubit* find_qubit(const std::string& name) const;

    // Throws UnknownQubitError.
    const Qubit& qubit(const std::string& name) const;

    const std::vector<GatePtr>& gates() const { return gates_; }

    GatePtr add_gate(GatePtr gate);

    // Removes `gate` (matched by identity); false when it is not part of the
    // circuit. The remaining gates keep their relative order.
    bool remove_gate(const GatePtr& gate);

    template <typename G, typename... Args>
    std::shared_ptr<G> add_gate(Args&&... args) {
        auto gate = std::make_shared<G>(std::forward<Args>(args)...);
        gates_.push_back(gate);
        return gate;
    }

    // Creates the gate through default_gate_registry().
    GatePtr add_gate(const std::string& gate_name, const GateArguments& args);
    GatePtr add_gate(
        const GateRegistry& registry,
        const std::string& gate_name,
        const GateArguments& args
    );

    std::shared_ptr<Measurement> add_measurement(
        const std::string& qubit,
        double time,
        std::shared_ptr<Sampler> sampler,
        std::optional<std::string> output_bit = std::nullopt
    );

    // Appends copies of `subcircuit`'s gates shifted by `time`. Qubit names
    // go through `name_map`, or are matched positionally against
    // subcircuit.qubit_names(), or are kept as they are. Qubits themselves
    // are not copied.
    void add_subcircuit(const Circuit& subcircuit, double time, const NameMap& name_map);
    void add_subcircuit(
        const Circuit& subcircuit,
        double time,
        const std::vector<std::string>& qubit_names
    );
    void add_subcircuit(const Circuit& subcircuit, double time);

    void order();

    // Fills every idle gap of each decohering qubit inside [tmin, tmax] with
    // an AmpPhDamp gate. Without a window the span of all current gates is
    // used. Classical bits and qubits with infinite t1 and t2 are skipped.
    void add_waiting_gates(
        const std::optional<std::vector<std::string>>& only_qubits = std::nullopt,
        std::optional<double> tmin = std::nullopt,
        std::optional<double> tmax = std::nullopt
    );

    // Throws UnknownQubitError when a gate names a qubit or bit missing from
    // the circuit and std::invalid_argument when a quantum operation targets
    // a ClassicalBit.
    void validate() const;

    // Validates, then applies every gate in its current order.
    void apply_to(StateBackend& state, const GateObserver& observer = GateObserver()) const;

    // Gates in time order.
    std::vector<TimelineEntry> timeline() const;

  private:
    std::string name_;
    std::vector<std::shared_ptr<Qubit>> qubits_;
    std::map<std::string, std::size_t> qubit_index_;
    std::vector<GatePtr> gates_;
};

}  // namespace dmsim
