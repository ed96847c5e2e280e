#include "circuit.hpp"

#include <algorithm>
#include <stdexcept>

#include "errors.hpp"
#include "gates/noise_gates.hpp"

namespace dmsim {

namespace {

struct Interval {
    double start = 0.0;
    double end = 0.0;
};

std::vector<GatePtr> sorted_by_time(const std::vector<GatePtr>& gates) {
    std::vector<GatePtr> sorted = gates;
    std::stable_sort(sorted.begin(), sorted.end(), [](const GatePtr& lhs, const GatePtr& rhs) {
        return lhs->time() < rhs->time();
    });
    return sorted;
}

}  // namespace

Circuit::Circuit(std::string name) : name_(std::move(name)) {}

const Qubit& Circuit::add_qubit(std::shared_ptr<Qubit> qubit) {
    if (!qubit) {
        throw std::invalid_argument("Cannot add a null qubit");
    }
    if (qubit_index_.count(qubit->name()) > 0) {
        throw DuplicateEntityError(
            "Trying to add qubit with name " + qubit->name() + " to circuit " + name_ +
            ", but a qubit with that name already exists");
    }
    qubit_index_.emplace(qubit->name(), qubits_.size());
    qubits_.push_back(std::move(qubit));
    return *qubits_.back();
}

const Qubit& Circuit::add_qubit(const std::string& name, double t1, double t2) {
    return add_qubit(std::make_shared<Qubit>(name, t1, t2));
}

std::vector<std::string> Circuit::qubit_names() const {
    std::vector<std::string> names;
    names.reserve(qubits_.size());
    for (const auto& qubit : qubits_) {
        names.push_back(qubit->name());
    }
    return names;
}

bool Circuit::has_qubit(const std::string& name) const {
    return qubit_index_.count(name) > 0;
}

const Qubit* Circuit::find_qubit(const std::string& name) const {
    const auto it = qubit_index_.find(name);
    if (it == qubit_index_.end()) {
        return nullptr;
    }
    return qubits_[it->second].get();
}

const Qubit& Circuit::qubit(const std::string& name) const {
    const Qubit* found = find_qubit(name);
    if (!found) {
        throw UnknownQubitError("Circuit " + name_ + " has no qubit named " + name);
    }
    return *found;
}

GatePtr Circuit::add_gate(GatePtr gate) {
    if (!gate) {
        throw std::invalid_argument("Cannot add a null gate");
    }
    gates_.push_back(gate);
    return gate;
}

bool Circuit::remove_gate(const GatePtr& gate) {
    const auto it = std::find(gates_.begin(), gates_.end(), gate);
    if (it == gates_.end()) {
        return false;
    }
    gates_.erase(it);
    return true;
}

GatePtr Circuit::add_gate(const std::string& gate_name, const GateArguments& args) {
    return add_gate(default_gate_registry(), gate_name, args);
}

GatePtr Circuit::add_gate(
    const GateRegistry& registry,
    const std::string& gate_name,
    const GateArguments& args
) {
    return add_gate(registry.create(gate_name, args));
}

std::shared_ptr<Measurement> Circuit::add_measurement(
    const std::string& qubit,
    double time,
    std::shared_ptr<Sampler> sampler,
    std::optional<std::string> output_bit
) {
    return add_gate<Measurement>(qubit, time, std::move(sampler), std::move(output_bit));
}

void Circuit::add_subcircuit(const Circuit& subcircuit, double time, const NameMap& name_map) {
    // Copy first so splicing a circuit into itself terminates.
    std::vector<GatePtr> spliced;
    spliced.reserve(subcircuit.gates_.size());
    for (const auto& gate : subcircuit.gates_) {
        spliced.push_back(gate->remapped(name_map, time));
    }
    gates_.insert(gates_.end(), spliced.begin(), spliced.end());
}

void Circuit::add_subcircuit(
    const Circuit& subcircuit,
    double time,
    const std::vector<std::string>& qubit_names
) {
    const auto source_names = subcircuit.qubit_names();
    if (source_names.size() != qubit_names.size()) {
        throw std::invalid_argument(
            "Subcircuit " + subcircuit.name() + " has " + std::to_string(source_names.size()) +
            " qubits but " + std::to_string(qubit_names.size()) + " names were given");
    }
    NameMap name_map;
    for (std::size_t i = 0; i < source_names.size(); ++i) {
        name_map[source_names[i]] = qubit_names[i];
    }
    add_subcircuit(subcircuit, time, name_map);
}

void Circuit::add_subcircuit(const Circuit& subcircuit, double time) {
    add_subcircuit(subcircuit, time, NameMap{});
}

void Circuit::order() {
    gates_ = sorted_by_time(gates_);
}

void Circuit::add_waiting_gates(
    const std::optional<std::vector<std::string>>& only_qubits,
    std::optional<double> tmin,
    std::optional<double> tmax
) {
    if (only_qubits) {
        for (const auto& name : *only_qubits) {
            qubit(name);
        }
    }
    if (!gates_.empty()) {
        double earliest = gates_.front()->start_time();
        double latest = gates_.front()->end_time();
        for (const auto& gate : gates_) {
            earliest = std::min(earliest, gate->start_time());
            latest = std::max(latest, gate->end_time());
        }
        if (!tmin) {
            tmin = earliest;
        }
        if (!tmax) {
            tmax = latest;
        }
    }
    if (!tmin || !tmax) {
        return;
    }
    if (*tmax < *tmin) {
        throw std::invalid_argument("Waiting window ends before it starts");
    }

    std::vector<GatePtr> waiting;
    for (const auto& qb : qubits_) {
        if (qb->is_classical() || !qb->has_decoherence()) {
            continue;
        }
        if (only_qubits &&
            std::find(only_qubits->begin(), only_qubits->end(), qb->name()) ==
                only_qubits->end()) {
            continue;
        }

        std::vector<Interval> busy;
        for (const auto& gate : gates_) {
            if (gate->involves_qubit(qb->name())) {
                busy.push_back(Interval{gate->start_time(), gate->end_time()});
            }
        }
        std::sort(busy.begin(), busy.end(), [](const Interval& lhs, const Interval& rhs) {
            return lhs.start < rhs.start;
        });

        std::vector<Interval> idle;
        double cursor = *tmin;
        for (const auto& interval : busy) {
            const double gap_end = std::min(interval.start, *tmax);
            if (gap_end - cursor > kMinimumIdleDuration) {
                idle.push_back(Interval{cursor, gap_end});
            }
            cursor = std::max(cursor, interval.end);
        }
        if (*tmax - cursor > kMinimumIdleDuration) {
            idle.push_back(Interval{cursor, *tmax});
        }

        for (const auto& gap : idle) {
            waiting.push_back(std::make_shared<AmpPhDamp>(
                qb->name(),
                0.5 * (gap.start + gap.end),
                gap.end - gap.start,
                qb->effective_t1(gap.start, gap.end),
                qb->effective_t2(gap.start, gap.end)));
        }
    }
    gates_.insert(gates_.end(), waiting.begin(), waiting.end());
}

void Circuit::validate() const {
    for (const auto& gate : gates_) {
        for (const auto& name : gate->involved_qubits()) {
            const Qubit* qb = find_qubit(name);
            if (!qb) {
                throw UnknownQubitError(
                    "Gate " + gate->describe() + " references unknown qubit " + name);
            }
            if (qb->is_classical()) {
                throw std::invalid_argument(
                    "Gate " + gate->describe() + " applies a quantum operation to classical bit " +
                    name);
            }
        }
        for (const auto& name : gate->classical_bits()) {
            if (!has_qubit(name)) {
                throw UnknownQubitError(
                    "Gate " + gate->describe() + " references unknown bit " + name);
            }
        }
    }
}

void Circuit::apply_to(StateBackend& state, const GateObserver& observer) const {
    validate();
    for (const auto& gate : gates_) {
        gate->apply_to(state);
        if (observer) {
            observer(*gate);
        }
    }
}

std::vector<TimelineEntry> Circuit::timeline() const {
    std::vector<TimelineEntry> entries;
    entries.reserve(gates_.size());
    for (const auto& gate : sorted_by_time(gates_)) {
        entries.push_back(TimelineEntry{
            gate->start_time(), gate->duration(), gate->kind(), gate->describe()});
    }
    return entries;
}

}  // namespace dmsim
