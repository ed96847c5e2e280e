#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "state_backend.hpp"

namespace dmsim {

// Qubit renaming used when splicing a subcircuit; names absent from the map
// keep their own name.
using NameMap = std::map<std::string, std::string>;

std::string remap_name(const NameMap& name_map, const std::string& name);

// Time-stamped circuit operation. `time` is the midpoint of the operation,
// which therefore occupies [time - duration / 2, time + duration / 2].
// Gates are immutable once built apart from a Measurement's outcome log.
class Gate {
  public:
    Gate(double time, double duration);
    virtual ~Gate() = default;

    double time() const { return time_; }
    double duration() const { return duration_; }
    double start_time() const { return time_ - 0.5 * duration_; }
    double end_time() const { return time_ + 0.5 * duration_; }

    // Quantum targets, in argument order.
    virtual std::vector<std::string> involved_qubits() const = 0;

    // Classical registers read or written.
    virtual std::vector<std::string> classical_bits() const { return {}; }

    bool involves_qubit(const std::string& name) const;

    virtual bool is_measurement() const { return false; }

    // True for gates that only touch classical registers.
    virtual bool is_classical() const { return false; }

    virtual void apply_to(StateBackend& state) = 0;

    virtual std::string kind() const = 0;

    // Parameter summary used by describe() and timelines; may be empty.
    virtual std::string details() const { return {}; }

    std::string describe() const;

    // Copy with every qubit and bit name passed through `name_map` and the
    // time shifted by `time_offset`.
    std::shared_ptr<Gate> remapped(const NameMap& name_map, double time_offset) const;

  protected:
    virtual std::shared_ptr<Gate> clone() const = 0;
    virtual void remap(const NameMap& name_map, double time_offset) = 0;

  private:
    double time_;
    double duration_;
};

using GatePtr = std::shared_ptr<Gate>;

}  // namespace dmsim
