#pragma once

#include <limits>
#include <string>
#include <vector>

namespace dmsim {

constexpr double kInfiniteTime = std::numeric_limits<double>::infinity();

// Extra decay channel active on [start, end]. Its rate 1/value adds to the
// qubit's base rate inside the window.
struct DecoherenceWindow {
    double start = 0.0;
    double end = 0.0;
    double value = kInfiniteTime;
};

// Effective time constant over [start, end] for a base constant plus rate
// windows: duration / (duration / base + sum(overlap_i / value_i)).
// Zero-length intervals return `base`; a zero total rate returns infinity.
double average_time_constant(
    double base,
    const std::vector<DecoherenceWindow>& windows,
    double start,
    double end
);

class Qubit {
  public:
    explicit Qubit(
        std::string name,
        double t1 = kInfiniteTime,
        double t2 = kInfiniteTime
    );
    virtual ~Qubit() = default;

    const std::string& name() const { return name_; }
    double t1() const { return t1_; }
    double t2() const { return t2_; }

    // Constants to use for an idle period spanning [start, end].
    virtual double effective_t1(double start, double end) const;
    virtual double effective_t2(double start, double end) const;

    virtual bool is_classical() const { return false; }

    // False when both constants are infinite and idling is a no-op.
    virtual bool has_decoherence() const;

  private:
    std::string name_;
    double t1_;
    double t2_;
};

// Qubit whose decay rates rise inside the given windows, e.g. while a
// neighbouring qubit is driven.
class VariableDecoherenceQubit : public Qubit {
  public:
    VariableDecoherenceQubit(
        std::string name,
        double base_t1,
        double base_t2,
        std::vector<DecoherenceWindow> t1s,
        std::vector<DecoherenceWindow> t2s
    );

    double effective_t1(double start, double end) const override;
    double effective_t2(double start, double end) const override;
    bool has_decoherence() const override;

    const std::vector<DecoherenceWindow>& t1_windows() const { return t1s_; }
    const std::vector<DecoherenceWindow>& t2_windows() const { return t2s_; }

  private:
    std::vector<DecoherenceWindow> t1s_;
    std::vector<DecoherenceWindow> t2s_;
};

// Classical register living alongside the qubits; only classical gates may
// target it and it never decoheres.
class ClassicalBit : public Qubit {
  public:
    explicit ClassicalBit(std::string name);

    bool is_classical() const override { return true; }
};

}  // namespace dmsim
