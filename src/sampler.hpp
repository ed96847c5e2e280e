#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace dmsim {

// Outcome of resolving one single-qubit measurement.
// `projected` is the branch the state collapses onto, `declared` is the
// classification reported to classical logic, and `probability` is the
// weight of this classification path.
struct SampleResult {
    int projected = 0;
    int declared = 0;
    double probability = 1.0;
};

inline bool operator==(const SampleResult& lhs, const SampleResult& rhs) {
    return lhs.projected == rhs.projected &&
           lhs.declared == rhs.declared &&
           lhs.probability == rhs.probability;
}

class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

class Mt19937RandomStream : public RandomStream {
  public:
    explicit Mt19937RandomStream(std::uint64_t seed);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64 rng_;
};

// Seeded stream, or one seeded from std::random_device when no seed is given.
std::unique_ptr<RandomStream> make_random_stream(std::optional<std::uint64_t> seed);

// Born-rule branch selection: 0 when u < p0 / (p0 + p1), otherwise 1.
int born_rule_outcome(double p0, double p1, double u);

// Stateful probability-to-outcome resolver. One instance may be shared by
// several Measurement gates; its random state advances on every call.
class Sampler {
  public:
    virtual ~Sampler() = default;

    Sampler() = default;
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    // p0, p1 are the non-negative, not necessarily normalized weights of the
    // two projective outcomes. Calls are serialized per instance.
    SampleResult sample(double p0, double p1);

    virtual std::string name() const = 0;

  protected:
    virtual SampleResult draw(double p0, double p1) = 0;

  private:
    std::mutex mutex_;
};

enum class SamplerKind {
    Selection,
    Uniform,
    UniformNoisy,
    Biased,
};

struct SamplerConfig {
    SamplerKind kind = SamplerKind::Uniform;
    std::optional<std::uint64_t> seed;

    // Forced outcome of the selection policy.
    int selection = 0;

    // Probability that the declared outcome differs from the projected one.
    double readout_error = 0.0;

    // Bias exponent of the biased policy; 1 samples flips at their true rate.
    double alpha = 1.0;
};

void validate_sampler_config(const SamplerConfig& config);

std::shared_ptr<Sampler> make_sampler(const SamplerConfig& config);

std::string to_string(SamplerKind kind);

}  // namespace dmsim
