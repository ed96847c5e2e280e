#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "sampler.hpp"

namespace dmsim {

// Readout-error sampler that draws classification flips from the biased
// distribution p_twiddle = e^alpha / (e^alpha + (1 - e)^alpha) instead of the
// true error rate e. alpha > 1 makes flips rarer, alpha < 1 more common;
// alpha == 1 reproduces UniformNoisySampler draw for draw. alpha must be
// positive, which keeps p_twiddle in [0, 1] even for e of 0 or 1.
//
// The returned path probability is always the true classification
// probability (e or 1 - e); the product of the biased probabilities of the
// flip decisions taken so far is kept in path_sampling_probability() so that
// callers can form importance weights.
class BiasedSampler : public Sampler {
  public:
    BiasedSampler(
        double readout_error,
        double alpha,
        std::optional<std::uint64_t> seed = std::nullopt
    );
    BiasedSampler(double readout_error, double alpha, std::unique_ptr<RandomStream> rng);

    std::string name() const override;

    double readout_error() const { return readout_error_; }
    double alpha() const { return alpha_; }
    double p_twiddle() const { return p_twiddle_; }
    double path_sampling_probability() const { return path_sampling_probability_; }

  protected:
    SampleResult draw(double p0, double p1) override;

  private:
    void initialize();

    double readout_error_;
    double alpha_;
    double p_twiddle_ = 0.0;
    double path_sampling_probability_ = 1.0;
    std::unique_ptr<RandomStream> rng_;
};

}  // namespace dmsim
