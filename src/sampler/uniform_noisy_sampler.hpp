#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "sampler.hpp"

namespace dmsim {

// Born-rule projection followed by a symmetric classification channel that
// flips the declared outcome with probability `readout_error`.
class UniformNoisySampler : public Sampler {
  public:
    explicit UniformNoisySampler(
        double readout_error,
        std::optional<std::uint64_t> seed = std::nullopt
    );
    UniformNoisySampler(double readout_error, std::unique_ptr<RandomStream> rng);

    std::string name() const override;

    double readout_error() const { return readout_error_; }

  protected:
    SampleResult draw(double p0, double p1) override;

  private:
    double readout_error_;
    std::unique_ptr<RandomStream> rng_;
};

}  // namespace dmsim
