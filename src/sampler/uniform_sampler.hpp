#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "sampler.hpp"

namespace dmsim {

// Noiseless Born-rule sampling: declared == projected, unit path weight.
class UniformSampler : public Sampler {
  public:
    explicit UniformSampler(std::optional<std::uint64_t> seed = std::nullopt);
    explicit UniformSampler(std::unique_ptr<RandomStream> rng);

    std::string name() const override;

  protected:
    SampleResult draw(double p0, double p1) override;

  private:
    std::unique_ptr<RandomStream> rng_;
};

}  // namespace dmsim
