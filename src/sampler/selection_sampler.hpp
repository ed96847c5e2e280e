#pragma once

#include "sampler.hpp"

namespace dmsim {

// Ignores the outcome weights and always reports the configured result.
class SelectionSampler : public Sampler {
  public:
    explicit SelectionSampler(int result);

    std::string name() const override;

    int result() const { return result_; }

  protected:
    SampleResult draw(double p0, double p1) override;

  private:
    int result_;
};

}  // namespace dmsim
