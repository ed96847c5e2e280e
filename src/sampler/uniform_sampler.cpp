#include "sampler/uniform_sampler.hpp"

#include <stdexcept>
#include <utility>

namespace dmsim {

UniformSampler::UniformSampler(std::optional<std::uint64_t> seed)
    : rng_(make_random_stream(seed)) {}

UniformSampler::UniformSampler(std::unique_ptr<RandomStream> rng)
    : rng_(std::move(rng)) {
    if (!rng_) {
        throw std::invalid_argument("Uniform sampler requires a random stream");
    }
}

std::string UniformSampler::name() const {
    return "uniform";
}

SampleResult UniformSampler::draw(double p0, double p1) {
    const int outcome = born_rule_outcome(p0, p1, rng_->uniform(0.0, 1.0));
    return SampleResult{outcome, outcome, 1.0};
}

}  // namespace dmsim
